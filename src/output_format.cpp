#include "output_format.h"
#include "file_utils.h"
#include "labshot/constants.h"

#include <cctype>

namespace labshot {

namespace {

const char* kTruncatedNote = "[Output truncated for display]";

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string decode_entities(std::string text) {
    const std::pair<const char*, const char*> entities[] = {
        {"&lt;", "<"}, {"&gt;", ">"}, {"&quot;", "\""}, {"&#39;", "'"},
        {"&nbsp;", " "}, {"&amp;", "&"}
    };
    for (const auto& [from, to] : entities) {
        std::string key(from);
        size_t pos = 0;
        while ((pos = text.find(key, pos)) != std::string::npos) {
            text.replace(pos, key.size(), to);
            pos += std::string(to).size();
        }
    }
    return text;
}

} // namespace

std::string normalize_output(const std::string& output) {
    std::vector<std::string> lines = FileUtils::split_lines(output);
    bool truncated = false;

    if (lines.size() > DISPLAY_MAX_LINES) {
        std::vector<std::string> kept(lines.begin(), lines.begin() + DISPLAY_HEAD_LINES);
        kept.push_back("...");
        kept.insert(kept.end(), lines.end() - DISPLAY_TAIL_LINES, lines.end());
        lines = std::move(kept);
        truncated = true;
    }

    for (auto& line : lines) {
        if (line.size() > DISPLAY_MAX_LINE_LENGTH) {
            line = line.substr(0, DISPLAY_LINE_HEAD) + "..." +
                   line.substr(line.size() - DISPLAY_LINE_TAIL);
            truncated = true;
        }
    }

    std::string result;
    for (size_t i = 0; i < lines.size(); i++) {
        if (i > 0) {
            result += '\n';
        }
        result += lines[i];
    }
    if (truncated) {
        result += "\n";
        result += kTruncatedNote;
    }
    return result;
}

std::vector<std::string> wrap_line(const std::string& line, size_t width) {
    std::vector<std::string> pieces;
    if (width == 0 || line.size() <= width) {
        pieces.push_back(line);
        return pieces;
    }
    for (size_t pos = 0; pos < line.size(); pos += width) {
        pieces.push_back(line.substr(pos, width));
    }
    return pieces;
}

std::string clean_output(const std::string& output, size_t width, size_t max_chars) {
    std::string result;
    for (const auto& line : FileUtils::split_lines(output)) {
        if (trim(line).empty()) {
            continue;
        }
        for (const auto& piece : wrap_line(line, width)) {
            if (!result.empty()) {
                result += '\n';
            }
            result += piece;
        }
    }
    if (result.size() > max_chars) {
        result = result.substr(0, max_chars) + " ...";
    }
    return result;
}

std::string expand_tabs(const std::string& line, size_t tab_width) {
    std::string out;
    for (char c : line) {
        if (c == '\t') {
            out.append(tab_width - (out.size() % tab_width), ' ');
        } else if (static_cast<unsigned char>(c) >= 0x20 && c != 0x7f) {
            out += c;
        }
    }
    return out;
}

std::vector<std::string> visible_text(const std::string& markup) {
    std::vector<std::string> blocks;
    std::string current;
    bool in_tag = false;
    bool skip_content = false;  // Inside <script> or <style>

    auto flush = [&]() {
        std::string text = trim(decode_entities(current));
        if (!text.empty()) {
            blocks.push_back(text);
        }
        current.clear();
    };

    for (size_t i = 0; i < markup.size(); i++) {
        char c = markup[i];
        if (!in_tag && c == '<') {
            std::string rest = markup.substr(i, 8);
            for (auto& ch : rest) {
                ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
            }
            if (rest.rfind("<script", 0) == 0 || rest.rfind("<style", 0) == 0) {
                skip_content = true;
            } else if (rest.rfind("</script", 0) == 0 || rest.rfind("</style", 0) == 0) {
                skip_content = false;
            }
            in_tag = true;
            flush();
            continue;
        }
        if (in_tag) {
            if (c == '>') {
                in_tag = false;
            }
            continue;
        }
        if (skip_content) {
            continue;
        }
        if (c == '&') {
            auto semi = markup.find(';', i);
            if (semi != std::string::npos && semi - i <= 7) {
                current += markup.substr(i, semi - i + 1);
                i = semi;
                continue;
            }
        }
        // A one-line {expression} is JSX, not text
        if (c == '{') {
            auto close = markup.find_first_of("}<\n", i + 1);
            if (close != std::string::npos && markup[close] == '}') {
                flush();
                i = close;
                continue;
            }
        }
        if (c == '{' || c == '}' || c == ';' || c == '(' || c == ')') {
            flush();
            continue;
        }
        if (c == '\n') {
            flush();
            continue;
        }
        current += c;
    }
    flush();
    return blocks;
}

} // namespace labshot
