#include "labshot/theme.h"
#include "labshot/errors.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace labshot {

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value;
}

} // namespace

Language parse_language(const std::string& name) {
    std::string key = lowercase(name);
    if (key == "python" || key == "py") return Language::PYTHON;
    if (key == "c") return Language::C;
    if (key == "java") return Language::JAVA;
    if (key == "javascript" || key == "js" || key == "node") return Language::JAVASCRIPT;
    if (key == "html") return Language::HTML;
    if (key == "react" || key == "jsx") return Language::REACT;
    throw std::invalid_argument("Unsupported language: " + name);
}

std::string language_name(Language language) {
    switch (language) {
        case Language::PYTHON: return "python";
        case Language::C: return "c";
        case Language::JAVA: return "java";
        case Language::JAVASCRIPT: return "javascript";
        case Language::HTML: return "html";
        case Language::REACT: return "react";
    }
    return "unknown";
}

std::string language_extension(Language language) {
    switch (language) {
        case Language::PYTHON: return "py";
        case Language::C: return "c";
        case Language::JAVA: return "java";
        case Language::JAVASCRIPT: return "js";
        case Language::HTML: return "html";
        case Language::REACT: return "jsx";
    }
    return "txt";
}

bool is_executable(Language language) {
    switch (language) {
        case Language::PYTHON:
        case Language::C:
        case Language::JAVA:
        case Language::JAVASCRIPT:
            return true;
        case Language::HTML:
        case Language::REACT:
            return false;
    }
    return false;
}

Theme parse_theme(const std::string& name) {
    std::string key = lowercase(name);
    if (key == "idle") return Theme::IDLE;
    if (key == "vscode") return Theme::VSCODE;
    if (key == "notepad") return Theme::NOTEPAD;
    if (key == "codeblocks") return Theme::CODEBLOCKS;
    if (key == "html") return Theme::HTML;
    if (key == "react") return Theme::REACT;
    if (key == "node") return Theme::NODE;
    throw UnknownThemeError(name);
}

std::string theme_name(Theme theme) {
    switch (theme) {
        case Theme::IDLE: return "idle";
        case Theme::VSCODE: return "vscode";
        case Theme::NOTEPAD: return "notepad";
        case Theme::CODEBLOCKS: return "codeblocks";
        case Theme::HTML: return "html";
        case Theme::REACT: return "react";
        case Theme::NODE: return "node";
    }
    return "unknown";
}

Theme default_theme_for(Language language) {
    switch (language) {
        case Language::PYTHON: return Theme::IDLE;
        case Language::C: return Theme::CODEBLOCKS;
        case Language::JAVA: return Theme::NOTEPAD;
        case Language::JAVASCRIPT: return Theme::NODE;
        case Language::HTML: return Theme::HTML;
        case Language::REACT: return Theme::REACT;
    }
    return Theme::VSCODE;
}

Theme resolve_theme(const std::string& batch_theme, Language language) {
    if (batch_theme.empty() || lowercase(batch_theme) == "auto") {
        return default_theme_for(language);
    }
    return parse_theme(batch_theme);
}

std::string java_class_name(const std::string& source) {
    for (const char* marker : {"public class ", "public final class ", "class "}) {
        auto pos = source.find(marker);
        if (pos == std::string::npos) {
            continue;
        }
        pos += std::char_traits<char>::length(marker);
        std::string name;
        while (pos < source.size() &&
               (std::isalnum(static_cast<unsigned char>(source[pos])) || source[pos] == '_')) {
            name += source[pos++];
        }
        if (!name.empty()) {
            return name;
        }
    }
    return "Main";
}

std::string source_filename(Language language, const std::string& source) {
    switch (language) {
        case Language::PYTHON: return "main.py";
        case Language::C: return "main.c";
        case Language::JAVA: return java_class_name(source) + ".java";
        case Language::JAVASCRIPT: return "main.js";
        case Language::HTML: return "index.html";
        case Language::REACT: return "App.jsx";
    }
    return "main.txt";
}

Language language_for_path(const std::string& path, Language fallback) {
    auto dot = path.rfind('.');
    if (dot == std::string::npos) {
        return fallback;
    }
    std::string ext = lowercase(path.substr(dot + 1));
    if (ext == "py") return Language::PYTHON;
    if (ext == "c" || ext == "h") return Language::C;
    if (ext == "java") return Language::JAVA;
    if (ext == "js" || ext == "mjs" || ext == "cjs") {
        return fallback == Language::REACT ? Language::REACT : Language::JAVASCRIPT;
    }
    if (ext == "jsx" || ext == "tsx") return Language::REACT;
    if (ext == "html" || ext == "htm" || ext == "css") return Language::HTML;
    return fallback;
}

} // namespace labshot
