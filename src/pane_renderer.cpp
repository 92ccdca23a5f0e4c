#include "labshot/renderer.h"
#include "labshot/artifact_store.h"
#include "labshot/errors.h"
#include "file_utils.h"
#include "highlighter.h"
#include "output_format.h"

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_OUTLINE_H

#include <png.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <iterator>

namespace labshot {

namespace {

struct Color {
    uint8_t r, g, b;
};

constexpr Color hex(uint32_t value) {
    return {static_cast<uint8_t>(value >> 16), static_cast<uint8_t>(value >> 8),
            static_cast<uint8_t>(value)};
}

struct Palette {
    // Editor
    Color editor_bg, title_bg, title_fg, gutter_bg, gutter_fg, text;
    Color keyword, builtin, string, comment, number, preprocessor, tag;
    bool bold_keywords;
    bool line_numbers;
    // Console
    Color term_bg, term_title_bg, term_title_fg, term_fg, term_err, term_dim;
    const char* editor_name;
    bool console_first;
};

const Palette kIdle{
    hex(0xffffff), hex(0xe6e6e6), hex(0x000000), hex(0xf3f3f3), hex(0x8a8a8a), hex(0x000000),
    hex(0xff7700), hex(0x900090), hex(0x00aa00), hex(0xdd0000), hex(0x800080), hex(0x000000),
    hex(0x000000), false, true,
    hex(0xffffff), hex(0xe6e6e6), hex(0x000000), hex(0x0000ff), hex(0xdd0000), hex(0x7f7f7f),
    "IDLE", false};

const Palette kVsCodeLight{
    hex(0xffffff), hex(0xdddddd), hex(0x333333), hex(0xffffff), hex(0x237893), hex(0x000000),
    hex(0x0000ff), hex(0x795e26), hex(0xa31515), hex(0x008000), hex(0x098658), hex(0xaf00db),
    hex(0x800000), false, true,
    hex(0x1e1e1e), hex(0x252526), hex(0xcccccc), hex(0xcccccc), hex(0xf48771), hex(0x808080),
    "Visual Studio Code", false};

const Palette kNotepad{
    hex(0xffffff), hex(0xf3f3f3), hex(0x000000), hex(0xffffff), hex(0x999999), hex(0x000000),
    hex(0x0000ff), hex(0x000000), hex(0x008000), hex(0x808080), hex(0xff0000), hex(0x000000),
    hex(0x0000ff), false, false,
    hex(0x0c0c0c), hex(0xffffff), hex(0x000000), hex(0xcccccc), hex(0xff5555), hex(0x767676),
    "Notepad", false};

const Palette kCodeBlocks{
    hex(0xffffff), hex(0xd4d0c8), hex(0x000000), hex(0xe4e4e4), hex(0x808080), hex(0x000000),
    hex(0x000080), hex(0x008080), hex(0x0000ff), hex(0x008000), hex(0x800000), hex(0x00a000),
    hex(0x000080), true, true,
    hex(0x000000), hex(0xd4d0c8), hex(0x000000), hex(0xffffff), hex(0xff6060), hex(0xc0c0c0),
    "Code::Blocks", false};

const Palette kVsCodeDark{
    hex(0x1e1e1e), hex(0x323233), hex(0xcccccc), hex(0x1e1e1e), hex(0x858585), hex(0xd4d4d4),
    hex(0x569cd6), hex(0xdcdcaa), hex(0xce9178), hex(0x6a9955), hex(0xb5cea8), hex(0xc586c0),
    hex(0x569cd6), false, true,
    hex(0x181818), hex(0x252526), hex(0xcccccc), hex(0xcccccc), hex(0xf48771), hex(0x808080),
    "Visual Studio Code", false};

const Palette kNode{
    hex(0x1e1e1e), hex(0x323233), hex(0xcccccc), hex(0x1e1e1e), hex(0x858585), hex(0xd4d4d4),
    hex(0xc586c0), hex(0xdcdcaa), hex(0xce9178), hex(0x6a9955), hex(0xb5cea8), hex(0xc586c0),
    hex(0x569cd6), false, true,
    hex(0x000000), hex(0x2d2d2d), hex(0xe5e5e5), hex(0xe5e5e5), hex(0xff6b6b), hex(0x8a8a8a),
    "node", true};

const Palette& palette_for(Theme theme) {
    switch (theme) {
        case Theme::IDLE: return kIdle;
        case Theme::VSCODE: return kVsCodeLight;
        case Theme::NOTEPAD: return kNotepad;
        case Theme::CODEBLOCKS: return kCodeBlocks;
        case Theme::HTML: return kVsCodeLight;
        case Theme::REACT: return kVsCodeDark;
        case Theme::NODE: return kNode;
    }
    return kVsCodeLight;
}

// Browser chrome
constexpr Color kToolbarBg = hex(0xf1f3f4);
constexpr Color kAddressBg = hex(0xffffff);
constexpr Color kAddressBorder = hex(0xdadce0);
constexpr Color kPageBg = hex(0xffffff);
constexpr Color kPageText = hex(0x202124);
constexpr Color kPageHeading = hex(0x1a73e8);

constexpr int kPad = 12;
constexpr size_t kMaxColumns = 100;
constexpr size_t kMinColumns = 48;
constexpr int kMaxDimension = 8192;

const char* kFontCandidates[] = {
    "/usr/share/fonts/truetype/dejavu/DejaVuSansMono.ttf",
    "/usr/share/fonts/dejavu/DejaVuSansMono.ttf",
    "/usr/share/fonts/TTF/DejaVuSansMono.ttf",
    "/usr/share/fonts/truetype/liberation/LiberationMono-Regular.ttf",
    "/usr/share/fonts/liberation-mono/LiberationMono-Regular.ttf",
    "/usr/share/fonts/truetype/noto/NotoSansMono-Regular.ttf",
    "/usr/share/fonts/truetype/ubuntu/UbuntuMono-R.ttf",
    "/usr/local/share/fonts/DejaVuSansMono.ttf",
};

struct Glyph {
    int left = 0;
    int top = 0;
    int width = 0;
    int rows = 0;
    std::vector<uint8_t> alpha;
};

class Canvas {
public:
    Canvas(int width, int height, Color background) {
        if (width <= 0 || height <= 0 || width > kMaxDimension || height > kMaxDimension) {
            throw RenderError("canvas size out of range: " + std::to_string(width) + "x" +
                              std::to_string(height));
        }
        image_.width = width;
        image_.height = height;
        image_.rgb.resize(static_cast<size_t>(width) * height * 3);
        fill_rect(0, 0, width, height, background);
    }

    int width() const { return image_.width; }
    int height() const { return image_.height; }

    void fill_rect(int x, int y, int w, int h, Color color) {
        int x0 = std::max(0, x), y0 = std::max(0, y);
        int x1 = std::min(image_.width, x + w), y1 = std::min(image_.height, y + h);
        for (int py = y0; py < y1; py++) {
            uint8_t* row = &image_.rgb[(static_cast<size_t>(py) * image_.width + x0) * 3];
            for (int px = x0; px < x1; px++) {
                *row++ = color.r;
                *row++ = color.g;
                *row++ = color.b;
            }
        }
    }

    void stroke_rect(int x, int y, int w, int h, Color color) {
        fill_rect(x, y, w, 1, color);
        fill_rect(x, y + h - 1, w, 1, color);
        fill_rect(x, y, 1, h, color);
        fill_rect(x + w - 1, y, 1, h, color);
    }

    void blend(int x, int y, uint8_t alpha, Color color) {
        if (alpha == 0 || x < 0 || y < 0 || x >= image_.width || y >= image_.height) {
            return;
        }
        uint8_t* px = &image_.rgb[(static_cast<size_t>(y) * image_.width + x) * 3];
        const uint8_t src[3] = {color.r, color.g, color.b};
        for (int i = 0; i < 3; i++) {
            px[i] = static_cast<uint8_t>(px[i] + ((src[i] - px[i]) * alpha) / 255);
        }
    }

    // Copies another image in at (x, y)
    void paste(const Image& other, int x, int y) {
        for (int row = 0; row < other.height; row++) {
            int ty = y + row;
            if (ty < 0 || ty >= image_.height) {
                continue;
            }
            int width = std::min(other.width, image_.width - x);
            if (width <= 0) {
                return;
            }
            std::copy_n(&other.rgb[static_cast<size_t>(row) * other.width * 3], width * 3,
                        &image_.rgb[(static_cast<size_t>(ty) * image_.width + x) * 3]);
        }
    }

    Image take() { return std::move(image_); }

private:
    Image image_;
};

struct StyledLine {
    std::string text;
    Color color;
    bool bold = false;
};

// Counts lead bytes only, so a multi-byte character is one column
size_t display_width(const std::string& text) {
    return static_cast<size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

// First `cols` columns of text
std::string take_columns(const std::string& text, size_t cols) {
    std::string out;
    size_t taken = 0;
    for (char c : text) {
        bool lead = (static_cast<unsigned char>(c) & 0xC0) != 0x80;
        if (lead && taken == cols) {
            break;
        }
        out += c;
        taken += lead ? 1 : 0;
    }
    return out;
}

TokenLine crop_tokens(const TokenLine& line, size_t max_cols) {
    size_t total = 0;
    for (const auto& token : line) {
        total += display_width(token.text);
    }
    if (total <= max_cols) {
        return line;
    }
    TokenLine out;
    size_t budget = max_cols - 3;
    for (const auto& token : line) {
        size_t w = display_width(token.text);
        if (w <= budget) {
            out.push_back(token);
            budget -= w;
            continue;
        }
        if (budget > 0) {
            out.push_back({take_columns(token.text, budget), token.type});
        }
        break;
    }
    out.push_back({"...", TokenType::TEXT});
    return out;
}

std::string display_command(Language language, const std::string& filename) {
    std::string stem = filename.substr(0, filename.rfind('.'));
    switch (language) {
        case Language::PYTHON: return "python " + filename;
        case Language::C: return "gcc " + filename + " -o prog && ./prog";
        case Language::JAVA: return "javac " + filename + " && java " + stem;
        case Language::JAVASCRIPT: return "node " + filename;
        case Language::HTML:
        case Language::REACT:
            return "npm start";
    }
    return filename;
}

std::string page_title(const std::string& route) {
    if (route.empty() || route == "/") {
        return "Home";
    }
    std::string name = route.substr(route.find_last_of('/') + 1);
    if (name.empty()) {
        return route;
    }
    name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[0])));
    return name;
}

std::string to_hex(int value) {
    static const char* digits = "0123456789ABCDEF";
    unsigned int v = static_cast<unsigned int>(value);
    std::string out;
    do {
        out.insert(out.begin(), digits[v & 0xF]);
        v >>= 4;
    } while (v != 0);
    return "0x" + out;
}

} // namespace

std::string to_string(RenderKind kind) {
    switch (kind) {
        case RenderKind::CODE: return "code";
        case RenderKind::TERMINAL: return "terminal";
        case RenderKind::COMBINED: return "combined";
        case RenderKind::BROWSER: return "browser";
        case RenderKind::FILE: return "file";
    }
    return "unknown";
}

class PaneRenderer::Impl {
public:
    std::string font_path;
    int cell_w = 8;
    int line_h = 16;
    int ascent = 12;
    std::array<Glyph, 95> regular;
    std::array<Glyph, 95> bold;

    Impl(const std::string& path, int size) : font_path(path) {
        FT_Library library;
        if (FT_Init_FreeType(&library) != 0) {
            throw RenderError("FreeType initialisation failed");
        }
        struct LibraryGuard {
            FT_Library lib;
            ~LibraryGuard() { FT_Done_FreeType(lib); }
        } library_guard{library};

        FT_Face face;
        if (FT_New_Face(library, path.c_str(), 0, &face) != 0) {
            throw RenderError("cannot load font " + path);
        }
        struct FaceGuard {
            FT_Face face;
            ~FaceGuard() { FT_Done_Face(face); }
        } face_guard{face};

        if (FT_Set_Pixel_Sizes(face, 0, static_cast<FT_UInt>(size)) != 0) {
            throw RenderError("font " + path + " does not support size " + std::to_string(size));
        }
        if (FT_Load_Char(face, 'M', FT_LOAD_DEFAULT) != 0) {
            throw RenderError("font " + path + " has no 'M' glyph");
        }
        cell_w = static_cast<int>((face->glyph->advance.x + 32) >> 6);
        ascent = static_cast<int>((face->size->metrics.ascender + 63) >> 6);
        int descent = static_cast<int>((-face->size->metrics.descender + 63) >> 6);
        line_h = ascent + descent + 3;

        for (int c = 32; c < 127; c++) {
            regular[c - 32] = load_glyph(face, c, false);
            bold[c - 32] = load_glyph(face, c, true);
        }
        std::cout << "[Renderer] Loaded font " << path << " (" << size << "px, cell "
                  << cell_w << "x" << line_h << ")" << std::endl;
    }

    static Glyph load_glyph(FT_Face face, int c, bool emboldened) {
        Glyph glyph;
        if (FT_Load_Char(face, static_cast<FT_ULong>(c), FT_LOAD_DEFAULT) != 0) {
            return glyph;
        }
        if (emboldened && face->glyph->format == FT_GLYPH_FORMAT_OUTLINE &&
            FT_Outline_Embolden(&face->glyph->outline, 1 << 6) != 0) {
            return glyph;
        }
        if (FT_Render_Glyph(face->glyph, FT_RENDER_MODE_NORMAL) != 0) {
            return glyph;
        }
        const FT_Bitmap& bitmap = face->glyph->bitmap;
        glyph.left = face->glyph->bitmap_left;
        glyph.top = face->glyph->bitmap_top;
        glyph.width = static_cast<int>(bitmap.width);
        glyph.rows = static_cast<int>(bitmap.rows);
        glyph.alpha.resize(static_cast<size_t>(glyph.width) * glyph.rows);
        for (int row = 0; row < glyph.rows; row++) {
            const uint8_t* src = bitmap.buffer + row * bitmap.pitch;
            std::copy_n(src, glyph.width, &glyph.alpha[static_cast<size_t>(row) * glyph.width]);
        }
        return glyph;
    }

    int draw_text(Canvas& canvas, int x, int top, const std::string& text, Color color,
                  bool emboldened) const {
        int baseline = top + ascent + 1;
        for (char ch : text) {
            unsigned char b = static_cast<unsigned char>(ch);
            if ((b & 0xC0) == 0x80) {
                continue;
            }
            int index = (b >= 32 && b < 127) ? b - 32 : '?' - 32;
            const Glyph& g = emboldened ? bold[index] : regular[index];
            for (int row = 0; row < g.rows; row++) {
                for (int col = 0; col < g.width; col++) {
                    canvas.blend(x + g.left + col, baseline - g.top + row,
                                 g.alpha[static_cast<size_t>(row) * g.width + col], color);
                }
            }
            x += cell_w;
        }
        return x;
    }

    int title_height() const { return line_h + 12; }

    void draw_title_bar(Canvas& canvas, const std::string& title, Color bg, Color fg) const {
        int h = title_height();
        canvas.fill_rect(0, 0, canvas.width(), h, bg);
        draw_text(canvas, kPad, (h - line_h) / 2, title, fg, false);
        std::string buttons = "_  x";
        int bx = canvas.width() - kPad - static_cast<int>(buttons.size()) * cell_w;
        draw_text(canvas, bx, (h - line_h) / 2, buttons, fg, false);
    }

    Color token_color(TokenType type, const Palette& p) const {
        switch (type) {
            case TokenType::TEXT: return p.text;
            case TokenType::KEYWORD: return p.keyword;
            case TokenType::BUILTIN: return p.builtin;
            case TokenType::STRING: return p.string;
            case TokenType::COMMENT: return p.comment;
            case TokenType::NUMBER: return p.number;
            case TokenType::PREPROCESSOR: return p.preprocessor;
            case TokenType::TAG: return p.tag;
        }
        return p.text;
    }

    Image code_pane(const std::string& filename, const std::vector<TokenLine>& source_lines,
                    const Palette& p) const {
        std::vector<TokenLine> lines;
        std::vector<int> numbers;
        for (size_t i = 0; i < source_lines.size(); i++) {
            if (source_lines.size() > MAX_CODE_LINES_RENDERED && i == MAX_CODE_LINES_RENDERED - 1) {
                lines.push_back({{"...", TokenType::TEXT}});
                numbers.push_back(0);
                break;
            }
            lines.push_back(crop_tokens(source_lines[i], kMaxColumns));
            numbers.push_back(static_cast<int>(i + 1));
        }
        if (lines.empty()) {
            lines.emplace_back();
            numbers.push_back(1);
        }

        size_t cols = kMinColumns;
        for (const auto& line : lines) {
            size_t w = 0;
            for (const auto& token : line) {
                w += display_width(token.text);
            }
            cols = std::max(cols, w);
        }

        int gutter_chars = p.line_numbers
            ? static_cast<int>(std::max<size_t>(2, std::to_string(source_lines.size()).size()))
            : 0;
        int gutter_w = gutter_chars ? gutter_chars * cell_w + kPad : 0;
        int title_h = title_height();
        int width = kPad + gutter_w + static_cast<int>(cols) * cell_w + kPad;
        int height = title_h + kPad + static_cast<int>(lines.size()) * line_h + kPad;

        Canvas canvas(width, height, p.editor_bg);
        draw_title_bar(canvas, filename + " - " + p.editor_name, p.title_bg, p.title_fg);
        if (gutter_w) {
            canvas.fill_rect(0, title_h, gutter_w + kPad / 2, height - title_h, p.gutter_bg);
        }

        for (size_t i = 0; i < lines.size(); i++) {
            int top = title_h + kPad + static_cast<int>(i) * line_h;
            if (gutter_w && numbers[i] > 0) {
                std::string num = std::to_string(numbers[i]);
                int nx = kPad + (gutter_chars - static_cast<int>(num.size())) * cell_w;
                draw_text(canvas, nx, top, num, p.gutter_fg, false);
            }
            int x = kPad + gutter_w;
            for (const auto& token : lines[i]) {
                bool emboldened = p.bold_keywords && token.type == TokenType::KEYWORD;
                x = draw_text(canvas, x, top, token.text, token_color(token.type, p), emboldened);
            }
        }
        return canvas.take();
    }

    Image text_panel(const std::string& title, const std::vector<StyledLine>& lines,
                     Color bg, Color title_bg, Color title_fg) const {
        size_t cols = kMinColumns;
        for (const auto& line : lines) {
            cols = std::max(cols, display_width(line.text));
        }
        int title_h = title_height();
        int rows = std::max<int>(1, static_cast<int>(lines.size()));
        int width = kPad * 2 + static_cast<int>(cols) * cell_w;
        int height = title_h + kPad + rows * line_h + kPad;

        Canvas canvas(width, height, bg);
        draw_title_bar(canvas, title, title_bg, title_fg);
        for (size_t i = 0; i < lines.size(); i++) {
            int top = title_h + kPad + static_cast<int>(i) * line_h;
            draw_text(canvas, kPad, top, lines[i].text, lines[i].color, lines[i].bold);
        }
        return canvas.take();
    }

    static void add_block(std::vector<StyledLine>& lines, const std::string& text, Color color) {
        if (text.empty()) {
            return;
        }
        for (const auto& line : FileUtils::split_lines(normalize_output(text))) {
            for (const auto& piece : wrap_line(expand_tabs(line), kMaxColumns)) {
                lines.push_back({piece, color});
            }
        }
    }

    Image terminal_pane(const RenderContent& content, Language language, Theme theme,
                        const Palette& p) const {
        std::vector<StyledLine> lines;
        std::string title;
        std::string command = display_command(language, content.filename);
        int exit_code = content.exit_code.value_or(0);

        switch (theme) {
            case Theme::IDLE:
                title = "IDLE Shell";
                lines.push_back({"===== RESTART: /lab/" + content.filename + " =====", p.term_dim});
                break;
            case Theme::NOTEPAD:
                title = "Command Prompt";
                lines.push_back({"C:\\lab>" + command, p.term_fg});
                break;
            case Theme::CODEBLOCKS:
                title = "Terminal - prog";
                break;
            case Theme::VSCODE:
            case Theme::HTML:
            case Theme::REACT:
                title = "TERMINAL";
                lines.push_back({"$ " + command, p.term_dim});
                break;
            case Theme::NODE:
                title = "node";
                lines.push_back({"$ " + command, p.term_dim});
                break;
        }

        add_block(lines, content.stdout_text, p.term_fg);
        add_block(lines, content.stderr_text, p.term_err);

        switch (theme) {
            case Theme::IDLE:
                lines.push_back({">>> ", p.term_dim});
                break;
            case Theme::NOTEPAD:
                lines.push_back({"", p.term_fg});
                lines.push_back({"C:\\lab>", p.term_fg});
                break;
            case Theme::CODEBLOCKS:
                lines.push_back({"", p.term_fg});
                lines.push_back({"Process returned " + std::to_string(exit_code) + " (" +
                                     to_hex(exit_code) + ")", p.term_fg});
                lines.push_back({"Press ENTER to continue.", p.term_fg});
                break;
            case Theme::VSCODE:
            case Theme::HTML:
            case Theme::REACT:
            case Theme::NODE:
                if (exit_code != 0) {
                    lines.push_back({"[exit code " + std::to_string(exit_code) + "]", p.term_dim});
                }
                break;
        }
        return text_panel(title, lines, p.term_bg, p.term_title_bg, p.term_title_fg);
    }

    Image browser_pane(const RenderContent& content, Language language) const {
        std::string route = content.route.empty() ? "/" : content.route;
        std::string url = language == Language::REACT
            ? "http://localhost:3000" + route
            : (content.route.empty() ? "file:///lab/" + content.filename
                                     : "http://localhost" + route);

        std::vector<StyledLine> page;
        page.push_back({page_title(route), kPageHeading, true});
        page.push_back({"", kPageText});
        for (const auto& block : visible_text(content.code)) {
            for (const auto& piece : wrap_line(expand_tabs(block), kMaxColumns)) {
                page.push_back({piece, kPageText});
            }
        }
        if (page.size() == 2) {
            page.push_back({"(empty page)", kAddressBorder});
        }
        if (page.size() > MAX_CODE_LINES_RENDERED) {
            page.resize(MAX_CODE_LINES_RENDERED - 1);
            page.push_back({"...", kPageText});
        }

        size_t cols = std::max(kMinColumns + 16, display_width(url) + 4);
        for (const auto& line : page) {
            cols = std::max(cols, display_width(line.text));
        }
        int tab_h = title_height();
        int bar_h = line_h + 16;
        int width = kPad * 2 + static_cast<int>(cols) * cell_w;
        int height = tab_h + bar_h + kPad + static_cast<int>(page.size()) * line_h + kPad;

        Canvas canvas(width, height, kPageBg);
        draw_title_bar(canvas, page_title(route) + " - " + content.filename, kToolbarBg, kPageText);
        canvas.fill_rect(0, tab_h, width, bar_h, kToolbarBg);
        canvas.fill_rect(kPad, tab_h + 4, width - 2 * kPad, bar_h - 8, kAddressBg);
        canvas.stroke_rect(kPad, tab_h + 4, width - 2 * kPad, bar_h - 8, kAddressBorder);
        draw_text(canvas, kPad + cell_w, tab_h + (bar_h - line_h) / 2, url, kPageText, false);

        for (size_t i = 0; i < page.size(); i++) {
            int top = tab_h + bar_h + kPad + static_cast<int>(i) * line_h;
            draw_text(canvas, kPad, top, page[i].text, page[i].color, page[i].bold);
        }
        return canvas.take();
    }

    static Image stack(const Image& first, const Image& second, Color gap_color) {
        constexpr int gap = 8;
        int width = std::max(first.width, second.width);
        Canvas canvas(width, first.height + gap + second.height, gap_color);
        canvas.paste(first, 0, 0);
        canvas.paste(second, 0, first.height + gap);
        return canvas.take();
    }
};

PaneRenderer::PaneRenderer(const std::string& font_path, int font_size) {
    std::string path = find_font(font_path);
    if (path.empty()) {
        throw RenderError("no monospace font found; set font_path or LABSHOT_FONT");
    }
    impl = std::make_unique<Impl>(path, font_size);
}

PaneRenderer::~PaneRenderer() = default;

const std::string& PaneRenderer::font_path() const {
    return impl->font_path;
}

std::string PaneRenderer::find_font(const std::string& preferred) {
    std::vector<std::string> candidates;
    if (!preferred.empty()) {
        candidates.push_back(preferred);
    }
    if (const char* env = std::getenv("LABSHOT_FONT")) {
        candidates.emplace_back(env);
    }
    candidates.insert(candidates.end(), std::begin(kFontCandidates), std::end(kFontCandidates));

    std::error_code ec;
    for (const auto& candidate : candidates) {
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return "";
}

Image PaneRenderer::rasterize(const RenderContent& content, Language language, Theme theme,
                              RenderKind kind) const {
    const Palette& p = palette_for(theme);
    std::string filename = content.filename.empty() ? source_filename(language, content.code)
                                                    : content.filename;
    RenderContent named = content;
    named.filename = filename;

    switch (kind) {
        case RenderKind::CODE:
            return impl->code_pane(filename, highlight(content.code, language), p);
        case RenderKind::TERMINAL:
            return impl->terminal_pane(named, language, theme, p);
        case RenderKind::COMBINED: {
            Image code = impl->code_pane(filename, highlight(content.code, language), p);
            Image console = impl->terminal_pane(named, language, theme, p);
            return p.console_first ? Impl::stack(console, code, p.term_bg)
                                   : Impl::stack(code, console, p.editor_bg);
        }
        case RenderKind::BROWSER:
            return impl->browser_pane(named, language);
        case RenderKind::FILE: {
            std::vector<TokenLine> lines;
            for (const auto& line : FileUtils::split_lines(normalize_output(content.code))) {
                lines.push_back({{expand_tabs(line), TokenType::TEXT}});
            }
            return impl->code_pane(filename, lines, kNotepad);
        }
    }
    throw RenderError("unsupported render kind");
}

namespace {

void png_write_to_string(png_structp png, png_bytep data, png_size_t length) {
    auto* out = static_cast<std::string*>(png_get_io_ptr(png));
    out->append(reinterpret_cast<const char*>(data), length);
}

void png_flush_noop(png_structp) {}

} // namespace

std::string encode_png(const Image& image) {
    if (image.width <= 0 || image.height <= 0 ||
        image.rgb.size() != static_cast<size_t>(image.width) * image.height * 3) {
        throw RenderError("invalid image buffer");
    }

    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png) {
        throw RenderError("png_create_write_struct failed");
    }
    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_write_struct(&png, nullptr);
        throw RenderError("png_create_info_struct failed");
    }

    std::string out;
    std::vector<png_bytep> rows(static_cast<size_t>(image.height));
    for (int y = 0; y < image.height; y++) {
        rows[y] = const_cast<png_bytep>(&image.rgb[static_cast<size_t>(y) * image.width * 3]);
    }

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        throw RenderError("libpng encoding failed");
    }

    png_set_write_fn(png, &out, png_write_to_string, png_flush_noop);
    png_set_IHDR(png, info, static_cast<png_uint_32>(image.width),
                 static_cast<png_uint_32>(image.height), 8, PNG_COLOR_TYPE_RGB,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);
    png_write_image(png, rows.data());
    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);
    return out;
}

PngArtifactRenderer::PngArtifactRenderer(std::shared_ptr<const PaneRenderer> panes,
                                         ArtifactStore& store)
    : panes_(std::move(panes)), store_(store) {
    if (!panes_) {
        throw std::invalid_argument("PngArtifactRenderer requires a PaneRenderer");
    }
}

ArtifactRef PngArtifactRenderer::render(const RenderContent& content, Language language,
                                        Theme theme, RenderKind kind, const std::string& key) {
    Image image = panes_->rasterize(content, language, theme, kind);
    std::string bytes = encode_png(image);
    store_.put(key, bytes);

    ArtifactRef ref;
    ref.ref = key;
    ref.kind = to_string(kind);
    ref.digest = FileUtils::sha256_string(bytes);
    switch (kind) {
        case RenderKind::CODE:
        case RenderKind::COMBINED:
            ref.label = content.filename.empty() ? source_filename(language, content.code)
                                                 : content.filename;
            break;
        case RenderKind::TERMINAL:
            ref.label = "Output";
            break;
        case RenderKind::BROWSER:
            ref.label = "Route " + (content.route.empty() ? std::string("/") : content.route);
            break;
        case RenderKind::FILE:
            ref.label = "file_" + content.filename;
            break;
    }
    std::cout << "[Renderer] " << key << " " << image.width << "x" << image.height
              << " " << theme_name(theme) << "/" << ref.kind << std::endl;
    return ref;
}

} // namespace labshot
