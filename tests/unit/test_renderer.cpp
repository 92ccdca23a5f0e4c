#include <gtest/gtest.h>
#include "labshot/artifact_store.h"
#include "labshot/errors.h"
#include "labshot/renderer.h"
#include "file_utils.h"
#include "highlighter.h"

#include <filesystem>
#include <memory>

namespace labshot {
namespace {

bool has_token(const TokenLine& line, const std::string& text, TokenType type) {
    for (const auto& token : line) {
        if (token.text == text && token.type == type) {
            return true;
        }
    }
    return false;
}

std::string joined(const TokenLine& line) {
    std::string text;
    for (const auto& token : line) {
        text += token.text;
    }
    return text;
}

// ============================================================================
// Highlighting
// ============================================================================

TEST(HighlighterTest, PythonTokens) {
    auto lines = highlight("def f(x):\n    return 'hi'  # note\n", Language::PYTHON);

    ASSERT_GE(lines.size(), 2u);
    EXPECT_TRUE(has_token(lines[0], "def", TokenType::KEYWORD));
    EXPECT_TRUE(has_token(lines[1], "'hi'", TokenType::STRING));
    EXPECT_TRUE(has_token(lines[1], "# note", TokenType::COMMENT));
    EXPECT_EQ(joined(lines[1]), "    return 'hi'  # note") << "Tokens must cover the line";
}

TEST(HighlighterTest, CommentSpansLines) {
    auto lines = highlight("int a; /* one\ntwo */ int b;", Language::C);

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1].front().type, TokenType::COMMENT);
    EXPECT_TRUE(has_token(lines[1], "int", TokenType::KEYWORD));
}

TEST(HighlighterTest, PreprocessorLine) {
    auto lines = highlight("#include <stdio.h>", Language::C);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].front().type, TokenType::PREPROCESSOR);
}

// ============================================================================
// PNG encoding
// ============================================================================

TEST(EncodePngTest, WritesSignature) {
    Image image;
    image.width = 2;
    image.height = 2;
    image.rgb.assign(12, 0x80);

    std::string png = encode_png(image);

    ASSERT_GT(png.size(), 8u);
    EXPECT_EQ(png.substr(0, 8), std::string("\x89PNG\r\n\x1a\n", 8));
    EXPECT_EQ(encode_png(image), png);
}

TEST(EncodePngTest, RejectsBadBuffer) {
    Image image;
    image.width = 4;
    image.height = 4;
    image.rgb.assign(10, 0);
    EXPECT_THROW(encode_png(image), RenderError);
    EXPECT_THROW(encode_png(Image{}), RenderError);
}

// ============================================================================
// Rasterizing
// ============================================================================

class PaneRendererTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (PaneRenderer::find_font().empty()) {
            GTEST_SKIP() << "no monospace font installed";
        }
        panes = std::make_shared<PaneRenderer>();

        content.code = "print(2 + 2)\n";
        content.stdout_text = "4\n";
        content.exit_code = 0;
    }

    std::shared_ptr<PaneRenderer> panes;
    RenderContent content;
};

TEST_F(PaneRendererTest, SameInputSameBytes) {
    std::string first = encode_png(
        panes->rasterize(content, Language::PYTHON, Theme::IDLE, RenderKind::COMBINED));
    std::string second = encode_png(
        panes->rasterize(content, Language::PYTHON, Theme::IDLE, RenderKind::COMBINED));
    EXPECT_EQ(FileUtils::sha256_string(first), FileUtils::sha256_string(second));
}

TEST_F(PaneRendererTest, ThemeChangesPixels) {
    Image idle = panes->rasterize(content, Language::PYTHON, Theme::IDLE, RenderKind::CODE);
    Image vscode = panes->rasterize(content, Language::PYTHON, Theme::VSCODE, RenderKind::CODE);
    EXPECT_NE(idle.rgb, vscode.rgb);
}

TEST_F(PaneRendererTest, EveryKindProducesAnImage) {
    content.route = "/about";
    for (RenderKind kind : {RenderKind::CODE, RenderKind::TERMINAL, RenderKind::COMBINED,
                            RenderKind::BROWSER, RenderKind::FILE}) {
        Image image = panes->rasterize(content, Language::PYTHON, Theme::IDLE, kind);
        EXPECT_GT(image.width, 0) << to_string(kind);
        EXPECT_GT(image.height, 0) << to_string(kind);
        EXPECT_EQ(image.rgb.size(), static_cast<size_t>(image.width) * image.height * 3);
    }
}

TEST_F(PaneRendererTest, CombinedIsTallerThanCode) {
    Image code = panes->rasterize(content, Language::PYTHON, Theme::IDLE, RenderKind::CODE);
    Image combined = panes->rasterize(content, Language::PYTHON, Theme::IDLE,
                                      RenderKind::COMBINED);
    EXPECT_GT(combined.height, code.height);
}

TEST_F(PaneRendererTest, ArtifactRendererStoresPng) {
    // Given: An artifact store in a temp dir
    auto root = std::filesystem::temp_directory_path() /
                ("labshot_render_" + FileUtils::random_hex(4));
    ArtifactStore store(root.string());
    PngArtifactRenderer renderer(panes, store);

    // When: Rendering a combined pane and a browser route
    ArtifactRef code = renderer.render(content, Language::PYTHON, Theme::IDLE,
                                       RenderKind::COMBINED, "b-1/q1_0.png");
    content.route = "/about";
    ArtifactRef page = renderer.render(content, Language::REACT, Theme::REACT,
                                       RenderKind::BROWSER, "b-1/q1_1.png");

    // Then: Both are stored under their keys with digests of the stored bytes
    EXPECT_EQ(code.label, "main.py");
    EXPECT_EQ(code.kind, "combined");
    EXPECT_EQ(code.digest, FileUtils::sha256_string(store.read("b-1/q1_0.png")));
    EXPECT_EQ(page.label, "Route /about");
    EXPECT_THROW(renderer.render(content, Language::PYTHON, Theme::IDLE, RenderKind::CODE,
                                 "b-1/q1_0.png"),
                 StoreError);

    std::filesystem::remove_all(root);
}

TEST(PaneRendererFontTest, MissingFontThrows) {
    if (!PaneRenderer::find_font().empty()) {
        GTEST_SKIP() << "a fallback font is installed";
    }
    EXPECT_THROW(PaneRenderer("/nonexistent/font.ttf"), RenderError);
}

TEST(ThemeParseTest, UnknownThemeIsRejected) {
    EXPECT_THROW(parse_theme("solarized"), UnknownThemeError);
    EXPECT_EQ(parse_theme("vscode"), Theme::VSCODE);
}

} // namespace
} // namespace labshot
