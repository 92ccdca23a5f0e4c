#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "labshot/constants.h"
#include "labshot/task.h"
#include "labshot/theme.h"

namespace labshot {

class ArtifactStore;

enum class RenderKind {
    CODE,       // Syntax-highlighted source in editor chrome
    TERMINAL,   // Captured stdout/stderr styled as a console
    COMBINED,   // Code pane and terminal pane stacked
    BROWSER,    // Page text under a browser address bar
    FILE        // Preview of a file the program wrote
};

std::string to_string(RenderKind kind);

struct RenderContent {
    std::string filename;      // Shown in the title bar
    std::string code;          // Source, page markup or file contents
    std::string stdout_text;
    std::string stderr_text;
    std::optional<int> exit_code;
    std::string route;         // BROWSER only, e.g. "/about"
};

// Packed 8-bit RGB, row-major
struct Image {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> rgb;
};

// Rasterizes panes with FreeType. Glyphs are cached at construction, so
// rasterize() is a pure function of its arguments and safe to call from
// several threads.
class PaneRenderer {
public:
    // Throws RenderError if no usable font is found
    explicit PaneRenderer(const std::string& font_path = "", int font_size = DEFAULT_FONT_SIZE);
    ~PaneRenderer();

    PaneRenderer(const PaneRenderer&) = delete;
    PaneRenderer& operator=(const PaneRenderer&) = delete;

    Image rasterize(const RenderContent& content, Language language, Theme theme,
                    RenderKind kind) const;

    const std::string& font_path() const;

    // First existing font among `preferred`, $LABSHOT_FONT and well-known
    // monospace locations. Empty if none.
    static std::string find_font(const std::string& preferred = "");

private:
    class Impl;
    std::unique_ptr<Impl> impl;
};

// Encodes with libpng; throws RenderError
std::string encode_png(const Image& image);

// Renders and persists one artifact, returning a reference to it
class ArtifactRenderer {
public:
    virtual ~ArtifactRenderer() = default;

    virtual ArtifactRef render(const RenderContent& content, Language language, Theme theme,
                               RenderKind kind, const std::string& key) = 0;
};

class PngArtifactRenderer : public ArtifactRenderer {
public:
    PngArtifactRenderer(std::shared_ptr<const PaneRenderer> panes, ArtifactStore& store);

    ArtifactRef render(const RenderContent& content, Language language, Theme theme,
                       RenderKind kind, const std::string& key) override;

private:
    std::shared_ptr<const PaneRenderer> panes_;
    ArtifactStore& store_;
};

} // namespace labshot
