#pragma once

#include <string>
#include <vector>

namespace labshot {

// Crops captured output for a screenshot: more than 20 lines keeps the
// first 10, "...", and the last 5; lines over 120 characters keep 100 +
// "..." + 15. Any cropping appends "[Output truncated for display]".
std::string normalize_output(const std::string& output);

// Drops blank lines, hard-wraps at `width` and caps the total length
std::string clean_output(const std::string& output, size_t width = 90, size_t max_chars = 2000);

// Hard wrap keeping indentation-free continuation lines
std::vector<std::string> wrap_line(const std::string& line, size_t width);

// Replaces tabs with spaces and drops non-printable bytes
std::string expand_tabs(const std::string& line, size_t tab_width = 4);

// Visible text of an HTML/JSX document: tags removed, entities decoded,
// one entry per non-empty block
std::vector<std::string> visible_text(const std::string& markup);

} // namespace labshot
