#pragma once

#include <string>
#include <vector>

namespace labshot {

class FileUtils {
public:
    // Hash utilities (artifact digests, content-addressed documents)
    static std::string sha256_string(const std::string& data);
    static std::string sha256_file(const std::string& filepath);
    static std::string bytes_to_hex(const unsigned char* data, size_t len);

    // Cryptographically random identifier, hex encoded (2 chars per byte)
    static std::string random_hex(size_t bytes);

    // Strip directories, replace anything outside [A-Za-z0-9._-], collapse
    // "..", trim leading/trailing dots and dashes, guard reserved names.
    // Throws std::invalid_argument if nothing usable remains.
    static std::string sanitize_filename(const std::string& filename, size_t max_length = 255);

    // [A-Za-z0-9._-]{1,64}, not starting with a dot
    static bool is_safe_identifier(const std::string& id);

    // Whole-file read; throws std::runtime_error on failure
    static std::string read_file(const std::string& filepath);

    // Creates the file with O_EXCL; returns false if it already exists,
    // throws std::runtime_error on any other failure
    static bool write_file_exclusive(const std::string& filepath, const std::string& data);

    // Plain overwrite, used for sources inside a private work directory
    static void write_file(const std::string& filepath, const std::string& data);

    // No NUL bytes in the first block
    static bool looks_like_text(const std::string& data);

    // Path separators in a project file are kept, each component sanitized
    static std::string sanitize_relative_path(const std::string& path);

    static std::vector<std::string> split_lines(const std::string& text);
};

} // namespace labshot
