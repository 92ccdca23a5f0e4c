#include "file_utils.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <fcntl.h>
#include <unistd.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace labshot {

namespace {

const std::vector<std::string> kReservedNames = {
    "CON", "PRN", "AUX", "NUL",
    "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
    "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9"
};

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-';
}

} // namespace

std::string FileUtils::sha256_string(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return bytes_to_hex(hash, SHA256_DIGEST_LENGTH);
}

std::string FileUtils::sha256_file(const std::string& filepath) {
    return sha256_string(read_file(filepath));
}

std::string FileUtils::bytes_to_hex(const unsigned char* data, size_t len) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; i++) {
        ss << std::setw(2) << static_cast<int>(data[i]);
    }
    return ss.str();
}

std::string FileUtils::random_hex(size_t bytes) {
    std::vector<unsigned char> buffer(bytes);
    if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return bytes_to_hex(buffer.data(), buffer.size());
}

std::string FileUtils::sanitize_filename(const std::string& filename, size_t max_length) {
    if (filename.empty()) {
        throw std::invalid_argument("Filename cannot be empty");
    }

    std::string name = filename;
    auto slash = name.find_last_of("/\\");
    if (slash != std::string::npos) {
        name = name.substr(slash + 1);
    }

    std::string cleaned;
    for (char c : name) {
        if (c == '\0') {
            continue;
        }
        cleaned += is_name_char(c) ? c : '_';
    }

    // Multiple dots could hide an extension
    size_t pos;
    while ((pos = cleaned.find("..")) != std::string::npos) {
        cleaned.replace(pos, 2, ".");
    }

    auto first = cleaned.find_first_not_of(".-");
    auto last = cleaned.find_last_not_of(".-");
    cleaned = first == std::string::npos ? "" : cleaned.substr(first, last - first + 1);

    if (std::none_of(cleaned.begin(), cleaned.end(),
                     [](unsigned char c) { return std::isalnum(c); })) {
        throw std::invalid_argument("Filename must contain at least one alphanumeric character");
    }

    if (cleaned.size() > max_length) {
        auto dot = cleaned.rfind('.');
        std::string ext = dot == std::string::npos ? "" : cleaned.substr(dot);
        if (ext.size() >= max_length) {
            ext.clear();
        }
        cleaned = cleaned.substr(0, max_length - ext.size()) + ext;
    }

    std::string stem = cleaned.substr(0, cleaned.find('.'));
    std::transform(stem.begin(), stem.end(), stem.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    if (std::find(kReservedNames.begin(), kReservedNames.end(), stem) != kReservedNames.end()) {
        cleaned = "file_" + cleaned;
    }
    return cleaned;
}

bool FileUtils::is_safe_identifier(const std::string& id) {
    if (id.empty() || id.size() > 64 || id[0] == '.') {
        return false;
    }
    return std::all_of(id.begin(), id.end(), is_name_char);
}

std::string FileUtils::read_file(const std::string& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

bool FileUtils::write_file_exclusive(const std::string& filepath, const std::string& data) {
    int fd = open(filepath.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd == -1) {
        if (errno == EEXIST) {
            return false;
        }
        throw std::runtime_error("Cannot create " + filepath + ": " + std::strerror(errno));
    }

    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = write(fd, data.data() + written, data.size() - written);
        if (n == -1) {
            if (errno == EINTR) {
                continue;
            }
            int saved = errno;
            close(fd);
            unlink(filepath.c_str());
            throw std::runtime_error("Write failed for " + filepath + ": " + std::strerror(saved));
        }
        written += static_cast<size_t>(n);
    }

    if (close(fd) != 0) {
        throw std::runtime_error("Close failed for " + filepath + ": " + std::strerror(errno));
    }
    return true;
}

void FileUtils::write_file(const std::string& filepath, const std::string& data) {
    std::ofstream file(filepath, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Cannot write file: " + filepath);
    }
    file << data;
    if (!file) {
        throw std::runtime_error("Write failed for " + filepath);
    }
}

bool FileUtils::looks_like_text(const std::string& data) {
    size_t probe = std::min<size_t>(data.size(), 8192);
    return std::memchr(data.data(), '\0', probe) == nullptr;
}

std::string FileUtils::sanitize_relative_path(const std::string& path) {
    std::string result;
    std::stringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '/')) {
        if (part.empty() || part == "." || part == "..") {
            continue;
        }
        if (!result.empty()) {
            result += '/';
        }
        result += sanitize_filename(part);
    }
    if (result.empty()) {
        throw std::invalid_argument("Empty project path: " + path);
    }
    return result;
}

std::vector<std::string> FileUtils::split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::string current;
    for (char c : text) {
        if (c == '\n') {
            lines.push_back(current);
            current.clear();
        } else if (c != '\r') {
            current += c;
        }
    }
    if (!current.empty()) {
        lines.push_back(current);
    }
    return lines;
}

} // namespace labshot
