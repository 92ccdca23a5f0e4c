#pragma once

#include <stdexcept>
#include <string>

namespace labshot {

// Persistence unavailable or a statement failed
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message)
        : std::runtime_error("Store error: " + message) {}
};

// Malformed batch submission, raised before anything is persisted
class InvalidBatchError : public std::runtime_error {
public:
    explicit InvalidBatchError(const std::string& message)
        : std::runtime_error("Invalid batch: " + message) {}
};

class UnknownThemeError : public std::runtime_error {
public:
    explicit UnknownThemeError(const std::string& theme)
        : std::runtime_error("Unknown theme: " + theme) {}
};

class RenderError : public std::runtime_error {
public:
    explicit RenderError(const std::string& message)
        : std::runtime_error("Render failed: " + message) {}
};

// Text generation collaborator failed or timed out
class UpstreamError : public std::runtime_error {
public:
    explicit UpstreamError(const std::string& message)
        : std::runtime_error("Upstream failure: " + message) {}
};

class ComposeError : public std::runtime_error {
public:
    explicit ComposeError(const std::string& message)
        : std::runtime_error("Compose failed: " + message) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error("Config error: " + message) {}
};

} // namespace labshot
