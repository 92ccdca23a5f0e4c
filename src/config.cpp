#include "labshot/config.h"
#include "labshot/errors.h"
#include "file_utils.h"

#include <json/json.h>

#include <iostream>
#include <sstream>

namespace labshot {

namespace {

int read_int(const Json::Value& root, const char* key, int current) {
    if (!root.isMember(key)) {
        return current;
    }
    const Json::Value& value = root[key];
    if (!value.isInt()) {
        throw ConfigError(std::string("'") + key + "' must be an integer");
    }
    return value.asInt();
}

size_t read_size(const Json::Value& root, const char* key, size_t current) {
    if (!root.isMember(key)) {
        return current;
    }
    const Json::Value& value = root[key];
    if (!value.isUInt64()) {
        throw ConfigError(std::string("'") + key + "' must be a non-negative integer");
    }
    return static_cast<size_t>(value.asUInt64());
}

std::string read_string(const Json::Value& root, const char* key, const std::string& current) {
    if (!root.isMember(key)) {
        return current;
    }
    const Json::Value& value = root[key];
    if (!value.isString()) {
        throw ConfigError(std::string("'") + key + "' must be a string");
    }
    return value.asString();
}

bool read_bool(const Json::Value& root, const char* key, bool current) {
    if (!root.isMember(key)) {
        return current;
    }
    const Json::Value& value = root[key];
    if (!value.isBool()) {
        throw ConfigError(std::string("'") + key + "' must be true or false");
    }
    return value.asBool();
}

} // namespace

ExecutionLimits Config::execution_limits() const {
    ExecutionLimits limits;
    limits.timeout = std::chrono::seconds(timeout_seconds);
    limits.memory_bytes = memory_bytes;
    limits.cpu_quota_us = cpu_quota_us;
    limits.cpu_period_us = cpu_period_us;
    limits.max_processes = max_processes;
    limits.max_open_files = max_open_files;
    limits.max_capture_bytes = max_capture_bytes;
    limits.network = false;
    return limits;
}

TextCallPolicy Config::text_policy() const {
    TextCallPolicy policy;
    policy.timeout = std::chrono::seconds(text_timeout_seconds);
    policy.retries = text_retries;
    policy.backoff = std::chrono::milliseconds(text_backoff_ms);
    return policy;
}

void Config::check() const {
    if (workers == 0) {
        throw ConfigError("workers must be at least 1");
    }
    if (timeout_seconds <= 0) {
        throw ConfigError("timeout_seconds must be positive");
    }
    if (memory_bytes < 16 * 1024 * 1024) {
        throw ConfigError("memory_bytes below 16MB cannot start an interpreter");
    }
    if (cpu_quota_us <= 0 || cpu_period_us <= 0) {
        throw ConfigError("cpu quota and period must be positive");
    }
    if (max_processes <= 0 || max_open_files <= 0) {
        throw ConfigError("process and file limits must be positive");
    }
    if (max_capture_bytes == 0) {
        throw ConfigError("max_capture_bytes must be positive");
    }
    if (text_timeout_seconds <= 0 || text_retries < 0 || text_backoff_ms < 0) {
        throw ConfigError("text generation timeout must be positive, retries and backoff non-negative");
    }
    if (font_size < 6 || font_size > 72) {
        throw ConfigError("font_size must be between 6 and 72");
    }
    if (max_source_length == 0) {
        throw ConfigError("max_source_length must be positive");
    }
    for (const auto& route : default_routes) {
        if (route.empty() || route[0] != '/') {
            throw ConfigError("route '" + route + "' must start with '/'");
        }
    }
}

Config Config::from_json_text(const std::string& text, Config base) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(text);
    if (!Json::parseFromStream(builder, stream, &root, &errors)) {
        throw ConfigError("invalid JSON: " + errors);
    }
    if (!root.isObject()) {
        throw ConfigError("top level must be an object");
    }

    Config config = std::move(base);
    config.workers = read_size(root, "workers", config.workers);
    config.timeout_seconds = read_int(root, "timeout_seconds", config.timeout_seconds);
    config.memory_bytes = read_size(root, "memory_bytes", config.memory_bytes);
    config.cpu_quota_us = read_int(root, "cpu_quota_us", static_cast<int>(config.cpu_quota_us));
    config.cpu_period_us = read_int(root, "cpu_period_us", static_cast<int>(config.cpu_period_us));
    config.max_processes = read_int(root, "max_processes", config.max_processes);
    config.max_open_files = read_int(root, "max_open_files", config.max_open_files);
    config.max_capture_bytes = read_size(root, "max_capture_bytes", config.max_capture_bytes);
    config.work_dir = read_string(root, "work_dir", config.work_dir);
    config.cgroup_root = read_string(root, "cgroup_root", config.cgroup_root);
    config.require_seccomp = read_bool(root, "require_seccomp", config.require_seccomp);
    config.require_isolation = read_bool(root, "require_isolation", config.require_isolation);
    config.text_timeout_seconds =
        read_int(root, "text_timeout_seconds", config.text_timeout_seconds);
    config.text_retries = read_int(root, "text_retries", config.text_retries);
    config.text_backoff_ms = read_int(root, "text_backoff_ms", config.text_backoff_ms);
    config.database_path = read_string(root, "database_path", config.database_path);
    config.artifact_dir = read_string(root, "artifact_dir", config.artifact_dir);
    config.font_path = read_string(root, "font_path", config.font_path);
    config.font_size = read_int(root, "font_size", config.font_size);
    config.max_source_length = read_size(root, "max_source_length", config.max_source_length);

    if (root.isMember("default_routes")) {
        const Json::Value& routes = root["default_routes"];
        if (!routes.isArray()) {
            throw ConfigError("'default_routes' must be an array of strings");
        }
        config.default_routes.clear();
        for (const auto& route : routes) {
            if (!route.isString()) {
                throw ConfigError("'default_routes' must be an array of strings");
            }
            config.default_routes.push_back(route.asString());
        }
    }

    config.check();
    return config;
}

Config Config::load_file(const std::string& path, Config base) {
    std::string text;
    try {
        text = FileUtils::read_file(path);
    } catch (const std::runtime_error& e) {
        throw ConfigError("cannot read " + path + ": " + e.what());
    }
    Config config = from_json_text(text, std::move(base));
    std::cout << "[Main] Loaded config from " << path << std::endl;
    return config;
}

} // namespace labshot
