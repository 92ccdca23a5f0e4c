#include "labshot/artifact_store.h"
#include "labshot/errors.h"
#include "file_utils.h"

#include <filesystem>
#include <iostream>
#include <sstream>

namespace labshot {

namespace fs = std::filesystem;

ArtifactStore::ArtifactStore(std::string root) : root_(std::move(root)) {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        throw StoreError("cannot create artifact root " + root_ + ": " + ec.message());
    }
}

void ArtifactStore::check_key(const std::string& key) const {
    std::stringstream ss(key);
    std::string part;
    size_t parts = 0;
    while (std::getline(ss, part, '/')) {
        if (!FileUtils::is_safe_identifier(part)) {
            throw StoreError("invalid artifact key: " + key);
        }
        parts++;
    }
    if (parts == 0) {
        throw StoreError("empty artifact key");
    }
}

std::string ArtifactStore::path_for(const std::string& key) const {
    check_key(key);
    return (fs::path(root_) / key).string();
}

void ArtifactStore::put(const std::string& key, const std::string& bytes) {
    fs::path path = path_for(key);
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw StoreError("cannot create " + path.parent_path().string() + ": " + ec.message());
    }

    bool created;
    try {
        created = FileUtils::write_file_exclusive(path.string(), bytes);
    } catch (const std::runtime_error& e) {
        throw StoreError(e.what());
    }
    if (!created) {
        throw StoreError("artifact already exists: " + key);
    }
    std::cout << "[ArtifactStore] Wrote " << key << " (" << bytes.size() << " bytes)" << std::endl;
}

std::string ArtifactStore::put_content_addressed(const std::string& prefix,
                                                 const std::string& stem,
                                                 const std::string& ext,
                                                 const std::string& bytes) {
    std::string digest = FileUtils::sha256_string(bytes);
    std::string key = prefix + "/" + stem + "_" + digest.substr(0, 8) + "." + ext;
    fs::path path = path_for(key);

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw StoreError("cannot create " + path.parent_path().string() + ": " + ec.message());
    }
    try {
        if (!FileUtils::write_file_exclusive(path.string(), bytes)) {
            if (FileUtils::read_file(path.string()) != bytes) {
                throw StoreError("digest collision for " + key);
            }
            return key;
        }
    } catch (const StoreError&) {
        throw;
    } catch (const std::runtime_error& e) {
        throw StoreError(e.what());
    }
    std::cout << "[ArtifactStore] Wrote " << key << " (" << bytes.size() << " bytes)" << std::endl;
    return key;
}

std::string ArtifactStore::read(const std::string& key) const {
    try {
        return FileUtils::read_file(path_for(key));
    } catch (const StoreError&) {
        throw;
    } catch (const std::runtime_error& e) {
        throw StoreError(e.what());
    }
}

bool ArtifactStore::exists(const std::string& key) const {
    std::error_code ec;
    return fs::exists(path_for(key), ec);
}

std::string ArtifactStore::artifact_key(const std::string& batch_id, const std::string& task_id,
                                        size_t index, const std::string& ext) {
    return batch_id + "/" + task_id + "_" + std::to_string(index) + "." + ext;
}

} // namespace labshot
