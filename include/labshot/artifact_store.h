#pragma once

#include <string>

namespace labshot {

// Append-only directory of rendered artifacts and composed documents.
// Keys are relative paths such as "<batch>/<task>_<index>.png".
class ArtifactStore {
public:
    explicit ArtifactStore(std::string root);

    // Write-once; throws StoreError if the key already exists
    void put(const std::string& key, const std::string& bytes);

    // Stores under "<prefix>/<stem>_<sha8>.<ext>" and returns the key.
    // Writing identical content again is a no-op.
    std::string put_content_addressed(const std::string& prefix, const std::string& stem,
                                      const std::string& ext, const std::string& bytes);

    std::string read(const std::string& key) const;
    bool exists(const std::string& key) const;
    std::string path_for(const std::string& key) const;
    const std::string& root() const { return root_; }

    static std::string artifact_key(const std::string& batch_id, const std::string& task_id,
                                    size_t index, const std::string& ext = "png");

private:
    void check_key(const std::string& key) const;

    std::string root_;
};

} // namespace labshot
