#pragma once

#include <memory>
#include <string>

namespace mup1gw {
namespace gateway {

// Default suffix when the upload name carries no extension
constexpr const char *kDefaultUploadSuffix = ".yaml";

// Extension of the last path component ("cfg.yml" -> ".yml"); leading-dot and
// trailing-dot names have none. Falls back to kDefaultUploadSuffix.
std::string upload_suffix(const std::string &filename);

// TempArtifact owns one uploaded file staged on disk for the tool
// - Unique name per instance (mkstemps), mode 0600
// - Removed when the owner goes out of scope, whatever path it leaves by
class TempArtifact {
public:
    // Writes content to a new file in directory (system temp dir if empty).
    // Returns nullptr and sets error on failure; nothing is left on disk then.
    static std::unique_ptr<TempArtifact> create(const std::string &directory, const std::string &suffix,
                                                const std::string &content, std::string &error);

    ~TempArtifact();

    TempArtifact(const TempArtifact &) = delete;
    TempArtifact &operator=(const TempArtifact &) = delete;

    const std::string &path() const { return path_; }

    // Deletes the file now; safe to call more than once
    bool remove();

private:
    explicit TempArtifact(std::string path);

    std::string path_;
    bool removed_ = false;
};

}  // namespace gateway
}  // namespace mup1gw
