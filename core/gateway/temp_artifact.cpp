#include "temp_artifact.hpp"

#include <fcntl.h>
#include <stdlib.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <vector>

#include "logging/logger.hpp"

namespace mup1gw {
namespace gateway {

namespace {
constexpr const char *kNamePrefix = "mup1gw-";
constexpr const char *kUniquePart = "XXXXXX";
}  // namespace

std::string upload_suffix(const std::string &filename) {
    std::string name = filename;
    while (!name.empty() && name.back() == '/') {
        name.pop_back();
    }
    const auto slash = name.find_last_of('/');
    if (slash != std::string::npos) {
        name = name.substr(slash + 1);
    }

    const auto dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 >= name.size()) {
        return kDefaultUploadSuffix;
    }

    std::string suffix = name.substr(dot);
    if (suffix.find('\0') != std::string::npos) {
        return kDefaultUploadSuffix;
    }
    return suffix;
}

TempArtifact::TempArtifact(std::string path) : path_(std::move(path)) {}

TempArtifact::~TempArtifact() { remove(); }

std::unique_ptr<TempArtifact> TempArtifact::create(const std::string &directory, const std::string &suffix,
                                                   const std::string &content, std::string &error) {
    std::filesystem::path dir(directory);
    if (directory.empty()) {
        std::error_code ec;
        dir = std::filesystem::temp_directory_path(ec);
        if (ec) {
            error = "No temporary directory available: " + ec.message();
            return nullptr;
        }
    }

    const std::string pattern = (dir / (std::string(kNamePrefix) + kUniquePart + suffix)).string();
    std::vector<char> name_buf(pattern.begin(), pattern.end());
    name_buf.push_back('\0');

    int fd = mkostemps(name_buf.data(), static_cast<int>(suffix.size()), O_CLOEXEC);
    if (fd < 0) {
        error = "Failed to create temporary file in " + dir.string() + ": " + std::strerror(errno);
        return nullptr;
    }

    // From here on the destructor owns cleanup
    std::unique_ptr<TempArtifact> artifact(new TempArtifact(std::string(name_buf.data())));

    size_t written = 0;
    while (written < content.size()) {
        ssize_t bytes = write(fd, content.data() + written, content.size() - written);
        if (bytes < 0) {
            if (errno == EINTR) {
                continue;
            }
            error = "Failed to write " + artifact->path() + ": " + std::strerror(errno);
            close(fd);
            return nullptr;
        }
        written += static_cast<size_t>(bytes);
    }

    if (close(fd) < 0) {
        error = "Failed to close " + artifact->path() + ": " + std::strerror(errno);
        return nullptr;
    }

    LOG_DEBUG("[TempArtifact] Staged " << content.size() << " bytes at " << artifact->path());
    return artifact;
}

bool TempArtifact::remove() {
    if (removed_) {
        return true;
    }
    if (unlink(path_.c_str()) < 0 && errno != ENOENT) {
        LOG_WARN("[TempArtifact] Failed to remove " << path_ << ": " << std::strerror(errno));
        return false;
    }
    removed_ = true;
    LOG_DEBUG("[TempArtifact] Removed " << path_);
    return true;
}

}  // namespace gateway
}  // namespace mup1gw
