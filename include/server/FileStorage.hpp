#pragma once

#include <cstdint>
#include <string>
#include <filesystem>
#include <stdexcept>

namespace lanshare {

/**
 * Owns the on-disk layout: temporary sinks live in the upload directory, each
 * published upload in a subdirectory named after its id, and host-registered
 * files are resolved under the shared directory.
 */
class FileStorage {
public:
    explicit FileStorage(const std::string& uploadDir = "uploads",
                         const std::string& sharedDir = "shared");

    // Private temp name for an in-flight upload; unique per call
    std::filesystem::path tempPathFor(const std::string& fileId) const;

    // Final location of a published upload: <uploadDir>/<encoded id>/<filename>
    std::filesystem::path finalPathFor(const std::string& fileId, const std::string& filename) const;

    // Atomically moves temp into place and returns the size on disk
    uint64_t publish(const std::filesystem::path& temp, const std::filesystem::path& final) const;

    // Resolves a host-relative path under the shared directory
    std::filesystem::path resolveShared(const std::string& relative) const;

    // Deletes a file; missing files are not an error
    bool deleteFile(const std::filesystem::path& path) const;

    // Whether a path names an in-flight upload sink
    static bool isTempName(const std::filesystem::path& path);

    // Ensures the storage directories exist
    void ensureStorageDirectory() const;

    const std::filesystem::path& uploadDir() const { return uploadDir_; }
    const std::filesystem::path& sharedDir() const { return sharedDir_; }

    // Keeps only the last path component; throws HttpError(MalformedRequest) if nothing usable is left
    static std::string sanitizeFilename(const std::string& filename);

    // Percent-encodes everything but [A-Za-z0-9_-], so distinct ids never share a
    // directory name and the result can never be "." or ".."
    static std::string encodeId(const std::string& id);

    static std::string formatFileSize(uint64_t bytes);

private:
    std::filesystem::path uploadDir_;
    std::filesystem::path sharedDir_;

    // Generates a unique suffix to prevent collisions
    static std::string generateUniqueSuffix();
};

} // namespace lanshare
