#include "server/FileStorage.hpp"
#include "http/HttpError.hpp"
#include <atomic>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>
#include <iostream>

namespace lanshare {

namespace {
const char* kTempPrefix = ".upload-";
const char* kTempSuffix = ".part";
}

FileStorage::FileStorage(const std::string& uploadDir, const std::string& sharedDir)
    : uploadDir_(uploadDir), sharedDir_(sharedDir) {
    ensureStorageDirectory();
}

void FileStorage::ensureStorageDirectory() const {
    std::filesystem::create_directories(uploadDir_);
    std::filesystem::create_directories(sharedDir_);
}

std::filesystem::path FileStorage::tempPathFor(const std::string& fileId) const {
    std::string key = fileId.empty() ? "pending" : encodeId(fileId);
    return uploadDir_ / (kTempPrefix + key + "-" + generateUniqueSuffix() + kTempSuffix);
}

std::filesystem::path FileStorage::finalPathFor(const std::string& fileId,
                                                const std::string& filename) const {
    return uploadDir_ / encodeId(fileId) / sanitizeFilename(filename);
}

uint64_t FileStorage::publish(const std::filesystem::path& temp,
                              const std::filesystem::path& final) const {
    std::error_code ec;
    std::filesystem::create_directories(final.parent_path(), ec);
    if (ec) {
        throw http::HttpError::internal("Failed to create " + final.parent_path().string() +
                                        " (" + ec.message() + ")");
    }
    std::filesystem::rename(temp, final, ec);
    if (ec) {
        throw http::HttpError::internal("Failed to move " + temp.string() + " to " +
                                        final.string() + " (" + ec.message() + ")");
    }
    uint64_t size = std::filesystem::file_size(final, ec);
    if (ec) {
        throw http::HttpError::internal("Failed to stat " + final.string() + " (" + ec.message() + ")");
    }
    return size;
}

std::filesystem::path FileStorage::resolveShared(const std::string& relative) const {
    std::filesystem::path rel(relative);
    if (relative.empty() || rel.is_absolute() || rel.has_root_name()) {
        throw http::HttpError::malformed("Shared path must be relative: " + relative);
    }
    for (const auto& part : rel) {
        if (part == "..") {
            throw http::HttpError::malformed("Shared path escapes shared directory: " + relative);
        }
    }
    return sharedDir_ / rel.lexically_normal();
}

bool FileStorage::deleteFile(const std::filesystem::path& path) const {
    std::error_code ec;
    bool removed = std::filesystem::remove(path, ec);
    if (ec) {
        std::cerr << "Failed to delete " << path << ": " << ec.message() << std::endl;
        return false;
    }
    return removed;
}

bool FileStorage::isTempName(const std::filesystem::path& path) {
    std::string name = path.filename().string();
    std::string prefix = kTempPrefix;
    std::string suffix = kTempSuffix;
    return name.size() > prefix.size() + suffix.size() &&
           name.compare(0, prefix.size(), prefix) == 0 &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string FileStorage::sanitizeFilename(const std::string& filename) {
    // Remove any path components
    std::string name = filename;
    size_t lastSlash = name.find_last_of("/\\");
    if (lastSlash != std::string::npos) {
        name = name.substr(lastSlash + 1);
    }

    std::string clean;
    for (char c : name) {
        if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) continue;
        clean += c;
    }

    if (clean.empty() || clean == "." || clean == "..") {
        throw http::HttpError::malformed("Invalid filename: " + filename);
    }
    return clean;
}

std::string FileStorage::encodeId(const std::string& id) {
    if (id.empty()) {
        throw http::HttpError::malformed("Invalid file id: empty");
    }
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(id.size());
    for (char c : id) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_') {
            out += c;
        } else {
            out += '%';
            out += hex[uc >> 4];
            out += hex[uc & 0x0f];
        }
    }
    return out;
}

std::string FileStorage::formatFileSize(uint64_t bytes) {
    if (bytes == 0) {
        return "0 Bytes";
    }
    const char* sizes[] = {"Bytes", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    int i = 0;
    while (value >= 1024.0 && i < 4) {
        value /= 1024.0;
        ++i;
    }
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << value << " " << sizes[i];
    return ss.str();
}

std::string FileStorage::generateUniqueSuffix() {
    // Generate a timestamp
    auto now = std::chrono::system_clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();

    // Random number plus a process-wide counter for uniqueness within one millisecond
    static std::atomic<unsigned> counter{0};
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(1000, 9999);

    std::ostringstream ss;
    ss << millis << "-" << dis(gen) << "-" << counter.fetch_add(1);
    return ss.str();
}

} // namespace lanshare
