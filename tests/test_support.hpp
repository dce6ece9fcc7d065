#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

#include "http/ChunkReader.hpp"
#include "http/ChunkWriter.hpp"
#include "http/HttpError.hpp"
#include "server/FileStorage.hpp"

namespace lanshare {
namespace test {

/**
 * In-memory request body delivered in scripted chunk sizes. If the declared
 * length is larger than the data, reading past the data behaves like a peer
 * that hung up.
 */
class MemoryChunkReader final : public http::ChunkReader {
public:
    MemoryChunkReader(std::string data, std::vector<size_t> chunkSizes = {},
                      std::optional<uint64_t> declaredLength = std::nullopt)
        : data_(std::move(data)),
          chunkSizes_(std::move(chunkSizes)),
          declared_(declaredLength ? *declaredLength : data_.size()) {}

    size_t read(char* buffer, size_t maxLen) override {
        if (maxLen == 0 || offset_ >= declared_) {
            return 0;
        }
        if (offset_ >= data_.size()) {
            throw http::HttpError::incomplete("Unexpected end of data at " + std::to_string(offset_));
        }
        size_t limit = maxLen;
        if (!chunkSizes_.empty()) {
            limit = std::min(limit, std::max<size_t>(1, chunkSizes_[call_++ % chunkSizes_.size()]));
        }
        size_t available = std::min<uint64_t>(data_.size(), declared_) - offset_;
        size_t n = std::min(limit, available);
        std::memcpy(buffer, data_.data() + offset_, n);
        offset_ += n;
        return n;
    }

    uint64_t contentLength() const override { return declared_; }
    uint64_t consumed() const override { return offset_; }

private:
    std::string data_;
    std::vector<size_t> chunkSizes_;
    uint64_t declared_;
    uint64_t offset_ = 0;
    size_t call_ = 0;
};

/**
 * Collects everything written; optionally fails like a dropped connection
 * once `failAfter` bytes have gone through.
 */
class StringChunkWriter final : public http::ChunkWriter {
public:
    explicit StringChunkWriter(std::optional<uint64_t> failAfter = std::nullopt)
        : failAfter_(failAfter) {}

    void write(const char* data, size_t len) override {
        if (failAfter_ && written_ + len > *failAfter_) {
            size_t accepted = static_cast<size_t>(*failAfter_ - written_);
            out_.append(data, accepted);
            written_ += accepted;
            throw http::HttpError::incomplete("Broken pipe");
        }
        out_.append(data, len);
        written_ += len;
    }

    uint64_t bytesWritten() const override { return written_; }

    using ChunkWriter::write;

    const std::string& str() const { return out_; }

    // Everything after the blank line that ends the response head
    std::string body() const {
        size_t end = out_.find("\r\n\r\n");
        return end == std::string::npos ? std::string() : out_.substr(end + 4);
    }

    std::string head() const {
        size_t end = out_.find("\r\n\r\n");
        return end == std::string::npos ? out_ : out_.substr(0, end + 4);
    }

    bool hasHeader(const std::string& line) const {
        return head().find("\r\n" + line + "\r\n") != std::string::npos;
    }

private:
    std::optional<uint64_t> failAfter_;
    std::string out_;
    uint64_t written_ = 0;
};

// Scratch directory removed on destruction
class TempDir {
public:
    TempDir() {
        static std::atomic<unsigned> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("lanshare-test-" + std::to_string(stamp) + "-" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string str(const std::string& child) const { return (path_ / child).string(); }

private:
    std::filesystem::path path_;
};

struct FormPart {
    std::string name;
    std::optional<std::string> filename;
    std::string data;
    std::string contentType = "application/octet-stream";
};

inline std::string multipartBody(const std::string& boundary, const std::vector<FormPart>& parts) {
    std::string body;
    for (const auto& part : parts) {
        body += "--" + boundary + "\r\n";
        body += "Content-Disposition: form-data; name=\"" + part.name + "\"";
        if (part.filename) {
            body += "; filename=\"" + *part.filename + "\"\r\n";
            body += "Content-Type: " + part.contentType;
        }
        body += "\r\n\r\n";
        body += part.data;
        body += "\r\n";
    }
    body += "--" + boundary + "--\r\n";
    return body;
}

// Deterministic binary data that includes CR, LF and '-' bytes
inline std::string patternBytes(size_t n, unsigned seed = 7) {
    std::string out;
    out.reserve(n);
    uint32_t state = seed * 2654435761u + 1;
    for (size_t i = 0; i < n; ++i) {
        state = state * 1664525u + 1013904223u;
        uint8_t b = static_cast<uint8_t>(state >> 24);
        if (i % 97 == 0) b = '\r';
        if (i % 97 == 1) b = '\n';
        if (i % 97 == 2 || i % 97 == 3) b = '-';
        out += static_cast<char>(b);
    }
    return out;
}

inline std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

inline void writeFile(const std::filesystem::path& path, const std::string& data) {
    std::ofstream out(path, std::ios::binary);
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
}

inline size_t countTempFiles(const std::filesystem::path& dir) {
    size_t n = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (FileStorage::isTempName(entry.path())) ++n;
    }
    return n;
}

} // namespace test
} // namespace lanshare
