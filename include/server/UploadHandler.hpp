#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include "config.hpp"
#include "core/FileRecord.hpp"
#include "core/FileRegistry.hpp"
#include "http/MultipartParser.hpp"
#include "http/Request.hpp"
#include "server/FileStorage.hpp"

namespace lanshare {

/**
 * State of one multipart upload. Picks the `fileId` field and the first
 * `file` part out of the body, streams the file into a private temp sink and
 * publishes it on finish(). A session destroyed before publishing removes its
 * temp file.
 */
class UploadSession : public http::MultipartHandler {
public:
    UploadSession(FileStorage& storage, const std::string& boundary);
    ~UploadSession() override;

    UploadSession(const UploadSession&) = delete;
    UploadSession& operator=(const UploadSession&) = delete;

    void feed(const char* data, size_t len) { parser_.feed(data, len); }

    // Ends the body, moves the file into place and registers it
    FileRecord finish(FileRegistry& registry);

    const std::optional<std::string>& fileId() const { return fileId_; }
    const std::optional<std::string>& filename() const { return filename_; }
    const std::filesystem::path& tempPath() const { return tempPath_; }
    uint64_t bytesWritten() const { return bytesWritten_; }
    bool published() const { return published_; }

    http::PartDisposition onPartHeaders(const http::PartHeaders& headers) override;
    void onFieldValue(const http::PartHeaders& headers, const std::string& value) override;
    void onPartData(const char* data, size_t len) override;
    void onPartEnd(const http::PartHeaders& headers) override;

private:
    void discard();

    FileStorage& storage_;
    http::MultipartStreamParser parser_;
    std::optional<std::string> fileId_;
    std::optional<std::string> filename_;
    std::string declaredType_;
    std::filesystem::path tempPath_;
    std::ofstream sink_;
    uint64_t bytesWritten_ = 0;
    bool fileSeen_ = false;
    bool fileComplete_ = false;
    bool published_ = false;
};

class UploadHandler {
public:
    UploadHandler(FileRegistry& registry, FileStorage& storage,
                  size_t chunkSize = LANSHARE_CHUNK_SIZE,
                  uint64_t progressStep = LANSHARE_UPLOAD_PROGRESS_STEP);

    /**
     * Streams a multipart/form-data request body to storage and publishes it.
     * Throws HttpError: MalformedRequest for bad headers or missing parts,
     * IncompleteTransfer for a truncated body, InternalError for I/O failures.
     */
    FileRecord handleUpload(const http::Request& request);

private:
    FileRegistry& registry_;
    FileStorage& storage_;
    size_t chunkSize_;
    uint64_t progressStep_;
};

} // namespace lanshare
