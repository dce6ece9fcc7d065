#include "server/UploadHandler.hpp"
#include "http/HttpError.hpp"
#include "http/MimeTypes.hpp"
#include <iostream>
#include <vector>

namespace lanshare {

UploadSession::UploadSession(FileStorage& storage, const std::string& boundary)
    : storage_(storage), parser_(boundary, *this) {}

UploadSession::~UploadSession() {
    discard();
}

void UploadSession::discard() {
    if (sink_.is_open()) {
        sink_.close();
    }
    if (!published_ && !tempPath_.empty()) {
        if (storage_.deleteFile(tempPath_)) {
            std::cout << "[UPLOAD] Discarded partial upload " << tempPath_.filename() << std::endl;
        }
        tempPath_.clear();
    }
}

http::PartDisposition UploadSession::onPartHeaders(const http::PartHeaders& headers) {
    if (headers.name == "fileId") {
        return http::PartDisposition::Field;
    }

    if (headers.name == "file" && headers.isFile()) {
        if (fileSeen_) {
            std::cout << "[UPLOAD] Skipping extra file part: " << headers.filename << std::endl;
            return http::PartDisposition::Skip;
        }
        filename_ = FileStorage::sanitizeFilename(headers.filename);
        declaredType_ = headers.content_type;
        std::cout << "[UPLOAD] Found filename: " << *filename_ << std::endl;

        tempPath_ = storage_.tempPathFor(fileId_ ? *fileId_ : "");
        sink_.open(tempPath_, std::ios::binary | std::ios::trunc);
        if (!sink_) {
            std::string path = tempPath_.string();
            tempPath_.clear();
            throw http::HttpError::internal("Failed to create file: " + path);
        }
        fileSeen_ = true;
        std::cout << "[UPLOAD] Starting file write to: " << tempPath_.string() << std::endl;
        return http::PartDisposition::File;
    }

    return http::PartDisposition::Skip;
}

void UploadSession::onFieldValue(const http::PartHeaders& headers, const std::string& value) {
    if (headers.name != "fileId") return;

    std::string id = value;
    http::MultipartStreamParser::trim(id);
    fileId_ = id;
    std::cout << "[UPLOAD] Found fileId: " << id << std::endl;
}

void UploadSession::onPartData(const char* data, size_t len) {
    sink_.write(data, static_cast<std::streamsize>(len));
    if (!sink_) {
        throw http::HttpError::internal("Failed writing to " + tempPath_.string());
    }
    bytesWritten_ += len;
}

void UploadSession::onPartEnd(const http::PartHeaders&) {
    sink_.close();
    if (sink_.fail()) {
        throw http::HttpError::internal("Failed to close " + tempPath_.string());
    }
    fileComplete_ = true;
    std::cout << "[UPLOAD] File data complete: " << FileStorage::formatFileSize(bytesWritten_)
              << " written" << std::endl;
}

FileRecord UploadSession::finish(FileRegistry& registry) {
    parser_.finish();

    if (!fileComplete_ || !filename_ || !fileId_ || fileId_->empty()) {
        std::cerr << "[UPLOAD] ERROR: Missing data - filename: " << filename_.value_or("<none>")
                  << ", file_id: " << fileId_.value_or("<none>") << std::endl;
        throw http::HttpError::malformed("Missing file data");
    }

    std::filesystem::path finalPath = storage_.finalPathFor(*fileId_, *filename_);
    uint64_t size = storage_.publish(tempPath_, finalPath);
    published_ = true;
    tempPath_.clear();

    FileRecord record;
    record.id = *fileId_;
    record.name = *filename_;
    record.size = size;
    record.mimeType = http::guessMimeType(*filename_);
    if (record.mimeType == "application/octet-stream" && !declaredType_.empty()) {
        record.mimeType = declaredType_;
    }
    record.storagePath = finalPath.string();
    record.uploaded = true;

    // Publish point: the file is in place before it becomes addressable
    auto previous = registry.put(record);
    if (previous && previous->uploaded && previous->storagePath != record.storagePath) {
        storage_.deleteFile(previous->storagePath);
    }

    std::cout << "[UPLOAD] File uploaded successfully: " << record.name << " ("
              << FileStorage::formatFileSize(size) << ")" << std::endl;
    std::cout << "[UPLOAD] Saved to: " << record.storagePath << std::endl;
    return record;
}

UploadHandler::UploadHandler(FileRegistry& registry, FileStorage& storage,
                             size_t chunkSize, uint64_t progressStep)
    : registry_(registry), storage_(storage),
      chunkSize_(chunkSize == 0 ? LANSHARE_CHUNK_SIZE : chunkSize),
      progressStep_(progressStep) {}

FileRecord UploadHandler::handleUpload(const http::Request& request) {
    std::cout << "[UPLOAD] Received upload request" << std::endl;

    if (!request.hasHeader("content-length") || request.body == nullptr) {
        std::cerr << "[UPLOAD] ERROR: Missing Content-Length header" << std::endl;
        throw http::HttpError::malformed("Missing Content-Length header");
    }

    std::string contentType = request.getHeader("content-type");
    std::string mediaType = contentType.substr(0, contentType.find(';'));
    http::MultipartStreamParser::trim(mediaType);
    http::MultipartStreamParser::toLower(mediaType);
    if (mediaType != "multipart/form-data") {
        std::cerr << "[UPLOAD] ERROR: Invalid content type: " << contentType << std::endl;
        throw http::HttpError::malformed("Invalid content type");
    }

    std::string boundary = http::MultipartStreamParser::extractBoundary(contentType);
    if (boundary.empty()) {
        std::cerr << "[UPLOAD] ERROR: No boundary found" << std::endl;
        throw http::HttpError::malformed("No boundary in content type");
    }

    http::ChunkReader& body = *request.body;
    uint64_t contentLength = body.contentLength();
    std::cout << "[UPLOAD] Content-Length: " << FileStorage::formatFileSize(contentLength) << std::endl;

    UploadSession session(storage_, boundary);
    try {
        std::vector<char> chunk(chunkSize_);
        uint64_t lastProgressReport = 0;
        while (true) {
            size_t n = body.read(chunk.data(), chunk.size());
            if (n == 0) break;
            session.feed(chunk.data(), n);

            uint64_t done = body.consumed();
            if (contentLength > progressStep_ && done - lastProgressReport > progressStep_) {
                double progress = static_cast<double>(done) * 100.0 / static_cast<double>(contentLength);
                std::cout << "[UPLOAD] Progress: " << static_cast<int>(progress) << "% ("
                          << FileStorage::formatFileSize(done) << "/"
                          << FileStorage::formatFileSize(contentLength) << ")" << std::endl;
                lastProgressReport = done;
            }
        }
        return session.finish(registry_);
    } catch (const std::exception& e) {
        std::cerr << "[UPLOAD] ERROR: " << e.what() << std::endl;
        throw;
    }
}

} // namespace lanshare
