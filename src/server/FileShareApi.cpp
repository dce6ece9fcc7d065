#include "server/FileShareApi.hpp"
#include "http/HttpError.hpp"
#include "http/MimeTypes.hpp"
#include "server/NetworkInfo.hpp"
#include <iostream>
#include <optional>

namespace lanshare {

namespace {
const size_t kMaxJsonBody = 64 * 1024;
}

FileShareApi::FileShareApi(FileRegistry& registry, FileStorage& storage, http::ContentTypePolicy policy)
    : registry_(registry), storage_(storage), uploads_(registry, storage),
      responder_(std::move(policy)) {}

void FileShareApi::registerRoutes(lsServer& server) {
    server.add_endpoint(endpoint(
        [this](http::Request& request, http::ChunkWriter&) { return listFiles(request); },
        HttpMethod::GET, "/api/files"));

    server.add_endpoint(endpoint(
        [this](http::Request& request, http::ChunkWriter&) { return uploadFile(request); },
        HttpMethod::POST, "/api/upload"));

    server.add_endpoint(endpoint(
        [this](http::Request& request, http::ChunkWriter&) { return registerFile(request); },
        HttpMethod::POST, "/api/register-file"));

    server.add_endpoint(endpoint(
        [this](http::Request& request, http::ChunkWriter&) { return removeFile(request); },
        HttpMethod::DELETE, "/api/remove-file/:id"));

    server.add_endpoint(endpoint(
        [this](http::Request& request, http::ChunkWriter& writer) { return downloadFile(request, writer); },
        HttpMethod::GET, "/api/download/:id"));

    server.add_endpoint(endpoint(
        [this, &server](http::Request&, http::ChunkWriter&) { return networkInfo(server.port()); },
        HttpMethod::GET, "/api/network-info"));
}

http::Response FileShareApi::listFiles(const http::Request&) const {
    return http::Response::ok(registry_.serialize());
}

http::Response FileShareApi::uploadFile(const http::Request& request) {
    uploads_.handleUpload(request);
    return http::Response::success("File uploaded successfully");
}

bool FileShareApi::validateRegistration(const nlohmann::json& body, std::string& error) {
    if (!body.is_object()) {
        error = "Body must be a JSON object";
        return false;
    }

    for (const char* field : {"id", "name"}) {
        if (!body.contains(field) || !body[field].is_string() || body[field].get<std::string>().empty()) {
            error = std::string("Field '") + field + "' must be a non-empty string";
            return false;
        }
    }

    // nlohmann stores non-negative integer literals as unsigned
    if (!body.contains("size") || !body["size"].is_number_unsigned()) {
        error = "Field 'size' must be a non-negative integer";
        return false;
    }

    for (const char* field : {"type", "path"}) {
        if (body.contains(field) && !body[field].is_null() && !body[field].is_string()) {
            error = std::string("Field '") + field + "' must be a string";
            return false;
        }
    }

    return true;
}

http::Response FileShareApi::registerFile(const http::Request& request) {
    if (request.body == nullptr) {
        throw http::HttpError::malformed("Missing Content-Length header");
    }

    nlohmann::json body;
    try {
        body = nlohmann::json::parse(http::consumeToString(*request.body, kMaxJsonBody));
    } catch (const nlohmann::json::parse_error& e) {
        throw http::HttpError::malformed(std::string("Invalid JSON: ") + e.what());
    }

    std::string error;
    if (!validateRegistration(body, error)) {
        throw http::HttpError::malformed(error);
    }

    FileRecord record;
    record.id = body["id"].get<std::string>();
    record.name = body["name"].get<std::string>();
    record.size = body["size"].get<uint64_t>();

    std::string type = body.contains("type") && body["type"].is_string() ? body["type"].get<std::string>() : "";
    record.mimeType = type.empty() ? http::guessMimeType(record.name) : type;

    std::string relative = body.contains("path") && body["path"].is_string()
                               ? body["path"].get<std::string>() : record.name;
    record.storagePath = storage_.resolveShared(relative).string();
    record.uploaded = false;

    auto previous = registry_.put(record);
    if (previous && previous->uploaded) {
        storage_.deleteFile(previous->storagePath);
    }

    std::cout << "File registered: " << record.name << " ("
              << FileStorage::formatFileSize(record.size) << ")" << std::endl;
    return http::Response::success("File registered successfully");
}

http::Response FileShareApi::removeFile(const http::Request& request) {
    std::string id = request.getParam("id");
    auto removed = registry_.remove(id);
    if (!removed) {
        throw http::HttpError::notFound("File not found");
    }

    // Host-registered files belong to the host and stay on disk
    if (removed->uploaded) {
        storage_.deleteFile(removed->storagePath);
    }

    std::cout << "File removed: " << removed->name << std::endl;
    return http::Response::success("File removed successfully");
}

http::Response FileShareApi::downloadFile(const http::Request& request, http::ChunkWriter& writer) const {
    std::string id = request.getParam("id");
    auto record = registry_.get(id);
    if (!record) {
        throw http::HttpError::notFound("File not found");
    }

    std::optional<std::string> range;
    if (request.hasHeader("range")) {
        range = request.getHeader("range");
    }

    http::DownloadResult result = responder_.respond(*record, range, request.getHeader("user-agent"), writer);
    return http::Response::streamedWith(result.status);
}

http::Response FileShareApi::networkInfo(uint16_t port) const {
    return http::Response::json(200, lanshare::networkInfo(port));
}

} // namespace lanshare
