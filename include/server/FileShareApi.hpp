#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "core/FileRegistry.hpp"
#include "http/RangeResponder.hpp"
#include "http/Request.hpp"
#include "server/FileStorage.hpp"
#include "server/UploadHandler.hpp"
#include "server/lsserver.hpp"

namespace lanshare {

/**
 * REST surface of the share: listing, upload, host registration, removal,
 * download and network introspection.
 */
class FileShareApi {
public:
    FileShareApi(FileRegistry& registry, FileStorage& storage,
                 http::ContentTypePolicy policy = http::mobileDownloadPolicy());

    // Registers every route under /api
    void registerRoutes(lsServer& server);

    http::Response listFiles(const http::Request& request) const;
    http::Response uploadFile(const http::Request& request);
    http::Response registerFile(const http::Request& request);
    http::Response removeFile(const http::Request& request);
    http::Response downloadFile(const http::Request& request, http::ChunkWriter& writer) const;
    http::Response networkInfo(uint16_t port) const;

    // Checks a register-file body; fills error on failure
    static bool validateRegistration(const nlohmann::json& body, std::string& error);

private:
    FileRegistry& registry_;
    FileStorage& storage_;
    UploadHandler uploads_;
    http::RangeResponder responder_;
};

} // namespace lanshare
