#pragma once

#include <string>
#include <vector>
#include <utility>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "http/ChunkReader.hpp"
#include "const/rest_enums.hpp"

namespace lanshare {
namespace http {

/**
 * HTTP Request object containing all request data
 */
struct Request {
    HttpMethod method = HttpMethod::GET;                 // GET, POST, DELETE, OPTIONS
    std::string path;                                      // Path without query string
    std::unordered_map<std::string, std::string> params;   // Path parameters (/download/:id)
    std::unordered_map<std::string, std::string> headers;  // Header names lower-cased
    ChunkReader* body = nullptr;                           // Null when there is no body

    // Convenience methods
    std::string getParam(const std::string& key, const std::string& defaultValue = "") const {
        auto it = params.find(key);
        return it != params.end() ? it->second : defaultValue;
    }

    // Lookup by lower-case header name
    std::string getHeader(const std::string& name, const std::string& defaultValue = "") const {
        auto it = headers.find(name);
        return it != headers.end() ? it->second : defaultValue;
    }

    bool hasHeader(const std::string& name) const {
        return headers.find(name) != headers.end();
    }
};

/**
 * HTTP Response object. A streamed response has already been written to the
 * connection by its handler; the server only records its status.
 */
struct Response {
    int status = 200;
    std::string contentType = "application/json";
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;  // extra headers
    bool streamed = false;

    static Response json(int status, const nlohmann::json& payload) {
        return {status, "application/json", payload.dump(), {}, false};
    }

    static Response ok(const std::string& body) {
        return {200, "application/json", body, {}, false};
    }

    static Response success(const std::string& message) {
        return json(200, {{"status", "success"}, {"message", message}});
    }

    static Response errorWith(int status, const std::string& message) {
        return json(status, {{"status", "error"}, {"message", message}});
    }

    static Response error(const std::string& message) {
        return errorWith(500, message);
    }

    static Response streamedWith(int status) {
        Response r;
        r.status = status;
        r.contentType.clear();
        r.streamed = true;
        return r;
    }
};

using HeaderList = std::vector<std::pair<std::string, std::string>>;

const char* statusText(int status);

// Status line plus headers, terminated by the blank line
std::string formatHead(int status, const HeaderList& headers);

// Cross-origin headers attached to every response
HeaderList corsHeaders();

} // namespace http
} // namespace lanshare
