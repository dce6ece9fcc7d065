#pragma once

#include <string>
#include <stdexcept>

namespace lanshare {

// Methods the file sharing API routes; anything else is answered with 405
enum class HttpMethod {
    GET,
    POST,
    DELETE,
    OPTIONS,
};


inline const char* to_string(HttpMethod method) {
    switch(method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::DELETE: return "DELETE";
        case HttpMethod::OPTIONS: return "OPTIONS";
    }
    return "UNKNOWN";
}


// Method tokens are case-sensitive
inline HttpMethod from_string(const std::string& method) {
    if (method == "GET") return HttpMethod::GET;
    else if (method == "POST") return HttpMethod::POST;
    else if (method == "DELETE") return HttpMethod::DELETE;
    else if (method == "OPTIONS") return HttpMethod::OPTIONS;
    else throw std::invalid_argument("Unsupported HTTP method: " + method);
}

} // namespace lanshare
