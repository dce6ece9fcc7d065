#include "http/Request.hpp"
#include <sstream>

namespace lanshare {
namespace http {

const char* statusText(int status) {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 206: return "Partial Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 411: return "Length Required";
        case 413: return "Payload Too Large";
        case 415: return "Unsupported Media Type";
        case 416: return "Range Not Satisfiable";
        case 500: return "Internal Server Error";
        default:  return "OK";
    }
}

std::string formatHead(int status, const HeaderList& headers) {
    std::ostringstream head;
    head << "HTTP/1.1 " << status << " " << statusText(status) << "\r\n";
    for (const auto& h : headers) {
        head << h.first << ": " << h.second << "\r\n";
    }
    head << "\r\n";
    return head.str();
}

HeaderList corsHeaders() {
    return {
        {"Access-Control-Allow-Origin", "*"},
        {"Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS"},
        {"Access-Control-Allow-Headers", "Content-Type, Range"},
    };
}

} // namespace http
} // namespace lanshare
