#include "http/MimeTypes.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace lanshare {
namespace http {

namespace {

std::string lowered(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const std::unordered_map<std::string, std::string>& mimeTable() {
    static const std::unordered_map<std::string, std::string> table = {
        {".txt", "text/plain"},
        {".html", "text/html"},
        {".htm", "text/html"},
        {".css", "text/css"},
        {".csv", "text/csv"},
        {".js", "text/javascript"},
        {".json", "application/json"},
        {".xml", "application/xml"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".tar", "application/x-tar"},
        {".7z", "application/x-7z-compressed"},
        {".rar", "application/vnd.rar"},
        {".doc", "application/msword"},
        {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {".xls", "application/vnd.ms-excel"},
        {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {".ppt", "application/vnd.ms-powerpoint"},
        {".pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
        {".apk", "application/vnd.android.package-archive"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".webp", "image/webp"},
        {".svg", "image/svg+xml"},
        {".bmp", "image/bmp"},
        {".heic", "image/heic"},
        {".mp3", "audio/mpeg"},
        {".wav", "audio/x-wav"},
        {".ogg", "audio/ogg"},
        {".flac", "audio/flac"},
        {".m4a", "audio/mp4"},
        {".mp4", "video/mp4"},
        {".mkv", "video/x-matroska"},
        {".mov", "video/quicktime"},
        {".webm", "video/webm"},
        {".avi", "video/x-msvideo"},
    };
    return table;
}

} // namespace

std::string guessMimeType(const std::string& filename) {
    size_t dotPos = filename.find_last_of('.');
    if (dotPos == std::string::npos || dotPos == filename.length() - 1) {
        return "application/octet-stream";
    }
    auto it = mimeTable().find(lowered(filename.substr(dotPos)));
    return it != mimeTable().end() ? it->second : "application/octet-stream";
}

ContentTypePolicy userAgentTokenPolicy(std::vector<std::string> tokens, std::string contentType) {
    for (auto& token : tokens) {
        token = lowered(token);
    }
    return [tokens = std::move(tokens), contentType = std::move(contentType)](
               const std::string& userAgent) -> std::optional<std::string> {
        std::string agent = lowered(userAgent);
        for (const auto& token : tokens) {
            if (!token.empty() && agent.find(token) != std::string::npos) {
                return contentType;
            }
        }
        return std::nullopt;
    };
}

ContentTypePolicy mobileDownloadPolicy() {
    return userAgentTokenPolicy({"mobile", "android", "iphone", "ipad"});
}

ContentTypePolicy noOverridePolicy() {
    return [](const std::string&) -> std::optional<std::string> { return std::nullopt; };
}

} // namespace http
} // namespace lanshare
