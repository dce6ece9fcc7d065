#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace lanshare {
namespace http {

// Content type for a filename by extension, application/octet-stream if unknown
std::string guessMimeType(const std::string& filename);

/**
 * Maps a request's User-Agent to a Content-Type that replaces the registered
 * one on downloads. nullopt keeps the registered type.
 */
using ContentTypePolicy = std::function<std::optional<std::string>(const std::string& userAgent)>;

// Overrides with `contentType` when the user agent contains any token (case-insensitive)
ContentTypePolicy userAgentTokenPolicy(std::vector<std::string> tokens,
                                       std::string contentType = "application/octet-stream");

// Mobile browsers tend to open inline types instead of saving them
ContentTypePolicy mobileDownloadPolicy();

ContentTypePolicy noOverridePolicy();

} // namespace http
} // namespace lanshare
