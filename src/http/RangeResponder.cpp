#include "http/RangeResponder.hpp"
#include "http/HttpError.hpp"
#include "server/FileStorage.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <vector>

namespace lanshare {
namespace http {

namespace {

// Parses a run of digits at s[pos]; false on empty run or overflow
bool parseDigits(const std::string& s, size_t& pos, uint64_t& value) {
    size_t begin = pos;
    value = 0;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
        uint64_t digit = static_cast<uint64_t>(s[pos] - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            return false;
        }
        value = value * 10 + digit;
        ++pos;
    }
    return pos > begin;
}

} // namespace

RangeRequest RangeRequest::parse(const std::optional<std::string>& header) {
    RangeRequest request;
    if (!header) {
        return request;
    }

    request.kind = Kind::Malformed;
    std::string value = *header;
    size_t a = 0, b = value.size();
    while (a < b && (value[a] == ' ' || value[a] == '\t')) ++a;
    while (b > a && (value[b - 1] == ' ' || value[b - 1] == '\t')) --b;
    value = value.substr(a, b - a);

    const std::string unit = "bytes=";
    if (value.compare(0, unit.size(), unit) != 0) {
        return request;
    }

    size_t pos = unit.size();
    uint64_t start = 0;
    if (!parseDigits(value, pos, start)) {
        return request;
    }
    if (pos >= value.size() || value[pos] != '-') {
        return request;
    }
    ++pos;

    std::optional<uint64_t> end;
    if (pos < value.size()) {
        uint64_t parsed = 0;
        if (!parseDigits(value, pos, parsed) || pos != value.size()) {
            return request;
        }
        end = parsed;
    }

    request.kind = Kind::Range;
    request.start = start;
    request.end = end;
    return request;
}

RangeSpec RangeRequest::resolve(uint64_t size) const {
    RangeSpec spec;
    spec.start = start;
    if (size == 0 || start >= size) {
        throw HttpError(ErrorKind::RangeNotSatisfiable, "Range Not Satisfiable");
    }
    spec.end = end ? *end : size - 1;
    if (spec.end >= size || spec.start > spec.end) {
        throw HttpError(ErrorKind::RangeNotSatisfiable, "Range Not Satisfiable");
    }
    return spec;
}

RangeResponder::RangeResponder(ContentTypePolicy policy, size_t chunkSize, uint64_t progressStep)
    : policy_(policy ? std::move(policy) : noOverridePolicy()),
      chunkSize_(chunkSize == 0 ? LANSHARE_CHUNK_SIZE : chunkSize),
      progressStep_(progressStep) {}

std::string RangeResponder::contentDisposition(const std::string& filename) {
    std::string escaped;
    for (char c : filename) {
        if (c == '"' || c == '\\') escaped += '\\';
        if (c == '\r' || c == '\n') continue;
        escaped += c;
    }
    return "attachment; filename=\"" + escaped + "\"";
}

HeaderList RangeResponder::downloadHeaders(const FileRecord& record, const std::string& userAgent,
                                           uint64_t contentLength) const {
    std::string contentType = record.mimeType.empty() ? "application/octet-stream" : record.mimeType;
    if (auto forced = policy_(userAgent)) {
        contentType = *forced;
    }

    HeaderList headers = {
        {"Content-Type", contentType},
        {"Content-Disposition", contentDisposition(record.name)},
        {"Content-Length", std::to_string(contentLength)},
        {"Accept-Ranges", "bytes"},
        {"Cache-Control", "no-cache, no-store, must-revalidate"},
        {"Pragma", "no-cache"},
        {"Expires", "0"},
    };
    for (auto& h : corsHeaders()) {
        headers.push_back(std::move(h));
    }
    headers.emplace_back("Access-Control-Expose-Headers", "Content-Length, Content-Range, Accept-Ranges");
    headers.emplace_back("Connection", "close");
    return headers;
}

DownloadResult RangeResponder::respond(const FileRecord& record,
                                       const std::optional<std::string>& rangeHeader,
                                       const std::string& userAgent,
                                       ChunkWriter& out) const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(record.storagePath, ec)) {
        throw HttpError::notFound("File not found on disk");
    }
    uint64_t fileSize = std::filesystem::file_size(record.storagePath, ec);
    if (ec) {
        throw HttpError::notFound("File not found on disk");
    }

    std::ifstream in(record.storagePath, std::ios::binary);
    if (!in) {
        throw HttpError::notFound("File not found on disk");
    }

    DownloadResult result;
    RangeSpec span{0, fileSize == 0 ? 0 : fileSize - 1};
    uint64_t contentLength = fileSize;

    RangeRequest range = RangeRequest::parse(rangeHeader);
    if (range.kind == RangeRequest::Kind::Range) {
        try {
            span = range.resolve(fileSize);
        } catch (const HttpError& e) {
            if (e.kind() != ErrorKind::RangeNotSatisfiable) throw;
            std::cout << "[DOWNLOAD] Rejected range '" << *rangeHeader << "' for " << record.name
                      << " (" << fileSize << " bytes)" << std::endl;
            HeaderList headers = {
                {"Content-Range", "bytes */" + std::to_string(fileSize)},
                {"Content-Length", "0"},
            };
            for (auto& h : corsHeaders()) {
                headers.push_back(std::move(h));
            }
            headers.emplace_back("Connection", "close");
            result.status = 416;
            try {
                out.write(formatHead(416, headers));
                result.complete = true;
            } catch (const HttpError& writeError) {
                if (writeError.kind() != ErrorKind::IncompleteTransfer) throw;
                std::cout << "[DOWNLOAD] Client disconnected: " << writeError.what() << std::endl;
            }
            return result;
        }
        contentLength = span.length();
        result.status = 206;
    } else if (range.kind == RangeRequest::Kind::Malformed) {
        std::cout << "[DOWNLOAD] Ignoring malformed range '" << *rangeHeader << "'" << std::endl;
    }

    HeaderList headers = downloadHeaders(record, userAgent, contentLength);
    if (result.status == 206) {
        headers.emplace_back("Content-Range", "bytes " + std::to_string(span.start) + "-" +
                                                  std::to_string(span.end) + "/" + std::to_string(fileSize));
        std::cout << "[DOWNLOAD] Serving range " << span.start << "-" << span.end << " of " << record.name
                  << " (" << FileStorage::formatFileSize(contentLength) << ")" << std::endl;
    } else {
        std::cout << "[DOWNLOAD] Serving full file: " << record.name
                  << " (" << FileStorage::formatFileSize(fileSize) << ")" << std::endl;
    }

    try {
        out.write(formatHead(result.status, headers));

        if (result.status == 206) {
            in.seekg(static_cast<std::streamoff>(span.start));
        }

        std::vector<char> chunk(chunkSize_);
        uint64_t lastProgressReport = 0;
        while (result.bytesSent < contentLength) {
            size_t want = static_cast<size_t>(std::min<uint64_t>(chunkSize_, contentLength - result.bytesSent));
            in.read(chunk.data(), static_cast<std::streamsize>(want));
            std::streamsize got = in.gcount();
            if (got <= 0) {
                break;
            }
            out.write(chunk.data(), static_cast<size_t>(got));
            result.bytesSent += static_cast<uint64_t>(got);

            if (contentLength > progressStep_ && result.bytesSent - lastProgressReport > progressStep_) {
                double progress = static_cast<double>(result.bytesSent) * 100.0 / static_cast<double>(contentLength);
                std::cout << "[DOWNLOAD] Progress: " << static_cast<int>(progress) << "% ("
                          << FileStorage::formatFileSize(result.bytesSent) << "/"
                          << FileStorage::formatFileSize(contentLength) << ")" << std::endl;
                lastProgressReport = result.bytesSent;
            }
        }
    } catch (const HttpError& e) {
        if (e.kind() != ErrorKind::IncompleteTransfer) throw;
        std::cout << "[DOWNLOAD] Client disconnected during download of " << record.name
                  << ": " << e.what() << std::endl;
    }

    result.complete = result.bytesSent == contentLength;
    if (result.complete) {
        std::cout << "[DOWNLOAD] Complete: " << record.name << " ("
                  << FileStorage::formatFileSize(result.bytesSent) << ")" << std::endl;
    } else {
        std::cout << "[DOWNLOAD] Incomplete: " << record.name << " ("
                  << FileStorage::formatFileSize(result.bytesSent) << "/"
                  << FileStorage::formatFileSize(contentLength) << ")" << std::endl;
    }
    return result;
}

} // namespace http
} // namespace lanshare
