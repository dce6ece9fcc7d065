#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include "config.hpp"
#include "core/FileRecord.hpp"
#include "http/ChunkWriter.hpp"
#include "http/MimeTypes.hpp"
#include "http/Request.hpp"

namespace lanshare {
namespace http {

// Accepted byte window, 0 <= start <= end < size
struct RangeSpec {
    uint64_t start = 0;
    uint64_t end = 0;

    uint64_t length() const { return end - start + 1; }
};

/**
 * Client Range header as written, before it is checked against a file size
 */
struct RangeRequest {
    enum class Kind {
        None,       // no header
        Malformed,  // not "bytes=<start>-[<end>]"
        Range,
    };

    Kind kind = Kind::None;
    uint64_t start = 0;
    std::optional<uint64_t> end;

    static RangeRequest parse(const std::optional<std::string>& header);

    /**
     * Resolve against the file size; an omitted end means size-1.
     * Throws HttpError(RangeNotSatisfiable) unless 0 <= start <= end < size.
     */
    RangeSpec resolve(uint64_t size) const;
};

struct DownloadResult {
    int status = 200;
    uint64_t bytesSent = 0;   // body bytes only
    bool complete = false;
};

/**
 * Writes a download response for a registered file: 200 for the whole file,
 * 206 for a satisfiable range, 416 otherwise. The body is streamed in fixed
 * size chunks; a peer that disconnects mid-body ends the transfer without
 * raising.
 */
class RangeResponder {
public:
    explicit RangeResponder(ContentTypePolicy policy = mobileDownloadPolicy(),
                            size_t chunkSize = LANSHARE_CHUNK_SIZE,
                            uint64_t progressStep = LANSHARE_DOWNLOAD_PROGRESS_STEP);

    /**
     * @throws HttpError(NotFound) if the backing file is missing; nothing has
     *         been written to `out` in that case
     */
    DownloadResult respond(const FileRecord& record,
                           const std::optional<std::string>& rangeHeader,
                           const std::string& userAgent,
                           ChunkWriter& out) const;

    HeaderList downloadHeaders(const FileRecord& record, const std::string& userAgent,
                               uint64_t contentLength) const;

    static std::string contentDisposition(const std::string& filename);

private:
    ContentTypePolicy policy_;
    size_t chunkSize_;
    uint64_t progressStep_;
};

} // namespace http
} // namespace lanshare
