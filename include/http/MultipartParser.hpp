#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

#include "config.hpp"

namespace lanshare {
namespace http {

/**
 * Headers of a single part of a multipart/form-data body
 */
struct PartHeaders {
    std::string name;           // form field name
    std::string filename;       // client-supplied filename (empty if not a file)
    std::string content_type;   // MIME type of the content

    bool isFile() const { return !filename.empty(); }
};

/**
 * What the parser should do with the part whose headers were just read
 */
enum class PartDisposition {
    Field,  // buffer the value and deliver it once
    File,   // stream data chunks to the handler
    Skip,   // discard until the next boundary
};

/**
 * Receiver of parser events. Events arrive strictly in body order.
 */
class MultipartHandler {
public:
    virtual ~MultipartHandler() = default;

    virtual PartDisposition onPartHeaders(const PartHeaders& headers) = 0;
    virtual void onFieldValue(const PartHeaders& headers, const std::string& value) = 0;
    virtual void onPartData(const char* data, size_t len) = 0;
    virtual void onPartEnd(const PartHeaders& headers) = 0;
};

/**
 * Incremental parser for multipart/form-data. Chunks may be split anywhere,
 * including inside the boundary line or the header block; the handler sees the
 * same events for every split of the same body. Memory use is bounded by the
 * header/field limits plus one boundary-sized tail.
 */
class MultipartStreamParser {
public:
    struct SeekingPart {};
    struct ReadingHeaders {};
    struct ReadingFieldValue { PartHeaders headers; };
    struct ReadingFileData { PartHeaders headers; uint64_t bytes = 0; };
    struct SkippingPart {};
    struct Done {};

    using State = std::variant<SeekingPart, ReadingHeaders, ReadingFieldValue, ReadingFileData,
                               SkippingPart, Done>;

    /**
     * @param boundary Multipart boundary string (without --)
     * @param handler Event receiver, must outlive the parser
     */
    MultipartStreamParser(const std::string& boundary, MultipartHandler& handler,
                          size_t maxHeaderBlock = LANSHARE_MAX_HEADER_BLOCK,
                          size_t maxFieldValue = LANSHARE_MAX_FIELD_VALUE);

    /**
     * Feed the next chunk of the body. Throws HttpError(MalformedRequest) on
     * oversized headers or field values.
     */
    void feed(const char* data, size_t len);

    /**
     * Signal end of input. Throws HttpError(IncompleteTransfer) if a part is
     * still open.
     */
    void finish();

    bool done() const { return std::holds_alternative<Done>(state_); }
    const State& state() const { return state_; }
    const char* stateName() const;

    // Bytes currently held back waiting for more input
    size_t buffered() const { return buffer_.size(); }

    /**
     * Extract boundary from Content-Type header value
     * @param content_type Full Content-Type header value
     * @return Boundary string or empty if not found
     */
    static std::string extractBoundary(const std::string& content_type);

    static void trim(std::string& s);
    static void toLower(std::string& s);
    static void parseContentDisposition(const std::string& value, std::string& name, std::string& filename);
    static PartHeaders parseHeaderBlock(const std::string& block);

private:
    // Each step returns false when it needs more input
    bool step(SeekingPart&);
    bool step(ReadingHeaders&);
    bool step(ReadingFieldValue&);
    bool step(ReadingFileData&);
    bool step(SkippingPart&);
    bool step(Done&);

    std::string marker_;      // "--" + boundary
    std::string delimiter_;   // "\r\n--" + boundary
    size_t safetyTail_;
    size_t maxHeaderBlock_;
    size_t maxFieldValue_;
    MultipartHandler& handler_;
    std::string buffer_;
    State state_;
};

} // namespace http
} // namespace lanshare
