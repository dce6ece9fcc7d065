#pragma once

#include <boost/asio.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

namespace lanshare {
namespace http {

/**
 * A finite, non-rewindable byte stream with a declared total length.
 */
class ChunkReader {
public:
    virtual ~ChunkReader() = default;

    /**
     * Reads up to maxLen bytes into buffer.
     * Returns 0 once the declared length has been consumed.
     * Throws HttpError(IncompleteTransfer) if the source ends early.
     */
    virtual size_t read(char* buffer, size_t maxLen) = 0;

    virtual uint64_t contentLength() const = 0;
    virtual uint64_t consumed() const = 0;

    uint64_t remaining() const { return contentLength() - consumed(); }
};

/**
 * Request body reader over a connected socket. Bytes that were pulled into
 * the header streambuf past the blank line are served first.
 */
class SocketChunkReader : public ChunkReader {
public:
    SocketChunkReader(boost::asio::ip::tcp::socket& socket,
                      boost::asio::streambuf& prefetched,
                      uint64_t contentLength);

    size_t read(char* buffer, size_t maxLen) override;

    uint64_t contentLength() const override { return contentLength_; }
    uint64_t consumed() const override { return consumed_; }

private:
    boost::asio::ip::tcp::socket& socket_;
    boost::asio::streambuf& prefetched_;
    uint64_t contentLength_;
    uint64_t consumed_ = 0;
};

/**
 * Drains the reader into a string. Throws HttpError(MalformedRequest) if the
 * body is larger than maxBytes.
 */
std::string consumeToString(ChunkReader& reader, size_t maxBytes);

} // namespace http
} // namespace lanshare
