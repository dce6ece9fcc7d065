#pragma once

#include <boost/asio.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

namespace lanshare {
namespace http {

/**
 * Outbound byte sink. Implementations throw HttpError(IncompleteTransfer)
 * when the peer goes away mid-write.
 */
class ChunkWriter {
public:
    virtual ~ChunkWriter() = default;

    virtual void write(const char* data, size_t len) = 0;
    virtual uint64_t bytesWritten() const = 0;

    void write(const std::string& data) { write(data.data(), data.size()); }
};

class SocketChunkWriter : public ChunkWriter {
public:
    explicit SocketChunkWriter(boost::asio::ip::tcp::socket& socket) : socket_(socket) {}

    void write(const char* data, size_t len) override;
    uint64_t bytesWritten() const override { return written_; }

    using ChunkWriter::write;

private:
    boost::asio::ip::tcp::socket& socket_;
    uint64_t written_ = 0;
};

} // namespace http
} // namespace lanshare
