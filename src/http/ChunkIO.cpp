#include "http/ChunkReader.hpp"
#include "http/ChunkWriter.hpp"
#include "http/HttpError.hpp"
#include <algorithm>

namespace lanshare {
namespace http {

SocketChunkReader::SocketChunkReader(boost::asio::ip::tcp::socket& socket,
                                     boost::asio::streambuf& prefetched,
                                     uint64_t contentLength)
    : socket_(socket), prefetched_(prefetched), contentLength_(contentLength) {}

size_t SocketChunkReader::read(char* buffer, size_t maxLen) {
    if (maxLen == 0 || consumed_ >= contentLength_) {
        return 0;
    }
    size_t want = static_cast<size_t>(std::min<uint64_t>(maxLen, contentLength_ - consumed_));

    // Body bytes that arrived together with the request head
    if (prefetched_.size() > 0) {
        size_t n = std::min(want, prefetched_.size());
        boost::asio::buffer_copy(boost::asio::buffer(buffer, n), prefetched_.data());
        prefetched_.consume(n);
        consumed_ += n;
        return n;
    }

    boost::system::error_code ec;
    size_t n = socket_.read_some(boost::asio::buffer(buffer, want), ec);
    if (ec) {
        throw HttpError::incomplete("Unexpected end of data at " + std::to_string(consumed_) +
                                    "/" + std::to_string(contentLength_) + " (" + ec.message() + ")");
    }
    consumed_ += n;
    return n;
}

std::string consumeToString(ChunkReader& reader, size_t maxBytes) {
    if (reader.contentLength() > maxBytes) {
        throw HttpError::malformed("Request body exceeds " + std::to_string(maxBytes) + " bytes");
    }
    std::string out;
    out.reserve(static_cast<size_t>(reader.contentLength()));
    char buffer[4096];
    while (true) {
        size_t n = reader.read(buffer, sizeof(buffer));
        if (n == 0) break;
        out.append(buffer, n);
    }
    return out;
}

void SocketChunkWriter::write(const char* data, size_t len) {
    boost::system::error_code ec;
    boost::asio::write(socket_, boost::asio::buffer(data, len), ec);
    if (ec) {
        throw HttpError::incomplete("Write failed after " + std::to_string(written_) +
                                    " bytes (" + ec.message() + ")");
    }
    written_ += len;
}

} // namespace http
} // namespace lanshare
