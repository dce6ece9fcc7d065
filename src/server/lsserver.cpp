#include "server/lsserver.hpp"
#include "http/ChunkReader.hpp"
#include "http/ChunkWriter.hpp"
#include "http/HttpError.hpp"
#include <sys/socket.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <istream>
#include <optional>

namespace lanshare {

namespace {

void trim(std::string& s)
{
    size_t a = 0, b = s.size();
    while (a < b && (s[a] == ' ' || s[a] == '\t')) ++a;
    while (b > a && (s[b - 1] == ' ' || s[b - 1] == '\t' || s[b - 1] == '\r' || s[b - 1] == '\n')) --b;
    s = s.substr(a, b - a);
}

void tolower_inplace(std::string& s)
{
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

// Breaks a blocking read or write that another thread is parked in. Goes through
// the native handle so the tcp::socket object itself is only touched by its worker.
void abort_socket(boost::asio::ip::tcp::socket& socket)
{
    if (::shutdown(socket.native_handle(), SHUT_RDWR) != 0 && errno != ENOTCONN) {
        std::cerr << "[SERVER] shutdown() failed: " << std::strerror(errno) << std::endl;
    }
}

// Closing with request bytes still unread makes the kernel send a reset, which can
// destroy a response the client has not read yet. Half-close, then read the rest.
void discard_unread_body(boost::asio::ip::tcp::socket& socket, http::ChunkReader& body)
{
    boost::system::error_code ec;
    socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
    if (ec) return;

    char scratch[8192];
    uint64_t budget = LANSHARE_MAX_DRAIN_BYTES;
    try {
        while (budget > 0) {
            size_t n = body.read(scratch, static_cast<size_t>(std::min<uint64_t>(sizeof(scratch), budget)));
            if (n == 0) break;
            budget -= n;
        }
    } catch (const http::HttpError& e) {
        std::cerr << "[SERVER] Stopped discarding request body: " << e.what() << std::endl;
    }
}

void write_response(http::ChunkWriter& writer, const http::Response& response)
{
    http::HeaderList headers;
    if (!response.contentType.empty()) {
        headers.emplace_back("Content-Type", response.contentType);
    }
    headers.emplace_back("Content-Length", std::to_string(response.body.size()));
    for (auto& h : http::corsHeaders()) {
        headers.push_back(std::move(h));
    }
    for (const auto& h : response.headers) {
        headers.push_back(h);
    }
    headers.emplace_back("Connection", "close");

    writer.write(http::formatHead(response.status, headers));
    if (!response.body.empty()) {
        writer.write(response.body);
    }
}

} // namespace

lsServer::lsServer(const Config& config)
    : config_(config), acceptor_(io_context_), signals_(io_context_) {}

lsServer::~lsServer()
{
    stopping_ = true;
    changed_.notify_all();
    if (watchdog_.joinable()) {
        watchdog_.join();
    }

    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : connections_) {
            workers.push_back(std::move(entry.second.worker));
        }
    }
    for (auto& worker : workers) {
        if (worker.joinable()) worker.join();
    }
}

void lsServer::add_endpoint(const endpoint& ep)
{
    handlers_.push_back(ep);
}

uint16_t lsServer::listen()
{
    for (int offset = 0; offset < LANSHARE_PORT_PROBE_RANGE; ++offset) {
        uint32_t candidate = static_cast<uint32_t>(config_.port) + static_cast<uint32_t>(offset);
        if (candidate > 65535) break;

        boost::system::error_code ec;
        acceptor_.open(tcp::v4(), ec);
        if (ec) {
            throw std::runtime_error("Cannot open listening socket: " + ec.message());
        }
        acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
        if (!ec) acceptor_.bind(tcp::endpoint(tcp::v4(), static_cast<uint16_t>(candidate)), ec);
        if (!ec) acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
        if (ec) {
            boost::system::error_code ignored;
            acceptor_.close(ignored);
            // Port 0 asks the OS for any free port; nothing else to probe
            if (config_.port == 0) break;
            continue;
        }

        port_ = acceptor_.local_endpoint().port();
        return port_;
    }
    throw std::runtime_error("No available ports found");
}

void lsServer::run(bool handleSignals)
{
    if (!acceptor_.is_open()) {
        listen();
    }
    std::cout << "[SERVER] Listening on port " << port_ << std::endl;

    if (handleSignals) {
        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const boost::system::error_code& ec, int signo) {
            if (ec) return;
            std::cout << "\n[SERVER] Signal " << signo << " received, shutting down" << std::endl;
            stop();
        });
    }

    watchdog_ = std::thread(&lsServer::watchdog, this);
    doAccept();
    io_context_.run();
    drain();
    std::cout << "[SERVER] Stopped" << std::endl;
}

void lsServer::stop()
{
    if (stopping_.exchange(true)) return;
    changed_.notify_all();
    boost::asio::post(io_context_, [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
        signals_.cancel(ec);
    });
}

size_t lsServer::activeConnections() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    size_t active = 0;
    for (const auto& entry : connections_) {
        if (entry.second.socket) ++active;
    }
    return active;
}

void lsServer::doAccept()
{
    acceptor_.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
        if (ec) {
            if (ec == boost::asio::error::operation_aborted || stopping_) return;
            std::cerr << "[SERVER] Accept failed: " << ec.message() << std::endl;
        } else if (stopping_) {
            boost::system::error_code ignored;
            socket.close(ignored);
            return;
        } else {
            auto shared = std::make_shared<tcp::socket>(std::move(socket));

            boost::system::error_code opt_ec;
            shared->set_option(boost::asio::socket_base::receive_buffer_size(LANSHARE_SOCKET_BUFFER_SIZE), opt_ec);
            if (!opt_ec) {
                shared->set_option(boost::asio::socket_base::send_buffer_size(LANSHARE_SOCKET_BUFFER_SIZE), opt_ec);
            }
            if (opt_ec) {
                std::cerr << "[SERVER] Could not resize socket buffers: " << opt_ec.message() << std::endl;
            }

            std::lock_guard<std::mutex> lock(mutex_);
            uint64_t id = nextId_++;
            Connection& connection = connections_[id];
            connection.socket = shared;
            connection.deadline = std::chrono::steady_clock::now() +
                                  std::chrono::seconds(config_.requestTimeoutSeconds);
            connection.worker = std::thread(&lsServer::handleConnection, this, id, shared);
        }

        reapFinished();
        doAccept();
    });
}

void lsServer::handleConnection(uint64_t id, std::shared_ptr<tcp::socket> socket)
{
    http::SocketChunkWriter writer(*socket);
    std::string method = "-";
    std::string path = "-";
    int status = 0;
    boost::asio::streambuf buf(LANSHARE_MAX_HEADER_BLOCK * 4);
    std::optional<http::SocketChunkReader> body;

    try {
        boost::system::error_code ec;
        boost::asio::read_until(*socket, buf, "\r\n\r\n", ec);
        if (ec) {
            if (ec == boost::asio::error::not_found) {
                throw http::HttpError::malformed("Request header too large");
            }
            if (buf.size() == 0) {
                finishConnection(id);
                return;
            }
            throw http::HttpError::incomplete("Connection closed before end of request head (" +
                                              ec.message() + ")");
        }

        std::istream request_stream(&buf);
        std::string version;
        request_stream >> method >> path >> version;

        std::string dummy;
        std::getline(request_stream, dummy);

        http::Request request;
        std::string clean_path = path;
        auto qm = path.find('?');
        if (qm != std::string::npos) {
            clean_path = path.substr(0, qm);
        }
        request.path = clean_path;

        std::string header_line;
        while (std::getline(request_stream, header_line) && header_line != "\r")
        {
            if (!header_line.empty() && header_line.back() == '\r') header_line.pop_back();
            if (header_line.empty()) break;

            auto colon = header_line.find(':');
            if (colon == std::string::npos) continue;

            std::string name = header_line.substr(0, colon);
            std::string value = header_line.substr(colon + 1);
            trim(name); trim(value);
            tolower_inplace(name);
            request.headers[name] = value;
        }

        try {
            request.method = from_string(method);
        } catch (const std::invalid_argument& e) {
            throw http::HttpError(http::ErrorKind::MethodNotAllowed, e.what());
        }

        if (request.hasHeader("content-length")) {
            std::string value = request.getHeader("content-length");
            uint64_t content_length = 0;
            try {
                size_t used = 0;
                content_length = std::stoull(value, &used);
                if (used != value.size() || value.front() == '-') {
                    throw std::invalid_argument(value);
                }
            } catch (const std::exception&) {
                throw http::HttpError::malformed("Invalid Content-Length header");
            }
            body.emplace(*socket, buf, content_length);
            request.body = &*body;
        }

        http::Response response = dispatch(request, writer);
        status = response.status;
        if (!response.streamed) {
            write_response(writer, response);
        }
    }
    catch (const http::HttpError& e) {
        status = e.status();
        if (writer.bytesWritten() == 0) {
            // A peer that already hung up makes this write fail too; that is only logged
            try {
                write_response(writer, http::Response::errorWith(status, e.what()));
            } catch (const http::HttpError& write_error) {
                std::cerr << "[SERVER] Could not send error response: " << write_error.what() << std::endl;
            }
        } else {
            std::cerr << "[SERVER] " << method << " " << path << " aborted: " << e.what() << std::endl;
        }
    }
    catch (const std::exception& e) {
        status = 500;
        std::cerr << "[SERVER] " << method << " " << path << " failed: " << e.what() << std::endl;
        if (writer.bytesWritten() == 0) {
            try {
                write_response(writer, http::Response::error(e.what()));
            } catch (const http::HttpError& write_error) {
                std::cerr << "[SERVER] Could not send error response: " << write_error.what() << std::endl;
            }
        }
    }

    if (body && body->remaining() > 0) {
        discard_unread_body(*socket, *body);
    }

    std::cout << "[SERVER] " << method << " " << path << " -> " << status << std::endl;
    finishConnection(id);
}

http::Response lsServer::dispatch(http::Request& request, http::ChunkWriter& writer)
{
    if (request.method == HttpMethod::OPTIONS) {
        http::Response preflight;
        preflight.contentType.clear();
        preflight.headers.emplace_back("Access-Control-Max-Age", "86400");
        return preflight;
    }

    bool path_known = false;
    for (const auto& ep : handlers_) {
        std::unordered_map<std::string, std::string> params;
        if (!ep.matches(request.path, params)) continue;
        path_known = true;
        if (ep.get_rest_type() != request.method) continue;

        request.params = std::move(params);
        return ep.get_handler()(request, writer);
    }

    if (path_known) {
        throw http::HttpError(http::ErrorKind::MethodNotAllowed, "Method not allowed");
    }
    throw http::HttpError::notFound("Not Found");
}

void lsServer::finishConnection(uint64_t id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(id);
    if (it != connections_.end() && it->second.socket) {
        boost::system::error_code ec;
        it->second.socket->shutdown(tcp::socket::shutdown_both, ec);
        it->second.socket->close(ec);
        it->second.socket.reset();
    }
    finished_.push_back(id);
    changed_.notify_all();
}

void lsServer::reapFinished()
{
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (uint64_t id : finished_) {
            auto it = connections_.find(id);
            if (it == connections_.end()) continue;
            done.push_back(std::move(it->second.worker));
            connections_.erase(it);
        }
        finished_.clear();
    }
    for (auto& worker : done) {
        if (worker.joinable()) worker.join();
    }
}

void lsServer::watchdog()
{
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        changed_.wait_for(lock, std::chrono::seconds(1));
        auto now = std::chrono::steady_clock::now();
        for (auto& entry : connections_) {
            Connection& connection = entry.second;
            if (!connection.socket || now < connection.deadline) continue;

            std::cerr << "[SERVER] Connection " << entry.first << " exceeded "
                      << config_.requestTimeoutSeconds << "s, aborting" << std::endl;
            abort_socket(*connection.socket);
            connection.deadline = std::chrono::steady_clock::time_point::max();
        }
    }
}

void lsServer::drain()
{
    {
        std::unique_lock<std::mutex> lock(mutex_);
        auto idle = [this]() {
            for (const auto& entry : connections_) {
                if (entry.second.socket) return false;
            }
            return true;
        };
        if (!changed_.wait_for(lock, std::chrono::seconds(config_.shutdownGraceSeconds), idle)) {
            std::cout << "[SERVER] Closing in-flight connections" << std::endl;
            for (auto& entry : connections_) {
                if (!entry.second.socket) continue;
                abort_socket(*entry.second.socket);
            }
        }
    }

    stopping_ = true;
    changed_.notify_all();
    if (watchdog_.joinable()) {
        watchdog_.join();
    }

    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : connections_) {
            workers.push_back(std::move(entry.second.worker));
        }
    }
    for (auto& worker : workers) {
        if (worker.joinable()) worker.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    connections_.clear();
    finished_.clear();
}

} // namespace lanshare
