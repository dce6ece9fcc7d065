#pragma once
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "config.hpp"
#include "const/rest_enums.hpp"
#include "http/Request.hpp"
#include "server/endpoint.hpp"

namespace lanshare {

/**
 * HTTP/1.1 server, one thread per connection and one request per connection.
 * The accept loop and signal handling run on the thread that calls run().
 */
class lsServer
{
public:
    explicit lsServer(const Config& config);
    ~lsServer();

    lsServer(const lsServer&) = delete;
    lsServer& operator=(const lsServer&) = delete;

    void add_endpoint(const endpoint& ep);

    // Binds the first free port starting at the configured one and returns it
    uint16_t listen();

    // Serves until stop() or SIGINT/SIGTERM, then drains in-flight connections
    void run(bool handleSignals = true);

    // Safe to call from any thread
    void stop();

    uint16_t port() const { return port_; }
    size_t activeConnections() const;

private:
    using tcp = boost::asio::ip::tcp;

    struct Connection {
        std::shared_ptr<tcp::socket> socket;
        std::chrono::steady_clock::time_point deadline;
        std::thread worker;
    };

    void doAccept();
    void handleConnection(uint64_t id, std::shared_ptr<tcp::socket> socket);
    http::Response dispatch(http::Request& request, http::ChunkWriter& writer);
    void finishConnection(uint64_t id);
    void reapFinished();
    void watchdog();
    void drain();

    Config config_;
    boost::asio::io_context io_context_;
    tcp::acceptor acceptor_;
    boost::asio::signal_set signals_;
    std::vector<endpoint> handlers_;
    uint16_t port_ = 0;

    mutable std::mutex mutex_;
    std::condition_variable changed_;
    std::unordered_map<uint64_t, Connection> connections_;
    std::vector<uint64_t> finished_;
    uint64_t nextId_ = 1;
    std::atomic<bool> stopping_{false};
    std::thread watchdog_;
};

} // namespace lanshare
