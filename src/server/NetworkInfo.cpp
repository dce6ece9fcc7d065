#include "server/NetworkInfo.hpp"
#include <boost/asio.hpp>

namespace lanshare {

std::string detectLocalAddress()
{
    using boost::asio::ip::udp;

    // Connecting a UDP socket sends nothing; it only selects the outbound interface
    boost::asio::io_context io_context;
    udp::socket socket(io_context);
    boost::system::error_code ec;
    socket.connect(udp::endpoint(boost::asio::ip::make_address("8.8.8.8", ec), 80), ec);
    if (ec) {
        return "127.0.0.1";
    }
    auto local = socket.local_endpoint(ec);
    if (ec || local.address().is_unspecified()) {
        return "127.0.0.1";
    }
    return local.address().to_string();
}

std::string advertisedUrl(const std::string& address, uint16_t port)
{
    return "http://" + address + ":" + std::to_string(port);
}

nlohmann::json networkInfo(uint16_t port)
{
    std::string address = detectLocalAddress();
    nlohmann::json info;
    info["localAddress"] = address;
    info["advertisedUrl"] = advertisedUrl(address, port);
    info["status"] = "running";
    return info;
}

} // namespace lanshare
