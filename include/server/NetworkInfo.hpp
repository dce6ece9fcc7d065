#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace lanshare {

// Address other LAN hosts can reach this machine on; 127.0.0.1 without a route
std::string detectLocalAddress();

std::string advertisedUrl(const std::string& address, uint16_t port);

// {localAddress, advertisedUrl, status}
nlohmann::json networkInfo(uint16_t port);

} // namespace lanshare
