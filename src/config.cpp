#include "config.hpp"
#include <stdexcept>

namespace lanshare {

namespace {

int parseInt(const std::string& flag, const std::string& value, int min, int max) {
    size_t used = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
    }
    if (used != value.size() || parsed < min || parsed > max) {
        throw std::invalid_argument(flag + " out of range: " + value);
    }
    return parsed;
}

} // namespace

Config Config::fromArgs(int argc, char** argv) {
    Config config;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument(arg + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "--port") {
            config.port = static_cast<uint16_t>(parseInt(arg, next(), 0, 65535));
        } else if (arg == "--uploads") {
            config.uploadDir = next();
        } else if (arg == "--shared") {
            config.sharedDir = next();
        } else if (arg == "--timeout") {
            config.requestTimeoutSeconds = parseInt(arg, next(), 1, 24 * 60 * 60);
        } else if (arg == "--no-mobile-override") {
            config.mobileOverride = false;
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }
    return config;
}

std::string Config::usage(const std::string& program) {
    return "Usage: " + program + " [options]\n"
           "  --port N              first port to try (default " + std::to_string(LANSHARE_DEFAULT_PORT) + ")\n"
           "  --uploads DIR         upload directory (default " LANSHARE_UPLOAD_DIR ")\n"
           "  --shared DIR          directory for host-registered files (default " LANSHARE_SHARED_DIR ")\n"
           "  --timeout SECONDS     per-request timeout (default " + std::to_string(LANSHARE_REQUEST_TIMEOUT_SECONDS) + ")\n"
           "  --no-mobile-override  keep registered content types for mobile clients\n";
}

} // namespace lanshare
