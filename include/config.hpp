#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#define LANSHARE_DEFAULT_PORT 8080
#define LANSHARE_PORT_PROBE_RANGE 100
#define LANSHARE_UPLOAD_DIR "uploads"
#define LANSHARE_SHARED_DIR "shared"
#define LANSHARE_CHUNK_SIZE (64 * 1024)
#define LANSHARE_SOCKET_BUFFER_SIZE (1024 * 1024)
#define LANSHARE_REQUEST_TIMEOUT_SECONDS 300
#define LANSHARE_SHUTDOWN_GRACE_SECONDS 5
#define LANSHARE_MAX_HEADER_BLOCK (16 * 1024)
#define LANSHARE_MAX_FIELD_VALUE (64 * 1024)
#define LANSHARE_MAX_DRAIN_BYTES (4 * 1024 * 1024)
#define LANSHARE_UPLOAD_PROGRESS_STEP (10ULL * 1024 * 1024)
#define LANSHARE_DOWNLOAD_PROGRESS_STEP (50ULL * 1024 * 1024)

namespace lanshare {

struct Config {
    uint16_t port = LANSHARE_DEFAULT_PORT;
    std::string uploadDir = LANSHARE_UPLOAD_DIR;
    std::string sharedDir = LANSHARE_SHARED_DIR;
    int requestTimeoutSeconds = LANSHARE_REQUEST_TIMEOUT_SECONDS;
    int shutdownGraceSeconds = LANSHARE_SHUTDOWN_GRACE_SECONDS;
    bool mobileOverride = true;

    // Parses command line flags; throws std::invalid_argument on unknown or bad flags
    static Config fromArgs(int argc, char** argv);

    static std::string usage(const std::string& program);
};

} // namespace lanshare
