#include <iostream>
#include <string>
#include <stdexcept>

#include "config.hpp"
#include "core/FileRegistry.hpp"
#include "http/MimeTypes.hpp"
#include "server/FileShareApi.hpp"
#include "server/FileStorage.hpp"
#include "server/NetworkInfo.hpp"
#include "server/lsserver.hpp"

using namespace lanshare;

static void print_server_info(uint16_t port)
{
    std::string local_ip = detectLocalAddress();

    std::cout << std::string(60, '=') << "\n";
    std::cout << "LanShare server started\n";
    std::cout << std::string(60, '=') << "\n";
    std::cout << "Server running on port: " << port << "\n";
    std::cout << "Local URL:   " << advertisedUrl("localhost", port) << "\n";
    std::cout << "Network URL: " << advertisedUrl(local_ip, port) << "\n";
    std::cout << std::string(60, '=') << "\n";
    std::cout << "Open the Network URL on any device in the same network.\n";
    std::cout << "Press Ctrl+C to stop the server" << std::endl;
}

int main(int argc, char** argv)
{
    Config config;
    try {
        config = Config::fromArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n" << Config::usage(argv[0]);
        return 2;
    }

    try {
        FileRegistry registry;
        FileStorage storage(config.uploadDir, config.sharedDir);
        FileShareApi api(registry, storage,
                         config.mobileOverride ? http::mobileDownloadPolicy() : http::noOverridePolicy());

        lsServer server(config);
        api.registerRoutes(server);

        uint16_t port = server.listen();
        print_server_info(port);
        server.run();
    } catch (const std::exception& e) {
        std::cerr << "Error starting server: " << e.what() << std::endl;
        std::cerr << "Check whether the port range is already in use." << std::endl;
        return 1;
    }
    return 0;
}
