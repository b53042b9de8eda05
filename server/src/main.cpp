#include <atomic>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <curl/curl.h>

#include "offloader/config.hpp"
#include "offloader/file_copier.hpp"
#include "offloader/mount_manager.hpp"
#include "offloader/transfer_service.hpp"
#include "offloader/version.hpp"
#include "simple_server.hpp"

namespace {

std::atomic<bool> stop_requested{false};

void handle_signal(int) {
    stop_requested = true;
}

}

int main(int argc, char* argv[]) {
    // Echo full command line once for diagnostics
    std::cout << "[cmd]";
    for (int i = 0; i < argc; ++i) {
        std::cout << " \"" << argv[i] << '"';
    }
    std::cout << std::endl;
    std::uint16_t port = 8080; // default
    std::string config_path = DEFAULT_CONFIG_FILE;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--port" && i + 1 < argc) {
            try {
                port = static_cast<std::uint16_t>(std::stoi(argv[++i]));
            } catch (const std::exception &e) {
                std::cerr << "Error: invalid port " << argv[i] << std::endl;
                return 1;
            }
        } else if (arg.starts_with("--config") && i + 1 < argc) {
            config_path = std::string(argv[++i]);
        } else if (arg == "--version") {
            std::cout << offloader::version() << std::endl;
            return 0;
        }
    }

    // write defaults on first start so they can be edited
    if (!std::filesystem::exists(config_path)) {
        try {
            save_config(config_path, Config{});
            std::cout << "[config] Created default configuration at " << config_path << std::endl;
        } catch (const std::exception &e) {
            std::cerr << "[config] " << e.what() << std::endl;
        }
    }

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::cerr << "Error: failed to initialize libcurl" << std::endl;
        return 1;
    }
    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    std::cout << "Starting offloader (version " << offloader::version() << ") on port " << port << std::endl;
    {
        Config config = load_config(config_path);
        SystemMountBackend backend(config.use_sudo);
        StreamFileCopier copier;
        TransferService service(config_path, backend, copier);
        start_simple_server(port, service, stop_requested);
    }
    curl_global_cleanup();
    std::cout << "Server exited." << std::endl;
    return 0;
}
