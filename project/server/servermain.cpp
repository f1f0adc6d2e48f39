#include "include/TopServer.hpp"
#include "include/config.hpp"
#include "../global/include/logging.hpp"
#include <csignal>
#include <cstring>
#include <exception>
#include <iostream>
#include <pthread.h>
#include <signal.h>
#include <string>

namespace {
    void usage(const char* prog) {
        std::cerr << "Usage: " << prog << " [config.json] [--port N]" << std::endl;
    }
}

int main(int argc, char* argv[]) {
    std::string config_file;
    int port_override = -1;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--port" && i + 1 < argc) {
            try {
                port_override = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                usage(argv[0]);
                return 1;
            }
            if (port_override < 0 || port_override > 65535) {
                usage(argv[0]);
                return 1;
            }
        } else if (arg == "-h" || arg == "--help") {
            usage(argv[0]);
            return 0;
        } else if (config_file.empty()) {
            config_file = arg;
        } else {
            usage(argv[0]);
            return 1;
        }
    }

    ServerConfig config;
    try {
        if (!config_file.empty()) {
            config = server_config::load(config_file);
        }
        if (port_override >= 0) {
            config.port = static_cast<uint16_t>(port_override);
        }
        config.validate();
    } catch (const std::exception& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    try {
        init_logging(config.log_level);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Failed to set up logging: " << e.what() << std::endl;
        return 1;
    }

    // 先屏蔽信号再起线程, 由主线程 sigwait
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    log_info("Starting server version {} on port {}", config.version, config.port);
    log_info("Press Ctrl-C to quit the server");
    try {
        TopServer server(config);
        server.launch();
        int sig = 0;
        sigwait(&signals, &sig);
        log_info("Received signal {}, shutting down", strsignal(sig));
        server.stop();
    } catch (const std::exception& e) {
        log_error("Server failed: {}", e.what());
        return 1;
    }
    return 0;
}
