#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

/*
config.json (全部可选):
{
    "version": "1.4",
    "port": 1337,
    "bind_address": "127.0.0.1",      // "0.0.0.0" 接受远程连接
    "heartbeat_enabled": true,
    "ping_interval_ms": 10000,
    "pong_timeout_ms": 3000,
    "max_pending": 1024,
    "worker_threads": 4,
    "log_level": "info"
}
*/
constexpr std::size_t MAX_PENDING_LIMIT = 16 * 1024 * 1024;
constexpr std::size_t WORKER_THREADS_LIMIT = 256;

struct ServerConfig {
    std::string version = "1.4";
    uint16_t port = 1337;
    std::string bind_address = "127.0.0.1";
    bool heartbeat_enabled = true;
    std::chrono::milliseconds ping_interval{10000};
    std::chrono::milliseconds pong_timeout{3000};
    std::size_t max_pending = 1024;  // 字节数
    std::size_t worker_threads = 4;
    std::string log_level = "info";

    // 不合法时抛 std::invalid_argument
    void validate() const;
};

namespace server_config {
    ServerConfig load(const std::string& file);
    ServerConfig parse(const std::string& content);
}
