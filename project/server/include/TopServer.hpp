#pragma once

#include "config.hpp"
#include <cstdint>
#include <thread>

class Dispatcher;
class ConnectionManager;
class TcpServer;
class thread_pool;
class timer_queue;

// 把线程池, 定时器, 用户表, 分发器和 TCP 服务器组装到一起
class TopServer {
public:
    thread_pool* pool = nullptr;
    timer_queue* timers = nullptr;
    ConnectionManager* conn_manager = nullptr;
    Dispatcher* disp = nullptr;
    TcpServer* chat_server = nullptr;

    explicit TopServer(const ServerConfig& config);
    TopServer(const TopServer&) = delete;
    TopServer& operator=(const TopServer&) = delete;
    ~TopServer();

    // 监听失败时抛异常
    void launch();
    void stop();
    uint16_t port() const;

private:
    ServerConfig config;
    std::thread loop_thread;
    bool launched = false;
};
