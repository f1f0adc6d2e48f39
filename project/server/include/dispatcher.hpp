#pragma once

#include "handler.hpp"
#include "config.hpp"

class ChatSession;
class ConnectionManager;
class TimerService;
struct ParsedMessage;

// 会话共享的服务: 用户表, 定时器, 配置, 以及按命令分发到 handler
class Dispatcher {
public:
    ConnectionManager* conn_manager = nullptr;
    TimerService* timers = nullptr;
    const ServerConfig config;

    Dispatcher(ConnectionManager* cm, TimerService* timers, const ServerConfig& config);
    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // 在会话锁内调用
    void dispatch(ChatSession& session, const ParsedMessage& message);

private:
    CommandHandler command_handler;
};
