#pragma once

#include <string>

class Dispatcher;
class ChatSession;

class Handler {
public:
    Dispatcher* disp = nullptr;
    Handler(Dispatcher* dispatcher);
};

/* -------------- Command -------------- */

// 协议错误只回 FAILnn, 连接保持, 状态不变
class CommandHandler : public Handler {
public:
    CommandHandler(Dispatcher* dispatcher);

    // 检查顺序: 已登录(FAIL04) -> 格式(FAIL02) -> 重名(FAIL01)
    void handle_login(ChatSession& session, const std::string& username);
    void handle_broadcast(ChatSession& session, const std::string& text);
    void handle_pong(ChatSession& session);
    void handle_quit(ChatSession& session);
    void handle_unknown(ChatSession& session);
};
