#pragma once

#include <string>

/*
 * 文本行协议: <COMMAND>[ <payload>]
 *
 * 客户端 -> 服务器: IDENT <name>, BCST <text>, PONG, QUIT
 * 服务器 -> 客户端: INIT <text>, OK ..., BCST <sender> <text>, PING,
 *                   DSCN <reason>, FAILnn <text>
 * 输出统一用 '\n' 结尾, 由发送端追加
 */

namespace cmd {
    constexpr const char* BROADCAST = "BCST";
    constexpr const char* CONFIRM = "OK";
    constexpr const char* DISCONNECT = "DSCN";
    constexpr const char* INIT = "INIT";
    constexpr const char* LOGIN = "IDENT";
    constexpr const char* PING = "PING";
    constexpr const char* PONG = "PONG";
    constexpr const char* QUIT = "QUIT";
}

enum class Command {
    Broadcast,
    Login,
    Pong,
    Quit,
    Unknown
};

enum class Failure {
    UnknownCommand,    // FAIL00
    UserTaken,         // FAIL01
    InvalidUsername,   // FAIL02
    NotLoggedIn,       // FAIL03
    AlreadyLoggedIn,   // FAIL04
    PongWithoutPing    // FAIL05
};

namespace reason {
    constexpr const char* UNTERMINATED = "Unterminated message";
    constexpr const char* PONG_TIMEOUT = "Pong timeout";
}

struct ParsedMessage {
    std::string command;
    std::string payload;
};

// 第一个空格前是命令, 之后全部是 payload, 不做校验
ParsedMessage parse_message(const std::string& line);

Command to_command(const std::string& token);

// "FAILnn <text>"
std::string failure_message(Failure failure);

// 3-14 个字母/数字/下划线
bool is_valid_username(const std::string& name);

std::string make_init(const std::string& version);
std::string make_confirm(const std::string& what);
std::string make_login_confirm(const std::string& username);
std::string make_broadcast_confirm(const std::string& text);
std::string make_broadcast(const std::string& sender, const std::string& text);
std::string make_ping();
std::string make_disconnect(const std::string& why);
