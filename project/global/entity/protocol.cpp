#include "../include/protocol.hpp"
#include <regex>

ParsedMessage parse_message(const std::string& line) {
    ParsedMessage msg;
    auto space = line.find(' ');
    if (space == std::string::npos) {
        msg.command = line;
    } else {
        msg.command = line.substr(0, space);
        msg.payload = line.substr(space + 1);
    }
    return msg;
}

Command to_command(const std::string& token) {
    if (token == cmd::BROADCAST) return Command::Broadcast;
    if (token == cmd::LOGIN) return Command::Login;
    if (token == cmd::PONG) return Command::Pong;
    if (token == cmd::QUIT) return Command::Quit;
    return Command::Unknown;
}

std::string failure_message(Failure failure) {
    switch (failure) {
        case Failure::UnknownCommand:
            return "FAIL00 Unknown command";
        case Failure::UserTaken:
            return "FAIL01 User already logged in";
        case Failure::InvalidUsername:
            return "FAIL02 Username has an invalid format or length";
        case Failure::NotLoggedIn:
            return "FAIL03 Please log in first";
        case Failure::AlreadyLoggedIn:
            return "FAIL04 User cannot login twice";
        case Failure::PongWithoutPing:
            return "FAIL05 Pong without ping";
    }
    return "FAIL00 Unknown command";
}

bool is_valid_username(const std::string& name) {
    static const std::regex pattern("^[A-Za-z0-9_]{3,14}$");
    return std::regex_match(name, pattern);
}

std::string make_init(const std::string& version) {
    return std::string(cmd::INIT) + " Welcome to the server " + version;
}

std::string make_confirm(const std::string& what) {
    return std::string(cmd::CONFIRM) + " " + what;
}

std::string make_login_confirm(const std::string& username) {
    return make_confirm(std::string(cmd::LOGIN) + " " + username);
}

std::string make_broadcast_confirm(const std::string& text) {
    return make_confirm(std::string(cmd::BROADCAST) + " " + text);
}

std::string make_broadcast(const std::string& sender, const std::string& text) {
    return std::string(cmd::BROADCAST) + " " + sender + " " + text;
}

std::string make_ping() {
    return cmd::PING;
}

std::string make_disconnect(const std::string& why) {
    return std::string(cmd::DISCONNECT) + " " + why;
}
