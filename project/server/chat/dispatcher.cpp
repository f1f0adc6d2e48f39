#include "../include/dispatcher.hpp"
#include "../../global/include/protocol.hpp"
#include <stdexcept>

Dispatcher::Dispatcher(ConnectionManager* cm, TimerService* timers, const ServerConfig& config)
    : conn_manager(cm), timers(timers), config(config), command_handler(this) {
    if (cm == nullptr || timers == nullptr) {
        throw std::invalid_argument("Dispatcher needs a connection manager and a timer service");
    }
}

void Dispatcher::dispatch(ChatSession& session, const ParsedMessage& message) {
    switch (to_command(message.command)) {
        case Command::Broadcast: {
            command_handler.handle_broadcast(session, message.payload);
            break;
        }
        case Command::Login: {
            command_handler.handle_login(session, message.payload);
            break;
        }
        case Command::Pong: {
            command_handler.handle_pong(session);
            break;
        }
        case Command::Quit: {
            command_handler.handle_quit(session);
            break;
        }
        default: {
            command_handler.handle_unknown(session);
            break;
        }
    }
}
