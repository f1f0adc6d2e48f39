#include "../include/handler.hpp"
#include "../include/dispatcher.hpp"
#include "../include/session.hpp"
#include "../include/connection_manager.hpp"
#include "../../global/include/protocol.hpp"
#include "../../global/include/logging.hpp"

/* Handler base */
Handler::Handler(Dispatcher* dispatcher) : disp(dispatcher) {}

/* ---------- CommandHandler ---------- */

CommandHandler::CommandHandler(Dispatcher* dispatcher) : Handler(dispatcher) {}

void CommandHandler::handle_login(ChatSession& session, const std::string& username) {
    if (session.st == ChatSession::State::Identified) {
        session.send_message(failure_message(Failure::AlreadyLoggedIn));
        return;
    }
    if (!is_valid_username(username)) {
        session.send_message(failure_message(Failure::InvalidUsername));
        return;
    }
    if (!disp->conn_manager->add_user(username, session.shared_from_this())) {
        // 名字被别的连接占着
        session.send_message(failure_message(Failure::UserTaken));
        return;
    }

    session.user = username;
    session.st = ChatSession::State::Identified;
    if (disp->config.heartbeat_enabled) {
        session.start_heartbeat();
    }
    session.send_message(make_login_confirm(username));
    session.print_stats(disp->conn_manager->stats());
}

void CommandHandler::handle_broadcast(ChatSession& session, const std::string& text) {
    if (session.st != ChatSession::State::Identified) {
        session.send_message(failure_message(Failure::NotLoggedIn));
        return;
    }
    auto users = disp->conn_manager->snapshot_users();
    for (const auto& [name, target] : users) {
        if (target.get() == &session) {
            // 发给自己的是确认, 不是广播
            session.send_message(make_broadcast_confirm(text));
        } else {
            target->deliver(name, make_broadcast(session.user, text));
        }
    }
}

void CommandHandler::handle_pong(ChatSession& session) {
    if (!session.heartbeat.pong_received()) {
        session.send_message(failure_message(Failure::PongWithoutPing));
        return;
    }
    session.log("heartbeat success");
}

void CommandHandler::handle_quit(ChatSession& session) {
    session.send_message(make_confirm("Goodbye"));
    session.force_close();
}

void CommandHandler::handle_unknown(ChatSession& session) {
    session.send_message(failure_message(Failure::UnknownCommand));
}
