#include "../include/session.hpp"
#include "../include/dispatcher.hpp"
#include "../../global/include/protocol.hpp"
#include "../../global/include/logging.hpp"

ChatSession::ChatSession(std::shared_ptr<Channel> channel, Dispatcher& disp)
    : channel(std::move(channel)),
      disp(disp),
      framer(disp.config.max_pending),
      heartbeat(*disp.timers, disp.config.ping_interval, disp.config.pong_timeout) {
    peer = this->channel->remote();
}

ChatSession::~ChatSession() {
    heartbeat.stop();
}

void ChatSession::start() {
    std::lock_guard<std::mutex> lock(mtx);
    disp.conn_manager->add_connection(this);
    // 握手: 连上就发 INIT, 客户端不用回
    send_message(make_init(disp.config.version));
}

void ChatSession::on_data(const std::string& chunk) {
    std::lock_guard<std::mutex> lock(mtx);
    if (st == State::Closed) {
        return;
    }
    FrameResult result = framer.feed(chunk);
    for (const auto& line : result.lines) {
        if (st == State::Closed) {
            break;
        }
        process_message(line);
    }
    // 防止内存被没有行尾的数据耗尽
    if (result.overflow && st != State::Closed) {
        log("too many pending characters");
        send_message(make_disconnect(reason::UNTERMINATED));
        force_close();
    }
}

void ChatSession::on_end() {
    std::lock_guard<std::mutex> lock(mtx);
    if (st == State::Closed) {
        return;
    }
    log("client closed connection unexpectedly");
    force_close();
}

void ChatSession::on_error(const std::string& what) {
    std::lock_guard<std::mutex> lock(mtx);
    log(what);
}

void ChatSession::on_close(bool had_error) {
    std::lock_guard<std::mutex> lock(mtx);
    if (torn_down) {
        return;
    }
    torn_down = true;
    if (had_error) {
        log("closing connection due to transmission error");
    }
    st = State::Closed;
    heartbeat.stop();
    ConnectionStats stats = disp.conn_manager->remove_session(user, this);
    log("removed client");
    print_stats(stats);
}

void ChatSession::deliver(const std::string& as_user, const std::string& message) {
    write_line(as_user, message);
}

std::string ChatSession::username() const {
    std::lock_guard<std::mutex> lock(mtx);
    return user;
}

ChatSession::State ChatSession::state() const {
    std::lock_guard<std::mutex> lock(mtx);
    return st;
}

bool ChatSession::heartbeat_running() const {
    std::lock_guard<std::mutex> lock(mtx);
    return heartbeat.running();
}

bool ChatSession::awaiting_pong() const {
    std::lock_guard<std::mutex> lock(mtx);
    return heartbeat.awaiting_pong();
}

const std::string& ChatSession::remote() const {
    return peer;
}

void ChatSession::process_message(const std::string& line) {
    log("--> " + line);
    disp.dispatch(*this, parse_message(line));
}

void ChatSession::send_message(const std::string& message) {
    write_line(user, message);
}

void ChatSession::write_line(const std::string& as_user, const std::string& message) {
    log_info("{} ({}) <-- {}", peer, as_user, message);
    channel->send_line(message);
}

void ChatSession::force_close() {
    if (st == State::Closed) {
        return;
    }
    st = State::Closed;
    heartbeat.stop();
    channel->destroy();
}

void ChatSession::start_heartbeat() {
    std::weak_ptr<ChatSession> weak = weak_from_this();
    if (heartbeat.start([weak]() {
            if (auto self = weak.lock()) {
                self->handle_ping_tick();
            }
        })) {
        log("heartbeat initiated");
    }
}

void ChatSession::handle_ping_tick() {
    std::lock_guard<std::mutex> lock(mtx);
    if (st == State::Closed) {
        return;
    }
    send_message(make_ping());
    std::weak_ptr<ChatSession> weak = weak_from_this();
    heartbeat.arm_deadline([weak](std::uint64_t round) {
        if (auto self = weak.lock()) {
            self->handle_pong_deadline(round);
        }
    });
}

void ChatSession::handle_pong_deadline(std::uint64_t round) {
    std::lock_guard<std::mutex> lock(mtx);
    if (st == State::Closed || !heartbeat.deadline_fired(round)) {
        return; // 已经收到 PONG 或者连接在关
    }
    log("heartbeat failure");
    send_message(make_disconnect(reason::PONG_TIMEOUT));
    force_close();
}

void ChatSession::log(const std::string& text) const {
    log_info("{} ({}) {}", peer, user, text);
}

void ChatSession::print_stats(const ConnectionStats& stats) const {
    log_info("{} client(s) / {} user(s)", stats.connections, stats.users);
}
