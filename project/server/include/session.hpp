#pragma once

#include "channel.hpp"
#include "heartbeat.hpp"
#include "connection_manager.hpp"
#include "../../global/include/line_framer.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

class Dispatcher;
class CommandHandler;

/*
 * 每个连接一个会话: 拆行, 分发命令, 登录状态, 心跳
 *
 *   Unidentified --IDENT ok--> Identified
 *        |                         |
 *        +-------> Closed <--------+      Closed 之后不再处理任何输入
 *
 * 本会话的字段只在持有 mtx 时修改 (数据到达, 心跳定时器, 关闭通知)
 * 别的会话广播过来走 deliver(), 不碰本会话的字段
 */
class ChatSession : public std::enable_shared_from_this<ChatSession> {
public:
    enum class State {
        Unidentified,
        Identified,
        Closed
    };

    ChatSession(std::shared_ptr<Channel> channel, Dispatcher& disp);
    ChatSession(const ChatSession&) = delete;
    ChatSession& operator=(const ChatSession&) = delete;
    ~ChatSession();

    // 加入连接集合并发送 INIT
    void start();
    void on_data(const std::string& chunk);
    // 对端半关闭
    void on_end();
    void on_error(const std::string& what);
    // 流已关闭; 清理只做一次
    void on_close(bool had_error);

    // 其他会话广播用, as_user 只用于日志前缀
    void deliver(const std::string& as_user, const std::string& message);

    std::string username() const;
    State state() const;
    bool heartbeat_running() const;
    bool awaiting_pong() const;
    const std::string& remote() const;

private:
    friend class CommandHandler;

    mutable std::mutex mtx;
    std::shared_ptr<Channel> channel;
    Dispatcher& disp;
    LineFramer framer;
    HeartbeatController heartbeat;
    std::string peer;
    std::string user; // 空串表示未登录
    State st = State::Unidentified;
    bool torn_down = false;

    void process_message(const std::string& line);
    void send_message(const std::string& message);
    void write_line(const std::string& as_user, const std::string& message);
    void force_close();
    void start_heartbeat();
    void handle_ping_tick();
    void handle_pong_deadline(std::uint64_t round);
    void log(const std::string& text) const;
    void print_stats(const ConnectionStats& stats) const;
};

using SessionPtr = std::shared_ptr<ChatSession>;
