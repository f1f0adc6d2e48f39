#pragma once

#include "channel.hpp"
#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

class event;
class reactor;
class thread_pool;
class AcceptedSocket;
class ChatSession;

// 一个已接受的 TCP 连接, 给会话当 Channel 用
class TcpServerConnection : public Channel,
                            public std::enable_shared_from_this<TcpServerConnection> {
public:
    // 关闭通知已交给会话后调用, 用来从服务器的连接表里删掉
    using ReleaseCallback = std::function<void(int fd, const ChatSession* session)>;

    // read_limit: 一次读事件最多读的字节数
    TcpServerConnection(std::unique_ptr<AcceptedSocket> socket, reactor* reactor_ptr, thread_pool* pool,
                        size_t read_limit);
    TcpServerConnection(const TcpServerConnection&) = delete;
    TcpServerConnection& operator=(const TcpServerConnection&) = delete;
    ~TcpServerConnection() override;

    // 绑定会话和释放回调, 启动会话 (发 INIT), 最后注册读事件.
    // INIT 发送失败时连接已进入关闭流程, 不再注册读事件
    void open(const std::shared_ptr<ChatSession>& session, ReleaseCallback on_release);

    void send_line(const std::string& line) override;
    void destroy() override;
    std::string remote() const override;

    // 读事件在线程池里的处理
    void handle_readable();

private:
    std::unique_ptr<AcceptedSocket> socket;
    std::shared_ptr<event> read_event;
    reactor* reactor_ptr = nullptr;
    thread_pool* pool = nullptr;
    std::weak_ptr<ChatSession> session;
    ReleaseCallback release_cb;
    std::string endpoint;
    size_t read_limit = 0;
    int fd = -1;
    std::atomic<bool> closing{false};

    // error 非空时先交给会话记日志, 再按传输错误关闭
    void close_connection(const std::string& error);
};
