#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

class Dispatcher;
class reactor;
class thread_pool;
class ListenSocket;
class ChatSession;
class TcpServerConnection;

class TcpServer {
private:
    struct Live {
        std::shared_ptr<ChatSession> session;
        std::shared_ptr<TcpServerConnection> conn;
    };

    reactor* pr = nullptr; // 反应堆, 事件丢到这里
    ListenSocket* listen_conn = nullptr; // 监听套接字
    thread_pool* pool = nullptr; // 事件回调丢这里
    Dispatcher* disp = nullptr;
    std::atomic<bool> running{false};

    // 活着的连接归这张表所有, 用户表和连接集合只存弱引用
    std::mutex live_mutex;
    std::unordered_map<int, Live> live;

    void release(int fd, const ChatSession* session);

public:
    TcpServer(const std::string& ip, uint16_t port);
    TcpServer(const TcpServer&) = delete;
    TcpServer& operator=(const TcpServer&) = delete;
    ~TcpServer();

    // bind 之后才是实际端口
    uint16_t get_port() const;

    // bind + listen + 注册监听事件, 失败抛异常
    void init(thread_pool* pool, Dispatcher* disp);
    // 事件循环, 阻塞到 stop()
    void start();
    void stop();
    bool is_running() const;
    void auto_accept();
    // 强制关闭所有连接
    void close_all();
    size_t live_count();
};
