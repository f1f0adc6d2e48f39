#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

class ChatSession;

struct ConnectionStats {
    std::size_t connections = 0;
    std::size_t users = 0;
};

/*
 * 用户表(username -> 会话)和连接集合, 一把锁管两张表
 * 两张表都不持有会话, 会话归 TcpServer 的连接表所有
 * 锁顺序: 会话锁 -> user_mutex, 这里不会回调会话
 */
class ConnectionManager {
public:
    using UserSnapshot = std::vector<std::pair<std::string, std::shared_ptr<ChatSession>>>;

private:
    struct UserEntry {
        std::weak_ptr<ChatSession> session;
        const ChatSession* identity = nullptr;
    };

    std::unordered_map<std::string, UserEntry> users;
    std::unordered_set<const ChatSession*> connections;
    mutable std::mutex user_mutex;

public:
    ConnectionManager() = default;
    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // 名字已被占用时返回false, 检查和插入在同一把锁内
    bool add_user(const std::string& username, const std::shared_ptr<ChatSession>& session);
    void remove_user(const std::string& username);
    bool user_exists(const std::string& username) const;
    std::shared_ptr<ChatSession> get_user(const std::string& username) const;
    // 广播用的一致快照, 已失效的条目跳过
    UserSnapshot snapshot_users() const;

    void add_connection(const ChatSession* session);
    void remove_connection(const ChatSession* session);
    bool has_connection(const ChatSession* session) const;

    // 断开时调用: 名字只在确实属于该会话时才删
    ConnectionStats remove_session(const std::string& username, const ChatSession* session);

    ConnectionStats stats() const;
};

