#include "include/connection_manager.hpp"
#include "../global/include/logging.hpp"

bool ConnectionManager::add_user(const std::string& username, const std::shared_ptr<ChatSession>& session) {
    if (username.empty() || session == nullptr) {
        log_error("Attempted to register empty username or null session");
        return false;
    }
    std::lock_guard<std::mutex> lock(user_mutex);
    auto [it, inserted] = users.try_emplace(username, UserEntry{session, session.get()});
    (void)it;
    return inserted;
}

void ConnectionManager::remove_user(const std::string& username) {
    if (username.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(user_mutex);
    users.erase(username);
}

bool ConnectionManager::user_exists(const std::string& username) const {
    std::lock_guard<std::mutex> lock(user_mutex);
    return users.find(username) != users.end();
}

std::shared_ptr<ChatSession> ConnectionManager::get_user(const std::string& username) const {
    std::lock_guard<std::mutex> lock(user_mutex);
    auto it = users.find(username);
    if (it == users.end()) {
        return nullptr;
    }
    return it->second.session.lock();
}

ConnectionManager::UserSnapshot ConnectionManager::snapshot_users() const {
    UserSnapshot snapshot;
    std::lock_guard<std::mutex> lock(user_mutex);
    snapshot.reserve(users.size());
    for (const auto& [name, entry] : users) {
        if (auto session = entry.session.lock()) {
            snapshot.emplace_back(name, std::move(session));
        }
    }
    return snapshot;
}

void ConnectionManager::add_connection(const ChatSession* session) {
    std::lock_guard<std::mutex> lock(user_mutex);
    connections.insert(session);
}

void ConnectionManager::remove_connection(const ChatSession* session) {
    std::lock_guard<std::mutex> lock(user_mutex);
    connections.erase(session);
}

bool ConnectionManager::has_connection(const ChatSession* session) const {
    std::lock_guard<std::mutex> lock(user_mutex);
    return connections.count(session) != 0;
}

ConnectionStats ConnectionManager::remove_session(const std::string& username, const ChatSession* session) {
    std::lock_guard<std::mutex> lock(user_mutex);
    if (!username.empty()) {
        auto it = users.find(username);
        if (it != users.end() && it->second.identity == session) {
            users.erase(it);
        } else if (it != users.end()) {
            log_warn("User {} belongs to another session, not removed", username);
        }
    }
    connections.erase(session);
    return ConnectionStats{connections.size(), users.size()};
}

ConnectionStats ConnectionManager::stats() const {
    std::lock_guard<std::mutex> lock(user_mutex);
    return ConnectionStats{connections.size(), users.size()};
}
