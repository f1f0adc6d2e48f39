#pragma once

#include <condition_variable>
#include <mutex>
#include <queue>

template<typename T>
class safe_queue {
private:
    std::mutex m_Mutex;
    std::queue<T> m_Queue;
    std::condition_variable m_Condition;
    bool m_Closed = false;
public:
    safe_queue() = default;
    ~safe_queue() = default;
    safe_queue(const safe_queue&) = delete;
    safe_queue& operator=(const safe_queue&) = delete;

    size_t size() {
        std::unique_lock<std::mutex> lock(m_Mutex);
        return m_Queue.size();
    }

    // 关闭后拒绝新元素
    bool push(T&& value) {
        std::unique_lock<std::mutex> lock(m_Mutex);
        if (m_Closed) {
            return false;
        }
        m_Queue.push(std::move(value));
        m_Condition.notify_one();
        return true;
    }

    bool try_pop(T& value) {
        std::unique_lock<std::mutex> lock(m_Mutex);
        if (m_Queue.empty()) {
            return false;
        }
        value = std::move(m_Queue.front());
        m_Queue.pop();
        return true;
    }

    // 阻塞直到有元素, 或者队列已关闭且为空(返回false)
    bool wait_and_pop(T& value) {
        std::unique_lock<std::mutex> lock(m_Mutex);
        m_Condition.wait(lock, [this] { return !m_Queue.empty() || m_Closed; });
        if (m_Queue.empty()) {
            return false;
        }
        value = std::move(m_Queue.front());
        m_Queue.pop();
        return true;
    }

    void close() {
        std::unique_lock<std::mutex> lock(m_Mutex);
        m_Closed = true;
        m_Condition.notify_all();
    }

    bool closed() {
        std::unique_lock<std::mutex> lock(m_Mutex);
        return m_Closed;
    }
};
