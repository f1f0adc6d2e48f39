#pragma once

#include "safe_queue.hpp"
#include <atomic>
#include <functional>
#include <thread>
#include <vector>

class thread_pool {
private:
    std::vector<std::thread> workers;
    safe_queue<std::function<void()>> tasks;
    std::atomic<bool> running{false};
    size_t thread_count;

    void worker_loop();

public:
    explicit thread_pool(size_t n);
    thread_pool(const thread_pool&) = delete;
    thread_pool& operator=(const thread_pool&) = delete;
    ~thread_pool();

    void init();
    void submit(std::function<void()> task);
    // 排空已提交的任务后回收线程
    void shutdown();
    bool is_running() const;
};
