#include "../include/threadpool.hpp"
#include "../include/logging.hpp"
#include <exception>

thread_pool::thread_pool(size_t n) : thread_count(n == 0 ? 1 : n) {}

thread_pool::~thread_pool() {
    shutdown();
}

void thread_pool::init() {
    if (running.exchange(true)) {
        return;
    }
    workers.reserve(thread_count);
    for (size_t i = 0; i < thread_count; ++i) {
        workers.emplace_back([this]() { worker_loop(); });
    }
    log_debug("Thread pool started with {} workers", thread_count);
}

void thread_pool::worker_loop() {
    std::function<void()> task;
    while (tasks.wait_and_pop(task)) {
        try {
            task();
        } catch (const std::exception& e) {
            log_error("Uncaught exception in pool task: {}", e.what());
        }
        task = nullptr;
    }
}

void thread_pool::submit(std::function<void()> task) {
    if (!tasks.push(std::move(task))) {
        log_debug("Task dropped: thread pool is shut down");
    }
}

void thread_pool::shutdown() {
    tasks.close();
    for (auto& t : workers) {
        if (t.joinable() && t.get_id() != std::this_thread::get_id()) {
            t.join();
        }
    }
    // 池内线程自己调用 shutdown 时无法 join 自己
    for (auto& t : workers) {
        if (t.joinable()) {
            t.detach();
        }
    }
    workers.clear();
    if (running.exchange(false)) {
        log_debug("Thread pool stopped");
    }
}

bool thread_pool::is_running() const {
    return running.load();
}
