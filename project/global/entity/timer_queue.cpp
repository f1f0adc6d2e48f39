#include "../include/timer_queue.hpp"
#include "../include/threadpool.hpp"
#include "../include/logging.hpp"
#include <algorithm>
#include <exception>

timer_queue::timer_queue(thread_pool* pool) : pool(pool) {}

timer_queue::~timer_queue() {
    shutdown();
}

void timer_queue::start() {
    std::lock_guard<std::mutex> lock(mtx);
    if (running) {
        return;
    }
    running = true;
    worker = std::thread([this]() { run_loop(); });
    log_debug("Timer queue started");
}

void timer_queue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (!running) {
            return;
        }
        running = false;
        tasks.clear();
        heap.clear();
    }
    cv.notify_all();
    if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
        worker.join();
    }
    log_debug("Timer queue stopped");
}

TimerId timer_queue::schedule(std::chrono::milliseconds delay,
                              std::chrono::milliseconds period,
                              Callback cb) {
    std::lock_guard<std::mutex> lock(mtx);
    TimerId id = next_id++;
    tasks[id] = task{std::move(cb), period};
    heap.push_back({Clock::now() + delay, id});
    std::push_heap(heap.begin(), heap.end());
    cv.notify_one();
    return id;
}

void timer_queue::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mtx);
    tasks.erase(id);
}

size_t timer_queue::pending() {
    std::lock_guard<std::mutex> lock(mtx);
    return tasks.size();
}

void timer_queue::run_loop() {
    std::unique_lock<std::mutex> lock(mtx);
    while (running) {
        if (heap.empty()) {
            cv.wait(lock);
            continue;
        }
        auto now = Clock::now();
        if (heap.front().expiry > now) {
            auto next = heap.front().expiry;
            cv.wait_until(lock, next);
            continue;
        }
        // 先读堆顶再 pop_heap
        entry due = heap.front();
        std::pop_heap(heap.begin(), heap.end());
        heap.pop_back();

        auto it = tasks.find(due.id);
        if (it == tasks.end()) {
            continue; // 已取消
        }
        Callback cb;
        if (it->second.period.count() > 0) {
            cb = it->second.cb;
            heap.push_back({due.expiry + it->second.period, due.id});
            std::push_heap(heap.begin(), heap.end());
        } else {
            cb = std::move(it->second.cb);
            tasks.erase(it);
        }

        lock.unlock();
        if (pool != nullptr) {
            pool->submit(std::move(cb));
        } else {
            try {
                cb();
            } catch (const std::exception& e) {
                log_error("Timer callback {} threw: {}", due.id, e.what());
            }
        }
        lock.lock();
    }
}
