#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

class thread_pool;

using TimerId = std::uint64_t;

// 可取消的定时任务; period 为 0 表示一次性
class TimerService {
public:
    using Callback = std::function<void()>;

    virtual ~TimerService() = default;

    virtual TimerId schedule(std::chrono::milliseconds delay,
                             std::chrono::milliseconds period,
                             Callback cb) = 0;
    // 对已触发或不存在的 id 无操作
    virtual void cancel(TimerId id) = 0;
};

/*
 * 单线程定时器: 按到期时间排的小根堆 + 条件变量
 * 取消只删 tasks 表中的条目, 堆里的旧节点弹出时发现没有对应任务就丢掉
 * 回调在锁外执行, 有线程池时丢进线程池
 */
class timer_queue : public TimerService {
private:
    using Clock = std::chrono::steady_clock;

    struct entry {
        Clock::time_point expiry;
        TimerId id;
        // std::push_heap 是大根堆, 反过来比较得到小根堆
        bool operator<(const entry& o) const { return expiry > o.expiry; }
    };

    struct task {
        Callback cb;
        std::chrono::milliseconds period;
    };

    std::vector<entry> heap;
    std::unordered_map<TimerId, task> tasks;
    std::mutex mtx;
    std::condition_variable cv;
    std::thread worker;
    bool running = false;
    TimerId next_id = 1;
    thread_pool* pool = nullptr;

    void run_loop();

public:
    explicit timer_queue(thread_pool* pool = nullptr);
    timer_queue(const timer_queue&) = delete;
    timer_queue& operator=(const timer_queue&) = delete;
    ~timer_queue() override;

    void start();
    void shutdown();

    TimerId schedule(std::chrono::milliseconds delay,
                     std::chrono::milliseconds period,
                     Callback cb) override;
    void cancel(TimerId id) override;

    size_t pending();
};
