#pragma once

#include "../../global/include/timer_queue.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>

/*
 * 每个会话两个定时器:
 *   ping_timer  周期性, 登录后一直跑到断开
 *   pong_timer  一次性, 只在发了PING还没收到PONG时存在
 * 所有方法都在会话锁内调用
 */
class HeartbeatController {
public:
    using TickCallback = std::function<void()>;
    using DeadlineCallback = std::function<void(std::uint64_t round)>;

private:
    TimerService& timers;
    std::chrono::milliseconds interval;
    std::chrono::milliseconds timeout;
    std::optional<TimerId> ping_timer;
    std::optional<TimerId> pong_timer;
    bool awaiting = false;
    std::uint64_t round = 0;

    void cancel_deadline();

public:
    HeartbeatController(TimerService& timers,
                        std::chrono::milliseconds interval,
                        std::chrono::milliseconds timeout);
    HeartbeatController(const HeartbeatController&) = delete;
    HeartbeatController& operator=(const HeartbeatController&) = delete;
    ~HeartbeatController();

    // 只生效一次, 重复调用返回false
    bool start(TickCallback on_tick);
    // PING 发出后调用, 上一轮还挂着的 deadline 先取消. 返回本轮编号
    std::uint64_t arm_deadline(DeadlineCallback on_deadline);
    // 有挂着的 deadline 时取消并返回true
    bool pong_received();
    // 只有当前这一轮的超时才算数
    bool deadline_fired(std::uint64_t fired_round);
    void stop();

    bool running() const;
    bool awaiting_pong() const;
};
