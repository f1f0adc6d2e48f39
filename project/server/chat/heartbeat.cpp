#include "../include/heartbeat.hpp"

HeartbeatController::HeartbeatController(TimerService& timers,
                                         std::chrono::milliseconds interval,
                                         std::chrono::milliseconds timeout)
    : timers(timers), interval(interval), timeout(timeout) {}

HeartbeatController::~HeartbeatController() {
    stop();
}

bool HeartbeatController::start(TickCallback on_tick) {
    if (ping_timer) {
        return false;
    }
    ping_timer = timers.schedule(interval, interval, std::move(on_tick));
    return true;
}

std::uint64_t HeartbeatController::arm_deadline(DeadlineCallback on_deadline) {
    cancel_deadline();
    std::uint64_t current = ++round;
    awaiting = true;
    pong_timer = timers.schedule(timeout, std::chrono::milliseconds(0),
        [cb = std::move(on_deadline), current]() {
            cb(current);
        });
    return current;
}

bool HeartbeatController::pong_received() {
    if (!awaiting) {
        return false;
    }
    cancel_deadline();
    return true;
}

bool HeartbeatController::deadline_fired(std::uint64_t fired_round) {
    if (!awaiting || fired_round != round) {
        return false;
    }
    awaiting = false;
    pong_timer.reset();
    return true;
}

void HeartbeatController::cancel_deadline() {
    if (pong_timer) {
        timers.cancel(*pong_timer);
        pong_timer.reset();
    }
    awaiting = false;
}

void HeartbeatController::stop() {
    if (ping_timer) {
        timers.cancel(*ping_timer);
        ping_timer.reset();
    }
    cancel_deadline();
}

bool HeartbeatController::running() const {
    return ping_timer.has_value();
}

bool HeartbeatController::awaiting_pong() const {
    return awaiting;
}
