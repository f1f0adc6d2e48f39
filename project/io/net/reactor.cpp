#include "../include/reactor.hpp"
#include "../../global/include/logging.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

event::event(int fd, uint32_t ev, std::function<void(uint32_t)> cb)
    : fd(fd), events(ev), call_back_func(std::move(cb)) {}

event::~event() {
    if (in_reactor && pr != nullptr) {
        epoll_ctl(pr->epoll_fd, EPOLL_CTL_DEL, fd, nullptr);
    }
    in_reactor = false;
    pr = nullptr;
    fd = -1;
}

void event::bind_with(reactor* re) {
    if (re == nullptr || pr != nullptr || in_reactor) {
        throw std::runtime_error(std::string(__func__) + ": event already bound or reactor is null");
    }
    pr = re;
}

void event::add_to_reactor() {
    struct epoll_event ev = {0, {0}};
    ev.events = events;
    ev.data.fd = fd;
    if (epoll_ctl(pr->epoll_fd, EPOLL_CTL_ADD, fd, &ev) < 0) {
        throw std::runtime_error(std::string(__func__) + ": epoll_ctl ADD failed for fd "
            + std::to_string(fd) + ": " + strerror(errno));
    }
    in_reactor = true;
}

void event::remove_from_reactor() {
    if (!in_reactor) {
        return;
    }
    if (epoll_ctl(pr->epoll_fd, EPOLL_CTL_DEL, fd, nullptr) < 0) {
        log_debug("epoll_ctl DEL failed for fd={}: {}", fd, strerror(errno));
    }
    in_reactor = false;
}

void event::rearm() {
    if (!in_reactor) {
        return;
    }
    struct epoll_event ev = {0, {0}};
    ev.events = events;
    ev.data.fd = fd;
    if (epoll_ctl(pr->epoll_fd, EPOLL_CTL_MOD, fd, &ev) < 0 && errno != ENOENT) {
        log_error("epoll_ctl MOD failed for fd={}: {}", fd, strerror(errno));
    }
}

void event::call_back(uint32_t revents) {
    if (call_back_func) {
        call_back_func(revents);
    }
}

bool event::is_binded() const { return pr != nullptr; }
int event::get_sockfd() const { return fd; }

reactor::reactor() : reactor(2048, 1000) {}

reactor::reactor(int max_events, int timeout)
    : max_events(max_events), epoll_timeout(timeout) {
    epoll_fd = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd < 0) {
        throw std::runtime_error(std::string(__func__) + ": Failed to create epoll instance - " + strerror(errno));
    }
    epoll_events = new epoll_event[max_events];
}

reactor::~reactor() {
    {
        std::lock_guard<std::mutex> lock(map_mutex);
        for (auto& [fd, ev] : fd_event_obj) {
            ev->remove_from_reactor();
            ev->pr = nullptr;
        }
        fd_event_obj.clear();
    }
    if (epoll_fd >= 0) {
        close(epoll_fd);
        epoll_fd = -1;
    }
    delete[] epoll_events;
    epoll_events = nullptr;
}

void reactor::add_event(const EventPtr& ev) {
    if (ev == nullptr || ev->get_sockfd() < 0) {
        throw std::runtime_error(std::string(__func__) + ": Invalid event or file descriptor");
    }
    if (!ev->is_binded()) {
        ev->bind_with(this);
    }
    std::lock_guard<std::mutex> lock(map_mutex);
    ev->add_to_reactor();
    fd_event_obj[ev->get_sockfd()] = ev;
}

void reactor::remove_event(int fd) {
    EventPtr ev;
    {
        std::lock_guard<std::mutex> lock(map_mutex);
        auto it = fd_event_obj.find(fd);
        if (it == fd_event_obj.end()) {
            return;
        }
        ev = std::move(it->second);
        fd_event_obj.erase(it);
        ev->remove_from_reactor();
    }
}

int reactor::poll_once() {
    int ret;
    do {
        ret = epoll_wait(epoll_fd, epoll_events, max_events, epoll_timeout);
    } while (ret < 0 && errno == EINTR);
    if (ret < 0) {
        throw std::runtime_error(std::string(__func__) + ": Epoll wait failed - " + strerror(errno));
    }

    // 先在锁内取出事件对象, 回调在锁外跑
    std::vector<std::pair<EventPtr, uint32_t>> ready;
    ready.reserve(ret);
    {
        std::lock_guard<std::mutex> lock(map_mutex);
        for (int i = 0; i < ret; ++i) {
            auto it = fd_event_obj.find(epoll_events[i].data.fd);
            if (it != fd_event_obj.end()) {
                // epoll_event 是 packed 结构, 先拷出来
                uint32_t revents = epoll_events[i].events;
                ready.emplace_back(it->second, revents);
            }
        }
    }
    for (auto& [ev, revents] : ready) {
        ev->call_back(revents);
    }
    return ret;
}
