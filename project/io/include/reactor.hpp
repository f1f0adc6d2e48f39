#pragma once

#include <sys/epoll.h>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

class reactor;

/*
 * 一个 fd 上的读事件 + 回调
 * 连接上的事件带 EPOLLONESHOT: 触发一次后内核自动停掉,
 * 回调处理完再 rearm, 保证同一连接同一时刻只有一个读任务
 */
class event {
private:
    int fd;
    uint32_t events;
    std::atomic<bool> in_reactor{false};

public:
    reactor* pr = nullptr;
    std::function<void(uint32_t)> call_back_func;

    event(int fd, uint32_t ev, std::function<void(uint32_t)> cb);
    event() = delete;
    event(const event&) = delete;
    event& operator=(const event&) = delete;
    ~event();

    void bind_with(reactor* re);
    void add_to_reactor();
    void remove_from_reactor();
    void rearm();
    void call_back(uint32_t revents);
    bool is_binded() const;
    int get_sockfd() const;
};

using EventPtr = std::shared_ptr<event>;

class reactor {
private:
    int epoll_fd = -1;
    int max_events = 2048;
    int epoll_timeout = 1000;
    epoll_event* epoll_events = nullptr;

    std::mutex map_mutex;
    std::unordered_map<int, EventPtr> fd_event_obj;

public:
    friend class event;

    reactor();
    reactor(int max_events, int timeout);
    reactor(const reactor&) = delete;
    reactor(reactor&&) = delete;
    reactor& operator=(const reactor&) = delete;
    reactor& operator=(reactor&&) = delete;
    ~reactor();

    // 登记并加入 epoll
    void add_event(const EventPtr& ev);
    void remove_event(int fd);
    // 等待并逐个调用回调, 返回就绪数量
    int poll_once();
};

