#include "include/TcpServer.hpp"
#include "include/TcpServerConnection.hpp"
#include "include/session.hpp"
#include "include/dispatcher.hpp"
#include "../global/include/logging.hpp"
#include "../global/include/threadpool.hpp"
#include "../io/include/reactor.hpp"
#include "../io/include/Socket.hpp"
#include <cerrno>
#include <cstring>
#include <exception>
#include <stdexcept>
#include <vector>

TcpServer::TcpServer(const std::string& ip, uint16_t port) {
    pr = new reactor(2048, 200);
    try {
        listen_conn = new ListenSocket(ip, port, true);
    } catch (...) {
        delete pr;
        throw;
    }
}

TcpServer::~TcpServer() {
    log_debug("Tcp server is being destroyed");
    {
        std::lock_guard<std::mutex> lock(live_mutex);
        live.clear();
    }
    delete listen_conn;
    delete pr;
}

uint16_t TcpServer::get_port() const {
    return listen_conn ? listen_conn->get_port() : 0;
}

void TcpServer::init(thread_pool* pool, Dispatcher* disp) {
    if (pool == nullptr || disp == nullptr) {
        throw std::invalid_argument("TcpServer::init needs a thread pool and a dispatcher");
    }
    this->pool = pool;
    this->disp = disp;
    if (!(listen_conn->bind() && listen_conn->listen())) {
        throw std::runtime_error("Failed to start listening on " + listen_conn->get_ip() + ":" + std::to_string(listen_conn->get_port()) + ": " + strerror(errno));
    }
    // 监听 fd 用边沿触发, 一次 accept 到 EAGAIN
    auto accept_event = std::make_shared<event>(listen_conn->get_fd(), EPOLLIN | EPOLLET,
        [this](uint32_t) {
            this->pool->submit([this]() {
                this->auto_accept();
            });
        });
    pr->add_event(accept_event);
    running = true;
}

void TcpServer::start() {
    // main loop
    while (running) {
        try {
            pr->poll_once();
        } catch (const std::exception& e) {
            log_error("Event loop failed: {}", e.what());
            running = false;
        }
    }
    log_debug("Tcp server main loop exited");
}

void TcpServer::stop() {
    running = false;
}

bool TcpServer::is_running() const {
    return running;
}

void TcpServer::auto_accept() {
    while (true) {
        auto new_sock = listen_conn->accept();
        if (!new_sock) {
            return;
        }
        int fd = new_sock->get_fd();
        std::shared_ptr<ChatSession> session;
        try {
            // 一次最多读 max_pending + 1 字节, 足够判定溢出
            auto conn = std::make_shared<TcpServerConnection>(std::move(new_sock), pr, pool,
                                                              disp->config.max_pending + 1);
            session = std::make_shared<ChatSession>(conn, *disp);
            {
                std::lock_guard<std::mutex> lock(live_mutex);
                live[fd] = Live{session, conn};
            }
            conn->open(session, [this](int closed_fd, const ChatSession* s) {
                release(closed_fd, s);
            });
        } catch (const std::exception& e) {
            log_error("Failed to set up connection fd {}: {}", fd, e.what());
            if (session) {
                session->on_close(true);
            }
            std::lock_guard<std::mutex> lock(live_mutex);
            live.erase(fd);
        }
    }
}

void TcpServer::release(int fd, const ChatSession* session) {
    std::lock_guard<std::mutex> lock(live_mutex);
    auto it = live.find(fd);
    if (it != live.end() && it->second.session.get() == session) {
        live.erase(it);
    }
}

void TcpServer::close_all() {
    std::vector<std::shared_ptr<TcpServerConnection>> conns;
    {
        std::lock_guard<std::mutex> lock(live_mutex);
        conns.reserve(live.size());
        for (auto& [fd, entry] : live) {
            conns.push_back(entry.conn);
        }
    }
    for (auto& conn : conns) {
        conn->destroy();
    }
}

size_t TcpServer::live_count() {
    std::lock_guard<std::mutex> lock(live_mutex);
    return live.size();
}
