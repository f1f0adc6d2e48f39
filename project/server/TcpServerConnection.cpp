#include "include/TcpServerConnection.hpp"
#include "include/session.hpp"
#include "../io/include/Socket.hpp"
#include "../io/include/reactor.hpp"
#include "../global/include/threadpool.hpp"
#include "../global/include/logging.hpp"
#include <cerrno>
#include <cstring>
#include <exception>
#include <stdexcept>

TcpServerConnection::TcpServerConnection(std::unique_ptr<AcceptedSocket> socket, reactor* reactor_ptr, thread_pool* pool,
                                         size_t read_limit)
    : socket(std::move(socket)), reactor_ptr(reactor_ptr), pool(pool), read_limit(read_limit) {
    if (!this->socket || reactor_ptr == nullptr || pool == nullptr) {
        throw std::invalid_argument("TcpServerConnection needs a socket, a reactor and a thread pool");
    }
    if (read_limit == 0) {
        throw std::invalid_argument("TcpServerConnection read limit must be positive");
    }
    fd = this->socket->get_fd();
    endpoint = this->socket->get_endpoint();
}

TcpServerConnection::~TcpServerConnection() {
    log_debug("Connection fd {} released", fd);
}

void TcpServerConnection::open(const std::shared_ptr<ChatSession>& s, ReleaseCallback on_release) {
    // 先绑定, INIT 发送失败时关闭流程才能找到会话和释放回调
    session = s;
    release_cb = std::move(on_release);
    // INIT 先于任何输入
    s->start();
    if (closing) {
        return;
    }

    std::weak_ptr<TcpServerConnection> weak = shared_from_this();
    thread_pool* workers = pool;
    read_event = std::make_shared<event>(fd, EPOLLIN | EPOLLRDHUP | EPOLLONESHOT,
        [weak, workers](uint32_t) {
            workers->submit([weak]() {
                if (auto conn = weak.lock()) {
                    try {
                        conn->handle_readable();
                    } catch (const std::exception& e) {
                        conn->close_connection(std::string("handler error: ") + e.what());
                    }
                }
            });
        });
    reactor_ptr->add_event(read_event);
    // 注册期间被别的线程关闭: close_connection 的 remove_event 可能早于 add_event
    if (closing) {
        reactor_ptr->remove_event(fd);
    }
}

void TcpServerConnection::send_line(const std::string& line) {
    if (closing) {
        log_debug("Dropping message to closing connection fd {}", fd);
        return;
    }
    if (!socket->send_line(line)) {
        close_connection(std::string("transmission error: ") + strerror(errno));
    }
}

void TcpServerConnection::destroy() {
    close_connection("");
}

std::string TcpServerConnection::remote() const {
    return endpoint;
}

void TcpServerConnection::handle_readable() {
    if (closing) {
        return;
    }
    auto s = session.lock();
    if (!s) {
        return;
    }
    std::string chunk;
    auto state = socket->receive_chunk(chunk, read_limit);
    int saved_errno = errno;
    if (!chunk.empty()) {
        s->on_data(chunk);
    }
    switch (state) {
        case DataSocket::RecvState::Disconnected: {
            s->on_end();
            return;
        }
        case DataSocket::RecvState::Error: {
            close_connection(std::string("read error: ") + strerror(saved_errno));
            return;
        }
        default: {
            // 处理完再打开读事件; 没读完的数据会让事件马上再触发
            if (!closing) {
                read_event->rearm();
            }
            break;
        }
    }
}

void TcpServerConnection::close_connection(const std::string& error) {
    if (closing.exchange(true)) {
        return;
    }
    reactor_ptr->remove_event(fd);
    socket->shutdown();

    // 关闭通知异步投递, 调用者可能正持有会话锁
    auto self = shared_from_this();
    pool->submit([self, error]() {
        bool had_error = !error.empty();
        if (auto s = self->session.lock()) {
            if (had_error) {
                s->on_error(error);
            }
            s->on_close(had_error);
        }
        if (self->release_cb) {
            self->release_cb(self->fd, self->session.lock().get());
        }
    });
}
