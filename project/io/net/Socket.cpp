#include "../include/Socket.hpp"
#include "../include/ioaction.hpp"
#include "../../global/include/logging.hpp"
#include <stdexcept>
#include <unistd.h>
#include <fcntl.h>
#include <cstring>
#include <cerrno>

/* ----- Socket ----- */

Socket::Socket(int fd, bool nonblock) : fd(fd) {
    if (fd < 0) {
        throw std::runtime_error("Invalid file descriptor: " + std::string(strerror(errno)));
    }
    if (nonblock && fcntl(fd, F_SETFL, fcntl(fd, F_GETFL) | O_NONBLOCK) < 0) {
        close(fd);
        this->fd = -1;
        throw std::runtime_error("Failed to set socket to non-blocking: " + std::string(strerror(errno)));
    }
}

Socket::Socket(Socket&& other) noexcept
    : fd(other.fd), ip(std::move(other.ip)), port(other.port), addr(other.addr) {
    other.fd = -1;
}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        if (fd >= 0) {
            close(fd);
        }
        fd = other.fd;
        ip = std::move(other.ip);
        port = other.port;
        addr = other.addr;
        other.fd = -1;
    }
    return *this;
}

Socket::~Socket() {
    if (fd >= 0) {
        close(fd);
    }
    fd = -1;
}

int Socket::get_fd() const {
    return fd;
}

std::string Socket::get_ip() const {
    return ip;
}

uint16_t Socket::get_port() const {
    return port;
}

std::string Socket::get_endpoint() const {
    if (ip.empty()) {
        return "";
    }
    return ip + ":" + std::to_string(port);
}

/* ----- DataSocket ----- */

DataSocket::RecvState DataSocket::receive_chunk(std::string& chunk, size_t max_bytes) {
    if (fd < 0) return RecvState::Error;

    std::lock_guard<std::mutex> lock(read_mutex);
    size_t received = 0;
    ReadStatus status = ::read_from(fd, chunk, &received, max_bytes);
    switch (status) {
        case ReadStatus::PeerClosed:
            return RecvState::Disconnected;
        case ReadStatus::Error:
            return RecvState::Error;
        default:
            return received > 0 ? RecvState::Success : RecvState::NoMoreData;
    }
}

bool DataSocket::send_line(const std::string& line) {
    if (fd < 0) {
        return false;
    }
    std::string framed = line;
    framed.push_back('\n');
    ssize_t res;
    {
        std::lock_guard<std::mutex> lock(write_mutex);
        res = ::write_to(fd, framed);
    }
    if (res < 0) {
        int saved_errno = errno;
        log_error("Failed to send on fd {}: {}", fd, strerror(saved_errno));
        // 调用者还要看 errno
        errno = saved_errno;
        return false;
    }
    return true;
}

void DataSocket::shutdown() {
    if (fd < 0) {
        return;
    }
    if (::shutdown(fd, SHUT_RDWR) < 0 && errno != ENOTCONN) {
        log_debug("shutdown fd {} failed: {}", fd, strerror(errno));
    }
}

/* ----- AcceptedSocket ----- */

AcceptedSocket::AcceptedSocket(int fd, const sockaddr_in& peer, bool nonblock) : DataSocket(fd, nonblock) {
    addr = peer;
    char buf[INET_ADDRSTRLEN] = {0};
    if (inet_ntop(AF_INET, &peer.sin_addr, buf, sizeof(buf)) != nullptr) {
        ip = buf;
    }
    port = ntohs(peer.sin_port);
}

/* ----- ConnectSocket ----- */

ConnectSocket::ConnectSocket(const std::string& ip, uint16_t port, bool nonblock)
    : DataSocket(socket(AF_INET, SOCK_STREAM, 0), nonblock) {
    this->ip = ip;
    this->port = port;
}

bool CSocket::connect() {
    if (connected) {
        log_error("CSocket: Tried to connect twice");
        return false;
    }
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) <= 0) {
        throw std::runtime_error("Invalid IP address: " + ip);
    }
    if (::connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        throw std::runtime_error("Failed to connect to " + ip + ":" + std::to_string(port) + " - " + std::string(strerror(errno)));
    }
    connected = true;
    log_debug("CSocket connected to {}:{}", ip, port);
    return true;
}

/* ----- ListenSocket ----- */

LSocket::ListenSocket(const std::string& ip, uint16_t port, bool nonblock)
    : Socket(socket(AF_INET, SOCK_STREAM, 0), nonblock) {
    this->ip = ip;
    this->port = port;
}

bool LSocket::bind() {
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) <= 0) {
        log_error("Invalid IP address: {}:{}", ip, port);
        return false;
    }
    int opt = 1;
    // 端口复用
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        log_error("Failed to set SO_REUSEADDR on {}:{}: {}", ip, port, strerror(errno));
        return false;
    }
    if (::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        log_error("Failed to bind {}:{}: {}", ip, port, strerror(errno));
        return false;
    }
    // 端口为 0 时取系统分配的端口
    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (getsockname(fd, reinterpret_cast<struct sockaddr*>(&bound), &len) == 0) {
        port = ntohs(bound.sin_port);
    }
    this->binded = true;
    log_debug("ListenSocket bound {}:{}", ip, port);
    return true;
}

bool LSocket::listen() {
    if (::listen(fd, SOMAXCONN) < 0) {
        log_error("Failed to listen on ListenSocket: {}", strerror(errno));
        return false;
    }
    log_debug("ListenSocket is now listening on {}:{}", ip, port);
    return true;
}

std::unique_ptr<AcceptedSocket> LSocket::accept() {
    if (!binded) {
        throw std::runtime_error("Socket is not binded");
    }
    sockaddr_in peer{};
    socklen_t len = sizeof(peer);
    int client_fd = ::accept4(fd, reinterpret_cast<struct sockaddr*>(&peer), &len, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (client_fd < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            log_error("Failed to accept connection: {}", strerror(errno));
        }
        return nullptr;
    }
    log_debug("ListenSocket accepted connection on fd: {}", client_fd);
    return std::make_unique<AcceptedSocket>(client_fd, peer);
}
