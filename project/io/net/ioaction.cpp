#include "../include/ioaction.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <poll.h>
#include <sys/socket.h>

ReadStatus read_from(int fd, std::string& buf, size_t* nread, size_t max_bytes) {
    if (nread) {
        *nread = 0;
    }
    if (fd < 0) {
        return ReadStatus::Error;
    }
    char tmp[BUFSIZ];
    size_t got = 0;
    while (got < max_bytes) {
        size_t want = std::min(sizeof(tmp), max_bytes - got);
        ssize_t n = read(fd, tmp, want);
        if (n > 0) {
            buf.append(tmp, static_cast<size_t>(n));
            got += static_cast<size_t>(n);
            if (nread) {
                *nread = got;
            }
        } else if (n == 0) {
            return ReadStatus::PeerClosed;
        } else if (errno == EINTR) {
            continue;
        } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return ReadStatus::Ok;
        } else {
            return ReadStatus::Error;
        }
    }
    // 到了上限, 剩下的留给下一次读事件
    return ReadStatus::Ok;
}

ssize_t write_to(int fd, const std::string& buf, int wait_ms) {
    if (fd < 0) {
        return -1;
    }
    size_t total_written = 0;
    const char* data = buf.data();
    while (total_written < buf.size()) {
        // MSG_NOSIGNAL: 对端已关时返回 EPIPE 而不是 SIGPIPE
        ssize_t n = ::send(fd, data + total_written, buf.size() - total_written,
                           MSG_NOSIGNAL | MSG_DONTWAIT);
        if (n >= 0) {
            total_written += static_cast<size_t>(n);
            continue;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            if (wait_ms <= 0) {
                return -1;
            }
            // 发送缓冲满, 有限时间内等可写
            struct pollfd pfd = {fd, POLLOUT, 0};
            int ready = poll(&pfd, 1, wait_ms);
            if (ready > 0 && !(pfd.revents & (POLLERR | POLLHUP | POLLNVAL))) {
                continue;
            }
            errno = (ready == 0) ? ETIMEDOUT : EPIPE;
            return -1;
        }
        return -1;
    }
    return static_cast<ssize_t>(total_written);
}
