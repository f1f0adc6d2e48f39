#pragma once

#include <unistd.h>
#include <cstddef>
#include <string>

enum class ReadStatus {
    Ok,          // 读到 EAGAIN 或读满 max_bytes, 连接还在
    PeerClosed,  // 读到 EOF
    Error
};

// 非阻塞 fd: 读到 EAGAIN 或读满 max_bytes, 追加到 buf. *nread 为本次读到的字节数
ReadStatus read_from(int fd, std::string& buf, size_t* nread = nullptr,
                     size_t max_bytes = static_cast<size_t>(-1));
// 写完整个 buf, 不阻塞调用者. 发送缓冲满时: wait_ms <= 0 直接返回 -1 (errno 为 EAGAIN),
// 否则最多等 wait_ms 毫秒可写. 返回写出的字节数, 出错 -1
ssize_t write_to(int fd, const std::string& buf, int wait_ms = 0);
