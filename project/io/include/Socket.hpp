#pragma once

#include <cstddef>
#include <cstdint>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <string>
#include <memory>
#include <mutex>

class Socket;
class ListenSocket;
class DataSocket;
class AcceptedSocket;
class ConnectSocket;

class Socket {
protected:
    int fd = -1;

    std::string ip;
    uint16_t port = 0;
    sockaddr_in addr{};

public:
    explicit Socket(int fd, bool nonblock = false);
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;
    Socket& operator=(Socket&& other) noexcept;
    Socket(Socket&& other) noexcept;
    virtual ~Socket();

    int get_fd() const;
    std::string get_ip() const;
    uint16_t get_port() const;
    // "ip:port", 地址未知时为空
    std::string get_endpoint() const;
};

class DataSocket : public Socket {
protected:
    std::mutex read_mutex;
    std::mutex write_mutex;

public:
    explicit DataSocket(int fd, bool nonblock = false) : Socket(fd, nonblock) {}

    enum class RecvState {
        Success,       // chunk 里有新数据
        NoMoreData,    // 没有新数据
        Disconnected,  // 对端关闭 (chunk 里可能还有关闭前的数据)
        Error
    };
    // 循环读到 EAGAIN, 一次最多 max_bytes 字节, 结果追加到 chunk
    RecvState receive_chunk(std::string& chunk, size_t max_bytes = static_cast<size_t>(-1));

    // 追加 '\n' 后整行写出, 各线程的写互斥. 发送缓冲满 (对端不读) 时立即失败
    bool send_line(const std::string& line);
    // 两个方向都关掉, fd 留到析构时再 close
    void shutdown();
};

class AcceptedSocket : public DataSocket {
public:
    AcceptedSocket() = delete;
    AcceptedSocket(int fd, const sockaddr_in& peer, bool nonblock = false);
};

class ConnectSocket : public DataSocket {
private:
    bool connected = false;

public:
    ConnectSocket() = delete;
    ConnectSocket(const std::string& ip, uint16_t port, bool nonblock = false);

    bool connect();
};

class ListenSocket : public Socket {
private:
    bool binded = false;

public:
    ListenSocket(const std::string& ip, uint16_t port, bool nonblock = false);

    bool bind();
    bool listen();
    // 没有待接收的连接 (EAGAIN) 或出错时返回 nullptr
    std::unique_ptr<AcceptedSocket> accept();
};

using CSocket = ConnectSocket;
using LSocket = ListenSocket;
