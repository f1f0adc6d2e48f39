#pragma once

#include <string>

// 会话看到的字节流: 只管发一行, 强制关闭, 以及对端地址
class Channel {
public:
    virtual ~Channel() = default;

    // 不带行尾, 由实现追加 '\n'. 失败只记日志, 随后走关闭流程
    virtual void send_line(const std::string& line) = 0;
    // 幂等. 关闭完成后异步通知会话 on_close
    virtual void destroy() = 0;
    virtual std::string remote() const = 0;
};
