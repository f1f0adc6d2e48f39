#pragma once

#include <cstddef>
#include <string>
#include <vector>

struct FrameResult {
    std::vector<std::string> lines;
    bool overflow = false;
};

/*
 * 增量拆行: "\r\n", "\r", "\n" 都算行尾, 行尾不保留
 * 未结束的尾巴留在 pending 里等下一块数据
 * 尾巴超过 max_pending 字节时置 overflow 并丢弃尾巴
 * 长度按字节算, 不按字符: 一个 UTF-8 多字节字符算多个字节,
 * 所以非 ASCII 文本比按 UTF-16 码元计数的实现更早触发溢出
 */
class LineFramer {
private:
    std::string pending_buf;
    std::size_t max_pending;
    // 上一块以 '\r' 结尾, 下一块开头的 '\n' 属于同一个行尾
    bool skip_lf = false;

public:
    explicit LineFramer(std::size_t max_pending);

    FrameResult feed(const std::string& chunk);

    const std::string& pending() const;
    std::size_t limit() const;
};
