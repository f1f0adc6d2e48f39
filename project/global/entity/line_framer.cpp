#include "../include/line_framer.hpp"

LineFramer::LineFramer(std::size_t max_pending) : max_pending(max_pending) {}

FrameResult LineFramer::feed(const std::string& chunk) {
    FrameResult result;
    std::size_t pos = 0;
    if (skip_lf && !chunk.empty()) {
        if (chunk[0] == '\n') {
            pos = 1;
        }
        skip_lf = false;
    }

    while (pos < chunk.size()) {
        std::size_t eol = chunk.find_first_of("\r\n", pos);
        if (eol == std::string::npos) {
            pending_buf.append(chunk, pos, std::string::npos);
            break;
        }
        pending_buf.append(chunk, pos, eol - pos);
        result.lines.push_back(std::move(pending_buf));
        pending_buf.clear();

        pos = eol + 1;
        if (chunk[eol] == '\r') {
            if (pos < chunk.size()) {
                if (chunk[pos] == '\n') {
                    ++pos;
                }
            } else {
                skip_lf = true;
            }
        }
    }

    // 防止不带行尾的数据撑爆内存
    if (pending_buf.size() > max_pending) {
        pending_buf.clear();
        pending_buf.shrink_to_fit();
        result.overflow = true;
    }
    return result;
}

const std::string& LineFramer::pending() const {
    return pending_buf;
}

std::size_t LineFramer::limit() const {
    return max_pending;
}
