#include "include/config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

void ServerConfig::validate() const {
    if (bind_address.empty()) {
        throw std::invalid_argument("bind_address must not be empty");
    }
    if (ping_interval.count() <= 0 || pong_timeout.count() <= 0) {
        throw std::invalid_argument("heartbeat durations must be positive");
    }
    // 上一轮的 PONG 超时必须在下一次 PING 之前结束
    if (ping_interval <= pong_timeout) {
        throw std::invalid_argument("ping_interval_ms must be greater than pong_timeout_ms");
    }
    if (max_pending == 0 || max_pending > MAX_PENDING_LIMIT) {
        throw std::invalid_argument("max_pending must be in [1, " + std::to_string(MAX_PENDING_LIMIT) + "]");
    }
    if (worker_threads == 0 || worker_threads > WORKER_THREADS_LIMIT) {
        throw std::invalid_argument("worker_threads must be in [1, " + std::to_string(WORKER_THREADS_LIMIT) + "]");
    }
    static const char* levels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    bool known = false;
    for (const char* level : levels) {
        known = known || log_level == level;
    }
    if (!known) {
        throw std::invalid_argument("Unknown log_level: " + log_level);
    }
}

namespace {
    // 整数先按 int64_t 读, 超出 [lo, hi] 直接拒绝, 不让 json 静默截断
    int64_t read_ranged(const json& j, const char* key, int64_t fallback, int64_t lo, int64_t hi) {
        int64_t v = j.value(key, fallback);
        if (v < lo || v > hi) {
            throw std::invalid_argument(std::string(key) + " out of range [" + std::to_string(lo) +
                                        ", " + std::to_string(hi) + "]: " + std::to_string(v));
        }
        return v;
    }
}

namespace server_config {
    ServerConfig parse(const std::string& content) {
        ServerConfig cfg;
        json j;
        try {
            j = json::parse(content);
        } catch (const json::parse_error& e) {
            throw std::invalid_argument(std::string("Malformed config: ") + e.what());
        }
        if (!j.is_object()) {
            throw std::invalid_argument("Config root must be a JSON object");
        }
        try {
            cfg.version = j.value("version", cfg.version);
            cfg.port = static_cast<uint16_t>(read_ranged(j, "port", cfg.port, 0, 65535));
            cfg.bind_address = j.value("bind_address", cfg.bind_address);
            cfg.heartbeat_enabled = j.value("heartbeat_enabled", cfg.heartbeat_enabled);
            cfg.ping_interval = std::chrono::milliseconds(
                j.value("ping_interval_ms", static_cast<int64_t>(cfg.ping_interval.count())));
            cfg.pong_timeout = std::chrono::milliseconds(
                j.value("pong_timeout_ms", static_cast<int64_t>(cfg.pong_timeout.count())));
            cfg.max_pending = static_cast<std::size_t>(read_ranged(
                j, "max_pending", static_cast<int64_t>(cfg.max_pending), 1, MAX_PENDING_LIMIT));
            cfg.worker_threads = static_cast<std::size_t>(read_ranged(
                j, "worker_threads", static_cast<int64_t>(cfg.worker_threads), 1, WORKER_THREADS_LIMIT));
            cfg.log_level = j.value("log_level", cfg.log_level);
        } catch (const json::type_error& e) {
            throw std::invalid_argument(std::string("Bad config value: ") + e.what());
        }
        cfg.validate();
        return cfg;
    }

    ServerConfig load(const std::string& file) {
        std::ifstream ifs(file);
        if (!ifs.is_open()) {
            throw std::runtime_error("Failed to open config file " + file);
        }

        std::string content;
        content.assign((std::istreambuf_iterator<char>(ifs)),
                       (std::istreambuf_iterator<char>()));
        ifs.close();
        return parse(content);
    }
}
