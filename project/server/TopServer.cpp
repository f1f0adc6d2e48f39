#include "include/TopServer.hpp"
#include "include/TcpServer.hpp"
#include "include/dispatcher.hpp"
#include "include/connection_manager.hpp"
#include "../global/include/threadpool.hpp"
#include "../global/include/timer_queue.hpp"
#include "../global/include/logging.hpp"

TopServer::TopServer(const ServerConfig& cfg) : config(cfg) {
    config.validate();
    pool = new thread_pool(config.worker_threads);
    timers = new timer_queue(pool);
    conn_manager = new ConnectionManager();
    disp = new Dispatcher(conn_manager, timers, config);
    try {
        chat_server = new TcpServer(config.bind_address, config.port);
    } catch (...) {
        delete disp;
        delete conn_manager;
        delete timers;
        delete pool;
        throw;
    }
}

TopServer::~TopServer() {
    stop();
    // 会话在 chat_server 的连接表里, 要先于定时器和分发器释放
    delete chat_server;
    delete disp;
    delete conn_manager;
    delete timers;
    delete pool;
}

void TopServer::launch() {
    pool->init();
    timers->start();
    chat_server->init(pool, disp);
    loop_thread = std::thread([this]() {
        chat_server->start();
    });
    launched = true;
    log_info("Chat server listening on {}:{}", config.bind_address, chat_server->get_port());
}

void TopServer::stop() {
    if (!launched) {
        return;
    }
    launched = false;
    log_info("Stopping server");
    chat_server->stop();
    if (loop_thread.joinable()) {
        loop_thread.join();
    }
    chat_server->close_all();
    timers->shutdown();
    // 排空关闭通知
    pool->shutdown();
    log_info("Server stopped");
}

uint16_t TopServer::port() const {
    return chat_server->get_port();
}
