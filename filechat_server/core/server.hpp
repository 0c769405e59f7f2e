#pragma once
#include <string>
#include <list>
#include <memory>
#include <mutex>
#include <atomic>
#include <condition_variable>
#include <netinet/in.h>
#include "common/noncopyable.hpp"
#include "common/config.hpp"
#include "core/registry.hpp"

class FileCatalog;
class Session;

// 监听 + 接入控制：单线程 accept 循环，每个会话一个独立线程
class FileChatServer : NonCopyable
{
public:
    FileChatServer(const ServerConfig &cfg, const FileCatalog &catalog);
    ~FileChatServer();

    bool start(); // socket/bind/listen + epoll 初始化
    void run();   // 阻塞直到 stop()，返回前关闭并等待所有会话
    void stop();  // 请求退出，可在信号处理函数里调用

    // 实际监听端口（cfg.port 为 0 时由内核分配）
    int port() const { return bound_port_; }

    ConnectionRegistry &registry() { return registry_; }
    const ConnectionRegistry &registry() const { return registry_; }

private:
    bool setup_listen_socket_();
    bool setup_epoll_();

    void handle_accept_();
    bool at_capacity_() const;
    void reject_(int cfd, const std::string &peer);
    void spawn_session_(int cfd, const std::string &peer);
    void shutdown_sessions_();

    ServerConfig cfg_;
    const FileCatalog &catalog_;
    ConnectionRegistry registry_;

    int listen_fd_ = -1;
    int epoll_fd_ = -1;
    int bound_port_ = 0;
    std::atomic<bool> running_{false};

    // 运行参数
    int backlog_ = 128;
    int max_events_ = 16;
    int ep_timeout_ = 200; // ms；stop() 后最多等这么久退出

    // 存活会话（只用于停机时打断和等待，不承载会话状态）
    mutable std::mutex live_mu_;
    std::condition_variable live_cv_;
    std::list<std::shared_ptr<Session>> live_;
};
