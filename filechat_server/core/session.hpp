#pragma once
#include <string>
#include <atomic>
#include <mutex>
#include <cstdint>
#include "common/noncopyable.hpp"
#include "net/stream_reader.hpp"

class ConnectionRegistry;
class FileCatalog;

enum class SessionState : uint8_t
{
    Handshaking = 0,
    Serving,
    Closed
};

const char *session_state_str(SessionState s);

// 一个客户端连接的完整生命周期：握手 -> 命令循环 -> 关闭。
// 会话独占 fd，关闭时注销记录并 close(fd)，且只做一次
class Session : NonCopyable
{
public:
    Session(int fd, std::string assigned_name, std::string peer_address,
            ConnectionRegistry &registry, const FileCatalog &catalog, size_t chunk_size);
    ~Session();

    // 阻塞跑完整个会话，返回时已处于 Closed
    void run();

    // 其他线程调用：打断阻塞中的读写，run() 随后走正常清理路径
    void shutdown();

    SessionState state() const { return state_.load(); }

    // 握手后为客户端确认的名字；其他线程只能在 run() 返回后读
    const std::string &name() const { return name_; }
    const std::string &peer_address() const { return peer_; }

private:
    bool handshake_();
    // 返回 false 表示会话应结束，reason 给出原因
    bool dispatch_(const std::string &line, const char *&reason);

    bool handle_status_();
    bool handle_list_();
    bool handle_get_(const std::string &line, const char *&reason);

    bool send_(const std::string &data);
    void close_(const char *reason);

    int fd_;
    std::string name_;
    std::string peer_;
    ConnectionRegistry &registry_;
    const FileCatalog &catalog_;
    size_t chunk_size_;
    StreamReader reader_;

    std::atomic<SessionState> state_{SessionState::Handshaking};
    bool registered_ = false;
    std::atomic<bool> cleaned_{false};

    std::mutex fd_mu_; // 保护 fd_ 的关闭，和 shutdown() 互斥
    bool closed_ = false;
};
