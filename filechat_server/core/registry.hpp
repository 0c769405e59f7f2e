#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <mutex>
#include <cstdint>
#include "common/noncopyable.hpp"

struct SessionRecord
{
    using Clock = std::chrono::system_clock;

    std::string name;
    std::string peer_address; // "ip:port"
    Clock::time_point connected_at{};
    Clock::time_point disconnected_at{}; // active 为 true 时无意义
    bool active = false;
};

// 所有会话共享的唯一可变状态：会话记录表 + 命名计数器，同一把锁保护。
// 记录只追加不删除，按插入顺序输出；锁内不做任何 I/O
class ConnectionRegistry : NonCopyable
{
public:
    // Client01, Client02, ...
    std::string next_name();

    // 新建一条活跃记录；name 已存在时返回 false
    bool register_connect(const std::string &name, const std::string &peer_address);

    // 把 name 标为断开并记下时间；重复调用或 name 不存在时什么也不做
    void register_disconnect(const std::string &name);

    size_t active_count() const;

    // "=== Server Cache ===" 开头、统计行结尾，每条记录一行
    std::vector<std::string> format_status() const;

    // 拷贝一份记录（只读）
    bool find(const std::string &name, SessionRecord &out) const;

    // 插入顺序的快照
    std::vector<SessionRecord> snapshot() const;

private:
    // 返回下标，找不到为 -1；调用方持锁
    long index_of_(const std::string &name) const;

    mutable std::mutex mu_;
    uint64_t counter_ = 0;
    std::vector<SessionRecord> records_;
};

// "YYYY-mm-dd HH:MM:SS"，本地时间
std::string format_time(SessionRecord::Clock::time_point tp);
