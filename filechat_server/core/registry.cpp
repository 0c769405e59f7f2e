#include "core/registry.hpp"
#include <ctime>
#include <cstdio>

std::string format_time(SessionRecord::Clock::time_point tp)
{
    std::time_t t = SessionRecord::Clock::to_time_t(tp);
    std::tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return buf;
}

std::string ConnectionRegistry::next_name()
{
    uint64_t n;
    {
        std::lock_guard<std::mutex> lk(mu_);
        n = ++counter_;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "Client%02llu", (unsigned long long)n);
    return buf;
}

long ConnectionRegistry::index_of_(const std::string &name) const
{
    // 同名至多一条，从后往前找最近的
    for (size_t i = records_.size(); i > 0; --i)
    {
        if (records_[i - 1].name == name)
            return static_cast<long>(i - 1);
    }
    return -1;
}

bool ConnectionRegistry::register_connect(const std::string &name, const std::string &peer_address)
{
    SessionRecord rec;
    rec.name = name;
    rec.peer_address = peer_address;
    rec.connected_at = SessionRecord::Clock::now();
    rec.active = true;

    std::lock_guard<std::mutex> lk(mu_);
    if (index_of_(name) >= 0)
        return false;
    records_.push_back(std::move(rec));
    return true;
}

void ConnectionRegistry::register_disconnect(const std::string &name)
{
    auto now = SessionRecord::Clock::now();
    std::lock_guard<std::mutex> lk(mu_);
    long i = index_of_(name);
    if (i < 0)
        return;
    auto &rec = records_[static_cast<size_t>(i)];
    if (!rec.active)
        return;
    rec.active = false;
    rec.disconnected_at = now;
}

size_t ConnectionRegistry::active_count() const
{
    std::lock_guard<std::mutex> lk(mu_);
    size_t n = 0;
    for (const auto &rec : records_)
    {
        if (rec.active)
            ++n;
    }
    return n;
}

std::vector<std::string> ConnectionRegistry::format_status() const
{
    // 锁内只拷贝，格式化放到锁外
    std::vector<SessionRecord> recs = snapshot();

    std::vector<std::string> lines;
    lines.reserve(recs.size() + 2);
    lines.emplace_back("=== Server Cache ===");
    if (recs.empty())
        lines.emplace_back("(no connections yet)");

    size_t active = 0;
    for (const auto &rec : recs)
    {
        if (rec.active)
            ++active;
        std::string line = rec.name;
        line += rec.active ? " [ACTIVE]" : " [DISCONNECTED]";
        line += " | addr=" + rec.peer_address;
        line += " | connected=" + format_time(rec.connected_at);
        line += " | disconnected=";
        line += rec.active ? "-" : format_time(rec.disconnected_at);
        lines.push_back(std::move(line));
    }

    lines.push_back("=== " + std::to_string(recs.size()) + " session(s), " +
                    std::to_string(active) + " active ===");
    return lines;
}

bool ConnectionRegistry::find(const std::string &name, SessionRecord &out) const
{
    std::lock_guard<std::mutex> lk(mu_);
    long i = index_of_(name);
    if (i < 0)
        return false;
    out = records_[static_cast<size_t>(i)];
    return true;
}

std::vector<SessionRecord> ConnectionRegistry::snapshot() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return records_;
}
