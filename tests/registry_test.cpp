#include <gtest/gtest.h>
#include <set>
#include <thread>
#include <vector>

#include "core/registry.hpp"

TEST(ConnectionRegistry, NamesAreMonotonicAndPadded)
{
    ConnectionRegistry reg;
    EXPECT_EQ(reg.next_name(), "Client01");
    EXPECT_EQ(reg.next_name(), "Client02");
    for (int i = 3; i < 10; ++i)
        reg.next_name();
    EXPECT_EQ(reg.next_name(), "Client10");
}

TEST(ConnectionRegistry, ConcurrentNamingNeverRepeats)
{
    ConnectionRegistry reg;
    std::vector<std::vector<std::string>> got(8);
    std::vector<std::thread> threads;
    for (size_t t = 0; t < got.size(); ++t)
    {
        threads.emplace_back([&reg, &got, t]() {
            for (int i = 0; i < 200; ++i)
                got[t].push_back(reg.next_name());
        });
    }
    for (auto &th : threads)
        th.join();

    std::set<std::string> uniq;
    for (const auto &v : got)
        uniq.insert(v.begin(), v.end());
    EXPECT_EQ(uniq.size(), 8u * 200u);
}

TEST(ConnectionRegistry, ConnectAndDisconnectTrackActiveCount)
{
    ConnectionRegistry reg;
    EXPECT_EQ(reg.active_count(), 0u);

    EXPECT_TRUE(reg.register_connect("Client01", "127.0.0.1:4000"));
    EXPECT_TRUE(reg.register_connect("Client02", "127.0.0.1:4001"));
    EXPECT_EQ(reg.active_count(), 2u);

    reg.register_disconnect("Client01");
    EXPECT_EQ(reg.active_count(), 1u);

    SessionRecord rec;
    ASSERT_TRUE(reg.find("Client01", rec));
    EXPECT_FALSE(rec.active);
    EXPECT_EQ(rec.peer_address, "127.0.0.1:4000");
    EXPECT_GE(rec.disconnected_at, rec.connected_at);
}

TEST(ConnectionRegistry, DuplicateNameIsRefused)
{
    ConnectionRegistry reg;
    EXPECT_TRUE(reg.register_connect("alice", "a:1"));
    EXPECT_FALSE(reg.register_connect("alice", "b:2"));

    reg.register_disconnect("alice");
    EXPECT_FALSE(reg.register_connect("alice", "c:3"));
    EXPECT_EQ(reg.snapshot().size(), 1u);
}

TEST(ConnectionRegistry, DisconnectIsIdempotent)
{
    ConnectionRegistry reg;
    ASSERT_TRUE(reg.register_connect("Client01", "x:1"));
    reg.register_disconnect("Client01");

    SessionRecord first;
    ASSERT_TRUE(reg.find("Client01", first));

    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    reg.register_disconnect("Client01");

    SessionRecord second;
    ASSERT_TRUE(reg.find("Client01", second));
    EXPECT_FALSE(second.active);
    EXPECT_EQ(second.disconnected_at, first.disconnected_at);
    EXPECT_EQ(reg.active_count(), 0u);
    EXPECT_EQ(reg.format_status(), reg.format_status());
}

TEST(ConnectionRegistry, DisconnectOfUnknownNameIsNoop)
{
    ConnectionRegistry reg;
    reg.register_disconnect("ghost");
    EXPECT_TRUE(reg.snapshot().empty());
    EXPECT_EQ(reg.active_count(), 0u);
}

TEST(ConnectionRegistry, EmptyStatusHasPlaceholder)
{
    ConnectionRegistry reg;
    std::vector<std::string> lines = reg.format_status();
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "=== Server Cache ===");
    EXPECT_EQ(lines[1], "(no connections yet)");
    EXPECT_EQ(lines[2], "=== 0 session(s), 0 active ===");
}

TEST(ConnectionRegistry, StatusKeepsInsertionOrder)
{
    ConnectionRegistry reg;
    ASSERT_TRUE(reg.register_connect("zeta", "10.0.0.1:1"));
    ASSERT_TRUE(reg.register_connect("alpha", "10.0.0.2:2"));
    reg.register_disconnect("zeta");

    std::vector<std::string> lines = reg.format_status();
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[1].rfind("zeta [DISCONNECTED] | addr=10.0.0.1:1 | connected=", 0), 0u);
    EXPECT_EQ(lines[1].find("disconnected=-"), std::string::npos);
    EXPECT_EQ(lines[2].rfind("alpha [ACTIVE] | addr=10.0.0.2:2 | connected=", 0), 0u);
    EXPECT_NE(lines[2].find("| disconnected=-"), std::string::npos);
    EXPECT_EQ(lines[3], "=== 2 session(s), 1 active ===");
}

TEST(ConnectionRegistry, FormatsTimestamps)
{
    std::string ts = format_time(SessionRecord::Clock::now());
    ASSERT_EQ(ts.size(), 19u);
    EXPECT_EQ(ts[4], '-');
    EXPECT_EQ(ts[10], ' ');
    EXPECT_EQ(ts[13], ':');
}
