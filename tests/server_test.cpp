#include <gtest/gtest.h>
#include <chrono>
#include <functional>
#include <memory>
#include <thread>
#include <unistd.h>

#include "core/server.hpp"
#include "file/file_catalog.hpp"
#include "net/stream_reader.hpp"
#include "net/socket_util.hpp"
#include "client/chat_client.hpp"
#include "test_util.hpp"

using testutil::TempDir;

namespace
{
    bool wait_until(const std::function<bool()> &pred, int timeout_ms = 3000)
    {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (pred())
                return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return pred();
    }

    class ServerTest : public ::testing::Test
    {
    protected:
        void SetUp() override { testutil::quiet_logs(); }

        void TearDown() override
        {
            if (server)
                server->stop();
            if (runner.joinable())
                runner.join();
        }

        void boot(int max_clients)
        {
            cfg.ip = "127.0.0.1";
            cfg.port = 0;
            cfg.max_clients = max_clients;
            cfg.repo_dir = repo_dir.path();
            cfg.chunk_size = 1000;
            ASSERT_TRUE(repo.init());
            server = std::make_unique<FileChatServer>(cfg, repo);
            ASSERT_TRUE(server->start());
            ASSERT_GT(server->port(), 0);
            runner = std::thread([this]() { server->run(); });
        }

        std::unique_ptr<FileChatClient> make_client()
        {
            ClientConfig cc;
            cc.host = "127.0.0.1";
            cc.port = server->port();
            cc.downloads_dir = dl_dir.path();
            cc.chunk_size = 333;
            return std::make_unique<FileChatClient>(cc);
        }

        std::unique_ptr<FileChatClient> joined_client()
        {
            auto c = make_client();
            EXPECT_TRUE(c->connect());
            EXPECT_TRUE(c->handshake()) << c->error();
            return c;
        }

        TempDir repo_dir;
        TempDir dl_dir;
        FileCatalog repo{repo_dir.path()};
        ServerConfig cfg;
        std::unique_ptr<FileChatServer> server;
        std::thread runner;
    };
} // namespace

TEST_F(ServerTest, AssignsIncreasingNames)
{
    boot(3);
    auto a = joined_client();
    auto b = joined_client();
    EXPECT_EQ(a->name(), "Client01");
    EXPECT_EQ(b->name(), "Client02");
    EXPECT_EQ(a->hello(), "HELLO Client01. Commands: status | list | get <file> | exit");
}

TEST_F(ServerTest, FourthClientIsRejectedAtCapacity)
{
    boot(3);
    auto a = joined_client();
    auto b = joined_client();
    auto c = joined_client();
    ASSERT_TRUE(wait_until([&] { return server->registry().active_count() == 3; }));

    // 原始连接：第一行就是满员提示，之后连接被关闭，从未收到 ASSIGNED
    int fd = connect_tcp("127.0.0.1", server->port());
    ASSERT_GE(fd, 0);
    StreamReader r(fd);
    std::string line;
    ASSERT_TRUE(r.read_line(line));
    EXPECT_EQ(line, "ERROR Server at capacity (max 3 clients). Try again later.");
    EXPECT_FALSE(r.read_line(line));
    ::close(fd);

    EXPECT_EQ(server->registry().active_count(), 3u);
    EXPECT_EQ(server->registry().snapshot().size(), 3u);

    auto d = make_client();
    ASSERT_TRUE(d->connect());
    EXPECT_FALSE(d->handshake());
    EXPECT_EQ(d->error(), "ERROR Server at capacity (max 3 clients). Try again later.");
    EXPECT_EQ(server->registry().active_count(), 3u);
}

TEST_F(ServerTest, SlotIsReusedAfterExit)
{
    boot(2);
    auto a = joined_client();
    auto b = joined_client();

    Reply bye;
    ASSERT_TRUE(a->request("exit", bye));
    EXPECT_EQ(bye.lines.at(0), "BYE");
    ASSERT_TRUE(wait_until([&] { return server->registry().active_count() == 1; }));

    auto c = joined_client();
    EXPECT_EQ(c->name(), "Client03");
    EXPECT_EQ(server->registry().active_count(), 2u);
}

TEST_F(ServerTest, MidHandshakeConnectionHoldsNoSlot)
{
    boot(1);
    // 收到 ASSIGNED 但不回 NAME
    int fd = connect_tcp("127.0.0.1", server->port());
    ASSERT_GE(fd, 0);
    StreamReader r(fd);
    std::string line;
    ASSERT_TRUE(r.read_line(line));
    EXPECT_EQ(line, "ASSIGNED Client01");
    EXPECT_EQ(server->registry().active_count(), 0u);

    // 只有已注册会话计入上限，第二个连接照常接入
    auto other = make_client();
    ASSERT_TRUE(other->connect());
    ASSERT_TRUE(other->handshake()) << other->error();
    EXPECT_EQ(other->name(), "Client02");
    EXPECT_EQ(server->registry().active_count(), 1u);

    // 已满，新连接被拒绝
    auto third = make_client();
    ASSERT_TRUE(third->connect());
    EXPECT_FALSE(third->handshake());
    EXPECT_EQ(third->error(), "ERROR Server at capacity (max 1 clients). Try again later.");

    ::close(fd);
}

TEST_F(ServerTest, CommandsEndToEnd)
{
    const std::string data = testutil::pattern_bytes(10000, 9);
    ASSERT_TRUE(testutil::write_file(repo_dir.file("data.bin"), data));
    boot(3);
    auto c = joined_client();

    Reply r;
    ASSERT_TRUE(c->request("list", r));
    EXPECT_EQ(r.kind, Reply::Kind::Block);
    ASSERT_EQ(r.lines.size(), 2u);
    EXPECT_EQ(r.lines[0], "=== Available Files ===");
    EXPECT_EQ(r.lines[1], "data.bin");

    ASSERT_TRUE(c->request("get data.bin", r));
    ASSERT_EQ(r.kind, Reply::Kind::File);
    EXPECT_EQ(r.transfer.status, Status::Ok);
    EXPECT_EQ(r.transfer.received, data.size());
    std::string got;
    ASSERT_TRUE(testutil::read_file(dl_dir.file("data.bin"), got));
    EXPECT_TRUE(got == data);

    ASSERT_TRUE(c->request("get nope.txt", r));
    EXPECT_EQ(r.kind, Reply::Kind::Error);
    EXPECT_EQ(r.lines.at(0), "ERROR File not found");

    ASSERT_TRUE(c->request("status", r));
    EXPECT_EQ(r.kind, Reply::Kind::Block);
    ASSERT_EQ(r.lines.size(), 3u);
    EXPECT_EQ(r.lines[1].rfind("Client01 [ACTIVE] | addr=127.0.0.1:", 0), 0u);

    ASSERT_TRUE(c->request("good morning", r));
    EXPECT_EQ(r.kind, Reply::Kind::Text);
    EXPECT_EQ(r.lines.at(0), "good morning ACK");

    ASSERT_TRUE(c->request("exit", r));
    EXPECT_EQ(r.lines.at(0), "BYE");
    EXPECT_FALSE(c->request("status", r));
    EXPECT_EQ(r.kind, Reply::Kind::Closed);
}

TEST_F(ServerTest, StatusShowsDisconnectedSessions)
{
    boot(3);
    auto a = joined_client();
    a->close();
    ASSERT_TRUE(wait_until([&] { return server->registry().active_count() == 0; }));

    auto b = joined_client();
    Reply r;
    ASSERT_TRUE(b->request("status", r));
    ASSERT_EQ(r.lines.size(), 4u);
    EXPECT_EQ(r.lines[1].rfind("Client01 [DISCONNECTED]", 0), 0u);
    EXPECT_EQ(r.lines[2].rfind("Client02 [ACTIVE]", 0), 0u);
    EXPECT_EQ(r.lines[3], "=== 2 session(s), 1 active ===");
}

TEST_F(ServerTest, StopEndsLiveSessions)
{
    boot(3);
    auto a = joined_client();
    auto b = joined_client();
    ASSERT_TRUE(wait_until([&] { return server->registry().active_count() == 2; }));

    server->stop();
    runner.join();
    EXPECT_EQ(server->registry().active_count(), 0u);

    Reply r;
    EXPECT_FALSE(a->request("status", r));
    EXPECT_EQ(r.kind, Reply::Kind::Closed);
}
