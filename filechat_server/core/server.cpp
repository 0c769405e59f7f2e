#include "core/server.hpp"
#include "core/session.hpp"
#include "core/protocol.hpp"
#include "file/file_catalog.hpp"
#include "net/socket_util.hpp"
#include "common/logger.hpp"
#include <sys/types.h>
#include <sys/socket.h>
#include <sys/epoll.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <thread>
#include <vector>

static int set_reuseaddr(int fd)
{
    int opt = 1;
    return setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
}

FileChatServer::FileChatServer(const ServerConfig &cfg, const FileCatalog &catalog)
    : cfg_(cfg), catalog_(catalog) {}

FileChatServer::~FileChatServer()
{
    stop();
    shutdown_sessions_();
    if (listen_fd_ >= 0)
        ::close(listen_fd_);
    if (epoll_fd_ >= 0)
        ::close(epoll_fd_);
}

bool FileChatServer::setup_listen_socket_()
{
    listen_fd_ = socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (listen_fd_ < 0)
    {
        LOG_ERROR("socket() failed: %s", strerror(errno));
        return false;
    }
    if (set_reuseaddr(listen_fd_) < 0)
    {
        LOG_WARN("setsockopt(SO_REUSEADDR) failed: %s", strerror(errno));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(cfg_.port));
    if (inet_pton(AF_INET, cfg_.ip.c_str(), &addr.sin_addr) <= 0)
    {
        LOG_ERROR("invalid ip: %s", cfg_.ip.c_str());
        return false;
    }
    if (bind(listen_fd_, (sockaddr *)&addr, sizeof(addr)) < 0)
    {
        LOG_ERROR("bind %s:%d failed: %s", cfg_.ip.c_str(), cfg_.port, strerror(errno));
        return false;
    }
    if (listen(listen_fd_, backlog_) < 0)
    {
        LOG_ERROR("listen failed: %s", strerror(errno));
        return false;
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (getsockname(listen_fd_, (sockaddr *)&bound, &len) < 0)
    {
        LOG_ERROR("getsockname failed: %s", strerror(errno));
        return false;
    }
    bound_port_ = ntohs(bound.sin_port);
    return true;
}

bool FileChatServer::setup_epoll_()
{
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0)
    {
        LOG_ERROR("epoll_create1 failed: %s", strerror(errno));
        return false;
    }

    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = listen_fd_;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, listen_fd_, &ev) < 0)
    {
        LOG_ERROR("epoll_ctl ADD listen failed: %s", strerror(errno));
        return false;
    }
    return true;
}

bool FileChatServer::start()
{
    if (!setup_listen_socket_())
        return false;
    if (!setup_epoll_())
        return false;
    running_ = true;
    LOG_INFO("Server listening on %s:%d (max clients: %d, repository: '%s')",
             cfg_.ip.c_str(), bound_port_, cfg_.max_clients, catalog_.root().c_str());
    return true;
}

bool FileChatServer::at_capacity_() const
{
    // 只按已完成握手的会话计数
    return registry_.active_count() >= static_cast<size_t>(cfg_.max_clients);
}

void FileChatServer::reject_(int cfd, const std::string &peer)
{
    LOG_WARN("Connection rejected from %s (server at capacity)", peer.c_str());
    if (!send_str(cfd, proto::capacity_line(cfg_.max_clients)))
        LOG_DEBUG("capacity notice to %s not delivered", peer.c_str());
    ::close(cfd);
}

void FileChatServer::spawn_session_(int cfd, const std::string &peer)
{
    if (cfg_.read_timeout_ms > 0 && !set_recv_timeout(cfd, cfg_.read_timeout_ms))
        LOG_WARN("session for %s runs without read timeout", peer.c_str());

    auto session = std::make_shared<Session>(cfd, registry_.next_name(), peer,
                                             registry_, catalog_, cfg_.chunk_size);
    std::list<std::shared_ptr<Session>>::iterator slot;
    {
        std::lock_guard<std::mutex> lk(live_mu_);
        slot = live_.insert(live_.end(), session);
    }

    try
    {
        std::thread([this, session, slot]() {
            session->run();
            std::lock_guard<std::mutex> lk(live_mu_);
            live_.erase(slot);
            live_cv_.notify_all();
        }).detach();
    }
    catch (const std::system_error &e)
    {
        LOG_ERROR("cannot start session thread for %s: %s", peer.c_str(), e.what());
        std::lock_guard<std::mutex> lk(live_mu_);
        live_.erase(slot);
        // session 析构时关闭 cfd
    }
}

void FileChatServer::handle_accept_()
{
    while (true)
    {
        sockaddr_in cli{};
        socklen_t len = sizeof(cli);
        // 会话线程里是阻塞读写，客户端 fd 不设 NONBLOCK
        int cfd = accept4(listen_fd_, (sockaddr *)&cli, &len, SOCK_CLOEXEC);
        if (cfd < 0)
        {
            if (errno == EAGAIN || errno == EWOULDBLOCK)
                break;
            if (errno == EINTR)
                continue;
            LOG_WARN("accept4 failed: %s", strerror(errno));
            break;
        }

        std::string peer = addr_to_string(cli);
        LOG_INFO("Accepted connection from %s", peer.c_str());

        if (at_capacity_())
        {
            reject_(cfd, peer);
            continue;
        }
        spawn_session_(cfd, peer);
    }
}

void FileChatServer::run()
{
    std::vector<epoll_event> evs(static_cast<size_t>(max_events_));
    while (running_)
    {
        int n = epoll_wait(epoll_fd_, evs.data(), max_events_, ep_timeout_);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            LOG_ERROR("epoll_wait failed: %s", strerror(errno));
            break;
        }
        for (int i = 0; i < n; ++i)
        {
            if (evs[i].data.fd == listen_fd_)
                handle_accept_();
        }
    }

    shutdown_sessions_();
    LOG_INFO("Server stopped.");
}

void FileChatServer::stop() { running_ = false; }

void FileChatServer::shutdown_sessions_()
{
    std::unique_lock<std::mutex> lk(live_mu_);
    for (auto &s : live_)
        s->shutdown();
    live_cv_.wait(lk, [this] { return live_.empty(); });
}
