#include "net/socket_util.hpp"
#include "common/logger.hpp"
#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

bool send_all(int fd, const char *data, size_t len)
{
    size_t sent = 0;
    while (sent < len)
    {
        ssize_t n = ::send(fd, data + sent, len - sent, MSG_NOSIGNAL);
        if (n > 0)
        {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        LOG_DEBUG("send fd=%d failed: %s", fd, n < 0 ? strerror(errno) : "0 bytes");
        return false;
    }
    return true;
}

bool send_str(int fd, const std::string &s) { return send_all(fd, s.data(), s.size()); }

bool set_recv_timeout(int fd, int ms)
{
    timeval tv{};
    if (ms > 0)
    {
        tv.tv_sec = ms / 1000;
        tv.tv_usec = (ms % 1000) * 1000;
    }
    if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0)
    {
        LOG_WARN("setsockopt(SO_RCVTIMEO) fd=%d failed: %s", fd, strerror(errno));
        return false;
    }
    return true;
}

std::string addr_to_string(const sockaddr_in &addr)
{
    char ip[INET_ADDRSTRLEN] = {0};
    if (!::inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip)))
        return "?";
    return std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));
}

int connect_tcp(const std::string &host, int port)
{
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo *res = nullptr;
    std::string service = std::to_string(port);
    int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (rc != 0)
    {
        LOG_ERROR("resolve %s failed: %s", host.c_str(), gai_strerror(rc));
        return -1;
    }

    int fd = -1;
    for (addrinfo *p = res; p; p = p->ai_next)
    {
        fd = ::socket(p->ai_family, p->ai_socktype | SOCK_CLOEXEC, p->ai_protocol);
        if (fd < 0)
            continue;
        if (::connect(fd, p->ai_addr, p->ai_addrlen) == 0)
            break;
        LOG_WARN("connect %s:%d failed: %s", host.c_str(), port, strerror(errno));
        ::close(fd);
        fd = -1;
    }
    ::freeaddrinfo(res);
    return fd;
}
