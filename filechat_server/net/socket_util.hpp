#pragma once
#include <string>
#include <cstddef>
#include <netinet/in.h>

// 把 len 字节全部写出（MSG_NOSIGNAL，EINTR 重试）。对端关闭或出错返回 false
bool send_all(int fd, const char *data, size_t len);
bool send_str(int fd, const std::string &s);

// 读超时；ms <= 0 表示清除超时
bool set_recv_timeout(int fd, int ms);

// "ip:port"
std::string addr_to_string(const sockaddr_in &addr);

// 连接 host:port（IPv4，阻塞），失败返回 -1
int connect_tcp(const std::string &host, int port);
