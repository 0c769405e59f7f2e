#pragma once
#include <string>
#include <cstddef>
#include "common/logger.hpp"

struct ServerConfig
{
    std::string ip = "0.0.0.0";
    int port = 5050;               // 0 = 由内核分配（测试用）
    int max_clients = 3;           // 同时在线会话上限
    std::string repo_dir = "repo"; // 提供下载的文件目录
    size_t chunk_size = 4096;      // 收发分块大小，不影响协议
    int read_timeout_ms = 0;       // 0 = 读不超时
    LogLevel log_level = LogLevel::INFO;
};

// 从 JSON 文件加载；缺省字段保留默认值。失败时 err 给出原因
bool load_server_config(const std::string &path, ServerConfig &cfg, std::string &err);

// 同上，直接解析 JSON 文本（测试用）
bool parse_server_config(const std::string &text, ServerConfig &cfg, std::string &err);
