#pragma once
#include <string>
#include <vector>
#include <cstdint>

// 以目录为后端的文件仓库：服务端用来列出/发送文件，客户端用来落盘下载
class FileCatalog
{
public:
    explicit FileCatalog(std::string root) : root_(std::move(root)) {}
    bool init(); // 确保目录存在（递归创建）

    const std::string &root() const { return root_; }
    std::string temp_path(const std::string &name) const;  // root/<name>.part
    std::string final_path(const std::string &name) const; // root/<name>

    // 只接受单层文件名：非空、不含 '/'、不是 "." / ".."
    static bool valid_name(const std::string &name);

    // 目录下的普通文件名，按字典序；目录打不开返回 false
    bool list(std::vector<std::string> &names) const;

    // 文件存在且是普通文件时给出大小
    bool stat_blob(const std::string &name, uint64_t &size) const;

    // 只读打开，失败返回 -1
    int open_blob(const std::string &name) const;

private:
    std::string root_;
};
