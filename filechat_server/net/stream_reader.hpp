#pragma once
#include <string>
#include <cstddef>
#include "common/noncopyable.hpp"

// 一条连接上的接收缓冲。
// 按行读（'\n' 分隔）和按字节数读共用同一个游标：
// 行读多收进来的字节留在缓冲里，紧接着的定长读先从缓冲取，反之亦然。
class StreamReader : NonCopyable
{
public:
    static constexpr size_t DEFAULT_RECV_CHUNK = 4096;

    // 不接管 fd 的所有权
    explicit StreamReader(int fd, size_t recv_chunk = DEFAULT_RECV_CHUNK);

    // 读到下一个 '\n'，line 为其之前的内容（不含 '\n'）。
    // 连接关闭且缓冲里没有完整的一行时返回 false；残余字节保留在缓冲中
    bool read_line(std::string &line);

    // 读恰好 n 字节追加到 out。返回实际读到的字节数，小于 n 说明连接提前结束
    size_t read_exact(size_t n, std::string &out);

    // 缓冲里还没被取走的字节数
    size_t buffered() const { return buf_.size() - head_; }

    // 对端已关闭（或读出错/超时）
    bool eof() const { return eof_; }

    // 最后一次 recv 失败的 errno，正常 EOF 时为 0
    int last_errno() const { return errno_; }

private:
    // 从 fd 再收一块追加到缓冲，返回 false 表示再也收不到了
    bool fill_();
    void compact_();

    int fd_;
    size_t recv_chunk_;
    std::string buf_;
    size_t head_ = 0; // 已消费位置
    bool eof_ = false;
    int errno_ = 0;
};
