#include "net/stream_reader.hpp"
#include "common/logger.hpp"
#include <sys/types.h>
#include <sys/socket.h>
#include <cerrno>
#include <cstring>

StreamReader::StreamReader(int fd, size_t recv_chunk)
    : fd_(fd), recv_chunk_(recv_chunk ? recv_chunk : DEFAULT_RECV_CHUNK) {}

bool StreamReader::fill_()
{
    if (eof_)
        return false;

    // 直接收进缓冲尾部，不再另开临时块
    compact_();
    const size_t old = buf_.size();
    buf_.resize(old + recv_chunk_);
    for (;;)
    {
        ssize_t n = ::recv(fd_, &buf_[old], recv_chunk_, 0);
        if (n > 0)
        {
            buf_.resize(old + static_cast<size_t>(n));
            return true;
        }
        const int err = n < 0 ? errno : 0;
        if (err == EINTR)
            continue;

        buf_.resize(old);
        if (n == 0)
        {
            eof_ = true;
            return false;
        }
        // EAGAIN/EWOULDBLOCK 在阻塞 fd 上只会来自 SO_RCVTIMEO 超时
        errno_ = err;
        eof_ = true;
        if (errno_ == EAGAIN || errno_ == EWOULDBLOCK)
            LOG_INFO("recv fd=%d timed out", fd_);
        else
            LOG_WARN("recv fd=%d failed: %s", fd_, strerror(errno_));
        return false;
    }
}

void StreamReader::compact_()
{
    if (head_ == 0)
        return;
    if (head_ >= buf_.size())
    {
        buf_.clear();
        head_ = 0;
        return;
    }
    // 已消费部分超过一半才挪，避免每次 erase
    if (head_ * 2 >= buf_.size())
    {
        buf_.erase(0, head_);
        head_ = 0;
    }
}

bool StreamReader::read_line(std::string &line)
{
    size_t scan_from = head_;
    for (;;)
    {
        size_t nl = buf_.find('\n', scan_from);
        if (nl != std::string::npos)
        {
            line.assign(buf_, head_, nl - head_);
            head_ = nl + 1;
            return true;
        }

        // fill_ 可能会挪动缓冲，记下已扫描的相对位置
        size_t scanned = buf_.size() - head_;
        if (!fill_())
            return false;
        scan_from = head_ + scanned;
    }
}

size_t StreamReader::read_exact(size_t n, std::string &out)
{
    size_t got = 0;
    while (got < n)
    {
        if (head_ == buf_.size() && !fill_())
            break;

        size_t take = buf_.size() - head_;
        if (take > n - got)
            take = n - got;
        out.append(buf_, head_, take);
        head_ += take;
        got += take;
    }
    return got;
}
