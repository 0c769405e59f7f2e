#include "client/chat_client.hpp"
#include "core/protocol.hpp"
#include "net/stream_reader.hpp"
#include "net/socket_util.hpp"
#include "common/logger.hpp"
#include <unistd.h>
#include <cstring>

namespace
{
    bool starts_with(const std::string &s, const char *prefix)
    {
        size_t n = std::strlen(prefix);
        return s.size() >= n && s.compare(0, n, prefix) == 0;
    }
} // namespace

const char *reply_kind_str(Reply::Kind k)
{
    switch (k)
    {
    case Reply::Kind::Text:
        return "text";
    case Reply::Kind::Block:
        return "block";
    case Reply::Kind::Error:
        return "error";
    case Reply::Kind::File:
        return "file";
    case Reply::Kind::Closed:
        return "closed";
    }
    return "unknown";
}

FileChatClient::FileChatClient(ClientConfig cfg)
    : cfg_(std::move(cfg)), downloads_(cfg_.downloads_dir) {}

FileChatClient::~FileChatClient() { close(); }

bool FileChatClient::connect()
{
    close();
    if (!downloads_.init())
    {
        error_ = "cannot create downloads directory " + cfg_.downloads_dir;
        return false;
    }
    fd_ = connect_tcp(cfg_.host, cfg_.port);
    if (fd_ < 0)
    {
        error_ = "cannot connect to server at " + cfg_.host + ":" + std::to_string(cfg_.port);
        return false;
    }
    reader_ = std::make_unique<StreamReader>(fd_, cfg_.chunk_size);
    return true;
}

void FileChatClient::close()
{
    reader_.reset();
    if (fd_ >= 0)
    {
        ::close(fd_);
        fd_ = -1;
    }
}

bool FileChatClient::send_line_(const std::string &line)
{
    if (fd_ < 0 || !send_str(fd_, line + "\n"))
    {
        error_ = "send failed";
        return false;
    }
    return true;
}

bool FileChatClient::handshake()
{
    if (!reader_)
    {
        error_ = "not connected";
        return false;
    }

    std::string line;
    if (!reader_->read_line(line))
    {
        error_ = "server closed connection";
        return false;
    }
    if (!starts_with(line, proto::ASSIGNED) || line.size() == std::strlen(proto::ASSIGNED))
    {
        // 满员时这里收到的是 ERROR 行
        LOG_WARN("did not receive assignment from server: '%s'", line.c_str());
        error_ = line;
        return false;
    }
    name_ = line.substr(std::strlen(proto::ASSIGNED));

    if (!send_line_(proto::NAME + name_))
        return false;

    if (!reader_->read_line(line))
    {
        error_ = "server closed connection";
        return false;
    }
    if (!starts_with(line, proto::HELLO))
    {
        LOG_WARN("unexpected greeting: '%s'", line.c_str());
        error_ = line;
        return false;
    }
    hello_ = line;
    return true;
}

bool FileChatClient::request(const std::string &command, Reply &reply)
{
    reply = Reply{};
    if (!send_line_(command))
        return false;
    return read_reply_(reply);
}

bool FileChatClient::read_reply_(Reply &reply)
{
    std::string line;
    if (!reader_ || !reader_->read_line(line))
    {
        reply.kind = Reply::Kind::Closed;
        return false;
    }

    uint64_t size = 0;
    if (parse_filesize_line(line, size))
    {
        reply.kind = Reply::Kind::File;
        reply.lines.push_back(line);
        reply.transfer = receive_catalog_file(*reader_, size, downloads_, cfg_.chunk_size);
        if (reply.transfer.status == Status::Ok)
        {
            LOG_INFO("[DOWNLOADED] %s -> %s (%llu bytes)", reply.transfer.filename.c_str(),
                     reply.transfer.path.c_str(), (unsigned long long)reply.transfer.received);
            return true;
        }
        // 帧头坏了或被截断之后，流上的位置已不可信
        LOG_WARN("receiving file failed: %s", status_str(reply.transfer.status));
        close();
        return false;
    }

    reply.lines.push_back(line);
    if (starts_with(line, proto::ERROR))
    {
        reply.kind = Reply::Kind::Error;
        return true;
    }
    if (starts_with(line, proto::BLOCK_MARK))
    {
        reply.kind = Reply::Kind::Block;
        for (;;)
        {
            if (!reader_->read_line(line))
            {
                reply.kind = Reply::Kind::Closed;
                return false;
            }
            if (line.empty())
                break;
            reply.lines.push_back(line);
        }
        return true;
    }
    reply.kind = Reply::Kind::Text;
    return true;
}
