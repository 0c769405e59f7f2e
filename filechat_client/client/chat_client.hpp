#pragma once
#include <string>
#include <vector>
#include <memory>
#include "common/noncopyable.hpp"
#include "common/status.hpp"
#include "file/file_catalog.hpp"
#include "transfer/file_transfer.hpp"

class StreamReader;

struct ClientConfig
{
    std::string host = "127.0.0.1";
    int port = 5050;
    std::string downloads_dir = "downloads";
    size_t chunk_size = 4096;
};

// 一次命令的回复
struct Reply
{
    enum class Kind
    {
        Text,  // 单行
        Block, // "===" 开头的多行块，读到空行为止
        Error, // "ERROR " 开头
        File,  // FILESIZE 帧，见 transfer
        Closed // 连接已断
    };

    Kind kind = Kind::Closed;
    std::vector<std::string> lines;
    TransferResult transfer;
};

const char *reply_kind_str(Reply::Kind k);

// 非交互客户端：握手后逐条发命令并按首行分类读取回复
class FileChatClient : NonCopyable
{
public:
    explicit FileChatClient(ClientConfig cfg);
    ~FileChatClient();

    bool connect();
    void close();
    bool connected() const { return fd_ >= 0; }

    // 收 ASSIGNED，回 NAME，收 HELLO。失败时 error() 为收到的那一行或原因
    bool handshake();

    // 发一条命令并读回复；连接断开时 reply.kind == Closed，返回 false
    bool request(const std::string &command, Reply &reply);

    const std::string &name() const { return name_; }
    const std::string &hello() const { return hello_; }
    const std::string &error() const { return error_; }

private:
    bool send_line_(const std::string &line);
    bool read_reply_(Reply &reply);

    ClientConfig cfg_;
    FileCatalog downloads_;
    int fd_ = -1;
    std::unique_ptr<StreamReader> reader_;
    std::string name_;
    std::string hello_;
    std::string error_;
};
