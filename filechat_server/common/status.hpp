#pragma once
#include <cstdint>

// 会话/传输各步骤的结果
enum class Status : uint8_t
{
    Ok = 0,
    ProtocolError,     // 握手行或文件头格式不对
    TruncatedTransfer, // 收满声明字节数之前连接就断了
    BlobNotFound,      // 仓库里没有这个文件
    CapacityExceeded,  // 接入时已满
    IoError            // send/recv/open/write 失败
};

inline const char *status_str(Status s)
{
    switch (s)
    {
    case Status::Ok:
        return "ok";
    case Status::ProtocolError:
        return "protocol error";
    case Status::TruncatedTransfer:
        return "truncated transfer";
    case Status::BlobNotFound:
        return "blob not found";
    case Status::CapacityExceeded:
        return "capacity exceeded";
    case Status::IoError:
        return "i/o error";
    }
    return "unknown";
}
