#pragma once
#include <string>
#include <cstdint>
#include <cstddef>
#include "common/status.hpp"

class StreamReader;
class FileCatalog;

// 文件帧：
//   FILESIZE <n>\n
//   FILENAME <name>\n
//   \n
//   <n 字节原始数据>，无结尾标记
static constexpr const char *FILESIZE_PREFIX = "FILESIZE ";
static constexpr const char *FILENAME_PREFIX = "FILENAME ";
static constexpr const char *NOT_FOUND_LINE = "ERROR File not found\n";

struct TransferResult
{
    Status status = Status::Ok;
    std::string filename; // 帧头里声明的文件名
    uint64_t declared = 0;
    uint64_t received = 0;
    std::string path; // 成功时落盘位置
};

std::string make_transfer_header(uint64_t size, const std::string &name);

// "FILESIZE <十进制数>"，只接受纯数字
bool parse_filesize_line(const std::string &line, uint64_t &size);
// "FILENAME <name>"，name 非空
bool parse_filename_line(const std::string &line, std::string &name);

// 发送帧头 + src_fd 里的 size 字节，按 chunk 分块
Status send_blob(int sock, const std::string &name, uint64_t size, int src_fd, size_t chunk);

// 从仓库发送 name；不存在时只回一行 "ERROR File not found" 并返回 BlobNotFound
Status send_catalog_file(int sock, const FileCatalog &catalog, const std::string &name, size_t chunk);

// reader 已经读过 "FILESIZE <size>" 这一行。
// 读 FILENAME 行和空行，再把 size 字节分块写进 dest 的 <name>.part，
// 收满后改名为 <name>；提前断开则删掉临时文件并返回 TruncatedTransfer
TransferResult receive_catalog_file(StreamReader &reader, uint64_t size, const FileCatalog &dest, size_t chunk);
