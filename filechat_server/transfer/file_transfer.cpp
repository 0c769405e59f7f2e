#include "transfer/file_transfer.hpp"
#include "net/stream_reader.hpp"
#include "net/socket_util.hpp"
#include "file/file_catalog.hpp"
#include "common/logger.hpp"
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <climits>
#include <vector>

namespace
{
    bool starts_with(const std::string &s, const char *prefix)
    {
        size_t n = std::strlen(prefix);
        return s.size() >= n && s.compare(0, n, prefix) == 0;
    }

    bool write_all(int fd, const char *data, size_t len)
    {
        size_t done = 0;
        while (done < len)
        {
            ssize_t n = ::write(fd, data + done, len - done);
            if (n > 0)
                done += static_cast<size_t>(n);
            else if (n < 0 && errno == EINTR)
                continue;
            else
                return false;
        }
        return true;
    }
} // namespace

std::string make_transfer_header(uint64_t size, const std::string &name)
{
    return std::string(FILESIZE_PREFIX) + std::to_string(size) + "\n" +
           FILENAME_PREFIX + name + "\n\n";
}

bool parse_filesize_line(const std::string &line, uint64_t &size)
{
    if (!starts_with(line, FILESIZE_PREFIX))
        return false;
    std::string digits = line.substr(std::strlen(FILESIZE_PREFIX));
    if (digits.empty() || digits.size() > 20)
        return false;

    uint64_t v = 0;
    for (char c : digits)
    {
        if (c < '0' || c > '9')
            return false;
        uint64_t d = static_cast<uint64_t>(c - '0');
        if (v > (UINT64_MAX - d) / 10)
            return false;
        v = v * 10 + d;
    }
    size = v;
    return true;
}

bool parse_filename_line(const std::string &line, std::string &name)
{
    if (!starts_with(line, FILENAME_PREFIX))
        return false;
    std::string n = line.substr(std::strlen(FILENAME_PREFIX));
    if (n.empty())
        return false;
    name = n;
    return true;
}

Status send_blob(int sock, const std::string &name, uint64_t size, int src_fd, size_t chunk)
{
    if (!send_str(sock, make_transfer_header(size, name)))
        return Status::IoError;

    std::vector<char> buf(chunk ? chunk : 4096);
    uint64_t remaining = size;
    while (remaining > 0)
    {
        size_t want = remaining < buf.size() ? static_cast<size_t>(remaining) : buf.size();
        ssize_t r = ::read(src_fd, buf.data(), want);
        if (r < 0 && errno == EINTR)
            continue;
        if (r <= 0)
        {
            // 头里的大小已经发出去了，这条连接上的帧已经没法补救
            LOG_ERROR("read %s failed after %llu/%llu bytes: %s", name.c_str(),
                      (unsigned long long)(size - remaining), (unsigned long long)size,
                      r < 0 ? strerror(errno) : "file shrank");
            return Status::IoError;
        }
        if (!send_all(sock, buf.data(), static_cast<size_t>(r)))
            return Status::IoError;
        remaining -= static_cast<uint64_t>(r);
    }
    return Status::Ok;
}

Status send_catalog_file(int sock, const FileCatalog &catalog, const std::string &name, size_t chunk)
{
    uint64_t size = 0;
    int fd = -1;
    if (catalog.stat_blob(name, size))
        fd = catalog.open_blob(name);
    if (fd < 0)
    {
        if (!send_str(sock, NOT_FOUND_LINE))
            return Status::IoError;
        return Status::BlobNotFound;
    }

    // 以打开后的实际大小为准
    struct stat st{};
    if (::fstat(fd, &st) == 0)
        size = static_cast<uint64_t>(st.st_size);

    Status s = send_blob(sock, name, size, fd, chunk);
    ::close(fd);
    if (s == Status::Ok)
        LOG_INFO("[FILE] sent %s (%llu bytes)", name.c_str(), (unsigned long long)size);
    return s;
}

TransferResult receive_catalog_file(StreamReader &reader, uint64_t size, const FileCatalog &dest, size_t chunk)
{
    TransferResult res;
    res.declared = size;

    std::string line;
    if (!reader.read_line(line) || !parse_filename_line(line, res.filename))
    {
        LOG_WARN("bad file header: expected FILENAME line");
        res.status = Status::ProtocolError;
        return res;
    }
    if (!FileCatalog::valid_name(res.filename))
    {
        LOG_WARN("bad file header: unusable file name '%s'", res.filename.c_str());
        res.status = Status::ProtocolError;
        return res;
    }
    if (!reader.read_line(line) || !line.empty())
    {
        LOG_WARN("bad file header: missing blank line after FILENAME");
        res.status = Status::ProtocolError;
        return res;
    }

    const std::string tmp = dest.temp_path(res.filename);
    int out = ::open(tmp.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
    if (out < 0)
    {
        LOG_ERROR("open %s failed: %s", tmp.c_str(), strerror(errno));
        res.status = Status::IoError;
        return res;
    }

    size_t step = chunk ? chunk : 4096;
    std::string piece;
    bool write_failed = false;
    while (res.received < size)
    {
        uint64_t left = size - res.received;
        size_t want = left < step ? static_cast<size_t>(left) : step;
        piece.clear();
        size_t got = reader.read_exact(want, piece);
        // 写失败后继续把声明的字节读完，保证连接上的帧边界不乱
        if (got > 0 && !write_failed && !write_all(out, piece.data(), got))
        {
            LOG_ERROR("write %s failed: %s", tmp.c_str(), strerror(errno));
            write_failed = true;
        }
        res.received += got;
        if (got < want)
            break;
    }
    ::close(out);

    if (res.received < size)
    {
        LOG_WARN("transfer of %s truncated: %llu/%llu bytes", res.filename.c_str(),
                 (unsigned long long)res.received, (unsigned long long)size);
        ::unlink(tmp.c_str());
        res.status = Status::TruncatedTransfer;
        return res;
    }
    if (write_failed)
    {
        ::unlink(tmp.c_str());
        res.status = Status::IoError;
        return res;
    }

    const std::string fin = dest.final_path(res.filename);
    if (::rename(tmp.c_str(), fin.c_str()) != 0)
    {
        LOG_ERROR("rename %s -> %s failed: %s", tmp.c_str(), fin.c_str(), strerror(errno));
        ::unlink(tmp.c_str());
        res.status = Status::IoError;
        return res;
    }
    res.path = fin;
    return res;
}
