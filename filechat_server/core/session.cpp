#include "core/session.hpp"
#include "core/registry.hpp"
#include "core/protocol.hpp"
#include "file/file_catalog.hpp"
#include "transfer/file_transfer.hpp"
#include "net/socket_util.hpp"
#include "common/logger.hpp"
#include <sys/socket.h>
#include <unistd.h>
#include <cstring>
#include <vector>

namespace
{
    bool starts_with(const std::string &s, const char *prefix)
    {
        size_t n = std::strlen(prefix);
        return s.size() >= n && s.compare(0, n, prefix) == 0;
    }

    std::string trim(const std::string &s)
    {
        size_t b = s.find_first_not_of(" \t\r");
        if (b == std::string::npos)
            return "";
        size_t e = s.find_last_not_of(" \t\r");
        return s.substr(b, e - b + 1);
    }
} // namespace

const char *session_state_str(SessionState s)
{
    switch (s)
    {
    case SessionState::Handshaking:
        return "handshaking";
    case SessionState::Serving:
        return "serving";
    case SessionState::Closed:
        return "closed";
    }
    return "unknown";
}

Session::Session(int fd, std::string assigned_name, std::string peer_address,
                 ConnectionRegistry &registry, const FileCatalog &catalog, size_t chunk_size)
    : fd_(fd),
      name_(std::move(assigned_name)),
      peer_(std::move(peer_address)),
      registry_(registry),
      catalog_(catalog),
      chunk_size_(chunk_size),
      reader_(fd, chunk_size) {}

Session::~Session() { close_("session destroyed"); }

void Session::run()
{
    const char *reason = "client disconnected";
    if (!handshake_())
    {
        reason = "handshake failed";
    }
    else
    {
        std::string line;
        for (;;)
        {
            if (!reader_.read_line(line))
            {
                reason = reader_.last_errno() ? "read error" : "client disconnected";
                break;
            }
            LOG_DEBUG("[%s] received '%s'", name_.c_str(), line.c_str());
            if (!dispatch_(line, reason))
                break;
        }
    }
    close_(reason);
}

bool Session::handshake_()
{
    if (!send_(proto::assigned_line(name_)))
        return false;

    std::string line;
    if (!reader_.read_line(line))
    {
        LOG_INFO("%s from %s closed before handshake", name_.c_str(), peer_.c_str());
        return false;
    }
    if (!starts_with(line, proto::NAME) || line.size() == std::strlen(proto::NAME))
    {
        LOG_WARN("%s from %s: bad handshake line '%s'", name_.c_str(), peer_.c_str(), line.c_str());
        return false;
    }

    // 以客户端回报的名字为准，不校验是否与分配的一致
    std::string claimed = line.substr(std::strlen(proto::NAME));
    if (claimed != name_)
        LOG_INFO("%s from %s claims name '%s'", name_.c_str(), peer_.c_str(), claimed.c_str());

    if (!registry_.register_connect(claimed, peer_))
    {
        LOG_WARN("name '%s' already registered, rejecting %s", claimed.c_str(), peer_.c_str());
        (void)send_(proto::NAME_IN_USE_LINE);
        return false;
    }
    name_ = claimed;
    registered_ = true;
    state_.store(SessionState::Serving);
    LOG_INFO("[JOIN] %s connected from %s", name_.c_str(), peer_.c_str());

    return send_(proto::hello_line(name_));
}

bool Session::dispatch_(const std::string &line, const char *&reason)
{
    if (line.empty())
        return true;

    if (line == proto::CMD_EXIT)
    {
        (void)send_(proto::BYE_LINE);
        reason = "client exit";
        return false;
    }

    bool ok;
    if (line == proto::CMD_STATUS)
        ok = handle_status_();
    else if (line == proto::CMD_LIST)
        ok = handle_list_();
    else if (line == proto::CMD_GET || starts_with(line, "get "))
        return handle_get_(line, reason);
    else
        ok = send_(line + proto::ACK_SUFFIX + "\n");

    if (!ok)
        reason = "send error";
    return ok;
}

bool Session::handle_status_()
{
    std::string out;
    for (const auto &l : registry_.format_status())
        out += l + "\n";
    out += "\n"; // 空行结束，客户端按此读多行
    return send_(out);
}

bool Session::handle_list_()
{
    std::vector<std::string> names;
    if (!catalog_.list(names))
        return send_("ERROR Cannot list files\n");

    std::string out = std::string(proto::LIST_HEADER) + "\n";
    if (names.empty())
        out += std::string(proto::LIST_EMPTY) + "\n";
    for (const auto &n : names)
        out += n + "\n";
    out += "\n";
    return send_(out);
}

bool Session::handle_get_(const std::string &line, const char *&reason)
{
    std::string file = trim(line.substr(std::strlen(proto::CMD_GET)));
    if (file.empty())
    {
        if (send_(proto::USAGE_GET_LINE))
            return true;
        reason = "send error";
        return false;
    }

    Status s = send_catalog_file(fd_, catalog_, file, chunk_size_);
    switch (s)
    {
    case Status::Ok:
        return true;
    case Status::BlobNotFound:
        LOG_INFO("[%s] requested missing file '%s'", name_.c_str(), file.c_str());
        return true;
    default:
        // 帧可能只发了一半，连接不能再用
        LOG_WARN("[%s] sending '%s' failed: %s", name_.c_str(), file.c_str(), status_str(s));
        reason = "file transfer failed";
        return false;
    }
}

bool Session::send_(const std::string &data)
{
    return send_str(fd_, data);
}

void Session::shutdown()
{
    std::lock_guard<std::mutex> lk(fd_mu_);
    if (!closed_)
        ::shutdown(fd_, SHUT_RDWR);
}

void Session::close_(const char *reason)
{
    if (cleaned_.exchange(true))
        return;

    // 先注销再关 fd：对端看到 EOF 时记录已经是断开状态
    if (registered_)
        registry_.register_disconnect(name_);
    {
        std::lock_guard<std::mutex> lk(fd_mu_);
        closed_ = true;
        ::close(fd_);
    }
    state_.store(SessionState::Closed);
    LOG_INFO("[LEAVE] %s (%s), reason: %s", name_.c_str(), peer_.c_str(), reason ? reason : "bye");
}
