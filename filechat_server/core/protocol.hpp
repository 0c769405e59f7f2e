#pragma once
#include <string>

// 文本协议：每行以单个 '\n' 结尾
namespace proto
{
    static constexpr const char *ASSIGNED = "ASSIGNED ";
    static constexpr const char *NAME = "NAME ";
    static constexpr const char *HELLO = "HELLO ";
    static constexpr const char *ERROR = "ERROR ";
    static constexpr const char *BLOCK_MARK = "===";

    static constexpr const char *CMD_EXIT = "exit";
    static constexpr const char *CMD_STATUS = "status";
    static constexpr const char *CMD_LIST = "list";
    static constexpr const char *CMD_GET = "get";

    static constexpr const char *BYE_LINE = "BYE\n";
    static constexpr const char *ACK_SUFFIX = " ACK";
    static constexpr const char *USAGE_GET_LINE = "ERROR Usage: get <filename>\n";
    static constexpr const char *NAME_IN_USE_LINE = "ERROR Name already in use\n";
    static constexpr const char *LIST_HEADER = "=== Available Files ===";
    static constexpr const char *LIST_EMPTY = "(repository is empty)";

    inline std::string assigned_line(const std::string &name) { return ASSIGNED + name + "\n"; }

    inline std::string hello_line(const std::string &name)
    {
        return HELLO + name + ". Commands: status | list | get <file> | exit\n";
    }

    inline std::string capacity_line(int max_clients)
    {
        return "ERROR Server at capacity (max " + std::to_string(max_clients) +
               " clients). Try again later.\n";
    }
} // namespace proto
