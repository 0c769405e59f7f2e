#include "common/logger.hpp"
#include <mutex>
#include <array>
#include <atomic>
#include <chrono>
#include <ctime>
#include <cctype>
#include <cstring>
#include <unistd.h>

namespace
{
    std::mutex g_mu;
    std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};
    FILE *g_out = stderr;
    bool g_color = true;

    inline unsigned long current_tid()
    {
        return static_cast<unsigned long>(gettid());
    }

    inline const char *short_file(const char *path)
    {
        if (!path)
            return "";
        const char *p = std::strrchr(path, '/');
        return p ? (p + 1) : path;
    }

    // yyyy-mm-dd HH:MM:SS.mmm
    inline void stamp_now(char *buf, size_t n)
    {
        using namespace std::chrono;
        auto now = system_clock::now();
        auto secs = time_point_cast<seconds>(now);
        auto ms = duration_cast<milliseconds>(now - secs).count();

        std::time_t t = system_clock::to_time_t(secs);
        std::tm tm_buf;
        localtime_r(&t, &tm_buf);
        std::snprintf(buf, n, "%04d-%02d-%02d %02d:%02d:%02d.%03ld",
                      tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
                      tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<long>(ms));
    }

    // snprintf 返回的是"本应写入"的长度，这里夹到缓冲区内
    inline size_t advance(size_t pos, int wrote, size_t cap)
    {
        if (wrote < 0)
            return pos;
        size_t next = pos + static_cast<size_t>(wrote);
        return next < cap ? next : cap - 1;
    }

} // namespace

void Logger::init(LogLevel lvl, FILE *out, bool enable_color)
{
    std::lock_guard<std::mutex> lock(g_mu);
    g_level.store(static_cast<int>(lvl));
    g_out = out ? out : stderr;
    g_color = enable_color;
}

void Logger::set_level(LogLevel lvl)
{
    g_level.store(static_cast<int>(lvl));
}

LogLevel Logger::level()
{
    return static_cast<LogLevel>(g_level.load());
}

void Logger::set_output(FILE *out)
{
    std::lock_guard<std::mutex> lock(g_mu);
    g_out = out ? out : stderr;
}

void Logger::set_color(bool enable)
{
    std::lock_guard<std::mutex> lock(g_mu);
    g_color = enable;
}

bool Logger::parse_level(const std::string &text, LogLevel &out)
{
    std::string t;
    t.reserve(text.size());
    for (char c : text)
        t.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (t == "debug")
        out = LogLevel::DEBUG;
    else if (t == "info")
        out = LogLevel::INFO;
    else if (t == "warn" || t == "warning")
        out = LogLevel::WARN;
    else if (t == "error")
        out = LogLevel::ERROR;
    else
        return false;
    return true;
}

const char *Logger::level_str(LogLevel lvl)
{
    switch (lvl)
    {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARN:
        return "WARN";
    case LogLevel::ERROR:
        return "ERROR";
    }
    return "UNKNOWN";
}

const char *Logger::level_color(LogLevel lvl)
{
    if (!g_color)
        return "";

    switch (lvl)
    {
    case LogLevel::DEBUG:
        return "\033[36m"; // Cyan
    case LogLevel::INFO:
        return "\033[32m"; // Green
    case LogLevel::WARN:
        return "\033[33m"; // Yellow
    case LogLevel::ERROR:
        return "\033[31m"; // Red
    }
    return "";
}

void Logger::log(LogLevel lvl, const char *file, int line, const char *fmt, ...)
{
    if (static_cast<int>(lvl) < g_level.load())
        return;

    std::lock_guard<std::mutex> lk(g_mu);

    // 整条拼到栈缓冲后一次写出，避免多线程交错
    std::array<char, 2048> buf{};
    const size_t cap = buf.size();
    size_t pos = 0;

    char ts[64];
    stamp_now(ts, sizeof(ts));
    pos = advance(pos, std::snprintf(buf.data() + pos, cap - pos, "[%s]", ts), cap);

    const char *c = level_color(lvl);
    const char *r = g_color ? "\033[0m" : "";
    pos = advance(pos, std::snprintf(buf.data() + pos, cap - pos, "%s[%s]%s", c, level_str(lvl), r), cap);

    pos = advance(pos, std::snprintf(buf.data() + pos, cap - pos, "[tid:%lu]", current_tid()), cap);
    pos = advance(pos, std::snprintf(buf.data() + pos, cap - pos, "[%s:%d] ", short_file(file), line), cap);

    va_list ap;
    va_start(ap, fmt);
    pos = advance(pos, std::vsnprintf(buf.data() + pos, cap - pos, fmt, ap), cap);
    va_end(ap);

    // 保证每条一行
    if (pos >= cap - 1)
        pos = cap - 2;
    buf[pos++] = '\n';
    buf[pos] = '\0';

    std::fwrite(buf.data(), 1, pos, g_out);
    std::fflush(g_out);
}
