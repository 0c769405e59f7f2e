#include "common/config.hpp"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace
{
    bool apply_json(const json &j, ServerConfig &cfg, std::string &err)
    {
        if (!j.is_object())
        {
            err = "config root must be an object";
            return false;
        }

        ServerConfig out = cfg;
        out.ip = j.value("ip", out.ip);
        out.port = j.value("port", out.port);
        out.max_clients = j.value("max_clients", out.max_clients);
        out.repo_dir = j.value("repo_dir", out.repo_dir);
        long long chunk = j.value("chunk_size", static_cast<long long>(out.chunk_size));
        out.read_timeout_ms = j.value("read_timeout_ms", out.read_timeout_ms);

        if (j.contains("log_level"))
        {
            std::string lvl = j["log_level"].get<std::string>();
            if (!Logger::parse_level(lvl, out.log_level))
            {
                err = "unknown log_level: " + lvl;
                return false;
            }
        }

        if (out.ip.empty())
        {
            err = "ip must not be empty";
            return false;
        }
        if (out.port < 0 || out.port > 65535)
        {
            err = "port out of range: " + std::to_string(out.port);
            return false;
        }
        if (out.max_clients < 1)
        {
            err = "max_clients must be >= 1";
            return false;
        }
        if (chunk < 1)
        {
            err = "chunk_size must be >= 1";
            return false;
        }
        out.chunk_size = static_cast<size_t>(chunk);
        if (out.read_timeout_ms < 0)
        {
            err = "read_timeout_ms must be >= 0";
            return false;
        }
        if (out.repo_dir.empty())
        {
            err = "repo_dir must not be empty";
            return false;
        }

        cfg = out;
        return true;
    }
} // namespace

bool parse_server_config(const std::string &text, ServerConfig &cfg, std::string &err)
{
    try
    {
        return apply_json(json::parse(text), cfg, err);
    }
    catch (const json::exception &e)
    {
        err = e.what();
        return false;
    }
}

bool load_server_config(const std::string &path, ServerConfig &cfg, std::string &err)
{
    std::ifstream in(path);
    if (!in)
    {
        err = "cannot open config file: " + path;
        return false;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return parse_server_config(ss.str(), cfg, err);
}
