#include <csignal>
#include <cstdlib>
#include <string>

#include "common/logger.hpp"
#include "common/config.hpp"
#include "file/file_catalog.hpp"
#include "core/server.hpp"

static FileChatServer *g_server = nullptr;

static void handle_signal(int)
{
    if (g_server)
        g_server->stop();
}

// 用法: filechat_server [config.json]
int main(int argc, char **argv)
{
    Logger::init(LogLevel::INFO);

    ServerConfig cfg;
    if (argc > 2)
    {
        LOG_ERROR("usage: %s [config.json]", argv[0]);
        return EXIT_FAILURE;
    }
    if (argc == 2)
    {
        std::string err;
        if (!load_server_config(argv[1], cfg, err))
        {
            LOG_ERROR("bad config %s: %s", argv[1], err.c_str());
            return EXIT_FAILURE;
        }
    }
    Logger::set_level(cfg.log_level);

    FileCatalog catalog(cfg.repo_dir);
    if (!catalog.init())
    {
        LOG_ERROR("FileCatalog init failed");
        return EXIT_FAILURE;
    }

    FileChatServer server(cfg, catalog);
    g_server = &server;

    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    if (!server.start())
    {
        LOG_ERROR("Server start failed.");
        return EXIT_FAILURE;
    }
    LOG_INFO("Press Ctrl+C to shut down");

    // 阻塞直到 stop()
    server.run();

    g_server = nullptr;
    LOG_INFO("Server exited. Bye.");
    return EXIT_SUCCESS;
}
