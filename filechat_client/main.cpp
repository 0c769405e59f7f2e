#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>
#include <unistd.h>

#include "common/logger.hpp"
#include "client/chat_client.hpp"

static void usage(const char *prog)
{
    std::fprintf(stderr,
                 "usage: %s [-h host] [-p port] [-d downloads_dir] [-v] command...\n"
                 "  commands: status | list | \"get <file>\" | exit | any text\n",
                 prog);
}

int main(int argc, char **argv)
{
    Logger::init(LogLevel::WARN);
    std::signal(SIGPIPE, SIG_IGN);

    ClientConfig cfg;
    int opt;
    while ((opt = getopt(argc, argv, "h:p:d:v")) != -1)
    {
        switch (opt)
        {
        case 'h':
            cfg.host = optarg;
            break;
        case 'p':
            cfg.port = std::atoi(optarg);
            break;
        case 'd':
            cfg.downloads_dir = optarg;
            break;
        case 'v':
            Logger::set_level(LogLevel::DEBUG);
            break;
        default:
            usage(argv[0]);
            return EXIT_FAILURE;
        }
    }
    if (cfg.port <= 0 || cfg.port > 65535)
    {
        std::fprintf(stderr, "invalid port\n");
        return EXIT_FAILURE;
    }

    std::vector<std::string> commands(argv + optind, argv + argc);
    if (commands.empty())
    {
        usage(argv[0]);
        return EXIT_FAILURE;
    }

    FileChatClient client(cfg);
    if (!client.connect())
    {
        std::fprintf(stderr, "[ERROR] %s\n", client.error().c_str());
        return EXIT_FAILURE;
    }
    if (!client.handshake())
    {
        std::fprintf(stderr, "[ERROR] %s\n", client.error().c_str());
        return EXIT_FAILURE;
    }
    std::printf("[INFO] Connected to server as %s\n%s\n", client.name().c_str(), client.hello().c_str());

    bool said_exit = false;
    int rc = EXIT_SUCCESS;
    for (const auto &cmd : commands)
    {
        if (cmd.empty())
            continue;
        Reply reply;
        bool ok = client.request(cmd, reply);

        if (reply.kind == Reply::Kind::File)
        {
            if (ok)
                std::printf("[DOWNLOADED] %s -> %s (%llu bytes)\n", reply.transfer.filename.c_str(),
                            reply.transfer.path.c_str(), (unsigned long long)reply.transfer.received);
            else
                std::fprintf(stderr, "[ERROR] Receiving file failed: %s\n", status_str(reply.transfer.status));
        }
        else
        {
            for (const auto &l : reply.lines)
                std::printf("%s\n", l.c_str());
        }

        if (!ok)
        {
            if (reply.kind == Reply::Kind::Closed)
                std::printf("[INFO] Server closed connection.\n");
            rc = EXIT_FAILURE;
            break;
        }
        if (cmd == "exit")
        {
            said_exit = true;
            break;
        }
    }

    if (!said_exit && client.connected())
    {
        Reply bye;
        if (!client.request("exit", bye))
            LOG_DEBUG("no BYE from server");
    }
    return rc;
}
