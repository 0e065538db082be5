#include <atomic>
#include <cerrno>
#include <cstring>
#include <memory>
#include <thread>
#include <vector>
#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>
#include "network/tcpserver.hpp"
#include "basaltutil.hpp"
#include "loggerimpl.hpp"
#include "network/worker.hpp"

#define LISTEN_BACKLOG (128)

static std::thread runner;
static std::atomic<bool> accepting{false};

static std::vector<std::unique_ptr<NetworkWorker>> workers;
static size_t next_index = 0;
/**
 * Connection ids start at 1, 0 is the workers' mailbox.
 */
static std::atomic<uint64_t> next_id{1};

static int server_fd = -1;

bool tcp_init(const ServerConfig& config, ServerContext& ctx, TaskPool& chunk_pool)
{
    /* Setup our network environment, */
    server_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd == -1)
    {
        logger().err("tcp_init(): socket(): %s", strerror(errno));
        return false;
    }

    int opt = 1;
    if (setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) == -1)
    {
        logger().err("tcp_init(): setsockopt(): SO_REUSEADDR: %s", strerror(errno));
        return false;
    }

    sockaddr_in server_addr{};
    server_addr.sin_family = AF_INET;
    server_addr.sin_port = htons(config.server_port);

    if (inet_pton(AF_INET, config.server_ip.c_str(), &server_addr.sin_addr) != 1)
    {
        logger().err("tcp_init(): invalid server-ip %s", config.server_ip.c_str());
        return false;
    }

    if (bind(server_fd, (sockaddr*) &server_addr, sizeof(server_addr)) == -1)
    {
        logger().err("tcp_init(): bind(): %s", strerror(errno));
        return false;
    }

    /* await incoming client connections */
    if (listen(server_fd, LISTEN_BACKLOG) == -1)
    {
        logger().err("tcp_init(): listen(): %s", strerror(errno));
        return false;
    }

    size_t count = config.network_workers;
    if (count == 0)
    {
        count = std::thread::hardware_concurrency();
        count = count == 0 ? 1 : count;
    }

    for (size_t i = 0; i < count; ++i)
    {
        workers.push_back(std::make_unique<NetworkWorker>(ctx, chunk_pool));

        if (!workers.back()->ready())
        {
            workers.clear();
            return false;
        }
    }

    logger().info("Listening on %s:%u with %zu network workers", config.server_ip.c_str(), config.server_port, count);
    return true; /* Network is set up and ready to run. */
}

static NetworkWorker& next_worker()
{
    NetworkWorker& worker = *workers[next_index];
    next_index = (next_index + 1) % workers.size();
    return worker;
}

static inline bool configure_fd(int client_fd)
{
    int opt = 1;
    int flags = fcntl(client_fd, F_GETFL, 0);

    // set the client to nonblocking for the worker
    if (flags == -1 || fcntl(client_fd, F_SETFL, flags | O_NONBLOCK) == -1)
    {
        logger().err("configure_fd(%i): fcntl(): %s", client_fd, strerror(errno));
        return false;
    }

    if (setsockopt(client_fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt)))
    {
        logger().warn("configure_fd(%i): setsockopt(): TCP_NODELAY: %s", client_fd, strerror(errno));
    }
    return true;
}

static void accept_connections()
{
    int client_fd;

    sockaddr_in client_addr{};
    socklen_t client_len;

    while (accepting)
    {
        client_len = sizeof(client_addr);
        // This blocks until a client attempts to connect
        client_fd = accept(server_fd, (sockaddr*) &client_addr, &client_len);

        if (client_fd == -1)
        {
            // If the server is shutting down, we don't have to error.
            if (accepting && errno != EINTR)
            {
                logger().err("accept_connections(): accept(): %s", strerror(errno));
            }
            continue;
        }

        if (!configure_fd(client_fd))
        {
            close(client_fd);
            continue;
        }

        uint64_t id = next_id++;
        debug(logger().info("[ + ]: /%s:%u (%llu)", inet_ntoa(client_addr.sin_addr), ntohs(client_addr.sin_port),
                            static_cast<unsigned long long>(id));)
        next_worker().assign(client_fd, id);
    }
}

void tcp_start()
{
    for (auto& worker : workers)
    {
        worker->start();
    }

    accepting = true;
    runner = std::thread(accept_connections);
}

void tcp_stop()
{
    accepting = false;

    if (server_fd != -1)
    {
        // stop new connections from coming in, this also wakes accept()
        shutdown(server_fd, SHUT_RDWR);
    }

    if (runner.joinable())
    {
        runner.join();
    }

    if (server_fd != -1)
    {
        close(server_fd);
        server_fd = -1;
    }

    for (auto& worker : workers)
    {
        worker->stop();
    }
}

void tcp_maintenance()
{
    for (auto& worker : workers)
    {
        worker->request_maintenance();
    }
}

size_t tcp_connection_count()
{
    size_t count = 0;

    for (auto& worker : workers)
    {
        count += worker->connection_count();
    }
    return count;
}
