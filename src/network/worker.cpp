#include <cerrno>
#include <cstring>
#include <exception>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>
#include "network/worker.hpp"
#include "exceptions.hpp"

// How many events an epoll_wait can handle at once.
#define MAX_EVENTS (128)
#define MAILBOX_ID (0)

NetworkWorker::NetworkWorker(ServerContext& ctx, TaskPool& chunk_pool) : ctx(ctx),
                                                                         chunk_pool(chunk_pool),
                                                                         epfd(epoll_create1(0)),
                                                                         mailbox_fd(eventfd(0, EFD_NONBLOCK)),
                                                                         maintenance_requested(false),
                                                                         client_count(0)
{
    if (epfd == -1)
    {
        logger().err("NetworkWorker: epoll_create1(): %s", strerror(errno));
        return;
    }
    if (mailbox_fd == -1)
    {
        logger().err("NetworkWorker: eventfd(): %s", strerror(errno));
        return;
    }

    epoll_event event{};
    event.data.u64 = MAILBOX_ID;
    event.events = EPOLLIN;

    if (epoll_ctl(epfd, EPOLL_CTL_ADD, mailbox_fd, &event) == -1)
    {
        logger().err("NetworkWorker: epoll_ctl(): EPOLL_CTL_ADD mailbox: %s", strerror(errno));
        close(mailbox_fd);
        mailbox_fd = -1;
    }
}

NetworkWorker::~NetworkWorker()
{
    stop();

    if (mailbox_fd != -1)
    {
        close(mailbox_fd);
    }
    if (epfd != -1)
    {
        close(epfd);
    }
}

void NetworkWorker::start()
{
    runner = std::jthread([this](std::stop_token stop) { listen(stop); });
}

void NetworkWorker::stop()
{
    if (runner.joinable())
    {
        runner.request_stop();
        wake();
        runner.join();
    }

    for (auto& [id, client] : clients)
    {
        connection_closed(*client.conn, ctx);
    }
    clients.clear();

    std::lock_guard<std::mutex> lock(mailbox_mutex);
    for (auto& [fd, id] : pending_clients)
    {
        close(fd);
    }
    pending_clients.clear();
    pending_chunks.clear();
    client_count = 0;
}

void NetworkWorker::wake()
{
    uint64_t u = 1;

    if (write(mailbox_fd, &u, sizeof(u)) == -1 && errno != EAGAIN)
    {
        logger().err("NetworkWorker::wake(): write(): %s", strerror(errno));
    }
}

void NetworkWorker::assign(int client_fd, uint64_t id)
{
    {
        std::lock_guard<std::mutex> lock(mailbox_mutex);
        pending_clients.emplace_back(client_fd, id);
        ++client_count;
    }
    wake();
}

void NetworkWorker::request_maintenance()
{
    {
        std::lock_guard<std::mutex> lock(mailbox_mutex);
        maintenance_requested = true;
    }
    wake();
}

size_t NetworkWorker::connection_count() const
{
    std::lock_guard<std::mutex> lock(mailbox_mutex);
    return client_count;
}

void NetworkWorker::request_chunk(Connection& connection, const ChunkPosition& pos)
{
    uint64_t id = connection.id();

    bool submitted = chunk_pool.submit([this, id, pos](std::stop_token) {
        ChunkPayload payload;

        try
        {
            payload = ctx.world.request_chunk(pos);
        } catch (const std::exception& e)
        {
            // the player just does not get this chunk, a null payload is skipped on delivery
            logger().err("Loading chunk %s failed: %s", pos.to_string().c_str(), e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mailbox_mutex);
            pending_chunks.push_back({id, pos, std::move(payload)});
        }
        wake();
    });

    if (!submitted)
    {
        debug(logger().info("Chunk pool is stopping, dropped request for %s", pos.to_string().c_str());)
    }
}

void NetworkWorker::add_client(int client_fd, uint64_t id)
{
    FrameSettings settings;
    settings.max_frame_length = ctx.config.max_frame_length;

    Client client{std::make_unique<Connection>(client_fd, id, settings), EPOLLIN | EPOLLRDHUP};

    epoll_event event{};
    event.data.u64 = id;
    event.events = client.interest;

    // add the client to the epoll's interest list
    if (epoll_ctl(epfd, EPOLL_CTL_ADD, client_fd, &event) == -1)
    {
        logger().err("NetworkWorker: epoll_ctl(): EPOLL_CTL_ADD %i: %s", client_fd, strerror(errno));
        std::lock_guard<std::mutex> lock(mailbox_mutex);
        --client_count;
        // the connection's destructor closes the fd
        return;
    }

    clients.emplace(id, std::move(client));
}

void NetworkWorker::close_client(uint64_t id, const char* reason)
{
    auto it = clients.find(id);

    if (it == clients.end())
    {
        return;
    }

    logger().info("Connection %llu closed: %s", static_cast<unsigned long long>(id), reason);
    connection_closed(*it->second.conn, ctx);
    clients.erase(it);

    std::lock_guard<std::mutex> lock(mailbox_mutex);
    --client_count;
}

void NetworkWorker::settle(Client& client)
{
    Connection& conn = *client.conn;

    if (!conn.flush())
    {
        close_client(conn.id(), "write failed");
        return;
    }

    if (conn.closing_after_flush() && !conn.wants_write())
    {
        close_client(conn.id(), "done");
        return;
    }

    uint32_t interest = EPOLLRDHUP;

    // stop reading while the peer is not keeping up with what we send
    if (conn.queued_bytes() <= ctx.config.outbound_queue_limit && !conn.closing_after_flush())
    {
        interest |= EPOLLIN;
    }
    if (conn.wants_write())
    {
        interest |= EPOLLOUT;
    }

    if (interest != client.interest)
    {
        epoll_event event{};
        event.data.u64 = conn.id();
        event.events = interest;

        if (epoll_ctl(epfd, EPOLL_CTL_MOD, conn.fd, &event) == -1)
        {
            logger().err("NetworkWorker: epoll_ctl(): EPOLL_CTL_MOD %i: %s", conn.fd, strerror(errno));
            close_client(conn.id(), "epoll failure");
            return;
        }
        client.interest = interest;
    }
}

void NetworkWorker::handle_events(Client& client, uint32_t events)
{
    Connection& conn = *client.conn;
    uint64_t id = conn.id();

    try
    {
        if (events & EPOLLERR)
        {
            close_client(id, "socket error");
            return;
        }

        if (events & (EPOLLIN | EPOLLRDHUP | EPOLLHUP))
        {
            bool open = conn.receive();

            // whatever arrived before the peer hung up is still handled
            process_packets(conn, ctx, *this);

            if (!open)
            {
                close_client(id, "end of stream");
                return;
            }
        }

        settle(client);
    } catch (const DecodeException& e)
    {
        logger().warn("Connection %llu: %s", static_cast<unsigned long long>(id), e.what());
        close_client(id, "protocol error");
    } catch (const BasaltException& e)
    {
        logger().err("Connection %llu: %s", static_cast<unsigned long long>(id), e.what());
        close_client(id, "internal error");
    }
}

void NetworkWorker::drain_mailbox()
{
    uint64_t u;
    std::vector<std::pair<int, uint64_t>> new_clients;
    std::vector<ChunkResult> chunks;
    bool maintenance;

    if (read(mailbox_fd, &u, sizeof(u)) == -1 && errno != EAGAIN)
    {
        logger().err("NetworkWorker: read(): mailbox: %s", strerror(errno));
    }

    {
        std::lock_guard<std::mutex> lock(mailbox_mutex);
        new_clients.swap(pending_clients);
        chunks.swap(pending_chunks);
        maintenance = maintenance_requested;
        maintenance_requested = false;
    }

    for (auto& [fd, id] : new_clients)
    {
        add_client(fd, id);
    }

    // one batch per connection
    std::unordered_map<uint64_t, std::vector<std::pair<ChunkPosition, ChunkPayload>>> batches;
    for (auto& result : chunks)
    {
        batches[result.connection_id].emplace_back(std::move(result.pos), std::move(result.payload));
    }

    for (auto& [id, batch] : batches)
    {
        auto it = clients.find(id);

        // the connection closed while its chunks loaded
        if (it != clients.end())
        {
            deliver_chunks(*it->second.conn, batch);
            settle(it->second);
        }
    }

    if (maintenance)
    {
        Clock::time_point now = Clock::now();
        std::vector<uint64_t> ids;

        ids.reserve(clients.size());
        for (auto& [id, client] : clients)
        {
            ids.push_back(id);
        }

        // settle() may close connections, so look each one up again
        for (uint64_t id : ids)
        {
            auto it = clients.find(id);

            if (it == clients.end())
            {
                continue;
            }
            if (!run_maintenance(*it->second.conn, ctx, now))
            {
                close_client(id, "timed out");
            } else
            {
                settle(it->second);
            }
        }
    }
}

void NetworkWorker::listen(std::stop_token stop)
{
    epoll_event events[MAX_EVENTS];
    int nfds;

    while (!stop.stop_requested())
    {
        nfds = epoll_wait(epfd, events, MAX_EVENTS, -1);

        if (nfds == -1)
        {
            if (errno != EINTR)
            {
                logger().err("NetworkWorker::listen(): epoll_wait(): %s", strerror(errno));
            }
            continue;
        }

        for (int i = 0; i < nfds && !stop.stop_requested(); ++i)
        {
            uint64_t id = events[i].data.u64;

            if (id == MAILBOX_ID)
            {
                drain_mailbox();
                continue;
            }

            // an earlier event in this batch may have closed it
            auto it = clients.find(id);
            if (it != clients.end())
            {
                handle_events(it->second, events[i].events);
            }
        }
    }
}
