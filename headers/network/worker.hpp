#ifndef BASALT_WORKER_HPP
#define BASALT_WORKER_HPP


#include <cstdint>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>
#include "core/task_pool.hpp"
#include "network/connection.hpp"
#include "network/handler.hpp"

/**
 * One epoll loop owning a set of connections. Everything that happens to those connections
 * (reads, packet handling, writes, chunk delivery, maintenance) runs on the worker's thread;
 * other threads talk to it through a mailbox woken by an eventfd.
 */
class NetworkWorker : public ChunkDispatcher
{
public:
    NetworkWorker(ServerContext& ctx, TaskPool& chunk_pool);

    ~NetworkWorker() override;

    NetworkWorker(const NetworkWorker&) = delete;

    NetworkWorker& operator=(const NetworkWorker&) = delete;

    /**
     * @return false if the epoll instance or the mailbox could not be created.
     */
    [[nodiscard]] inline bool ready() const { return epfd != -1 && mailbox_fd != -1; }

    void start();

    /**
     * Stops the loop and closes every connection. Submitted chunk loads must have finished.
     */
    void stop();

    /**
     * Hands a connected, non-blocking client socket to this worker. Thread safe.
     */
    void assign(int client_fd, uint64_t id);

    /**
     * Asks the loop to run keep-alive and timeout checks. Thread safe.
     */
    void request_maintenance();

    /**
     * Loads the chunk on the chunk pool and posts it back to this worker's mailbox.
     */
    void request_chunk(Connection& connection, const ChunkPosition& pos) override;

    [[nodiscard]] size_t connection_count() const;
private:
    struct Client
    {
        std::unique_ptr<Connection> conn;
        uint32_t interest;
    };

    struct ChunkResult
    {
        uint64_t connection_id;
        ChunkPosition pos;
        ChunkPayload payload;
    };

    void listen(std::stop_token stop);

    void wake();

    void drain_mailbox();

    void add_client(int client_fd, uint64_t id);

    void handle_events(Client& client, uint32_t events);

    /**
     * Flushes, closes the connection if it is done, and otherwise updates its epoll interest.
     */
    void settle(Client& client);

    void close_client(uint64_t id, const char* reason);

    ServerContext& ctx;
    TaskPool& chunk_pool;
    int epfd;
    /**
     * eventfd registered with epoll under id 0.
     */
    int mailbox_fd;

    mutable std::mutex mailbox_mutex;
    std::vector<std::pair<int, uint64_t>> pending_clients;
    std::vector<ChunkResult> pending_chunks;
    bool maintenance_requested;
    size_t client_count;

    std::unordered_map<uint64_t, Client> clients;
    std::jthread runner;
};


#endif //BASALT_WORKER_HPP
