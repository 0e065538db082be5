#ifndef BASALT_HANDLER_HPP
#define BASALT_HANDLER_HPP


#include <atomic>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "config.hpp"
#include "network/cipher.hpp"
#include "network/connection.hpp"
#include "world/command.hpp"
#include "world/world.hpp"

/**
 * Where a connection's chunk requests go. Results come back through deliver_chunks() on the
 * connection's own worker thread.
 */
class ChunkDispatcher
{
public:
    virtual ~ChunkDispatcher() = default;

    virtual void request_chunk(Connection& connection, const ChunkPosition& pos) = 0;
};

/**
 * Everything the packet handlers need besides the connection itself. Shared by every worker.
 */
struct ServerContext
{
    /**
     * @param keys RSA key pair for the encryption handshake, or nullptr to skip encryption.
     */
    ServerContext(const ServerConfig& config, World& world, CommandSink& commands, const KeyPair* keys);

    const ServerConfig& config;
    World& world;
    CommandSink& commands;
    const KeyPair* keys;
    /**
     * data: URL sent in status responses, empty for none.
     */
    std::string favicon;
    std::atomic<int> online_players{0};
    std::atomic<int32_t> next_entity_id{1};
};

/**
 * Decodes and handles every complete packet the connection has buffered, in arrival order.
 * Stops early once the connection is closing. Chunks the player needs are requested from chunks.
 * @throws DecodeException if the peer broke the protocol. The connection is CLOSED by then and the caller drops it.
 */
void process_packets(Connection& conn, ServerContext& ctx, ChunkDispatcher& chunks);

/**
 * Sends the chunks that are still in the player's view as one chunk batch.
 * A null payload marks a failed load; that chunk is untracked so it is requested again later.
 */
void deliver_chunks(Connection& conn, const std::vector<std::pair<ChunkPosition, ChunkPayload>>& chunks);

/**
 * Read timeout and keep-alive bookkeeping, run about once a second per connection.
 * @return false if the connection has timed out and should be closed.
 */
bool run_maintenance(Connection& conn, ServerContext& ctx, Clock::time_point now);

/**
 * Releases what the connection held in the shared context. Call once, before destroying it.
 */
void connection_closed(Connection& conn, ServerContext& ctx);


#endif //BASALT_HANDLER_HPP
