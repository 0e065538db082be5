#ifndef BASALT_TEST_UTIL_HPP
#define BASALT_TEST_UTIL_HPP


#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "config.hpp"
#include "codec/readbuffer.hpp"
#include "codec/writebuffer.hpp"
#include "network/cipher.hpp"
#include "network/connection.hpp"
#include "network/frame.hpp"
#include "network/handler.hpp"
#include "storage/chunk_store.hpp"
#include "world/chunk_cache.hpp"
#include "world/chunk_generator.hpp"
#include "world/command.hpp"
#include "world/world.hpp"

/**
 * Fresh directory under /tmp, removed with everything in it on destruction.
 */
class TempDir
{
public:
    TempDir();

    ~TempDir();

    TempDir(const TempDir&) = delete;

    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] inline const std::string& path() const { return dir; }

    [[nodiscard]] inline std::string file(const std::string& name) const { return dir + "/" + name; }
private:
    std::string dir;
};

void write_file(const std::string& path, const std::vector<uint8_t>& bytes);

std::vector<uint8_t> read_file(const std::string& path);

struct SocketPair
{
    /**
     * Non-blocking, handed to a Connection.
     */
    int server;
    /**
     * Blocking with a receive timeout, driven by TestClient.
     */
    int client;
};

SocketPair make_socket_pair();

struct ReceivedPacket
{
    int32_t id;
    std::vector<uint8_t> body;
};

/**
 * The client end of a socket pair, speaking the framed protocol the same way a game client does.
 */
class TestClient
{
public:
    explicit TestClient(int fd);

    ~TestClient();

    TestClient(const TestClient&) = delete;

    TestClient& operator=(const TestClient&) = delete;

    void send(int32_t id, const std::function<void(WriteBuffer&)>& fields);

    /**
     * @return The next packet, or nothing if none arrived within the receive timeout.
     */
    std::optional<ReceivedPacket> receive();

    /**
     * Reads the next packet and fails the current test if its id is not the expected one.
     */
    ReceivedPacket expect(int32_t id);

    /**
     * @return True if the server closed its end and nothing is left to read.
     */
    bool at_eof();

    /**
     * @return True if nothing has been sent that was not read yet. Never waits.
     */
    bool idle();

    inline void enable_compression(int threshold) { settings.compression_threshold = threshold; }

    void enable_encryption(const std::vector<uint8_t>& secret);

    // serverbound packets used across the connection tests

    void handshake(int32_t protocol, int32_t next_state);

    void login_start(const std::string& name);

    void client_information(int8_t view_distance);

    void known_packs();

    void set_position(double x, double y, double z);

    void keep_alive(Phase phase, int64_t id);
private:
    int fd;
    FrameSettings settings;
    FrameDecoder decoder;
    std::unique_ptr<StreamCipher> encryptor;
    std::unique_ptr<StreamCipher> decryptor;
};

/**
 * Collects chunk requests and answers them when the test asks, on the test's thread.
 */
class InlineDispatcher : public ChunkDispatcher
{
public:
    void request_chunk(Connection& connection, const ChunkPosition& pos) override;

    /**
     * Loads every pending request of the connection through the world and delivers them as one batch.
     * @return Number of chunks loaded.
     */
    size_t deliver(Connection& connection, World& world);

    [[nodiscard]] inline size_t pending() const { return requests.size(); }

    [[nodiscard]] inline const std::vector<ChunkPosition>& history() const { return requested; }
private:
    std::vector<std::pair<uint64_t, ChunkPosition>> requests;
    std::vector<ChunkPosition> requested;
};

class RecordingCommandSink : public CommandSink
{
public:
    void submit_decoded_command(Connection& connection, const Command& command) override;

    std::vector<int> packet_ids;
};

/**
 * A store, cache, world and server context on a temporary directory.
 */
struct ServerFixture
{
    explicit ServerFixture(const KeyPair* keys = nullptr);

    TempDir dir;
    ServerConfig config;
    ChunkStore store;
    ChunkCache cache;
    FlatChunkGenerator generator;
    World world;
    RecordingCommandSink commands;
    ServerContext ctx;
    InlineDispatcher dispatcher;

    /**
     * Reads what the client sent, handles it and writes the replies.
     */
    void pump(Connection& conn);
};

/**
 * Drives a fresh connection through login and configuration into play.
 */
void join(ServerFixture& fx, Connection& conn, TestClient& client, const std::string& name = "Steve");


#endif //BASALT_TEST_UTIL_HPP
