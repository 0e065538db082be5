#ifndef BASALT_CLIENTBOUND_HPP
#define BASALT_CLIENTBOUND_HPP


#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "codec/writebuffer.hpp"
#include "math/uuid.hpp"
#include "network/packet_ids.hpp"
#include "network/protocol_state.hpp"

// Every clientbound packet names its id and the phase it is legal in, and writes its
// fields (not the id) with encode(). Connection::send refuses packets for another phase.

// STATUS

struct StatusResponse
{
    static constexpr int ID = STATUS_RESPONSE;
    static constexpr Phase PHASE = STATUS;

    std::string json;

    void encode(WriteBuffer& wbuf) const;
};

struct PongResponse
{
    static constexpr int ID = STATUS_PONG_RESPONSE;
    static constexpr Phase PHASE = STATUS;

    int64_t payload;

    void encode(WriteBuffer& wbuf) const;
};

// LOGIN

struct LoginDisconnect
{
    static constexpr int ID = LOGIN_DISCONNECT;
    static constexpr Phase PHASE = LOGIN;

    std::string reason;

    void encode(WriteBuffer& wbuf) const;
};

struct EncryptionRequest
{
    static constexpr int ID = LOGIN_ENCRYPTION_REQUEST;
    static constexpr Phase PHASE = LOGIN;

    std::string server_id;
    std::vector<uint8_t> public_key;
    std::vector<uint8_t> verify_token;
    bool should_authenticate;

    void encode(WriteBuffer& wbuf) const;
};

struct LoginSuccess
{
    static constexpr int ID = LOGIN_SUCCESS;
    static constexpr Phase PHASE = LOGIN;

    UUID uuid;
    std::string username;

    void encode(WriteBuffer& wbuf) const;
};

struct SetCompression
{
    static constexpr int ID = LOGIN_SET_COMPRESSION;
    static constexpr Phase PHASE = LOGIN;

    int32_t threshold;

    void encode(WriteBuffer& wbuf) const;
};

// CONFIG

struct ConfigPluginMessage
{
    static constexpr int ID = CONFIG_PLUGIN_MESSAGE;
    static constexpr Phase PHASE = CONFIG;

    std::string channel;
    std::vector<uint8_t> data;

    void encode(WriteBuffer& wbuf) const;
};

struct ConfigDisconnect
{
    static constexpr int ID = CONFIG_DISCONNECT;
    static constexpr Phase PHASE = CONFIG;

    std::string reason;

    void encode(WriteBuffer& wbuf) const;
};

struct FinishConfiguration
{
    static constexpr int ID = CONFIG_FINISH;
    static constexpr Phase PHASE = CONFIG;

    void encode(WriteBuffer& wbuf) const;
};

struct ConfigKeepAlive
{
    static constexpr int ID = CONFIG_KEEP_ALIVE;
    static constexpr Phase PHASE = CONFIG;

    int64_t id;

    void encode(WriteBuffer& wbuf) const;
};

struct FeatureFlags
{
    static constexpr int ID = CONFIG_FEATURE_FLAGS;
    static constexpr Phase PHASE = CONFIG;

    std::vector<std::string> flags;

    void encode(WriteBuffer& wbuf) const;
};

struct KnownPacks
{
    static constexpr int ID = CONFIG_KNOWN_PACKS;
    static constexpr Phase PHASE = CONFIG;

    std::string nspace;
    std::string id;
    std::string version;

    void encode(WriteBuffer& wbuf) const;
};

// PLAY

struct PlayDisconnect
{
    static constexpr int ID = PLAY_DISCONNECT;
    static constexpr Phase PHASE = PLAY;

    std::string reason;

    void encode(WriteBuffer& wbuf) const;
};

struct PlayKeepAlive
{
    static constexpr int ID = PLAY_KEEP_ALIVE;
    static constexpr Phase PHASE = PLAY;

    int64_t id;

    void encode(WriteBuffer& wbuf) const;
};

/**
 * Join game. Only the fields the server varies are exposed.
 */
struct PlayLogin
{
    static constexpr int ID = PLAY_LOGIN;
    static constexpr Phase PHASE = PLAY;

    int32_t entity_id;
    std::string dimension;
    int32_t max_players;
    int32_t view_distance;
    int32_t simulation_distance;
    uint8_t game_mode;

    void encode(WriteBuffer& wbuf) const;
};

#define GAME_EVENT_START_WAITING_FOR_CHUNKS (13)

struct GameEvent
{
    static constexpr int ID = PLAY_GAME_EVENT;
    static constexpr Phase PHASE = PLAY;

    uint8_t event;
    float value;

    void encode(WriteBuffer& wbuf) const;
};

struct SetCenterChunk
{
    static constexpr int ID = PLAY_SET_CENTER_CHUNK;
    static constexpr Phase PHASE = PLAY;

    int32_t x;
    int32_t z;

    void encode(WriteBuffer& wbuf) const;
};

struct ChunkBatchStart
{
    static constexpr int ID = PLAY_CHUNK_BATCH_START;
    static constexpr Phase PHASE = PLAY;

    void encode(WriteBuffer& wbuf) const;
};

struct ChunkBatchFinished
{
    static constexpr int ID = PLAY_CHUNK_BATCH_FINISHED;
    static constexpr Phase PHASE = PLAY;

    int32_t batch_size;

    void encode(WriteBuffer& wbuf) const;
};

/**
 * Chunk column with no heightmaps, block entities or light. data is the column's
 * tag tree in network form, encoded once and shared by every receiver.
 */
struct ChunkData
{
    static constexpr int ID = PLAY_CHUNK_DATA;
    static constexpr Phase PHASE = PLAY;

    int32_t x;
    int32_t z;
    std::shared_ptr<const std::vector<uint8_t>> data;

    void encode(WriteBuffer& wbuf) const;
};

struct UnloadChunk
{
    static constexpr int ID = PLAY_UNLOAD_CHUNK;
    static constexpr Phase PHASE = PLAY;

    int32_t x;
    int32_t z;

    void encode(WriteBuffer& wbuf) const;
};

struct PlayPongResponse
{
    static constexpr int ID = PLAY_PONG_RESPONSE;
    static constexpr Phase PHASE = PLAY;

    int64_t payload;

    void encode(WriteBuffer& wbuf) const;
};

struct SynchronizePosition
{
    static constexpr int ID = PLAY_SYNCHRONIZE_POSITION;
    static constexpr Phase PHASE = PLAY;

    int32_t teleport_id;
    double x;
    double y;
    double z;
    float yaw;
    float pitch;

    void encode(WriteBuffer& wbuf) const;
};


#endif //BASALT_CLIENTBOUND_HPP
