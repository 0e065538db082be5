#ifndef BASALT_SERVERBOUND_HPP
#define BASALT_SERVERBOUND_HPP


#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "codec/readbuffer.hpp"
#include "math/position.hpp"
#include "math/uuid.hpp"

/**
 * Longest plugin message body a client may send.
 */
#define MAX_PLUGIN_MESSAGE_LENGTH (32767)
#define MAX_COOKIE_LENGTH (5120)
#define MAX_KNOWN_PACKS (64)
#define CHAT_SIGNATURE_LENGTH (256)
/**
 * Largest absolute x, y or z a client may report, the edge of the vanilla world border.
 */
#define MAX_COORDINATE (3.0e7)

// Every struct decodes its own fields from a packet body whose id was already consumed.
// Structs used in more than one phase share a layout in each of them.

// HANDSHAKE

struct Intention
{
    int32_t protocol_version;
    std::string address;
    uint16_t port;
    int32_t next_state;

    static Intention decode(ReadBuffer& rbuf);
};

// STATUS

struct StatusRequest
{
    static StatusRequest decode(ReadBuffer& rbuf);
};

/**
 * status 0x01, play 0x24
 */
struct PingRequest
{
    int64_t payload;

    static PingRequest decode(ReadBuffer& rbuf);
};

// LOGIN

struct LoginStart
{
    std::string username;
    UUID uuid;

    static LoginStart decode(ReadBuffer& rbuf);
};

struct EncryptionResponse
{
    std::vector<uint8_t> shared_secret;
    std::vector<uint8_t> verify_token;

    static EncryptionResponse decode(ReadBuffer& rbuf);
};

struct LoginPluginResponse
{
    int32_t message_id;
    std::optional<std::vector<uint8_t>> data;

    static LoginPluginResponse decode(ReadBuffer& rbuf);
};

struct LoginAcknowledged
{
    static LoginAcknowledged decode(ReadBuffer& rbuf);
};

/**
 * login 0x04, config 0x01
 */
struct CookieResponse
{
    std::string key;
    std::optional<std::vector<uint8_t>> payload;

    static CookieResponse decode(ReadBuffer& rbuf);
};

// CONFIG

/**
 * config 0x00, play 0x0C
 */
struct ClientInformation
{
    std::string locale;
    int8_t view_distance;
    int32_t chat_mode;
    bool chat_colors;
    uint8_t skin_parts;
    int32_t main_hand;
    bool text_filtering;
    bool allow_server_listings;
    int32_t particle_status;

    static ClientInformation decode(ReadBuffer& rbuf);
};

/**
 * config 0x02, play 0x14
 */
struct PluginMessage
{
    std::string channel;
    std::vector<uint8_t> data;

    static PluginMessage decode(ReadBuffer& rbuf);
};

struct FinishConfigurationAck
{
    static FinishConfigurationAck decode(ReadBuffer& rbuf);
};

/**
 * config 0x04, play 0x1A
 */
struct KeepAliveResponse
{
    int64_t id;

    static KeepAliveResponse decode(ReadBuffer& rbuf);
};

/**
 * config 0x05, play 0x2B
 */
struct Pong
{
    int32_t id;

    static Pong decode(ReadBuffer& rbuf);
};

struct ResourcePackResponse
{
    UUID uuid;
    int32_t result;

    static ResourcePackResponse decode(ReadBuffer& rbuf);
};

struct KnownPack
{
    std::string nspace;
    std::string id;
    std::string version;
};

struct KnownPacksResponse
{
    std::vector<KnownPack> packs;

    static KnownPacksResponse decode(ReadBuffer& rbuf);
};

// PLAY

struct ConfirmTeleportation
{
    int32_t teleport_id;

    static ConfirmTeleportation decode(ReadBuffer& rbuf);
};

struct ChatCommand
{
    std::string command;

    static ChatCommand decode(ReadBuffer& rbuf);
};

struct ChatMessage
{
    std::string message;
    int64_t timestamp;
    int64_t salt;
    std::optional<std::vector<uint8_t>> signature;
    int32_t message_count;
    uint8_t acknowledged[3];
    uint8_t checksum;

    static ChatMessage decode(ReadBuffer& rbuf);
};

struct ChunkBatchReceived
{
    float chunks_per_tick;

    static ChunkBatchReceived decode(ReadBuffer& rbuf);
};

struct ClientStatus
{
    int32_t action;

    static ClientStatus decode(ReadBuffer& rbuf);
};

struct ClientTickEnd
{
    static ClientTickEnd decode(ReadBuffer& rbuf);
};

struct SetPlayerPosition
{
    double x;
    double y;
    double z;
    uint8_t flags;

    static SetPlayerPosition decode(ReadBuffer& rbuf);
};

struct SetPlayerPositionRotation
{
    double x;
    double y;
    double z;
    float yaw;
    float pitch;
    uint8_t flags;

    static SetPlayerPositionRotation decode(ReadBuffer& rbuf);
};

struct SetPlayerRotation
{
    float yaw;
    float pitch;
    uint8_t flags;

    static SetPlayerRotation decode(ReadBuffer& rbuf);
};

struct SetMovementFlags
{
    uint8_t flags;

    static SetMovementFlags decode(ReadBuffer& rbuf);
};

struct PlayerAction
{
    int32_t status;
    BlockPosition location;
    int8_t face;
    int32_t sequence;

    static PlayerAction decode(ReadBuffer& rbuf);
};

struct PlayerLoaded
{
    static PlayerLoaded decode(ReadBuffer& rbuf);
};

struct SetHeldItem
{
    int16_t slot;

    static SetHeldItem decode(ReadBuffer& rbuf);
};

struct SwingArm
{
    int32_t hand;

    static SwingArm decode(ReadBuffer& rbuf);
};

struct UseItemOn
{
    int32_t hand;
    BlockPosition location;
    int32_t face;
    float cursor_x;
    float cursor_y;
    float cursor_z;
    bool inside_block;
    bool world_border_hit;
    int32_t sequence;

    static UseItemOn decode(ReadBuffer& rbuf);
};

struct UseItem
{
    int32_t hand;
    int32_t sequence;
    float yaw;
    float pitch;

    static UseItem decode(ReadBuffer& rbuf);
};

using ServerboundPacket = std::variant<
        Intention,
        StatusRequest,
        PingRequest,
        LoginStart,
        EncryptionResponse,
        LoginPluginResponse,
        LoginAcknowledged,
        CookieResponse,
        ClientInformation,
        PluginMessage,
        FinishConfigurationAck,
        KeepAliveResponse,
        Pong,
        ResourcePackResponse,
        KnownPacksResponse,
        ConfirmTeleportation,
        ChatCommand,
        ChatMessage,
        ChunkBatchReceived,
        ClientStatus,
        ClientTickEnd,
        SetPlayerPosition,
        SetPlayerPositionRotation,
        SetPlayerRotation,
        SetMovementFlags,
        PlayerAction,
        PlayerLoaded,
        SetHeldItem,
        SwingArm,
        UseItemOn,
        UseItem>;


#endif //BASALT_SERVERBOUND_HPP
