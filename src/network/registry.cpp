#include "network/registry.hpp"
#include "network/packet_ids.hpp"
#include "exceptions.hpp"

template<typename Packet>
static ServerboundPacket decode_as(ReadBuffer& rbuf)
{
    return Packet::decode(rbuf);
}

#define ENTRY(name, type) {name, decode_as<type>}
#define NONE {nullptr, nullptr}

static const PacketEntry handshaking[0x1] = {
        ENTRY("intention", Intention)
};

static const PacketEntry status[0x2] = {
        ENTRY("status_request", StatusRequest),
        ENTRY("ping_request", PingRequest)
};

// once the status response went out only the ping is left
static const PacketEntry status_complete[0x2] = {
        NONE,
        ENTRY("ping_request", PingRequest)
};

static const PacketEntry login[0x5] = {
        ENTRY("login_start", LoginStart),
        ENTRY("encryption_response", EncryptionResponse),
        ENTRY("login_plugin_response", LoginPluginResponse),
        ENTRY("login_acknowledged", LoginAcknowledged),
        ENTRY("cookie_response", CookieResponse)
};

static const PacketEntry config[0x8] = {
        ENTRY("client_information", ClientInformation),
        ENTRY("cookie_response", CookieResponse),
        ENTRY("plugin_message", PluginMessage),
        ENTRY("acknowledge_finish_config", FinishConfigurationAck),
        ENTRY("keep_alive", KeepAliveResponse),
        ENTRY("pong", Pong),
        ENTRY("resource_pack_response", ResourcePackResponse),
        ENTRY("known_packs", KnownPacksResponse)
};

static const PacketEntry play[0x40] = {
        ENTRY("confirm_teleportation", ConfirmTeleportation), // 0x00
        NONE, // query block entity tag
        NONE, // bundle item selected
        NONE, // change difficulty
        NONE, // acknowledge message
        ENTRY("chat_command", ChatCommand), // 0x05
        NONE, // signed chat command
        ENTRY("chat_message", ChatMessage), // 0x07
        NONE, // player session
        ENTRY("chunk_batch_received", ChunkBatchReceived), // 0x09
        ENTRY("client_status", ClientStatus), // 0x0A
        ENTRY("client_tick_end", ClientTickEnd), // 0x0B
        ENTRY("client_information", ClientInformation), // 0x0C
        NONE, // command suggestions request
        NONE, // acknowledge configuration
        NONE, // click container button
        NONE, // click container
        NONE, // close container
        NONE, // change container slot state
        NONE, // cookie response
        ENTRY("plugin_message", PluginMessage), // 0x14
        NONE, // debug sample subscription
        NONE, // edit book
        NONE, // query entity tag
        NONE, // interact
        NONE, // jigsaw generate
        ENTRY("keep_alive", KeepAliveResponse), // 0x1A
        NONE, // lock difficulty
        ENTRY("set_player_position", SetPlayerPosition), // 0x1C
        ENTRY("set_player_position_rotation", SetPlayerPositionRotation), // 0x1D
        ENTRY("set_player_rotation", SetPlayerRotation), // 0x1E
        ENTRY("set_player_movement_flags", SetMovementFlags), // 0x1F
        NONE, // move vehicle
        NONE, // paddle boat
        NONE, // pick item from block
        NONE, // pick item from entity
        ENTRY("ping_request", PingRequest), // 0x24
        NONE, // place recipe
        NONE, // player abilities
        ENTRY("player_action", PlayerAction), // 0x27
        NONE, // player command
        NONE, // player input
        ENTRY("player_loaded", PlayerLoaded), // 0x2A
        ENTRY("pong", Pong), // 0x2B
        NONE, // change recipe book settings
        NONE, // set seen recipe
        NONE, // rename item
        NONE, // resource pack response
        NONE, // seen advancements
        NONE, // select trade
        NONE, // set beacon effect
        ENTRY("set_held_item", SetHeldItem), // 0x33
        NONE, // program command block
        NONE, // program command block minecart
        NONE, // set creative mode slot
        NONE, // program jigsaw block
        NONE, // program structure block
        NONE, // set test block
        NONE, // update sign
        ENTRY("swing_arm", SwingArm), // 0x3B
        NONE, // teleport to entity
        NONE, // test instance block action
        ENTRY("use_item_on", UseItemOn), // 0x3E
        ENTRY("use_item", UseItem) // 0x3F
};

struct PacketTable
{
    const PacketEntry* entries;
    size_t size;
};

#define TABLE(array) {array, sizeof(array) / sizeof(PacketEntry)}

// indexed by Phase
static const PacketTable tables[PHASE_COUNT] = {
        TABLE(handshaking),
        TABLE(status),
        TABLE(status_complete),
        TABLE(login),
        TABLE(config),
        TABLE(play),
        {nullptr, 0}
};

const PacketEntry* lookup_packet(Phase phase, int32_t id)
{
    const PacketTable& table = tables[phase];

    if (id < 0 || static_cast<size_t>(id) >= table.size || !table.entries[id].decode)
    {
        return nullptr;
    }
    return &table.entries[id];
}

size_t packet_table_size(Phase phase)
{
    return tables[phase].size;
}

DecodedPacket decode_packet(Phase phase, const std::vector<uint8_t>& payload, int32_t max_string_length)
{
    ReadBuffer rbuf(payload);
    rbuf.limit_strings(max_string_length);
    int32_t id = rbuf.read_varint();
    const PacketEntry* entry = lookup_packet(phase, id);

    if (!entry)
    {
        throw UnknownPacketException(phase, id);
    }

    DecodedPacket decoded{id, entry->name, entry->decode(rbuf)};
    rbuf.expect_end();
    return decoded;
}
