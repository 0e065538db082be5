#include <cmath>
#include <string>
#include "network/serverbound.hpp"
#include "exceptions.hpp"

Intention Intention::decode(ReadBuffer& rbuf)
{
    Intention packet{};
    packet.protocol_version = rbuf.read_varint();
    packet.address = rbuf.read_string(255);
    packet.port = rbuf.read_ushort();
    packet.next_state = rbuf.read_varint();
    return packet;
}

StatusRequest StatusRequest::decode(ReadBuffer&)
{
    return {};
}

PingRequest PingRequest::decode(ReadBuffer& rbuf)
{
    return {rbuf.read_long()};
}

LoginStart LoginStart::decode(ReadBuffer& rbuf)
{
    LoginStart packet{};
    packet.username = rbuf.read_string(16);
    packet.uuid = rbuf.read_uuid();
    return packet;
}

EncryptionResponse EncryptionResponse::decode(ReadBuffer& rbuf)
{
    EncryptionResponse packet{};
    packet.shared_secret = rbuf.read_byte_array(256);
    packet.verify_token = rbuf.read_byte_array(256);
    return packet;
}

LoginPluginResponse LoginPluginResponse::decode(ReadBuffer& rbuf)
{
    LoginPluginResponse packet{};
    packet.message_id = rbuf.read_varint();

    if (rbuf.read_bool())
    {
        if (rbuf.remaining() > MAX_PLUGIN_MESSAGE_LENGTH)
        {
            throw LengthOverflowException("login plugin response of " + std::to_string(rbuf.remaining()) + " bytes");
        }
        packet.data = rbuf.read_remaining();
    }
    return packet;
}

LoginAcknowledged LoginAcknowledged::decode(ReadBuffer&)
{
    return {};
}

CookieResponse CookieResponse::decode(ReadBuffer& rbuf)
{
    CookieResponse packet{};
    packet.key = rbuf.read_string();

    if (rbuf.read_bool())
    {
        packet.payload = rbuf.read_byte_array(MAX_COOKIE_LENGTH);
    }
    return packet;
}

ClientInformation ClientInformation::decode(ReadBuffer& rbuf)
{
    ClientInformation packet{};
    packet.locale = rbuf.read_string(16);
    packet.view_distance = rbuf.read_char();
    packet.chat_mode = rbuf.read_varint();
    packet.chat_colors = rbuf.read_bool();
    packet.skin_parts = rbuf.read_uchar();
    packet.main_hand = rbuf.read_varint();
    packet.text_filtering = rbuf.read_bool();
    packet.allow_server_listings = rbuf.read_bool();
    packet.particle_status = rbuf.read_varint();
    return packet;
}

PluginMessage PluginMessage::decode(ReadBuffer& rbuf)
{
    PluginMessage packet{};
    packet.channel = rbuf.read_string();

    if (rbuf.remaining() > MAX_PLUGIN_MESSAGE_LENGTH)
    {
        throw LengthOverflowException("plugin message of " + std::to_string(rbuf.remaining()) + " bytes");
    }
    packet.data = rbuf.read_remaining();
    return packet;
}

FinishConfigurationAck FinishConfigurationAck::decode(ReadBuffer&)
{
    return {};
}

KeepAliveResponse KeepAliveResponse::decode(ReadBuffer& rbuf)
{
    return {rbuf.read_long()};
}

Pong Pong::decode(ReadBuffer& rbuf)
{
    return {rbuf.read_int()};
}

ResourcePackResponse ResourcePackResponse::decode(ReadBuffer& rbuf)
{
    ResourcePackResponse packet{};
    packet.uuid = rbuf.read_uuid();
    packet.result = rbuf.read_varint();
    return packet;
}

KnownPacksResponse KnownPacksResponse::decode(ReadBuffer& rbuf)
{
    KnownPacksResponse packet{};
    int32_t count = rbuf.read_varint();

    if (count < 0 || count > MAX_KNOWN_PACKS)
    {
        throw LengthOverflowException("known packs count " + std::to_string(count));
    }

    packet.packs.reserve(count);
    for (int32_t i = 0; i < count; ++i)
    {
        KnownPack pack;
        pack.nspace = rbuf.read_string();
        pack.id = rbuf.read_string();
        pack.version = rbuf.read_string();
        packet.packs.push_back(std::move(pack));
    }
    return packet;
}

ConfirmTeleportation ConfirmTeleportation::decode(ReadBuffer& rbuf)
{
    return {rbuf.read_varint()};
}

ChatCommand ChatCommand::decode(ReadBuffer& rbuf)
{
    return {rbuf.read_string()};
}

ChatMessage ChatMessage::decode(ReadBuffer& rbuf)
{
    ChatMessage packet{};
    packet.message = rbuf.read_string(256);
    packet.timestamp = rbuf.read_long();
    packet.salt = rbuf.read_long();

    if (rbuf.read_bool())
    {
        std::vector<uint8_t> signature(CHAT_SIGNATURE_LENGTH);
        rbuf.read_bytes(signature.data(), signature.size());
        packet.signature = std::move(signature);
    }

    packet.message_count = rbuf.read_varint();
    rbuf.read_bytes(packet.acknowledged, sizeof(packet.acknowledged));
    packet.checksum = rbuf.read_uchar();
    return packet;
}

ChunkBatchReceived ChunkBatchReceived::decode(ReadBuffer& rbuf)
{
    return {rbuf.read_float()};
}

ClientStatus ClientStatus::decode(ReadBuffer& rbuf)
{
    return {rbuf.read_varint()};
}

ClientTickEnd ClientTickEnd::decode(ReadBuffer&)
{
    return {};
}

/**
 * @throws ProtocolViolationException unless the value is finite and within MAX_COORDINATE
 */
static double read_coordinate(ReadBuffer& rbuf)
{
    double value = rbuf.read_double();

    if (!std::isfinite(value) || std::fabs(value) > MAX_COORDINATE)
    {
        throw ProtocolViolationException("coordinate " + std::to_string(value) + " is outside the world");
    }
    return value;
}

SetPlayerPosition SetPlayerPosition::decode(ReadBuffer& rbuf)
{
    SetPlayerPosition packet{};
    packet.x = read_coordinate(rbuf);
    packet.y = read_coordinate(rbuf);
    packet.z = read_coordinate(rbuf);
    packet.flags = rbuf.read_uchar();
    return packet;
}

SetPlayerPositionRotation SetPlayerPositionRotation::decode(ReadBuffer& rbuf)
{
    SetPlayerPositionRotation packet{};
    packet.x = read_coordinate(rbuf);
    packet.y = read_coordinate(rbuf);
    packet.z = read_coordinate(rbuf);
    packet.yaw = rbuf.read_float();
    packet.pitch = rbuf.read_float();
    packet.flags = rbuf.read_uchar();
    return packet;
}

SetPlayerRotation SetPlayerRotation::decode(ReadBuffer& rbuf)
{
    SetPlayerRotation packet{};
    packet.yaw = rbuf.read_float();
    packet.pitch = rbuf.read_float();
    packet.flags = rbuf.read_uchar();
    return packet;
}

SetMovementFlags SetMovementFlags::decode(ReadBuffer& rbuf)
{
    return {rbuf.read_uchar()};
}

PlayerAction PlayerAction::decode(ReadBuffer& rbuf)
{
    PlayerAction packet{};
    packet.status = rbuf.read_varint();
    packet.location = rbuf.read_position();
    packet.face = rbuf.read_char();
    packet.sequence = rbuf.read_varint();
    return packet;
}

PlayerLoaded PlayerLoaded::decode(ReadBuffer&)
{
    return {};
}

SetHeldItem SetHeldItem::decode(ReadBuffer& rbuf)
{
    return {rbuf.read_short()};
}

SwingArm SwingArm::decode(ReadBuffer& rbuf)
{
    return {rbuf.read_varint()};
}

UseItemOn UseItemOn::decode(ReadBuffer& rbuf)
{
    UseItemOn packet{};
    packet.hand = rbuf.read_varint();
    packet.location = rbuf.read_position();
    packet.face = rbuf.read_varint();
    packet.cursor_x = rbuf.read_float();
    packet.cursor_y = rbuf.read_float();
    packet.cursor_z = rbuf.read_float();
    packet.inside_block = rbuf.read_bool();
    packet.world_border_hit = rbuf.read_bool();
    packet.sequence = rbuf.read_varint();
    return packet;
}

UseItem UseItem::decode(ReadBuffer& rbuf)
{
    UseItem packet{};
    packet.hand = rbuf.read_varint();
    packet.sequence = rbuf.read_varint();
    packet.yaw = rbuf.read_float();
    packet.pitch = rbuf.read_float();
    return packet;
}
