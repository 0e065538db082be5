#include "network/clientbound.hpp"
#include "network/status.hpp"
#include "nbt/nbt_io.hpp"

/**
 * Text components are sent as a nameless string tag since 1.20.3.
 */
static void write_text_component(WriteBuffer& wbuf, const std::string& text)
{
    write_network_tag(wbuf, Tag::of_string(text));
}

void StatusResponse::encode(WriteBuffer& wbuf) const
{
    wbuf.write_string(json);
}

void PongResponse::encode(WriteBuffer& wbuf) const
{
    wbuf.write_long(payload);
}

void LoginDisconnect::encode(WriteBuffer& wbuf) const
{
    // login is the only phase that still takes a JSON text component
    wbuf.write_string("{\"text\":\"" + json_escape(reason) + "\"}");
}

void EncryptionRequest::encode(WriteBuffer& wbuf) const
{
    wbuf.write_string(server_id);
    wbuf.write_byte_array(public_key);
    wbuf.write_byte_array(verify_token);
    wbuf.write_bool(should_authenticate);
}

void LoginSuccess::encode(WriteBuffer& wbuf) const
{
    wbuf.write_uuid(uuid);
    wbuf.write_string(username);
    // no profile properties
    wbuf.write_varint(0);
}

void SetCompression::encode(WriteBuffer& wbuf) const
{
    wbuf.write_varint(threshold);
}

void ConfigPluginMessage::encode(WriteBuffer& wbuf) const
{
    wbuf.write_string(channel);
    wbuf.write_bytes(data);
}

void ConfigDisconnect::encode(WriteBuffer& wbuf) const
{
    write_text_component(wbuf, reason);
}

void FinishConfiguration::encode(WriteBuffer&) const
{}

void ConfigKeepAlive::encode(WriteBuffer& wbuf) const
{
    wbuf.write_long(id);
}

void FeatureFlags::encode(WriteBuffer& wbuf) const
{
    wbuf.write_varint(static_cast<int32_t>(flags.size()));

    for (const auto& flag : flags)
    {
        wbuf.write_string(flag);
    }
}

void KnownPacks::encode(WriteBuffer& wbuf) const
{
    wbuf.write_varint(1);
    wbuf.write_string(nspace);
    wbuf.write_string(id);
    wbuf.write_string(version);
}

void PlayDisconnect::encode(WriteBuffer& wbuf) const
{
    write_text_component(wbuf, reason);
}

void PlayKeepAlive::encode(WriteBuffer& wbuf) const
{
    wbuf.write_long(id);
}

void PlayLogin::encode(WriteBuffer& wbuf) const
{
    wbuf.write_int(entity_id);
    wbuf.write_bool(false); // hardcore
    wbuf.write_varint(1);
    wbuf.write_string(dimension);
    wbuf.write_varint(max_players);
    wbuf.write_varint(view_distance);
    wbuf.write_varint(simulation_distance);
    wbuf.write_bool(false); // reduced debug info
    wbuf.write_bool(true); // respawn screen
    wbuf.write_bool(false); // limited crafting
    wbuf.write_varint(0); // dimension type
    wbuf.write_string(dimension);
    wbuf.write_long(0); // hashed seed
    wbuf.write_ubyte(game_mode);
    wbuf.write_byte(-1); // previous game mode
    wbuf.write_bool(false); // debug world
    wbuf.write_bool(true); // flat world
    wbuf.write_bool(false); // death location
    wbuf.write_varint(0); // portal cooldown
    wbuf.write_varint(63); // sea level
    wbuf.write_bool(false); // enforces secure chat
}

void GameEvent::encode(WriteBuffer& wbuf) const
{
    wbuf.write_ubyte(event);
    wbuf.write_float(value);
}

void SetCenterChunk::encode(WriteBuffer& wbuf) const
{
    wbuf.write_varint(x);
    wbuf.write_varint(z);
}

void ChunkBatchStart::encode(WriteBuffer&) const
{}

void ChunkBatchFinished::encode(WriteBuffer& wbuf) const
{
    wbuf.write_varint(batch_size);
}

void ChunkData::encode(WriteBuffer& wbuf) const
{
    wbuf.write_int(x);
    wbuf.write_int(z);
    wbuf.write_varint(0); // heightmaps

    if (data)
    {
        wbuf.write_byte_array(*data);
    } else
    {
        wbuf.write_varint(0);
    }

    wbuf.write_varint(0); // block entities

    // light: sky mask, block mask, empty sky mask, empty block mask, sky arrays, block arrays
    for (int i = 0; i < 6; ++i)
    {
        wbuf.write_varint(0);
    }
}

void UnloadChunk::encode(WriteBuffer& wbuf) const
{
    // z comes first on the wire
    wbuf.write_int(z);
    wbuf.write_int(x);
}

void PlayPongResponse::encode(WriteBuffer& wbuf) const
{
    wbuf.write_long(payload);
}

void SynchronizePosition::encode(WriteBuffer& wbuf) const
{
    wbuf.write_varint(teleport_id);
    wbuf.write_double(x);
    wbuf.write_double(y);
    wbuf.write_double(z);
    // velocity
    wbuf.write_double(0);
    wbuf.write_double(0);
    wbuf.write_double(0);
    wbuf.write_float(yaw);
    wbuf.write_float(pitch);
    // every coordinate absolute
    wbuf.write_int(0);
}
