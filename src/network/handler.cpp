#include <algorithm>
#include "network/handler.hpp"
#include "exceptions.hpp"
#include "network/clientbound.hpp"
#include "network/registry.hpp"
#include "network/status.hpp"

#define SERVER_BRAND "basalt"
/**
 * Feet height of a player standing on the flat world's grass layer.
 */
#define SPAWN_Y (-60.0)
#define MIN_VIEW_DISTANCE (2)

ServerContext::ServerContext(const ServerConfig& config, World& world, CommandSink& commands, const KeyPair* keys)
        : config(config), world(world), commands(commands), keys(keys)
{}

static unsigned long long cid(const Connection& conn)
{
    return static_cast<unsigned long long>(conn.id());
}

template<typename T>
static const T& expect(const DecodedPacket& decoded, Phase phase)
{
    const T* packet = std::get_if<T>(&decoded.packet);

    if (!packet)
    {
        throw ProtocolViolationException(std::string(decoded.name) + " is not allowed in " + phase_name(phase));
    }
    return *packet;
}

static void check_keep_alive(Connection& conn, const KeepAliveResponse& response)
{
    if (!conn.keep_alive_id || *conn.keep_alive_id != response.id)
    {
        throw ProtocolViolationException("keep-alive reply " + std::to_string(response.id) + " does not match");
    }
    conn.keep_alive_id.reset();
}

// HANDSHAKE

static void handle_handshake(Connection& conn, const DecodedPacket& decoded)
{
    const auto& intention = expect<Intention>(decoded, HANDSHAKE);

    conn.protocol_version = intention.protocol_version;

    debug(logger().info("[%llu > S] intention: protocol %i, %s:%u, next %i", cid(conn), intention.protocol_version,
                        intention.address.c_str(), intention.port, intention.next_state);)

    switch (intention.next_state)
    {
        case INTENT_STATUS:
            conn.set_phase(STATUS);
            break;
        case INTENT_LOGIN:
        case INTENT_TRANSFER:
            conn.set_phase(LOGIN);
            break;
        default:
            throw ProtocolViolationException("handshake asked for unknown state " +
                                             std::to_string(intention.next_state));
    }
}

// STATUS

static void handle_status(Connection& conn, ServerContext& ctx, const DecodedPacket& decoded)
{
    if (std::holds_alternative<StatusRequest>(decoded.packet))
    {
        if (conn.phase() != STATUS)
        {
            throw ProtocolViolationException("second status request");
        }

        conn.send(StatusResponse{build_status_json(ctx.config, conn.protocol_version, ctx.online_players,
                                                   ctx.favicon)});
        conn.set_phase(STATUS_COMPLETE);
        return;
    }

    const auto& ping = expect<PingRequest>(decoded, conn.phase());

    conn.send(PongResponse{ping.payload});
    conn.close_after_flush();
}

// LOGIN

static void finish_login(Connection& conn, ServerContext& ctx)
{
    int threshold = ctx.config.compression_threshold;

    if (threshold >= 0)
    {
        // set compression itself still goes out uncompressed
        conn.send(SetCompression{threshold});
        conn.enable_compression(threshold);
    }

    conn.send(LoginSuccess{conn.uuid, conn.username});
    conn.login_success_sent = true;

    logger().info("%s (%s) logged in from connection %llu%s", conn.username.c_str(), conn.uuid.to_string().c_str(),
                  cid(conn), conn.encrypted() ? " with encryption" : "");
}

static void handle_login_start(Connection& conn, ServerContext& ctx, const LoginStart& start)
{
    if (!conn.username.empty())
    {
        throw ProtocolViolationException("second login start");
    }
    if (start.username.empty())
    {
        throw ProtocolViolationException("empty username");
    }

    conn.username = start.username;
    conn.uuid = UUID::offline(start.username);

    if (ctx.keys)
    {
        conn.verify_token = random_bytes(VERIFY_TOKEN_LENGTH);
        conn.send(EncryptionRequest{"", ctx.keys->public_der(), conn.verify_token, false});
    } else
    {
        finish_login(conn, ctx);
    }
}

static void handle_encryption_response(Connection& conn, ServerContext& ctx, const EncryptionResponse& response)
{
    std::vector<uint8_t> secret;
    std::vector<uint8_t> token;

    if (!ctx.keys || conn.verify_token.empty() || conn.encrypted())
    {
        throw ProtocolViolationException("unexpected encryption response");
    }

    if (!ctx.keys->decrypt(response.verify_token, token) || token != conn.verify_token)
    {
        throw ProtocolViolationException("verify token mismatch");
    }
    if (!ctx.keys->decrypt(response.shared_secret, secret) || !conn.enable_encryption(secret))
    {
        throw ProtocolViolationException("bad shared secret");
    }

    conn.verify_token.clear();
    finish_login(conn, ctx);
}

static void start_configuration(Connection& conn)
{
    WriteBuffer brand;
    brand.write_string(SERVER_BRAND);

    conn.send(ConfigPluginMessage{"minecraft:brand", brand.to_vector()});
    conn.send(FeatureFlags{{"minecraft:vanilla"}});
    conn.send(KnownPacks{"minecraft", "core", PROTOCOL_VERSION_NAME});
}

static void handle_login(Connection& conn, ServerContext& ctx, const DecodedPacket& decoded)
{
    if (const auto* start = std::get_if<LoginStart>(&decoded.packet))
    {
        handle_login_start(conn, ctx, *start);
    } else if (const auto* response = std::get_if<EncryptionResponse>(&decoded.packet))
    {
        handle_encryption_response(conn, ctx, *response);
    } else if (std::holds_alternative<LoginAcknowledged>(decoded.packet))
    {
        if (!conn.login_success_sent)
        {
            throw ProtocolViolationException("login acknowledged before login success");
        }

        conn.set_phase(CONFIG);
        conn.keep_alive_sent = Clock::now();
        start_configuration(conn);
    } else
    {
        // plugin and cookie responses, nothing was asked for
        debug(logger().info("[%llu > S] %s ignored", cid(conn), decoded.name);)
    }
}

// CONFIG

static void enter_play(Connection& conn, ServerContext& ctx, ChunkDispatcher& chunks)
{
    int distance = ctx.config.view_distance;

    if (conn.client_view_distance > 0)
    {
        distance = std::max(MIN_VIEW_DISTANCE, std::min(distance, static_cast<int>(conn.client_view_distance)));
    }

    int32_t eid = ctx.next_entity_id++;
    conn.player = std::make_unique<Player>(eid, conn.uuid, conn.username, ctx.config.level_dimension, distance);
    ++ctx.online_players;

    Position spawn;
    spawn.x = 8.5;
    spawn.y = SPAWN_Y;
    spawn.z = 8.5;
    conn.player->set_position(spawn);

    std::vector<ChunkPosition> entering;
    std::vector<ChunkPosition> leaving;
    conn.player->recenter(spawn.cx(), spawn.cz(), entering, leaving);

    conn.send(PlayLogin{eid, ctx.config.level_dimension, ctx.config.max_players, distance, distance,
                        static_cast<uint8_t>(conn.player->game_mode())});
    conn.send(GameEvent{GAME_EVENT_START_WAITING_FOR_CHUNKS, 0});
    conn.send(SetCenterChunk{spawn.cx(), spawn.cz()});
    conn.send(SynchronizePosition{conn.next_teleport_id++, spawn.x, spawn.y, spawn.z, 0, 0});

    for (const auto& pos : entering)
    {
        conn.player->track(pos);
        chunks.request_chunk(conn, pos);
    }

    logger().info("%s joined as entity %i, %zu chunks requested", conn.username.c_str(), eid, entering.size());
}

static void handle_config(Connection& conn, ServerContext& ctx, ChunkDispatcher& chunks, const DecodedPacket& decoded)
{
    if (const auto* info = std::get_if<ClientInformation>(&decoded.packet))
    {
        conn.client_view_distance = info->view_distance;
    } else if ([[maybe_unused]] const auto* message = std::get_if<PluginMessage>(&decoded.packet))
    {
        debug(logger().info("[%llu > S] plugin message on %s (%zu bytes)", cid(conn), message->channel.c_str(),
                            message->data.size());)
    } else if (const auto* keep_alive = std::get_if<KeepAliveResponse>(&decoded.packet))
    {
        check_keep_alive(conn, *keep_alive);
    } else if (std::holds_alternative<KnownPacksResponse>(decoded.packet))
    {
        if (!conn.finish_config_sent)
        {
            conn.send(FinishConfiguration{});
            conn.finish_config_sent = true;
        }
    } else if (std::holds_alternative<FinishConfigurationAck>(decoded.packet))
    {
        if (!conn.finish_config_sent)
        {
            throw ProtocolViolationException("finish configuration acknowledged before it was sent");
        }

        conn.set_phase(PLAY);
        enter_play(conn, ctx, chunks);
    } else
    {
        debug(logger().info("[%llu > S] %s ignored", cid(conn), decoded.name);)
    }
}

// PLAY

static void move_player(Connection& conn, ChunkDispatcher& chunks, double x, double y, double z)
{
    Player& player = *conn.player;
    Position pos = player.position();

    pos.x = x;
    pos.y = y;
    pos.z = z;
    player.set_position(pos);

    std::vector<ChunkPosition> entering;
    std::vector<ChunkPosition> leaving;

    if (!player.recenter(pos.cx(), pos.cz(), entering, leaving))
    {
        return;
    }

    conn.send(SetCenterChunk{pos.cx(), pos.cz()});

    for (const auto& chunk : leaving)
    {
        conn.send(UnloadChunk{chunk.x, chunk.z});
    }
    for (const auto& chunk : entering)
    {
        player.track(chunk);
        chunks.request_chunk(conn, chunk);
    }
}

static void handle_play(Connection& conn, ServerContext& ctx, ChunkDispatcher& chunks, DecodedPacket& decoded)
{
    if (const auto* keep_alive = std::get_if<KeepAliveResponse>(&decoded.packet))
    {
        check_keep_alive(conn, *keep_alive);
        return;
    }
    if (const auto* ping = std::get_if<PingRequest>(&decoded.packet))
    {
        conn.send(PlayPongResponse{ping->payload});
        return;
    }

    // movement is handled here and still reaches the command sink
    if (const auto* move = std::get_if<SetPlayerPosition>(&decoded.packet))
    {
        move_player(conn, chunks, move->x, move->y, move->z);
    } else if (const auto* look = std::get_if<SetPlayerPositionRotation>(&decoded.packet))
    {
        move_player(conn, chunks, look->x, look->y, look->z);
    }

    ctx.commands.submit_decoded_command(conn, Command{decoded.id, decoded.name, std::move(decoded.packet)});
}

static void handle_packets(Connection& conn, ServerContext& ctx, ChunkDispatcher& chunks)
{
    while (conn.phase() != CLOSED && !conn.closing_after_flush())
    {
        std::optional<std::vector<uint8_t>> payload = conn.next_payload();

        if (!payload)
        {
            return;
        }

        Phase phase = conn.phase();
        std::optional<DecodedPacket> decoded;

        try
        {
            decoded = decode_packet(phase, *payload, static_cast<int32_t>(ctx.config.max_string_length));
        } catch (const UnknownPacketException& e)
        {
            if (!tolerates_unknown_packets(phase))
            {
                throw ProtocolViolationException(e.what());
            }

            logger().warn("Connection %llu: skipping unknown packet 0x%02x in %s", cid(conn), e.packet_id(),
                          phase_name(phase));
            continue;
        }

        debug(logger().info("[%llu > S] %s %s", cid(conn), phase_name(phase), decoded->name);)

        switch (phase)
        {
            case HANDSHAKE:
                handle_handshake(conn, *decoded);
                break;
            case STATUS:
            case STATUS_COMPLETE:
                handle_status(conn, ctx, *decoded);
                break;
            case LOGIN:
                handle_login(conn, ctx, *decoded);
                break;
            case CONFIG:
                handle_config(conn, ctx, chunks, *decoded);
                break;
            case PLAY:
                handle_play(conn, ctx, chunks, *decoded);
                break;
            case CLOSED:
                return;
        }
    }
}

void process_packets(Connection& conn, ServerContext& ctx, ChunkDispatcher& chunks)
{
    try
    {
        handle_packets(conn, ctx, chunks);
    } catch (const DecodeException&)
    {
        conn.set_phase(CLOSED);
        throw;
    }
}

void deliver_chunks(Connection& conn, const std::vector<std::pair<ChunkPosition, ChunkPayload>>& chunks)
{
    if (conn.phase() != PLAY || !conn.player)
    {
        return;
    }

    std::vector<const std::pair<ChunkPosition, ChunkPayload>*> visible;

    for (const auto& chunk : chunks)
    {
        if (!chunk.second)
        {
            // failed load, the client never got it
            conn.player->untrack(chunk.first);
            continue;
        }
        // the player may have walked away while the chunk loaded
        if (conn.player->tracks(chunk.first) && conn.player->in_view(chunk.first))
        {
            visible.push_back(&chunk);
        }
    }

    if (visible.empty())
    {
        return;
    }

    conn.send(ChunkBatchStart{});

    for (const auto* chunk : visible)
    {
        auto data = std::make_shared<const std::vector<uint8_t>>(encode_network_chunk(*chunk->second));
        conn.send(ChunkData{chunk->first.x, chunk->first.z, std::move(data)});
    }

    conn.send(ChunkBatchFinished{static_cast<int32_t>(visible.size())});
}

bool run_maintenance(Connection& conn, ServerContext& ctx, Clock::time_point now)
{
    const ServerConfig& config = ctx.config;

    if (now - conn.last_read() > std::chrono::seconds(config.read_timeout))
    {
        logger().info("Connection %llu timed out after %i seconds without data", cid(conn), config.read_timeout);
        conn.discard_output();
        return false;
    }

    if (conn.phase() != CONFIG && conn.phase() != PLAY)
    {
        return true;
    }

    if (conn.keep_alive_id)
    {
        if (now - conn.keep_alive_sent > std::chrono::seconds(config.keep_alive_timeout))
        {
            logger().info("Connection %llu did not answer keep-alive %lld", cid(conn),
                          static_cast<long long>(*conn.keep_alive_id));
            return false;
        }
        return true;
    }

    if (now - conn.keep_alive_sent >= std::chrono::seconds(config.keep_alive_interval))
    {
        int64_t id = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();

        if (conn.phase() == CONFIG)
        {
            conn.send(ConfigKeepAlive{id});
        } else
        {
            conn.send(PlayKeepAlive{id});
        }

        conn.keep_alive_id = id;
        conn.keep_alive_sent = now;
    }
    return true;
}

void connection_closed(Connection& conn, ServerContext& ctx)
{
    conn.set_phase(CLOSED);

    if (conn.player)
    {
        --ctx.online_players;
        logger().info("%s left (connection %llu)", conn.player->username().c_str(), cid(conn));
        conn.player.reset();
    }
}
