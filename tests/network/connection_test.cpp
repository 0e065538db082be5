#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <limits>
#include <string>
#include <vector>
#include <unistd.h>
#include <sys/socket.h>
#include <catch2/catch.hpp>
#include "codec/varint.hpp"
#include "exceptions.hpp"
#include "network/clientbound.hpp"
#include "network/packet_ids.hpp"
#include "network/status.hpp"
#include "test_util.hpp"

using namespace std::chrono_literals;

TEST_CASE("server list ping answers and closes", "[network][connection]")
{
    ServerFixture fx;
    SocketPair pair = make_socket_pair();
    Connection conn(pair.server, 1, FrameSettings());
    TestClient client(pair.client);

    // an old client still sees its own protocol echoed back
    client.handshake(1, INTENT_STATUS);
    client.send(STATUS_REQUEST, nullptr);
    fx.pump(conn);

    ReceivedPacket response = client.expect(STATUS_RESPONSE);
    ReadBuffer rbuf(response.body);
    std::string json = rbuf.read_string();

    REQUIRE(json.find("\"protocol\":1}") != std::string::npos);
    REQUIRE(json.find("\"online\":0") != std::string::npos);
    REQUIRE(conn.phase() == STATUS_COMPLETE);

    client.send(STATUS_PING_REQUEST, [](WriteBuffer& wbuf) { wbuf.write_long(42); });
    fx.pump(conn);

    ReceivedPacket pong = client.expect(STATUS_PONG_RESPONSE);
    ReadBuffer pong_buf(pong.body);
    REQUIRE(pong_buf.read_long() == 42);
    REQUIRE(conn.closing_after_flush());

    connection_closed(conn, fx.ctx);
    REQUIRE(conn.phase() == CLOSED);
}

TEST_CASE("a second status request is skipped", "[network][connection]")
{
    ServerFixture fx;
    SocketPair pair = make_socket_pair();
    Connection conn(pair.server, 1, FrameSettings());
    TestClient client(pair.client);

    client.handshake(PROTOCOL_VERSION, INTENT_STATUS);
    client.send(STATUS_REQUEST, nullptr);
    client.send(STATUS_REQUEST, nullptr);

    // status complete has no id 0, so the second request is an unknown packet and skipped
    fx.pump(conn);
    client.expect(STATUS_RESPONSE);
    REQUIRE(conn.phase() == STATUS_COMPLETE);
    REQUIRE(client.idle());
}

TEST_CASE("unknown packets are skipped before login", "[network][connection]")
{
    ServerFixture fx;
    SocketPair pair = make_socket_pair();
    Connection conn(pair.server, 1, FrameSettings());
    TestClient client(pair.client);

    client.handshake(PROTOCOL_VERSION, INTENT_STATUS);
    client.send(0x7F, nullptr);
    client.send(STATUS_REQUEST, nullptr);
    fx.pump(conn);

    client.expect(STATUS_RESPONSE);
    REQUIRE(conn.phase() == STATUS_COMPLETE);
}

TEST_CASE("unknown packets during login close the connection", "[network][connection]")
{
    ServerFixture fx;
    SocketPair pair = make_socket_pair();
    Connection conn(pair.server, 1, FrameSettings());
    TestClient client(pair.client);

    client.handshake(PROTOCOL_VERSION, INTENT_LOGIN);
    client.send(0x7F, nullptr);

    REQUIRE_THROWS_AS(fx.pump(conn), ProtocolViolationException);
    REQUIRE(conn.phase() == CLOSED);
}

TEST_CASE("handshakes asking for an unknown state are refused", "[network][connection]")
{
    ServerFixture fx;
    SocketPair pair = make_socket_pair();
    Connection conn(pair.server, 1, FrameSettings());
    TestClient client(pair.client);

    client.handshake(PROTOCOL_VERSION, 9);

    REQUIRE_THROWS_AS(fx.pump(conn), ProtocolViolationException);
    REQUIRE(conn.phase() == CLOSED);
}

TEST_CASE("oversized frames close the connection", "[network][connection]")
{
    ServerFixture fx;
    SocketPair pair = make_socket_pair();
    Connection conn(pair.server, 1, FrameSettings());
    TestClient client(pair.client);

    std::vector<uint8_t> length = encode_varint(MAX_FRAME_LENGTH + 1);
    REQUIRE(write(pair.client, length.data(), length.size()) == static_cast<ssize_t>(length.size()));

    REQUIRE_THROWS_AS(fx.pump(conn), FrameTooLargeException);
    REQUIRE(conn.phase() == CLOSED);
}

TEST_CASE("oversized frames are refused before their body is buffered", "[network][connection]")
{
    SocketPair pair = make_socket_pair();
    Connection conn(pair.server, 1, FrameSettings());

    // the largest length a 4 byte varint holds, then far more body than one read takes
    std::vector<uint8_t> bytes{0xFF, 0xFF, 0xFF, 0x7F};
    bytes.resize(bytes.size() + 4 * RECV_CHUNK_SIZE, 0xAB);
    REQUIRE(write(pair.client, bytes.data(), bytes.size()) == static_cast<ssize_t>(bytes.size()));

    REQUIRE_THROWS_AS(conn.receive(), FrameTooLargeException);
    REQUIRE(conn.phase() == CLOSED);
    REQUIRE(conn.buffered() <= RECV_CHUNK_SIZE);

    // the rest of the body was never read off the socket
    uint8_t peek;
    REQUIRE(recv(pair.server, &peek, 1, MSG_PEEK | MSG_DONTWAIT) == 1);
    close(pair.client);
}

TEST_CASE("reads stop once a whole frame of the largest size is buffered", "[network][connection]")
{
    ServerFixture fx;
    SocketPair pair = make_socket_pair();
    FrameSettings settings;
    settings.max_frame_length = 64;
    Connection conn(pair.server, 1, settings);
    TestClient client(pair.client);

    client.handshake(PROTOCOL_VERSION, INTENT_STATUS);
    // 40 frames of 10 bytes each, unknown packets the status phase skips
    for (int i = 0; i < 40; ++i)
    {
        client.send(0x7F, [](WriteBuffer& wbuf) { wbuf.write_bytes(std::vector<uint8_t>(8, 0)); });
    }

    auto unread = [&]() {
        uint8_t peek;
        return recv(pair.server, &peek, 1, MSG_PEEK | MSG_DONTWAIT) == 1;
    };

    REQUIRE(conn.receive());
    REQUIRE(conn.buffered() <= 64 + VARINT_MAX_BYTES);
    REQUIRE(unread());

    size_t rounds = 0;
    while ((conn.buffered() > 0 || unread()) && rounds < 100)
    {
        fx.pump(conn);
        REQUIRE(conn.buffered() <= 64 + VARINT_MAX_BYTES);
        ++rounds;
    }

    REQUIRE(rounds > 1);
    REQUIRE(conn.buffered() == 0);
    REQUIRE(conn.phase() == STATUS);
}

TEST_CASE("players join, receive their chunks and walk", "[network][connection]")
{
    ServerFixture fx;
    SocketPair pair = make_socket_pair();
    Connection conn(pair.server, 1, FrameSettings());
    TestClient client(pair.client);

    REQUIRE(fx.config.compression_threshold == 256);
    join(fx, conn, client);

    REQUIRE(conn.frame_settings().compression_threshold == 256);
    REQUIRE(fx.ctx.online_players == 1);
    REQUIRE(conn.player);
    REQUIRE(conn.player->view_distance() == 2);
    REQUIRE(fx.dispatcher.pending() == 13);

    REQUIRE(fx.dispatcher.deliver(conn, fx.world) == 13);
    REQUIRE(conn.flush());

    client.expect(PLAY_CHUNK_BATCH_START);
    for (int i = 0; i < 13; ++i)
    {
        ReceivedPacket chunk = client.expect(PLAY_CHUNK_DATA);
        ReadBuffer rbuf(chunk.body);
        int32_t x = rbuf.read_int();
        int32_t z = rbuf.read_int();

        REQUIRE(std::abs(x) + std::abs(z) <= 2);
    }
    ReceivedPacket finished = client.expect(PLAY_CHUNK_BATCH_FINISHED);
    ReadBuffer finished_buf(finished.body);
    REQUIRE(finished_buf.read_varint() == 13);

    // one chunk east
    client.set_position(24.5, -60, 8.5);
    fx.pump(conn);

    ReceivedPacket center = client.expect(PLAY_SET_CENTER_CHUNK);
    ReadBuffer center_buf(center.body);
    REQUIRE(center_buf.read_varint() == 1);
    REQUIRE(center_buf.read_varint() == 0);

    for (int i = 0; i < 5; ++i)
    {
        client.expect(PLAY_UNLOAD_CHUNK);
    }
    REQUIRE(fx.dispatcher.pending() == 5);
    REQUIRE(fx.commands.packet_ids == std::vector<int>{PLAY_SET_PLAYER_POSITION});

    connection_closed(conn, fx.ctx);
    REQUIRE(fx.ctx.online_players == 0);
    REQUIRE_FALSE(conn.player);
}

TEST_CASE("positions outside the world close the connection", "[network][connection]")
{
    ServerFixture fx;
    SocketPair pair = make_socket_pair();
    Connection conn(pair.server, 1, FrameSettings());
    TestClient client(pair.client);

    join(fx, conn, client);
    REQUIRE(fx.dispatcher.pending() == 13);

    client.set_position(std::numeric_limits<double>::quiet_NaN(), -60, 8.5);

    REQUIRE_THROWS_AS(fx.pump(conn), ProtocolViolationException);
    REQUIRE(conn.phase() == CLOSED);
    REQUIRE(fx.dispatcher.pending() == 13);
    REQUIRE(fx.commands.packet_ids.empty());
}

TEST_CASE("chunks that failed to load are requested again", "[network][connection]")
{
    ServerFixture fx;
    SocketPair pair = make_socket_pair();
    Connection conn(pair.server, 1, FrameSettings());
    TestClient client(pair.client);

    join(fx, conn, client);
    REQUIRE(conn.player->tracked_count() == 13);

    ChunkPosition spawn{conn.player->dimension(), 0, 0};
    deliver_chunks(conn, {{spawn, nullptr}});

    REQUIRE_FALSE(conn.player->tracks(spawn));
    REQUIRE(conn.player->tracked_count() == 12);
    REQUIRE(conn.flush());

    // one chunk east, spawn is still in view and comes back with the five new chunks
    client.set_position(24.5, -60, 8.5);
    fx.pump(conn);
    client.expect(PLAY_SET_CENTER_CHUNK);

    REQUIRE(fx.dispatcher.pending() == 13 + 6);
    REQUIRE(conn.player->tracks(spawn));
    REQUIRE(std::count(fx.dispatcher.history().begin(), fx.dispatcher.history().end(), spawn) == 2);
}

TEST_CASE("login success carries the offline uuid", "[network][connection]")
{
    ServerFixture fx;
    fx.config.compression_threshold = -1;
    SocketPair pair = make_socket_pair();
    Connection conn(pair.server, 1, FrameSettings());
    TestClient client(pair.client);

    client.handshake(PROTOCOL_VERSION, INTENT_LOGIN);
    client.login_start("Notch");
    fx.pump(conn);

    ReceivedPacket success = client.expect(LOGIN_SUCCESS);
    ReadBuffer rbuf(success.body);
    REQUIRE(rbuf.read_uuid() == UUID::offline("Notch"));
    REQUIRE(rbuf.read_string() == "Notch");
    REQUIRE(rbuf.read_varint() == 0);
    REQUIRE(conn.phase() == LOGIN);
}

TEST_CASE("chunks that left view before loading are not sent", "[network][connection]")
{
    ServerFixture fx;
    SocketPair pair = make_socket_pair();
    Connection conn(pair.server, 1, FrameSettings());
    TestClient client(pair.client);

    join(fx, conn, client);

    // walk far away before the spawn chunks arrive
    client.set_position(1000, -60, 1000);
    fx.pump(conn);
    client.expect(PLAY_SET_CENTER_CHUNK);

    REQUIRE(fx.dispatcher.pending() == 26);
    REQUIRE(fx.dispatcher.deliver(conn, fx.world) == 26);
    REQUIRE(conn.flush());

    // 13 unloads for spawn, then one batch with only the new view
    for (int i = 0; i < 13; ++i)
    {
        client.expect(PLAY_UNLOAD_CHUNK);
    }
    client.expect(PLAY_CHUNK_BATCH_START);
    for (int i = 0; i < 13; ++i)
    {
        client.expect(PLAY_CHUNK_DATA);
    }
    ReceivedPacket finished = client.expect(PLAY_CHUNK_BATCH_FINISHED);
    ReadBuffer rbuf(finished.body);
    REQUIRE(rbuf.read_varint() == 13);
}

TEST_CASE("encryption switches on in the middle of a read", "[network][connection]")
{
    KeyPair keys;
    ServerFixture fx(&keys);
    fx.config.compression_threshold = -1;
    SocketPair pair = make_socket_pair();
    Connection conn(pair.server, 1, FrameSettings());
    TestClient client(pair.client);

    client.handshake(PROTOCOL_VERSION, INTENT_LOGIN);
    client.login_start("Alex");
    fx.pump(conn);

    ReceivedPacket request = client.expect(LOGIN_ENCRYPTION_REQUEST);
    ReadBuffer rbuf(request.body);
    REQUIRE(rbuf.read_string().empty());
    REQUIRE(rbuf.read_byte_array(4096) == keys.public_der());
    std::vector<uint8_t> token = rbuf.read_byte_array(VERIFY_TOKEN_LENGTH);
    REQUIRE(token.size() == VERIFY_TOKEN_LENGTH);
    REQUIRE_FALSE(rbuf.read_bool());

    std::vector<uint8_t> secret = random_bytes(SHARED_SECRET_LENGTH);
    client.send(LOGIN_ENCRYPTION_RESPONSE, [&](WriteBuffer& wbuf) {
        wbuf.write_byte_array(keys.encrypt(secret));
        wbuf.write_byte_array(keys.encrypt(token));
    });

    // the acknowledgement is encrypted and arrives in the same read as the response
    client.enable_encryption(secret);
    client.send(LOGIN_ACKNOWLEDGED, nullptr);
    fx.pump(conn);

    REQUIRE(conn.encrypted());
    client.expect(LOGIN_SUCCESS);
    REQUIRE(conn.phase() == CONFIG);
    client.expect(CONFIG_PLUGIN_MESSAGE);
}

TEST_CASE("a wrong verify token is a violation", "[network][connection]")
{
    KeyPair keys;
    ServerFixture fx(&keys);
    SocketPair pair = make_socket_pair();
    Connection conn(pair.server, 1, FrameSettings());
    TestClient client(pair.client);

    client.handshake(PROTOCOL_VERSION, INTENT_LOGIN);
    client.login_start("Alex");
    fx.pump(conn);
    client.expect(LOGIN_ENCRYPTION_REQUEST);

    client.send(LOGIN_ENCRYPTION_RESPONSE, [&](WriteBuffer& wbuf) {
        wbuf.write_byte_array(keys.encrypt(random_bytes(SHARED_SECRET_LENGTH)));
        wbuf.write_byte_array(keys.encrypt({0, 0, 0, 0, 0}));
    });

    REQUIRE_THROWS_AS(fx.pump(conn), ProtocolViolationException);
    REQUIRE(conn.phase() == CLOSED);
    REQUIRE_FALSE(conn.encrypted());
}

TEST_CASE("packets out of order are violations", "[network][connection]")
{
    ServerFixture fx;
    SocketPair pair = make_socket_pair();
    Connection conn(pair.server, 1, FrameSettings());
    TestClient client(pair.client);

    SECTION("login acknowledged before login success")
    {
        client.handshake(PROTOCOL_VERSION, INTENT_LOGIN);
        client.send(LOGIN_ACKNOWLEDGED, nullptr);

        REQUIRE_THROWS_AS(fx.pump(conn), ProtocolViolationException);
    }

    SECTION("a play packet during configuration")
    {
        fx.config.compression_threshold = -1;
        client.handshake(PROTOCOL_VERSION, INTENT_LOGIN);
        client.login_start("Steve");
        fx.pump(conn);
        client.expect(LOGIN_SUCCESS);
        client.send(LOGIN_ACKNOWLEDGED, nullptr);
        fx.pump(conn);
        REQUIRE(conn.phase() == CONFIG);

        client.set_position(0, 0, 0);
        REQUIRE_THROWS_AS(fx.pump(conn), ProtocolViolationException);
    }

    SECTION("finish acknowledged before finish was sent")
    {
        fx.config.compression_threshold = -1;
        client.handshake(PROTOCOL_VERSION, INTENT_LOGIN);
        client.login_start("Steve");
        client.send(LOGIN_ACKNOWLEDGED, nullptr);
        fx.pump(conn);
        REQUIRE(conn.phase() == CONFIG);

        client.send(CONFIG_FINISH_ACKNOWLEDGED, nullptr);
        REQUIRE_THROWS_AS(fx.pump(conn), ProtocolViolationException);
    }

    REQUIRE(conn.phase() == CLOSED);
}

TEST_CASE("packets of another phase are never sent", "[network][connection]")
{
    SocketPair pair = make_socket_pair();
    Connection conn(pair.server, 1, FrameSettings());
    TestClient client(pair.client);

    REQUIRE_FALSE(conn.send(PlayKeepAlive{1}));
    REQUIRE_FALSE(conn.send(StatusResponse{"{}"}));
    REQUIRE(conn.queued_bytes() == 0);
    REQUIRE_FALSE(conn.wants_write());
}

TEST_CASE("keep-alives are sent and must be answered", "[network][connection][keepalive]")
{
    ServerFixture fx;
    fx.config.read_timeout = 3600;
    SocketPair pair = make_socket_pair();
    Connection conn(pair.server, 1, FrameSettings());
    TestClient client(pair.client);

    join(fx, conn, client);
    Clock::time_point now = Clock::now();

    // nothing is due yet
    REQUIRE(run_maintenance(conn, fx.ctx, now));
    REQUIRE_FALSE(conn.keep_alive_id);

    REQUIRE(run_maintenance(conn, fx.ctx, now + 16s));
    REQUIRE(conn.keep_alive_id);
    REQUIRE(conn.flush());

    ReceivedPacket keep_alive = client.expect(PLAY_KEEP_ALIVE);
    ReadBuffer rbuf(keep_alive.body);
    int64_t id = rbuf.read_long();
    REQUIRE(id == *conn.keep_alive_id);

    SECTION("a matching reply clears it")
    {
        client.keep_alive(PLAY, id);
        fx.pump(conn);
        REQUIRE_FALSE(conn.keep_alive_id);
        REQUIRE(run_maintenance(conn, fx.ctx, now + 20s));
    }

    SECTION("a reply with another id is a violation")
    {
        client.keep_alive(PLAY, id + 1);
        REQUIRE_THROWS_AS(fx.pump(conn), ProtocolViolationException);
        REQUIRE(conn.phase() == CLOSED);
    }

    SECTION("no reply times out")
    {
        REQUIRE(run_maintenance(conn, fx.ctx, now + 40s));
        REQUIRE_FALSE(run_maintenance(conn, fx.ctx, now + 47s));
    }
}

TEST_CASE("configuration keep-alives use the configuration packet", "[network][connection][keepalive]")
{
    ServerFixture fx;
    fx.config.compression_threshold = -1;
    SocketPair pair = make_socket_pair();
    Connection conn(pair.server, 1, FrameSettings());
    TestClient client(pair.client);

    client.handshake(PROTOCOL_VERSION, INTENT_LOGIN);
    client.login_start("Steve");
    client.send(LOGIN_ACKNOWLEDGED, nullptr);
    fx.pump(conn);
    client.expect(LOGIN_SUCCESS);
    client.expect(CONFIG_PLUGIN_MESSAGE);
    client.expect(CONFIG_FEATURE_FLAGS);
    client.expect(CONFIG_KNOWN_PACKS);

    REQUIRE(run_maintenance(conn, fx.ctx, Clock::now() + 16s));
    REQUIRE(conn.flush());

    ReceivedPacket keep_alive = client.expect(CONFIG_KEEP_ALIVE);
    ReadBuffer rbuf(keep_alive.body);
    client.keep_alive(CONFIG, rbuf.read_long());
    fx.pump(conn);

    REQUIRE_FALSE(conn.keep_alive_id);
    REQUIRE(conn.phase() == CONFIG);
}

TEST_CASE("silent connections time out and drop their output", "[network][connection]")
{
    ServerFixture fx;
    SocketPair pair = make_socket_pair();
    Connection conn(pair.server, 1, FrameSettings());
    TestClient client(pair.client);

    client.handshake(PROTOCOL_VERSION, INTENT_STATUS);
    client.send(STATUS_REQUEST, nullptr);
    conn.receive();
    process_packets(conn, fx.ctx, fx.dispatcher);
    REQUIRE(conn.wants_write());

    REQUIRE(run_maintenance(conn, fx.ctx, Clock::now() + 10s));
    REQUIRE_FALSE(run_maintenance(conn, fx.ctx, Clock::now() + 31s));
    REQUIRE(conn.queued_bytes() == 0);
    REQUIRE_FALSE(conn.wants_write());
}

TEST_CASE("peer close is reported by receive", "[network][connection]")
{
    SocketPair pair = make_socket_pair();
    Connection conn(pair.server, 1, FrameSettings());

    REQUIRE(conn.receive());
    close(pair.client);
    REQUIRE_FALSE(conn.receive());
}

TEST_CASE("status json is escaped and carries the favicon", "[network][status]")
{
    REQUIRE(json_escape("plain") == "plain");
    REQUIRE(json_escape("a\"b\\c\n\x01") == "a\\\"b\\\\c\\n\\u0001");

    ServerConfig config;
    config.motd = "say \"hi\"";
    config.max_players = 5;

    std::string json = build_status_json(config, PROTOCOL_VERSION, 2, "data:image/png;base64,AAAA");
    REQUIRE(json == "{\"version\":{\"name\":\"1.21.5\",\"protocol\":770},"
                    "\"players\":{\"max\":5,\"online\":2,\"sample\":[]},"
                    "\"description\":{\"text\":\"say \\\"hi\\\"\"},"
                    "\"favicon\":\"data:image/png;base64,AAAA\"}");

    REQUIRE(build_status_json(config, 1, 0, "").find("favicon") == std::string::npos);
}

TEST_CASE("favicons load as base64 data urls", "[network][status]")
{
    TempDir dir;
    write_file(dir.file("icon.png"), {'a', 'b', 'c'});

    REQUIRE(load_favicon(dir.file("icon.png")) == "data:image/png;base64,YWJj");
    REQUIRE(load_favicon(dir.file("missing.png")).empty());
}
