#ifndef BASALT_CONNECTION_HPP
#define BASALT_CONNECTION_HPP


#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "basaltutil.hpp"
#include "codec/writebuffer.hpp"
#include "entity/player.hpp"
#include "loggerimpl.hpp"
#include "network/cipher.hpp"
#include "network/frame.hpp"
#include "network/protocol_state.hpp"

/**
 * Bytes requested from the socket per recv() call.
 */
#define RECV_CHUNK_SIZE (16384)
/**
 * Most frames handed to one writev() call.
 */
#define MAX_WRITE_IOV (64)

using Clock = std::chrono::steady_clock;

/**
 * One client: its socket, protocol phase, framing and cipher state, and outbound queue.
 *
 * A connection belongs to one network worker and is only touched from that worker's thread.
 * Inbound bytes go socket -> decrypt -> frame decoder -> payloads; outbound packets go
 * encode -> frame -> encrypt -> queue -> writev, so the queue always holds wire bytes.
 */
class Connection
{
public:
    /**
     * Open client file descriptor. The connection closes it when destroyed.
     */
    const int fd;

    Connection(int client_fd, uint64_t id, FrameSettings settings);

    ~Connection();

    Connection(const Connection&) = delete;

    Connection& operator=(const Connection&) = delete;

    [[nodiscard]] inline uint64_t id() const { return conn_id; }

    [[nodiscard]] inline Phase phase() const { return current; }

    /**
     * @throws ProtocolViolationException if the phase cannot follow the current one
     */
    void set_phase(Phase next);

    // READ

    /**
     * Reads what the socket has buffered and feeds it to the frame decoder, stopping once one
     * frame of the largest allowed size and its length prefix are buffered.
     * @return false once the peer has closed the stream or the socket failed.
     * @throws DecodeException subclasses, with the phase set to CLOSED, if a length prefix is
     *         malformed or too large
     */
    bool receive();

    /**
     * Decrypts (when encryption is on) and buffers bytes read from the peer, then checks the
     * length prefix of the next frame.
     */
    void feed(const uint8_t* data, size_t size);

    [[nodiscard]] inline size_t buffered() const { return decoder.pending(); }

    /**
     * @return The next complete packet payload (id and fields), or nothing if more bytes are needed.
     * @throws DecodeException subclasses if the frame is malformed
     */
    std::optional<std::vector<uint8_t>> next_payload();

    // WRITE

    /**
     * Encodes and queues a packet. The packet must belong to the connection's phase.
     * @return false, queueing nothing, if it does not.
     */
    template<typename P>
    bool send(const P& packet)
    {
        if (wire_phase(current) != P::PHASE)
        {
            logger().warn("Connection %llu: refusing to send packet 0x%02x of phase %s while in %s",
                          static_cast<unsigned long long>(conn_id), P::ID, phase_name(P::PHASE), phase_name(current));
            return false;
        }

        WriteBuffer wbuf;
        wbuf.write_varint(P::ID);
        packet.encode(wbuf);

        debug(logger().info("[S > %llu] %s 0x%02x (%zu bytes)", static_cast<unsigned long long>(conn_id),
                            phase_name(current), P::ID, wbuf.size());)

        enqueue(encode_frame(wbuf, settings));
        return true;
    }

    /**
     * Writes as much of the outbound queue as the socket accepts.
     * @return false if the socket failed.
     */
    bool flush();

    [[nodiscard]] inline size_t queued_bytes() const { return outbound_bytes; }

    [[nodiscard]] inline bool wants_write() const { return !outbound.empty(); }

    /**
     * Drops every queued frame.
     */
    void discard_output();

    // NEGOTIATION

    /**
     * Switches both directions to compressed frames. Send the set compression packet first.
     * @return false if compression was already enabled.
     */
    bool enable_compression(int threshold);

    /**
     * Starts AES-128-CFB8 in both directions with secret as key and IV. Bytes already buffered
     * but not yet decoded are decrypted in place.
     * @return false if encryption was already enabled.
     */
    bool enable_encryption(const std::vector<uint8_t>& secret);

    [[nodiscard]] inline bool encrypted() const { return encryptor != nullptr; }

    [[nodiscard]] inline const FrameSettings& frame_settings() const { return settings; }

    // SESSION STATE

    /**
     * Close once everything queued has been written.
     */
    inline void close_after_flush() { closing = true; }

    [[nodiscard]] inline bool closing_after_flush() const { return closing; }

    [[nodiscard]] inline Clock::time_point last_read() const { return last_read_time; }

    inline void touch(Clock::time_point now) { last_read_time = now; }

    /**
     * Protocol version the client announced in its handshake.
     */
    int32_t protocol_version = 0;
    /**
     * Username from login start, kept until the player is created.
     */
    std::string username;
    UUID uuid;
    std::vector<uint8_t> verify_token;
    bool login_success_sent = false;
    bool finish_config_sent = false;
    /**
     * View distance from client information, 0 until the client sends one.
     */
    int8_t client_view_distance = 0;
    /**
     * Set when a keep-alive is awaiting its reply.
     */
    std::optional<int64_t> keep_alive_id;
    Clock::time_point keep_alive_sent;
    int32_t next_teleport_id = 1;
    std::unique_ptr<Player> player;
private:
    void enqueue(std::vector<uint8_t> frame);

    uint64_t conn_id;
    Phase current;
    FrameSettings settings;
    FrameDecoder decoder;
    std::unique_ptr<StreamCipher> encryptor;
    std::unique_ptr<StreamCipher> decryptor;
    std::deque<std::vector<uint8_t>> outbound;
    /**
     * Bytes of the front frame already written.
     */
    size_t front_offset;
    size_t outbound_bytes;
    bool closing;
    Clock::time_point last_read_time;
};


#endif //BASALT_CONNECTION_HPP
