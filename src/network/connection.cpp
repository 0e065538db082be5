#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <unistd.h>
#include <sys/socket.h>
#include <sys/uio.h>
#include "network/connection.hpp"
#include "exceptions.hpp"

Connection::Connection(int client_fd, uint64_t id, FrameSettings settings) : fd(client_fd),
                                                                            conn_id(id),
                                                                            current(HANDSHAKE),
                                                                            settings(settings),
                                                                            front_offset(0),
                                                                            outbound_bytes(0),
                                                                            closing(false),
                                                                            last_read_time(Clock::now())
{}

Connection::~Connection()
{
    // this also removes it from the epoll interest list
    close(fd);
}

void Connection::set_phase(Phase next)
{
    if (next == current)
    {
        return;
    }

    if (!transition_allowed(current, next))
    {
        throw ProtocolViolationException(std::string("illegal transition from ") + phase_name(current) + " to " +
                                         phase_name(next));
    }

    debug(logger().info("Connection %llu: %s -> %s", static_cast<unsigned long long>(conn_id), phase_name(current),
                        phase_name(next));)
    current = next;
}

bool Connection::receive()
{
    uint8_t chunk[RECV_CHUNK_SIZE];
    size_t limit = settings.max_frame_length + VARINT_MAX_BYTES;

    while (true)
    {
        // the rest stays in the socket until the frames already buffered are handled
        if (decoder.pending() >= limit)
        {
            return true;
        }

        size_t room = std::min(sizeof(chunk), limit - decoder.pending());
        ssize_t res = recv(fd, chunk, room, 0);

        if (res > 0)
        {
            feed(chunk, static_cast<size_t>(res));
            continue;
        }

        if (res == 0)
        {
            return false;
        }

        if (errno == EINTR)
        {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK)
        {
            return true;
        }

        logger().warn("Connection %llu: recv(): %s", static_cast<unsigned long long>(conn_id), strerror(errno));
        return false;
    }
}

void Connection::feed(const uint8_t* data, size_t size)
{
    last_read_time = Clock::now();

    if (decryptor)
    {
        std::vector<uint8_t> plain(data, data + size);
        decryptor->update(plain.data(), plain.size());
        decoder.feed(plain.data(), plain.size());
    } else
    {
        decoder.feed(data, size);
    }

    try
    {
        decoder.check(settings);
    } catch (const DecodeException&)
    {
        set_phase(CLOSED);
        throw;
    }
}

std::optional<std::vector<uint8_t>> Connection::next_payload()
{
    return decoder.next(settings);
}

void Connection::enqueue(std::vector<uint8_t> frame)
{
    if (encryptor)
    {
        encryptor->update(frame.data(), frame.size());
    }

    outbound_bytes += frame.size();
    outbound.push_back(std::move(frame));
}

bool Connection::flush()
{
    iovec iov[MAX_WRITE_IOV];

    while (!outbound.empty())
    {
        int iov_size = 0;

        for (auto it = outbound.begin(); it != outbound.end() && iov_size < MAX_WRITE_IOV; ++it, ++iov_size)
        {
            size_t skip = iov_size == 0 ? front_offset : 0;
            iov[iov_size].iov_base = it->data() + skip;
            iov[iov_size].iov_len = it->size() - skip;
        }

        ssize_t res = writev(fd, iov, iov_size);

        if (res == -1)
        {
            if (errno == EINTR)
            {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK)
            {
                return true;
            }

            logger().warn("Connection %llu: writev(): %s", static_cast<unsigned long long>(conn_id), strerror(errno));
            return false;
        }

        outbound_bytes -= res;

        // pop every frame that was written completely, then remember how far into the next one we got
        while (res > 0)
        {
            size_t left = outbound.front().size() - front_offset;

            if (static_cast<size_t>(res) >= left)
            {
                res -= static_cast<ssize_t>(left);
                outbound.pop_front();
                front_offset = 0;
            } else
            {
                front_offset += res;
                res = 0;
            }
        }
    }

    return true;
}

void Connection::discard_output()
{
    outbound.clear();
    front_offset = 0;
    outbound_bytes = 0;
}

bool Connection::enable_compression(int threshold)
{
    if (settings.compressed() || threshold < 0)
    {
        return false;
    }

    settings.compression_threshold = threshold;
    return true;
}

bool Connection::enable_encryption(const std::vector<uint8_t>& secret)
{
    if (encryptor || secret.size() != SHARED_SECRET_LENGTH)
    {
        return false;
    }

    encryptor = std::make_unique<StreamCipher>(secret.data(), CIPHER_ENCRYPT);
    decryptor = std::make_unique<StreamCipher>(secret.data(), CIPHER_DECRYPT);

    // anything the peer sent after the encryption response is already ciphertext
    decoder.transform_pending([this](uint8_t* data, size_t size) { decryptor->update(data, size); });
    return true;
}
