#include "network/frame.hpp"
#include "codec/readbuffer.hpp"
#include "codec/varint.hpp"
#include "compression/compression.hpp"
#include "exceptions.hpp"

std::vector<uint8_t> encode_frame(WriteBuffer& payload, const FrameSettings& settings)
{
    auto size = static_cast<int32_t>(payload.size());

    if (!settings.compressed())
    {
        payload.prepend_varint(size);
        return payload.to_vector();
    }

    if (size < settings.compression_threshold)
    {
        // data length 0 marks an uncompressed body
        payload.prepend_varint(0);
        payload.prepend_varint(size + 1);
        return payload.to_vector();
    }

    std::vector<uint8_t> body = compress(COMPRESSION_DEFLATE, payload.data(), payload.size());
    size_t data_length_size = varint_size(static_cast<uint32_t>(size));
    std::vector<uint8_t> frame;

    frame.reserve(VARINT_MAX_BYTES + data_length_size + body.size());

    uint8_t prefix[VARINT_MAX_BYTES];
    size_t prefix_size = encode_varint(static_cast<uint32_t>(data_length_size + body.size()), prefix);
    frame.insert(frame.end(), prefix, prefix + prefix_size);
    prefix_size = encode_varint(static_cast<uint32_t>(size), prefix);
    frame.insert(frame.end(), prefix, prefix + prefix_size);
    frame.insert(frame.end(), body.begin(), body.end());
    return frame;
}

std::vector<uint8_t> encode_frame(const std::vector<uint8_t>& payload, const FrameSettings& settings)
{
    WriteBuffer buf(payload.size());

    buf.write_bytes(payload);
    return encode_frame(buf, settings);
}

void FrameDecoder::feed(const uint8_t* data, size_t size)
{
    // drop consumed bytes once they make up most of the buffer
    if (offset && offset >= buffer.size() / 2)
    {
        buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(offset));
        offset = 0;
    }
    buffer.insert(buffer.end(), data, data + size);
}

std::optional<VarintResult> FrameDecoder::check(const FrameSettings& settings) const
{
    std::optional<VarintResult> length = peek_varint(buffer.data() + offset, buffer.size() - offset, VARINT_MAX_BYTES);

    // The varint peek accepts all 32 bits, so lengths with the sign bit set show up as huge values here.
    if (length && length->value > settings.max_frame_length)
    {
        throw FrameTooLargeException("frame of " + std::to_string(length->value) + " bytes exceeds the " +
                                     std::to_string(settings.max_frame_length) + " byte limit");
    }
    return length;
}

std::optional<std::vector<uint8_t>> FrameDecoder::next(const FrameSettings& settings)
{
    std::optional<VarintResult> length = check(settings);

    if (!length)
    {
        return std::nullopt;
    }

    const uint8_t* head = buffer.data() + offset;
    size_t available = buffer.size() - offset;
    size_t total = length->consumed + length->value;
    if (available < total)
    {
        return std::nullopt;
    }

    const uint8_t* body = head + length->consumed;
    size_t body_size = length->value;
    offset += total;

    if (!settings.compressed())
    {
        return std::vector<uint8_t>(body, body + body_size);
    }

    ReadBuffer rbuf(body, body_size);
    int32_t data_length = rbuf.read_varint();

    if (data_length == 0)
    {
        return rbuf.read_remaining();
    }
    if (data_length < 0 || static_cast<size_t>(data_length) > settings.max_uncompressed_length)
    {
        throw LengthOverflowException("compressed frame declares " + std::to_string(data_length) + " bytes");
    }
    if (data_length < settings.compression_threshold)
    {
        throw CompressionMismatchException("compressed frame of " + std::to_string(data_length) +
                                           " bytes is below the threshold of " +
                                           std::to_string(settings.compression_threshold));
    }

    return decompress(COMPRESSION_DEFLATE, rbuf.data(), rbuf.remaining(), static_cast<size_t>(data_length),
                      settings.max_uncompressed_length);
}

void FrameDecoder::transform_pending(const std::function<void(uint8_t*, size_t)>& transform)
{
    if (pending())
    {
        transform(buffer.data() + offset, pending());
    }
}
