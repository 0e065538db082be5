#include "codec/varint.hpp"
#include "exceptions.hpp"

size_t encode_varint(uint64_t x, uint8_t* out)
{
    size_t written = 0;

    while (true)
    {
        if ((x & ~static_cast<uint64_t>(SEGMENT_BITS)) == 0)
        {
            out[written++] = static_cast<uint8_t>(x);
            return written;
        }
        out[written++] = static_cast<uint8_t>((x & SEGMENT_BITS) | CONTINUE_BIT);
        x >>= 7;
    }
}

std::vector<uint8_t> encode_varint(uint64_t x)
{
    uint8_t buf[VARLONG_MAX_BYTES];
    size_t len = encode_varint(x, buf);
    return {buf, buf + len};
}

size_t varint_size(uint64_t x)
{
    size_t size = 1;

    while (x & ~static_cast<uint64_t>(SEGMENT_BITS))
    {
        x >>= 7;
        ++size;
    }
    return size;
}

/**
 * Shared body of decode_varint and peek_varint.
 * @return false if the input ran out before the varint terminated.
 */
static bool read_varint(const uint8_t* bytes, size_t size, int max_bytes, VarintResult& out)
{
    uint64_t value = 0;
    int position = 0;

    for (int i = 0; i < max_bytes; ++i)
    {
        if (static_cast<size_t>(i) >= size)
        {
            return false;
        }

        uint8_t c = bytes[i];

        if (i == max_bytes - 1)
        {
            // The last byte may only carry the bits that still fit the value.
            // For 5 byte varints that is 4 bits (32 - 28), for 10 byte varlongs 1 bit (64 - 63).
            int remaining_bits = (max_bytes == VARINT_MAX_BYTES ? 32 : 64) - position;
            if (remaining_bits < 7 && (c >> remaining_bits))
            {
                throw MalformedVarintException("varint does not fit its value width");
            }
        }

        value |= static_cast<uint64_t>(c & SEGMENT_BITS) << position;

        if (!(c & CONTINUE_BIT))
        {
            out.value = value;
            out.consumed = i + 1;
            return true;
        }

        position += 7;
    }

    throw MalformedVarintException("varint is too big");
}

VarintResult decode_varint(const uint8_t* bytes, size_t size, int max_bytes)
{
    VarintResult result{};

    if (!read_varint(bytes, size, max_bytes, result))
    {
        throw TruncatedException("varint is truncated");
    }
    return result;
}

std::optional<VarintResult> peek_varint(const uint8_t* bytes, size_t size, int max_bytes)
{
    VarintResult result{};

    if (!read_varint(bytes, size, max_bytes, result))
    {
        return std::nullopt;
    }
    return result;
}
