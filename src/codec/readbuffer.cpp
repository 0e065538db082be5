#include <bit>
#include <cstring>
#include "codec/readbuffer.hpp"
#include "codec/varint.hpp"
#include "exceptions.hpp"

ReadBuffer::ReadBuffer(const uint8_t* data, size_t size) : begin(data), cursor(data), end(data + size)
{}

ReadBuffer::ReadBuffer(const std::vector<uint8_t>& bytes) : ReadBuffer(bytes.data(), bytes.size())
{}

void ReadBuffer::require(size_t size) const
{
    if (remaining() < size)
    {
        throw TruncatedException("read of " + std::to_string(size) + " bytes with only " +
                                 std::to_string(remaining()) + " remaining");
    }
}

void ReadBuffer::expect_end() const
{
    if (remaining())
    {
        throw TrailingBytesException(std::to_string(remaining()) + " trailing bytes after packet");
    }
}

int8_t ReadBuffer::read_char()
{
    return static_cast<int8_t>(read_uchar());
}

uint8_t ReadBuffer::read_uchar()
{
    require(sizeof(uint8_t));
    return *cursor++;
}

uint16_t ReadBuffer::read_ushort()
{
    uint16_t rax;

    require(sizeof(uint16_t));
    memcpy(&rax, cursor, sizeof(uint16_t));
    cursor += sizeof(uint16_t);
    return __builtin_bswap16(rax);
}

int16_t ReadBuffer::read_short()
{
    return std::bit_cast<int16_t>(read_ushort());
}

int32_t ReadBuffer::read_int()
{
    uint32_t rax;

    require(sizeof(uint32_t));
    memcpy(&rax, cursor, sizeof(uint32_t));
    cursor += sizeof(uint32_t);
    return std::bit_cast<int32_t>(__builtin_bswap32(rax));
}

uint64_t ReadBuffer::read_ulong()
{
    uint64_t rax;

    require(sizeof(uint64_t));
    memcpy(&rax, cursor, sizeof(uint64_t));
    cursor += sizeof(uint64_t);
    return __builtin_bswap64(rax);
}

int64_t ReadBuffer::read_long()
{
    return std::bit_cast<int64_t>(read_ulong());
}

float ReadBuffer::read_float()
{
    return std::bit_cast<float>(read_int());
}

double ReadBuffer::read_double()
{
    return std::bit_cast<double>(read_ulong());
}

int32_t ReadBuffer::read_varint()
{
    VarintResult result = decode_varint(cursor, remaining(), VARINT_MAX_BYTES);
    cursor += result.consumed;
    return static_cast<int32_t>(static_cast<uint32_t>(result.value));
}

int64_t ReadBuffer::read_varlong()
{
    VarintResult result = decode_varint(cursor, remaining(), VARLONG_MAX_BYTES);
    cursor += result.consumed;
    return static_cast<int64_t>(result.value);
}

std::string ReadBuffer::read_string(int32_t max_length)
{
    int32_t size = read_varint();

    if (max_length > string_limit)
    {
        max_length = string_limit;
    }

    // a character is at most 3 bytes in the protocol's UTF-8
    if (size < 0 || static_cast<int64_t>(size) > static_cast<int64_t>(max_length) * 3)
    {
        throw LengthOverflowException("string of " + std::to_string(size) + " bytes exceeds maximum of " +
                                      std::to_string(max_length) + " characters");
    }

    require(size);

    // count characters by skipping UTF-8 continuation bytes
    int32_t characters = 0;
    for (int32_t i = 0; i < size; ++i)
    {
        if ((cursor[i] & 0xC0) != 0x80)
        {
            ++characters;
        }
    }
    if (characters > max_length)
    {
        throw LengthOverflowException("string of " + std::to_string(characters) + " characters exceeds maximum of " +
                                      std::to_string(max_length));
    }

    std::string rax(reinterpret_cast<const char*>(cursor), size);
    cursor += size;
    return rax;
}

std::vector<uint8_t> ReadBuffer::read_byte_array(int32_t max_length)
{
    int32_t size = read_varint();

    if (size < 0 || size > max_length)
    {
        throw LengthOverflowException("byte array of " + std::to_string(size) + " bytes exceeds maximum of " +
                                      std::to_string(max_length));
    }

    require(size);
    std::vector<uint8_t> rax(cursor, cursor + size);
    cursor += size;
    return rax;
}

void ReadBuffer::read_bytes(uint8_t* out, size_t size)
{
    require(size);
    memcpy(out, cursor, size);
    cursor += size;
}

std::vector<uint8_t> ReadBuffer::read_remaining()
{
    std::vector<uint8_t> rax(cursor, end);
    cursor = end;
    return rax;
}

UUID ReadBuffer::read_uuid()
{
    uint64_t most = read_ulong();
    uint64_t least = read_ulong();
    return {most, least};
}

BlockPosition ReadBuffer::read_position()
{
    return BlockPosition::unpack(read_long());
}

void ReadBuffer::skip(size_t size)
{
    require(size);
    cursor += size;
}
