#include <bit>
#include <cstring>
#include <stdexcept>
#include "codec/writebuffer.hpp"
#include "codec/varint.hpp"

#define EXTRA_CAPACITY (32)

WriteBuffer::WriteBuffer(size_t size) : buf(new uint8_t[size + WRITE_HEADROOM]),
                                        end(buf + size + WRITE_HEADROOM),
                                        start(buf + WRITE_HEADROOM),
                                        cursor(start)
{}

WriteBuffer::~WriteBuffer()
{
    delete[] buf;
}

void WriteBuffer::buffer_resize(size_t size)
{
    auto* resized = new uint8_t[size];
    size_t used = cursor - buf;

    memcpy(resized, buf, used);

    end = resized + size;
    start = start - buf + resized;
    cursor = cursor - buf + resized;
    delete[] buf;
    buf = resized;
}

void WriteBuffer::ensure_capacity(size_t bytes)
{
    if (sector_remaining() < bytes)
    {
        // grow geometrically so that chunk sized payloads don't resize per field
        size_t current = end - buf;
        size_t wanted = current + bytes + EXTRA_CAPACITY;
        buffer_resize(wanted > current * 2 ? wanted : current * 2);
    }
}

#define WRITE(type, x) ensure_capacity(sizeof(type)); memcpy(cursor, &x, sizeof(type)); cursor += sizeof(type);

void WriteBuffer::write_byte(int8_t x)
{
    WRITE(int8_t, x)
}

void WriteBuffer::write_ubyte(uint8_t x)
{
    WRITE(uint8_t, x)
}

void WriteBuffer::write_bool(bool x)
{
    // This is implemented this way since bool isn't guaranteed to be 1 byte in size
    write_ubyte(x ? 1 : 0);
}

void WriteBuffer::write_short(int16_t x)
{
    uint16_t be = __builtin_bswap16(std::bit_cast<uint16_t>(x));
    WRITE(uint16_t, be)
}

void WriteBuffer::write_int(int32_t x)
{
    uint32_t be = __builtin_bswap32(std::bit_cast<uint32_t>(x));
    WRITE(uint32_t, be)
}

void WriteBuffer::write_long(int64_t x)
{
    uint64_t be = __builtin_bswap64(std::bit_cast<uint64_t>(x));
    WRITE(uint64_t, be)
}

void WriteBuffer::write_float(float x)
{
    write_int(std::bit_cast<int32_t>(x));
}

void WriteBuffer::write_double(double x)
{
    write_long(std::bit_cast<int64_t>(x));
}

void WriteBuffer::write_varint(int32_t x)
{
    ensure_capacity(VARINT_MAX_BYTES);
    cursor += encode_varint(static_cast<uint32_t>(x), cursor);
}

void WriteBuffer::write_varlong(int64_t x)
{
    ensure_capacity(VARLONG_MAX_BYTES);
    cursor += encode_varint(static_cast<uint64_t>(x), cursor);
}

void WriteBuffer::write_uuid(const UUID& uuid)
{
    write_long(std::bit_cast<int64_t>(uuid.most));
    write_long(std::bit_cast<int64_t>(uuid.least));
}

void WriteBuffer::write_position(const BlockPosition& pos)
{
    write_long(pos.pack());
}

void WriteBuffer::write_bytes(const uint8_t* bytes, size_t size)
{
    if (size)
    {
        ensure_capacity(size);
        memcpy(cursor, bytes, size);
        cursor += size;
    }
}

void WriteBuffer::write_string(const std::string& str)
{
    write_varint(static_cast<int32_t>(str.size()));
    write_bytes(reinterpret_cast<const uint8_t*>(str.data()), str.size());
}

void WriteBuffer::write_byte_array(const std::vector<uint8_t>& bytes)
{
    write_varint(static_cast<int32_t>(bytes.size()));
    write_bytes(bytes.data(), bytes.size());
}

void WriteBuffer::prepend_varint(int32_t x)
{
    uint8_t len[VARINT_MAX_BYTES];
    size_t len_length = encode_varint(static_cast<uint32_t>(x), len);

    if (static_cast<size_t>(start - buf) < len_length)
    {
        throw std::length_error("write buffer headroom exhausted");
    }

    start -= len_length;
    memcpy(start, len, len_length);
}

std::vector<uint8_t> WriteBuffer::to_vector() const
{
    return {start, cursor};
}

void WriteBuffer::reset()
{
    start = buf + WRITE_HEADROOM;
    cursor = start;
}
