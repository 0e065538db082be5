#ifndef BASALT_WRITEBUFFER_HPP
#define BASALT_WRITEBUFFER_HPP


#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "math/position.hpp"
#include "math/uuid.hpp"

/**
 * Bytes kept free in front of the written data so frame headers
 * (outer length + inner data length, two varints) can be prepended in place.
 */
#define WRITE_HEADROOM (10)

/**
 * Growable big-endian writer used to build packet bodies, tag trees and store records.
 */
class WriteBuffer
{
public:
    explicit WriteBuffer(size_t size = 64);

    ~WriteBuffer();

    WriteBuffer(const WriteBuffer&) = delete;

    WriteBuffer& operator=(const WriteBuffer&) = delete;

    void write_byte(int8_t x);

    void write_ubyte(uint8_t x);

    void write_bool(bool x);

    /**
     * Writes a signed 16-bit big-endian integer.
     */
    void write_short(int16_t x);

    /**
     * Writes a signed 32-bit big-endian integer.
     */
    void write_int(int32_t x);

    void write_long(int64_t x);

    void write_float(float x);

    void write_double(double x);

    void write_varint(int32_t x);

    void write_varlong(int64_t x);

    void write_uuid(const UUID& uuid);

    void write_position(const BlockPosition& pos);

    void write_bytes(const uint8_t* bytes, size_t size);

    inline void write_bytes(const std::vector<uint8_t>& bytes) { write_bytes(bytes.data(), bytes.size()); }

    /**
     * Writes the string prefixed with its byte length as a varint.
     */
    void write_string(const std::string& str);

    /**
     * Writes the bytes prefixed with their length as a varint.
     */
    void write_byte_array(const std::vector<uint8_t>& bytes);

    /**
     * Writes a varint in front of everything written so far, consuming headroom.
     * At most WRITE_HEADROOM bytes may be prepended over the buffer's lifetime between resets.
     */
    void prepend_varint(int32_t x);

    /**
     * @return Measurement of how many bytes have been written (including prepended bytes).
     */
    [[nodiscard]] inline size_t size() const { return cursor - start; }

    [[nodiscard]] inline const uint8_t* data() const { return start; }

    [[nodiscard]] std::vector<uint8_t> to_vector() const;

    /**
     * Resets the write buffer to its initial state, keeping its allocation.
     */
    void reset();
private:
    /**
     * @return Measurement of how many bytes the write cursor has until it runs out of space.
     */
    [[nodiscard]] inline size_t sector_remaining() const { return end - cursor; }

    void ensure_capacity(size_t bytes);

    void buffer_resize(size_t size);

    /**
     * Pointer to the beginning of the allocation owned by this buffer.
     */
    uint8_t* buf;
    /**
     * Points to one past the last byte of the allocation.
     */
    uint8_t* end;
    /**
     * First written byte. Starts at buf + WRITE_HEADROOM and moves back as varints are prepended.
     */
    uint8_t* start;
    /**
     * Current write position.
     */
    uint8_t* cursor;
};


#endif //BASALT_WRITEBUFFER_HPP
