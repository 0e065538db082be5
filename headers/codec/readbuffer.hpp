#ifndef BASALT_READBUFFER_HPP
#define BASALT_READBUFFER_HPP


#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "math/position.hpp"
#include "math/uuid.hpp"

/**
 * Longest string (in characters) a peer may send unless a field declares a shorter maximum.
 */
#define MAX_STRING_LENGTH (32767)

/**
 * Bounded big-endian reader over a contiguous packet body. Every read checks the bytes
 * remaining and throws TruncatedException rather than reading past the end.
 */
class ReadBuffer
{
public:
    ReadBuffer(const uint8_t* data, size_t size);

    explicit ReadBuffer(const std::vector<uint8_t>& bytes);

    int8_t read_char();

    uint8_t read_uchar();

    inline bool read_bool() { return read_uchar() != 0; }

    int16_t read_short();

    uint16_t read_ushort();

    int32_t read_int();

    uint64_t read_ulong();

    int64_t read_long();

    float read_float();

    double read_double();

    int32_t read_varint();

    int64_t read_varlong();

    /**
     * Reads a varint length prefixed UTF-8 string.
     * @param max_length Maximum length in characters. The byte length may be up to 3 times larger.
     * @throws LengthOverflowException if the declared length is negative or too large.
     */
    std::string read_string(int32_t max_length = MAX_STRING_LENGTH);

    /**
     * Reads a varint length prefixed byte array.
     * @throws LengthOverflowException if the declared length is negative or above max_length.
     */
    std::vector<uint8_t> read_byte_array(int32_t max_length);

    void read_bytes(uint8_t* out, size_t size);

    std::vector<uint8_t> read_remaining();

    UUID read_uuid();

    BlockPosition read_position();

    /**
     * Moves the cursor forward without reading.
     */
    void skip(size_t size);

    /**
     * Caps every later read_string at max_length characters, whatever the field allows.
     */
    inline void limit_strings(int32_t max_length) { string_limit = max_length; }

    [[nodiscard]] inline size_t remaining() const { return end - cursor; }

    [[nodiscard]] inline size_t position() const { return cursor - begin; }

    [[nodiscard]] inline const uint8_t* data() const { return cursor; }

    /**
     * @throws TrailingBytesException if any bytes were left unread.
     */
    void expect_end() const;
private:
    /**
     * @throws TruncatedException if fewer than size bytes remain
     */
    void require(size_t size) const;

    const uint8_t* begin;
    const uint8_t* cursor;
    const uint8_t* end;
    int32_t string_limit = MAX_STRING_LENGTH;
};


#endif //BASALT_READBUFFER_HPP
