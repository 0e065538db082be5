#ifndef BASALT_VARINT_HPP
#define BASALT_VARINT_HPP


#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#define SEGMENT_BITS (0b01111111)
#define CONTINUE_BIT (0b10000000)

/**
 * Maximum encoded width of a value in the 32-bit range.
 */
#define VARINT_MAX_BYTES (5)
/**
 * Maximum encoded width of a value in the 64-bit range.
 */
#define VARLONG_MAX_BYTES (10)

struct VarintResult
{
    uint64_t value;
    size_t consumed;
};

/**
 * Writes the varint encoding of x to out, which must have room for VARLONG_MAX_BYTES.
 * @return The number of bytes written.
 */
size_t encode_varint(uint64_t x, uint8_t* out);

std::vector<uint8_t> encode_varint(uint64_t x);

/**
 * @return The number of bytes encode_varint(x) produces.
 */
size_t varint_size(uint64_t x);

/**
 * Decodes a varint of at most max_bytes from the start of bytes.
 *
 * @throws MalformedVarintException if max_bytes pass without a terminating byte,
 *         or the final byte carries bits that do not fit a max_bytes wide value.
 * @throws TruncatedException if size runs out before the varint terminates.
 */
VarintResult decode_varint(const uint8_t* bytes, size_t size, int max_bytes = VARLONG_MAX_BYTES);

/**
 * Same as decode_varint, but an incomplete varint is not an error.
 * @return nullopt if more bytes are needed.
 */
std::optional<VarintResult> peek_varint(const uint8_t* bytes, size_t size, int max_bytes = VARINT_MAX_BYTES);


#endif //BASALT_VARINT_HPP
