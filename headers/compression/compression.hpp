#ifndef BASALT_COMPRESSION_HPP
#define BASALT_COMPRESSION_HPP


#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * Closed set of compression schemes. The values are the tag bytes stored in front of
 * persisted chunk records and, for 1-3, the tags used by region files.
 */
enum CompressionScheme : uint8_t
{
    COMPRESSION_GZIP = 1,
    COMPRESSION_DEFLATE = 2,
    COMPRESSION_NONE = 3,
    COMPRESSION_ZSTD = 5
};

/**
 * Region file scheme tags that are recognised but cannot be imported.
 */
#define REGION_SCHEME_LZ4 (4)
#define REGION_SCHEME_EXTERNAL (127)

const char* scheme_name(CompressionScheme scheme);

/**
 * @return false if tag is not a member of CompressionScheme.
 */
bool scheme_from_tag(uint8_t tag, CompressionScheme& out);

/**
 * Parses "none", "deflate", "gzip" or "zstd".
 */
bool parse_scheme(const std::string& name, CompressionScheme& out);

/**
 * @return false only for zstd when the build has no zstd support.
 */
bool scheme_available(CompressionScheme scheme);

std::vector<uint8_t> compress(CompressionScheme scheme, const uint8_t* data, size_t size);

inline std::vector<uint8_t> compress(CompressionScheme scheme, const std::vector<uint8_t>& bytes)
{
    return compress(scheme, bytes.data(), bytes.size());
}

/**
 * Decompresses one complete stream.
 *
 * @param expected_size Exact decompressed size the caller was promised, if any.
 * @param max_size Output is never allowed to grow beyond this many bytes.
 * @throws LengthOverflowException if the output would exceed max_size
 * @throws CompressionMismatchException if the output size differs from expected_size
 * @throws CorruptStreamException on malformed or truncated input, or bytes after the end of the stream
 */
std::vector<uint8_t> decompress(CompressionScheme scheme, const uint8_t* data, size_t size,
                                std::optional<size_t> expected_size, size_t max_size);

inline std::vector<uint8_t> decompress(CompressionScheme scheme, const std::vector<uint8_t>& bytes,
                                       std::optional<size_t> expected_size, size_t max_size)
{
    return decompress(scheme, bytes.data(), bytes.size(), expected_size, max_size);
}


#endif //BASALT_COMPRESSION_HPP
