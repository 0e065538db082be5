#ifndef BASALT_CHUNK_POSITION_HPP
#define BASALT_CHUNK_POSITION_HPP


#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

/**
 * Address of one chunk column: dimension identifier plus chunk x and z.
 */
struct ChunkPosition
{
    std::string dimension;
    int32_t x = 0;
    int32_t z = 0;

    /**
     * @return The store key: u16 dimension length, dimension bytes, then x and z as big-endian
     *         values with the sign bit flipped, so byte order sorts by dimension, x, then z.
     */
    [[nodiscard]] std::vector<uint8_t> key() const;

    /**
     * Inverse of key().
     * @return false if the bytes are not a well formed key.
     */
    static bool from_key(const uint8_t* data, size_t size, ChunkPosition& out);

    [[nodiscard]] std::string to_string() const;

    bool operator==(const ChunkPosition& other) const = default;
};

struct ChunkPositionHash
{
    size_t operator()(const ChunkPosition& pos) const;
};

/**
 * Smallest and one past the largest key of any chunk in the dimension.
 */
std::vector<uint8_t> dimension_key_begin(const std::string& dimension);

std::vector<uint8_t> dimension_key_end(const std::string& dimension);


#endif //BASALT_CHUNK_POSITION_HPP
