#include <functional>
#include "world/chunk_position.hpp"

#define SIGN_FLIP (0x80000000u)

static void write_be32(std::vector<uint8_t>& out, uint32_t x)
{
    out.push_back(static_cast<uint8_t>(x >> 24));
    out.push_back(static_cast<uint8_t>(x >> 16));
    out.push_back(static_cast<uint8_t>(x >> 8));
    out.push_back(static_cast<uint8_t>(x));
}

static uint32_t read_be32(const uint8_t* data)
{
    return static_cast<uint32_t>(data[0]) << 24 |
           static_cast<uint32_t>(data[1]) << 16 |
           static_cast<uint32_t>(data[2]) << 8 |
           static_cast<uint32_t>(data[3]);
}

static void write_dimension(std::vector<uint8_t>& out, const std::string& dimension)
{
    auto size = static_cast<uint16_t>(dimension.size());

    out.push_back(static_cast<uint8_t>(size >> 8));
    out.push_back(static_cast<uint8_t>(size));
    out.insert(out.end(), dimension.begin(), dimension.begin() + size);
}

std::vector<uint8_t> ChunkPosition::key() const
{
    std::vector<uint8_t> out;

    out.reserve(2 + dimension.size() + 8);
    write_dimension(out, dimension);
    write_be32(out, static_cast<uint32_t>(x) ^ SIGN_FLIP);
    write_be32(out, static_cast<uint32_t>(z) ^ SIGN_FLIP);
    return out;
}

bool ChunkPosition::from_key(const uint8_t* data, size_t size, ChunkPosition& out)
{
    if (size < 2)
    {
        return false;
    }

    size_t dimension_size = static_cast<size_t>(data[0]) << 8 | data[1];
    if (size != 2 + dimension_size + 8)
    {
        return false;
    }

    out.dimension.assign(reinterpret_cast<const char*>(data + 2), dimension_size);
    out.x = static_cast<int32_t>(read_be32(data + 2 + dimension_size) ^ SIGN_FLIP);
    out.z = static_cast<int32_t>(read_be32(data + 6 + dimension_size) ^ SIGN_FLIP);
    return true;
}

std::string ChunkPosition::to_string() const
{
    return dimension + "[" + std::to_string(x) + ", " + std::to_string(z) + "]";
}

size_t ChunkPositionHash::operator()(const ChunkPosition& pos) const
{
    size_t h = std::hash<int64_t>{}((static_cast<int64_t>(pos.x) * 73856093) ^
                                    (static_cast<int64_t>(pos.z) * 83492791));
    return h ^ (std::hash<std::string>{}(pos.dimension) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
}

std::vector<uint8_t> dimension_key_begin(const std::string& dimension)
{
    std::vector<uint8_t> out;

    write_dimension(out, dimension);
    return out;
}

std::vector<uint8_t> dimension_key_end(const std::string& dimension)
{
    std::vector<uint8_t> out = dimension_key_begin(dimension);

    // every key of the dimension is this prefix plus 8 bytes, so prefix + 8 * 0xFF + 1 byte bounds them all
    out.insert(out.end(), 9, 0xFF);
    return out;
}
