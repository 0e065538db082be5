#ifndef BASALT_CHUNK_GENERATOR_HPP
#define BASALT_CHUNK_GENERATOR_HPP


#include <cstdint>
#include "nbt/tag.hpp"
#include "world/chunk_position.hpp"

/**
 * Data version written into generated chunks (1.21.5).
 */
#define CHUNK_DATA_VERSION (4325)

#define CHUNK_MIN_SECTION (-4)
#define CHUNK_SECTION_COUNT (24)
#define SECTION_BLOCKS (4096)

/**
 * Produces the tag tree for a chunk the store has never seen.
 */
class ChunkGenerator
{
public:
    virtual ~ChunkGenerator() = default;

    virtual Tag generate(const ChunkPosition& pos) = 0;
};

/**
 * Bedrock, two layers of dirt and a layer of grass at the bottom of the world, air above.
 */
class FlatChunkGenerator : public ChunkGenerator
{
public:
    Tag generate(const ChunkPosition& pos) override;
};


#endif //BASALT_CHUNK_GENERATOR_HPP
