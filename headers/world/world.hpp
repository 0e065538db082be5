#ifndef BASALT_WORLD_HPP
#define BASALT_WORLD_HPP


#include <atomic>
#include <cstdint>
#include "storage/chunk_store.hpp"
#include "world/chunk_cache.hpp"
#include "world/chunk_codec.hpp"
#include "world/chunk_generator.hpp"
#include "world/chunk_position.hpp"

/**
 * Chunk access for the rest of the server: cache first, then the store, then the generator.
 */
class World
{
public:
    World(ChunkStore& store, ChunkCache& cache, ChunkGenerator& generator, NbtLimits limits = {});

    /**
     * Blocks until the chunk is available. Chunks the store has never seen are generated and
     * persisted before they are returned.
     * @throws StoreException if the store fails
     * @throws DecodeException if the stored record is corrupt
     */
    ChunkPayload request_chunk(const ChunkPosition& pos);

    /**
     * Write-through update of a chunk.
     */
    void persist_chunk(const ChunkPosition& pos, ChunkPayload payload);

    [[nodiscard]] inline uint64_t generated() const { return generated_count; }

    [[nodiscard]] inline ChunkCache& chunk_cache() { return cache; }
private:
    ChunkPayload load(const ChunkPosition& pos);

    ChunkStore& store;
    ChunkCache& cache;
    ChunkGenerator& generator;
    NbtLimits limits;
    std::atomic<uint64_t> generated_count{0};
};


#endif //BASALT_WORLD_HPP
