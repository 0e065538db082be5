#include "world/world.hpp"
#include "basaltutil.hpp"
#include "loggerimpl.hpp"

World::World(ChunkStore& store, ChunkCache& cache, ChunkGenerator& generator, NbtLimits limits)
        : store(store), cache(cache), generator(generator), limits(limits)
{}

ChunkPayload World::load(const ChunkPosition& pos)
{
    std::optional<StoredChunk> stored = store.get(pos);

    if (stored)
    {
        return std::make_shared<const Tag>(decode_chunk(*stored, limits));
    }

    auto generated = std::make_shared<const Tag>(generator.generate(pos));

    // a concurrent persist_chunk may have written the position while this one generated
    if (!store.put_if_absent(pos, encode_chunk(*generated, store.scheme())))
    {
        stored = store.get(pos);
        if (stored)
        {
            return std::make_shared<const Tag>(decode_chunk(*stored, limits));
        }
    }
    ++generated_count;
    debug(logger().info("Generated chunk %s", pos.to_string().c_str());)
    return generated;
}

ChunkPayload World::request_chunk(const ChunkPosition& pos)
{
    return cache.get_or_load(pos, [this, &pos]() { return load(pos); });
}

void World::persist_chunk(const ChunkPosition& pos, ChunkPayload payload)
{
    cache.put_and_persist(pos, std::move(payload));
}
