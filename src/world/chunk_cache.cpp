#include <exception>
#include "world/chunk_cache.hpp"
#include "nbt/nbt_io.hpp"

/**
 * Bookkeeping overhead charged per entry on top of the tag tree's encoded size.
 */
#define ENTRY_OVERHEAD (128)

ChunkCache::ChunkCache(ChunkStore& store, ChunkCacheOptions options) : store(store), options(options)
{
    if (options.background_eviction)
    {
        evictor = std::jthread([this](std::stop_token stop) { evict_loop(stop); });
    }
}

ChunkCache::~ChunkCache()
{
    if (evictor.joinable())
    {
        evictor.request_stop();
        evictor.join();
    }
}

ChunkCache::Shard& ChunkCache::shard_for(const ChunkPosition& pos)
{
    return shards[ChunkPositionHash{}(pos) % CACHE_SHARDS];
}

void ChunkCache::touch(Shard& shard, Entry& entry)
{
    entry.last_access = ++clock;
    shard.lru.splice(shard.lru.begin(), shard.lru, entry.lru);
}

void ChunkCache::insert(Shard& shard, const ChunkPosition& pos, ChunkPayload payload)
{
    size_t cost = ENTRY_OVERHEAD + tag_payload_size(*payload);
    auto it = shard.entries.find(pos);

    if (it != shard.entries.end())
    {
        total_bytes -= it->second.cost;
        total_bytes += cost;
        it->second.payload = std::move(payload);
        it->second.cost = cost;
        touch(shard, it->second);
        return;
    }

    shard.lru.push_front(pos);
    shard.entries.emplace(pos, Entry{std::move(payload), cost, ++clock, shard.lru.begin()});
    ++total_entries;
    total_bytes += cost;
}

void ChunkCache::erase(Shard& shard, const ChunkPosition& pos)
{
    auto it = shard.entries.find(pos);

    if (it != shard.entries.end())
    {
        total_bytes -= it->second.cost;
        --total_entries;
        shard.lru.erase(it->second.lru);
        shard.entries.erase(it);
    }
}

void ChunkCache::supersede(Shard& shard, const ChunkPosition& pos)
{
    auto it = shard.loading.find(pos);

    if (it != shard.loading.end())
    {
        // the load keeps running for whoever waits on it, but its result will not be cached
        // and the next get_or_load starts from the newer state
        it->second->superseded = true;
        shard.loading.erase(it);
    }
}

ChunkPayload ChunkCache::get_or_load(const ChunkPosition& pos, const ChunkLoader& loader)
{
    Shard& shard = shard_for(pos);
    std::promise<ChunkPayload> promise;
    std::shared_ptr<InFlight> flight;

    {
        std::unique_lock<std::mutex> lock(shard.mutex);
        auto hit = shard.entries.find(pos);

        if (hit != shard.entries.end())
        {
            ++hits;
            touch(shard, hit->second);
            return hit->second.payload;
        }

        ++misses;
        auto pending = shard.loading.find(pos);

        if (pending != shard.loading.end())
        {
            std::shared_future<ChunkPayload> result = pending->second->result;
            lock.unlock();
            return result.get();
        }

        flight = std::make_shared<InFlight>();
        flight->result = promise.get_future().share();
        shard.loading.emplace(pos, flight);
    }

    ++loads;
    ChunkPayload payload;

    try
    {
        payload = loader();
    } catch (...)
    {
        {
            std::lock_guard<std::mutex> lock(shard.mutex);
            auto it = shard.loading.find(pos);
            if (it != shard.loading.end() && it->second == flight)
            {
                shard.loading.erase(it);
            }
        }
        // waiters see the same failure, and the caller gets it rethrown
        promise.set_exception(std::current_exception());
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.loading.find(pos);

        if (it != shard.loading.end() && it->second == flight)
        {
            shard.loading.erase(it);
        }

        if (flight->superseded)
        {
            // a write landed while loading, hand out the newer value if it is still cached
            auto newer = shard.entries.find(pos);
            if (newer != shard.entries.end())
            {
                payload = newer->second.payload;
            }
        } else if (payload)
        {
            insert(shard, pos, payload);
        }
    }

    promise.set_value(payload);

    if (over_limit())
    {
        wake_evictor();
    }
    return payload;
}

ChunkPayload ChunkCache::get(const ChunkPosition& pos)
{
    Shard& shard = shard_for(pos);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.entries.find(pos);

    if (it == shard.entries.end())
    {
        ++misses;
        return nullptr;
    }

    ++hits;
    touch(shard, it->second);
    return it->second.payload;
}

void ChunkCache::put_and_persist(const ChunkPosition& pos, ChunkPayload payload)
{
    Shard& shard = shard_for(pos);
    StoredChunk stored = encode_chunk(*payload, store.scheme());

    {
        std::lock_guard<std::mutex> persist_lock(shard.persist_mutex);

        store.put(pos, stored);

        std::lock_guard<std::mutex> lock(shard.mutex);
        supersede(shard, pos);
        insert(shard, pos, std::move(payload));
    }

    if (over_limit())
    {
        wake_evictor();
    }
}

void ChunkCache::invalidate(const ChunkPosition& pos)
{
    Shard& shard = shard_for(pos);
    std::lock_guard<std::mutex> lock(shard.mutex);

    supersede(shard, pos);
    erase(shard, pos);
}

bool ChunkCache::over_limit() const
{
    return (options.max_entries && total_entries > options.max_entries) ||
           (options.max_bytes && total_bytes > options.max_bytes);
}

void ChunkCache::trim()
{
    while (over_limit())
    {
        // find the shard whose least recently used entry is the oldest overall
        Shard* oldest = nullptr;
        uint64_t oldest_access = UINT64_MAX;

        for (auto& shard : shards)
        {
            std::lock_guard<std::mutex> lock(shard.mutex);

            if (!shard.lru.empty())
            {
                uint64_t access = shard.entries.at(shard.lru.back()).last_access;
                if (access < oldest_access)
                {
                    oldest_access = access;
                    oldest = &shard;
                }
            }
        }

        if (!oldest)
        {
            return;
        }

        std::lock_guard<std::mutex> lock(oldest->mutex);
        // the tail may have been touched since it was looked at, evicting it anyway is still LRU enough
        if (!oldest->lru.empty())
        {
            ChunkPosition victim = oldest->lru.back();
            erase(*oldest, victim);
            ++evictions;
        }
    }
}

ChunkCacheStats ChunkCache::stats() const
{
    return {hits, misses, loads, evictions, total_entries, total_bytes};
}

void ChunkCache::wake_evictor()
{
    if (!options.background_eviction)
    {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(evictor_mutex);
        evict_requested = true;
    }
    evictor_cv.notify_one();
}

void ChunkCache::evict_loop(std::stop_token stop)
{
    while (!stop.stop_requested())
    {
        {
            std::unique_lock<std::mutex> lock(evictor_mutex);
            evictor_cv.wait_for(lock, stop, options.eviction_interval, [this]() { return evict_requested; });
            evict_requested = false;
        }

        if (stop.stop_requested())
        {
            return;
        }

        trim();
    }
}
