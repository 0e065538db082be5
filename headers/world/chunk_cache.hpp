#ifndef BASALT_CHUNK_CACHE_HPP
#define BASALT_CHUNK_CACHE_HPP


#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <unordered_map>
#include "storage/chunk_store.hpp"
#include "world/chunk_codec.hpp"
#include "world/chunk_position.hpp"

#define CACHE_SHARDS (16)

using ChunkLoader = std::function<ChunkPayload()>;

struct ChunkCacheOptions
{
    /**
     * 0 disables the limit.
     */
    size_t max_entries = 4096;
    /**
     * Budget for the encoded size of cached tag trees. 0 disables the limit.
     */
    size_t max_bytes = 256 * 1024 * 1024;
    /**
     * Run a thread that trims the cache whenever an insert pushes it over a limit.
     */
    bool background_eviction = true;
    std::chrono::milliseconds eviction_interval{250};
};

struct ChunkCacheStats
{
    uint64_t hits;
    uint64_t misses;
    uint64_t loads;
    uint64_t evictions;
    size_t entries;
    size_t bytes;
};

/**
 * Bounded, sharded, write-through cache of decoded chunks in front of the ChunkStore.
 *
 * get_or_load() runs at most one loader per missing key at a time; every other caller for that
 * key waits on the same result. A waiter that goes away does not cancel the load. Writes go to
 * the store before the cache, and a write or invalidation supersedes any load already in flight
 * for that key so the load can never put an older payload back.
 */
class ChunkCache
{
public:
    ChunkCache(ChunkStore& store, ChunkCacheOptions options);

    ~ChunkCache();

    ChunkCache(const ChunkCache&) = delete;

    ChunkCache& operator=(const ChunkCache&) = delete;

    /**
     * @return The cached payload, or the loader's result. Loader exceptions reach every caller
     *         waiting on that load and nothing is cached.
     */
    ChunkPayload get_or_load(const ChunkPosition& pos, const ChunkLoader& loader);

    /**
     * Cache-only lookup.
     * @return nullptr on a miss.
     */
    ChunkPayload get(const ChunkPosition& pos);

    /**
     * Encodes the payload, puts it to the store and then replaces the cache entry. If the store
     * put throws, the cache is left untouched.
     */
    void put_and_persist(const ChunkPosition& pos, ChunkPayload payload);

    /**
     * Drops the entry without touching the store.
     */
    void invalidate(const ChunkPosition& pos);

    /**
     * Evicts least recently used entries until both limits hold.
     */
    void trim();

    [[nodiscard]] ChunkCacheStats stats() const;

    [[nodiscard]] inline size_t size() const { return total_entries; }

    [[nodiscard]] inline size_t bytes() const { return total_bytes; }
private:
    struct Entry
    {
        ChunkPayload payload;
        size_t cost;
        uint64_t last_access;
        std::list<ChunkPosition>::iterator lru;
    };

    struct InFlight
    {
        std::shared_future<ChunkPayload> result;
        bool superseded = false;
    };

    struct Shard
    {
        std::mutex mutex;
        /**
         * Serializes put_and_persist for the shard so store order and cache order agree.
         */
        std::mutex persist_mutex;
        /**
         * Most recently used at the front.
         */
        std::list<ChunkPosition> lru;
        std::unordered_map<ChunkPosition, Entry, ChunkPositionHash> entries;
        std::unordered_map<ChunkPosition, std::shared_ptr<InFlight>, ChunkPositionHash> loading;
    };

    Shard& shard_for(const ChunkPosition& pos);

    void touch(Shard& shard, Entry& entry);

    /**
     * Requires shard.mutex.
     */
    void insert(Shard& shard, const ChunkPosition& pos, ChunkPayload payload);

    /**
     * Requires shard.mutex.
     */
    void erase(Shard& shard, const ChunkPosition& pos);

    /**
     * Requires shard.mutex.
     */
    void supersede(Shard& shard, const ChunkPosition& pos);

    [[nodiscard]] bool over_limit() const;

    void wake_evictor();

    void evict_loop(std::stop_token stop);

    ChunkStore& store;
    ChunkCacheOptions options;
    Shard shards[CACHE_SHARDS];

    std::atomic<uint64_t> clock{0};
    std::atomic<size_t> total_entries{0};
    std::atomic<size_t> total_bytes{0};
    std::atomic<uint64_t> hits{0};
    std::atomic<uint64_t> misses{0};
    std::atomic<uint64_t> loads{0};
    std::atomic<uint64_t> evictions{0};

    std::mutex evictor_mutex;
    std::condition_variable_any evictor_cv;
    bool evict_requested = false;
    std::jthread evictor;
};


#endif //BASALT_CHUNK_CACHE_HPP
