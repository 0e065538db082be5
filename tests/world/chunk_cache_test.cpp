#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>
#include <catch2/catch.hpp>
#include "test_util.hpp"

#define OVERWORLD "minecraft:overworld"

static ChunkCacheOptions foreground(size_t max_entries = 0, size_t max_bytes = 0)
{
    ChunkCacheOptions options;

    options.max_entries = max_entries;
    options.max_bytes = max_bytes;
    options.background_eviction = false;
    return options;
}

static ChunkPayload payload_with(int32_t marker)
{
    TagCompound root;
    root.put("marker", Tag::of_int(marker));
    return std::make_shared<const Tag>(Tag::of_compound(std::move(root)));
}

static int32_t marker_of(const ChunkPayload& payload)
{
    return payload->as_compound().get("marker")->as_int();
}

TEST_CASE("concurrent misses share one load", "[world][cache]")
{
    TempDir dir;
    ChunkStore store(dir.file("world.bslt"));
    ChunkCache cache(store, foreground());
    ChunkPosition pos{OVERWORLD, 3, 4};
    std::atomic<int> calls{0};

    auto slow_loader = [&]() {
        ++calls;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        return payload_with(7);
    };

    std::vector<ChunkPayload> results(16);
    std::vector<std::thread> threads;

    for (size_t i = 0; i < results.size(); ++i)
    {
        threads.emplace_back([&, i]() { results[i] = cache.get_or_load(pos, slow_loader); });
    }
    for (auto& thread : threads)
    {
        thread.join();
    }

    REQUIRE(calls == 1);
    for (const auto& result : results)
    {
        REQUIRE(result);
        REQUIRE(result.get() == results[0].get());
    }
    REQUIRE(cache.size() == 1);
    REQUIRE(cache.stats().loads == 1);
}

TEST_CASE("loader failures reach every waiter and cache nothing", "[world][cache]")
{
    TempDir dir;
    ChunkStore store(dir.file("world.bslt"));
    ChunkCache cache(store, foreground());
    ChunkPosition pos{OVERWORLD, 0, 0};
    std::atomic<int> calls{0};

    auto failing_loader = [&]() -> ChunkPayload {
        ++calls;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        throw std::runtime_error("disk on fire");
    };

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < 8; ++i)
    {
        threads.emplace_back([&]() {
            try
            {
                cache.get_or_load(pos, failing_loader);
            } catch (const std::runtime_error&)
            {
                ++failures;
            }
        });
    }
    for (auto& thread : threads)
    {
        thread.join();
    }

    REQUIRE(failures == 8);
    REQUIRE(calls >= 1);
    REQUIRE(cache.size() == 0);
    REQUIRE_FALSE(cache.get(pos));

    // the next request tries again
    REQUIRE(marker_of(cache.get_or_load(pos, []() { return payload_with(1); })) == 1);
}

TEST_CASE("writes go to the store before the cache", "[world][cache]")
{
    TempDir dir;
    std::string path = dir.file("world.bslt");
    ChunkPosition pos{OVERWORLD, -5, 9};

    {
        ChunkStore store(path);
        ChunkCache cache(store, foreground());

        cache.put_and_persist(pos, payload_with(42));

        REQUIRE(marker_of(cache.get(pos)) == 42);
        REQUIRE(decode_chunk(*store.get(pos)) == *payload_with(42));
    }

    ChunkStore reopened(path);
    REQUIRE(decode_chunk(*reopened.get(pos)) == *payload_with(42));
}

TEST_CASE("a write during a load wins over the load", "[world][cache]")
{
    TempDir dir;
    ChunkStore store(dir.file("world.bslt"));
    ChunkCache cache(store, foreground());
    ChunkPosition pos{OVERWORLD, 1, 1};
    std::atomic<bool> loading{false};

    std::thread loader_thread([&]() {
        cache.get_or_load(pos, [&]() {
            loading = true;
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            return payload_with(1);
        });
    });

    while (!loading)
    {
        std::this_thread::yield();
    }
    cache.put_and_persist(pos, payload_with(2));
    loader_thread.join();

    REQUIRE(marker_of(cache.get(pos)) == 2);
    REQUIRE(decode_chunk(*store.get(pos)) == *payload_with(2));
}

TEST_CASE("invalidation drops only the cached copy", "[world][cache]")
{
    TempDir dir;
    ChunkStore store(dir.file("world.bslt"));
    ChunkCache cache(store, foreground());
    ChunkPosition pos{OVERWORLD, 0, 0};

    cache.put_and_persist(pos, payload_with(5));
    cache.invalidate(pos);

    REQUIRE_FALSE(cache.get(pos));
    REQUIRE(cache.size() == 0);
    REQUIRE(cache.bytes() == 0);
    REQUIRE(store.contains(pos));

    int calls = 0;
    ChunkPayload reloaded = cache.get_or_load(pos, [&]() {
        ++calls;
        return std::make_shared<const Tag>(decode_chunk(*store.get(pos)));
    });
    REQUIRE(calls == 1);
    REQUIRE(marker_of(reloaded) == 5);
}

TEST_CASE("trimming evicts the least recently used entries", "[world][cache]")
{
    TempDir dir;
    ChunkStore store(dir.file("world.bslt"));
    ChunkCache cache(store, foreground(3));

    for (int i = 0; i < 5; ++i)
    {
        cache.get_or_load(ChunkPosition{OVERWORLD, i, 0}, [i]() { return payload_with(i); });
    }
    // touch chunk 0 so chunk 1 and 2 are the oldest
    REQUIRE(cache.get(ChunkPosition{OVERWORLD, 0, 0}));

    REQUIRE(cache.size() == 5);
    cache.trim();
    REQUIRE(cache.size() == 3);
    REQUIRE(cache.stats().evictions == 2);

    REQUIRE(cache.get(ChunkPosition{OVERWORLD, 0, 0}));
    REQUIRE_FALSE(cache.get(ChunkPosition{OVERWORLD, 1, 0}));
    REQUIRE_FALSE(cache.get(ChunkPosition{OVERWORLD, 2, 0}));
    REQUIRE(cache.get(ChunkPosition{OVERWORLD, 3, 0}));
    REQUIRE(cache.get(ChunkPosition{OVERWORLD, 4, 0}));
}

TEST_CASE("the byte budget bounds the cache too", "[world][cache]")
{
    TempDir dir;
    ChunkStore store(dir.file("world.bslt"));
    ChunkCache cache(store, foreground(0, 1));

    cache.get_or_load(ChunkPosition{OVERWORLD, 0, 0}, []() { return payload_with(0); });
    REQUIRE(cache.bytes() > 1);

    cache.trim();
    REQUIRE(cache.size() == 0);
    REQUIRE(cache.bytes() == 0);
}

TEST_CASE("the background evictor trims after inserts", "[world][cache]")
{
    TempDir dir;
    ChunkStore store(dir.file("world.bslt"));
    ChunkCacheOptions options;
    options.max_entries = 2;
    options.eviction_interval = std::chrono::milliseconds(10);
    ChunkCache cache(store, options);

    for (int i = 0; i < 10; ++i)
    {
        cache.get_or_load(ChunkPosition{OVERWORLD, i, 0}, [i]() { return payload_with(i); });
    }

    for (int i = 0; i < 200 && cache.size() > 2; ++i)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    REQUIRE(cache.size() <= 2);
}

TEST_CASE("hits and misses are counted", "[world][cache]")
{
    TempDir dir;
    ChunkStore store(dir.file("world.bslt"));
    ChunkCache cache(store, foreground());
    ChunkPosition pos{OVERWORLD, 0, 0};

    REQUIRE_FALSE(cache.get(pos));
    cache.get_or_load(pos, []() { return payload_with(0); });
    cache.get_or_load(pos, []() { return payload_with(1); });
    REQUIRE(cache.get(pos));

    ChunkCacheStats stats = cache.stats();
    REQUIRE(stats.misses == 2);
    REQUIRE(stats.hits == 2);
    REQUIRE(stats.loads == 1);
    REQUIRE(stats.entries == 1);
}
