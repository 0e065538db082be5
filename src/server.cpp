#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <poll.h>
#include <unistd.h>
#include "server.hpp"
#include "basaltutil.hpp"
#include "exceptions.hpp"
#include "loggerimpl.hpp"
#include "core/task_pool.hpp"
#include "network/cipher.hpp"
#include "network/handler.hpp"
#include "network/status.hpp"
#include "network/tcpserver.hpp"
#include "storage/chunk_store.hpp"
#include "storage/region_file.hpp"
#include "world/chunk_cache.hpp"
#include "world/chunk_generator.hpp"
#include "world/command.hpp"
#include "world/world.hpp"

static std::atomic<bool> running{false};

bool is_running()
{
    return running.load();
}

// tick scheduler pulled from Minestom
constexpr double TICKS_PER_SECOND = 20.0;
constexpr uint64_t TICK_TIME_NANOS = 1000000000L / TICKS_PER_SECOND;
constexpr uint64_t SERVER_MAX_TICK_CATCH_UP = 5;
constexpr uint64_t SLEEP_THRESHOLD = 2000; // ns
/**
 * Connection maintenance runs once a second.
 */
constexpr uint64_t MAINTENANCE_TICKS = 20;
constexpr int CONSOLE_POLL_MS = 250;

using std::chrono::steady_clock;
using std::chrono::milliseconds;
using std::this_thread::sleep_for;

using std::chrono::duration_cast;

static uint64_t nanotime()
{
    return duration_cast<std::chrono::nanoseconds>(steady_clock::now().time_since_epoch()).count();
}

/**
 * Tries to sleep until the given time
 * @param until Nanosecond timescale time stamp about when to wake up
 */
static inline void sleep_until(uint64_t until)
{
    uint64_t now;

    while ((now = nanotime()) < until)
    {
        uint64_t remaining_ns = until - now;

        // Sleep less the closer we are to the next tick, and spin the last couple of microseconds
        if (remaining_ns >= SLEEP_THRESHOLD)
        {
            sleep_for(milliseconds(remaining_ns / 2000000L));
        }
    }
}

static void tick(uint64_t tick_count)
{
    if (tick_count % MAINTENANCE_TICKS == 0)
    {
        tcp_maintenance();
    }
}

static void loop()
{
    uint64_t ticks = 0;
    uint64_t total_ticks = 0;
    // The time when ticks started occurring, used to predict when any tick should start.
    uint64_t base_time = nanotime();
    uint64_t next_start;

    while (running)
    {
        tick(total_ticks++);
        ++ticks;

        next_start = base_time + TICK_TIME_NANOS * ticks;
        sleep_until(next_start);

        // If the server gets too far behind, reset instead of running a burst of catch-up ticks.
        if (nanotime() > next_start + TICK_TIME_NANOS * SERVER_MAX_TICK_CATCH_UP)
        {
            base_time = nanotime();
            ticks = 0;
        }
    }
}

static void console_thread(ChunkStore& store, ChunkCache& cache)
{
    std::string in;
    pollfd pfd{STDIN_FILENO, POLLIN, 0};

    while (running)
    {
        // wake up regularly so a stop from elsewhere is noticed
        if (poll(&pfd, 1, CONSOLE_POLL_MS) <= 0)
        {
            continue;
        }
        if (!std::getline(std::cin, in))
        {
            return;
        }

        if (in == "stop")
        {
            logger().info("Stopping...");
            server_stop();
        } else if (in == "status")
        {
            ChunkCacheStats stats = cache.stats();
            logger().info("%zu connections, %zu chunks stored, cache %zu entries / %zu bytes, %llu hits, %llu misses, "
                          "%llu evictions", tcp_connection_count(), store.count(), stats.entries, stats.bytes,
                          static_cast<unsigned long long>(stats.hits), static_cast<unsigned long long>(stats.misses),
                          static_cast<unsigned long long>(stats.evictions));
        } else if (in == "compact")
        {
            try
            {
                store.compact();
                logger().info("Compacted %s (%llu bytes)", store.log().path().c_str(),
                              static_cast<unsigned long long>(store.log().file_size()));
            } catch (const StoreException& e)
            {
                logger().err("Compaction failed: %s", e.what());
            }
        } else if (!in.empty())
        {
            logger().info("Commands: stop, status, compact");
        }
    }
}

static bool import_regions(const ServerConfig& config, ChunkStore& store)
{
    try
    {
        ImportReport report = import_region_directory(store, config.import_region_dir, config.level_dimension);
        logger().info("Imported %zu chunks from %s (%zu warnings)", report.imported, config.import_region_dir.c_str(),
                      report.warnings.size());
        return true;
    } catch (const StoreException& e)
    {
        logger().err("Region import failed: %s", e.what());
        return false;
    }
}

bool server_start(const ServerConfig& config)
{
    auto start = steady_clock::now();

    if (running)
    {
        logger().err("Invocation of server_start() when already running!");
        return false;
    }

    logger().set_level(config.log_level);
    logger().info("Starting basalt (%s, protocol %i) on %s:%u", config.version_name.c_str(), config.protocol_version,
                  config.server_ip.c_str(), config.server_port);
    debug(logger().info("Packet tracing is on");)

    if (!scheme_available(config.store_compression))
    {
        logger().err("store-compression %s is not available in this build", scheme_name(config.store_compression));
        return false;
    }

    std::unique_ptr<ChunkStore> store;

    try
    {
        store = std::make_unique<ChunkStore>(config.store_path, ChunkStoreOptions{config.store_sync,
                                                                                  config.store_compression});
    } catch (const StoreException& e)
    {
        logger().err("Unable to open the world store: %s", e.what());
        return false;
    }

    logger().info("Opened %s: %zu chunks", config.store_path.c_str(), store->count());

    if (!config.import_region_dir.empty() && !import_regions(config, *store))
    {
        return false;
    }

    ChunkCacheOptions cache_options;
    cache_options.max_entries = config.cache_max_entries;
    cache_options.max_bytes = config.cache_max_bytes;

    ChunkCache cache(*store, cache_options);
    FlatChunkGenerator generator;
    World world(*store, cache, generator, NbtLimits{config.nbt_max_depth});
    LoggingCommandSink commands;

    std::unique_ptr<KeyPair> keys;
    if (config.online_mode)
    {
        keys = std::make_unique<KeyPair>();
        debug(logger().info("Generated public encryption key (%zu bytes)", keys->public_der().size());)
    }

    ServerContext ctx(config, world, commands, keys.get());
    ctx.favicon = load_favicon(config.favicon);

    TaskPool chunk_pool(config.chunk_workers);

    running = true;

    if (!tcp_init(config, ctx, chunk_pool))
    {
        logger().err("Failed to initialize!");
        running = false;
        return false;
    }

    tcp_start();

    logger().info("Done (%lld ms)", static_cast<long long>(
            duration_cast<milliseconds>(steady_clock::now() - start).count()));

    std::thread console(console_thread, std::ref(*store), std::ref(cache));
    loop();
    console.join();

    // drain chunk loads before the workers and the world go away
    chunk_pool.shutdown();
    tcp_stop();

    logger().info("Stopped after %llu generated chunks and %llu commands",
                  static_cast<unsigned long long>(world.generated()),
                  static_cast<unsigned long long>(commands.received()));
    return true;
}

void server_stop()
{
    running = false;
}
