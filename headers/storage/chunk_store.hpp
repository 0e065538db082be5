#ifndef BASALT_CHUNK_STORE_HPP
#define BASALT_CHUNK_STORE_HPP


#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "compression/compression.hpp"
#include "storage/log_store.hpp"
#include "world/chunk_position.hpp"

/**
 * A chunk as it is persisted: the tag tree compressed with scheme. The store never looks inside data.
 */
struct StoredChunk
{
    CompressionScheme scheme = COMPRESSION_NONE;
    std::vector<uint8_t> data;

    bool operator==(const StoredChunk& other) const = default;
};

struct ChunkStoreOptions
{
    bool sync = false;
    /**
     * Scheme new records are written with.
     */
    CompressionScheme scheme = COMPRESSION_DEFLATE;
};

/**
 * Chunk records keyed by ChunkPosition::key(). Each value is one scheme tag byte followed by
 * the compressed tag tree.
 */
class ChunkStore
{
public:
    /**
     * @throws StoreException if the underlying log cannot be opened
     */
    explicit ChunkStore(const std::string& path, ChunkStoreOptions options = {});

    /**
     * @throws StoreException on a read error
     * @throws CorruptStreamException if the record does not start with a known scheme tag
     */
    [[nodiscard]] std::optional<StoredChunk> get(const ChunkPosition& pos) const;

    /**
     * Overwrites any previous record. Safe to retry.
     */
    void put(const ChunkPosition& pos, const StoredChunk& chunk);

    /**
     * @return false, writing nothing, if the position already has a record.
     */
    bool put_if_absent(const ChunkPosition& pos, const StoredChunk& chunk);

    /**
     * Writes every record or none of them.
     */
    void put_batch(const std::vector<std::pair<ChunkPosition, StoredChunk>>& chunks);

    [[nodiscard]] bool contains(const ChunkPosition& pos) const;

    /**
     * @return Every stored chunk of the dimension with x in [x0, x1] and z in [z0, z1], ordered by x then z.
     */
    [[nodiscard]] std::vector<std::pair<ChunkPosition, StoredChunk>> get_range(const std::string& dimension,
                                                                              int32_t x0, int32_t z0,
                                                                              int32_t x1, int32_t z1) const;

    [[nodiscard]] size_t count() const;

    void compact();

    [[nodiscard]] inline CompressionScheme scheme() const { return options.scheme; }

    [[nodiscard]] inline const LogStore& log() const { return store; }
private:
    ChunkStoreOptions options;
    LogStore store;
};

Bytes encode_record(const StoredChunk& chunk);

/**
 * @throws CorruptStreamException on an empty record or unknown scheme tag
 */
StoredChunk decode_record(const Bytes& record);


#endif //BASALT_CHUNK_STORE_HPP
