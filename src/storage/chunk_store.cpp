#include "storage/chunk_store.hpp"
#include "exceptions.hpp"

Bytes encode_record(const StoredChunk& chunk)
{
    Bytes record;

    record.reserve(1 + chunk.data.size());
    record.push_back(chunk.scheme);
    record.insert(record.end(), chunk.data.begin(), chunk.data.end());
    return record;
}

StoredChunk decode_record(const Bytes& record)
{
    StoredChunk chunk;

    if (record.empty())
    {
        throw CorruptStreamException("empty chunk record");
    }
    if (!scheme_from_tag(record[0], chunk.scheme))
    {
        throw CorruptStreamException("chunk record has unknown scheme tag " + std::to_string(record[0]));
    }

    chunk.data.assign(record.begin() + 1, record.end());
    return chunk;
}

ChunkStore::ChunkStore(const std::string& path, ChunkStoreOptions options) : options(options),
                                                                             store(path, LogStoreOptions{options.sync})
{}

std::optional<StoredChunk> ChunkStore::get(const ChunkPosition& pos) const
{
    std::optional<Bytes> record = store.get(pos.key());

    if (!record)
    {
        return std::nullopt;
    }
    return decode_record(*record);
}

void ChunkStore::put(const ChunkPosition& pos, const StoredChunk& chunk)
{
    store.put(pos.key(), encode_record(chunk));
}

bool ChunkStore::put_if_absent(const ChunkPosition& pos, const StoredChunk& chunk)
{
    return store.put_if_absent(pos.key(), encode_record(chunk));
}

void ChunkStore::put_batch(const std::vector<std::pair<ChunkPosition, StoredChunk>>& chunks)
{
    WriteBatch batch;

    for (const auto& [pos, chunk] : chunks)
    {
        batch.put(pos.key(), encode_record(chunk));
    }
    store.write(batch);
}

bool ChunkStore::contains(const ChunkPosition& pos) const
{
    return store.contains(pos.key());
}

std::vector<std::pair<ChunkPosition, StoredChunk>> ChunkStore::get_range(const std::string& dimension,
                                                                         int32_t x0, int32_t z0,
                                                                         int32_t x1, int32_t z1) const
{
    std::vector<std::pair<ChunkPosition, StoredChunk>> out;

    if (x0 > x1 || z0 > z1)
    {
        return out;
    }

    // keys sort by x then z, so the range covers whole columns of x and filters z
    Bytes begin = ChunkPosition{dimension, x0, z0}.key();
    Bytes end = ChunkPosition{dimension, x1, z1}.key();
    end.push_back(0);

    store.scan(begin, end, [&](const Bytes& key, const Bytes& value) {
        ChunkPosition pos;

        if (ChunkPosition::from_key(key.data(), key.size(), pos) && pos.dimension == dimension &&
            pos.z >= z0 && pos.z <= z1)
        {
            out.emplace_back(std::move(pos), decode_record(value));
        }
        return true;
    });
    return out;
}

size_t ChunkStore::count() const
{
    return store.size();
}

void ChunkStore::compact()
{
    store.compact();
}
