#include "world/chunk_codec.hpp"

StoredChunk encode_chunk(const Tag& root, CompressionScheme scheme)
{
    std::vector<uint8_t> raw = encode_tag("", root);

    return StoredChunk{scheme, compress(scheme, raw)};
}

Tag decode_chunk(const StoredChunk& stored, const NbtLimits& limits)
{
    std::vector<uint8_t> raw = decompress(stored.scheme, stored.data, std::nullopt, MAX_CHUNK_SIZE);

    return decode_tag(raw, limits).tag;
}

std::vector<uint8_t> encode_network_chunk(const Tag& root)
{
    WriteBuffer wbuf(4096);

    write_network_tag(wbuf, root);
    return wbuf.to_vector();
}
