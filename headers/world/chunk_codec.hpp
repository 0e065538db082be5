#ifndef BASALT_CHUNK_CODEC_HPP
#define BASALT_CHUNK_CODEC_HPP


#include <memory>
#include <vector>
#include "nbt/nbt_io.hpp"
#include "nbt/tag.hpp"
#include "storage/chunk_store.hpp"

/**
 * Largest decompressed chunk tag tree accepted from the store or a region file.
 */
#define MAX_CHUNK_SIZE (32 * 1024 * 1024)

/**
 * A decoded chunk. Immutable once built so every holder can share it.
 */
using ChunkPayload = std::shared_ptr<const Tag>;

/**
 * Serializes the tag tree as a nameless-root disk tag and compresses it.
 */
StoredChunk encode_chunk(const Tag& root, CompressionScheme scheme);

/**
 * @throws DecodeException subclasses if the record does not decompress or parse
 */
Tag decode_chunk(const StoredChunk& stored, const NbtLimits& limits = {});

/**
 * Network form of the chunk (nameless root), as carried in the chunk data packet.
 */
std::vector<uint8_t> encode_network_chunk(const Tag& root);


#endif //BASALT_CHUNK_CODEC_HPP
