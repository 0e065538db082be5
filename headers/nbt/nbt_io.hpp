#ifndef BASALT_NBT_IO_HPP
#define BASALT_NBT_IO_HPP


#include <string>
#include "codec/readbuffer.hpp"
#include "codec/writebuffer.hpp"
#include "nbt/tag.hpp"

/**
 * Default bound on list/compound nesting accepted from untrusted input.
 */
#define NBT_MAX_DEPTH (512)

struct NbtLimits
{
    int max_depth = NBT_MAX_DEPTH;
};

struct NamedTag
{
    std::string name;
    Tag tag;
};

/**
 * Writes a root tag in the disk format: type byte, u16 name, payload.
 */
void write_tag(WriteBuffer& out, const std::string& name, const Tag& tag);

/**
 * Writes a root tag in the network format, which omits the root name.
 */
void write_network_tag(WriteBuffer& out, const Tag& tag);

/**
 * Reads a root tag in the disk format.
 *
 * @throws UnknownTagIdException on an unrecognised type byte
 * @throws DepthExceededException when nesting passes limits.max_depth
 * @throws LengthOverflowException on a negative array or list length
 * @throws TruncatedException if the input ends early or a declared length cannot fit in what remains
 */
NamedTag read_tag(ReadBuffer& in, const NbtLimits& limits = {});

/**
 * Reads a root tag in the network format.
 */
Tag read_network_tag(ReadBuffer& in, const NbtLimits& limits = {});

/**
 * @return Exact size of the tag's payload in bytes (no type byte or name), without encoding it.
 */
size_t tag_payload_size(const Tag& tag);

std::vector<uint8_t> encode_tag(const std::string& name, const Tag& tag);

/**
 * Decodes bytes holding exactly one named root tag.
 * @throws TrailingBytesException if bytes follow the root tag
 */
NamedTag decode_tag(const std::vector<uint8_t>& bytes, const NbtLimits& limits = {});


#endif //BASALT_NBT_IO_HPP
