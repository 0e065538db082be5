#include <stdexcept>
#include <string>
#include "nbt/nbt_io.hpp"
#include "exceptions.hpp"

static void write_nbt_string(WriteBuffer& out, const std::string& str)
{
    // tags cannot hold longer strings, only a root name can get here
    if (str.size() > MAX_TAG_STRING_LENGTH)
    {
        throw std::invalid_argument("tag name of " + std::to_string(str.size()) + " bytes exceeds " +
                                    std::to_string(MAX_TAG_STRING_LENGTH));
    }
    out.write_short(static_cast<int16_t>(static_cast<uint16_t>(str.size())));
    out.write_bytes(reinterpret_cast<const uint8_t*>(str.data()), str.size());
}

static void write_payload(WriteBuffer& out, const Tag& tag)
{
    switch (tag.type())
    {
        case TAG_END:
            break;
        case TAG_BYTE:
            out.write_byte(tag.as_byte());
            break;
        case TAG_SHORT:
            out.write_short(tag.as_short());
            break;
        case TAG_INT:
            out.write_int(tag.as_int());
            break;
        case TAG_LONG:
            out.write_long(tag.as_long());
            break;
        case TAG_FLOAT:
            out.write_float(tag.as_float());
            break;
        case TAG_DOUBLE:
            out.write_double(tag.as_double());
            break;
        case TAG_BYTE_ARRAY:
        {
            const auto& bytes = tag.as_byte_array();
            out.write_int(static_cast<int32_t>(bytes.size()));
            out.write_bytes(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size());
            break;
        }
        case TAG_STRING:
            write_nbt_string(out, tag.as_string());
            break;
        case TAG_LIST:
        {
            const auto& list = tag.as_list();
            out.write_ubyte(list.element_type());
            out.write_int(static_cast<int32_t>(list.size()));
            for (const auto& item : list.items())
            {
                write_payload(out, item);
            }
            break;
        }
        case TAG_COMPOUND:
            for (const auto& [name, child] : tag.as_compound())
            {
                out.write_ubyte(child.type());
                write_nbt_string(out, name);
                write_payload(out, child);
            }
            out.write_ubyte(TAG_END);
            break;
        case TAG_INT_ARRAY:
        {
            const auto& ints = tag.as_int_array();
            out.write_int(static_cast<int32_t>(ints.size()));
            for (int32_t x : ints)
            {
                out.write_int(x);
            }
            break;
        }
        case TAG_LONG_ARRAY:
        {
            const auto& longs = tag.as_long_array();
            out.write_int(static_cast<int32_t>(longs.size()));
            for (int64_t x : longs)
            {
                out.write_long(x);
            }
            break;
        }
    }
}

void write_tag(WriteBuffer& out, const std::string& name, const Tag& tag)
{
    out.write_ubyte(tag.type());
    if (tag.type() != TAG_END)
    {
        write_nbt_string(out, name);
        write_payload(out, tag);
    }
}

void write_network_tag(WriteBuffer& out, const Tag& tag)
{
    out.write_ubyte(tag.type());
    write_payload(out, tag);
}

/**
 * Smallest number of bytes one payload of the given type occupies, used to reject
 * lengths that cannot possibly fit before anything is allocated.
 */
static size_t min_payload_size(TagType type)
{
    switch (type)
    {
        case TAG_END:
            return 0;
        case TAG_BYTE:
            return 1;
        case TAG_SHORT:
        case TAG_STRING:
            return 2;
        case TAG_INT:
        case TAG_FLOAT:
        case TAG_BYTE_ARRAY:
        case TAG_INT_ARRAY:
        case TAG_LONG_ARRAY:
            return 4;
        case TAG_LONG:
        case TAG_DOUBLE:
            return 8;
        case TAG_LIST:
            return 5;
        case TAG_COMPOUND:
            return 1;
    }
    return 1;
}

static TagType read_type(ReadBuffer& in)
{
    uint8_t id = in.read_uchar();

    if (id >= TAG_TYPE_COUNT)
    {
        throw UnknownTagIdException("unknown tag id " + std::to_string(id));
    }
    return static_cast<TagType>(id);
}

static std::string read_nbt_string(ReadBuffer& in)
{
    uint16_t size = in.read_ushort();
    std::string str(size, '\0');

    in.read_bytes(reinterpret_cast<uint8_t*>(str.data()), size);
    return str;
}

/**
 * Reads an i32 element count and checks it against what is left in the buffer.
 */
static size_t read_count(ReadBuffer& in, size_t element_size)
{
    int32_t count = in.read_int();

    if (count < 0)
    {
        throw LengthOverflowException("negative tag length " + std::to_string(count));
    }
    if (element_size && static_cast<uint64_t>(count) * element_size > in.remaining())
    {
        throw TruncatedException("tag length " + std::to_string(count) + " exceeds the " +
                                 std::to_string(in.remaining()) + " bytes remaining");
    }
    return static_cast<size_t>(count);
}

static Tag read_payload(ReadBuffer& in, TagType type, int depth, const NbtLimits& limits)
{
    switch (type)
    {
        case TAG_END:
            return {};
        case TAG_BYTE:
            return Tag::of_byte(in.read_char());
        case TAG_SHORT:
            return Tag::of_short(in.read_short());
        case TAG_INT:
            return Tag::of_int(in.read_int());
        case TAG_LONG:
            return Tag::of_long(in.read_long());
        case TAG_FLOAT:
            return Tag::of_float(in.read_float());
        case TAG_DOUBLE:
            return Tag::of_double(in.read_double());
        case TAG_BYTE_ARRAY:
        {
            std::vector<int8_t> bytes(read_count(in, 1));
            in.read_bytes(reinterpret_cast<uint8_t*>(bytes.data()), bytes.size());
            return Tag::of_byte_array(std::move(bytes));
        }
        case TAG_STRING:
            return Tag::of_string(read_nbt_string(in));
        case TAG_LIST:
        {
            if (depth >= limits.max_depth)
            {
                throw DepthExceededException("tag nesting exceeds " + std::to_string(limits.max_depth));
            }

            TagType element_type = read_type(in);
            size_t count = read_count(in, min_payload_size(element_type));

            if (element_type == TAG_END && count)
            {
                throw CorruptStreamException("list of end tags with " + std::to_string(count) + " items");
            }

            TagList list(element_type);
            for (size_t i = 0; i < count; ++i)
            {
                list.push(read_payload(in, element_type, depth + 1, limits));
            }
            return Tag::of_list(std::move(list));
        }
        case TAG_COMPOUND:
        {
            if (depth >= limits.max_depth)
            {
                throw DepthExceededException("tag nesting exceeds " + std::to_string(limits.max_depth));
            }

            TagCompound compound;
            TagType child_type;
            while ((child_type = read_type(in)) != TAG_END)
            {
                std::string name = read_nbt_string(in);
                compound.put(name, read_payload(in, child_type, depth + 1, limits));
            }
            return Tag::of_compound(std::move(compound));
        }
        case TAG_INT_ARRAY:
        {
            std::vector<int32_t> ints(read_count(in, 4));
            for (int32_t& x : ints)
            {
                x = in.read_int();
            }
            return Tag::of_int_array(std::move(ints));
        }
        case TAG_LONG_ARRAY:
        {
            std::vector<int64_t> longs(read_count(in, 8));
            for (int64_t& x : longs)
            {
                x = in.read_long();
            }
            return Tag::of_long_array(std::move(longs));
        }
    }
    throw UnknownTagIdException("unknown tag id " + std::to_string(type));
}

NamedTag read_tag(ReadBuffer& in, const NbtLimits& limits)
{
    TagType type = read_type(in);

    if (type == TAG_END)
    {
        return {};
    }

    std::string name = read_nbt_string(in);
    Tag tag = read_payload(in, type, 0, limits);
    return {std::move(name), std::move(tag)};
}

Tag read_network_tag(ReadBuffer& in, const NbtLimits& limits)
{
    return read_payload(in, read_type(in), 0, limits);
}

size_t tag_payload_size(const Tag& tag)
{
    switch (tag.type())
    {
        case TAG_END:
            return 0;
        case TAG_BYTE:
            return 1;
        case TAG_SHORT:
            return 2;
        case TAG_INT:
        case TAG_FLOAT:
            return 4;
        case TAG_LONG:
        case TAG_DOUBLE:
            return 8;
        case TAG_BYTE_ARRAY:
            return 4 + tag.as_byte_array().size();
        case TAG_STRING:
            return 2 + tag.as_string().size();
        case TAG_LIST:
        {
            size_t size = 5;
            for (const auto& item : tag.as_list().items())
            {
                size += tag_payload_size(item);
            }
            return size;
        }
        case TAG_COMPOUND:
        {
            size_t size = 1;
            for (const auto& [name, child] : tag.as_compound())
            {
                size += 3 + name.size() + tag_payload_size(child);
            }
            return size;
        }
        case TAG_INT_ARRAY:
            return 4 + 4 * tag.as_int_array().size();
        case TAG_LONG_ARRAY:
            return 4 + 8 * tag.as_long_array().size();
    }
    return 0;
}

std::vector<uint8_t> encode_tag(const std::string& name, const Tag& tag)
{
    WriteBuffer out(256);

    write_tag(out, name, tag);
    return out.to_vector();
}

NamedTag decode_tag(const std::vector<uint8_t>& bytes, const NbtLimits& limits)
{
    ReadBuffer in(bytes);
    NamedTag named = read_tag(in, limits);

    in.expect_end();
    return named;
}
