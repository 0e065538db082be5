#ifndef BASALT_TAG_HPP
#define BASALT_TAG_HPP


#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

/**
 * Tag discriminants as they appear on the wire and on disk.
 */
enum TagType : uint8_t
{
    TAG_END = 0,
    TAG_BYTE = 1,
    TAG_SHORT = 2,
    TAG_INT = 3,
    TAG_LONG = 4,
    TAG_FLOAT = 5,
    TAG_DOUBLE = 6,
    TAG_BYTE_ARRAY = 7,
    TAG_STRING = 8,
    TAG_LIST = 9,
    TAG_COMPOUND = 10,
    TAG_INT_ARRAY = 11,
    TAG_LONG_ARRAY = 12
};

#define TAG_TYPE_COUNT (13)
/**
 * Longest string value or compound key in bytes, the most its u16 length prefix holds.
 */
#define MAX_TAG_STRING_LENGTH (65535)

const char* tag_type_name(TagType type);

class Tag;

/**
 * Homogeneous list. Every item must have element_type; an empty list may have any element type.
 */
class TagList
{
public:
    TagList();

    explicit TagList(TagType element_type);

    /**
     * @throws std::invalid_argument if the tag's type differs from the list's element type
     */
    void push(Tag tag);

    [[nodiscard]] inline TagType element_type() const { return _element_type; }

    [[nodiscard]] inline const std::vector<Tag>& items() const { return _items; }

    [[nodiscard]] inline size_t size() const { return _items.size(); }

    bool operator==(const TagList& other) const;
private:
    TagType _element_type;
    std::vector<Tag> _items;
};

/**
 * String keyed map of tags. Keys are unique and their order is not significant.
 */
class TagCompound
{
public:
    using Entry = std::pair<std::string, Tag>;

    /**
     * Inserts the tag, replacing any tag already stored under name.
     * @throws std::invalid_argument if name is longer than MAX_TAG_STRING_LENGTH bytes
     */
    void put(const std::string& name, Tag tag);

    /**
     * @return The tag stored under name, or nullptr.
     */
    [[nodiscard]] const Tag* get(const std::string& name) const;

    [[nodiscard]] bool contains(const std::string& name) const;

    bool erase(const std::string& name);

    [[nodiscard]] inline size_t size() const { return entries.size(); }

    [[nodiscard]] inline bool empty() const { return entries.empty(); }

    [[nodiscard]] inline std::vector<Entry>::const_iterator begin() const { return entries.begin(); }

    [[nodiscard]] inline std::vector<Entry>::const_iterator end() const { return entries.end(); }

    bool operator==(const TagCompound& other) const;
private:
    std::vector<Entry> entries;
    /**
     * Position of each key in entries.
     */
    std::unordered_map<std::string, size_t> index;
};

/**
 * One value of the tagged tree format. The variant index is the tag's TagType.
 */
class Tag
{
public:
    using Value = std::variant<std::monostate,
            int8_t,
            int16_t,
            int32_t,
            int64_t,
            float,
            double,
            std::vector<int8_t>,
            std::string,
            TagList,
            TagCompound,
            std::vector<int32_t>,
            std::vector<int64_t>>;

    /**
     * Constructs an end tag.
     */
    Tag();

    static Tag of_byte(int8_t x);

    static Tag of_short(int16_t x);

    static Tag of_int(int32_t x);

    static Tag of_long(int64_t x);

    static Tag of_float(float x);

    static Tag of_double(double x);

    static Tag of_byte_array(std::vector<int8_t> x);

    /**
     * @throws std::invalid_argument if x is longer than MAX_TAG_STRING_LENGTH bytes
     */
    static Tag of_string(std::string x);

    static Tag of_list(TagList x);

    static Tag of_compound(TagCompound x);

    static Tag of_int_array(std::vector<int32_t> x);

    static Tag of_long_array(std::vector<int64_t> x);

    [[nodiscard]] inline TagType type() const { return static_cast<TagType>(value.index()); }

    // accessors throw std::bad_variant_access on a type mismatch
    [[nodiscard]] int8_t as_byte() const;

    [[nodiscard]] int16_t as_short() const;

    [[nodiscard]] int32_t as_int() const;

    [[nodiscard]] int64_t as_long() const;

    [[nodiscard]] float as_float() const;

    [[nodiscard]] double as_double() const;

    [[nodiscard]] const std::vector<int8_t>& as_byte_array() const;

    [[nodiscard]] const std::string& as_string() const;

    [[nodiscard]] const TagList& as_list() const;

    [[nodiscard]] const TagCompound& as_compound() const;

    [[nodiscard]] TagCompound& as_compound();

    [[nodiscard]] const std::vector<int32_t>& as_int_array() const;

    [[nodiscard]] const std::vector<int64_t>& as_long_array() const;

    bool operator==(const Tag& other) const;
private:
    explicit Tag(Value value);

    Value value;
};


#endif //BASALT_TAG_HPP
