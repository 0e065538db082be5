#include <algorithm>
#include <stdexcept>
#include "nbt/tag.hpp"

const char* tag_type_name(TagType type)
{
    switch (type)
    {
        case TAG_END:
            return "end";
        case TAG_BYTE:
            return "byte";
        case TAG_SHORT:
            return "short";
        case TAG_INT:
            return "int";
        case TAG_LONG:
            return "long";
        case TAG_FLOAT:
            return "float";
        case TAG_DOUBLE:
            return "double";
        case TAG_BYTE_ARRAY:
            return "byte_array";
        case TAG_STRING:
            return "string";
        case TAG_LIST:
            return "list";
        case TAG_COMPOUND:
            return "compound";
        case TAG_INT_ARRAY:
            return "int_array";
        case TAG_LONG_ARRAY:
            return "long_array";
    }
    return "unknown";
}

TagList::TagList() : _element_type(TAG_END)
{}

TagList::TagList(TagType element_type) : _element_type(element_type)
{}

void TagList::push(Tag tag)
{
    if (_items.empty() && _element_type == TAG_END)
    {
        // an untyped empty list adopts the type of its first item
        _element_type = tag.type();
    }
    else if (tag.type() != _element_type)
    {
        throw std::invalid_argument(std::string("cannot add ") + tag_type_name(tag.type()) + " to a list of " +
                                    tag_type_name(_element_type));
    }
    if (tag.type() == TAG_END)
    {
        throw std::invalid_argument("end tags cannot be list items");
    }
    _items.push_back(std::move(tag));
}

bool TagList::operator==(const TagList& other) const
{
    return _element_type == other._element_type && _items == other._items;
}

static void check_string_length(const std::string& str, const char* what)
{
    if (str.size() > MAX_TAG_STRING_LENGTH)
    {
        throw std::invalid_argument(std::string(what) + " of " + std::to_string(str.size()) + " bytes exceeds " +
                                    std::to_string(MAX_TAG_STRING_LENGTH));
    }
}

void TagCompound::put(const std::string& name, Tag tag)
{
    auto it = index.find(name);

    if (it != index.end())
    {
        entries[it->second].second = std::move(tag);
        return;
    }

    check_string_length(name, "compound key");
    index.emplace(name, entries.size());
    entries.emplace_back(name, std::move(tag));
}

const Tag* TagCompound::get(const std::string& name) const
{
    auto it = index.find(name);
    return it == index.end() ? nullptr : &entries[it->second].second;
}

bool TagCompound::contains(const std::string& name) const
{
    return index.contains(name);
}

bool TagCompound::erase(const std::string& name)
{
    auto it = index.find(name);

    if (it == index.end())
    {
        return false;
    }

    // order is not significant, so the last entry fills the hole
    size_t slot = it->second;
    index.erase(it);
    if (slot != entries.size() - 1)
    {
        entries[slot] = std::move(entries.back());
        index[entries[slot].first] = slot;
    }
    entries.pop_back();
    return true;
}

bool TagCompound::operator==(const TagCompound& other) const
{
    if (entries.size() != other.entries.size())
    {
        return false;
    }
    // keys are unique, so equal sizes plus every key matching means equal maps
    return std::all_of(entries.begin(), entries.end(), [&other](const Entry& entry) {
        const Tag* tag = other.get(entry.first);
        return tag && *tag == entry.second;
    });
}

Tag::Tag() = default;

Tag::Tag(Value value) : value(std::move(value))
{}

Tag Tag::of_byte(int8_t x)
{
    return Tag(Value(std::in_place_index<TAG_BYTE>, x));
}

Tag Tag::of_short(int16_t x)
{
    return Tag(Value(std::in_place_index<TAG_SHORT>, x));
}

Tag Tag::of_int(int32_t x)
{
    return Tag(Value(std::in_place_index<TAG_INT>, x));
}

Tag Tag::of_long(int64_t x)
{
    return Tag(Value(std::in_place_index<TAG_LONG>, x));
}

Tag Tag::of_float(float x)
{
    return Tag(Value(std::in_place_index<TAG_FLOAT>, x));
}

Tag Tag::of_double(double x)
{
    return Tag(Value(std::in_place_index<TAG_DOUBLE>, x));
}

Tag Tag::of_byte_array(std::vector<int8_t> x)
{
    return Tag(Value(std::in_place_index<TAG_BYTE_ARRAY>, std::move(x)));
}

Tag Tag::of_string(std::string x)
{
    check_string_length(x, "string");
    return Tag(Value(std::in_place_index<TAG_STRING>, std::move(x)));
}

Tag Tag::of_list(TagList x)
{
    return Tag(Value(std::in_place_index<TAG_LIST>, std::move(x)));
}

Tag Tag::of_compound(TagCompound x)
{
    return Tag(Value(std::in_place_index<TAG_COMPOUND>, std::move(x)));
}

Tag Tag::of_int_array(std::vector<int32_t> x)
{
    return Tag(Value(std::in_place_index<TAG_INT_ARRAY>, std::move(x)));
}

Tag Tag::of_long_array(std::vector<int64_t> x)
{
    return Tag(Value(std::in_place_index<TAG_LONG_ARRAY>, std::move(x)));
}

int8_t Tag::as_byte() const
{
    return std::get<TAG_BYTE>(value);
}

int16_t Tag::as_short() const
{
    return std::get<TAG_SHORT>(value);
}

int32_t Tag::as_int() const
{
    return std::get<TAG_INT>(value);
}

int64_t Tag::as_long() const
{
    return std::get<TAG_LONG>(value);
}

float Tag::as_float() const
{
    return std::get<TAG_FLOAT>(value);
}

double Tag::as_double() const
{
    return std::get<TAG_DOUBLE>(value);
}

const std::vector<int8_t>& Tag::as_byte_array() const
{
    return std::get<TAG_BYTE_ARRAY>(value);
}

const std::string& Tag::as_string() const
{
    return std::get<TAG_STRING>(value);
}

const TagList& Tag::as_list() const
{
    return std::get<TAG_LIST>(value);
}

const TagCompound& Tag::as_compound() const
{
    return std::get<TAG_COMPOUND>(value);
}

TagCompound& Tag::as_compound()
{
    return std::get<TAG_COMPOUND>(value);
}

const std::vector<int32_t>& Tag::as_int_array() const
{
    return std::get<TAG_INT_ARRAY>(value);
}

const std::vector<int64_t>& Tag::as_long_array() const
{
    return std::get<TAG_LONG_ARRAY>(value);
}

bool Tag::operator==(const Tag& other) const
{
    return value == other.value;
}
