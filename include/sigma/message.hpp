#pragma once
#include <functional>
#include <map>
#include <string>
#include <vector>

#include "sigma/field.hpp"
#include "sigma/tag.hpp"

namespace sigma
{

struct TaggedValue
{
    Tag tag;
    std::string data;

    bool operator==(const TaggedValue&) const = default;
};

// Schema-agnostic message: header fields by name plus tagged fields in wire order.
// Values are owned; nothing refers back into a decoded buffer.
struct Message
{
    std::map<std::string, FieldValue, std::less<>> fields;
    std::vector<TaggedValue> tagged;

    bool operator==(const Message&) const = default;
};

} // namespace sigma
