#include "sigma/request.hpp"
#include "sigma/schema.hpp"

#include <openssl/rand.h>
#include <array>

namespace sigma
{

SigmaRequest& SigmaRequest::set_saf(std::string_view v)
{
    saf_ = std::string(v);
    return *this;
}

SigmaRequest& SigmaRequest::set_source(std::string_view v)
{
    source_ = std::string(v);
    return *this;
}

SigmaRequest& SigmaRequest::set_mti(std::string_view v)
{
    mti_ = std::string(v);
    return *this;
}

SigmaRequest& SigmaRequest::set_auth_serno(uint64_t v)
{
    auth_serno_ = v;
    return *this;
}

SigmaRequest& SigmaRequest::set_tag(uint16_t tag, std::string_view v)
{
    tags_.insert_or_assign(tag, std::string(v));
    return *this;
}

SigmaRequest& SigmaRequest::set_iso_field(uint16_t field, std::string_view v)
{
    iso_fields_.insert_or_assign(field, std::string(v));
    return *this;
}

SigmaRequest& SigmaRequest::set_iso_subfield(uint16_t field, uint8_t sub, std::string_view v)
{
    iso_subfields_.insert_or_assign(std::pair{field, sub}, std::string(v));
    return *this;
}

SigmaRequest& SigmaRequest::set(const Tag& tag, std::string_view v)
{
    switch (tag.cls)
    {
        case TagClass::regular:      return set_tag(tag.number, v);
        case TagClass::iso:          return set_iso_field(tag.number, v);
        case TagClass::iso_subfield: return set_iso_subfield(tag.number, tag.sub, v);
    }
    return *this;
}

std::optional<std::string_view> SigmaRequest::tag(uint16_t tag) const
{
    auto it = tags_.find(tag);
    return it == tags_.end() ? std::nullopt : std::optional<std::string_view>(it->second);
}

std::optional<std::string_view> SigmaRequest::iso_field(uint16_t field) const
{
    auto it = iso_fields_.find(field);
    return it == iso_fields_.end() ? std::nullopt : std::optional<std::string_view>(it->second);
}

std::optional<std::string_view> SigmaRequest::iso_subfield(uint16_t field, uint8_t sub) const
{
    auto it = iso_subfields_.find(std::pair{field, sub});
    return it == iso_subfields_.end() ? std::nullopt : std::optional<std::string_view>(it->second);
}

Message SigmaRequest::to_message() const
{
    Message msg;
    if (saf_)        msg.fields.emplace(field_names::saf, *saf_);
    if (source_)     msg.fields.emplace(field_names::source, *source_);
    if (mti_)        msg.fields.emplace(field_names::mti, *mti_);
    if (auth_serno_) msg.fields.emplace(field_names::serno, *auth_serno_);

    msg.tagged.reserve(tags_.size() + iso_fields_.size() + iso_subfields_.size());
    for (const auto& [k, v] : tags_)
    {
        msg.tagged.push_back({regular_tag(k), v});
    }
    for (const auto& [k, v] : iso_fields_)
    {
        msg.tagged.push_back({iso_tag(k), v});
    }
    for (const auto& [k, v] : iso_subfields_)
    {
        msg.tagged.push_back({iso_subfield_tag(k.first, k.second), v});
    }
    return msg;
}

SigmaRequest SigmaRequest::from_message(const Message& msg)
{
    SigmaRequest req;

    auto text = [&msg](std::string_view name) -> std::optional<std::string>
    {
        auto it = msg.fields.find(name);
        if (it == msg.fields.end() || !std::holds_alternative<std::string>(it->second))
        {
            return std::nullopt;
        }
        return std::get<std::string>(it->second);
    };

    req.saf_ = text(field_names::saf);
    req.source_ = text(field_names::source);
    req.mti_ = text(field_names::mti);
    if (auto it = msg.fields.find(field_names::serno);
        it != msg.fields.end() && std::holds_alternative<uint64_t>(it->second))
    {
        req.auth_serno_ = std::get<uint64_t>(it->second);
    }

    for (const auto& tv : msg.tagged)
    {
        req.set(tv.tag, tv.data);
    }
    return req;
}

std::optional<uint64_t> generate_auth_serno()
{
    std::array<unsigned char, 8> random_bytes{};
    if (RAND_bytes(random_bytes.data(), static_cast<int>(random_bytes.size())) != 1)
    {
        return std::nullopt;
    }

    uint64_t value = 0;
    for (auto b : random_bytes)
    {
        value = (value << 8) | b;
    }
    return value % max_auth_serno + 1;
}

} // namespace sigma
