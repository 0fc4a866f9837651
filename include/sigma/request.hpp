#pragma once
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "sigma/errors.hpp"
#include "sigma/message.hpp"

namespace sigma
{

// Authorization request sent to the switch.
// Setters chain; nothing is defaulted, an unset header field fails validation.
class SigmaRequest
{
public:
    using tag_map = std::map<uint16_t, std::string>;
    using subfield_map = std::map<std::pair<uint16_t, uint8_t>, std::string>;

    SigmaRequest() = default;

    SigmaRequest& set_saf(std::string_view v);
    SigmaRequest& set_source(std::string_view v);
    SigmaRequest& set_mti(std::string_view v);
    SigmaRequest& set_auth_serno(uint64_t v);

    SigmaRequest& set_tag(uint16_t tag, std::string_view v);
    SigmaRequest& set_iso_field(uint16_t field, std::string_view v);
    SigmaRequest& set_iso_subfield(uint16_t field, uint8_t sub, std::string_view v);
    SigmaRequest& set(const Tag& tag, std::string_view v);

    [[nodiscard]] const std::optional<std::string>& saf() const { return saf_; }
    [[nodiscard]] const std::optional<std::string>& source() const { return source_; }
    [[nodiscard]] const std::optional<std::string>& mti() const { return mti_; }
    [[nodiscard]] std::optional<uint64_t> auth_serno() const { return auth_serno_; }

    [[nodiscard]] std::optional<std::string_view> tag(uint16_t tag) const;
    [[nodiscard]] std::optional<std::string_view> iso_field(uint16_t field) const;
    [[nodiscard]] std::optional<std::string_view> iso_subfield(uint16_t field, uint8_t sub) const;

    [[nodiscard]] const tag_map& tags() const { return tags_; }
    [[nodiscard]] const tag_map& iso_fields() const { return iso_fields_; }
    [[nodiscard]] const subfield_map& iso_subfields() const { return iso_subfields_; }

    // Regular tags first, then ISO fields, then ISO subfields, each ascending
    [[nodiscard]] Message to_message() const;
    [[nodiscard]] static SigmaRequest from_message(const Message& msg);

    bool operator==(const SigmaRequest&) const = default;

private:
    std::optional<std::string> saf_;
    std::optional<std::string> source_;
    std::optional<std::string> mti_;
    std::optional<uint64_t> auth_serno_;
    tag_map tags_;
    tag_map iso_fields_;
    subfield_map iso_subfields_;
};

constexpr uint64_t max_auth_serno = 9'999'999'999;

// Random serial in [1, max_auth_serno]; nullopt when the system RNG fails
[[nodiscard]] std::optional<uint64_t> generate_auth_serno();

} // namespace sigma
