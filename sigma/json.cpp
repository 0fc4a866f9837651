#include "sigma/json.hpp"
#include "sigma/schema.hpp"
#include "fundamentals/json_utils.hpp"

namespace sigma
{

namespace {

std::expected<std::string, SchemaError> required_str(const boost::json::object& obj, std::string_view key)
{
    auto v = json_utils::extract_str(obj, key);
    if (!v)
    {
        auto ec = v.error() == json_utils::lookup_err::missing ? SchemaError::errc::missing_field
                                                               : SchemaError::errc::invalid_value;
        return std::unexpected(SchemaError{ec, std::string(key)});
    }
    return std::move(*v);
}

bool is_header(std::string_view key)
{
    return key == field_names::saf || key == field_names::source ||
           key == field_names::mti || key == field_names::serno;
}

} // namespace

std::expected<SigmaRequest, SchemaError> request_from_json(const boost::json::value& jv, SernoPolicy serno)
{
    if (!jv.is_object())
    {
        return std::unexpected(SchemaError{SchemaError::errc::invalid_value, "<root>"});
    }
    const auto& obj = jv.as_object();

    SigmaRequest req;

    auto saf = required_str(obj, field_names::saf);
    if (!saf)
    {
        return std::unexpected(saf.error());
    }
    auto source = required_str(obj, field_names::source);
    if (!source)
    {
        return std::unexpected(source.error());
    }
    auto mti = required_str(obj, field_names::mti);
    if (!mti)
    {
        return std::unexpected(mti.error());
    }
    req.set_saf(*saf).set_source(*source).set_mti(*mti);

    if (auto it = obj.find(field_names::serno); it != obj.end())
    {
        auto num = json_utils::as_uint(it->value());
        if (!num)
        {
            return std::unexpected(SchemaError{SchemaError::errc::invalid_value, std::string(field_names::serno)});
        }
        req.set_auth_serno(*num);
    }
    else if (serno == SernoPolicy::generate)
    {
        // Left unset when the RNG fails; validation then reports the missing field
        if (auto generated = generate_auth_serno())
        {
            req.set_auth_serno(*generated);
        }
    }

    for (const auto& [key, value] : obj)
    {
        if (is_header(key))
        {
            continue;
        }

        auto tag = Tag::parse(key);
        if (!tag || !tag->valid())
        {
            return std::unexpected(SchemaError{SchemaError::errc::unknown_field, std::string(key)});
        }
        auto text = json_utils::as_text(value);
        if (!text)
        {
            return std::unexpected(SchemaError{SchemaError::errc::invalid_value, std::string(key)});
        }
        req.set(*tag, *text);
    }
    return req;
}

boost::json::object to_json(const SigmaResponse& resp)
{
    boost::json::object obj;
    obj["mti"] = resp.mti();
    obj["auth_serno"] = resp.auth_serno();
    if (auto reason = resp.reason())
    {
        obj["reason"] = *reason;
    }
    if (!resp.fees().empty())
    {
        boost::json::array fees;
        for (const auto& fee : resp.fees())
        {
            fees.push_back(boost::json::object{
                {"reason", fee.reason},
                {"currency", fee.currency},
                {"amount", fee.amount}
            });
        }
        obj["fees"] = std::move(fees);
    }
    if (const auto& adata = resp.adata())
    {
        obj["adata"] = *adata;
    }
    return obj;
}

} // namespace sigma
