#pragma once
#include <boost/json.hpp>
#include <expected>

#include "sigma/errors.hpp"
#include "sigma/request.hpp"
#include "sigma/response.hpp"

namespace sigma
{

enum class SernoPolicy : uint8_t
{
    require,
    generate   // fill a missing "Serno" with generate_auth_serno()
};

/**
 * Request from a flat JSON object:
 *   {"SAF": "Y", "SRC": "M", "MTI": "0200", "Serno": 6007040979,
 *    "T0000": "...", "i002": "...", "s048.01": "..."}
 * Tag values may be strings or unsigned integers.
 */
[[nodiscard]] std::expected<SigmaRequest, SchemaError> request_from_json(const boost::json::value& jv,
                                                                         SernoPolicy serno = SernoPolicy::generate);

// {"mti": "0110", "auth_serno": 4007040978, "reason": 8100, "fees": [...], "adata": "..."}
// Absent parts are left out rather than written as null or zero.
[[nodiscard]] boost::json::object to_json(const SigmaResponse& resp);

} // namespace sigma
