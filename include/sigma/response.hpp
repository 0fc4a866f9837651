#pragma once
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sigma/errors.hpp"
#include "sigma/fee_data.hpp"
#include "sigma/message.hpp"

namespace sigma
{

// Switch reply. MTI and serial are always present; the tagged parts are optional
// and report absence through std::optional rather than 0 or "".
class SigmaResponse
{
public:
    SigmaResponse(std::string_view mti, uint64_t auth_serno);

    SigmaResponse& set_reason(uint32_t v);
    SigmaResponse& add_fee(const FeeData& fee);
    SigmaResponse& set_adata(std::string_view v);

    [[nodiscard]] const std::string& mti() const { return mti_; }
    [[nodiscard]] uint64_t auth_serno() const { return auth_serno_; }
    [[nodiscard]] std::optional<uint32_t> reason() const { return reason_; }
    [[nodiscard]] const std::vector<FeeData>& fees() const { return fees_; }
    [[nodiscard]] const std::optional<std::string>& adata() const { return adata_; }

    [[nodiscard]] std::expected<Message, EncodingError> to_message() const;
    [[nodiscard]] static std::expected<SigmaResponse, DecodingError> from_message(const Message& msg);

    bool operator==(const SigmaResponse&) const = default;

private:
    std::string mti_;
    uint64_t auth_serno_;
    std::optional<uint32_t> reason_;
    std::vector<FeeData> fees_;
    std::optional<std::string> adata_;
};

} // namespace sigma
