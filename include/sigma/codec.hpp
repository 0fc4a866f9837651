#pragma once
#include <expected>
#include <span>

#include "sigma/errors.hpp"
#include "sigma/field.hpp"
#include "sigma/message.hpp"
#include "sigma/request.hpp"
#include "sigma/response.hpp"
#include "sigma/schema.hpp"

namespace sigma::codec
{

/*
 *  | length (N ASCII digits) | header fields | tagged fields ... | crc32 (optional) |
 *                            |_______ length counts everything after the prefix ____|
 */

// Validates first; on any failure no buffer is produced
[[nodiscard]] std::expected<WireBuffer, EncodeError> encode(const Message& msg, const Schema& schema);

// Length and checksum are verified before any content is parsed
[[nodiscard]] std::expected<Message, DecodingError> decode(std::span<const std::byte> data, const Schema& schema);

[[nodiscard]] std::expected<WireBuffer, EncodeError> encode(const SigmaRequest& req,
                                                           const Schema& schema = Schema::describe(MessageKind::request));
[[nodiscard]] std::expected<WireBuffer, EncodeError> encode(const SigmaResponse& resp,
                                                           const Schema& schema = Schema::describe(MessageKind::response));

[[nodiscard]] std::expected<SigmaRequest, DecodingError> decode_request(std::span<const std::byte> data,
                                                                       const Schema& schema = Schema::describe(MessageKind::request));
[[nodiscard]] std::expected<SigmaResponse, DecodingError> decode_response(std::span<const std::byte> data,
                                                                         const Schema& schema = Schema::describe(MessageKind::response));

[[nodiscard]] uint32_t checksum(std::span<const std::byte> data);

} // namespace sigma::codec
