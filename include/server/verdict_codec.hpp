#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace llmfirewall {

/**
 * @brief Body of POST /v1/check-content
 */
struct CheckContentRequest {
    std::string content;
    std::string request_id;     // empty: server assigns one
    RequestMetadata metadata;
};

/**
 * @brief JSON mapping of the check-content request and response.
 *
 * Entity kinds are written as their stable integer wire value; a value
 * outside the known range is written as UNKNOWN (0).
 */
namespace codec {

[[nodiscard]] int entity_kind_wire_value(EntityKind kind);

/// INVALID_INPUT on malformed JSON, a non-object body or a missing/non-string "content".
[[nodiscard]] Result<CheckContentRequest> parse_check_request(std::string_view body);

[[nodiscard]] nlohmann::json finding_to_json(const Finding& finding);
[[nodiscard]] nlohmann::json semantic_to_json(const SemanticMetadata& meta);
[[nodiscard]] nlohmann::json verdict_to_json(const Verdict& verdict);

[[nodiscard]] std::string serialize_verdict(const Verdict& verdict);

/// {"success":false,"error":"..."} with the message escaped.
[[nodiscard]] std::string error_body(std::string_view message);

} // namespace codec

} // namespace llmfirewall
