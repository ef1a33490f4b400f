#include "server/verdict_codec.hpp"

#include <utility>

namespace llmfirewall::codec {

using json = nlohmann::json;

int entity_kind_wire_value(EntityKind kind) {
    const auto value = std::to_underlying(kind);
    return value <= kMaxEntityKindValue ? static_cast<int>(value) : 0;
}

Result<CheckContentRequest> parse_check_request(std::string_view body) {
    using R = Result<CheckContentRequest>;

    const auto doc = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded()) {
        return R::error(ErrorCategory::INVALID_INPUT, "Invalid JSON: malformed body");
    }
    if (!doc.is_object()) {
        return R::error(ErrorCategory::INVALID_INPUT, "Invalid JSON: body must be an object");
    }

    const auto content = doc.find("content");
    if (content == doc.end() || !content->is_string()) {
        return R::error(ErrorCategory::INVALID_INPUT, "Missing required field: content");
    }

    CheckContentRequest req;
    req.content = content->get<std::string>();

    if (const auto id = doc.find("request_id"); id != doc.end() && !id->is_null()) {
        if (!id->is_string()) {
            return R::error(ErrorCategory::INVALID_INPUT, "Field request_id must be a string");
        }
        req.request_id = id->get<std::string>();
    }

    if (const auto meta = doc.find("metadata"); meta != doc.end() && !meta->is_null()) {
        if (!meta->is_object()) {
            return R::error(ErrorCategory::INVALID_INPUT, "Field metadata must be an object");
        }
        for (const auto& [key, value] : meta->items()) {
            req.metadata.emplace(key, value.is_string() ? value.get<std::string>() : value.dump());
        }
    }
    return R::ok(std::move(req));
}

json finding_to_json(const Finding& finding) {
    return {
        {"type", entity_kind_wire_value(finding.type)},
        {"type_name", entity_kind_to_string(finding.type)},
        {"text", finding.text},
        {"start", finding.start},
        {"end", finding.end},
        {"confidence", finding.confidence},
        {"replacement", finding.replacement},
        {"category", finding.category},
    };
}

json semantic_to_json(const SemanticMetadata& meta) {
    json out = {
        {"method", meta.method},
        {"threshold", meta.threshold},
    };
    if (meta.method == "embedding_similarity") {
        out["model_version"] = meta.model_version;
        out["inference_time_ms"] = meta.inference_time_ms;
        out["max_unsafe_similarity"] = meta.max_unsafe_similarity;
        out["max_safe_similarity"] = meta.max_safe_similarity;
        out["risk_score"] = meta.risk_score;
    }
    if (!meta.error.empty()) {
        out["error"] = meta.error;
    }
    return out;
}

json verdict_to_json(const Verdict& verdict) {
    json issues = json::array();
    for (const auto& f : verdict.findings) {
        issues.push_back(finding_to_json(f));
    }

    json out = {
        {"is_safe", verdict.is_safe},
        {"redacted_text", verdict.redacted_text},
        {"detected_issues", std::move(issues)},
        {"confidence_score", verdict.confidence},
        {"request_id", verdict.request_id},
        {"anonymized_entities", verdict.anonymized_entities},
        {"processing_time_ms", static_cast<double>(verdict.elapsed.count()) / 1000.0},
        {"semantic", semantic_to_json(verdict.semantic)},
    };
    if (!verdict.anonymization_map.empty()) {
        json mapping = json::object();
        for (const auto& [original, fake] : verdict.anonymization_map) {
            mapping[original] = fake;
        }
        out["anonymization_map"] = std::move(mapping);
    }
    if (!verdict.detector_errors.empty()) {
        out["detector_errors"] = verdict.detector_errors;
    }
    return out;
}

std::string serialize_verdict(const Verdict& verdict) {
    // Invalid UTF-8 in echoed text is replaced rather than failing the response
    return verdict_to_json(verdict).dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string error_body(std::string_view message) {
    const json out = {{"success", false}, {"error", std::string(message)}};
    return out.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace llmfirewall::codec
