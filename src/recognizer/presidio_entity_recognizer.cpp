#include "recognizer/presidio_entity_recognizer.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <nlohmann/json.hpp>

#include <algorithm>
#include <format>

namespace llmfirewall {

using json = nlohmann::json;

PresidioEntityRecognizer::PresidioEntityRecognizer(Config config)
    : config_(std::move(config)) {}

const char* PresidioEntityRecognizer::presidio_entity_name(EntityKind kind) {
    switch (kind) {
        case EntityKind::EMAIL:       return "EMAIL_ADDRESS";
        case EntityKind::PHONE:       return "PHONE_NUMBER";
        case EntityKind::SSN:         return "US_SSN";
        case EntityKind::CREDIT_CARD: return "CREDIT_CARD";
        case EntityKind::IP_ADDRESS:  return "IP_ADDRESS";
        case EntityKind::PERSON:      return "PERSON";
        case EntityKind::LOCATION:    return "LOCATION";
        case EntityKind::URL:         return "URL";
        // No Presidio recognizer; passed through under our own name
        case EntityKind::UNKNOWN:
        case EntityKind::API_KEY:
        case EntityKind::PASSWORD:
        case EntityKind::PROMPT_INJECTION:
        case EntityKind::JAILBREAK:
        case EntityKind::EXCESSIVE_SPECIAL_CHARS:
        case EntityKind::ENCODED_PAYLOAD:
        case EntityKind::ML_JAILBREAK:
            return entity_kind_to_string(kind);
    }
    return entity_kind_to_string(kind);
}

std::vector<RecognizedEntity> PresidioEntityRecognizer::parse_response(
    std::string_view text, const std::string& body) {

    const auto doc = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_array()) {
        throw RecognizerError("Presidio response is not a JSON array");
    }

    const size_t code_points = utils::utf8::count_code_points(text);

    std::vector<RecognizedEntity> entities;
    entities.reserve(doc.size());
    for (const auto& item : doc) {
        if (!item.is_object()) {
            throw RecognizerError("Presidio response item is not an object");
        }
        const auto type = item.find("entity_type");
        const auto start = item.find("start");
        const auto end = item.find("end");
        const auto score = item.find("score");
        if (type == item.end() || !type->is_string() ||
            start == item.end() || !start->is_number_unsigned() ||
            end == item.end() || !end->is_number_unsigned() ||
            score == item.end() || !score->is_number()) {
            throw RecognizerError("Presidio response item is missing fields");
        }

        const auto cp_start = start->get<size_t>();
        const auto cp_end = end->get<size_t>();
        if (cp_start > cp_end || cp_end > code_points) {
            throw RecognizerError(std::format("Presidio span [{}, {}) outside text of {} characters",
                cp_start, cp_end, code_points));
        }

        entities.push_back(RecognizedEntity{
            .entity_type = type->get<std::string>(),
            .start = utils::utf8::byte_offset(text, cp_start),
            .end = utils::utf8::byte_offset(text, cp_end),
            .score = score->get<double>(),
        });
    }
    std::ranges::sort(entities, {}, &RecognizedEntity::start);
    return entities;
}

std::vector<RecognizedEntity> PresidioEntityRecognizer::recognize(
    std::string_view text,
    const std::string& language,
    const std::vector<EntityKind>& entity_types,
    double score_threshold) {

    requests_.fetch_add(1, std::memory_order_relaxed);

    json entities = json::array();
    for (const auto kind : entity_types) {
        entities.push_back(presidio_entity_name(kind));
    }
    json request = {
        {"text", std::string(text)},
        {"language", language},
        {"score_threshold", score_threshold},
    };
    if (!entities.empty()) request["entities"] = std::move(entities);

    httplib::Client cli(config_.endpoint);
    cli.set_connection_timeout(std::chrono::milliseconds(config_.timeout_ms));
    cli.set_read_timeout(std::chrono::milliseconds(config_.timeout_ms));
    cli.set_write_timeout(std::chrono::milliseconds(config_.timeout_ms));

    const auto res = cli.Post("/analyze", request.dump(), "application/json");
    if (!res) {
        errors_.fetch_add(1, std::memory_order_relaxed);
        throw RecognizerError(std::format("Presidio request failed: {}",
            httplib::to_string(res.error())));
    }
    if (res->status != httplib::StatusCode::OK_200) {
        errors_.fetch_add(1, std::memory_order_relaxed);
        throw RecognizerError(std::format("Presidio error: HTTP {} - {}",
            res->status, res->body.substr(0, 200)));
    }

    try {
        return parse_response(text, res->body);
    } catch (const RecognizerError&) {
        errors_.fetch_add(1, std::memory_order_relaxed);
        throw;
    }
}

PresidioEntityRecognizer::Stats PresidioEntityRecognizer::get_stats() const {
    return {
        .requests = requests_.load(std::memory_order_relaxed),
        .errors = errors_.load(std::memory_order_relaxed),
    };
}

} // namespace llmfirewall
