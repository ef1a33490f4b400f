#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "server/verdict_codec.hpp"

using namespace llmfirewall;
using json = nlohmann::json;

TEST_CASE("VerdictCodec: entity kinds use stable wire values", "[codec]") {
    CHECK(codec::entity_kind_wire_value(EntityKind::UNKNOWN) == 0);
    CHECK(codec::entity_kind_wire_value(EntityKind::EMAIL) == 2);
    CHECK(codec::entity_kind_wire_value(EntityKind::JAILBREAK) == 12);
    CHECK(codec::entity_kind_wire_value(EntityKind::ML_JAILBREAK) == 15);
    CHECK(codec::entity_kind_wire_value(static_cast<EntityKind>(200)) == 0);
}

TEST_CASE("VerdictCodec: parse a full request", "[codec]") {
    auto result = codec::parse_check_request(
        R"({"content":"hello","request_id":"r-1","metadata":{"client":"web","retries":2}})");
    REQUIRE(result.is_ok());

    const auto& req = result.value();
    CHECK(req.content == "hello");
    CHECK(req.request_id == "r-1");
    CHECK(req.metadata.at("client") == "web");
    CHECK(req.metadata.at("retries") == "2");
}

TEST_CASE("VerdictCodec: optional fields may be absent or null", "[codec]") {
    auto result = codec::parse_check_request(R"({"content":"hi","request_id":null})");
    REQUIRE(result.is_ok());
    CHECK(result.value().request_id.empty());
    CHECK(result.value().metadata.empty());
}

TEST_CASE("VerdictCodec: malformed requests", "[codec]") {
    const auto error_of = [](std::string_view body) {
        auto result = codec::parse_check_request(body);
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::INVALID_INPUT);
        return result.error_message();
    };

    CHECK(error_of("{not json") == "Invalid JSON: malformed body");
    CHECK(error_of(R"(["content"])") == "Invalid JSON: body must be an object");
    CHECK(error_of(R"({"text":"hi"})") == "Missing required field: content");
    CHECK(error_of(R"({"content":42})") == "Missing required field: content");
    CHECK(error_of(R"({"content":"hi","request_id":7})") == "Field request_id must be a string");
    CHECK(error_of(R"({"content":"hi","metadata":"x"})") == "Field metadata must be an object");
}

TEST_CASE("VerdictCodec: verdict JSON layout", "[codec]") {
    Verdict v;
    v.is_safe = false;
    v.redacted_text = "mail <EMAIL_REDACTED>";
    v.confidence = 0.9;
    v.request_id = "r-9";
    v.elapsed = std::chrono::microseconds(1500);
    v.findings.push_back(Finding{
        .type = EntityKind::EMAIL,
        .text = "a@corp.io",
        .start = 5,
        .end = 14,
        .confidence = 0.8,
        .category = "pii",
        .replacement = "<EMAIL_REDACTED>",
    });

    const auto out = codec::verdict_to_json(v);
    CHECK(out["is_safe"] == false);
    CHECK(out["redacted_text"] == "mail <EMAIL_REDACTED>");
    CHECK(out["confidence_score"].get<double>() == Catch::Approx(0.9));
    CHECK(out["request_id"] == "r-9");
    CHECK(out["processing_time_ms"].get<double>() == Catch::Approx(1.5));
    CHECK_FALSE(out.contains("detector_errors"));
    CHECK_FALSE(out.contains("anonymization_map"));

    REQUIRE(out["detected_issues"].size() == 1);
    const auto& issue = out["detected_issues"][0];
    CHECK(issue["type"] == 2);
    CHECK(issue["type_name"] == "EMAIL");
    CHECK(issue["start"] == 5);
    CHECK(issue["end"] == 14);
    CHECK(issue["replacement"] == "<EMAIL_REDACTED>");
    CHECK(issue["category"] == "pii");

    CHECK(out["semantic"]["method"] == "disabled");
    CHECK_FALSE(out["semantic"].contains("risk_score"));
}

TEST_CASE("VerdictCodec: semantic diagnostics and detector errors", "[codec]") {
    Verdict v;
    v.semantic.method = "embedding_similarity";
    v.semantic.model_version = "all-MiniLM-L6-v2";
    v.semantic.risk_score = 0.62;
    v.semantic.threshold = 0.5;
    v.detector_errors = {"pii: recognizer unavailable"};

    const auto out = codec::verdict_to_json(v);
    CHECK(out["semantic"]["model_version"] == "all-MiniLM-L6-v2");
    CHECK(out["semantic"]["risk_score"].get<double>() == Catch::Approx(0.62));
    CHECK(out["semantic"]["threshold"].get<double>() == Catch::Approx(0.5));
    REQUIRE(out["detector_errors"].size() == 1);
    CHECK(out["detector_errors"][0] == "pii: recognizer unavailable");
}

TEST_CASE("VerdictCodec: anonymization map is emitted when present", "[codec]") {
    Verdict v;
    v.anonymization_map = {{"alice@corp.io", "user_1a2b@example.com"}};

    const auto out = codec::verdict_to_json(v);
    REQUIRE(out.contains("anonymization_map"));
    CHECK(out["anonymization_map"]["alice@corp.io"] == "user_1a2b@example.com");
}

TEST_CASE("VerdictCodec: invalid UTF-8 does not break serialization", "[codec]") {
    Verdict v;
    v.redacted_text = "bad \xC3 byte";
    std::string body;
    REQUIRE_NOTHROW(body = codec::serialize_verdict(v));
    CHECK(json::parse(body)["is_safe"] == true);
}

TEST_CASE("VerdictCodec: error body escapes the message", "[codec]") {
    const auto body = json::parse(codec::error_body("bad \"quote\""));
    CHECK(body["success"] == false);
    CHECK(body["error"] == "bad \"quote\"");
}
