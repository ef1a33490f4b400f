#include "security/fake_value_generator.hpp"
#include "core/digest.hpp"
#include "core/utils.hpp"

#include <array>
#include <format>

namespace llmfirewall {

namespace {

constexpr std::array<std::string_view, 3> kEmailDomains = {
    "example.com", "example.org", "example.net",
};

// Fictional NANP numbers: area and exchange 555, line 0100-0199
constexpr std::string_view kFakeAreaCode = "555";
constexpr std::string_view kFakeExchange = "555";

} // anonymous namespace

FakeValueGenerator::FakeValueGenerator()
    : rng_(std::random_device{}()) {}

FakeValueGenerator::FakeValueGenerator(uint64_t seed)
    : rng_(seed) {}

std::string FakeValueGenerator::redaction_token(EntityKind kind) {
    return std::format("<{}_REDACTED>", entity_kind_to_string(kind));
}

std::string FakeValueGenerator::anonymized_token(EntityKind kind) {
    return std::format("<{}_ANONYMIZED>", entity_kind_to_string(kind));
}

std::string FakeValueGenerator::generate(EntityKind kind, std::string_view original) {
    switch (kind) {
        case EntityKind::EMAIL:
            return fake_email(original);
        case EntityKind::PHONE:
            return fake_phone(original);
        case EntityKind::IP_ADDRESS:
            return fake_ip();
        case EntityKind::PERSON:
            return hashed_placeholder("Person", original);
        case EntityKind::LOCATION:
            return hashed_placeholder("Location", original);
        case EntityKind::CREDIT_CARD:
        case EntityKind::SSN:
        case EntityKind::API_KEY:
        case EntityKind::PASSWORD:
            return redaction_token(kind);
        case EntityKind::UNKNOWN:
        case EntityKind::URL:
        case EntityKind::PROMPT_INJECTION:
        case EntityKind::JAILBREAK:
        case EntityKind::EXCESSIVE_SPECIAL_CHARS:
        case EntityKind::ENCODED_PAYLOAD:
        case EntityKind::ML_JAILBREAK:
            return anonymized_token(kind);
    }
    return anonymized_token(EntityKind::UNKNOWN);
}

std::string FakeValueGenerator::fake_email(std::string_view original) {
    const auto hex = digest::sha256_prefix(original, 8);
    const auto domain_index = utils::parse_int<uint32_t>(std::string_view(hex).substr(6, 2), 16, 0u)
        % kEmailDomains.size();
    return std::format("user_{}@{}", hex.substr(0, 6), kEmailDomains[domain_index]);
}

std::string FakeValueGenerator::hashed_placeholder(std::string_view prefix,
                                                   std::string_view original) {
    return std::format("{} {}", prefix, utils::to_upper(digest::sha256_prefix(original, 4)));
}

std::string FakeValueGenerator::fake_phone(std::string_view original) {
    const auto line = std::format("01{:02d}", random_between(0, 99));
    const bool international = !original.empty() && original.front() == '+';
    const std::string prefix = international ? "+1 " : "";

    if (original.contains('(') && original.contains(')')) {
        return std::format("{}({}) {}-{}", prefix, kFakeAreaCode, kFakeExchange, line);
    }
    if (original.contains('-')) {
        return std::format("{}{}-{}-{}", prefix, kFakeAreaCode, kFakeExchange, line);
    }
    if (original.contains('.')) {
        return std::format("{}{}.{}.{}", prefix, kFakeAreaCode, kFakeExchange, line);
    }
    if (original.contains(' ')) {
        return std::format("{}{} {} {}", prefix, kFakeAreaCode, kFakeExchange, line);
    }
    return std::format("{}{}{}{}", prefix, kFakeAreaCode, kFakeExchange, line);
}

std::string FakeValueGenerator::fake_ip() {
    return std::format("192.0.2.{}", random_between(1, 254));
}

uint32_t FakeValueGenerator::random_between(uint32_t lo, uint32_t hi) {
    std::uniform_int_distribution<uint32_t> dist(lo, hi);
    std::lock_guard lock(rng_mutex_);
    return dist(rng_);
}

} // namespace llmfirewall
