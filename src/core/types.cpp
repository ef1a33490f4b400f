#include "core/types.hpp"
#include "core/utils.hpp"

#include <array>

namespace llmfirewall {

namespace {

struct KindName {
    std::string_view name;
    EntityKind kind;
};

// Canonical names first, then the aliases emitted by external recognizers
constexpr std::array kKindNames{
    KindName{"UNKNOWN", EntityKind::UNKNOWN},
    KindName{"API_KEY", EntityKind::API_KEY},
    KindName{"EMAIL", EntityKind::EMAIL},
    KindName{"PHONE", EntityKind::PHONE},
    KindName{"SSN", EntityKind::SSN},
    KindName{"CREDIT_CARD", EntityKind::CREDIT_CARD},
    KindName{"IP_ADDRESS", EntityKind::IP_ADDRESS},
    KindName{"PERSON", EntityKind::PERSON},
    KindName{"LOCATION", EntityKind::LOCATION},
    KindName{"URL", EntityKind::URL},
    KindName{"PASSWORD", EntityKind::PASSWORD},
    KindName{"PROMPT_INJECTION", EntityKind::PROMPT_INJECTION},
    KindName{"JAILBREAK", EntityKind::JAILBREAK},
    KindName{"EXCESSIVE_SPECIAL_CHARS", EntityKind::EXCESSIVE_SPECIAL_CHARS},
    KindName{"ENCODED_PAYLOAD", EntityKind::ENCODED_PAYLOAD},
    KindName{"ML_JAILBREAK", EntityKind::ML_JAILBREAK},
    KindName{"PHONE_NUMBER", EntityKind::PHONE},
    KindName{"EMAIL_ADDRESS", EntityKind::EMAIL},
    KindName{"US_SSN", EntityKind::SSN},
    KindName{"IP", EntityKind::IP_ADDRESS},
};

} // anonymous namespace

std::optional<EntityKind> parse_entity_kind(std::string_view name) {
    const auto upper = utils::to_upper(utils::trim(std::string(name)));
    for (const auto& entry : kKindNames) {
        if (entry.name == upper) return entry.kind;
    }
    return std::nullopt;
}

} // namespace llmfirewall
