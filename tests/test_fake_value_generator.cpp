#include <catch2/catch_test_macros.hpp>
#include "security/fake_value_generator.hpp"

#include <regex>

using namespace llmfirewall;

namespace {

bool matches(const std::string& value, const char* pattern) {
    return std::regex_match(value, std::regex(pattern));
}

} // namespace

TEST_CASE("FakeValueGenerator: phone keeps the original layout", "[anonymizer][fake]") {
    FakeValueGenerator gen(42);

    CHECK(matches(gen.generate(EntityKind::PHONE, "(415) 867-5309"), R"(\(555\) 555-01\d\d)"));
    CHECK(matches(gen.generate(EntityKind::PHONE, "415-867-5309"), R"(555-555-01\d\d)"));
    CHECK(matches(gen.generate(EntityKind::PHONE, "415.867.5309"), R"(555\.555\.01\d\d)"));
    CHECK(matches(gen.generate(EntityKind::PHONE, "415 867 5309"), R"(555 555 01\d\d)"));
    CHECK(matches(gen.generate(EntityKind::PHONE, "4158675309"), R"(55555501\d\d)"));
    CHECK(matches(gen.generate(EntityKind::PHONE, "+1 415.867.5309"), R"(\+1 555\.555\.01\d\d)"));
}

TEST_CASE("FakeValueGenerator: email is derived from the original", "[anonymizer][fake]") {
    FakeValueGenerator gen(1);

    const auto a = gen.generate(EntityKind::EMAIL, "alice@corp.io");
    CHECK(a == gen.generate(EntityKind::EMAIL, "alice@corp.io"));
    CHECK(a == FakeValueGenerator::fake_email("alice@corp.io"));
    CHECK(matches(a, R"(user_[0-9a-f]{6}@example\.(com|org|net))"));
    CHECK(a != gen.generate(EntityKind::EMAIL, "bob@corp.io"));
}

TEST_CASE("FakeValueGenerator: IP addresses come from TEST-NET-1", "[anonymizer][fake]") {
    FakeValueGenerator gen(7);
    for (int i = 0; i < 50; ++i) {
        const auto ip = gen.generate(EntityKind::IP_ADDRESS, "10.1.2.3");
        REQUIRE(matches(ip, R"(192\.0\.2\.\d{1,3})"));
        const int last = std::stoi(ip.substr(ip.rfind('.') + 1));
        CHECK(last >= 1);
        CHECK(last <= 254);
    }
}

TEST_CASE("FakeValueGenerator: person and location placeholders are stable", "[anonymizer][fake]") {
    FakeValueGenerator gen;

    const auto person = gen.generate(EntityKind::PERSON, "Jane Doe");
    CHECK(matches(person, R"(Person [0-9A-F]{4})"));
    CHECK(person == gen.generate(EntityKind::PERSON, "Jane Doe"));

    CHECK(matches(gen.generate(EntityKind::LOCATION, "Berlin"), R"(Location [0-9A-F]{4})"));
}

TEST_CASE("FakeValueGenerator: secrets are never faked", "[anonymizer][fake]") {
    FakeValueGenerator gen;
    CHECK(gen.generate(EntityKind::CREDIT_CARD, "4111 1111 1111 1111") == "<CREDIT_CARD_REDACTED>");
    CHECK(gen.generate(EntityKind::SSN, "123-45-6789") == "<SSN_REDACTED>");
    CHECK(gen.generate(EntityKind::API_KEY, "sk-abc") == "<API_KEY_REDACTED>");
    CHECK(gen.generate(EntityKind::PASSWORD, "hunter2") == "<PASSWORD_REDACTED>");
}

TEST_CASE("FakeValueGenerator: other kinds get an anonymized token", "[anonymizer][fake]") {
    FakeValueGenerator gen;
    CHECK(gen.generate(EntityKind::URL, "https://corp.io") == "<URL_ANONYMIZED>");
    CHECK(gen.generate(EntityKind::UNKNOWN, "x") == "<UNKNOWN_ANONYMIZED>");
    CHECK(FakeValueGenerator::redaction_token(EntityKind::EMAIL) == "<EMAIL_REDACTED>");
}
