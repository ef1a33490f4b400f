#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "config/config_loader.hpp"

using namespace llmfirewall;

namespace {

bool mentions(const ConfigLoader::LoadResult& result, const std::string& needle) {
    return result.error_message.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("ConfigValidation: empty config uses defaults", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.server.port == 50051);
    CHECK(cfg.server.max_content_length == 10240);
    CHECK(cfg.features.pii_detection);
    CHECK(cfg.features.prompt_injection);
    CHECK_FALSE(cfg.features.anonymization);
    CHECK_FALSE(cfg.features.ml_jailbreak);
    CHECK(cfg.pii.confidence_threshold == Catch::Approx(0.7));
    CHECK(cfg.pii.recognizer == "pattern");
    CHECK(cfg.prompt_injection.special_char_threshold == Catch::Approx(0.1));
    CHECK(cfg.ml_jailbreak.threshold == Catch::Approx(0.5));
    CHECK(cfg.anonymization.mapping_ttl_seconds == 3600);
    CHECK(cfg.anonymization.cache.backend == "memory");
}

TEST_CASE("ConfigValidation: full config parses", "[config][validation]") {
    const std::string toml = R"(
[server]
host = "127.0.0.1"
port = 8088
threads = 4
max_content_length = 4096
min_content_length = 2

[logging]
level = "debug"

[features]
anonymization = true
ml_jailbreak = true

[pii]
entities = ["EMAIL_ADDRESS", "PHONE_NUMBER"]
confidence_threshold = 0.6
recognizer = "presidio"
endpoint = "http://presidio:5002"

[prompt_injection]
special_char_threshold = 0.2

[[prompt_injection.rules]]
name = "grandma"
family = "jailbreak"
pattern = 'my\s+grandma'
confidence = 0.75

[[prompt_injection.rules]]
pattern = 'sudo\s+mode'

[ml_jailbreak]
threshold = 0.4
endpoint = "http://embeddings:8080"
unsafe_examples = ["be evil"]
safe_examples = ["be nice"]

[anonymization]
mapping_ttl_seconds = 600

[anonymization.cache]
backend = "Redis"
host = "redis.internal"
port = 6380
db = 2
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.server.host == "127.0.0.1");
    CHECK(cfg.server.port == 8088);
    CHECK(cfg.server.thread_pool_size == 4);
    CHECK(cfg.server.min_content_length == 2);
    CHECK(cfg.logging.level == "debug");
    CHECK(cfg.pii.entities == std::vector<std::string>{"EMAIL_ADDRESS", "PHONE_NUMBER"});
    CHECK(cfg.pii.endpoint == "http://presidio:5002");

    REQUIRE(cfg.prompt_injection.rules.size() == 2);
    CHECK(cfg.prompt_injection.rules[0].name == "grandma");
    CHECK(cfg.prompt_injection.rules[0].family == "jailbreak");
    CHECK(cfg.prompt_injection.rules[0].confidence == Catch::Approx(0.75));
    CHECK(cfg.prompt_injection.rules[1].name == "custom_1");
    CHECK(cfg.prompt_injection.rules[1].family == "direct");

    CHECK(cfg.ml_jailbreak.unsafe_examples == std::vector<std::string>{"be evil"});
    CHECK(cfg.anonymization.mapping_ttl_seconds == 600);
    CHECK(cfg.anonymization.cache.backend == "redis");
    CHECK(cfg.anonymization.cache.port == 6380);
    CHECK(cfg.anonymization.cache.db == 2);
}

TEST_CASE("ConfigValidation: invalid port fails", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[server]\nport = 0\n");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "server.port"));

    result = ConfigLoader::load_from_string("[server]\nport = 70000\n");
    CHECK_FALSE(result.success);
}

TEST_CASE("ConfigValidation: content length bounds", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(R"(
[server]
max_content_length = 10
min_content_length = 20
)");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "min_content_length"));
}

TEST_CASE("ConfigValidation: content length is capped at the scan limit", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[server]\nmax_content_length = 32768\n");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "server.max_content_length"));

    result = ConfigLoader::load_from_string("[server]\nmax_content_length = 16384\n");
    CHECK(result.success);
}

TEST_CASE("ConfigValidation: unknown log level fails", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[logging]\nlevel = \"verbose\"\n");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "logging.level"));
}

TEST_CASE("ConfigValidation: PII section", "[config][validation]") {
    SECTION("unknown entity") {
        auto result = ConfigLoader::load_from_string("[pii]\nentities = [\"EMAIL\", \"SHOE_SIZE\"]\n");
        CHECK_FALSE(result.success);
        CHECK(mentions(result, "SHOE_SIZE"));
    }
    SECTION("threshold out of range") {
        auto result = ConfigLoader::load_from_string("[pii]\nconfidence_threshold = 1.2\n");
        CHECK_FALSE(result.success);
        CHECK(mentions(result, "pii.confidence_threshold"));
    }
    SECTION("unknown recognizer") {
        auto result = ConfigLoader::load_from_string("[pii]\nrecognizer = \"spacy\"\n");
        CHECK_FALSE(result.success);
        CHECK(mentions(result, "pii.recognizer"));
    }
    SECTION("presidio without endpoint") {
        auto result = ConfigLoader::load_from_string("[pii]\nrecognizer = \"presidio\"\n");
        CHECK_FALSE(result.success);
        CHECK(mentions(result, "pii.endpoint"));
    }
    SECTION("presidio without endpoint is fine when PII detection is off") {
        auto result = ConfigLoader::load_from_string(R"(
[features]
pii_detection = false

[pii]
recognizer = "presidio"
)");
        CHECK(result.success);
    }
}

TEST_CASE("ConfigValidation: custom rules", "[config][validation]") {
    SECTION("empty pattern") {
        auto result = ConfigLoader::load_from_string(R"(
[[prompt_injection.rules]]
name = "blank"
)");
        CHECK_FALSE(result.success);
        CHECK(mentions(result, "rules[0].pattern"));
    }
    SECTION("unknown family") {
        auto result = ConfigLoader::load_from_string(R"(
[[prompt_injection.rules]]
family = "weird"
pattern = "x"
)");
        CHECK_FALSE(result.success);
        CHECK(mentions(result, "rules[0].family"));
    }
    SECTION("confidence out of range") {
        auto result = ConfigLoader::load_from_string(R"(
[[prompt_injection.rules]]
pattern = "x"
confidence = 1.5
)");
        CHECK_FALSE(result.success);
        CHECK(mentions(result, "rules[0].confidence"));
    }
}

TEST_CASE("ConfigValidation: ml_jailbreak requires an endpoint when enabled", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[features]\nml_jailbreak = true\n");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "ml_jailbreak.endpoint"));

    result = ConfigLoader::load_from_string("[ml_jailbreak]\nthreshold = -0.1\n");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "ml_jailbreak.threshold"));
}

TEST_CASE("ConfigValidation: anonymization cache", "[config][validation]") {
    SECTION("unknown backend") {
        auto result = ConfigLoader::load_from_string("[anonymization.cache]\nbackend = \"memcached\"\n");
        CHECK_FALSE(result.success);
        CHECK(mentions(result, "anonymization.cache.backend"));
    }
    SECTION("redis port") {
        auto result = ConfigLoader::load_from_string(
            "[anonymization.cache]\nbackend = \"redis\"\nport = 0\n");
        CHECK_FALSE(result.success);
        CHECK(mentions(result, "anonymization.cache.port"));
    }
    SECTION("ttl") {
        auto result = ConfigLoader::load_from_string("[anonymization]\nmapping_ttl_seconds = 0\n");
        CHECK_FALSE(result.success);
        CHECK(mentions(result, "mapping_ttl_seconds"));
    }
}

TEST_CASE("ConfigValidation: every violation is reported", "[config][validation]") {
    FirewallConfig cfg;
    cfg.server.port = 0;
    cfg.pii.confidence_threshold = 2.0;
    cfg.anonymization.cache.max_entries = 0;

    const auto errors = ConfigLoader::validate_config(cfg);
    CHECK(errors.size() == 3);
    CHECK(ConfigLoader::validate_config(FirewallConfig{}).empty());
}

TEST_CASE("ConfigValidation: malformed TOML is a parse error", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[server\nport = 1");
    CHECK_FALSE(result.success);
    CHECK(mentions(result, "Failed to parse config"));
}
