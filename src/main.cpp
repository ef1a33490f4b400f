#include "cache/in_memory_cache_backend.hpp"
#include "cache/mapping_store.hpp"
#include "cache/redis_cache_backend.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "core/verdict_aggregator.hpp"
#include "embedding/http_embedding_provider.hpp"
#include "recognizer/pattern_entity_recognizer.hpp"
#include "recognizer/presidio_entity_recognizer.hpp"
#include "security/entity_anonymizer.hpp"
#include "security/fake_value_generator.hpp"
#include "security/pattern_rule_engine.hpp"
#include "security/semantic_risk_scorer.hpp"
#include "server/http_server.hpp"

#include <memory>
#include <csignal>
#include <cstdlib>
#include <format>

using namespace llmfirewall;

// Global instance for signal handling
std::shared_ptr<HttpServer> g_server;

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));
    if (g_server) {
        g_server->stop();
    }
    exit(0);
}

namespace {

PatternRule to_pattern_rule(const CustomRuleConfig& cfg) {
    const auto family = parse_rule_family(cfg.family).value_or(RuleFamily::DIRECT_INJECTION);
    const bool jailbreak = family == RuleFamily::JAILBREAK;

    PatternRule rule;
    rule.family = family;
    rule.name = cfg.name;
    rule.pattern = cfg.pattern;
    rule.kind = jailbreak ? EntityKind::JAILBREAK : EntityKind::PROMPT_INJECTION;
    rule.category = !cfg.category.empty() ? cfg.category
                  : jailbreak ? "jailbreak_attempt" : "direct_injection";
    rule.confidence = cfg.confidence;
    rule.replacement = jailbreak ? "<JAILBREAK_DETECTED>" : "<PROMPT_INJECTION_DETECTED>";
    return rule;
}

std::shared_ptr<ICacheBackend> make_cache_backend(const CacheBackendConfig& cfg) {
    if (cfg.backend == "redis") {
        RedisCacheBackend::Config redis;
        redis.host = cfg.host;
        redis.port = static_cast<uint16_t>(cfg.port);
        redis.password = cfg.password;
        redis.db = static_cast<uint32_t>(cfg.db);
        redis.timeout_ms = static_cast<uint32_t>(cfg.timeout_ms);
        return std::make_shared<RedisCacheBackend>(std::move(redis));
    }
    InMemoryCacheBackend::Config memory;
    memory.max_entries = static_cast<size_t>(cfg.max_entries);
    return std::make_shared<InMemoryCacheBackend>(memory);
}

std::shared_ptr<IEntityRecognizer> make_recognizer(const PiiConfig& cfg) {
    if (cfg.recognizer == "presidio") {
        return std::make_shared<PresidioEntityRecognizer>(PresidioEntityRecognizer::Config{
            .endpoint = cfg.endpoint,
            .timeout_ms = static_cast<uint32_t>(cfg.timeout_ms),
        });
    }
    return std::make_shared<PatternEntityRecognizer>();
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        utils::log::info("LLM Firewall starting...");

        // Setup signal handlers
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::string config_file = "config/firewall.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("[1/6] Loading configuration from {}", config_file));
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return 1;
        }
        const auto& cfg = config_result.config;
        utils::log::set_level(utils::log::parse_level(cfg.logging.level).value_or(utils::log::Level::INFO));

        // [2/6] Anonymization mapping store
        auto backend = make_cache_backend(cfg.anonymization.cache);
        auto mapping_store = std::make_shared<MappingStore>(
            backend, nullptr,
            MappingStore::Config{.ttl = std::chrono::seconds(cfg.anonymization.mapping_ttl_seconds)});
        utils::log::info(std::format("[2/6] Mapping store: {} backend, ttl {}s",
            mapping_store->backend_name(), cfg.anonymization.mapping_ttl_seconds));
        if (cfg.features.anonymization && !mapping_store->ping()) {
            utils::log::warn("Mapping cache backend unreachable, mappings will use the local fallback");
        }

        auto anonymizer = std::make_shared<EntityAnonymizer>(
            EntityAnonymizer::Config{.enabled = cfg.features.anonymization},
            mapping_store, std::make_shared<FakeValueGenerator>());

        // [3/6] Entity recognizer
        auto recognizer = make_recognizer(cfg.pii);
        utils::log::info(std::format("[3/6] Entity recognizer: {}, {} entity types, threshold {}",
            recognizer->name(), cfg.pii.entities.size(), cfg.pii.confidence_threshold));

        // [4/6] Pattern rule engine
        PatternRuleEngine::Config engine_config;
        engine_config.enabled = cfg.features.prompt_injection;
        engine_config.special_char_threshold = cfg.prompt_injection.special_char_threshold;
        for (const auto& rule : cfg.prompt_injection.rules) {
            engine_config.extra_rules.push_back(to_pattern_rule(rule));
        }
        auto engine_result = PatternRuleEngine::create(engine_config);
        if (engine_result.is_error()) {
            utils::log::error(std::format("Pattern rule engine: {}", engine_result.error_message()));
            return 1;
        }
        utils::log::info(std::format("[4/6] Pattern rule engine: {}",
            cfg.features.prompt_injection ? "enabled" : "disabled"));

        // [5/6] Semantic risk scorer
        std::shared_ptr<IEmbeddingProvider> embeddings;
        if (cfg.features.ml_jailbreak) {
            embeddings = std::make_shared<HttpEmbeddingProvider>(HttpEmbeddingProvider::Config{
                .endpoint = cfg.ml_jailbreak.endpoint,
                .api_key = cfg.ml_jailbreak.api_key,
                .model = cfg.ml_jailbreak.model,
                .timeout_ms = static_cast<uint32_t>(cfg.ml_jailbreak.timeout_ms),
            });
        }
        auto scorer = std::make_shared<SemanticRiskScorer>(SemanticRiskScorer::Config{
            .enabled = cfg.features.ml_jailbreak,
            .threshold = cfg.ml_jailbreak.threshold,
            .unsafe_examples = cfg.ml_jailbreak.unsafe_examples,
            .safe_examples = cfg.ml_jailbreak.safe_examples,
        }, embeddings);
        utils::log::info(std::format("[5/6] Semantic risk scorer: {}",
            scorer->is_enabled() ? "enabled" : "disabled"));

        // [6/6] Verdict aggregator
        VerdictAggregator::Config agg_config;
        for (const auto& name : cfg.pii.entities) {
            if (const auto kind = parse_entity_kind(name)) {
                agg_config.pii_entities.push_back(*kind);
            }
        }
        agg_config.pii_confidence_threshold = cfg.pii.confidence_threshold;
        agg_config.language = cfg.pii.language;
        agg_config.max_content_length = static_cast<size_t>(cfg.server.max_content_length);
        agg_config.min_content_length = static_cast<size_t>(cfg.server.min_content_length);

        AggregatorComponents components;
        components.recognizer = recognizer;
        components.pattern_engine = engine_result.value();
        components.semantic_scorer = scorer;
        components.anonymizer = anonymizer;
        components.flags = DetectorFlags{
            .pii_detection = cfg.features.pii_detection,
            .prompt_injection = cfg.features.prompt_injection,
            .anonymization = cfg.features.anonymization,
            .ml_jailbreak = cfg.features.ml_jailbreak,
        };

        auto aggregator_result = VerdictAggregator::create(std::move(components), std::move(agg_config));
        if (aggregator_result.is_error()) {
            utils::log::error(std::format("Verdict aggregator: {}", aggregator_result.error_message()));
            return 1;
        }
        utils::log::info("[6/6] Verdict aggregator ready");

        g_server = std::make_shared<HttpServer>(
            aggregator_result.value(), mapping_store,
            HttpServer::Config{
                .host = cfg.server.host,
                .port = cfg.server.port,
                .thread_pool_size = static_cast<size_t>(cfg.server.thread_pool_size),
                .service_version = cfg.server.service_version,
            });

        // Start HTTP server (blocking)
        g_server->start();

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
