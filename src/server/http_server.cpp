#include "server/http_server.hpp"
#include "server/http_constants.hpp"
#include "server/verdict_codec.hpp"
#include "core/utils.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <nlohmann/json.hpp>

#include <format>
#include <stdexcept>

namespace llmfirewall {

using json = nlohmann::json;

namespace {

const char* detector_state(bool flag, bool available) {
    if (!flag) return "disabled";
    return available ? "enabled" : "unavailable";
}

} // anonymous namespace

// ============================================================================
// Constructor
// ============================================================================

HttpServer::HttpServer(std::shared_ptr<VerdictAggregator> aggregator,
                       std::shared_ptr<MappingStore> mapping_store,
                       Config config)
    : aggregator_(std::move(aggregator)),
      mapping_store_(std::move(mapping_store)),
      config_(std::move(config)),
      started_at_(std::chrono::steady_clock::now()) {
    if (!aggregator_) {
        throw std::invalid_argument("HttpServer requires a verdict aggregator");
    }
}

HttpServer::~HttpServer() = default;

// ============================================================================
// start(): create server, register routes, listen
// ============================================================================

void HttpServer::start() {
    httplib::Server* svr = nullptr;
    {
        std::lock_guard<std::mutex> lock(server_mutex_);
        server_ = std::make_unique<httplib::Server>();
        svr = server_.get();
    }

    const size_t pool_size = config_.thread_pool_size;
    svr->new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };

    register_routes(*svr);

    utils::log::info(std::format("Starting LLM Firewall on {}:{} ({} threads, version {})",
        config_.host, config_.port, config_.thread_pool_size, config_.service_version));

    if (!svr->listen(config_.host, config_.port)) {
        throw std::runtime_error(std::format("Failed to start HTTP server on {}:{}",
            config_.host, config_.port));
    }
}

void HttpServer::stop() {
    std::lock_guard<std::mutex> lock(server_mutex_);
    if (server_) {
        server_->stop();
    }
    utils::log::info("Server stopped");
}

HttpServer::HttpStats HttpServer::get_http_stats() const {
    return {
        .requests = requests_.load(std::memory_order_relaxed),
        .bad_requests = bad_requests_.load(std::memory_order_relaxed),
        .internal_errors = internal_errors_.load(std::memory_order_relaxed),
    };
}

void HttpServer::register_routes(httplib::Server& svr) {
    svr.Post(http::kCheckContentPath, [this](const httplib::Request& req, httplib::Response& res) {
        handle_check_content(req, res);
    });
    svr.Get(http::kHealthPath, [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });
    svr.Get(http::kMetricsPath, [this](const httplib::Request& req, httplib::Response& res) {
        handle_metrics(req, res);
    });
}

// ============================================================================
// Handler: POST /v1/check-content
// ============================================================================

void HttpServer::handle_check_content(const httplib::Request& req, httplib::Response& res) {
    requests_.fetch_add(1, std::memory_order_relaxed);

    try {
        const std::string content_type = req.get_header_value("Content-Type");
        if (!content_type.contains(http::kJsonContentType)) {
            bad_requests_.fetch_add(1, std::memory_order_relaxed);
            res.status = httplib::StatusCode::BadRequest_400;
            res.set_content(R"({"success":false,"error":"Content-Type must be application/json"})",
                            http::kJsonContentType);
            return;
        }

        auto parsed = codec::parse_check_request(req.body);
        if (parsed.is_error()) {
            bad_requests_.fetch_add(1, std::memory_order_relaxed);
            res.status = httplib::StatusCode::BadRequest_400;
            res.set_content(codec::error_body(parsed.error_message()), http::kJsonContentType);
            return;
        }

        auto& request = parsed.value();
        if (request.request_id.empty()) {
            request.request_id = req.get_header_value(http::kRequestIdHeader);
        }

        auto result = aggregator_->check_content(request.content, request.request_id, request.metadata);
        if (result.is_error()) {
            bad_requests_.fetch_add(1, std::memory_order_relaxed);
            res.status = result.error_category() == ErrorCategory::INVALID_INPUT
                ? httplib::StatusCode::BadRequest_400
                : httplib::StatusCode::InternalServerError_500;
            res.set_content(codec::error_body(result.error_message()), http::kJsonContentType);
            return;
        }

        const auto& verdict = result.value();
        res.status = httplib::StatusCode::OK_200;
        res.set_header(http::kRequestIdHeader, verdict.request_id);
        res.set_content(codec::serialize_verdict(verdict), http::kJsonContentType);
    } catch (const std::exception& e) {
        internal_errors_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("check-content failed: {}", e.what()));
        res.status = httplib::StatusCode::InternalServerError_500;
        res.set_content(codec::error_body(std::format("Internal error: {}", e.what())),
                        http::kJsonContentType);
    }
}

// ============================================================================
// Handler: GET /health
// ============================================================================

void HttpServer::handle_health(const httplib::Request& req, httplib::Response& res) {
    const std::string level = req.get_param_value("level");
    const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_at_);

    json body = {
        {"status", "SERVING"},
        {"version", config_.service_version},
        {"uptime_seconds", uptime.count()},
    };

    if (level == "deep") {
        const auto& flags = aggregator_->flags();
        const auto& c = aggregator_->components();
        body["detectors"] = {
            {"pii_detection", detector_state(flags.pii_detection, true)},
            {"recognizer", c.recognizer->name()},
            {"prompt_injection", detector_state(flags.prompt_injection, c.pattern_engine->is_enabled())},
            {"anonymization", detector_state(flags.anonymization, c.anonymizer->is_enabled())},
            {"ml_jailbreak", detector_state(flags.ml_jailbreak, c.semantic_scorer->is_enabled())},
        };

        if (mapping_store_) {
            // Unreachable primary still serves from the local fallback
            body["cache"] = {
                {"backend", mapping_store_->backend_name()},
                {"reachable", mapping_store_->ping()},
            };
        }
    }

    res.status = httplib::StatusCode::OK_200;
    res.set_content(body.dump(), http::kJsonContentType);
}

// ============================================================================
// Handler: GET /metrics
// ============================================================================

void HttpServer::handle_metrics(const httplib::Request&, httplib::Response& res) {
    res.status = httplib::StatusCode::OK_200;
    res.set_content(build_metrics_output(), http::kPrometheusContentType);
}

std::string HttpServer::build_metrics_output() const {
    std::string output;

    const auto as = aggregator_->get_stats();
    const uint64_t safe = (as.checks > as.unsafe_verdicts) ? (as.checks - as.unsafe_verdicts) : 0;
    output += std::format(
        "# HELP llm_firewall_checks_total Content checks analyzed\n"
        "# TYPE llm_firewall_checks_total counter\n"
        "llm_firewall_checks_total{{verdict=\"safe\"}} {}\n"
        "llm_firewall_checks_total{{verdict=\"unsafe\"}} {}\n\n"
        "# HELP llm_firewall_rejected_inputs_total Checks rejected by input validation\n"
        "# TYPE llm_firewall_rejected_inputs_total counter\n"
        "llm_firewall_rejected_inputs_total {}\n\n",
        safe, as.unsafe_verdicts, as.rejected_inputs);

    output += std::format(
        "# HELP llm_firewall_findings_total Findings by detector\n"
        "# TYPE llm_firewall_findings_total counter\n"
        "llm_firewall_findings_total{{detector=\"pii\"}} {}\n"
        "llm_firewall_findings_total{{detector=\"pattern\"}} {}\n"
        "llm_firewall_findings_total{{detector=\"semantic\"}} {}\n\n"
        "# HELP llm_firewall_detector_faults_total Detector faults recovered with reduced confidence\n"
        "# TYPE llm_firewall_detector_faults_total counter\n"
        "llm_firewall_detector_faults_total{{detector=\"pii\"}} {}\n"
        "llm_firewall_detector_faults_total{{detector=\"pattern\"}} {}\n"
        "llm_firewall_detector_faults_total{{detector=\"semantic\"}} {}\n\n"
        "# HELP llm_firewall_anonymization_fallbacks_total Anonymization failures answered with redaction\n"
        "# TYPE llm_firewall_anonymization_fallbacks_total counter\n"
        "llm_firewall_anonymization_fallbacks_total {}\n\n",
        as.pii_findings, as.pattern_findings, as.semantic_findings,
        as.pii_faults, as.pattern_faults, as.semantic_faults,
        as.anonymization_fallbacks);

    output += std::format(
        "# HELP llm_firewall_ab_comparisons_total Pattern vs semantic verdict comparisons\n"
        "# TYPE llm_firewall_ab_comparisons_total counter\n"
        "llm_firewall_ab_comparisons_total{{result=\"agree\"}} {}\n"
        "llm_firewall_ab_comparisons_total{{result=\"disagree\"}} {}\n\n",
        as.ab_agreements, as.ab_disagreements);

    const auto& c = aggregator_->components();
    const auto es = c.anonymizer->get_stats();
    output += std::format(
        "# HELP llm_firewall_entities_replaced_total Entity spans substituted in output text\n"
        "# TYPE llm_firewall_entities_replaced_total counter\n"
        "llm_firewall_entities_replaced_total {}\n\n"
        "# HELP llm_firewall_mappings_reused_total Substitutions served from an existing mapping\n"
        "# TYPE llm_firewall_mappings_reused_total counter\n"
        "llm_firewall_mappings_reused_total {}\n\n",
        es.entities_replaced, es.mappings_reused);

    if (mapping_store_) {
        const auto ms = mapping_store_->get_stats();
        output += std::format(
            "# HELP llm_firewall_cache_backend_errors_total Mapping cache backend failures\n"
            "# TYPE llm_firewall_cache_backend_errors_total counter\n"
            "llm_firewall_cache_backend_errors_total {}\n\n"
            "# HELP llm_firewall_cache_fallback_total Mapping operations served by the local fallback\n"
            "# TYPE llm_firewall_cache_fallback_total counter\n"
            "llm_firewall_cache_fallback_total{{op=\"read\"}} {}\n"
            "llm_firewall_cache_fallback_total{{op=\"write\"}} {}\n\n",
            ms.backend_errors, ms.fallback_reads, ms.fallback_writes);
    }

    const auto hs = get_http_stats();
    output += std::format(
        "# HELP llm_firewall_http_requests_total check-content HTTP requests\n"
        "# TYPE llm_firewall_http_requests_total counter\n"
        "llm_firewall_http_requests_total {}\n\n"
        "# HELP llm_firewall_http_errors_total check-content HTTP errors by class\n"
        "# TYPE llm_firewall_http_errors_total counter\n"
        "llm_firewall_http_errors_total{{class=\"bad_request\"}} {}\n"
        "llm_firewall_http_errors_total{{class=\"internal\"}} {}\n",
        hs.requests, hs.bad_requests, hs.internal_errors);

    return output;
}

} // namespace llmfirewall
