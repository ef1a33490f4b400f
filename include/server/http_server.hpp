#pragma once

#include "cache/mapping_store.hpp"
#include "core/verdict_aggregator.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace llmfirewall {

/**
 * @brief HTTP front end of the firewall
 *
 * Routes:
 *   POST /v1/check-content   run a check, returns the serialized verdict
 *   GET  /health             liveness; ?level=deep adds detector and cache state
 *   GET  /metrics            Prometheus text exposition
 */
class HttpServer {
public:
    struct Config {
        std::string host = "0.0.0.0";
        int port = 50051;
        size_t thread_pool_size = 8;
        std::string service_version = "1.0.0";
    };

    HttpServer(std::shared_ptr<VerdictAggregator> aggregator,
               std::shared_ptr<MappingStore> mapping_store,
               Config config);
    ~HttpServer();

    /// Blocks until stop() is called. Throws std::runtime_error when the socket cannot be bound.
    void start();
    void stop();

    struct HttpStats {
        uint64_t requests;
        uint64_t bad_requests;
        uint64_t internal_errors;
    };
    [[nodiscard]] HttpStats get_http_stats() const;

    // Exposed for tests; the same code paths serve the routes.
    void handle_check_content(const httplib::Request& req, httplib::Response& res);
    void handle_health(const httplib::Request& req, httplib::Response& res);
    void handle_metrics(const httplib::Request& req, httplib::Response& res);

    [[nodiscard]] std::string build_metrics_output() const;

private:
    void register_routes(httplib::Server& svr);

    std::shared_ptr<VerdictAggregator> aggregator_;
    std::shared_ptr<MappingStore> mapping_store_;   // nullable: no cache section in health
    const Config config_;
    const std::chrono::steady_clock::time_point started_at_;

    std::mutex server_mutex_;
    std::unique_ptr<httplib::Server> server_;

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> bad_requests_{0};
    std::atomic<uint64_t> internal_errors_{0};
};

} // namespace llmfirewall
