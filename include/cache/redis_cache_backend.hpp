#pragma once

#include "cache/icache_backend.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace llmfirewall {

// ============================================================================
// RESP2 codec (Redis serialization protocol)
// ============================================================================

namespace resp {

struct Reply {
    enum class Type { SIMPLE_STRING, ERROR, INTEGER, BULK_STRING, NIL, ARRAY };

    Type type = Type::NIL;
    std::string str;
    int64_t integer = 0;
    std::vector<Reply> elements;
};

/// Encode a command as a RESP array of bulk strings.
[[nodiscard]] std::string encode_command(const std::vector<std::string>& args);

/**
 * @brief Parse one reply from the front of buffer.
 * @param consumed Set to the number of bytes used (0 when incomplete)
 * @return The reply, or nullopt when buffer holds only part of a reply
 * @throws CacheError on a protocol violation
 */
[[nodiscard]] std::optional<Reply> parse_reply(std::string_view buffer, size_t& consumed);

} // namespace resp

/**
 * @brief Redis-backed mapping store over a single blocking TCP connection.
 *
 * Calls are serialized on one connection. Connect, send and receive are
 * bounded by timeout_ms. Any I/O or protocol failure closes the connection
 * and throws CacheError; the next call reconnects.
 */
class RedisCacheBackend : public ICacheBackend {
public:
    struct Config {
        std::string host = "127.0.0.1";
        uint16_t port = 6379;
        std::string password;
        uint32_t db = 0;
        uint32_t timeout_ms = 200;
    };

    explicit RedisCacheBackend(Config config);
    ~RedisCacheBackend() override;

    RedisCacheBackend(const RedisCacheBackend&) = delete;
    RedisCacheBackend& operator=(const RedisCacheBackend&) = delete;

    [[nodiscard]] std::optional<std::string> get(const std::string& key) override;

    void set(const std::string& key, const std::string& value,
             std::chrono::seconds ttl) override;

    [[nodiscard]] bool ping() override;

    [[nodiscard]] const char* name() const override { return "redis"; }

    struct Stats {
        uint64_t commands = 0;
        uint64_t errors = 0;
        uint64_t connects = 0;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    [[nodiscard]] resp::Reply execute(const std::vector<std::string>& args);

    // All *_locked helpers require mutex_ held
    void connect_locked();
    void disconnect_locked();
    void send_locked(const std::string& payload);
    [[nodiscard]] resp::Reply read_reply_locked();
    [[nodiscard]] resp::Reply round_trip_locked(const std::vector<std::string>& args);

    Config config_;
    std::mutex mutex_;
    int fd_ = -1;
    std::string read_buffer_;

    std::atomic<uint64_t> commands_{0};
    std::atomic<uint64_t> errors_{0};
    std::atomic<uint64_t> connects_{0};
};

} // namespace llmfirewall
