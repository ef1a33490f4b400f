#include "cache/redis_cache_backend.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>

namespace llmfirewall {

// ============================================================================
// RESP codec
// ============================================================================

namespace resp {

namespace {

constexpr int kMaxNestingDepth = 8;
constexpr int64_t kMaxBulkLength = 512LL * 1024 * 1024;  // Redis proto-max-bulk-len default

std::optional<Reply> parse_at(std::string_view buf, size_t& pos, int depth) {
    if (depth > kMaxNestingDepth) {
        throw CacheError("RESP: reply nesting too deep");
    }
    if (pos >= buf.size()) return std::nullopt;

    const auto eol = buf.find("\r\n", pos);
    if (eol == std::string_view::npos) return std::nullopt;

    const char prefix = buf[pos];
    const auto line = buf.substr(pos + 1, eol - pos - 1);
    const size_t next = eol + 2;

    Reply reply;
    switch (prefix) {
        case '+':
            reply.type = Reply::Type::SIMPLE_STRING;
            reply.str = std::string(line);
            pos = next;
            return reply;

        case '-':
            reply.type = Reply::Type::ERROR;
            reply.str = std::string(line);
            pos = next;
            return reply;

        case ':': {
            const auto value = utils::try_parse_int<int64_t>(line);
            if (!value) throw CacheError(std::format("RESP: bad integer '{}'", line));
            reply.type = Reply::Type::INTEGER;
            reply.integer = *value;
            pos = next;
            return reply;
        }

        case '$': {
            const auto len = utils::try_parse_int<int64_t>(line);
            if (!len || *len < -1 || *len > kMaxBulkLength) {
                throw CacheError(std::format("RESP: bad bulk length '{}'", line));
            }
            if (*len == -1) {
                reply.type = Reply::Type::NIL;
                pos = next;
                return reply;
            }
            const auto n = static_cast<size_t>(*len);
            if (buf.size() - next < n + 2) return std::nullopt;
            if (buf.substr(next + n, 2) != "\r\n") {
                throw CacheError("RESP: bulk string not terminated by CRLF");
            }
            reply.type = Reply::Type::BULK_STRING;
            reply.str = std::string(buf.substr(next, n));
            pos = next + n + 2;
            return reply;
        }

        case '*': {
            const auto count = utils::try_parse_int<int64_t>(line);
            if (!count || *count < -1) throw CacheError(std::format("RESP: bad array length '{}'", line));
            if (*count == -1) {
                reply.type = Reply::Type::NIL;
                pos = next;
                return reply;
            }
            reply.type = Reply::Type::ARRAY;
            size_t cursor = next;
            for (int64_t i = 0; i < *count; ++i) {
                auto element = parse_at(buf, cursor, depth + 1);
                if (!element) return std::nullopt;
                reply.elements.push_back(std::move(*element));
            }
            pos = cursor;
            return reply;
        }

        default:
            throw CacheError(std::format("RESP: unexpected type byte 0x{:02x}",
                static_cast<unsigned char>(prefix)));
    }
}

} // anonymous namespace

std::string encode_command(const std::vector<std::string>& args) {
    std::string out = std::format("*{}\r\n", args.size());
    for (const auto& arg : args) {
        out += std::format("${}\r\n", arg.size());
        out += arg;
        out += "\r\n";
    }
    return out;
}

std::optional<Reply> parse_reply(std::string_view buffer, size_t& consumed) {
    size_t pos = 0;
    auto reply = parse_at(buffer, pos, 0);
    consumed = reply ? pos : 0;
    return reply;
}

} // namespace resp

// ============================================================================
// RedisCacheBackend
// ============================================================================

RedisCacheBackend::RedisCacheBackend(Config config)
    : config_(std::move(config)) {}

RedisCacheBackend::~RedisCacheBackend() {
    std::lock_guard lock(mutex_);
    disconnect_locked();
}

void RedisCacheBackend::connect_locked() {
    struct addrinfo hints{};
    struct addrinfo* result = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    const std::string port = std::to_string(config_.port);
    if (getaddrinfo(config_.host.c_str(), port.c_str(), &hints, &result) != 0 || !result) {
        throw CacheError(std::format("Redis: DNS resolution failed for {}", config_.host));
    }

    struct timeval tv{};
    tv.tv_sec = static_cast<time_t>(config_.timeout_ms / 1000);
    tv.tv_usec = static_cast<suseconds_t>((config_.timeout_ms % 1000) * 1000);

    int fd = -1;
    for (auto* ai = result; ai != nullptr; ai = ai->ai_next) {
        fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) continue;

        // SO_SNDTIMEO also bounds connect() on Linux
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) break;
        close(fd);
        fd = -1;
    }
    freeaddrinfo(result);

    if (fd < 0) {
        throw CacheError(std::format("Redis: connect failed to {}:{}", config_.host, config_.port));
    }

    const int one = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

    fd_ = fd;
    read_buffer_.clear();
    connects_.fetch_add(1, std::memory_order_relaxed);

    if (!config_.password.empty()) {
        const auto reply = round_trip_locked({"AUTH", config_.password});
        if (reply.type == resp::Reply::Type::ERROR) {
            throw CacheError(std::format("Redis: AUTH rejected: {}", reply.str));
        }
    }
    if (config_.db != 0) {
        const auto reply = round_trip_locked({"SELECT", std::to_string(config_.db)});
        if (reply.type == resp::Reply::Type::ERROR) {
            throw CacheError(std::format("Redis: SELECT {} rejected: {}", config_.db, reply.str));
        }
    }
}

void RedisCacheBackend::disconnect_locked() {
    if (fd_ >= 0) {
        close(fd_);
        fd_ = -1;
    }
    read_buffer_.clear();
}

void RedisCacheBackend::send_locked(const std::string& payload) {
    size_t sent = 0;
    while (sent < payload.size()) {
        const ssize_t n = ::send(fd_, payload.data() + sent, payload.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            const bool timed_out = (errno == EAGAIN || errno == EWOULDBLOCK);
            throw CacheError(timed_out ? "Redis: send timed out"
                                       : std::format("Redis: send failed: {}", std::strerror(errno)));
        }
        sent += static_cast<size_t>(n);
    }
}

resp::Reply RedisCacheBackend::read_reply_locked() {
    char chunk[4096];
    while (true) {
        size_t consumed = 0;
        auto reply = resp::parse_reply(read_buffer_, consumed);
        if (reply) {
            read_buffer_.erase(0, consumed);
            return std::move(*reply);
        }

        const ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n == 0) throw CacheError("Redis: connection closed by server");
        if (n < 0) {
            const bool timed_out = (errno == EAGAIN || errno == EWOULDBLOCK);
            throw CacheError(timed_out ? "Redis: read timed out"
                                       : std::format("Redis: recv failed: {}", std::strerror(errno)));
        }
        read_buffer_.append(chunk, static_cast<size_t>(n));
    }
}

resp::Reply RedisCacheBackend::round_trip_locked(const std::vector<std::string>& args) {
    send_locked(resp::encode_command(args));
    return read_reply_locked();
}

resp::Reply RedisCacheBackend::execute(const std::vector<std::string>& args) {
    std::lock_guard lock(mutex_);
    commands_.fetch_add(1, std::memory_order_relaxed);
    try {
        if (fd_ < 0) connect_locked();
        return round_trip_locked(args);
    } catch (const CacheError&) {
        errors_.fetch_add(1, std::memory_order_relaxed);
        disconnect_locked();
        throw;
    }
}

std::optional<std::string> RedisCacheBackend::get(const std::string& key) {
    const auto reply = execute({"GET", key});
    switch (reply.type) {
        case resp::Reply::Type::BULK_STRING:
            return reply.str;
        case resp::Reply::Type::NIL:
            return std::nullopt;
        case resp::Reply::Type::ERROR:
            throw CacheError(std::format("Redis: GET failed: {}", reply.str));
        case resp::Reply::Type::SIMPLE_STRING:
        case resp::Reply::Type::INTEGER:
        case resp::Reply::Type::ARRAY:
            break;
    }
    throw CacheError("Redis: unexpected reply type for GET");
}

void RedisCacheBackend::set(const std::string& key, const std::string& value,
                            std::chrono::seconds ttl) {
    // EX requires a positive value
    const auto seconds = std::max<std::chrono::seconds::rep>(ttl.count(), 1);
    const auto reply = execute({"SET", key, value, "EX", std::to_string(seconds)});
    if (reply.type == resp::Reply::Type::ERROR) {
        throw CacheError(std::format("Redis: SET failed: {}", reply.str));
    }
    if (reply.type != resp::Reply::Type::SIMPLE_STRING || reply.str != "OK") {
        throw CacheError("Redis: unexpected reply to SET");
    }
}

bool RedisCacheBackend::ping() {
    try {
        const auto reply = execute({"PING"});
        return reply.type == resp::Reply::Type::SIMPLE_STRING && reply.str == "PONG";
    } catch (const CacheError& e) {
        utils::log::debug(std::format("Redis ping failed: {}", e.what()));
        return false;
    }
}

RedisCacheBackend::Stats RedisCacheBackend::get_stats() const {
    return {
        .commands = commands_.load(std::memory_order_relaxed),
        .errors = errors_.load(std::memory_order_relaxed),
        .connects = connects_.load(std::memory_order_relaxed),
    };
}

} // namespace llmfirewall
