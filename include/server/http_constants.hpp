#pragma once

#include <string>

namespace llmfirewall::http {

// std::string because cpp-httplib APIs require const std::string&
inline const std::string kRequestIdHeader = "X-Request-Id";
inline constexpr const char* kJsonContentType = "application/json";
inline constexpr const char* kPrometheusContentType = "text/plain; version=0.0.4; charset=utf-8";

inline const std::string kCheckContentPath = "/v1/check-content";
inline const std::string kHealthPath = "/health";
inline const std::string kMetricsPath = "/metrics";

} // namespace llmfirewall::http
