#include "errors.hpp"
#include "utils.hpp"
#include <initializer_list>

namespace convmem {

const char* to_string(ProviderErrorKind kind) {
    switch (kind) {
    case ProviderErrorKind::connection:         return "connection";
    case ProviderErrorKind::timeout:            return "timeout";
    case ProviderErrorKind::http_status:        return "http_status";
    case ProviderErrorKind::auth:               return "auth";
    case ProviderErrorKind::rate_limit:         return "rate_limit";
    case ProviderErrorKind::malformed_response: return "malformed_response";
    case ProviderErrorKind::empty_embedding:    return "empty_embedding";
    case ProviderErrorKind::cancelled:          return "cancelled";
    }
    return "unknown";
}

static bool text_contains_any(const std::string& text, std::initializer_list<const char*> patterns) {
    for (auto p : patterns) {
        if (text.find(p) != std::string::npos) return true;
    }
    return false;
}

ProviderErrorKind classify_provider_error(const std::string& error_text) {
    std::string lower = to_lower(error_text);

    if (text_contains_any(lower, {"rate limit", "rate_limit", "too many requests", "429",
                                   "quota exceeded", "resource_exhausted"}))
        return ProviderErrorKind::rate_limit;

    if (text_contains_any(lower, {"timeout", "timed out", "deadline exceeded"}))
        return ProviderErrorKind::timeout;

    if (text_contains_any(lower, {"401", "403", "unauthorized", "forbidden",
                                   "invalid api key", "invalid_api_key", "authentication"}))
        return ProviderErrorKind::auth;

    if (text_contains_any(lower, {"connection refused", "connection error", "could not connect"}))
        return ProviderErrorKind::connection;

    return ProviderErrorKind::http_status;
}

DimensionMismatch::DimensionMismatch(size_t expected, size_t actual)
    : std::runtime_error("Embedding dimension mismatch: expected " + std::to_string(expected) +
                         ", got " + std::to_string(actual))
    , expected_(expected)
    , actual_(actual) {}

} // namespace convmem
