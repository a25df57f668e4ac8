#pragma once
#include <string>
#include <cstddef>
#include <stdexcept>

namespace convmem {

enum class ProviderErrorKind {
    connection,
    timeout,
    http_status,
    auth,
    rate_limit,
    malformed_response,
    empty_embedding,
    cancelled
};

const char* to_string(ProviderErrorKind kind);

// Maps provider/transport error text onto a kind. Falls back to http_status.
ProviderErrorKind classify_provider_error(const std::string& error_text);

// Embedding call failed, timed out, was cancelled or returned an unusable vector.
class ProviderError : public std::runtime_error {
public:
    ProviderError(ProviderErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ProviderErrorKind kind() const { return kind_; }

private:
    ProviderErrorKind kind_;
};

// Two vectors from different embedding spaces were about to be compared.
class DimensionMismatch : public std::runtime_error {
public:
    DimensionMismatch(size_t expected, size_t actual);

    size_t expected() const { return expected_; }
    size_t actual() const { return actual_; }

private:
    size_t expected_;
    size_t actual_;
};

class DuplicateTurn : public std::invalid_argument {
public:
    explicit DuplicateTurn(const std::string& turn_id)
        : std::invalid_argument("Turn id already present in store: " + turn_id), turn_id_(turn_id) {}

    const std::string& turn_id() const { return turn_id_; }

private:
    std::string turn_id_;
};

} // namespace convmem
