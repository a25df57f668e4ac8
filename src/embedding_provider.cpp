#include "embedding_provider.hpp"
#include "errors.hpp"
#include <httplib.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <iostream>

namespace convmem {

static ProviderError provider_failure(ProviderErrorKind kind, const std::string& message) {
    std::cerr << "[embedding] " << to_string(kind) << ": " << message << "\n";
    return ProviderError(kind, message);
}

// ── Shared checks ───────────────────────────────────────────────────

std::vector<float> EmbeddingProvider::embed(const std::string& text, const EmbedOptions& opts) {
    if (opts.cancelled()) {
        throw provider_failure(ProviderErrorKind::cancelled, "Embedding cancelled before request");
    }

    std::vector<float> vec = do_embed(text, opts);

    if (opts.cancelled()) {
        throw provider_failure(ProviderErrorKind::cancelled, "Embedding cancelled while in flight");
    }
    if (vec.empty()) {
        throw provider_failure(ProviderErrorKind::empty_embedding, "Provider returned an empty embedding");
    }
    for (float v : vec) {
        if (!std::isfinite(v)) {
            throw provider_failure(ProviderErrorKind::malformed_response,
                                   "Provider returned a non-finite embedding value");
        }
    }

    size_t expected = tag().dimensions;
    if (expected == 0) {
        learn_dimensions(vec.size());
    } else if (vec.size() != expected) {
        throw provider_failure(ProviderErrorKind::malformed_response,
                               "Provider returned " + std::to_string(vec.size()) +
                               " dimensions, expected " + std::to_string(expected));
    }
    return vec;
}

// ── OpenAI-compatible HTTP provider ─────────────────────────────────

static void parse_url(const std::string& url, std::string& scheme, std::string& host, int& port, std::string& path_prefix) {
    scheme = "http";
    host = "127.0.0.1";
    port = 80;
    path_prefix = "";

    size_t pos = 0;
    if (url.substr(0, 8) == "https://") {
        scheme = "https"; pos = 8; port = 443;
    } else if (url.substr(0, 7) == "http://") {
        scheme = "http"; pos = 7; port = 80;
    }

    size_t slash = url.find('/', pos);
    std::string host_port = (slash != std::string::npos) ? url.substr(pos, slash - pos) : url.substr(pos);
    if (slash != std::string::npos) {
        path_prefix = url.substr(slash);
        while (!path_prefix.empty() && path_prefix.back() == '/') path_prefix.pop_back();
    }

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        host = host_port.substr(0, colon);
        port = std::stoi(host_port.substr(colon + 1));
    } else {
        host = host_port;
    }
}

OpenAiEmbeddingProvider::OpenAiEmbeddingProvider(std::string name, const ProviderConfig& provider,
                                                 const EmbeddingConfig& embedding)
    : name_(std::move(name))
    , provider_(provider)
    , embedding_(embedding)
    , dimensions_(embedding.dimensions > 0 ? static_cast<size_t>(embedding.dimensions) : 0) {
    std::string scheme, host;
    int port = 80;
    parse_url(provider_.api_base, scheme, host, port, path_prefix_);
    base_url_ = scheme + "://" + host + ":" + std::to_string(port);
}

ProviderTag OpenAiEmbeddingProvider::tag() const {
    return ProviderTag{name_, embedding_.model, dimensions_.load()};
}

void OpenAiEmbeddingProvider::learn_dimensions(size_t dims) {
    size_t unset = 0;
    dimensions_.compare_exchange_strong(unset, dims);
}

static void apply_timeout(httplib::Client& cli, std::chrono::milliseconds total,
                          std::chrono::milliseconds connect) {
    auto sec = [](std::chrono::milliseconds ms) { return static_cast<time_t>(ms.count() / 1000); };
    auto usec = [](std::chrono::milliseconds ms) { return static_cast<time_t>((ms.count() % 1000) * 1000); };
    cli.set_connection_timeout(sec(connect), usec(connect));
    cli.set_read_timeout(sec(total), usec(total));
    cli.set_write_timeout(sec(total), usec(total));
}

std::vector<float> OpenAiEmbeddingProvider::do_embed(const std::string& text, const EmbedOptions& opts) {
    auto budget = opts.timeout.count() > 0 ? opts.timeout : std::chrono::milliseconds(embedding_.timeout_ms);
    auto connect = std::min(budget, std::chrono::milliseconds(embedding_.connect_timeout_ms));

    httplib::Client cli(base_url_);
    if (!cli.is_valid()) {
        throw provider_failure(ProviderErrorKind::connection,
                               "Cannot create HTTP client for " + base_url_ +
                               " (https needs cpp-httplib with OpenSSL support)");
    }
    apply_timeout(cli, budget, connect);

    nlohmann::json body;
    body["model"] = embedding_.model;
    body["input"] = nlohmann::json::array({text});
    if (embedding_.dimensions > 0) body["dimensions"] = embedding_.dimensions;

    httplib::Headers headers;
    std::string api_key = provider_.effective_api_key();
    if (!api_key.empty()) {
        headers.emplace("Authorization", "Bearer " + api_key);
    }

    std::string path = path_prefix_ + "/embeddings";
    auto started = std::chrono::steady_clock::now();
    auto res = cli.Post(path, headers, body.dump(), "application/json");

    if (!res) {
        int64_t took = elapsed_ms(started);
        std::string detail = "error code " + std::to_string(static_cast<int>(res.error()));
        // A read timeout surfaces as a plain read error; a call that used up
        // the budget (allowing for poll granularity) counts as a timeout.
        if (took * 10 >= budget.count() * 9) {
            throw provider_failure(ProviderErrorKind::timeout,
                                   "Embedding request timed out after " + std::to_string(took) + "ms (" + detail + ")");
        }
        throw provider_failure(ProviderErrorKind::connection,
                               "Embedding request failed: connection error (" + detail + ")");
    }

    if (res->status != 200) {
        std::string message = "Embedding returned status " + std::to_string(res->status) + ": " + res->body;
        ProviderErrorKind kind;
        switch (res->status) {
        case 401: case 403: kind = ProviderErrorKind::auth; break;
        case 429:           kind = ProviderErrorKind::rate_limit; break;
        case 408: case 504: kind = ProviderErrorKind::timeout; break;
        default:            kind = classify_provider_error(message); break;
        }
        throw provider_failure(kind, message);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(res->body);
    } catch (const std::exception& e) {
        throw provider_failure(ProviderErrorKind::malformed_response,
                               std::string("Failed to parse embedding response: ") + e.what());
    }

    if (!j.is_object() || !j.contains("data") || !j["data"].is_array() || j["data"].empty()) {
        throw provider_failure(ProviderErrorKind::malformed_response, "Embedding response has no data array");
    }
    auto& item = j["data"][0];
    if (!item.is_object() || !item.contains("embedding") || !item["embedding"].is_array()) {
        throw provider_failure(ProviderErrorKind::malformed_response, "Embedding response item has no embedding array");
    }

    std::vector<float> vec;
    vec.reserve(item["embedding"].size());
    for (auto& v : item["embedding"]) {
        if (!v.is_number()) {
            throw provider_failure(ProviderErrorKind::malformed_response, "Embedding contains a non-numeric value");
        }
        vec.push_back(v.get<float>());
    }
    return vec;
}

// ── Hashing provider ────────────────────────────────────────────────

static uint64_t fnv1a(const std::string& s) {
    uint64_t h = 14695981039346656037ull;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ull;
    }
    return h;
}

HashingEmbeddingProvider::HashingEmbeddingProvider(size_t buckets)
    : buckets_(buckets > 0 ? buckets : 4096) {}

ProviderTag HashingEmbeddingProvider::tag() const {
    return ProviderTag{"local", "fnv1a-bow", buckets_};
}

std::vector<float> HashingEmbeddingProvider::do_embed(const std::string& text, const EmbedOptions&) {
    std::vector<float> vec(buckets_, 0.0f);

    std::string token;
    auto flush = [&]() {
        if (token.empty()) return;
        vec[fnv1a(token) % buckets_] += 1.0f;
        token.clear();
    };
    for (char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            token += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        } else {
            flush();
        }
    }
    flush();

    float norm = 0.0f;
    for (float v : vec) norm += v * v;
    if (norm > 0.0f) {
        norm = std::sqrt(norm);
        for (float& v : vec) v /= norm;
    }
    return vec;
}

// ── Factory ─────────────────────────────────────────────────────────

std::shared_ptr<EmbeddingProvider> make_embedding_provider(const Config& cfg) {
    if (cfg.embedding.provider == "local") {
        return std::make_shared<HashingEmbeddingProvider>(static_cast<size_t>(cfg.embedding.hash_buckets));
    }
    ProviderConfig pc = cfg.resolve_embedding_provider();
    return std::make_shared<OpenAiEmbeddingProvider>(cfg.embedding.provider, pc, cfg.embedding);
}

} // namespace convmem
