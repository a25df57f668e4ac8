#pragma once
#include <string>
#include <map>
#include <nlohmann/json.hpp>
#include "utils.hpp"

namespace convmem {

struct ProviderConfig {
    std::string api_key;
    std::string api_base;
    std::string api_key_env = "OPENAI_API_KEY";  // consulted when api_key is empty

    std::string effective_api_key() const {
        if (!api_key.empty()) return api_key;
        return api_key_env.empty() ? "" : env_or(api_key_env.c_str(), "");
    }
};

struct EmbeddingConfig {
    std::string provider = "local";   // "local" or a key into providers
    std::string model = "text-embedding-3-small";
    int dimensions = 0;               // 0 = whatever the provider returns
    int timeout_ms = 30000;
    int connect_timeout_ms = 10000;
    int hash_buckets = 4096;          // local provider only
};

struct RetrievalConfig {
    int recent_window = 2;
    int top_k = 3;
};

struct GatewayConfig {
    std::string host = "127.0.0.1";
    int port = 8001;
    std::string api_key;       // Optional Bearer token auth
    int rate_limit_rpm = 0;    // 0 = unlimited
};

struct Config {
    std::map<std::string, ProviderConfig> providers;
    EmbeddingConfig embedding;
    RetrievalConfig retrieval;
    GatewayConfig gateway;

    // Throws std::runtime_error when embedding.provider names an unknown key.
    ProviderConfig resolve_embedding_provider() const;

    static Config make_default();
    static Config load(const std::string& path);
    void save(const std::string& path) const;
    nlohmann::json to_json() const;
    static Config from_json(const nlohmann::json& j);
};

} // namespace convmem
