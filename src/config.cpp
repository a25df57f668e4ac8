#include "config.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace convmem {

ProviderConfig Config::resolve_embedding_provider() const {
    auto it = providers.find(embedding.provider);
    if (it != providers.end()) return it->second;
    throw std::runtime_error("Embedding provider '" + embedding.provider + "' is not configured");
}

Config Config::make_default() {
    Config c;
    c.providers["default"] = ProviderConfig{"", "https://api.openai.com/v1", "OPENAI_API_KEY"};
    return c;
}

nlohmann::json Config::to_json() const {
    nlohmann::json j;

    for (auto& [k, v] : providers) {
        j["providers"][k] = {{"api_base", v.api_base}};
        if (!v.api_key.empty()) j["providers"][k]["api_key"] = v.api_key;
        if (!v.api_key_env.empty()) j["providers"][k]["api_key_env"] = v.api_key_env;
    }

    auto& em = j["embedding"];
    em["provider"] = embedding.provider;
    em["model"] = embedding.model;
    em["dimensions"] = embedding.dimensions;
    em["timeout_ms"] = embedding.timeout_ms;
    em["connect_timeout_ms"] = embedding.connect_timeout_ms;
    em["hash_buckets"] = embedding.hash_buckets;

    j["retrieval"] = {
        {"recent_window", retrieval.recent_window},
        {"top_k", retrieval.top_k}
    };

    auto& gw = j["gateway"];
    gw["host"] = gateway.host;
    gw["port"] = gateway.port;
    if (!gateway.api_key.empty()) gw["api_key"] = gateway.api_key;
    if (gateway.rate_limit_rpm > 0) gw["rate_limit_rpm"] = gateway.rate_limit_rpm;

    return j;
}

Config Config::from_json(const nlohmann::json& j) {
    Config c;

    if (j.contains("providers")) {
        for (auto& [k, v] : j["providers"].items()) {
            ProviderConfig p;
            p.api_key = v.value("api_key", "");
            p.api_base = v.value("api_base", "");
            p.api_key_env = v.value("api_key_env", p.api_key_env);
            c.providers[k] = std::move(p);
        }
    }

    if (j.contains("embedding")) {
        auto& em = j["embedding"];
        c.embedding.provider = em.value("provider", c.embedding.provider);
        c.embedding.model = em.value("model", c.embedding.model);
        c.embedding.dimensions = em.value("dimensions", c.embedding.dimensions);
        c.embedding.timeout_ms = em.value("timeout_ms", c.embedding.timeout_ms);
        c.embedding.connect_timeout_ms = em.value("connect_timeout_ms", c.embedding.connect_timeout_ms);
        c.embedding.hash_buckets = em.value("hash_buckets", c.embedding.hash_buckets);
    }

    if (j.contains("retrieval")) {
        auto& rt = j["retrieval"];
        c.retrieval.recent_window = rt.value("recent_window", c.retrieval.recent_window);
        c.retrieval.top_k = rt.value("top_k", c.retrieval.top_k);
    }

    if (j.contains("gateway")) {
        auto& gw = j["gateway"];
        c.gateway.host = gw.value("host", c.gateway.host);
        c.gateway.port = gw.value("port", c.gateway.port);
        c.gateway.api_key = gw.value("api_key", "");
        c.gateway.rate_limit_rpm = gw.value("rate_limit_rpm", 0);
    }

    if (c.embedding.dimensions < 0) c.embedding.dimensions = 0;
    if (c.embedding.hash_buckets <= 0) c.embedding.hash_buckets = 4096;
    if (c.retrieval.recent_window < 0) c.retrieval.recent_window = 0;
    if (c.retrieval.top_k < 0) c.retrieval.top_k = 0;

    return c;
}

Config Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[warn] Config not found at " << path << ", using defaults\n";
        return make_default();
    }
    try {
        nlohmann::json j = nlohmann::json::parse(f);
        return from_json(j);
    } catch (const std::exception& e) {
        std::cerr << "[warn] Failed to parse config: " << e.what() << ", using defaults\n";
        return make_default();
    }
}

void Config::save(const std::string& path) const {
    auto parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent);
    std::ofstream f(path);
    f << to_json().dump(2) << std::endl;
}

} // namespace convmem
