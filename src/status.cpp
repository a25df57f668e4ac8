#include "status.hpp"
#include "config.hpp"
#include "embedding_provider.hpp"
#include <iostream>

namespace convmem {

static std::string mask_key(const std::string& key) {
    if (key.empty()) return "(not set)";
    if (key.size() <= 8) return "****";
    return key.substr(0, 4) + "..." + key.substr(key.size() - 4);
}

int cmd_status(const std::string& config_path) {
    Config cfg = Config::load(config_path);

    std::cout << "=== convmem status ===\n";
    std::cout << "Config path  : " << config_path
              << (fs::exists(config_path) ? "" : " (missing, using defaults)") << "\n";

    std::cout << "Providers    : ";
    bool first = true;
    for (auto& [name, p] : cfg.providers) {
        if (!first) std::cout << ", ";
        std::cout << name;
        if (!p.api_base.empty()) std::cout << " (" << p.api_base << ", key " << mask_key(p.effective_api_key()) << ")";
        first = false;
    }
    if (first) std::cout << "(none)";
    std::cout << "\n";

    std::cout << "Embedding    : " << cfg.embedding.provider;
    try {
        auto provider = make_embedding_provider(cfg);
        std::cout << " -> " << provider->tag().str() << "\n";
    } catch (const std::exception& e) {
        std::cout << " (invalid: " << e.what() << ")\n";
    }
    std::cout << "Timeouts     : " << cfg.embedding.timeout_ms << "ms request, "
              << cfg.embedding.connect_timeout_ms << "ms connect\n";

    std::cout << "Retrieval    : last " << cfg.retrieval.recent_window
              << " turns + top " << cfg.retrieval.top_k << " similar\n";

    std::cout << "Gateway      : " << cfg.gateway.host << ":" << cfg.gateway.port;
    if (!cfg.gateway.api_key.empty()) std::cout << " (auth)";
    if (cfg.gateway.rate_limit_rpm > 0) std::cout << " (" << cfg.gateway.rate_limit_rpm << " rpm)";
    std::cout << "\n";
    return 0;
}

} // namespace convmem
