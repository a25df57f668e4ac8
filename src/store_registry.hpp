#pragma once
#include "vector_store.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace convmem {

/**
 * Process-wide map conversation id -> VectorStore.
 *
 * Empty at construction, stores are created on first get() and live as long
 * as the registry. There is no eviction: clear_conversation() empties a store
 * but keeps its entry. Every store shares the registry's provider and ranker.
 */
class StoreRegistry {
public:
    explicit StoreRegistry(std::shared_ptr<EmbeddingProvider> provider,
                           std::shared_ptr<const Ranker> ranker = nullptr);

    StoreRegistry(const StoreRegistry&) = delete;
    StoreRegistry& operator=(const StoreRegistry&) = delete;

    std::shared_ptr<VectorStore> get(const std::string& conversation_id);

    // False when no store exists for the id; nothing is created in that case.
    bool clear_conversation(const std::string& conversation_id);

    bool contains(const std::string& conversation_id) const;
    size_t size() const;
    std::vector<std::string> conversation_ids() const;

    const EmbeddingProvider& provider() const { return *provider_; }

private:
    std::shared_ptr<EmbeddingProvider> provider_;
    std::shared_ptr<const Ranker> ranker_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<VectorStore>> stores_;
};

} // namespace convmem
