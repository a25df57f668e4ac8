#include "store_registry.hpp"
#include <iostream>
#include <stdexcept>

namespace convmem {

StoreRegistry::StoreRegistry(std::shared_ptr<EmbeddingProvider> provider,
                             std::shared_ptr<const Ranker> ranker)
    : provider_(std::move(provider))
    , ranker_(ranker ? std::move(ranker) : std::make_shared<LinearRanker>()) {
    if (!provider_) throw std::invalid_argument("StoreRegistry requires an embedding provider");
}

std::shared_ptr<VectorStore> StoreRegistry::get(const std::string& conversation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stores_.find(conversation_id);
    if (it != stores_.end()) return it->second;

    auto store = std::make_shared<VectorStore>(conversation_id, provider_, ranker_);
    stores_.emplace(conversation_id, store);
    std::cerr << "[registry] Created store for conversation '" << conversation_id
              << "' (" << stores_.size() << " total)\n";
    return store;
}

bool StoreRegistry::clear_conversation(const std::string& conversation_id) {
    std::shared_ptr<VectorStore> store;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = stores_.find(conversation_id);
        if (it == stores_.end()) return false;
        store = it->second;
    }
    // Outside the registry lock: clear() may wait for an in-flight add().
    store->clear();
    return true;
}

bool StoreRegistry::contains(const std::string& conversation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stores_.count(conversation_id) > 0;
}

size_t StoreRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stores_.size();
}

std::vector<std::string> StoreRegistry::conversation_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(stores_.size());
    for (auto& [id, _] : stores_) ids.push_back(id);
    return ids;
}

} // namespace convmem
