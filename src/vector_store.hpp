#pragma once
#include "conversation_turn.hpp"
#include "embedding_provider.hpp"
#include "similarity.hpp"
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace convmem {

// Last turns of a store, taken under one lock.
struct RecentWindow {
    size_t first_index = 0;   // insertion index of turns.front()
    size_t total = 0;         // store size at snapshot time
    std::vector<ConversationTurn> turns;

    std::set<size_t> indices() const;
};

struct SearchResult {
    ConversationTurn turn;
    float similarity;
    size_t index;   // insertion index in the store
};

/**
 * Ordered, append-only turn history of one conversation.
 *
 * add() calls are serialized per store (the embedding call included), so
 * indices grow strictly in arrival order. Readers share the turn list; the
 * append and clear() take it exclusively. Readers get copies of turns.
 */
class VectorStore {
public:
    VectorStore(std::string conversation_id,
                std::shared_ptr<EmbeddingProvider> provider,
                std::shared_ptr<const Ranker> ranker = nullptr);

    VectorStore(const VectorStore&) = delete;
    VectorStore& operator=(const VectorStore&) = delete;

    /**
     * Embeds the turn when it carries no embedding, then appends it.
     * @return the insertion index of the new turn.
     * @throws ProviderError the embedding call failed; the store is unchanged.
     * @throws DimensionMismatch a supplied embedding does not fit the store.
     * @throws DuplicateTurn the id is already present.
     * @throws std::invalid_argument a supplied embedding has a non-finite value.
     */
    size_t add(ConversationTurn turn, const EmbedOptions& opts = {});

    /**
     * Top-k turns by cosine similarity to query_text. Excluded indices and
     * turns failing the filter are dropped before scoring. Empty store,
     * k == 0 or blank query -> empty result without calling the provider.
     * @throws ProviderError the query embedding failed.
     */
    std::vector<SearchResult> search(const std::string& query_text,
                                     size_t k = 3,
                                     const std::set<size_t>& exclude_indices = {},
                                     const MetadataFilter& metadata_filter = {},
                                     const EmbedOptions& opts = {}) const;

    // Last n turns in insertion order (all of them when fewer exist).
    std::vector<ConversationTurn> get_recent_turns(size_t n) const;
    std::set<size_t> recent_indices(size_t n) const;
    RecentWindow recent_window(size_t n) const;

    std::optional<ConversationTurn> get_turn(size_t index) const;

    size_t size() const;
    bool empty() const { return size() == 0; }
    size_t dimensions() const;
    void clear();

    const std::string& conversation_id() const { return conversation_id_; }
    const EmbeddingProvider& provider() const { return *provider_; }

private:
    std::string conversation_id_;
    std::shared_ptr<EmbeddingProvider> provider_;
    std::shared_ptr<const Ranker> ranker_;

    mutable std::shared_mutex turns_mutex_;
    std::mutex ingest_mutex_;

    std::vector<ConversationTurn> turns_;
    std::unordered_set<std::string> ids_;
    size_t dimensions_ = 0;   // 0 until the first turn lands
};

} // namespace convmem
