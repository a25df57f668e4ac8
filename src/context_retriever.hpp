#pragma once
#include "vector_store.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace convmem {

enum class Provenance { recent, retrieved };

struct ContextTurn {
    std::string question;
    std::optional<std::string> generated_query;
    std::vector<std::string> tables;
    Provenance provenance = Provenance::recent;
    std::optional<float> similarity;   // retrieved turns only
    size_t turn_number = 0;            // 1-based position in the conversation

    nlohmann::json to_json() const;
};

struct RetrievalTimings {
    int64_t sliding_window_ms = 0;
    int64_t semantic_search_ms = 0;
};

struct HybridContext {
    std::vector<ContextTurn> turns;   // recent first, then retrieved by rank
    RetrievalTimings timings;

    bool empty() const { return turns.empty(); }
    size_t count(Provenance p) const;
    nlohmann::json to_json() const;
};

struct RetrievalOptions {
    size_t recent_window = 2;
    size_t top_k = 3;
    MetadataFilter filter;
    EmbedOptions embed;
};

/**
 * Recency window plus semantic search over the older turns.
 *
 * The last recent_window turns are always included. When the store holds
 * more than that, the question is searched against the remaining turns
 * (window indices excluded) and the top_k hits are appended.
 * ProviderError from the search propagates.
 */
HybridContext retrieve_context(const VectorStore& store,
                               const std::string& question,
                               const RetrievalOptions& opts = {});

// Prompt block with [RECENT Turn N] / [RETRIEVED Turn N, similarity=x] markers.
// Empty string for an empty context.
std::string format_context_for_prompt(const HybridContext& context);

} // namespace convmem
