#include "vector_store.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <cmath>
#include <iostream>
#include <sstream>

namespace convmem {

static std::string join_indices(const std::set<size_t>& indices) {
    std::ostringstream out;
    bool first = true;
    for (size_t i : indices) {
        if (!first) out << ", ";
        out << i;
        first = false;
    }
    return out.str();
}

VectorStore::VectorStore(std::string conversation_id,
                         std::shared_ptr<EmbeddingProvider> provider,
                         std::shared_ptr<const Ranker> ranker)
    : conversation_id_(std::move(conversation_id))
    , provider_(std::move(provider))
    , ranker_(ranker ? std::move(ranker) : std::make_shared<LinearRanker>()) {
    if (!provider_) throw std::invalid_argument("VectorStore requires an embedding provider");
}

size_t VectorStore::add(ConversationTurn turn, const EmbedOptions& opts) {
    std::lock_guard<std::mutex> ingest(ingest_mutex_);

    // Only add() and clear() mutate, and both hold ingest_mutex_, so the
    // snapshot taken here stays valid until the append below.
    size_t index;
    size_t dims;
    {
        std::shared_lock<std::shared_mutex> lock(turns_mutex_);
        index = turns_.size();
        dims = dimensions_;
        if (turn.id.empty()) {
            // Skip past generated ids a caller already used.
            size_t n = index + 1;
            do {
                turn.id = "turn_" + std::to_string(n++);
            } while (ids_.count(turn.id));
        } else if (ids_.count(turn.id)) {
            throw DuplicateTurn(turn.id);
        }
    }
    if (turn.timestamp.empty()) turn.timestamp = iso8601_now();

    if (!turn.has_embedding()) {
        turn.embedding = provider_->embed(format_turn_for_embedding(turn), opts);
    } else {
        for (float v : turn.embedding) {
            if (!std::isfinite(v)) throw std::invalid_argument("Supplied embedding has a non-finite value");
        }
        // A supplied vector must at least match the provider's space.
        size_t provider_dims = provider_->tag().dimensions;
        if (dims == 0 && provider_dims != 0 && turn.embedding.size() != provider_dims) {
            throw DimensionMismatch(provider_dims, turn.embedding.size());
        }
    }
    if (dims != 0 && turn.embedding.size() != dims) {
        throw DimensionMismatch(dims, turn.embedding.size());
    }

    std::string id = turn.id;
    size_t total;
    {
        std::unique_lock<std::shared_mutex> lock(turns_mutex_);
        if (dimensions_ == 0) dimensions_ = turn.embedding.size();
        ids_.insert(turn.id);
        turns_.push_back(std::move(turn));
        total = turns_.size();
    }

    std::cerr << "[vector_store] " << conversation_id_ << ": added turn " << id
              << " at index " << index << ", total: " << total << "\n";
    return index;
}

std::vector<SearchResult> VectorStore::search(const std::string& query_text,
                                              size_t k,
                                              const std::set<size_t>& exclude_indices,
                                              const MetadataFilter& metadata_filter,
                                              const EmbedOptions& opts) const {
    if (k == 0 || is_blank(query_text) || empty()) return {};

    std::vector<float> query = provider_->embed(query_text, opts);

    std::vector<SearchResult> results;
    {
        std::shared_lock<std::shared_mutex> lock(turns_mutex_);
        if (turns_.empty()) return {};
        if (query.size() != dimensions_) throw DimensionMismatch(dimensions_, query.size());

        std::vector<RankCandidate> candidates;
        candidates.reserve(turns_.size());
        for (size_t i = 0; i < turns_.size(); i++) {
            if (exclude_indices.count(i)) continue;
            if (!metadata_filter.matches(turns_[i].metadata)) continue;
            candidates.emplace_back(i, &turns_[i].embedding);
        }

        for (auto& ranked : ranker_->rank(query, candidates, k)) {
            results.push_back({turns_[ranked.slot], ranked.score, ranked.slot});
        }
    }

    std::cerr << "[vector_store] " << conversation_id_ << ": search";
    if (!exclude_indices.empty()) std::cerr << " (excluding [" << join_indices(exclude_indices) << "])";
    std::cerr << " -> " << results.size() << " result(s)\n";
    return results;
}

std::set<size_t> RecentWindow::indices() const {
    std::set<size_t> out;
    for (size_t i = 0; i < turns.size(); i++) out.insert(first_index + i);
    return out;
}

RecentWindow VectorStore::recent_window(size_t n) const {
    std::shared_lock<std::shared_mutex> lock(turns_mutex_);
    RecentWindow w;
    w.total = turns_.size();
    w.first_index = w.total > n ? w.total - n : 0;
    w.turns.assign(turns_.begin() + static_cast<std::ptrdiff_t>(w.first_index), turns_.end());
    return w;
}

std::vector<ConversationTurn> VectorStore::get_recent_turns(size_t n) const {
    return recent_window(n).turns;
}

std::set<size_t> VectorStore::recent_indices(size_t n) const {
    return recent_window(n).indices();
}

std::optional<ConversationTurn> VectorStore::get_turn(size_t index) const {
    std::shared_lock<std::shared_mutex> lock(turns_mutex_);
    if (index >= turns_.size()) return std::nullopt;
    return turns_[index];
}

size_t VectorStore::size() const {
    std::shared_lock<std::shared_mutex> lock(turns_mutex_);
    return turns_.size();
}

size_t VectorStore::dimensions() const {
    std::shared_lock<std::shared_mutex> lock(turns_mutex_);
    return dimensions_;
}

void VectorStore::clear() {
    std::lock_guard<std::mutex> ingest(ingest_mutex_);
    {
        std::unique_lock<std::shared_mutex> lock(turns_mutex_);
        turns_.clear();
        ids_.clear();
        dimensions_ = 0;
    }
    std::cerr << "[vector_store] " << conversation_id_ << ": cleared all turns\n";
}

} // namespace convmem
