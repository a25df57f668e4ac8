#include "context_retriever.hpp"
#include "utils.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace convmem {

static ContextTurn make_context_turn(const ConversationTurn& turn, Provenance provenance, size_t index) {
    ContextTurn ct;
    ct.question = turn.question;
    ct.generated_query = turn.generated_query;
    ct.tables = turn.metadata.tables;
    ct.provenance = provenance;
    ct.turn_number = index + 1;
    return ct;
}

nlohmann::json ContextTurn::to_json() const {
    nlohmann::json j;
    j["question"] = question;
    if (generated_query) j["sql"] = *generated_query;
    j["tables"] = tables;
    j["provenance"] = provenance == Provenance::recent ? "recent" : "retrieved";
    if (similarity) j["similarity"] = *similarity;
    j["turnNumber"] = turn_number;
    return j;
}

size_t HybridContext::count(Provenance p) const {
    size_t n = 0;
    for (auto& t : turns) {
        if (t.provenance == p) n++;
    }
    return n;
}

nlohmann::json HybridContext::to_json() const {
    nlohmann::json arr = nlohmann::json::array();
    for (auto& t : turns) arr.push_back(t.to_json());
    nlohmann::json j;
    j["context"] = arr;
    j["timings"] = {
        {"sliding_window_ms", timings.sliding_window_ms},
        {"semantic_search_ms", timings.semantic_search_ms}
    };
    return j;
}

HybridContext retrieve_context(const VectorStore& store,
                               const std::string& question,
                               const RetrievalOptions& opts) {
    HybridContext ctx;

    auto started = std::chrono::steady_clock::now();
    RecentWindow window = store.recent_window(opts.recent_window);
    ctx.timings.sliding_window_ms = elapsed_ms(started);

    for (size_t i = 0; i < window.turns.size(); i++) {
        ctx.turns.push_back(make_context_turn(window.turns[i], Provenance::recent, window.first_index + i));
    }

    if (window.total <= opts.recent_window) {
        std::cerr << "[retriever] " << store.conversation_id() << ": " << window.turns.size()
                  << " recent turn(s), not enough history for semantic search\n";
        return ctx;
    }

    started = std::chrono::steady_clock::now();
    auto results = store.search(question, opts.top_k, window.indices(), opts.filter, opts.embed);
    ctx.timings.semantic_search_ms = elapsed_ms(started);

    for (auto& r : results) {
        ContextTurn ct = make_context_turn(r.turn, Provenance::retrieved, r.index);
        ct.similarity = r.similarity;
        ctx.turns.push_back(std::move(ct));
    }

    std::cerr << "[retriever] " << store.conversation_id() << ": " << window.turns.size()
              << " recent, " << results.size() << " retrieved (" << ctx.timings.semantic_search_ms << "ms)\n";
    return ctx;
}

std::string format_context_for_prompt(const HybridContext& context) {
    if (context.empty()) return "";

    std::ostringstream out;
    out << "\n## Conversation History (Hybrid: Recent + Retrieved)\n\n";

    for (auto& t : context.turns) {
        if (t.provenance == Provenance::recent) {
            out << "[RECENT Turn " << t.turn_number << "]\n";
        } else {
            out << "[RETRIEVED Turn " << t.turn_number << ", similarity="
                << std::fixed << std::setprecision(2) << t.similarity.value_or(0.0f) << "]\n";
        }
        out << "Q: \"" << t.question << "\"\n";
        if (t.generated_query && !t.generated_query->empty()) {
            out << "SQL: " << *t.generated_query << "\n";
        }
        if (!t.tables.empty()) {
            out << "Tables: ";
            for (size_t i = 0; i < t.tables.size(); i++) {
                if (i > 0) out << ", ";
                out << t.tables[i];
            }
            out << "\n";
        }
        out << "\n";
    }

    out << "NOTE: If the current question uses \"those\", \"them\", \"these\", \"it\", "
           "look at the RECENT turns for context.\n";
    return out.str();
}

} // namespace convmem
