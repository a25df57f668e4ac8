#pragma once
#include <string>
#include <vector>
#include <set>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace convmem {

struct TurnFilter {
    std::string column;
    std::string op;         // "=", ">", "LIKE", ...
    nlohmann::json value;   // any JSON scalar
};

struct TurnMetadata {
    std::vector<std::string> tables;   // unique, caller order
    std::vector<TurnFilter> filters;   // empty = none
    std::optional<std::string> key_metric;
    std::optional<int64_t> row_count;

    bool has_table(const std::string& table) const;
    void add_table(const std::string& table);
};

// One answered question. Immutable once stored.
struct ConversationTurn {
    std::string id;
    std::string question;
    std::string timestamp;  // ISO-8601
    TurnMetadata metadata;
    std::optional<std::string> generated_query;
    std::vector<float> embedding;  // empty until embedded

    bool has_embedding() const { return !embedding.empty(); }

    nlohmann::json to_json(bool include_embedding = true) const;

    // Throws std::invalid_argument when a member has the wrong JSON type or an
    // embedding value does not fit a finite float.
    static ConversationTurn from_json(const nlohmann::json& j);
};

// Predicate evaluated before scoring. An absent or empty table set matches everything.
struct MetadataFilter {
    std::optional<std::set<std::string>> tables;

    bool empty() const { return !tables || tables->empty(); }
    bool matches(const TurnMetadata& metadata) const;
};

/**
 * Canonical text embedded for a turn:
 *   Question: <q> | Tables: a, b | Filters: col op value, ... | Result: <metric or N rows returned>
 * Sections without data are left out.
 */
std::string format_turn_for_embedding(const ConversationTurn& turn);

} // namespace convmem
