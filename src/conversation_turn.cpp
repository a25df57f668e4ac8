#include "conversation_turn.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace convmem {

bool TurnMetadata::has_table(const std::string& table) const {
    return std::find(tables.begin(), tables.end(), table) != tables.end();
}

void TurnMetadata::add_table(const std::string& table) {
    if (!has_table(table)) tables.push_back(table);
}

bool MetadataFilter::matches(const TurnMetadata& metadata) const {
    if (empty()) return true;
    for (auto& t : metadata.tables) {
        if (tables->count(t)) return true;
    }
    return false;
}

static std::string filter_value_text(const nlohmann::json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_null()) return "null";
    return v.dump();
}

std::string format_turn_for_embedding(const ConversationTurn& turn) {
    std::string out = "Question: " + turn.question;

    const auto& md = turn.metadata;
    if (!md.tables.empty()) {
        out += " | Tables: ";
        for (size_t i = 0; i < md.tables.size(); i++) {
            if (i > 0) out += ", ";
            out += md.tables[i];
        }
    }

    if (!md.filters.empty()) {
        out += " | Filters: ";
        for (size_t i = 0; i < md.filters.size(); i++) {
            auto& f = md.filters[i];
            if (i > 0) out += ", ";
            out += f.column + " " + f.op + " " + filter_value_text(f.value);
        }
    }

    if (md.key_metric && !md.key_metric->empty()) {
        out += " | Result: " + *md.key_metric;
    } else if (md.row_count) {
        out += " | Result: " + std::to_string(*md.row_count) + " rows returned";
    }
    return out;
}

nlohmann::json ConversationTurn::to_json(bool include_embedding) const {
    nlohmann::json j;
    j["id"] = id;
    j["question"] = question;
    j["timestamp"] = timestamp;

    auto& md = j["metadata"];
    md["tables"] = metadata.tables;
    if (!metadata.filters.empty()) {
        auto& arr = md["filters"];
        for (auto& f : metadata.filters) {
            arr.push_back({{"column", f.column}, {"operator", f.op}, {"value", f.value}});
        }
    }
    if (metadata.key_metric) md["keyMetric"] = *metadata.key_metric;
    if (metadata.row_count) md["rowCount"] = *metadata.row_count;

    if (generated_query) j["generatedQuery"] = *generated_query;
    if (include_embedding && !embedding.empty()) j["embedding"] = embedding;
    return j;
}

static std::string require_string(const nlohmann::json& j, const char* key, bool required) {
    if (!j.contains(key) || j[key].is_null()) {
        if (required) throw std::invalid_argument(std::string("missing field: ") + key);
        return "";
    }
    if (!j[key].is_string()) {
        throw std::invalid_argument(std::string("field must be a string: ") + key);
    }
    return j[key].get<std::string>();
}

ConversationTurn ConversationTurn::from_json(const nlohmann::json& j) {
    if (!j.is_object()) throw std::invalid_argument("turn must be a JSON object");

    ConversationTurn t;
    t.id = require_string(j, "id", false);
    t.question = require_string(j, "question", true);
    t.timestamp = require_string(j, "timestamp", false);

    if (j.contains("metadata") && !j["metadata"].is_null()) {
        auto& md = j["metadata"];
        if (!md.is_object()) throw std::invalid_argument("metadata must be an object");

        if (md.contains("tables")) {
            if (!md["tables"].is_array()) throw std::invalid_argument("metadata.tables must be an array");
            for (auto& item : md["tables"]) {
                if (!item.is_string()) throw std::invalid_argument("metadata.tables entries must be strings");
                t.metadata.add_table(item.get<std::string>());
            }
        }

        if (md.contains("filters") && !md["filters"].is_null()) {
            if (!md["filters"].is_array()) throw std::invalid_argument("metadata.filters must be an array");
            for (auto& item : md["filters"]) {
                if (!item.is_object()) throw std::invalid_argument("metadata.filters entries must be objects");
                TurnFilter f;
                f.column = require_string(item, "column", true);
                f.op = require_string(item, "operator", true);
                f.value = item.contains("value") ? item["value"] : nlohmann::json();
                t.metadata.filters.push_back(std::move(f));
            }
        }

        if (md.contains("keyMetric") && !md["keyMetric"].is_null()) {
            t.metadata.key_metric = require_string(md, "keyMetric", true);
        }
        if (md.contains("rowCount") && !md["rowCount"].is_null()) {
            if (!md["rowCount"].is_number()) throw std::invalid_argument("metadata.rowCount must be a number");
            t.metadata.row_count = md["rowCount"].get<int64_t>();
        }
    }

    if (j.contains("generatedQuery") && !j["generatedQuery"].is_null()) {
        t.generated_query = require_string(j, "generatedQuery", true);
    } else if (j.contains("sql") && !j["sql"].is_null()) {
        t.generated_query = require_string(j, "sql", true);
    }

    if (j.contains("embedding") && !j["embedding"].is_null()) {
        auto& emb = j["embedding"];
        if (!emb.is_array()) throw std::invalid_argument("embedding must be an array");
        t.embedding.reserve(emb.size());
        for (auto& v : emb) {
            if (!v.is_number()) throw std::invalid_argument("embedding entries must be numbers");
            double d = v.get<double>();
            if (!std::isfinite(d) || std::fabs(d) > std::numeric_limits<float>::max()) {
                throw std::invalid_argument("embedding entries must be finite floats");
            }
            t.embedding.push_back(static_cast<float>(d));
        }
    }
    return t;
}

} // namespace convmem
