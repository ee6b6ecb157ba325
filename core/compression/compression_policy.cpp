#include "compression/compression_policy.hpp"
#include "common/error.hpp"
#include "common/payload.hpp"

#include <algorithm>

namespace ctxgraph {

const char* toString(CompressionLevel level) {
    switch (level) {
        case CompressionLevel::Low:    return "low";
        case CompressionLevel::Medium: return "medium";
        case CompressionLevel::High:   return "high";
    }
    return "medium";
}

CompressionLevel parseCompressionLevel(const std::string& name) {
    if (name == "low")    return CompressionLevel::Low;
    if (name == "medium") return CompressionLevel::Medium;
    if (name == "high")   return CompressionLevel::High;
    throw ValidationError("Unknown compression level: " + name);
}

// ─── CompressionPolicy ─────────────────────────────────────────

const LevelSettings& CompressionPolicy::settings(CompressionLevel level) const {
    auto it = levels.find(level);
    if (it == levels.end()) {
        throw ValidationError(std::string("No settings for compression level: ") + toString(level));
    }
    return it->second;
}

bool CompressionPolicy::isPreserved(const std::string& key) const {
    return std::find(preserve_keys.begin(), preserve_keys.end(), key) != preserve_keys.end();
}

void CompressionPolicy::validate() const {
    for (const auto& [level, s] : levels) {
        if (!(s.preserve_ratio > 0.0 && s.preserve_ratio <= 1.0)) {
            throw ValidationError(std::string("preserveRatio for level '") + toString(level) +
                                  "' must be in (0, 1]");
        }
    }
    settings(default_level);
}

// ─── ImportanceWeightTable ─────────────────────────────────────

ImportanceWeightTable::ImportanceWeightTable(std::vector<std::pair<std::string, double>> entries,
                                             double fallback)
    : fallback_(fallback) {
    for (auto& [key, weight] : entries) {
        set(key, weight);
    }
}

double ImportanceWeightTable::lookup(const std::string& key) const {
    for (const auto& [name, weight] : entries_) {
        if (name == key) return weight;
    }
    for (const auto& [name, weight] : entries_) {
        if (containsIgnoreCase(key, name)) return weight;
    }
    return fallback_;
}

void ImportanceWeightTable::set(const std::string& key, double weight) {
    if (weight < 0.0 || weight > 1.0) {
        throw ValidationError("Importance weight for '" + key + "' must be in [0, 1]");
    }
    for (auto& entry : entries_) {
        if (entry.first == key) {
            entry.second = weight;
            return;
        }
    }
    entries_.emplace_back(key, weight);
}

bool ImportanceWeightTable::contains(const std::string& key) const {
    for (const auto& entry : entries_) {
        if (entry.first == key) return true;
    }
    return false;
}

ImportanceWeightTable ImportanceWeightTable::smartDefaults() {
    return ImportanceWeightTable({
        {"error", 1.0},
        {"output", 0.9},
        {"status", 1.0},
        {"state", 0.95},
        {"id", 1.0},
        {"agentId", 1.0},
        {"agentType", 1.0},
        {"capabilities", 0.8},
        {"config", 0.7},
        {"history", 0.3},
        {"logs", 0.2},
        {"tempData", 0.1},
        {"massiveData", 0.1},
    });
}

ImportanceWeightTable ImportanceWeightTable::graphBaseDefaults() {
    return ImportanceWeightTable({
        {"error", 1.0},
        {"output", 0.9},
        {"status", 1.0},
        {"id", 1.0},
        {"capabilities", 0.8},
        {"config", 0.7},
        {"history", 0.3},
        {"logs", 0.2},
        {"tempData", 0.1},
    });
}

} // namespace ctxgraph
