#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace ctxgraph {

enum class CompressionLevel { Low, Medium, High };

const char* toString(CompressionLevel level);
/// Throws ValidationError for anything but low / medium / high.
CompressionLevel parseCompressionLevel(const std::string& name);

struct LevelSettings {
    double threshold = 0.5;
    double preserve_ratio = 0.5;   // (0, 1]
};

/// Age gate, per-level preserve ratios and the must-keep key set.
struct CompressionPolicy {
    std::map<CompressionLevel, LevelSettings> levels{
        {CompressionLevel::Low,    {0.3, 0.8}},
        {CompressionLevel::Medium, {0.5, 0.5}},
        {CompressionLevel::High,   {0.7, 0.2}},
    };
    CompressionLevel default_level = CompressionLevel::Medium;

    /// Records younger than this are returned untouched.
    std::chrono::milliseconds age_threshold{30 * 60 * 1000};

    std::vector<std::string> preserve_keys{"id", "status", "error", "output"};

    size_t max_summary_length = 1000;      // text truncation strategy
    size_t long_string_threshold = 1000;   // smart strategies shorten strings above this

    const LevelSettings& settings(CompressionLevel level) const;
    bool isPreserved(const std::string& key) const;

    /// Throws ValidationError if a preserve ratio is outside (0, 1].
    void validate() const;
};

// ─── ImportanceWeightTable ─────────────────────────────────────
// Field name → weight in [0, 1]. Lookup tries an exact match, then the
// first entry (in insertion order) whose name occurs in the field name
// ignoring case, then the fallback.

class ImportanceWeightTable {
public:
    ImportanceWeightTable() = default;
    ImportanceWeightTable(std::vector<std::pair<std::string, double>> entries,
                          double fallback = 0.5);

    double lookup(const std::string& key) const;
    void set(const std::string& key, double weight);
    bool contains(const std::string& key) const;

    const std::vector<std::pair<std::string, double>>& entries() const { return entries_; }
    double fallback() const { return fallback_; }

    /// Weights used by smart compression.
    static ImportanceWeightTable smartDefaults();
    /// Base weights that graph-aware compression boosts.
    static ImportanceWeightTable graphBaseDefaults();

private:
    std::vector<std::pair<std::string, double>> entries_;
    double fallback_ = 0.5;
};

} // namespace ctxgraph
