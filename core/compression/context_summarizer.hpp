#pragma once

#include "analysis/graph_analyzer.hpp"
#include "common/logger.hpp"
#include "common/time.hpp"
#include "compression/compression_policy.hpp"
#include "compression/context_record.hpp"

#include <json/json.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace ctxgraph {

enum class CompressionStrategy { Ratio, TextTruncation, Smart, GraphAware, Emergency };

const char* toString(CompressionStrategy strategy);

struct CompressionStats {
    CompressionStrategy strategy = CompressionStrategy::Ratio;
    bool compressed = false;        // false: record returned untouched
    size_t original_size = 0;       // bytes of serialized data
    size_t compressed_size = 0;
    double compression_ratio = 1.0; // compressed / original

    // Smart and graph-aware only.
    size_t target_tokens = 0;
    size_t original_tokens = 0;
    size_t final_tokens = 0;

    // Graph-aware only.
    std::optional<double> centrality_score;
    std::optional<double> importance;
    std::optional<size_t> relationship_count;
};

struct CompressionResult {
    ContextRecord record;
    CompressionStats stats;
};

struct SummarizerConfig {
    CompressionPolicy policy;
    ImportanceWeightTable smart_weights = ImportanceWeightTable::smartDefaults();
    ImportanceWeightTable graph_base_weights = ImportanceWeightTable::graphBaseDefaults();

    /// Never boosted by graph position.
    std::vector<std::string> protected_keys{"error", "status", "id"};
    /// Field-name fragments boosted 1.3× when the node has relationships.
    std::vector<std::string> relationship_keys{"parent", "child", "dependency", "reference",
                                                 "relationship"};

    bool use_graph_analysis = true;
    /// Run graph-aware compression even when the record is within budget.
    bool force_graph_analysis = false;

    size_t batch_chunk_size = 3;
    size_t default_target_tokens = 20000;
    size_t batch_target_tokens = 5000;
    size_t token_limit = 25000;
    double token_limit_fraction = 0.8;

    ClockFn clock;
};

// ─── ContextSummarizer ─────────────────────────────────────────
// Budget-aware compression of context records. Every strategy is a
// pure function of the record, the policy and (for graph-aware) the
// analyzer's view of the node; none mutates the graph. A result is
// never larger than its input: when a strategy would grow the data,
// the record comes back untouched with `compressed` false.

class ContextSummarizer {
public:
    explicit ContextSummarizer(SummarizerConfig config = {}, LoggerPtr logger = nullptr);

    /// Non-owning. Pass nullptr to detach.
    void setGraphAnalyzer(GraphAnalyzer* analyzer);
    bool hasGraphAnalyzer() const { return analyzer_ != nullptr; }

    /// Ratio-based compression with per-level field lists. Records
    /// younger than the age threshold come back untouched. Throws
    /// ValidationError when `data` does not fit the record's level.
    CompressionResult summarize(const ContextRecord& record,
                                std::optional<CompressionLevel> level = std::nullopt) const;

    /// Head/tail truncation of every string longer than `max_length`
    /// (default: policy.max_summary_length).
    CompressionResult truncateText(const ContextRecord& record,
                                   std::optional<size_t> max_length = std::nullopt) const;

    /// Importance-ranked compression toward a token budget.
    CompressionResult smartSummarize(const ContextRecord& record,
                                     std::optional<size_t> target_tokens = std::nullopt) const;

    /// Smart compression with weights and retention boosted by the
    /// node's graph position. Falls back to smartSummarize when no
    /// analyzer is attached, graph analysis is disabled, or the
    /// analyzer throws.
    CompressionResult graphAwareSummarize(const ContextRecord& record,
                                          std::optional<size_t> target_tokens = std::nullopt) const;

    /// Fixed minimal field set per level. Ignores ratios.
    CompressionResult emergencySummarize(const ContextRecord& record) const;

    /// Graph-aware (or smart, without an analyzer) compression of many
    /// records, batch_chunk_size at a time in parallel. Results keep the
    /// input order.
    std::vector<CompressionResult> batchGraphAwareSummarize(
        const std::vector<ContextRecord>& records,
        std::optional<size_t> target_tokens_per_record = std::nullopt) const;

    // ── Helpers ──
    std::string extractKeyPoints(const std::string& text,
                                 std::optional<size_t> max_length = std::nullopt) const;

    /// Keep the policy's preserve keys, then the smallest remaining
    /// values up to ceil(remaining · ratio). Adds `_summary` when
    /// anything was dropped.
    Json::Value preserveImportantKeys(const Json::Value& obj, double preserve_ratio) const;

    bool needsTokenSummarization(const ContextRecord& record,
                                 std::optional<size_t> token_limit = std::nullopt) const;

    /// ceil(bytes / 4)
    static size_t estimateTokens(size_t byte_size);
    static size_t estimateTokens(const ContextRecord& record);

    /// < 0.5 low, < 0.8 medium, otherwise high.
    static CompressionLevel calculateCompressionLevel(size_t current_size, size_t max_size);

    const SummarizerConfig& config() const { return config_; }

private:
    struct RankingContext {
        double compression_ratio = 1.0;
        const ImportanceWeightTable* weights = nullptr;
        const GraphAnalysis* analysis = nullptr;   // null: plain smart ranking
    };

    Json::Value restorePreservedKeys(const Json::Value& original, Json::Value summarized) const;

    Json::Value compressRanked(const Json::Value& value, const RankingContext& ctx) const;
    double rankWeight(const std::string& key, const RankingContext& ctx) const;
    ImportanceWeightTable enhancedWeights(const GraphAnalysis& analysis) const;

    Json::Value emergencyData(const ContextRecord& record) const;

    TimePoint now() const;

    CompressionResult unchanged(const ContextRecord& record, CompressionStrategy strategy) const;
    CompressionResult finish(const ContextRecord& record, Json::Value data,
                             CompressionStats stats) const;

    SummarizerConfig config_;
    LoggerPtr logger_;
    GraphAnalyzer* analyzer_ = nullptr;

};

} // namespace ctxgraph
