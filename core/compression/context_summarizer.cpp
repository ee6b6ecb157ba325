#include "compression/context_summarizer.hpp"
#include "common/error.hpp"
#include "common/payload.hpp"
#include "compression/text_truncation.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <utility>
#include <variant>

namespace ctxgraph {

const char* toString(CompressionStrategy strategy) {
    switch (strategy) {
        case CompressionStrategy::Ratio:          return "ratio";
        case CompressionStrategy::TextTruncation: return "text-truncation";
        case CompressionStrategy::Smart:          return "smart";
        case CompressionStrategy::GraphAware:     return "graph-aware";
        case CompressionStrategy::Emergency:      return "emergency";
    }
    return "ratio";
}

namespace {

/// ceil(n · ratio), tolerant of the rounding noise in n · ratio.
size_t ceilCount(size_t n, double ratio) {
    double exact = static_cast<double>(n) * ratio;
    double rounded = std::ceil(exact - 1e-9);
    return rounded <= 0.0 ? 0 : static_cast<size_t>(rounded);
}

Json::Value lastItems(const Json::Value& array, size_t keep) {
    Json::Value out(Json::arrayValue);
    Json::ArrayIndex n = array.size();
    Json::ArrayIndex first = keep >= n ? 0 : n - static_cast<Json::ArrayIndex>(keep);
    for (Json::ArrayIndex i = first; i < n; ++i) out.append(array[i]);
    return out;
}

Json::Value toJsonSize(size_t n) { return Json::Value(static_cast<Json::UInt64>(n)); }

// ─── Ratio visitor ─────────────────────────────────────────────
// Per-level field lists for ratio-based summarization.

class RatioVisitor {
public:
    RatioVisitor(const ContextSummarizer& summarizer, double ratio)
        : summarizer_(summarizer), ratio_(ratio) {}

    Json::Value operator()(const AgentPayload& p) const {
        Json::Value out(Json::objectValue);
        out["agentId"] = p.agent_id;
        out["agentType"] = p.agent_type;
        if (!p.state.isNull()) out["state"] = summarizer_.preserveImportantKeys(p.state, ratio_);
        if (p.capabilities) out["capabilities"] = fromStringList(*p.capabilities);

        if (p.history.isArray()) {
            Json::Value history = keepHistory(p.history);
            Json::Value summary(Json::objectValue);
            summary["totalEntries"] = p.history.size();
            summary["preserved"] = history.size();
            summary["summarized"] = true;
            out["history"] = std::move(history);
            out["historySummary"] = std::move(summary);
        }
        return out;
    }

    Json::Value operator()(const TaskPayload& p) const {
        Json::Value out(Json::objectValue);
        out["taskId"] = p.task_id;
        out["taskType"] = p.task_type;
        out["status"] = toString(p.status);
        if (p.progress) out["progress"] = *p.progress;

        if (p.status == TaskStatus::Completed || p.status == TaskStatus::Failed) {
            if (!p.output.isNull()) out["output"] = p.output;
            if (p.error) out["error"] = *p.error;
        }
        if (!p.input.isNull()) out["input"] = summarizer_.preserveImportantKeys(p.input, ratio_);
        return out;
    }

    Json::Value operator()(const ProjectPayload& p) const {
        Json::Value out(Json::objectValue);
        out["projectName"] = p.project_name;
        out["projectPath"] = p.project_path;
        out["activeAgents"] = fromStringList(p.active_agents);
        if (!p.config.isNull()) out["config"] = summarizer_.preserveImportantKeys(p.config, ratio_);
        if (!p.shared_state.isNull()) {
            out["sharedState"] = summarizer_.preserveImportantKeys(p.shared_state, ratio_);
        }
        return out;
    }

    Json::Value operator()(const GlobalPayload& p) const { return p.data; }

    Json::Value operator()(const GenericPayload& p) const {
        if (p.data.isArray()) return lastItems(p.data, ceilCount(p.data.size(), ratio_));
        return summarizer_.preserveImportantKeys(p.data, ratio_);
    }

private:
    /// First two entries plus the most recent (keep − 2).
    Json::Value keepHistory(const Json::Value& history) const {
        size_t n = history.size();
        size_t keep = ceilCount(n, ratio_);
        if (keep >= n) return history;

        Json::Value out(Json::arrayValue);
        size_t head = std::min<size_t>(2, n);
        size_t tail = keep > 2 ? keep - 2 : 0;
        for (size_t i = 0; i < head; ++i) out.append(history[static_cast<Json::ArrayIndex>(i)]);
        for (size_t i = n - tail; i < n; ++i) {
            if (i >= head) out.append(history[static_cast<Json::ArrayIndex>(i)]);
        }
        return out;
    }

    const ContextSummarizer& summarizer_;
    double ratio_;
};

} // namespace

ContextSummarizer::ContextSummarizer(SummarizerConfig config, LoggerPtr logger)
    : config_(std::move(config)),
      logger_(loggerOrNull(std::move(logger), "ctxgraph.summarizer")) {
    config_.policy.validate();
    if (config_.token_limit_fraction <= 0.0 || config_.token_limit_fraction > 1.0) {
        throw ValidationError("token_limit_fraction must be in (0, 1]");
    }
    if (config_.batch_chunk_size == 0) {
        throw ValidationError("batch_chunk_size must be positive");
    }
}

void ContextSummarizer::setGraphAnalyzer(GraphAnalyzer* analyzer) {
    analyzer_ = analyzer;
    logger_->info(analyzer ? "Graph analyzer attached" : "Graph analyzer detached");
}

TimePoint ContextSummarizer::now() const {
    return config_.clock ? config_.clock() : systemNow();
}

// ─── Ratio-based ───────────────────────────────────────────────

CompressionResult ContextSummarizer::summarize(const ContextRecord& record,
                                               std::optional<CompressionLevel> level) const {
    CompressionLevel effective = level.value_or(config_.policy.default_level);
    const LevelSettings& settings = config_.policy.settings(effective);

    // Validate before the age gate so malformed input is reported
    // regardless of age.
    TypedPayload payload = parsePayload(record.level, record.data);

    auto age = std::chrono::duration_cast<std::chrono::milliseconds>(now() - record.created_at);
    if (age < config_.policy.age_threshold) {
        logger_->debug("Context {} is {} ms old, below age threshold; left intact",
                       record.id, age.count());
        return unchanged(record, CompressionStrategy::Ratio);
    }
    if (std::holds_alternative<GlobalPayload>(payload)) {
        logger_->debug("Global context {} is never compressed", record.id);
        return unchanged(record, CompressionStrategy::Ratio);
    }

    Json::Value data = std::visit(RatioVisitor(*this, settings.preserve_ratio), payload);
    data = restorePreservedKeys(record.data, std::move(data));

    CompressionStats stats;
    stats.strategy = CompressionStrategy::Ratio;
    CompressionResult result = finish(record, std::move(data), stats);
    if (!result.stats.compressed) return result;

    Json::Value& meta = result.record.metadata;
    meta["summarized"] = true;
    meta["summarizedAt"] = static_cast<Json::Int64>(toEpochMillis(now()));
    meta["compressionLevel"] = toString(effective);
    meta["preserveRatio"] = settings.preserve_ratio;

    logger_->info("Summarized {} at level {}: {} -> {} bytes",
                  record.id, toString(effective),
                  result.stats.original_size, result.stats.compressed_size);
    return result;
}

Json::Value ContextSummarizer::restorePreservedKeys(const Json::Value& original,
                                                    Json::Value summarized) const {
    if (!original.isObject() || !summarized.isObject()) return summarized;
    for (const auto& key : config_.policy.preserve_keys) {
        if (original.isMember(key) && !summarized.isMember(key)) {
            summarized[key] = original[key];
        }
    }
    return summarized;
}

Json::Value ContextSummarizer::preserveImportantKeys(const Json::Value& obj,
                                                     double preserve_ratio) const {
    if (!obj.isObject()) return obj;

    const std::vector<std::string> keys = obj.getMemberNames();
    Json::Value out(Json::objectValue);

    std::vector<std::pair<size_t, std::string>> remaining;
    for (const auto& key : keys) {
        if (config_.policy.isPreserved(key)) {
            out[key] = obj[key];
        } else {
            remaining.emplace_back(serializedSize(obj[key]), key);
        }
    }

    // Smaller values first.
    std::stable_sort(remaining.begin(), remaining.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    size_t keep = std::min(ceilCount(remaining.size(), preserve_ratio), remaining.size());
    for (size_t i = 0; i < keep; ++i) {
        out[remaining[i].second] = obj[remaining[i].second];
    }

    if (keys.size() > out.size()) {
        Json::Value summary(Json::objectValue);
        summary["originalKeys"] = toJsonSize(keys.size());
        summary["preservedKeys"] = toJsonSize(out.size());
        summary["droppedKeys"] = toJsonSize(keys.size() - out.size());
        out["_summary"] = std::move(summary);
    }
    return out;
}

// ─── Text truncation ───────────────────────────────────────────

CompressionResult ContextSummarizer::truncateText(const ContextRecord& record,
                                                  std::optional<size_t> max_length) const {
    size_t limit = max_length.value_or(config_.policy.max_summary_length);

    CompressionStats stats;
    stats.strategy = CompressionStrategy::TextTruncation;
    CompressionResult result = finish(record, truncateLongStrings(record.data, limit), stats);
    if (!result.stats.compressed) return result;

    result.record.metadata["truncated"] = true;
    result.record.metadata["maxLength"] = toJsonSize(limit);
    logger_->debug("Truncated strings in {} to {} chars", record.id, limit);
    return result;
}

std::string ContextSummarizer::extractKeyPoints(const std::string& text,
                                                std::optional<size_t> max_length) const {
    return ctxgraph::extractKeyPoints(text, max_length.value_or(config_.policy.max_summary_length));
}

// ─── Smart ─────────────────────────────────────────────────────

CompressionResult ContextSummarizer::smartSummarize(const ContextRecord& record,
                                                    std::optional<size_t> target_tokens) const {
    size_t target = target_tokens.value_or(config_.default_target_tokens);
    size_t current = estimateTokens(record);

    if (current <= target) {
        CompressionResult result = unchanged(record, CompressionStrategy::Smart);
        result.stats.target_tokens = target;
        result.stats.original_tokens = current;
        result.stats.final_tokens = current;
        return result;
    }

    RankingContext ctx;
    ctx.compression_ratio = static_cast<double>(target) / static_cast<double>(current);
    ctx.weights = &config_.smart_weights;

    CompressionStats stats;
    stats.strategy = CompressionStrategy::Smart;
    stats.target_tokens = target;
    stats.original_tokens = current;
    CompressionResult result = finish(record, compressRanked(record.data, ctx), stats);
    if (!result.stats.compressed) return result;

    Json::Value& meta = result.record.metadata;
    meta["smartSummarized"] = true;
    meta["smartSummarizedAt"] = static_cast<Json::Int64>(toEpochMillis(now()));
    meta["targetTokens"] = toJsonSize(target);
    meta["originalTokens"] = toJsonSize(current);
    result.stats.final_tokens = estimateTokens(result.record);
    meta["finalTokens"] = toJsonSize(result.stats.final_tokens);

    logger_->info("Smart summarization of {}: {} -> {} tokens (target {})",
                  record.id, current, result.stats.final_tokens, target);
    return result;
}

double ContextSummarizer::rankWeight(const std::string& key, const RankingContext& ctx) const {
    double weight = ctx.weights->lookup(key);
    if (ctx.analysis && ctx.analysis->relationship_count > 0) {
        for (const auto& fragment : config_.relationship_keys) {
            if (containsIgnoreCase(key, fragment)) return std::min(weight * 1.3, 1.0);
        }
    }
    return weight;
}

Json::Value ContextSummarizer::compressRanked(const Json::Value& value,
                                              const RankingContext& ctx) const {
    double centrality = ctx.analysis ? ctx.analysis->centrality_score : 0.0;

    if (value.isArray()) {
        if (value.empty()) return value;
        double ratio = ctx.analysis
            ? std::min(ctx.compression_ratio * (1.0 + centrality * 0.3), 1.0)
            : ctx.compression_ratio;
        return lastItems(value, std::max<size_t>(1, ceilCount(value.size(), ratio)));
    }
    if (!value.isObject() || value.empty()) return value;

    double ratio = ctx.analysis
        ? std::min(ctx.compression_ratio * (1.0 + centrality * 0.2), 1.0)
        : ctx.compression_ratio;

    std::vector<std::pair<std::string, double>> ranked;
    for (const auto& key : value.getMemberNames()) {
        ranked.emplace_back(key, rankWeight(key, ctx));
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    size_t keep = std::max<size_t>(1, ceilCount(ranked.size(), ratio));
    Json::Value out(Json::objectValue);
    Json::Value dropped(Json::arrayValue);

    for (size_t i = 0; i < ranked.size(); ++i) {
        const std::string& key = ranked[i].first;
        if (i >= keep && !config_.policy.isPreserved(key)) {
            dropped.append(key);
            continue;
        }
        const Json::Value& child = value[key];
        if (child.isObject() || child.isArray()) {
            out[key] = compressRanked(child, ctx);
        } else if (child.isString() && child.asString().size() > config_.policy.long_string_threshold) {
            const std::string text = child.asString();
            out[key] = ctxgraph::extractKeyPoints(text, ceilCount(text.size(), ratio));
        } else {
            out[key] = child;
        }
    }

    if (!dropped.empty()) {
        Json::Value summary(Json::objectValue);
        summary["originalKeys"] = toJsonSize(ranked.size());
        summary["preservedKeys"] = toJsonSize(ranked.size() - dropped.size());
        summary["droppedKeys"] = dropped.size();
        summary["droppedKeyNames"] = dropped;
        if (ctx.analysis) {
            summary["graphAware"] = true;
            summary["centralityScore"] = ctx.analysis->centrality_score;
            summary["relationshipCount"] = toJsonSize(ctx.analysis->relationship_count);
        }
        out["_compressionSummary"] = std::move(summary);
    }
    return out;
}

// ─── Graph-aware ───────────────────────────────────────────────

ImportanceWeightTable ContextSummarizer::enhancedWeights(const GraphAnalysis& analysis) const {
    const ImportanceWeightTable& base = config_.graph_base_weights;
    ImportanceWeightTable table({}, base.fallback());

    double factor = analysis.importance;
    double bonus = analysis.centrality_score * 0.2;
    for (const auto& [key, weight] : base.entries()) {
        bool is_protected = std::find(config_.protected_keys.begin(), config_.protected_keys.end(),
                                      key) != config_.protected_keys.end();
        table.set(key, is_protected ? weight : std::min(weight * (1.0 + factor + bonus), 1.0));
    }

    if (analysis.relationship_count > 0) {
        table.set("parentId", 0.9);
        table.set("children", 0.8);
        table.set("dependencies", 0.8);
        table.set("references", 0.7);
    }
    return table;
}

CompressionResult ContextSummarizer::graphAwareSummarize(const ContextRecord& record,
                                                         std::optional<size_t> target_tokens) const {
    size_t target = target_tokens.value_or(config_.default_target_tokens);

    if (!analyzer_ || !config_.use_graph_analysis) {
        logger_->debug("No graph analysis for {}; using smart summarization", record.id);
        return smartSummarize(record, target);
    }

    size_t current = estimateTokens(record);
    if (current <= target && !config_.force_graph_analysis) {
        CompressionResult result = unchanged(record, CompressionStrategy::GraphAware);
        result.stats.target_tokens = target;
        result.stats.original_tokens = current;
        result.stats.final_tokens = current;
        return result;
    }

    GraphAnalysis analysis;
    try {
        analysis = analyzer_->analyze(record.id);
    } catch (const std::exception& e) {
        logger_->error("Graph-aware summarization failed for {}, falling back to smart: {}",
                       record.id, e.what());
        return smartSummarize(record, target);
    }

    ImportanceWeightTable weights = enhancedWeights(analysis);
    RankingContext ctx;
    ctx.compression_ratio =
        std::min(static_cast<double>(target) / static_cast<double>(current), 1.0);
    ctx.weights = &weights;
    ctx.analysis = &analysis;

    CompressionStats stats;
    stats.strategy = CompressionStrategy::GraphAware;
    stats.target_tokens = target;
    stats.original_tokens = current;
    stats.centrality_score = analysis.centrality_score;
    stats.importance = analysis.importance;
    stats.relationship_count = analysis.relationship_count;
    CompressionResult result = finish(record, compressRanked(record.data, ctx), stats);
    if (!result.stats.compressed) return result;

    Json::Value& meta = result.record.metadata;
    meta["graphAwareSummarized"] = true;
    meta["graphAwareSummarizedAt"] = static_cast<Json::Int64>(toEpochMillis(now()));
    meta["targetTokens"] = toJsonSize(target);
    meta["originalTokens"] = toJsonSize(current);
    Json::Value graph(Json::objectValue);
    graph["relationshipCount"] = toJsonSize(analysis.relationship_count);
    graph["importance"] = analysis.importance;
    graph["centralityScore"] = analysis.centrality_score;
    meta["graphAnalysis"] = std::move(graph);
    result.stats.final_tokens = estimateTokens(result.record);
    meta["finalTokens"] = toJsonSize(result.stats.final_tokens);

    logger_->info("Graph-aware summarization of {}: {} -> {} tokens "
                  "(target {}, relationships={}, centrality={:.3f})",
                  record.id, current, result.stats.final_tokens, target,
                  analysis.relationship_count, analysis.centrality_score);
    return result;
}

std::vector<CompressionResult> ContextSummarizer::batchGraphAwareSummarize(
    const std::vector<ContextRecord>& records,
    std::optional<size_t> target_tokens_per_record) const {
    size_t target = target_tokens_per_record.value_or(config_.batch_target_tokens);
    std::vector<CompressionResult> results;
    results.reserve(records.size());

    logger_->info("Batch summarization of {} contexts (target {} tokens each)",
                  records.size(), target);
    try {
        for (size_t begin = 0; begin < records.size(); begin += config_.batch_chunk_size) {
            size_t end = std::min(records.size(), begin + config_.batch_chunk_size);

            std::vector<std::future<CompressionResult>> pending;
            pending.reserve(end - begin);
            for (size_t i = begin; i < end; ++i) {
                pending.push_back(std::async(std::launch::async, [this, &records, i, target] {
                    return graphAwareSummarize(records[i], target);
                }));
            }
            for (auto& f : pending) results.push_back(f.get());
        }
    } catch (const std::exception& e) {
        logger_->error("Batch summarization failed after {} of {} contexts: {}",
                       results.size(), records.size(), e.what());
        throw;
    }
    return results;
}

// ─── Emergency ─────────────────────────────────────────────────

Json::Value ContextSummarizer::emergencyData(const ContextRecord& record) const {
    const Json::Value src =
        record.data.isObject() ? record.data : Json::Value(Json::objectValue);

    auto stringOr = [&src](const char* key, const std::string& fallback) {
        const Json::Value& v = src[key];
        return v.isString() && !v.asString().empty() ? v.asString() : fallback;
    };

    Json::Value out(Json::objectValue);
    switch (record.level) {
        case ContextLevel::Agent: {
            out["agentId"] = stringOr("agentId", record.id);
            out["agentType"] = stringOr("agentType", "unknown");

            const Json::Value& state = src["state"];
            auto pick = [&](const char* key) -> Json::Value {
                if (state.isObject() && !state[key].isNull()) return state[key];
                return src[key];
            };
            Json::Value essential(Json::objectValue);
            Json::Value status = pick("status");
            essential["status"] = status.isNull() ? Json::Value("unknown") : status;
            Json::Value error = pick("error");
            if (!error.isNull()) essential["error"] = error;
            Json::Value progress = pick("progress");
            if (!progress.isNull()) essential["progress"] = progress;
            essential["summary"] = "Emergency summarized - essential state only";
            out["state"] = std::move(essential);

            const Json::Value& output = src["output"];
            if (!output.isNull()) {
                Json::Value result(Json::objectValue);
                if (output.isObject()) {
                    result["result"] = output["result"].isNull()
                        ? Json::Value("Emergency summarized output") : output["result"];
                } else {
                    std::string text = output.isString() ? output.asString() : toCompactString(output);
                    result["result"] = utf8Prefix(text, 200);
                }
                out["output"] = std::move(result);
            }

            Json::Value entry(Json::objectValue);
            entry["timestamp"] = toIsoString(now());
            entry["action"] = "emergency_summarization";
            entry["details"] = "Context emergency summarized due to size limits";
            out["history"].append(entry);
            out["capabilities"] =
                src["capabilities"].isArray() ? src["capabilities"] : Json::Value(Json::arrayValue);
            break;
        }
        case ContextLevel::Task: {
            out["taskId"] = stringOr("taskId", record.id);
            out["taskType"] = stringOr("taskType", "unknown");
            Json::Value input(Json::objectValue);
            if (!src["input"].isNull()) input["summary"] = "Emergency summarized input";
            out["input"] = std::move(input);
            if (!src["output"].isNull()) {
                out["output"] = ctxgraph::extractKeyPoints(toCompactString(src["output"]), 200);
            }
            out["status"] = stringOr("status", "unknown");
            out["progress"] = src["progress"].isNumeric() ? src["progress"] : Json::Value(0);
            if (!src["error"].isNull()) out["error"] = src["error"];
            break;
        }
        case ContextLevel::Project: {
            out["projectName"] = stringOr("projectName", "Unnamed Project");
            out["projectPath"] = stringOr("projectPath", ".");
            out["config"]["emergency"] = true;
            out["activeAgents"] =
                src["activeAgents"].isArray() ? src["activeAgents"] : Json::Value(Json::arrayValue);
            out["sharedState"]["emergency"] = "summarized";
            break;
        }
        case ContextLevel::Global:
        case ContextLevel::Generic: {
            out["summary"] = "Emergency summarized context";
            out["originalLevel"] = toString(record.level);
            if (!src["error"].isNull()) {
                out["criticalData"] = src["error"];
            } else if (!src["output"].isNull()) {
                out["criticalData"] = src["output"];
            } else {
                out["criticalData"] = Json::Value();
            }
            break;
        }
    }
    return out;
}

CompressionResult ContextSummarizer::emergencySummarize(const ContextRecord& record) const {
    logger_->warn("Emergency summarization triggered for {} ({} bytes)",
                  record.id, serializedSize(record.data));

    CompressionStats stats;
    stats.strategy = CompressionStrategy::Emergency;
    CompressionResult result = finish(record, emergencyData(record), stats);
    if (!result.stats.compressed) return result;

    Json::Value& meta = result.record.metadata;
    meta["emergencySummarized"] = true;
    meta["emergencySummarizedAt"] = static_cast<Json::Int64>(toEpochMillis(now()));
    meta["emergencyNote"] = "This context was emergency-summarized to prevent token overflow";

    logger_->info("Emergency summarization of {}: {} -> {} bytes",
                  record.id, result.stats.original_size, result.stats.compressed_size);
    return result;
}

// ─── Budget helpers ────────────────────────────────────────────

size_t ContextSummarizer::estimateTokens(size_t byte_size) {
    return (byte_size + 3) / 4;
}

size_t ContextSummarizer::estimateTokens(const ContextRecord& record) {
    return estimateTokens(serializedSize(record.toJson()));
}

CompressionLevel ContextSummarizer::calculateCompressionLevel(size_t current_size, size_t max_size) {
    if (max_size == 0) return CompressionLevel::High;
    double ratio = static_cast<double>(current_size) / static_cast<double>(max_size);
    if (ratio < 0.5) return CompressionLevel::Low;
    if (ratio < 0.8) return CompressionLevel::Medium;
    return CompressionLevel::High;
}

bool ContextSummarizer::needsTokenSummarization(const ContextRecord& record,
                                                std::optional<size_t> token_limit) const {
    double limit = static_cast<double>(token_limit.value_or(config_.token_limit));
    return static_cast<double>(estimateTokens(record)) > limit * config_.token_limit_fraction;
}

// ─── Result assembly ───────────────────────────────────────────

CompressionResult ContextSummarizer::unchanged(const ContextRecord& record,
                                               CompressionStrategy strategy) const {
    CompressionResult result{record, {}};
    result.stats.strategy = strategy;
    result.stats.compressed = false;
    result.stats.original_size = serializedSize(record.data);
    result.stats.compressed_size = result.stats.original_size;
    result.stats.compression_ratio = 1.0;
    return result;
}

CompressionResult ContextSummarizer::finish(const ContextRecord& record, Json::Value data,
                                            CompressionStats stats) const {
    stats.original_size = serializedSize(record.data);
    size_t size = serializedSize(data);
    if (size > stats.original_size) {
        logger_->debug("{} compression of {} would grow it ({} > {} bytes); keeping original",
                       toString(stats.strategy), record.id, size, stats.original_size);
        CompressionResult kept = unchanged(record, stats.strategy);
        kept.stats.target_tokens = stats.target_tokens;
        kept.stats.original_tokens = stats.original_tokens;
        kept.stats.final_tokens = stats.original_tokens;
        kept.stats.centrality_score = stats.centrality_score;
        kept.stats.importance = stats.importance;
        kept.stats.relationship_count = stats.relationship_count;
        return kept;
    }
    stats.compressed = true;
    stats.compressed_size = size;
    stats.compression_ratio = stats.original_size == 0
        ? 1.0
        : static_cast<double>(size) / static_cast<double>(stats.original_size);

    CompressionResult result{record, stats};
    result.record.data = std::move(data);

    Json::Value& meta = result.record.metadata;
    if (!meta.isObject()) meta = Json::Value(Json::objectValue);
    meta["strategy"] = toString(stats.strategy);
    meta["originalSize"] = toJsonSize(stats.original_size);
    meta["compressedSize"] = toJsonSize(stats.compressed_size);
    meta["compressionRatio"] = stats.compression_ratio;
    return result;
}

} // namespace ctxgraph
