#include "analysis/graph_analyzer.hpp"
#include "common/error.hpp"

#include <algorithm>

namespace ctxgraph {

// ─── RelationshipImportanceTable ───────────────────────────────

RelationshipImportanceTable::RelationshipImportanceTable()
    : weights_{{"parent", 1.0},
               {"depends-on", 0.9},
               {"references", 0.7},
               {"executes", 0.8},
               {"child", 0.6}} {}

RelationshipImportanceTable::RelationshipImportanceTable(
    std::unordered_map<std::string, double> weights, double fallback)
    : weights_(std::move(weights)), fallback_(fallback) {
    for (const auto& [type, w] : weights_) {
        if (w < 0.0 || w > 1.0) {
            throw ValidationError("Relationship importance for '" + type + "' must be in [0, 1]");
        }
    }
}

double RelationshipImportanceTable::lookup(const std::string& relationship_type) const {
    auto it = weights_.find(relationship_type);
    return it != weights_.end() ? it->second : fallback_;
}

void RelationshipImportanceTable::set(const std::string& relationship_type, double weight) {
    if (weight < 0.0 || weight > 1.0) {
        throw ValidationError("Relationship importance for '" + relationship_type +
                              "' must be in [0, 1]");
    }
    weights_[relationship_type] = weight;
}

// ─── GraphAnalyzer ─────────────────────────────────────────────

GraphAnalyzer::GraphAnalyzer(ContextGraph& graph, AnalyzerConfig config, LoggerPtr logger)
    : graph_(graph),
      traversal_(graph),
      config_(std::move(config)),
      logger_(loggerOrNull(std::move(logger), "ctxgraph.analyzer")) {}

GraphAnalysis GraphAnalyzer::analyze(const std::string& context_id) {
    if (!graph_.hasNode(context_id)) {
        throw NodeNotFound(context_id);
    }

    GraphAnalysis analysis;
    analysis.neighbors = graph_.getNeighbors(context_id);
    analysis.dependencies = traversal_.findDependencies(context_id, config_.dependency_options);
    analysis.impacted = traversal_.findImpactedContexts(context_id, config_.impact_options);

    analysis.relationship_count = analysis.neighbors.size();
    analysis.dependency_count = analysis.dependencies.size();
    analysis.impacted_count = analysis.impacted.size();

    analysis.centrality_score = centrality(analysis.relationship_count,
                                           analysis.dependency_count,
                                           analysis.impacted_count);
    analysis.importance = importance(analysis.neighbors,
                                     analysis.dependency_count,
                                     analysis.impacted_count);

    logger_->debug("Analyzed {}: relationships={} dependencies={} impacted={} "
                   "centrality={:.3f} importance={:.3f}",
                   context_id, analysis.relationship_count, analysis.dependency_count,
                   analysis.impacted_count, analysis.centrality_score, analysis.importance);
    return analysis;
}

double GraphAnalyzer::centrality(size_t relationship_count, size_t dependency_count,
                                 size_t impacted_count) {
    double rel_score = std::min(static_cast<double>(relationship_count) / 10.0, 1.0);
    double dependent_score = std::min(static_cast<double>(impacted_count) / 5.0, 1.0);
    // Nodes with many dependencies of their own are more specific.
    double specificity = std::max(1.0 - static_cast<double>(dependency_count) / 10.0, 0.1);
    return rel_score * 0.4 + dependent_score * 0.4 + specificity * 0.2;
}

double GraphAnalyzer::importance(const std::vector<Neighbor>& neighbors, size_t dependency_count,
                                 size_t impacted_count) const {
    double score = 0.5;
    score += std::min(static_cast<double>(impacted_count) * 0.1, 0.3);
    for (const auto& neighbor : neighbors) {
        score += config_.relationship_importance.lookup(neighbor.relationship) * 0.05;
    }
    score -= std::min(static_cast<double>(dependency_count) * 0.02, 0.1);
    return std::clamp(score, 0.1, 1.0);
}

} // namespace ctxgraph
