#pragma once

#include "common/logger.hpp"
#include "graph/context_graph.hpp"
#include "traversal/graph_traversal.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace ctxgraph {

/// Relationship type → base importance in [0, 1].
class RelationshipImportanceTable {
public:
    /// parent 1.0, depends-on 0.9, executes 0.8, references 0.7, child 0.6.
    RelationshipImportanceTable();
    RelationshipImportanceTable(std::unordered_map<std::string, double> weights,
                                double fallback = 0.5);

    double lookup(const std::string& relationship_type) const;
    void set(const std::string& relationship_type, double weight);

    const std::unordered_map<std::string, double>& weights() const { return weights_; }
    double fallback() const { return fallback_; }

private:
    std::unordered_map<std::string, double> weights_;
    double fallback_ = 0.5;
};

struct AnalyzerConfig {
    RelationshipImportanceTable relationship_importance;
    DependencyOptions dependency_options;
    ImpactOptions impact_options;
};

/// A node's position in the graph reduced to two scalars, plus the
/// raw traversal output they were computed from.
struct GraphAnalysis {
    size_t relationship_count = 0;
    size_t dependency_count = 0;
    size_t impacted_count = 0;
    double importance = 0.5;
    double centrality_score = 0.5;

    std::vector<Neighbor> neighbors;
    std::vector<Dependency> dependencies;
    std::vector<ImpactedContext> impacted;
};

// ─── GraphAnalyzer ─────────────────────────────────────────────
// centrality = 0.4·min(rel/10, 1) + 0.4·min(impacted/5, 1)
//            + 0.2·max(1 − deps/10, 0.1)
// importance = clamp(0.5 + min(0.1·impacted, 0.3)
//                    + Σ 0.05·relImportance(neighbor.type)
//                    − min(0.02·deps, 0.1), 0.1, 1.0)

class GraphAnalyzer {
public:
    explicit GraphAnalyzer(ContextGraph& graph,
                           AnalyzerConfig config = {},
                           LoggerPtr logger = nullptr);

    /// Throws NodeNotFound when `context_id` is not in the graph.
    GraphAnalysis analyze(const std::string& context_id);

    static double centrality(size_t relationship_count, size_t dependency_count,
                             size_t impacted_count);

    double importance(const std::vector<Neighbor>& neighbors, size_t dependency_count,
                      size_t impacted_count) const;

    const AnalyzerConfig& config() const { return config_; }

private:
    ContextGraph& graph_;
    GraphTraversal traversal_;
    AnalyzerConfig config_;
    LoggerPtr logger_;
};

} // namespace ctxgraph
