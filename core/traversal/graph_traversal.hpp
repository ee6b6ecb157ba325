#pragma once

#include "graph/context_graph.hpp"

#include <json/json.h>

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ctxgraph {

// An empty relationship-type list means "every type" throughout.

// ─── Dependencies ──────────────────────────────────────────────

struct DependencyOptions {
    std::optional<size_t> max_depth;    // default: GraphConfig::max_traversal_depth
    std::vector<std::string> relationship_types{"depends-on", "requires"};
    bool transitive = true;
};

struct Dependency {
    std::string context_id;
    std::string relationship;
    size_t distance = 0;        // hops from the origin, starting at 1
    double weight = 1.0;        // weight of the edge that reached it
    std::vector<Edge> path;     // origin → context_id
    Json::Value metadata;
};

// ─── Impact ────────────────────────────────────────────────────

struct ImpactOptions {
    std::vector<std::string> relationship_types{"depends-on", "parent", "references"};
    size_t max_distance = 3;
    double impact_threshold = 0.1;
    std::optional<double> decay_factor;  // default: GraphConfig::impact_decay_factor
};

struct ImpactedContext {
    std::string context_id;
    double impact = 0.0;
    size_t distance = 0;
    std::string relationship;
    std::vector<Edge> path;     // edges walked backwards from the origin
};

// ─── Cycles / paths / queries ──────────────────────────────────

struct Cycle {
    std::vector<std::string> nodes;   // first node repeated at the end
    std::vector<Edge> edges;
    std::string type = "dependency-cycle";
};

struct ShortestPathOptions {
    bool weighted = true;     // cost 1/weight, else 1 per hop
    std::vector<std::string> relationship_types;
};

struct GraphPath {
    std::vector<Edge> edges;
    std::vector<std::string> nodes;
    double cost = 0.0;
};

struct QueryOptions {
    std::vector<std::string> start_nodes;   // empty: every node
    std::vector<std::string> relationship_types;
    size_t max_depth = 3;
    std::function<bool(const ContextNode&)> node_filter;
    std::function<bool(const Edge&)> edge_filter;
    size_t limit = 0;                       // 0: unlimited
};

struct QueryMatch {
    ContextNode node;
    std::vector<Edge> path;
    size_t depth = 0;
};

struct GraphStatistics {
    size_t node_count = 0;
    size_t edge_count = 0;
    std::vector<std::string> relationship_types;
    std::map<std::string, size_t> edges_by_type;
    double average_degree = 0.0;
    double density = 0.0;
    size_t components = 0;
};

GraphStatistics computeStatistics(const GraphIndex& index);
Json::Value statisticsToJson(const GraphStatistics& stats);

// ─── GraphTraversal ────────────────────────────────────────────
// Read-only algorithms over a ContextGraph. Each call holds the
// graph's shared lock for its whole run. Bounds (max_depth, limit,
// max_distance) truncate results silently.

class GraphTraversal {
public:
    explicit GraphTraversal(ContextGraph& graph) : graph_(graph) {}

    /// Bounded DFS over outgoing edges. Keeps the shortest discovery of
    /// each node, the heavier edge on ties. Never contains `id` itself.
    /// Sorted by (distance asc, weight desc). Records an access on `id`.
    std::vector<Dependency> findDependencies(const std::string& id,
                                             const DependencyOptions& options = {});

    /// BFS over incoming edges ("who depends on me"). Impact of a node
    /// at distance d is the product of edge weights along the path times
    /// decay^d. Sorted by impact descending.
    std::vector<ImpactedContext> findImpactedContexts(const std::string& id,
                                                      const ImpactOptions& options = {}) const;

    /// One representative cycle per DFS root over the given types.
    std::vector<Cycle> detectCycles(
        const std::vector<std::string>& relationship_types = {"depends-on", "requires"}) const;

    /// Dijkstra. nullopt when either node is missing or `to` is unreachable.
    std::optional<GraphPath> findShortestPath(const std::string& from, const std::string& to,
                                              const ShortestPathOptions& options = {}) const;

    /// Depth-bounded DFS from the start nodes applying the filters.
    /// Filters run under the shared lock and must not mutate the graph.
    std::vector<QueryMatch> query(const QueryOptions& options = {}) const;

    GraphStatistics getStatistics() const;

private:
    ContextGraph& graph_;
};

} // namespace ctxgraph
