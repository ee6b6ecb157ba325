#include "traversal/graph_traversal.hpp"

#include <algorithm>
#include <deque>
#include <limits>
#include <queue>
#include <unordered_map>
#include <unordered_set>

namespace ctxgraph {

// ─── Dependencies ──────────────────────────────────────────────

std::vector<Dependency> GraphTraversal::findDependencies(const std::string& id,
                                                         const DependencyOptions& options) {
    const size_t max_depth = options.max_depth.value_or(graph_.config().max_traversal_depth);

    auto deps = graph_.read([&](const GraphIndex& index) {
        std::unordered_map<std::string, Dependency> found;
        // Depth at which each node was last expanded. A node is expanded
        // again only if reached at a strictly smaller depth.
        std::unordered_map<std::string, size_t> expanded_at;
        std::vector<Edge> path;

        std::function<void(const std::string&, size_t)> visit =
            [&](const std::string& node_id, size_t depth) {
                if (depth > max_depth) return;
                auto seen = expanded_at.find(node_id);
                if (seen != expanded_at.end() && seen->second <= depth) return;
                expanded_at[node_id] = depth;

                for (EdgeHandle eid : index.outgoing(node_id)) {
                    const Edge* e = index.edge(eid);
                    if (!e || !matchesRelationship(options.relationship_types, e->relationship_type)) {
                        continue;
                    }
                    path.push_back(*e);

                    if (e->to != id) {
                        auto existing = found.find(e->to);
                        if (existing == found.end() ||
                            existing->second.distance > depth ||
                            (existing->second.distance == depth && existing->second.weight < e->weight)) {
                            found[e->to] = Dependency{e->to, e->relationship_type, depth,
                                                      e->weight, path, e->metadata};
                        }
                    }

                    if (options.transitive) {
                        visit(e->to, depth + 1);
                    }
                    path.pop_back();
                }
            };

        visit(id, 1);

        std::vector<Dependency> out;
        out.reserve(found.size());
        for (auto& [_, dep] : found) out.push_back(std::move(dep));
        std::sort(out.begin(), out.end(), [](const Dependency& a, const Dependency& b) {
            if (a.distance != b.distance) return a.distance < b.distance;
            if (a.weight != b.weight) return a.weight > b.weight;
            return a.context_id < b.context_id;
        });
        return out;
    });

    graph_.recordAccess(id);
    return deps;
}

// ─── Impact ────────────────────────────────────────────────────

std::vector<ImpactedContext> GraphTraversal::findImpactedContexts(const std::string& id,
                                                                  const ImpactOptions& options) const {
    const double decay = options.decay_factor.value_or(graph_.config().impact_decay_factor);

    return graph_.read([&](const GraphIndex& index) {
        struct Pending {
            std::string id;
            size_t distance;
            double impact;
            std::vector<Edge> path;
        };

        std::unordered_map<std::string, ImpactedContext> impacted;
        std::deque<Pending> queue;
        queue.push_back({id, 0, 1.0, {}});

        while (!queue.empty()) {
            Pending current = std::move(queue.front());
            queue.pop_front();
            if (current.distance >= options.max_distance) continue;

            // Stale entry: the node was re-reached with a larger impact
            // after this one was queued.
            if (current.id != id) {
                auto it = impacted.find(current.id);
                if (it != impacted.end() && it->second.impact > current.impact) continue;
            }

            for (EdgeHandle eid : index.incoming(current.id)) {
                const Edge* e = index.edge(eid);
                if (!e || !matchesRelationship(options.relationship_types, e->relationship_type)) {
                    continue;
                }
                if (e->from == id) continue;

                double impact = current.impact * e->weight * decay;
                if (impact < options.impact_threshold) continue;

                auto existing = impacted.find(e->from);
                if (existing != impacted.end() && existing->second.impact >= impact) continue;

                std::vector<Edge> path = current.path;
                path.push_back(*e);
                impacted[e->from] = ImpactedContext{e->from, impact, current.distance + 1,
                                                    e->relationship_type, path};
                queue.push_back({e->from, current.distance + 1, impact, std::move(path)});
            }
        }

        std::vector<ImpactedContext> out;
        out.reserve(impacted.size());
        for (auto& [_, entry] : impacted) out.push_back(std::move(entry));
        std::sort(out.begin(), out.end(), [](const ImpactedContext& a, const ImpactedContext& b) {
            if (a.impact != b.impact) return a.impact > b.impact;
            return a.context_id < b.context_id;
        });
        return out;
    });
}

// ─── Cycles ────────────────────────────────────────────────────

std::vector<Cycle> GraphTraversal::detectCycles(const std::vector<std::string>& relationship_types) const {
    auto cycles = graph_.read([&](const GraphIndex& index) {
        std::vector<Cycle> found;
        std::unordered_set<std::string> visited;
        std::unordered_set<std::string> on_stack;
        std::vector<std::string> stack;
        std::vector<Edge> edge_stack;  // edge_stack[i] joins stack[i] → stack[i + 1]

        std::function<bool(const std::string&)> dfs = [&](const std::string& node_id) -> bool {
            visited.insert(node_id);
            on_stack.insert(node_id);
            stack.push_back(node_id);

            for (EdgeHandle eid : index.outgoing(node_id)) {
                const Edge* e = index.edge(eid);
                if (!e || !matchesRelationship(relationship_types, e->relationship_type)) continue;

                if (on_stack.count(e->to)) {
                    size_t start = static_cast<size_t>(
                        std::find(stack.begin(), stack.end(), e->to) - stack.begin());
                    Cycle cycle;
                    cycle.nodes.assign(stack.begin() + start, stack.end());
                    cycle.nodes.push_back(e->to);
                    cycle.edges.assign(edge_stack.begin() + start, edge_stack.end());
                    cycle.edges.push_back(*e);
                    found.push_back(std::move(cycle));
                    return true;
                }
                if (!visited.count(e->to)) {
                    edge_stack.push_back(*e);
                    if (dfs(e->to)) return true;
                    edge_stack.pop_back();
                }
            }

            stack.pop_back();
            on_stack.erase(node_id);
            return false;
        };

        for (const auto& [node_id, _] : index.nodes()) {
            if (visited.count(node_id)) continue;
            stack.clear();
            edge_stack.clear();
            on_stack.clear();
            dfs(node_id);
        }
        return found;
    });

    graph_.logger()->info("Cycle detection complete: {} cycle(s) found", cycles.size());
    return cycles;
}

// ─── Shortest path ─────────────────────────────────────────────

std::optional<GraphPath> GraphTraversal::findShortestPath(const std::string& from, const std::string& to,
                                                          const ShortestPathOptions& options) const {
    return graph_.read([&](const GraphIndex& index) -> std::optional<GraphPath> {
        if (!index.hasNode(from) || !index.hasNode(to)) return std::nullopt;
        if (from == to) {
            GraphPath trivial;
            trivial.nodes.push_back(from);
            return trivial;
        }

        using Entry = std::pair<double, std::string>;
        std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> frontier;
        std::unordered_map<std::string, double> dist;
        std::unordered_map<std::string, EdgeHandle> previous;
        std::unordered_set<std::string> settled;

        dist[from] = 0.0;
        frontier.push({0.0, from});

        while (!frontier.empty()) {
            auto [cost, current] = frontier.top();
            frontier.pop();
            if (settled.count(current)) continue;
            settled.insert(current);
            if (current == to) break;

            for (EdgeHandle eid : index.outgoing(current)) {
                const Edge* e = index.edge(eid);
                if (!e || !matchesRelationship(options.relationship_types, e->relationship_type)) {
                    continue;
                }
                double step = options.weighted ? 1.0 / e->weight : 1.0;
                double alt = cost + step;
                auto known = dist.find(e->to);
                if (known == dist.end() || alt < known->second) {
                    dist[e->to] = alt;
                    previous[e->to] = eid;
                    frontier.push({alt, e->to});
                }
            }
        }

        if (!previous.count(to)) return std::nullopt;

        GraphPath result;
        result.cost = dist[to];
        std::string current = to;
        while (current != from) {
            const Edge* e = index.edge(previous.at(current));
            result.edges.push_back(*e);
            current = e->from;
        }
        std::reverse(result.edges.begin(), result.edges.end());
        result.nodes.push_back(from);
        for (const auto& e : result.edges) result.nodes.push_back(e.to);
        return result;
    });
}

// ─── Query ─────────────────────────────────────────────────────

std::vector<QueryMatch> GraphTraversal::query(const QueryOptions& options) const {
    return graph_.read([&](const GraphIndex& index) {
        std::vector<QueryMatch> results;
        std::unordered_set<std::string> visited;
        std::vector<Edge> path;

        auto full = [&]() { return options.limit > 0 && results.size() >= options.limit; };

        std::function<void(const std::string&, size_t)> traverse =
            [&](const std::string& node_id, size_t depth) {
                if (depth > options.max_depth || visited.count(node_id) || full()) return;
                visited.insert(node_id);

                const ContextNode* node = index.node(node_id);
                if (node && (!options.node_filter || options.node_filter(*node))) {
                    results.push_back({*node, path, depth});
                }

                for (EdgeHandle eid : index.outgoing(node_id)) {
                    if (full()) return;
                    const Edge* e = index.edge(eid);
                    if (!e || !matchesRelationship(options.relationship_types, e->relationship_type)) {
                        continue;
                    }
                    if (options.edge_filter && !options.edge_filter(*e)) continue;
                    path.push_back(*e);
                    traverse(e->to, depth + 1);
                    path.pop_back();
                }
            };

        std::vector<std::string> roots =
            options.start_nodes.empty() ? index.nodeIds() : options.start_nodes;
        for (const auto& root : roots) {
            if (full()) break;
            traverse(root, 0);
        }
        return results;
    });
}

// ─── Statistics ────────────────────────────────────────────────

GraphStatistics computeStatistics(const GraphIndex& index) {
    GraphStatistics stats;
    stats.node_count = index.nodeCount();
    stats.edge_count = index.edgeCount();
    stats.relationship_types = index.relationshipTypes();
    for (const auto& type : stats.relationship_types) {
        stats.edges_by_type[type] = index.edgesOfType(type).size();
    }

    const size_t n = stats.node_count;
    if (n > 0) {
        size_t total_degree = 0;
        for (const auto& [id, _] : index.nodes()) {
            total_degree += index.outgoing(id).size() + index.incoming(id).size();
        }
        stats.average_degree = static_cast<double>(total_degree) / static_cast<double>(n);
    }
    if (n > 1) {
        stats.density = static_cast<double>(stats.edge_count) /
                        (static_cast<double>(n) * static_cast<double>(n - 1));
    }

    // Weakly connected components: reachability over both directions.
    std::unordered_set<std::string> visited;
    for (const auto& [root, _] : index.nodes()) {
        if (visited.count(root)) continue;
        stats.components++;
        std::vector<std::string> stack{root};
        visited.insert(root);
        while (!stack.empty()) {
            std::string current = stack.back();
            stack.pop_back();
            for (EdgeHandle eid : index.outgoing(current)) {
                const Edge* e = index.edge(eid);
                if (e && visited.insert(e->to).second) stack.push_back(e->to);
            }
            for (EdgeHandle eid : index.incoming(current)) {
                const Edge* e = index.edge(eid);
                if (e && visited.insert(e->from).second) stack.push_back(e->from);
            }
        }
    }
    return stats;
}

Json::Value statisticsToJson(const GraphStatistics& stats) {
    Json::Value out(Json::objectValue);
    out["nodeCount"] = static_cast<Json::UInt64>(stats.node_count);
    out["edgeCount"] = static_cast<Json::UInt64>(stats.edge_count);
    Json::Value types(Json::arrayValue);
    for (const auto& t : stats.relationship_types) types.append(t);
    out["relationshipTypes"] = types;
    Json::Value by_type(Json::objectValue);
    for (const auto& [type, count] : stats.edges_by_type) {
        by_type[type] = static_cast<Json::UInt64>(count);
    }
    out["edgesByType"] = by_type;
    out["averageDegree"] = stats.average_degree;
    out["density"] = stats.density;
    out["components"] = static_cast<Json::UInt64>(stats.components);
    return out;
}

GraphStatistics GraphTraversal::getStatistics() const {
    return graph_.read([](const GraphIndex& index) { return computeStatistics(index); });
}

} // namespace ctxgraph
