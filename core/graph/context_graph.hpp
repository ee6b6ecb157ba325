#pragma once

#include "common/logger.hpp"
#include "common/time.hpp"
#include "graph/graph_index.hpp"

#include <json/json.h>

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace ctxgraph {

struct GraphConfig {
    size_t max_traversal_depth = 10;
    double default_edge_weight = 1.0;   // used when addEdge gets no weight
    double impact_decay_factor = 0.8;   // per-hop decay for impact propagation
};

enum class Direction { Outgoing, Incoming, Both };

const char* toString(Direction direction);

struct Neighbor {
    std::string context_id;
    std::string relationship;
    Direction direction = Direction::Outgoing;
    double weight = 1.0;
};

// ─── ContextGraph ──────────────────────────────────────────────
// Directed, weighted, typed graph over context records.
//
// Mutations take an exclusive lock; reads and traversals take a
// shared lock for their whole duration, so a traversal never sees a
// half-applied mutation. Callbacks passed to read() run under the
// shared lock and must not call back into mutating methods.

class ContextGraph {
public:
    explicit ContextGraph(GraphConfig config = {},
                          LoggerPtr logger = nullptr,
                          ClockFn clock = nullptr);

    ContextGraph(const ContextGraph&) = delete;
    ContextGraph& operator=(const ContextGraph&) = delete;

    // ── Mutation ──
    /// Insert or replace a node. Replacing keeps its edges and logs a warning.
    void addNode(const std::string& id, Json::Value payload);

    /// Add a directed edge. Throws NodeNotFound if either endpoint is
    /// absent and ValidationError for an empty type or a weight outside
    /// (0, 1]. Nothing is modified when it throws.
    EdgeHandle addEdge(const std::string& from, const std::string& to,
                       const std::string& relationship_type,
                       std::optional<double> weight = std::nullopt,
                       Json::Value metadata = Json::Value());

    /// Remove a node and every edge touching it.
    bool removeNode(const std::string& id);

    /// Remove the first edge from → to with the given type.
    bool removeEdge(const std::string& from, const std::string& to,
                    const std::string& relationship_type);

    /// Bump last-access time and access count. No-op for unknown ids.
    void recordAccess(const std::string& id);

    /// Insert a node with its timestamps and counters as given (import path).
    void restoreNode(ContextNode node);

    /// Insert a fully-formed edge, keeping its created_at (import path).
    /// Same validation as addEdge.
    EdgeHandle restoreEdge(Edge edge);

    void clear();

    // ── Reads ──
    std::vector<Neighbor> getNeighbors(const std::string& id,
                                       Direction direction = Direction::Both,
                                       const std::vector<std::string>& relationship_types = {}) const;

    bool hasNode(const std::string& id) const;
    std::optional<ContextNode> getNode(const std::string& id) const;
    std::vector<std::string> nodeIds() const;
    std::vector<Edge> edges() const;
    std::vector<std::string> relationshipTypes() const;
    size_t nodeCount() const;
    size_t edgeCount() const;

    /// Run `fn(const GraphIndex&)` under the shared lock and return its result.
    template <typename Fn>
    auto read(Fn&& fn) const -> decltype(fn(std::declval<const GraphIndex&>())) {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return fn(static_cast<const GraphIndex&>(index_));
    }

    const GraphConfig& config() const { return config_; }
    const LoggerPtr& logger() const { return logger_; }
    TimePoint now() const { return clock_(); }

private:
    void validateEdge(const Edge& edge) const;

    GraphConfig config_;
    LoggerPtr logger_;
    ClockFn clock_;

    mutable std::shared_mutex mutex_;
    GraphIndex index_;
};

/// True when `types` is empty or contains `type`.
bool matchesRelationship(const std::vector<std::string>& types, const std::string& type);

} // namespace ctxgraph
