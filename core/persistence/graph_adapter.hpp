#pragma once

#include "common/logger.hpp"
#include "graph/context_graph.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace ctxgraph {

enum class DeploymentEnvironment { Development, Test, Production };

const char* toString(DeploymentEnvironment env);
/// Throws ValidationError for anything but development / test / production.
DeploymentEnvironment parseDeploymentEnvironment(const std::string& name);

/// Edge pattern for GraphAdapter::runQuery. Unset fields match anything.
struct QueryPattern {
    std::optional<std::string> from;
    std::optional<std::string> to;
    std::optional<std::string> relationship_type;
    size_t limit = 0;   // 0 = unlimited
};

// ─── GraphAdapter ──────────────────────────────────────────────
// Narrow interface to an optional backing store. Implementations
// report failures as AdapterError.

class GraphAdapter {
public:
    virtual ~GraphAdapter() = default;

    virtual void upsertNode(const ContextNode& node) = 0;
    /// Keyed by (from, to, relationship_type).
    virtual void upsertEdge(const Edge& edge) = 0;

    /// Edges touching `context_id` in either direction.
    virtual std::vector<Edge> fetchNeighbors(const std::string& context_id) const = 0;
    virtual std::vector<Edge> runQuery(const QueryPattern& pattern) const = 0;

    /// Drop everything. Refused in production.
    virtual void clearAll() = 0;

    virtual std::string name() const = 0;
};

// ─── InMemoryGraphAdapter ──────────────────────────────────────

class InMemoryGraphAdapter : public GraphAdapter {
public:
    explicit InMemoryGraphAdapter(DeploymentEnvironment env = DeploymentEnvironment::Development);

    void upsertNode(const ContextNode& node) override;
    void upsertEdge(const Edge& edge) override;
    std::vector<Edge> fetchNeighbors(const std::string& context_id) const override;
    std::vector<Edge> runQuery(const QueryPattern& pattern) const override;
    void clearAll() override;
    std::string name() const override { return "in-memory"; }

    std::optional<ContextNode> node(const std::string& id) const;
    size_t nodeCount() const;
    size_t edgeCount() const;
    DeploymentEnvironment environment() const { return env_; }

private:
    using EdgeKey = std::tuple<std::string, std::string, std::string>;

    DeploymentEnvironment env_;
    mutable std::mutex mutex_;
    std::map<std::string, ContextNode> nodes_;
    std::map<EdgeKey, Edge> edges_;
};

// ─── GraphMirror ───────────────────────────────────────────────
// Best-effort copy of a graph into an adapter. The graph is
// snapshotted under its shared lock; the adapter is called after the
// lock is released. A failed write is logged and counted, never
// rethrown.

struct MirrorReport {
    size_t nodes_written = 0;
    size_t edges_written = 0;
    size_t failures = 0;

    bool complete() const { return failures == 0; }
};

class GraphMirror {
public:
    explicit GraphMirror(LoggerPtr logger = nullptr);

    MirrorReport push(const ContextGraph& graph, GraphAdapter& adapter) const;

private:
    LoggerPtr logger_;
};

} // namespace ctxgraph
