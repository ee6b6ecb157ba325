#include "persistence/graph_adapter.hpp"
#include "common/error.hpp"

#include <utility>

namespace ctxgraph {

const char* toString(DeploymentEnvironment env) {
    switch (env) {
        case DeploymentEnvironment::Development: return "development";
        case DeploymentEnvironment::Test:        return "test";
        case DeploymentEnvironment::Production:  return "production";
    }
    return "development";
}

DeploymentEnvironment parseDeploymentEnvironment(const std::string& name) {
    if (name == "development") return DeploymentEnvironment::Development;
    if (name == "test")        return DeploymentEnvironment::Test;
    if (name == "production")  return DeploymentEnvironment::Production;
    throw ValidationError("Unknown deployment environment: " + name);
}

// ─── InMemoryGraphAdapter ──────────────────────────────────────

InMemoryGraphAdapter::InMemoryGraphAdapter(DeploymentEnvironment env) : env_(env) {}

void InMemoryGraphAdapter::upsertNode(const ContextNode& node) {
    if (node.id.empty()) throw AdapterError("Cannot store a node without an id");
    std::lock_guard<std::mutex> lock(mutex_);
    nodes_[node.id] = node;
}

void InMemoryGraphAdapter::upsertEdge(const Edge& edge) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!nodes_.count(edge.from) || !nodes_.count(edge.to)) {
        throw AdapterError("Edge " + edge.from + " -[" + edge.relationship_type + "]-> " +
                           edge.to + " references a node that was never stored");
    }
    edges_[EdgeKey{edge.from, edge.to, edge.relationship_type}] = edge;
}

std::vector<Edge> InMemoryGraphAdapter::fetchNeighbors(const std::string& context_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Edge> result;
    for (const auto& [key, edge] : edges_) {
        if (edge.from == context_id || edge.to == context_id) result.push_back(edge);
    }
    return result;
}

std::vector<Edge> InMemoryGraphAdapter::runQuery(const QueryPattern& pattern) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Edge> result;
    for (const auto& [key, edge] : edges_) {
        if (pattern.from && edge.from != *pattern.from) continue;
        if (pattern.to && edge.to != *pattern.to) continue;
        if (pattern.relationship_type && edge.relationship_type != *pattern.relationship_type) continue;
        result.push_back(edge);
        if (pattern.limit > 0 && result.size() >= pattern.limit) break;
    }
    return result;
}

void InMemoryGraphAdapter::clearAll() {
    if (env_ == DeploymentEnvironment::Production) {
        throw AdapterError("Cannot clear graph store in production");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    nodes_.clear();
    edges_.clear();
}

std::optional<ContextNode> InMemoryGraphAdapter::node(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return std::nullopt;
    return it->second;
}

size_t InMemoryGraphAdapter::nodeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nodes_.size();
}

size_t InMemoryGraphAdapter::edgeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return edges_.size();
}

// ─── GraphMirror ───────────────────────────────────────────────

GraphMirror::GraphMirror(LoggerPtr logger)
    : logger_(loggerOrNull(std::move(logger), "ctxgraph.mirror")) {}

MirrorReport GraphMirror::push(const ContextGraph& graph, GraphAdapter& adapter) const {
    std::vector<ContextNode> nodes;
    std::vector<Edge> edges;
    graph.read([&](const GraphIndex& index) {
        nodes.reserve(index.nodeCount());
        for (const auto& [id, node] : index.nodes()) nodes.push_back(node);
        edges.reserve(index.edgeCount());
        for (const auto& [handle, edge] : index.edges()) edges.push_back(edge);
    });

    MirrorReport report;
    for (const auto& node : nodes) {
        try {
            adapter.upsertNode(node);
            ++report.nodes_written;
        } catch (const std::exception& e) {
            ++report.failures;
            logger_->warn("[{}] failed to write node {}: {}", adapter.name(), node.id, e.what());
        }
    }
    for (const auto& edge : edges) {
        try {
            adapter.upsertEdge(edge);
            ++report.edges_written;
        } catch (const std::exception& e) {
            ++report.failures;
            logger_->warn("[{}] failed to write edge {} -[{}]-> {}: {}", adapter.name(),
                          edge.from, edge.relationship_type, edge.to, e.what());
        }
    }

    logger_->info("Mirrored graph to {}: {} nodes, {} edges, {} failures", adapter.name(),
                  report.nodes_written, report.edges_written, report.failures);
    return report;
}

} // namespace ctxgraph
