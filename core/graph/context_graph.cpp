#include "graph/context_graph.hpp"
#include "common/error.hpp"

#include <algorithm>
#include <mutex>

namespace ctxgraph {

const char* toString(Direction direction) {
    switch (direction) {
        case Direction::Outgoing: return "outgoing";
        case Direction::Incoming: return "incoming";
        case Direction::Both:     return "both";
    }
    return "both";
}

bool matchesRelationship(const std::vector<std::string>& types, const std::string& type) {
    if (types.empty()) return true;
    return std::find(types.begin(), types.end(), type) != types.end();
}

ContextGraph::ContextGraph(GraphConfig config, LoggerPtr logger, ClockFn clock)
    : config_(config),
      logger_(loggerOrNull(std::move(logger), "ctxgraph.graph")),
      clock_(clock ? std::move(clock) : ClockFn(systemNow)) {
    if (!(config_.default_edge_weight > 0.0 && config_.default_edge_weight <= 1.0)) {
        throw ValidationError("default_edge_weight must be in (0, 1]");
    }
}

// ─── Mutation ──────────────────────────────────────────────────

void ContextGraph::addNode(const std::string& id, Json::Value payload) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    bool existed = index_.upsertNode(id, std::move(payload), clock_());
    if (existed) {
        logger_->warn("Node already exists, updating: {}", id);
    }
    logger_->debug("Node added: {} (nodes={})", id, index_.nodeCount());
}

EdgeHandle ContextGraph::addEdge(const std::string& from, const std::string& to,
                                 const std::string& relationship_type,
                                 std::optional<double> weight,
                                 Json::Value metadata) {
    Edge edge(from, to, relationship_type, weight.value_or(config_.default_edge_weight));
    edge.metadata = metadata.isNull() ? Json::Value(Json::objectValue) : std::move(metadata);
    edge.created_at = clock_();
    return restoreEdge(std::move(edge));
}

EdgeHandle ContextGraph::restoreEdge(Edge edge) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    validateEdge(edge);
    std::string from = edge.from;
    std::string to = edge.to;
    std::string type = edge.relationship_type;
    EdgeHandle id = index_.insertEdge(std::move(edge));
    logger_->debug("Edge added: {} -[{}]-> {} (edges={})", from, type, to, index_.edgeCount());
    return id;
}

void ContextGraph::validateEdge(const Edge& edge) const {
    if (edge.relationship_type.empty()) {
        throw ValidationError("Relationship type is required");
    }
    if (!(edge.weight > 0.0 && edge.weight <= 1.0)) {
        throw ValidationError("Edge weight must be in (0, 1], got " + std::to_string(edge.weight));
    }
    if (!index_.hasNode(edge.from)) throw NodeNotFound(edge.from);
    if (!index_.hasNode(edge.to)) throw NodeNotFound(edge.to);
}

bool ContextGraph::removeNode(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!index_.eraseNode(id)) return false;
    logger_->debug("Node removed: {} (nodes={})", id, index_.nodeCount());
    return true;
}

bool ContextGraph::removeEdge(const std::string& from, const std::string& to,
                              const std::string& relationship_type) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto handle = index_.findEdge(from, to, relationship_type);
    if (!handle) return false;
    return index_.eraseEdge(*handle);
}

void ContextGraph::recordAccess(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    ContextNode* node = index_.node(id);
    if (!node) return;
    node->last_accessed_at = clock_();
    node->access_count++;
}

void ContextGraph::restoreNode(ContextNode node) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (index_.hasNode(node.id)) {
        logger_->warn("Node already exists, updating: {}", node.id);
    }
    index_.putNode(std::move(node));
}

void ContextGraph::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    index_.clear();
}

// ─── Reads ─────────────────────────────────────────────────────

std::vector<Neighbor> ContextGraph::getNeighbors(const std::string& id, Direction direction,
                                                 const std::vector<std::string>& relationship_types) const {
    return read([&](const GraphIndex& index) {
        std::vector<Neighbor> neighbors;
        if (direction == Direction::Outgoing || direction == Direction::Both) {
            for (auto eid : index.outgoing(id)) {
                const Edge* e = index.edge(eid);
                if (!e || !matchesRelationship(relationship_types, e->relationship_type)) continue;
                neighbors.push_back({e->to, e->relationship_type, Direction::Outgoing, e->weight});
            }
        }
        if (direction == Direction::Incoming || direction == Direction::Both) {
            for (auto eid : index.incoming(id)) {
                const Edge* e = index.edge(eid);
                if (!e || !matchesRelationship(relationship_types, e->relationship_type)) continue;
                neighbors.push_back({e->from, e->relationship_type, Direction::Incoming, e->weight});
            }
        }
        return neighbors;
    });
}

bool ContextGraph::hasNode(const std::string& id) const {
    return read([&](const GraphIndex& index) { return index.hasNode(id); });
}

std::optional<ContextNode> ContextGraph::getNode(const std::string& id) const {
    return read([&](const GraphIndex& index) -> std::optional<ContextNode> {
        const ContextNode* node = index.node(id);
        if (!node) return std::nullopt;
        return *node;
    });
}

std::vector<std::string> ContextGraph::nodeIds() const {
    return read([](const GraphIndex& index) { return index.nodeIds(); });
}

std::vector<Edge> ContextGraph::edges() const {
    return read([](const GraphIndex& index) {
        std::vector<Edge> out;
        out.reserve(index.edgeCount());
        for (const auto& [_, edge] : index.edges()) out.push_back(edge);
        return out;
    });
}

std::vector<std::string> ContextGraph::relationshipTypes() const {
    return read([](const GraphIndex& index) { return index.relationshipTypes(); });
}

size_t ContextGraph::nodeCount() const {
    return read([](const GraphIndex& index) { return index.nodeCount(); });
}

size_t ContextGraph::edgeCount() const {
    return read([](const GraphIndex& index) { return index.edgeCount(); });
}

} // namespace ctxgraph
