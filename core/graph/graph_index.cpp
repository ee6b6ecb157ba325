#include "graph/graph_index.hpp"

#include <algorithm>

namespace ctxgraph {

namespace {
const std::set<EdgeHandle> kNoEdges;
}

// ─── Nodes ─────────────────────────────────────────────────────

bool GraphIndex::upsertNode(const std::string& id, Json::Value payload, TimePoint now) {
    auto it = nodes_.find(id);
    if (it != nodes_.end()) {
        it->second.payload = std::move(payload);
        it->second.last_accessed_at = now;
        return true;
    }
    nodes_.emplace(id, ContextNode(id, std::move(payload), now));
    outgoing_[id];  // ensure entry exists
    incoming_[id];
    return false;
}

void GraphIndex::putNode(ContextNode node) {
    std::string id = node.id;
    nodes_[id] = std::move(node);
    outgoing_[id];
    incoming_[id];
}

bool GraphIndex::eraseNode(const std::string& id) {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return false;

    std::vector<EdgeHandle> edges_to_remove;
    for (auto eid : outgoing(id)) edges_to_remove.push_back(eid);
    for (auto eid : incoming(id)) edges_to_remove.push_back(eid);
    for (auto eid : edges_to_remove) {
        eraseEdge(eid);  // self-loops appear twice; the second erase is a no-op
    }

    outgoing_.erase(id);
    incoming_.erase(id);
    nodes_.erase(it);
    return true;
}

ContextNode* GraphIndex::node(const std::string& id) {
    auto it = nodes_.find(id);
    return it != nodes_.end() ? &it->second : nullptr;
}

const ContextNode* GraphIndex::node(const std::string& id) const {
    auto it = nodes_.find(id);
    return it != nodes_.end() ? &it->second : nullptr;
}

std::vector<std::string> GraphIndex::nodeIds() const {
    std::vector<std::string> ids;
    ids.reserve(nodes_.size());
    for (const auto& [id, _] : nodes_) {
        ids.push_back(id);
    }
    return ids;
}

// ─── Edges ─────────────────────────────────────────────────────

EdgeHandle GraphIndex::insertEdge(Edge edge) {
    EdgeHandle id = next_edge_id_++;
    edge.id = id;
    outgoing_[edge.from].insert(id);
    incoming_[edge.to].insert(id);
    by_type_[edge.relationship_type].insert(id);
    edges_.emplace(id, std::move(edge));
    return id;
}

bool GraphIndex::eraseEdge(EdgeHandle id) {
    auto it = edges_.find(id);
    if (it == edges_.end()) return false;

    const Edge& e = it->second;
    auto out = outgoing_.find(e.from);
    if (out != outgoing_.end()) out->second.erase(id);
    auto in = incoming_.find(e.to);
    if (in != incoming_.end()) in->second.erase(id);
    auto typed = by_type_.find(e.relationship_type);
    if (typed != by_type_.end()) {
        typed->second.erase(id);
        if (typed->second.empty()) by_type_.erase(typed);
    }

    edges_.erase(it);
    return true;
}

std::optional<EdgeHandle> GraphIndex::findEdge(const std::string& from, const std::string& to,
                                               const std::string& type) const {
    for (auto eid : outgoing(from)) {
        const Edge* e = edge(eid);
        if (e && e->to == to && e->relationship_type == type) return eid;
    }
    return std::nullopt;
}

const Edge* GraphIndex::edge(EdgeHandle id) const {
    auto it = edges_.find(id);
    return it != edges_.end() ? &it->second : nullptr;
}

// ─── Adjacency ─────────────────────────────────────────────────

const std::set<EdgeHandle>& GraphIndex::outgoing(const std::string& node_id) const {
    auto it = outgoing_.find(node_id);
    return it != outgoing_.end() ? it->second : kNoEdges;
}

const std::set<EdgeHandle>& GraphIndex::incoming(const std::string& node_id) const {
    auto it = incoming_.find(node_id);
    return it != incoming_.end() ? it->second : kNoEdges;
}

const std::set<EdgeHandle>& GraphIndex::edgesOfType(const std::string& type) const {
    auto it = by_type_.find(type);
    return it != by_type_.end() ? it->second : kNoEdges;
}

std::vector<std::string> GraphIndex::relationshipTypes() const {
    std::vector<std::string> types;
    types.reserve(by_type_.size());
    for (const auto& [type, handles] : by_type_) {
        if (!handles.empty()) types.push_back(type);
    }
    std::sort(types.begin(), types.end());
    return types;
}

void GraphIndex::clear() {
    nodes_.clear();
    edges_.clear();
    outgoing_.clear();
    incoming_.clear();
    by_type_.clear();
    next_edge_id_ = 1;
}

} // namespace ctxgraph
