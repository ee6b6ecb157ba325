#pragma once

#include "graph/context_node.hpp"
#include "graph/edge.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace ctxgraph {

// ─── GraphIndex ────────────────────────────────────────────────
// Flat node and edge tables plus adjacency and relationship-type
// indices. Edges are owned by the edge table; adjacency sets only
// hold handles, so removing a node is a filter over handles.
//
// Not synchronized. ContextGraph owns one and guards it with a
// reader/writer lock.

class GraphIndex {
public:
    // ── Nodes ──
    /// Inserts or replaces the payload. Returns true if the node existed.
    bool upsertNode(const std::string& id, Json::Value payload, TimePoint now);
    void putNode(ContextNode node);
    bool eraseNode(const std::string& id);
    ContextNode* node(const std::string& id);
    const ContextNode* node(const std::string& id) const;
    bool hasNode(const std::string& id) const { return nodes_.count(id) > 0; }
    std::vector<std::string> nodeIds() const;
    const std::map<std::string, ContextNode>& nodes() const { return nodes_; }
    size_t nodeCount() const { return nodes_.size(); }

    // ── Edges ──
    /// Assigns a handle and links the edge. Endpoints must exist.
    EdgeHandle insertEdge(Edge edge);
    bool eraseEdge(EdgeHandle id);
    std::optional<EdgeHandle> findEdge(const std::string& from, const std::string& to,
                                       const std::string& type) const;
    const Edge* edge(EdgeHandle id) const;
    const std::map<EdgeHandle, Edge>& edges() const { return edges_; }
    size_t edgeCount() const { return edges_.size(); }

    // ── Adjacency ──
    const std::set<EdgeHandle>& outgoing(const std::string& node_id) const;
    const std::set<EdgeHandle>& incoming(const std::string& node_id) const;
    const std::set<EdgeHandle>& edgesOfType(const std::string& type) const;

    /// Relationship types with at least one live edge, sorted.
    std::vector<std::string> relationshipTypes() const;

    void clear();

private:
    EdgeHandle next_edge_id_ = 1;

    std::map<std::string, ContextNode> nodes_;
    std::map<EdgeHandle, Edge> edges_;

    std::unordered_map<std::string, std::set<EdgeHandle>> outgoing_;
    std::unordered_map<std::string, std::set<EdgeHandle>> incoming_;
    std::unordered_map<std::string, std::set<EdgeHandle>> by_type_;
};

} // namespace ctxgraph
