#pragma once

#include "graph/context_graph.hpp"

#include <json/json.h>

#include <memory>
#include <string>

namespace ctxgraph {

// ─── GraphSerializer ───────────────────────────────────────────
// JSON export / import of a whole graph:
//
//   { "nodes": [ { id, payload, metadata: { createdAt, lastAccessed, accessCount } } ],
//     "edges": [ { from, to, type, weight, metadata, createdAt } ],
//     "stats": { nodeCount, edgeCount, relationshipTypes, ... } }
//
// Timestamps are epoch milliseconds. Edge handles are not exported;
// the importing graph assigns fresh ones.

class GraphSerializer {
public:
    /// Snapshot taken under a single shared lock.
    static Json::Value toJson(const ContextGraph& graph);

    /// Throws SerializationError for a malformed document, including
    /// edges that reference missing nodes or carry invalid weights.
    static std::unique_ptr<ContextGraph> fromJson(const Json::Value& doc,
                                                  GraphConfig config = {},
                                                  LoggerPtr logger = nullptr);

    static void exportToFile(const ContextGraph& graph, const std::string& path);
    static std::unique_ptr<ContextGraph> importFromFile(const std::string& path,
                                                        GraphConfig config = {},
                                                        LoggerPtr logger = nullptr);
};

} // namespace ctxgraph
