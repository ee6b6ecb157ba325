#include "graph/graph_serializer.hpp"
#include "common/error.hpp"
#include "common/payload.hpp"
#include "traversal/graph_traversal.hpp"

#include <fstream>
#include <sstream>
#include <utility>

namespace ctxgraph {

namespace {

Json::Value millis(TimePoint tp) {
    return Json::Value(static_cast<Json::Int64>(toEpochMillis(tp)));
}

TimePoint readMillis(const Json::Value& v, TimePoint fallback) {
    if (v.isNull()) return fallback;
    if (!v.isIntegral()) throw SerializationError("Timestamps must be integer epoch milliseconds");
    return fromEpochMillis(v.asInt64());
}

void requireString(const Json::Value& obj, const char* field, const char* what,
                   std::string& out) {
    if (!obj[field].isString()) {
        throw SerializationError(std::string(what) + " requires string field '" + field + "'");
    }
    out = obj[field].asString();
}

ContextNode nodeFromJson(const Json::Value& doc, TimePoint now) {
    if (!doc.isObject()) throw SerializationError("Node entries must be objects");
    ContextNode node;
    requireString(doc, "id", "Node", node.id);
    node.payload = doc["payload"];

    const Json::Value& meta = doc["metadata"];
    if (!meta.isNull() && !meta.isObject()) {
        throw SerializationError("Node '" + node.id + "' metadata must be an object");
    }
    node.created_at = readMillis(meta["createdAt"], now);
    node.last_accessed_at = readMillis(meta["lastAccessed"], node.created_at);
    if (!meta["accessCount"].isNull()) {
        if (!meta["accessCount"].isUInt64()) {
            throw SerializationError("Node '" + node.id + "' accessCount must be a non-negative integer");
        }
        node.access_count = meta["accessCount"].asUInt64();
    }
    return node;
}

Edge edgeFromJson(const Json::Value& doc, TimePoint now) {
    if (!doc.isObject()) throw SerializationError("Edge entries must be objects");
    Edge edge;
    requireString(doc, "from", "Edge", edge.from);
    requireString(doc, "to", "Edge", edge.to);
    requireString(doc, "type", "Edge", edge.relationship_type);
    if (!doc["weight"].isNull()) {
        if (!doc["weight"].isNumeric()) throw SerializationError("Edge weight must be numeric");
        edge.weight = doc["weight"].asDouble();
    }
    edge.metadata = doc["metadata"];
    edge.created_at = readMillis(doc["createdAt"], now);
    return edge;
}

} // namespace

Json::Value GraphSerializer::toJson(const ContextGraph& graph) {
    return graph.read([](const GraphIndex& index) {
        Json::Value doc(Json::objectValue);

        Json::Value nodes(Json::arrayValue);
        for (const auto& [id, node] : index.nodes()) {
            Json::Value entry(Json::objectValue);
            entry["id"] = id;
            entry["payload"] = node.payload;
            Json::Value meta(Json::objectValue);
            meta["createdAt"] = millis(node.created_at);
            meta["lastAccessed"] = millis(node.last_accessed_at);
            meta["accessCount"] = static_cast<Json::UInt64>(node.access_count);
            entry["metadata"] = std::move(meta);
            nodes.append(std::move(entry));
        }

        Json::Value edges(Json::arrayValue);
        for (const auto& [handle, edge] : index.edges()) {
            Json::Value entry(Json::objectValue);
            entry["from"] = edge.from;
            entry["to"] = edge.to;
            entry["type"] = edge.relationship_type;
            entry["weight"] = edge.weight;
            entry["metadata"] = edge.metadata;
            entry["createdAt"] = millis(edge.created_at);
            edges.append(std::move(entry));
        }

        doc["nodes"] = std::move(nodes);
        doc["edges"] = std::move(edges);
        doc["stats"] = statisticsToJson(computeStatistics(index));
        return doc;
    });
}

std::unique_ptr<ContextGraph> GraphSerializer::fromJson(const Json::Value& doc,
                                                        GraphConfig config,
                                                        LoggerPtr logger) {
    if (!doc.isObject()) throw SerializationError("Graph document must be an object");
    const Json::Value& nodes = doc["nodes"];
    const Json::Value& edges = doc["edges"];
    if (!nodes.isNull() && !nodes.isArray()) throw SerializationError("'nodes' must be an array");
    if (!edges.isNull() && !edges.isArray()) throw SerializationError("'edges' must be an array");

    auto graph = std::make_unique<ContextGraph>(config, std::move(logger));
    TimePoint now = graph->now();

    for (const auto& entry : nodes) graph->restoreNode(nodeFromJson(entry, now));

    for (const auto& entry : edges) {
        Edge edge = edgeFromJson(entry, now);
        try {
            graph->restoreEdge(std::move(edge));
        } catch (const Error& e) {
            throw SerializationError(std::string("Invalid edge in graph document: ") + e.what());
        }
    }

    graph->logger()->info("Imported graph: {} nodes, {} edges",
                          graph->nodeCount(), graph->edgeCount());
    return graph;
}

void GraphSerializer::exportToFile(const ContextGraph& graph, const std::string& path) {
    std::ofstream out(path);
    if (!out) throw SerializationError("Cannot open " + path + " for writing");

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(toJson(graph), &out);
    out << "\n";
    if (!out) throw SerializationError("Failed writing graph to " + path);
}

std::unique_ptr<ContextGraph> GraphSerializer::importFromFile(const std::string& path,
                                                              GraphConfig config,
                                                              LoggerPtr logger) {
    std::ifstream in(path);
    if (!in) throw SerializationError("Cannot open " + path + " for reading");
    std::stringstream buffer;
    buffer << in.rdbuf();
    return fromJson(parseJson(buffer.str(), path), config, std::move(logger));
}

} // namespace ctxgraph
