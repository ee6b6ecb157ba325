// PyBind11 bindings for the ctxgraph core.
// Exposes the context graph, traversal, analyzer and summarizer to Python.
// Payloads and records cross the boundary as JSON strings.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "analysis/graph_analyzer.hpp"
#include "common/error.hpp"
#include "common/payload.hpp"
#include "compression/context_summarizer.hpp"
#include "config/config_loader.hpp"
#include "graph/context_graph.hpp"
#include "graph/graph_serializer.hpp"
#include "traversal/graph_traversal.hpp"

namespace py = pybind11;
using namespace ctxgraph;

namespace {

Json::Value edgeToJson(const Edge& e) {
    Json::Value v(Json::objectValue);
    v["from"] = e.from;
    v["to"] = e.to;
    v["type"] = e.relationship_type;
    v["weight"] = e.weight;
    return v;
}

Json::Value pathToJson(const std::vector<Edge>& path) {
    Json::Value v(Json::arrayValue);
    for (const auto& e : path) v.append(edgeToJson(e));
    return v;
}

Json::Value resultToJson(const CompressionResult& r) {
    Json::Value v(Json::objectValue);
    v["record"] = r.record.toJson();
    v["strategy"] = toString(r.stats.strategy);
    v["compressed"] = r.stats.compressed;
    v["originalSize"] = static_cast<Json::UInt64>(r.stats.original_size);
    v["compressedSize"] = static_cast<Json::UInt64>(r.stats.compressed_size);
    v["compressionRatio"] = r.stats.compression_ratio;
    if (r.stats.centrality_score) v["centralityScore"] = *r.stats.centrality_score;
    if (r.stats.relationship_count) {
        v["relationshipCount"] = static_cast<Json::UInt64>(*r.stats.relationship_count);
    }
    return v;
}

ContextRecord recordFromString(const std::string& text) {
    return ContextRecord::fromJson(parseJson(text, "context record"));
}

} // namespace

PYBIND11_MODULE(ctxgraph_bindings, m) {
    m.doc() = "ctxgraph C++ Core Bindings";

    // ── Errors ──
    // Translators run newest first: the base class goes in before its subclasses.
    py::register_exception<Error>(m, "CtxGraphError", PyExc_RuntimeError);
    py::register_exception<NodeNotFound>(m, "NodeNotFound", PyExc_KeyError);
    py::register_exception<ValidationError>(m, "ValidationError", PyExc_ValueError);

    // ── Config ──
    py::class_<GraphConfig>(m, "GraphConfig")
        .def(py::init<>())
        .def_readwrite("max_traversal_depth", &GraphConfig::max_traversal_depth)
        .def_readwrite("default_edge_weight", &GraphConfig::default_edge_weight)
        .def_readwrite("impact_decay_factor", &GraphConfig::impact_decay_factor);

    py::enum_<Direction>(m, "Direction")
        .value("OUTGOING", Direction::Outgoing)
        .value("INCOMING", Direction::Incoming)
        .value("BOTH", Direction::Both);

    py::class_<Neighbor>(m, "Neighbor")
        .def_readonly("context_id", &Neighbor::context_id)
        .def_readonly("relationship", &Neighbor::relationship)
        .def_readonly("direction", &Neighbor::direction)
        .def_readonly("weight", &Neighbor::weight);

    // ── ContextGraph ──
    py::class_<ContextGraph>(m, "ContextGraph")
        .def(py::init([](const GraphConfig& config) {
                 return std::make_unique<ContextGraph>(config, makeLogger("ctxgraph.graph"));
             }),
             py::arg("config") = GraphConfig{})
        .def("add_node", [](ContextGraph& self, const std::string& id, const std::string& payload) {
                 self.addNode(id, parseJson(payload, "payload"));
             },
             py::arg("id"), py::arg("payload") = "{}")
        .def("add_edge", [](ContextGraph& self, const std::string& from, const std::string& to,
                            const std::string& type, std::optional<double> weight) {
                 return self.addEdge(from, to, type, weight);
             },
             py::arg("from_id"), py::arg("to_id"), py::arg("relationship_type"),
             py::arg("weight") = py::none())
        .def("remove_node", &ContextGraph::removeNode)
        .def("remove_edge", &ContextGraph::removeEdge)
        .def("has_node", &ContextGraph::hasNode)
        .def("get_payload", [](const ContextGraph& self, const std::string& id) -> py::object {
                 auto node = self.getNode(id);
                 if (!node) return py::none();
                 return py::str(toCompactString(node->payload));
             })
        .def("get_neighbors", &ContextGraph::getNeighbors,
             py::arg("id"), py::arg("direction") = Direction::Both,
             py::arg("relationship_types") = std::vector<std::string>{})
        .def("node_ids", &ContextGraph::nodeIds)
        .def("relationship_types", &ContextGraph::relationshipTypes)
        .def("node_count", &ContextGraph::nodeCount)
        .def("edge_count", &ContextGraph::edgeCount)
        .def("to_json", [](const ContextGraph& self) {
                 return toCompactString(GraphSerializer::toJson(self));
             })
        .def("export_to_file", [](const ContextGraph& self, const std::string& path) {
                 GraphSerializer::exportToFile(self, path);
             });

    // ── Traversal ──
    py::class_<GraphTraversal>(m, "GraphTraversal")
        .def(py::init<ContextGraph&>(), py::keep_alive<1, 2>())
        .def("find_dependencies", [](GraphTraversal& self, const std::string& id,
                                     std::optional<size_t> max_depth,
                                     std::vector<std::string> types, bool transitive) {
                 DependencyOptions opts;
                 opts.max_depth = max_depth;
                 opts.relationship_types = std::move(types);
                 opts.transitive = transitive;
                 Json::Value out(Json::arrayValue);
                 for (const auto& d : self.findDependencies(id, opts)) {
                     Json::Value v(Json::objectValue);
                     v["contextId"] = d.context_id;
                     v["relationship"] = d.relationship;
                     v["distance"] = static_cast<Json::UInt64>(d.distance);
                     v["weight"] = d.weight;
                     v["path"] = pathToJson(d.path);
                     out.append(v);
                 }
                 return toCompactString(out);
             },
             py::arg("id"), py::arg("max_depth") = py::none(),
             py::arg("relationship_types") = DependencyOptions{}.relationship_types,
             py::arg("transitive") = true)
        .def("find_impacted_contexts", [](const GraphTraversal& self, const std::string& id,
                                          size_t max_distance, double threshold) {
                 ImpactOptions opts;
                 opts.max_distance = max_distance;
                 opts.impact_threshold = threshold;
                 Json::Value out(Json::arrayValue);
                 for (const auto& c : self.findImpactedContexts(id, opts)) {
                     Json::Value v(Json::objectValue);
                     v["contextId"] = c.context_id;
                     v["impact"] = c.impact;
                     v["distance"] = static_cast<Json::UInt64>(c.distance);
                     v["relationship"] = c.relationship;
                     out.append(v);
                 }
                 return toCompactString(out);
             },
             py::arg("id"), py::arg("max_distance") = 3, py::arg("impact_threshold") = 0.1)
        .def("detect_cycles", [](const GraphTraversal& self, std::vector<std::string> types) {
                 std::vector<std::vector<std::string>> cycles;
                 for (const auto& c : self.detectCycles(types)) cycles.push_back(c.nodes);
                 return cycles;
             },
             py::arg("relationship_types") = std::vector<std::string>{"depends-on", "requires"})
        .def("find_shortest_path", [](const GraphTraversal& self, const std::string& from,
                                      const std::string& to, bool weighted) -> py::object {
                 ShortestPathOptions opts;
                 opts.weighted = weighted;
                 auto path = self.findShortestPath(from, to, opts);
                 if (!path) return py::none();
                 return py::make_tuple(path->nodes, path->cost);
             },
             py::arg("from_id"), py::arg("to_id"), py::arg("weighted") = true)
        .def("get_statistics", [](const GraphTraversal& self) {
                 return toCompactString(statisticsToJson(self.getStatistics()));
             });

    // ── Analyzer ──
    py::class_<GraphAnalysis>(m, "GraphAnalysis")
        .def_readonly("relationship_count", &GraphAnalysis::relationship_count)
        .def_readonly("dependency_count", &GraphAnalysis::dependency_count)
        .def_readonly("impacted_count", &GraphAnalysis::impacted_count)
        .def_readonly("importance", &GraphAnalysis::importance)
        .def_readonly("centrality_score", &GraphAnalysis::centrality_score);

    py::class_<GraphAnalyzer>(m, "GraphAnalyzer")
        .def(py::init([](ContextGraph& graph) {
                 return std::make_unique<GraphAnalyzer>(graph, AnalyzerConfig{},
                                                        makeLogger("ctxgraph.analyzer"));
             }),
             py::keep_alive<1, 2>())
        .def("analyze", &GraphAnalyzer::analyze)
        .def_static("centrality", &GraphAnalyzer::centrality);

    // ── Summarizer ──
    py::enum_<CompressionLevel>(m, "CompressionLevel")
        .value("LOW", CompressionLevel::Low)
        .value("MEDIUM", CompressionLevel::Medium)
        .value("HIGH", CompressionLevel::High);

    py::class_<ContextSummarizer>(m, "ContextSummarizer")
        .def(py::init([](const std::string& config_json) {
                 SummarizerConfig config = config_json.empty()
                     ? SummarizerConfig{}
                     : ConfigLoader::fromString(config_json).summarizer;
                 return std::make_unique<ContextSummarizer>(std::move(config),
                                                            makeLogger("ctxgraph.summarizer"));
             }),
             py::arg("config_json") = "")
        .def("set_graph_analyzer", &ContextSummarizer::setGraphAnalyzer, py::keep_alive<1, 2>())
        .def("summarize", [](const ContextSummarizer& self, const std::string& record,
                             std::optional<CompressionLevel> level) {
                 return toCompactString(resultToJson(self.summarize(recordFromString(record), level)));
             },
             py::arg("record"), py::arg("level") = py::none())
        .def("smart_summarize", [](const ContextSummarizer& self, const std::string& record,
                                   std::optional<size_t> target_tokens) {
                 return toCompactString(
                     resultToJson(self.smartSummarize(recordFromString(record), target_tokens)));
             },
             py::arg("record"), py::arg("target_tokens") = py::none())
        .def("graph_aware_summarize", [](const ContextSummarizer& self, const std::string& record,
                                         std::optional<size_t> target_tokens) {
                 return toCompactString(
                     resultToJson(self.graphAwareSummarize(recordFromString(record), target_tokens)));
             },
             py::arg("record"), py::arg("target_tokens") = py::none())
        .def("emergency_summarize", [](const ContextSummarizer& self, const std::string& record) {
                 return toCompactString(resultToJson(self.emergencySummarize(recordFromString(record))));
             })
        .def("needs_token_summarization", [](const ContextSummarizer& self, const std::string& record,
                                             std::optional<size_t> limit) {
                 return self.needsTokenSummarization(recordFromString(record), limit);
             },
             py::arg("record"), py::arg("token_limit") = py::none())
        .def("extract_key_points", &ContextSummarizer::extractKeyPoints,
             py::arg("text"), py::arg("max_length") = py::none())
        .def_static("estimate_tokens", py::overload_cast<size_t>(&ContextSummarizer::estimateTokens));
}
