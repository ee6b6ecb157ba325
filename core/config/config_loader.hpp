#pragma once

#include "analysis/graph_analyzer.hpp"
#include "compression/context_summarizer.hpp"
#include "graph/context_graph.hpp"

#include <json/json.h>

#include <string>

namespace ctxgraph {

/// Every tunable of the library in one place.
struct LibraryConfig {
    GraphConfig graph;
    AnalyzerConfig analyzer;
    SummarizerConfig summarizer;
};

// ─── ConfigLoader ──────────────────────────────────────────────
// Reads a JSON document with optional sections:
//
//   {
//     "graph":      { "maxTraversalDepth": 10, "defaultEdgeWeight": 1.0,
//                     "impactDecayFactor": 0.8 },
//     "analyzer":   { "relationshipImportance": { "parent": 1.0, ... },
//                     "dependencyTypes": [...], "dependencyMaxDepth": 5,
//                     "transitive": true, "impactTypes": [...],
//                     "impactMaxDistance": 3, "impactThreshold": 0.1 },
//     "summarizer": { "level": "medium", "ageThresholdMs": 1800000,
//                     "levels": { "high": { "threshold": 0.7, "preserveRatio": 0.2 } },
//                     "preserveKeys": [...], "maxSummaryLength": 1000,
//                     "longStringThreshold": 1000, "importanceWeights": { ... },
//                     "graphBaseWeights": { ... }, "useGraphAnalysis": true,
//                     "forceGraphAnalysis": false, "batchChunkSize": 3,
//                     "defaultTargetTokens": 20000, "batchTargetTokens": 5000,
//                     "tokenLimit": 25000, "tokenLimitFraction": 0.8 }
//   }
//
// Absent keys keep their defaults. Any malformed value raises
// ConfigError naming the offending key.

class ConfigLoader {
public:
    static LibraryConfig fromJson(const Json::Value& doc);
    static LibraryConfig fromString(const std::string& text);
    static LibraryConfig fromFile(const std::string& path);
};

} // namespace ctxgraph
