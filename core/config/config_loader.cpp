#include "config/config_loader.hpp"
#include "common/error.hpp"
#include "common/payload.hpp"

#include <cstdint>
#include <fstream>
#include <sstream>

namespace ctxgraph {

namespace {

std::string keyPath(const std::string& section, const std::string& key) {
    return section + "." + key;
}

const Json::Value& section(const Json::Value& doc, const char* name) {
    const Json::Value& v = doc[name];
    if (!v.isNull() && !v.isObject()) {
        throw ConfigError(std::string("Config section '") + name + "' must be an object");
    }
    return v;
}

void readDouble(const Json::Value& sec, const std::string& name, const std::string& key,
                double& out) {
    const Json::Value& v = sec[key];
    if (v.isNull()) return;
    if (!v.isNumeric()) throw ConfigError("'" + keyPath(name, key) + "' must be a number");
    out = v.asDouble();
}

void readSize(const Json::Value& sec, const std::string& name, const std::string& key,
              size_t& out) {
    const Json::Value& v = sec[key];
    if (v.isNull()) return;
    if (!v.isUInt64()) {
        throw ConfigError("'" + keyPath(name, key) + "' must be a non-negative integer");
    }
    out = static_cast<size_t>(v.asUInt64());
}

void readBool(const Json::Value& sec, const std::string& name, const std::string& key,
              bool& out) {
    const Json::Value& v = sec[key];
    if (v.isNull()) return;
    if (!v.isBool()) throw ConfigError("'" + keyPath(name, key) + "' must be a boolean");
    out = v.asBool();
}

void readStrings(const Json::Value& sec, const std::string& name, const std::string& key,
                 std::vector<std::string>& out) {
    const Json::Value& v = sec[key];
    if (v.isNull()) return;
    try {
        out = toStringList(v, keyPath(name, key));
    } catch (const ValidationError& e) {
        throw ConfigError(e.what());
    }
}

/// Calls `apply(key, weight)` for every entry of a { key: number } object.
template <typename Fn>
void readWeights(const Json::Value& sec, const std::string& name, const std::string& key,
                 Fn&& apply) {
    const Json::Value& v = sec[key];
    if (v.isNull()) return;
    if (!v.isObject()) throw ConfigError("'" + keyPath(name, key) + "' must be an object");
    for (const auto& entry : v.getMemberNames()) {
        if (!v[entry].isNumeric()) {
            throw ConfigError("'" + keyPath(name, key) + "." + entry + "' must be a number");
        }
        try {
            apply(entry, v[entry].asDouble());
        } catch (const ValidationError& e) {
            throw ConfigError(e.what());
        }
    }
}

void loadGraph(const Json::Value& sec, GraphConfig& cfg) {
    const std::string name = "graph";
    readSize(sec, name, "maxTraversalDepth", cfg.max_traversal_depth);
    readDouble(sec, name, "defaultEdgeWeight", cfg.default_edge_weight);
    readDouble(sec, name, "impactDecayFactor", cfg.impact_decay_factor);

    if (cfg.default_edge_weight <= 0.0 || cfg.default_edge_weight > 1.0) {
        throw ConfigError("'graph.defaultEdgeWeight' must be in (0, 1]");
    }
    if (cfg.impact_decay_factor <= 0.0 || cfg.impact_decay_factor > 1.0) {
        throw ConfigError("'graph.impactDecayFactor' must be in (0, 1]");
    }
}

void loadAnalyzer(const Json::Value& sec, AnalyzerConfig& cfg) {
    const std::string name = "analyzer";
    readWeights(sec, name, "relationshipImportance", [&](const std::string& type, double w) {
        cfg.relationship_importance.set(type, w);
    });

    readStrings(sec, name, "dependencyTypes", cfg.dependency_options.relationship_types);
    if (!sec["dependencyMaxDepth"].isNull()) {
        size_t depth = 0;
        readSize(sec, name, "dependencyMaxDepth", depth);
        cfg.dependency_options.max_depth = depth;
    }
    readBool(sec, name, "transitive", cfg.dependency_options.transitive);

    readStrings(sec, name, "impactTypes", cfg.impact_options.relationship_types);
    readSize(sec, name, "impactMaxDistance", cfg.impact_options.max_distance);
    readDouble(sec, name, "impactThreshold", cfg.impact_options.impact_threshold);
}

void loadLevels(const Json::Value& sec, CompressionPolicy& policy) {
    const Json::Value& levels = sec["levels"];
    if (levels.isNull()) return;
    if (!levels.isObject()) throw ConfigError("'summarizer.levels' must be an object");

    for (const auto& level_name : levels.getMemberNames()) {
        CompressionLevel level;
        try {
            level = parseCompressionLevel(level_name);
        } catch (const ValidationError& e) {
            throw ConfigError(e.what());
        }
        const Json::Value& entry = levels[level_name];
        if (!entry.isObject()) {
            throw ConfigError("'summarizer.levels." + level_name + "' must be an object");
        }
        LevelSettings& settings = policy.levels[level];
        const std::string path = "summarizer.levels." + level_name;
        readDouble(entry, path, "threshold", settings.threshold);
        readDouble(entry, path, "preserveRatio", settings.preserve_ratio);
    }
}

void loadSummarizer(const Json::Value& sec, SummarizerConfig& cfg) {
    const std::string name = "summarizer";
    CompressionPolicy& policy = cfg.policy;

    if (!sec["level"].isNull()) {
        if (!sec["level"].isString()) throw ConfigError("'summarizer.level' must be a string");
        try {
            policy.default_level = parseCompressionLevel(sec["level"].asString());
        } catch (const ValidationError& e) {
            throw ConfigError(e.what());
        }
    }
    if (!sec["ageThresholdMs"].isNull()) {
        size_t ms = 0;
        readSize(sec, name, "ageThresholdMs", ms);
        policy.age_threshold = std::chrono::milliseconds(static_cast<int64_t>(ms));
    }
    loadLevels(sec, policy);
    readStrings(sec, name, "preserveKeys", policy.preserve_keys);
    readSize(sec, name, "maxSummaryLength", policy.max_summary_length);
    readSize(sec, name, "longStringThreshold", policy.long_string_threshold);

    readWeights(sec, name, "importanceWeights", [&](const std::string& key, double w) {
        cfg.smart_weights.set(key, w);
    });
    readWeights(sec, name, "graphBaseWeights", [&](const std::string& key, double w) {
        cfg.graph_base_weights.set(key, w);
    });

    readBool(sec, name, "useGraphAnalysis", cfg.use_graph_analysis);
    readBool(sec, name, "forceGraphAnalysis", cfg.force_graph_analysis);
    readSize(sec, name, "batchChunkSize", cfg.batch_chunk_size);
    readSize(sec, name, "defaultTargetTokens", cfg.default_target_tokens);
    readSize(sec, name, "batchTargetTokens", cfg.batch_target_tokens);
    readSize(sec, name, "tokenLimit", cfg.token_limit);
    readDouble(sec, name, "tokenLimitFraction", cfg.token_limit_fraction);

    try {
        policy.validate();
    } catch (const ValidationError& e) {
        throw ConfigError(e.what());
    }
    if (cfg.batch_chunk_size == 0) throw ConfigError("'summarizer.batchChunkSize' must be positive");
    if (cfg.token_limit_fraction <= 0.0 || cfg.token_limit_fraction > 1.0) {
        throw ConfigError("'summarizer.tokenLimitFraction' must be in (0, 1]");
    }
}

} // namespace

LibraryConfig ConfigLoader::fromJson(const Json::Value& doc) {
    if (!doc.isObject()) throw ConfigError("Config document must be a JSON object");

    LibraryConfig config;
    loadGraph(section(doc, "graph"), config.graph);
    loadAnalyzer(section(doc, "analyzer"), config.analyzer);
    loadSummarizer(section(doc, "summarizer"), config.summarizer);
    return config;
}

LibraryConfig ConfigLoader::fromString(const std::string& text) {
    Json::Value doc;
    try {
        doc = parseJson(text, "config");
    } catch (const SerializationError& e) {
        throw ConfigError(e.what());
    }
    return fromJson(doc);
}

LibraryConfig ConfigLoader::fromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigError("Cannot open config file " + path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return fromString(buffer.str());
}

} // namespace ctxgraph
