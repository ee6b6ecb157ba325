#pragma once

#include "common/time.hpp"

#include <json/json.h>

#include <cstdint>
#include <string>
#include <utility>

namespace ctxgraph {

/// Handle into the graph's edge table. Edges refer to nodes by id,
/// never by pointer.
using EdgeHandle = uint64_t;

/// A directed, typed, weighted relationship between two contexts.
/// Several edges of different types may join the same pair.
struct Edge {
    EdgeHandle id = 0;
    std::string from;
    std::string to;
    std::string relationship_type;
    double weight = 1.0;          // (0, 1]
    Json::Value metadata;
    TimePoint created_at{};

    Edge() = default;
    Edge(std::string from, std::string to, std::string rel_type, double weight = 1.0)
        : from(std::move(from)), to(std::move(to)),
          relationship_type(std::move(rel_type)), weight(weight) {}
};

} // namespace ctxgraph
