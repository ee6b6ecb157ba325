#pragma once

#include "common/time.hpp"

#include <json/json.h>

#include <cstdint>
#include <string>
#include <utility>

namespace ctxgraph {

/// A context record held by the graph. The payload is opaque to the
/// store; only the compression engine looks inside it.
struct ContextNode {
    std::string id;
    Json::Value payload;
    TimePoint created_at{};
    TimePoint last_accessed_at{};
    uint64_t access_count = 0;

    ContextNode() = default;
    ContextNode(std::string id, Json::Value payload, TimePoint now)
        : id(std::move(id)), payload(std::move(payload)),
          created_at(now), last_accessed_at(now) {}

    Json::Value getField(const std::string& key,
                         const Json::Value& default_val = Json::Value()) const {
        if (!payload.isObject()) return default_val;
        return payload.get(key, default_val);
    }
};

} // namespace ctxgraph
