#pragma once

#include "common/time.hpp"
#include "graph/context_node.hpp"

#include <json/json.h>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ctxgraph {

enum class ContextLevel { Global, Project, Agent, Task, Generic };

const char* toString(ContextLevel level);
/// Unknown names map to Generic.
ContextLevel parseContextLevel(const std::string& name);

/// A context as handed to the compression engine: identity, level,
/// creation time, free-form metadata and the compressible `data`.
struct ContextRecord {
    std::string id;
    ContextLevel level = ContextLevel::Generic;
    std::optional<std::string> parent_id;
    TimePoint created_at{};
    Json::Value metadata{Json::objectValue};
    Json::Value data;

    /// { id, level, parentId?, metadata: { createdAt (epoch ms), ... }, data }
    Json::Value toJson() const;

    /// Inverse of toJson(). Throws ValidationError on a malformed document.
    static ContextRecord fromJson(const Json::Value& doc);

    static ContextRecord fromNode(const ContextNode& node, ContextLevel level);
};

// ─── Typed payloads ────────────────────────────────────────────
// One strongly-typed view per context level. The summarizer
// dispatches on the variant instead of probing dictionaries.

enum class TaskStatus {
    Pending, Assigned, Running, InProgress, Completed, Failed, Blocked, Cancelled
};

const char* toString(TaskStatus status);
/// Throws ValidationError for names outside the task status set.
TaskStatus parseTaskStatus(const std::string& name);

struct AgentPayload {
    std::string agent_id;
    std::string agent_type;
    Json::Value state;                       // object or null
    Json::Value history;                     // array or null
    std::optional<std::vector<std::string>> capabilities;
};

struct TaskPayload {
    std::string task_id;
    std::string task_type;
    TaskStatus status = TaskStatus::Pending;
    std::optional<double> progress;
    Json::Value input;
    Json::Value output;
    std::optional<std::string> error;
};

struct ProjectPayload {
    std::string project_name;
    std::string project_path;
    Json::Value config;                      // object or null
    Json::Value shared_state;                // object or null
    std::vector<std::string> active_agents;
};

/// Global contexts are never compressed; the data is carried as is.
struct GlobalPayload {
    Json::Value data;
};

struct GenericPayload {
    Json::Value data;
};

using TypedPayload =
    std::variant<AgentPayload, TaskPayload, ProjectPayload, GlobalPayload, GenericPayload>;

/// Validate `data` against the shape required for `level`.
/// Throws ValidationError naming the offending field.
TypedPayload parsePayload(ContextLevel level, const Json::Value& data);

} // namespace ctxgraph
