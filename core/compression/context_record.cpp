#include "compression/context_record.hpp"
#include "common/error.hpp"
#include "common/payload.hpp"

namespace ctxgraph {

const char* toString(ContextLevel level) {
    switch (level) {
        case ContextLevel::Global:  return "global";
        case ContextLevel::Project: return "project";
        case ContextLevel::Agent:   return "agent";
        case ContextLevel::Task:    return "task";
        case ContextLevel::Generic: return "generic";
    }
    return "generic";
}

ContextLevel parseContextLevel(const std::string& name) {
    if (name == "global")  return ContextLevel::Global;
    if (name == "project") return ContextLevel::Project;
    if (name == "agent")   return ContextLevel::Agent;
    if (name == "task")    return ContextLevel::Task;
    return ContextLevel::Generic;
}

// ─── ContextRecord ─────────────────────────────────────────────

Json::Value ContextRecord::toJson() const {
    Json::Value doc(Json::objectValue);
    doc["id"] = id;
    doc["level"] = toString(level);
    if (parent_id) doc["parentId"] = *parent_id;
    Json::Value meta = metadata.isObject() ? metadata : Json::Value(Json::objectValue);
    meta["createdAt"] = static_cast<Json::Int64>(toEpochMillis(created_at));
    doc["metadata"] = meta;
    doc["data"] = data;
    return doc;
}

ContextRecord ContextRecord::fromJson(const Json::Value& doc) {
    if (!doc.isObject()) throw ValidationError("Context record must be an object");
    if (!doc["id"].isString()) throw ValidationError("Context record requires a string 'id'");

    ContextRecord record;
    record.id = doc["id"].asString();
    if (doc.isMember("level")) {
        if (!doc["level"].isString()) throw ValidationError("Field 'level' must be a string");
        record.level = parseContextLevel(doc["level"].asString());
    }
    if (doc.isMember("parentId") && !doc["parentId"].isNull()) {
        if (!doc["parentId"].isString()) throw ValidationError("Field 'parentId' must be a string");
        record.parent_id = doc["parentId"].asString();
    }

    const Json::Value& meta = doc["metadata"];
    if (!meta.isObject() || !meta["createdAt"].isIntegral()) {
        throw ValidationError("Context record requires integer 'metadata.createdAt' (epoch ms)");
    }
    record.created_at = fromEpochMillis(meta["createdAt"].asInt64());
    record.metadata = meta;
    record.metadata.removeMember("createdAt");
    record.data = doc["data"];
    return record;
}

ContextRecord ContextRecord::fromNode(const ContextNode& node, ContextLevel level) {
    ContextRecord record;
    record.id = node.id;
    record.level = level;
    record.created_at = node.created_at;
    record.data = node.payload;
    return record;
}

// ─── Task status ───────────────────────────────────────────────

const char* toString(TaskStatus status) {
    switch (status) {
        case TaskStatus::Pending:    return "pending";
        case TaskStatus::Assigned:   return "assigned";
        case TaskStatus::Running:    return "running";
        case TaskStatus::InProgress: return "in-progress";
        case TaskStatus::Completed:  return "completed";
        case TaskStatus::Failed:     return "failed";
        case TaskStatus::Blocked:    return "blocked";
        case TaskStatus::Cancelled:  return "cancelled";
    }
    return "pending";
}

TaskStatus parseTaskStatus(const std::string& name) {
    if (name == "pending")     return TaskStatus::Pending;
    if (name == "assigned")    return TaskStatus::Assigned;
    if (name == "running")     return TaskStatus::Running;
    if (name == "in-progress") return TaskStatus::InProgress;
    if (name == "completed")   return TaskStatus::Completed;
    if (name == "failed")      return TaskStatus::Failed;
    if (name == "blocked")     return TaskStatus::Blocked;
    if (name == "cancelled")   return TaskStatus::Cancelled;
    throw ValidationError("Unknown task status: " + name);
}

// ─── Payload parsing ───────────────────────────────────────────

namespace {

std::string requireString(const Json::Value& data, const char* field, ContextLevel level) {
    const Json::Value& v = data[field];
    if (!v.isString()) {
        throw ValidationError(std::string(toString(level)) + " context requires string field '" +
                              field + "'");
    }
    return v.asString();
}

Json::Value optionalObject(const Json::Value& data, const char* field) {
    const Json::Value& v = data[field];
    if (v.isNull()) return Json::Value();
    if (!v.isObject()) {
        throw ValidationError(std::string("Field '") + field + "' must be an object");
    }
    return v;
}

AgentPayload parseAgent(const Json::Value& data) {
    AgentPayload p;
    p.agent_id = requireString(data, "agentId", ContextLevel::Agent);
    p.agent_type = requireString(data, "agentType", ContextLevel::Agent);
    p.state = optionalObject(data, "state");
    if (!data["history"].isNull()) {
        if (!data["history"].isArray()) throw ValidationError("Field 'history' must be an array");
        p.history = data["history"];
    }
    if (!data["capabilities"].isNull()) {
        p.capabilities = toStringList(data["capabilities"], "capabilities");
    }
    return p;
}

TaskPayload parseTask(const Json::Value& data) {
    TaskPayload p;
    p.task_id = requireString(data, "taskId", ContextLevel::Task);
    p.task_type = requireString(data, "taskType", ContextLevel::Task);
    p.status = parseTaskStatus(requireString(data, "status", ContextLevel::Task));
    if (!data["progress"].isNull()) {
        if (!data["progress"].isNumeric()) throw ValidationError("Field 'progress' must be numeric");
        p.progress = data["progress"].asDouble();
    }
    p.input = data["input"];
    p.output = data["output"];
    if (!data["error"].isNull()) {
        if (!data["error"].isString()) throw ValidationError("Field 'error' must be a string");
        p.error = data["error"].asString();
    }
    return p;
}

ProjectPayload parseProject(const Json::Value& data) {
    ProjectPayload p;
    p.project_name = requireString(data, "projectName", ContextLevel::Project);
    p.project_path = requireString(data, "projectPath", ContextLevel::Project);
    p.config = optionalObject(data, "config");
    p.shared_state = optionalObject(data, "sharedState");
    if (!data["activeAgents"].isNull()) {
        p.active_agents = toStringList(data["activeAgents"], "activeAgents");
    }
    return p;
}

} // namespace

TypedPayload parsePayload(ContextLevel level, const Json::Value& data) {
    if (level != ContextLevel::Generic && !data.isObject()) {
        throw ValidationError(std::string(toString(level)) + " context data must be an object");
    }
    switch (level) {
        case ContextLevel::Agent:   return parseAgent(data);
        case ContextLevel::Task:    return parseTask(data);
        case ContextLevel::Project: return parseProject(data);
        case ContextLevel::Global:  return GlobalPayload{data};
        case ContextLevel::Generic: return GenericPayload{data};
    }
    return GenericPayload{data};
}

} // namespace ctxgraph
