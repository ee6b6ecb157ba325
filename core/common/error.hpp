#pragma once

#include <stdexcept>
#include <string>

namespace ctxgraph {

// ─── Error ─────────────────────────────────────────────────────
// Base class for every error raised by the library. The code lets
// callers branch without a chain of catch clauses.

class Error : public std::runtime_error {
public:
    enum class Code {
        NodeNotFound,
        Validation,
        Adapter,
        Config,
        Serialization
    };

    Error(const std::string& message, Code code)
        : std::runtime_error(message), code_(code) {}

    Code code() const { return code_; }

private:
    Code code_;
};

/// An edge or lookup referenced a context id that is not in the graph.
class NodeNotFound : public Error {
public:
    explicit NodeNotFound(const std::string& context_id)
        : Error("Context node not found: " + context_id, Code::NodeNotFound),
          context_id_(context_id) {}

    const std::string& contextId() const { return context_id_; }

private:
    std::string context_id_;
};

/// Malformed input: empty relationship type, weight out of range,
/// a record whose shape does not match its context level.
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message)
        : Error(message, Code::Validation) {}
};

/// Raised by persistent graph adapters.
class AdapterError : public Error {
public:
    explicit AdapterError(const std::string& message)
        : Error(message, Code::Adapter) {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message)
        : Error(message, Code::Config) {}
};

class SerializationError : public Error {
public:
    explicit SerializationError(const std::string& message)
        : Error(message, Code::Serialization) {}
};

} // namespace ctxgraph
