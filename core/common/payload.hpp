#pragma once

#include <json/json.h>

#include <cstddef>
#include <string>
#include <vector>

namespace ctxgraph {

// Payloads are plain JSON trees. Their "size" is always the byte
// length of the compact serialization.

std::string toCompactString(const Json::Value& value);
size_t serializedSize(const Json::Value& value);

/// Parse a JSON document. Throws SerializationError with `what` in the
/// message when the text is not valid JSON.
Json::Value parseJson(const std::string& text, const std::string& what = "document");

/// Read a string array. Throws ValidationError when `value` is not an
/// array of strings.
std::vector<std::string> toStringList(const Json::Value& value, const std::string& field);

Json::Value fromStringList(const std::vector<std::string>& values);

std::string toLower(const std::string& s);
bool containsIgnoreCase(const std::string& haystack, const std::string& needle);

} // namespace ctxgraph
