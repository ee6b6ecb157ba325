#pragma once

#include <json/json.h>

#include <cstddef>
#include <string>

namespace ctxgraph {

/// Keep the head and tail halves of `text` around an inline marker:
///   <head>...[N chars omitted]...<tail>
/// Lengths are in bytes; each half is cut on a UTF-8 character boundary
/// and N counts the characters dropped between them. Text no longer than
/// `max_length` is returned as is.
std::string extractKeyPoints(const std::string& text, size_t max_length);

/// The longest prefix of `text` of at most `max_bytes` bytes that does
/// not split a UTF-8 sequence.
std::string utf8Prefix(const std::string& text, size_t max_bytes);

/// Apply extractKeyPoints to every string (at any depth) longer than
/// `max_length`, unless the marker would make it longer. Object keys and
/// non-string values are untouched.
Json::Value truncateLongStrings(const Json::Value& value, size_t max_length);

} // namespace ctxgraph
