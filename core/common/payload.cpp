#include "common/payload.hpp"
#include "common/error.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <sstream>

namespace ctxgraph {

std::string toCompactString(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

size_t serializedSize(const Json::Value& value) {
    return toCompactString(value).size();
}

Json::Value parseJson(const std::string& text, const std::string& what) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        throw SerializationError("Failed to parse " + what + ": " + errors);
    }
    return root;
}

std::vector<std::string> toStringList(const Json::Value& value, const std::string& field) {
    if (!value.isArray()) {
        throw ValidationError("Field '" + field + "' must be an array of strings");
    }
    std::vector<std::string> out;
    out.reserve(value.size());
    for (const auto& item : value) {
        if (!item.isString()) {
            throw ValidationError("Field '" + field + "' must be an array of strings");
        }
        out.push_back(item.asString());
    }
    return out;
}

Json::Value fromStringList(const std::vector<std::string>& values) {
    Json::Value arr(Json::arrayValue);
    for (const auto& v : values) arr.append(v);
    return arr;
}

std::string toLower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    return toLower(haystack).find(toLower(needle)) != std::string::npos;
}

} // namespace ctxgraph
