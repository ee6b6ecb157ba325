#include "compression/text_truncation.hpp"

namespace ctxgraph {

namespace {

bool isContinuationByte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

} // namespace

std::string extractKeyPoints(const std::string& text, size_t max_length) {
    if (text.size() <= max_length) return text;

    size_t part = max_length / 2;
    size_t head = part;
    while (head > 0 && isContinuationByte(text[head])) --head;
    size_t tail = text.size() - part;
    while (tail < text.size() && isContinuationByte(text[tail])) ++tail;

    size_t omitted = 0;
    for (size_t i = head; i < tail; ++i) {
        if (!isContinuationByte(text[i])) ++omitted;
    }

    std::string out;
    out.reserve(head + (text.size() - tail) + 32);
    out.append(text, 0, head);
    out += "...[" + std::to_string(omitted) + " chars omitted]...";
    out.append(text, tail, std::string::npos);
    return out;
}

std::string utf8Prefix(const std::string& text, size_t max_bytes) {
    if (text.size() <= max_bytes) return text;
    size_t end = max_bytes;
    while (end > 0 && isContinuationByte(text[end])) --end;
    return text.substr(0, end);
}

Json::Value truncateLongStrings(const Json::Value& value, size_t max_length) {
    if (value.isString()) {
        const std::string text = value.asString();
        std::string shortened = extractKeyPoints(text, max_length);
        return shortened.size() < text.size() ? Json::Value(shortened) : value;
    }
    if (value.isArray()) {
        Json::Value out(Json::arrayValue);
        for (const auto& item : value) out.append(truncateLongStrings(item, max_length));
        return out;
    }
    if (value.isObject()) {
        Json::Value out(Json::objectValue);
        for (const auto& key : value.getMemberNames()) {
            out[key] = truncateLongStrings(value[key], max_length);
        }
        return out;
    }
    return value;
}

} // namespace ctxgraph
