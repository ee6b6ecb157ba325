#include <gtest/gtest.h>
#include <cstdint>
#include "common/error.hpp"
#include "common/payload.hpp"
#include "compression/context_summarizer.hpp"
#include "compression/text_truncation.hpp"

using namespace ctxgraph;

namespace {

constexpr int64_t kNow = 1700000000000;
constexpr int64_t kHour = 60 * 60 * 1000;

SummarizerConfig fixedClockConfig() {
    SummarizerConfig config;
    config.clock = [] { return fromEpochMillis(kNow); };
    return config;
}

ContextRecord makeRecord(const std::string& id, ContextLevel level, Json::Value data,
                         int64_t age_ms = kHour) {
    ContextRecord record;
    record.id = id;
    record.level = level;
    record.created_at = fromEpochMillis(kNow - age_ms);
    record.data = std::move(data);
    return record;
}

Json::Value agentData(int history_entries) {
    Json::Value data(Json::objectValue);
    data["agentId"] = "agent-7";
    data["agentType"] = "developer";
    data["state"]["status"] = "busy";
    data["state"]["currentFile"] = "src/main.cpp";
    data["capabilities"].append("code");
    data["capabilities"].append("review");
    for (int i = 0; i < history_entries; ++i) {
        Json::Value entry(Json::objectValue);
        entry["step"] = i;
        entry["action"] = "edited file number " + std::to_string(i);
        data["history"].append(entry);
    }
    return data;
}

/// Every lead byte is followed by the continuation bytes it announces.
bool validUtf8(const std::string& text) {
    size_t i = 0;
    while (i < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        size_t len = c < 0x80 ? 1 : (c >> 5) == 0x6 ? 2 : (c >> 4) == 0xE ? 3 : (c >> 3) == 0x1E ? 4 : 0;
        if (len == 0 || i + len > text.size()) return false;
        for (size_t k = 1; k < len; ++k) {
            if ((static_cast<unsigned char>(text[i + k]) & 0xC0) != 0x80) return false;
        }
        i += len;
    }
    return true;
}

} // namespace

// ─── Ratio-based ───────────────────────────────────────────────

TEST(SummarizerTest, YoungRecordIsUntouched) {
    ContextSummarizer s(fixedClockConfig());
    ContextRecord record = makeRecord("agent-7", ContextLevel::Agent, agentData(50), 5 * 60 * 1000);

    CompressionResult result = s.summarize(record, CompressionLevel::High);
    EXPECT_FALSE(result.stats.compressed);
    EXPECT_EQ(toCompactString(result.record.data), toCompactString(record.data));
    EXPECT_EQ(result.stats.original_size, result.stats.compressed_size);
    EXPECT_FALSE(result.record.metadata.isMember("summarized"));
}

TEST(SummarizerTest, HighLevelKeepsTenHistoryEntries) {
    ContextSummarizer s(fixedClockConfig());
    ContextRecord record = makeRecord("agent-7", ContextLevel::Agent, agentData(50));

    CompressionResult result = s.summarize(record, CompressionLevel::High);
    ASSERT_TRUE(result.stats.compressed);
    const Json::Value& history = result.record.data["history"];
    ASSERT_EQ(history.size(), 10u);
    EXPECT_EQ(history[0]["step"].asInt(), 0);
    EXPECT_EQ(history[1]["step"].asInt(), 1);
    EXPECT_EQ(history[2]["step"].asInt(), 42);
    EXPECT_EQ(history[9]["step"].asInt(), 49);

    const Json::Value& summary = result.record.data["historySummary"];
    EXPECT_EQ(summary["totalEntries"].asInt(), 50);
    EXPECT_EQ(summary["preserved"].asInt(), 10);
    EXPECT_TRUE(summary["summarized"].asBool());

    EXPECT_EQ(result.record.data["agentId"].asString(), "agent-7");
    EXPECT_EQ(result.record.data["capabilities"].size(), 2u);
    EXPECT_EQ(result.record.data["state"]["status"].asString(), "busy");
    EXPECT_LT(result.stats.compressed_size, result.stats.original_size);
}

TEST(SummarizerTest, MetadataDescribesSummary) {
    ContextSummarizer s(fixedClockConfig());
    ContextRecord record = makeRecord("agent-7", ContextLevel::Agent, agentData(20));
    record.metadata["owner"] = "orchestrator";

    CompressionResult result = s.summarize(record);
    const Json::Value& meta = result.record.metadata;
    EXPECT_TRUE(meta["summarized"].asBool());
    EXPECT_EQ(meta["summarizedAt"].asInt64(), kNow);
    EXPECT_EQ(meta["compressionLevel"].asString(), "medium");
    EXPECT_DOUBLE_EQ(meta["preserveRatio"].asDouble(), 0.5);
    EXPECT_EQ(meta["strategy"].asString(), "ratio");
    EXPECT_EQ(meta["originalSize"].asUInt64(), result.stats.original_size);
    EXPECT_EQ(meta["compressedSize"].asUInt64(), result.stats.compressed_size);
    EXPECT_EQ(meta["owner"].asString(), "orchestrator");
    EXPECT_EQ(result.record.data["history"].size(), 10u);
}

TEST(SummarizerTest, PreserveKeysSurviveAgentFieldList) {
    ContextSummarizer s(fixedClockConfig());
    Json::Value data = agentData(40);
    data["status"] = "degraded";
    data["error"] = "rate limited";
    data["scratchpad"] = std::string(500, 's');
    ContextRecord record = makeRecord("agent-7", ContextLevel::Agent, data);

    CompressionResult result = s.summarize(record, CompressionLevel::High);
    EXPECT_EQ(result.record.data["status"].asString(), "degraded");
    EXPECT_EQ(result.record.data["error"].asString(), "rate limited");
    EXPECT_FALSE(result.record.data.isMember("scratchpad"));
}

TEST(SummarizerTest, GenericObjectKeepsMustKeepKeys) {
    ContextSummarizer s(fixedClockConfig());
    Json::Value data(Json::objectValue);
    data["id"] = "job-1";
    data["status"] = "failed";
    data["error"] = "timeout";
    data["output"] = "partial";
    for (int i = 0; i < 10; ++i) {
        data["field" + std::to_string(i)] = std::string(50 + i * 10, 'x');
    }
    ContextRecord record = makeRecord("job-1", ContextLevel::Generic, data);

    CompressionResult result = s.summarize(record, CompressionLevel::High);
    const Json::Value& out = result.record.data;
    for (const char* key : {"id", "status", "error", "output"}) {
        EXPECT_TRUE(out.isMember(key)) << key;
    }
    // ceil(10 * 0.2) = 2 smallest of the remaining fields.
    EXPECT_TRUE(out.isMember("field0"));
    EXPECT_TRUE(out.isMember("field1"));
    EXPECT_FALSE(out.isMember("field2"));
    EXPECT_EQ(out["_summary"]["originalKeys"].asInt(), 14);
    EXPECT_EQ(out["_summary"]["preservedKeys"].asInt(), 6);
    EXPECT_EQ(out["_summary"]["droppedKeys"].asInt(), 8);
}

TEST(SummarizerTest, GenericArrayKeepsMostRecent) {
    ContextSummarizer s(fixedClockConfig());
    Json::Value data(Json::arrayValue);
    for (int i = 0; i < 10; ++i) data.append("event-" + std::to_string(i));
    ContextRecord record = makeRecord("events", ContextLevel::Generic, data);

    CompressionResult result = s.summarize(record, CompressionLevel::Medium);
    const Json::Value& out = result.record.data;
    ASSERT_EQ(out.size(), 5u);
    EXPECT_EQ(out[0].asString(), "event-5");
    EXPECT_EQ(out[4].asString(), "event-9");
}

TEST(SummarizerTest, CompletedTaskKeepsOutputAndError) {
    ContextSummarizer s(fixedClockConfig());
    Json::Value data(Json::objectValue);
    data["taskId"] = "t-1";
    data["taskType"] = "build";
    data["status"] = "completed";
    data["progress"] = 100;
    data["output"]["artifact"] = "app.bin";
    data["error"] = "warnings emitted";
    for (int i = 0; i < 8; ++i) data["input"]["arg" + std::to_string(i)] = std::string(200, 'a');
    data["input"]["id"] = "in-1";
    ContextRecord record = makeRecord("t-1", ContextLevel::Task, data);

    CompressionResult result = s.summarize(record, CompressionLevel::Low);
    const Json::Value& out = result.record.data;
    EXPECT_EQ(out["status"].asString(), "completed");
    EXPECT_DOUBLE_EQ(out["progress"].asDouble(), 100.0);
    EXPECT_EQ(out["output"]["artifact"].asString(), "app.bin");
    EXPECT_EQ(out["error"].asString(), "warnings emitted");
    // ceil(8 * 0.8) = 7 of the non-essential input keys, plus id.
    EXPECT_EQ(out["input"]["id"].asString(), "in-1");
    EXPECT_EQ(out["input"]["_summary"]["droppedKeys"].asInt(), 1);
    EXPECT_TRUE(result.stats.compressed);
    EXPECT_LT(result.stats.compressed_size, result.stats.original_size);
}

TEST(SummarizerTest, ProjectSummary) {
    ContextSummarizer s(fixedClockConfig());
    Json::Value data(Json::objectValue);
    data["projectName"] = "orbit";
    data["projectPath"] = "/srv/orbit";
    data["activeAgents"].append("agent-1");
    for (int i = 0; i < 4; ++i) data["config"]["opt" + std::to_string(i)] = std::string(20 * (i + 1), 'c');
    data["sharedState"]["status"] = "green";
    data["sharedState"]["cache"] = std::string(300, 'z');
    ContextRecord record = makeRecord("orbit", ContextLevel::Project, data);

    CompressionResult result = s.summarize(record, CompressionLevel::Medium);
    const Json::Value& out = result.record.data;
    EXPECT_EQ(out["projectName"].asString(), "orbit");
    EXPECT_EQ(out["activeAgents"].size(), 1u);
    EXPECT_TRUE(out["config"].isMember("opt0"));
    EXPECT_TRUE(out["config"].isMember("opt1"));
    EXPECT_FALSE(out["config"].isMember("opt3"));
    EXPECT_EQ(out["sharedState"]["status"].asString(), "green");
    EXPECT_TRUE(out["sharedState"].isMember("cache"));  // ceil(1 * 0.5) = 1
}

TEST(SummarizerTest, GlobalRecordsAreNeverCompressed) {
    ContextSummarizer s(fixedClockConfig());
    Json::Value data(Json::objectValue);
    for (int i = 0; i < 20; ++i) data["k" + std::to_string(i)] = std::string(100, 'g');
    ContextRecord record = makeRecord("global", ContextLevel::Global, data);

    CompressionResult result = s.summarize(record, CompressionLevel::High);
    EXPECT_FALSE(result.stats.compressed);
    EXPECT_EQ(toCompactString(result.record.data), toCompactString(data));
}

TEST(SummarizerTest, MalformedRecordsRejected) {
    ContextSummarizer s(fixedClockConfig());

    Json::Value agent = agentData(3);
    agent.removeMember("agentId");
    EXPECT_THROW(s.summarize(makeRecord("a", ContextLevel::Agent, agent)), ValidationError);

    Json::Value task(Json::objectValue);
    task["taskId"] = "t";
    task["taskType"] = "build";
    task["status"] = "exploded";
    EXPECT_THROW(s.summarize(makeRecord("t", ContextLevel::Task, task)), ValidationError);

    Json::Value project(Json::objectValue);
    project["projectName"] = "p";
    project["projectPath"] = ".";
    project["activeAgents"] = "agent-1";
    EXPECT_THROW(s.summarize(makeRecord("p", ContextLevel::Project, project)), ValidationError);

    // Validation runs before the age gate.
    EXPECT_THROW(s.summarize(makeRecord("a", ContextLevel::Agent, agent, 1000)), ValidationError);
    EXPECT_THROW(s.summarize(makeRecord("a", ContextLevel::Agent, Json::Value("text"))),
                 ValidationError);
}

TEST(SummarizerTest, NeverGrowsPayload) {
    ContextSummarizer s(fixedClockConfig());
    Json::Value data(Json::objectValue);
    data["a"] = 1;
    data["b"] = 2;
    ContextRecord record = makeRecord("tiny", ContextLevel::Generic, data);

    // Dropping one key and adding a _summary would grow this record.
    CompressionResult result = s.summarize(record, CompressionLevel::High);
    EXPECT_FALSE(result.stats.compressed);
    EXPECT_EQ(result.stats.compressed_size, result.stats.original_size);
    EXPECT_DOUBLE_EQ(result.stats.compression_ratio, 1.0);
    EXPECT_EQ(toCompactString(result.record.data), toCompactString(data));
    EXPECT_FALSE(result.record.metadata.isMember("summarized"));
    EXPECT_FALSE(result.record.metadata.isMember("strategy"));
}

TEST(SummarizerTest, InvalidPolicyRejected) {
    SummarizerConfig config;
    config.policy.levels[CompressionLevel::High].preserve_ratio = 0.0;
    EXPECT_THROW(ContextSummarizer s(config), ValidationError);

    SummarizerConfig fraction;
    fraction.token_limit_fraction = 1.5;
    EXPECT_THROW(ContextSummarizer s(fraction), ValidationError);
}

// ─── Key preservation helper ───────────────────────────────────

TEST(SummarizerTest, PreserveImportantKeysPrefersSmallValues) {
    ContextSummarizer s;
    Json::Value obj(Json::objectValue);
    obj["id"] = 1;
    obj["a"] = "x";
    obj["bb"] = "yyyy";
    obj["ccc"] = "zzzzzzzz";
    obj["d"] = std::string(100, 'w');

    Json::Value out = s.preserveImportantKeys(obj, 0.5);
    EXPECT_TRUE(out.isMember("id"));
    EXPECT_TRUE(out.isMember("a"));
    EXPECT_TRUE(out.isMember("bb"));
    EXPECT_FALSE(out.isMember("ccc"));
    EXPECT_FALSE(out.isMember("d"));
    EXPECT_EQ(out["_summary"]["originalKeys"].asInt(), 5);
    EXPECT_EQ(out["_summary"]["preservedKeys"].asInt(), 3);
    EXPECT_EQ(out["_summary"]["droppedKeys"].asInt(), 2);

    EXPECT_FALSE(s.preserveImportantKeys(obj, 1.0).isMember("_summary"));
    EXPECT_EQ(s.preserveImportantKeys(Json::Value(42), 0.1).asInt(), 42);
}

// ─── Text truncation ───────────────────────────────────────────

TEST(TextTruncationTest, ExtractKeyPoints) {
    EXPECT_EQ(extractKeyPoints("abcdefghij", 4), "ab...[6 chars omitted]...ij");
    EXPECT_EQ(extractKeyPoints("short", 10), "short");
    EXPECT_EQ(extractKeyPoints("", 0), "");

    ContextSummarizer s;
    std::string text(2500, 'q');
    std::string out = s.extractKeyPoints(text);
    EXPECT_NE(out.find("...[1500 chars omitted]..."), std::string::npos);
    EXPECT_EQ(out.size(), 1000u + std::string("...[1500 chars omitted]...").size());
}

TEST(TextTruncationTest, ExtractKeyPointsKeepsCharactersWhole) {
    std::string e_acute = "\xC3\xA9";
    std::string text;
    for (int i = 0; i < 1500; ++i) text += e_acute;

    // 501 bytes per half would split a two-byte character on both sides.
    std::string head, tail;
    for (int i = 0; i < 250; ++i) head += e_acute;
    tail = head;
    EXPECT_EQ(extractKeyPoints(text, 1003), head + "...[1000 chars omitted]..." + tail);
    EXPECT_TRUE(validUtf8(extractKeyPoints(text, 7)));
}

TEST(TextTruncationTest, Utf8Prefix) {
    std::string euro = "\xE2\x82\xAC";
    EXPECT_EQ(utf8Prefix("abcdef", 4), "abcd");
    EXPECT_EQ(utf8Prefix("ab", 4), "ab");
    EXPECT_EQ(utf8Prefix(euro + euro, 5), euro);
    EXPECT_EQ(utf8Prefix(euro, 2), "");
    EXPECT_EQ(utf8Prefix("a" + euro, 4), "a" + euro);
}

TEST(TextTruncationTest, TruncateTextRecord) {
    ContextSummarizer s(fixedClockConfig());
    Json::Value data(Json::objectValue);
    data["log"] = std::string(1500, 'l') + std::string(1500, 'm');
    data["nested"]["note"] = std::string(3000, 'n');
    data["nested"]["count"] = 7;
    data["name"] = "kept";
    ContextRecord record = makeRecord("txt", ContextLevel::Generic, data);

    CompressionResult result = s.truncateText(record, 1000);
    const Json::Value& out = result.record.data;
    std::string log = out["log"].asString();
    EXPECT_EQ(log.substr(0, 500), std::string(500, 'l'));
    EXPECT_EQ(log.substr(log.size() - 500), std::string(500, 'm'));
    EXPECT_NE(log.find("[2000 chars omitted]"), std::string::npos);
    EXPECT_LT(out["nested"]["note"].asString().size(), 3000u);
    EXPECT_EQ(out["nested"]["count"].asInt(), 7);
    EXPECT_EQ(out["name"].asString(), "kept");
    EXPECT_EQ(result.stats.strategy, CompressionStrategy::TextTruncation);
    EXPECT_TRUE(result.record.metadata["truncated"].asBool());
}

TEST(TextTruncationTest, SlightlyLongStringsKept) {
    // The marker would make a 1001-char string longer than it was.
    Json::Value v(std::string(1001, 'k'));
    EXPECT_EQ(truncateLongStrings(v, 1000).asString().size(), 1001u);
}

// ─── Emergency ─────────────────────────────────────────────────

TEST(EmergencyTest, AgentMinimalState) {
    ContextSummarizer s(fixedClockConfig());
    Json::Value data = agentData(30);
    data["state"]["progress"] = 40;
    data["output"]["result"] = "ok";
    data["output"]["blob"] = std::string(2000, 'b');
    ContextRecord record = makeRecord("agent-7", ContextLevel::Agent, data);

    CompressionResult result = s.emergencySummarize(record);
    const Json::Value& out = result.record.data;
    EXPECT_EQ(out["agentId"].asString(), "agent-7");
    EXPECT_EQ(out["agentType"].asString(), "developer");
    EXPECT_EQ(out["state"]["status"].asString(), "busy");
    EXPECT_EQ(out["state"]["progress"].asInt(), 40);
    EXPECT_FALSE(out["state"].isMember("currentFile"));
    EXPECT_EQ(out["output"]["result"].asString(), "ok");
    ASSERT_EQ(out["history"].size(), 1u);
    EXPECT_EQ(out["history"][0]["action"].asString(), "emergency_summarization");
    EXPECT_EQ(out["history"][0]["timestamp"].asString(), toIsoString(fromEpochMillis(kNow)));
    EXPECT_EQ(out["capabilities"].size(), 2u);

    EXPECT_TRUE(result.record.metadata["emergencySummarized"].asBool());
    EXPECT_EQ(result.stats.strategy, CompressionStrategy::Emergency);
    EXPECT_LT(result.stats.compressed_size, result.stats.original_size);
}

TEST(EmergencyTest, TaskKeepsStatusErrorAndTruncatedOutput) {
    ContextSummarizer s(fixedClockConfig());
    Json::Value data(Json::objectValue);
    data["taskId"] = "t-9";
    data["taskType"] = "deploy";
    data["status"] = "failed";
    data["error"] = "boom";
    data["input"]["manifest"] = std::string(800, 'i');
    data["output"] = std::string(1200, 'o');
    ContextRecord record = makeRecord("t-9", ContextLevel::Task, data);

    const Json::Value out = s.emergencySummarize(record).record.data;
    EXPECT_EQ(out["taskId"].asString(), "t-9");
    EXPECT_EQ(out["status"].asString(), "failed");
    EXPECT_EQ(out["error"].asString(), "boom");
    EXPECT_EQ(out["input"]["summary"].asString(), "Emergency summarized input");
    EXPECT_NE(out["output"].asString().find("chars omitted"), std::string::npos);
    EXPECT_EQ(out["progress"].asInt(), 0);
}

TEST(EmergencyTest, AgentTextOutputCutOnCharacterBoundary) {
    ContextSummarizer s(fixedClockConfig());
    Json::Value data = agentData(30);
    std::string text;
    for (int i = 0; i < 300; ++i) text += "\xC3\xA9";
    data["output"] = text;
    ContextRecord record = makeRecord("agent-7", ContextLevel::Agent, data);

    CompressionResult result = s.emergencySummarize(record);
    ASSERT_TRUE(result.stats.compressed);
    std::string kept = result.record.data["output"]["result"].asString();
    EXPECT_EQ(kept, text.substr(0, 200));
    EXPECT_TRUE(validUtf8(kept));
}

TEST(EmergencyTest, TinyAgentIsLeftAlone) {
    ContextSummarizer s(fixedClockConfig());
    Json::Value data(Json::objectValue);
    data["agentId"] = "a";
    data["agentType"] = "t";
    ContextRecord record = makeRecord("a", ContextLevel::Agent, data);

    // The emergency skeleton (state, history entry) is bigger than this record.
    CompressionResult result = s.emergencySummarize(record);
    EXPECT_FALSE(result.stats.compressed);
    EXPECT_EQ(result.stats.strategy, CompressionStrategy::Emergency);
    EXPECT_EQ(toCompactString(result.record.data), toCompactString(data));
    EXPECT_FALSE(result.record.metadata.isMember("emergencySummarized"));
}

TEST(EmergencyTest, ProjectAndGeneric) {
    ContextSummarizer s(fixedClockConfig());

    Json::Value project(Json::objectValue);
    project["projectName"] = "orbit";
    project["config"]["big"] = std::string(500, 'c');
    Json::Value p = s.emergencySummarize(makeRecord("p", ContextLevel::Project, project)).record.data;
    EXPECT_EQ(p["projectName"].asString(), "orbit");
    EXPECT_EQ(p["projectPath"].asString(), ".");
    EXPECT_TRUE(p["config"]["emergency"].asBool());

    Json::Value generic(Json::objectValue);
    generic["error"] = "disk full";
    generic["blob"] = std::string(500, 'x');
    Json::Value g = s.emergencySummarize(makeRecord("g", ContextLevel::Generic, generic)).record.data;
    EXPECT_EQ(g["criticalData"].asString(), "disk full");
    EXPECT_EQ(g["originalLevel"].asString(), "generic");
}

// ─── Budget helpers ────────────────────────────────────────────

TEST(BudgetTest, EstimateTokens) {
    EXPECT_EQ(ContextSummarizer::estimateTokens(0u), 0u);
    EXPECT_EQ(ContextSummarizer::estimateTokens(4u), 1u);
    EXPECT_EQ(ContextSummarizer::estimateTokens(10u), 3u);
}

TEST(BudgetTest, CompressionLevelFromSize) {
    EXPECT_EQ(ContextSummarizer::calculateCompressionLevel(40, 100), CompressionLevel::Low);
    EXPECT_EQ(ContextSummarizer::calculateCompressionLevel(50, 100), CompressionLevel::Medium);
    EXPECT_EQ(ContextSummarizer::calculateCompressionLevel(79, 100), CompressionLevel::Medium);
    EXPECT_EQ(ContextSummarizer::calculateCompressionLevel(80, 100), CompressionLevel::High);
    EXPECT_EQ(ContextSummarizer::calculateCompressionLevel(10, 0), CompressionLevel::High);
}

TEST(BudgetTest, NeedsTokenSummarization) {
    ContextSummarizer s(fixedClockConfig());
    Json::Value big(Json::objectValue);
    big["blob"] = std::string(90000, 'b');
    ContextRecord large = makeRecord("big", ContextLevel::Generic, big);
    EXPECT_TRUE(s.needsTokenSummarization(large));       // ~22.5k tokens > 20k
    EXPECT_FALSE(s.needsTokenSummarization(large, 50000));

    ContextRecord small = makeRecord("small", ContextLevel::Generic, Json::Value("hi"));
    EXPECT_FALSE(s.needsTokenSummarization(small));
}

TEST(PolicyTest, LevelNames) {
    EXPECT_EQ(parseCompressionLevel("high"), CompressionLevel::High);
    EXPECT_STREQ(toString(CompressionLevel::Low), "low");
    EXPECT_THROW(parseCompressionLevel("extreme"), ValidationError);
}

TEST(PolicyTest, WeightLookup) {
    ImportanceWeightTable table = ImportanceWeightTable::smartDefaults();
    EXPECT_DOUBLE_EQ(table.lookup("history"), 0.3);
    EXPECT_DOUBLE_EQ(table.lookup("errorDetails"), 1.0);     // substring of "error"
    EXPECT_DOUBLE_EQ(table.lookup("debugLogs"), 0.2);        // substring of "logs"
    EXPECT_DOUBLE_EQ(table.lookup("notes"), 0.5);
    EXPECT_THROW(table.set("x", 2.0), ValidationError);
}

// ─── Records ───────────────────────────────────────────────────

TEST(ContextRecordTest, JsonRoundTrip) {
    ContextRecord record = makeRecord("t-1", ContextLevel::Task, Json::Value("payload"));
    record.parent_id = "p-1";
    record.metadata["owner"] = "qa";

    Json::Value doc = record.toJson();
    EXPECT_EQ(doc["level"].asString(), "task");
    EXPECT_EQ(doc["metadata"]["createdAt"].asInt64(), kNow - kHour);

    ContextRecord back = ContextRecord::fromJson(doc);
    EXPECT_EQ(back.id, "t-1");
    EXPECT_EQ(back.level, ContextLevel::Task);
    ASSERT_TRUE(back.parent_id.has_value());
    EXPECT_EQ(*back.parent_id, "p-1");
    EXPECT_EQ(toEpochMillis(back.created_at), kNow - kHour);
    EXPECT_EQ(back.metadata["owner"].asString(), "qa");
    EXPECT_FALSE(back.metadata.isMember("createdAt"));
    EXPECT_EQ(back.data.asString(), "payload");
}

TEST(ContextRecordTest, RejectsMalformed) {
    EXPECT_THROW(ContextRecord::fromJson(Json::Value(3)), ValidationError);
    EXPECT_THROW(ContextRecord::fromJson(parseJson(R"({"id": "x"})")), ValidationError);
    EXPECT_THROW(ContextRecord::fromJson(parseJson(R"({"metadata": {"createdAt": 1}})")),
                 ValidationError);
    EXPECT_EQ(parseContextLevel("mystery"), ContextLevel::Generic);
}

TEST(ContextRecordTest, FromNode) {
    ContextNode node("n-1", Json::Value("data"), fromEpochMillis(kNow));
    ContextRecord record = ContextRecord::fromNode(node, ContextLevel::Agent);
    EXPECT_EQ(record.id, "n-1");
    EXPECT_EQ(record.level, ContextLevel::Agent);
    EXPECT_EQ(toEpochMillis(record.created_at), kNow);
    EXPECT_EQ(record.data.asString(), "data");
}
