#include <gtest/gtest.h>
#include "graph/context_graph.hpp"
#include "traversal/graph_traversal.hpp"

using namespace ctxgraph;

namespace {

/// A→B parent 1.0, A→C parent 1.0, B→D depends-on 0.9, C→D references 0.5
void buildDiamond(ContextGraph& g) {
    for (const char* id : {"A", "B", "C", "D"}) g.addNode(id, Json::Value(Json::objectValue));
    g.addEdge("A", "B", "parent", 1.0);
    g.addEdge("A", "C", "parent", 1.0);
    g.addEdge("B", "D", "depends-on", 0.9);
    g.addEdge("C", "D", "references", 0.5);
}

/// A→B→C→D, depends-on, weight 1.0
void buildChain(ContextGraph& g) {
    for (const char* id : {"A", "B", "C", "D"}) g.addNode(id, Json::Value());
    g.addEdge("A", "B", "depends-on", 1.0);
    g.addEdge("B", "C", "depends-on", 1.0);
    g.addEdge("C", "D", "depends-on", 1.0);
}

} // namespace

// ─── Dependencies ──────────────────────────────────────────────

TEST(TraversalTest, DependenciesOfB) {
    ContextGraph g;
    buildDiamond(g);
    GraphTraversal t(g);

    DependencyOptions opts;
    opts.relationship_types = {"depends-on"};
    auto deps = t.findDependencies("B", opts);
    ASSERT_EQ(deps.size(), 1u);
    EXPECT_EQ(deps[0].context_id, "D");
    EXPECT_EQ(deps[0].distance, 1u);
    EXPECT_DOUBLE_EQ(deps[0].weight, 0.9);
    EXPECT_EQ(deps[0].relationship, "depends-on");
    ASSERT_EQ(deps[0].path.size(), 1u);
    EXPECT_EQ(deps[0].path[0].from, "B");
}

TEST(TraversalTest, DependenciesRecordAccess) {
    ContextGraph g;
    buildDiamond(g);
    GraphTraversal t(g);
    t.findDependencies("B");
    EXPECT_EQ(g.getNode("B")->access_count, 1u);
}

TEST(TraversalTest, DependenciesTransitiveAndSorted) {
    ContextGraph g;
    buildChain(g);
    g.addEdge("A", "D", "requires", 0.3);
    GraphTraversal t(g);

    auto deps = t.findDependencies("A");
    ASSERT_EQ(deps.size(), 3u);
    // D is reached directly at distance 1 (weight 0.3) and via the chain at 3.
    EXPECT_EQ(deps[0].context_id, "B");
    EXPECT_EQ(deps[0].distance, 1u);
    EXPECT_EQ(deps[1].context_id, "D");
    EXPECT_EQ(deps[1].distance, 1u);
    EXPECT_DOUBLE_EQ(deps[1].weight, 0.3);
    EXPECT_EQ(deps[2].context_id, "C");
    EXPECT_EQ(deps[2].distance, 2u);
    EXPECT_EQ(deps[2].path.size(), 2u);
}

TEST(TraversalTest, DependenciesNonTransitive) {
    ContextGraph g;
    buildChain(g);
    GraphTraversal t(g);
    DependencyOptions opts;
    opts.transitive = false;
    auto deps = t.findDependencies("A", opts);
    ASSERT_EQ(deps.size(), 1u);
    EXPECT_EQ(deps[0].context_id, "B");
}

TEST(TraversalTest, DependenciesMaxDepth) {
    ContextGraph g;
    buildChain(g);
    GraphTraversal t(g);
    DependencyOptions opts;
    opts.max_depth = 2;
    auto deps = t.findDependencies("A", opts);
    ASSERT_EQ(deps.size(), 2u);
    EXPECT_EQ(deps.back().context_id, "C");
}

TEST(TraversalTest, NoSelfDependency) {
    ContextGraph g;
    buildChain(g);
    g.addEdge("D", "A", "depends-on", 0.8);
    g.addEdge("B", "B", "depends-on", 0.5);
    GraphTraversal t(g);

    for (const auto& id : g.nodeIds()) {
        for (const auto& dep : t.findDependencies(id)) {
            EXPECT_NE(dep.context_id, id);
        }
    }
}

TEST(TraversalTest, DependenciesHigherWeightWinsAtEqualDistance) {
    ContextGraph g;
    for (const char* id : {"A", "B"}) g.addNode(id, Json::Value());
    g.addEdge("A", "B", "depends-on", 0.4);
    g.addEdge("A", "B", "requires", 0.9);
    GraphTraversal t(g);

    auto deps = t.findDependencies("A");
    ASSERT_EQ(deps.size(), 1u);
    EXPECT_DOUBLE_EQ(deps[0].weight, 0.9);
    EXPECT_EQ(deps[0].relationship, "requires");
}

// ─── Impact ────────────────────────────────────────────────────

TEST(TraversalTest, ImpactDecaysAlongChain) {
    ContextGraph g;
    buildChain(g);
    GraphTraversal t(g);

    auto impacted = t.findImpactedContexts("D");
    ASSERT_EQ(impacted.size(), 3u);
    EXPECT_EQ(impacted[0].context_id, "C");
    EXPECT_EQ(impacted[0].distance, 1u);
    EXPECT_NEAR(impacted[0].impact, 0.8, 1e-9);
    EXPECT_EQ(impacted[1].context_id, "B");
    EXPECT_EQ(impacted[1].distance, 2u);
    EXPECT_NEAR(impacted[1].impact, 0.64, 1e-9);
    EXPECT_EQ(impacted[2].context_id, "A");
    EXPECT_NEAR(impacted[2].impact, 0.512, 1e-9);
    EXPECT_LT(impacted[1].impact, impacted[0].impact);
    EXPECT_LT(impacted[2].impact, impacted[1].impact);
    EXPECT_EQ(impacted[1].path.size(), 2u);
}

TEST(TraversalTest, ImpactThresholdPrunes) {
    ContextGraph g;
    buildChain(g);
    GraphTraversal t(g);
    ImpactOptions opts;
    opts.impact_threshold = 0.6;
    auto impacted = t.findImpactedContexts("D", opts);
    ASSERT_EQ(impacted.size(), 2u);
    EXPECT_EQ(impacted[1].context_id, "B");
}

TEST(TraversalTest, ImpactMaxDistance) {
    ContextGraph g;
    buildChain(g);
    GraphTraversal t(g);
    ImpactOptions opts;
    opts.max_distance = 1;
    auto impacted = t.findImpactedContexts("D", opts);
    ASSERT_EQ(impacted.size(), 1u);
    EXPECT_EQ(impacted[0].context_id, "C");
}

TEST(TraversalTest, ImpactKeepsLargerValue) {
    ContextGraph g;
    for (const char* id : {"X", "Y", "Z"}) g.addNode(id, Json::Value());
    // Z depends on X directly (weak) and through Y (strong).
    g.addEdge("Z", "X", "references", 0.2);
    g.addEdge("Y", "X", "depends-on", 1.0);
    g.addEdge("Z", "Y", "depends-on", 1.0);
    GraphTraversal t(g);

    ImpactOptions opts;
    opts.impact_threshold = 0.05;
    auto impacted = t.findImpactedContexts("X", opts);
    ASSERT_EQ(impacted.size(), 2u);
    EXPECT_EQ(impacted[0].context_id, "Y");
    EXPECT_EQ(impacted[1].context_id, "Z");
    EXPECT_NEAR(impacted[1].impact, 0.64, 1e-9);
    EXPECT_EQ(impacted[1].distance, 2u);
}

// ─── Cycles ────────────────────────────────────────────────────

TEST(TraversalTest, CycleThroughBackEdge) {
    ContextGraph g;
    buildDiamond(g);
    GraphTraversal t(g);
    EXPECT_TRUE(t.detectCycles().empty());

    g.addEdge("D", "B", "depends-on", 0.6);
    auto cycles = t.detectCycles();
    ASSERT_EQ(cycles.size(), 1u);
    EXPECT_EQ(cycles[0].nodes, (std::vector<std::string>{"B", "D", "B"}));
    ASSERT_EQ(cycles[0].edges.size(), 2u);
    EXPECT_EQ(cycles[0].edges[0].from, "B");
    EXPECT_EQ(cycles[0].edges[1].from, "D");
    EXPECT_EQ(cycles[0].type, "dependency-cycle");
}

TEST(TraversalTest, DagHasNoCycles) {
    ContextGraph g;
    for (const char* id : {"a", "b", "c", "d", "e"}) g.addNode(id, Json::Value());
    g.addEdge("a", "b", "depends-on");
    g.addEdge("a", "c", "depends-on");
    g.addEdge("b", "d", "requires");
    g.addEdge("c", "d", "depends-on");
    g.addEdge("d", "e", "depends-on");
    GraphTraversal t(g);
    EXPECT_TRUE(t.detectCycles().empty());
    EXPECT_TRUE(t.detectCycles({}).empty());
}

TEST(TraversalTest, CyclesFromEveryRoot) {
    ContextGraph g;
    for (const char* id : {"a", "b", "x", "y"}) g.addNode(id, Json::Value());
    g.addEdge("a", "b", "depends-on");
    g.addEdge("b", "a", "depends-on");
    g.addEdge("x", "y", "requires");
    g.addEdge("y", "x", "requires");
    GraphTraversal t(g);

    auto cycles = t.detectCycles();
    ASSERT_EQ(cycles.size(), 2u);
    EXPECT_EQ(cycles[0].nodes, (std::vector<std::string>{"a", "b", "a"}));
    EXPECT_EQ(cycles[1].nodes, (std::vector<std::string>{"x", "y", "x"}));
}

TEST(TraversalTest, CycleTypeFilter) {
    ContextGraph g;
    for (const char* id : {"a", "b"}) g.addNode(id, Json::Value());
    g.addEdge("a", "b", "parent");
    g.addEdge("b", "a", "child");
    GraphTraversal t(g);
    EXPECT_TRUE(t.detectCycles().empty());
    EXPECT_EQ(t.detectCycles({"parent", "child"}).size(), 1u);
}

// ─── Shortest path ─────────────────────────────────────────────

TEST(TraversalTest, ShortestPathWeighted) {
    ContextGraph g;
    for (const char* id : {"s", "m", "t"}) g.addNode(id, Json::Value());
    g.addEdge("s", "t", "references", 0.25);   // cost 4
    g.addEdge("s", "m", "references", 1.0);    // cost 1
    g.addEdge("m", "t", "references", 0.5);    // cost 2
    GraphTraversal t(g);

    auto path = t.findShortestPath("s", "t");
    ASSERT_TRUE(path.has_value());
    EXPECT_DOUBLE_EQ(path->cost, 3.0);
    EXPECT_EQ(path->nodes, (std::vector<std::string>{"s", "m", "t"}));
    ASSERT_EQ(path->edges.size(), 2u);

    ShortestPathOptions hops;
    hops.weighted = false;
    auto direct = t.findShortestPath("s", "t", hops);
    ASSERT_TRUE(direct.has_value());
    EXPECT_DOUBLE_EQ(direct->cost, 1.0);
    EXPECT_EQ(direct->edges.size(), 1u);
}

TEST(TraversalTest, ShortestPathUnreachable) {
    ContextGraph g;
    buildDiamond(g);
    GraphTraversal t(g);
    EXPECT_FALSE(t.findShortestPath("D", "A").has_value());
    EXPECT_FALSE(t.findShortestPath("A", "nowhere").has_value());

    ShortestPathOptions opts;
    opts.relationship_types = {"depends-on"};
    EXPECT_FALSE(t.findShortestPath("A", "D", opts).has_value());

    auto self = t.findShortestPath("A", "A");
    ASSERT_TRUE(self.has_value());
    EXPECT_DOUBLE_EQ(self->cost, 0.0);
    EXPECT_TRUE(self->edges.empty());
}

// ─── Query ─────────────────────────────────────────────────────

TEST(TraversalTest, QueryFromStartNode) {
    ContextGraph g;
    buildDiamond(g);
    GraphTraversal t(g);

    QueryOptions opts;
    opts.start_nodes = {"A"};
    auto results = t.query(opts);
    ASSERT_EQ(results.size(), 4u);
    EXPECT_EQ(results[0].node.id, "A");
    EXPECT_EQ(results[0].depth, 0u);
    EXPECT_TRUE(results[0].path.empty());
}

TEST(TraversalTest, QueryFiltersAndLimit) {
    ContextGraph g;
    buildDiamond(g);
    GraphTraversal t(g);

    QueryOptions opts;
    opts.start_nodes = {"A"};
    opts.edge_filter = [](const Edge& e) { return e.weight >= 0.9; };
    opts.node_filter = [](const ContextNode& n) { return n.id != "A"; };
    auto results = t.query(opts);
    // C→D (0.5) is filtered out, D is still reached via B.
    ASSERT_EQ(results.size(), 3u);
    for (const auto& r : results) EXPECT_NE(r.node.id, "A");

    QueryOptions limited;
    limited.limit = 2;
    EXPECT_EQ(t.query(limited).size(), 2u);

    QueryOptions shallow;
    shallow.start_nodes = {"A"};
    shallow.max_depth = 0;
    EXPECT_EQ(t.query(shallow).size(), 1u);
}

// ─── Statistics ────────────────────────────────────────────────

TEST(TraversalTest, Statistics) {
    ContextGraph g;
    buildDiamond(g);
    g.addNode("lonely", Json::Value());
    GraphTraversal t(g);

    auto stats = t.getStatistics();
    EXPECT_EQ(stats.node_count, 5u);
    EXPECT_EQ(stats.edge_count, 4u);
    EXPECT_EQ(stats.relationship_types,
              (std::vector<std::string>{"depends-on", "parent", "references"}));
    EXPECT_DOUBLE_EQ(stats.average_degree, 8.0 / 5.0);
    EXPECT_DOUBLE_EQ(stats.density, 4.0 / 20.0);
    EXPECT_EQ(stats.components, 2u);
    EXPECT_EQ(stats.edges_by_type.at("parent"), 2u);
    EXPECT_EQ(stats.edges_by_type.at("depends-on"), 1u);
    EXPECT_EQ(stats.edges_by_type.at("references"), 1u);

    Json::Value json = statisticsToJson(stats);
    EXPECT_EQ(json["nodeCount"].asUInt64(), 5u);
    EXPECT_EQ(json["relationshipTypes"].size(), 3u);
    EXPECT_EQ(json["edgesByType"]["parent"].asUInt64(), 2u);

    // Removing the last edge of a type drops it from the index.
    g.removeEdge("C", "D", "references");
    auto after = t.getStatistics();
    EXPECT_EQ(after.edges_by_type.count("references"), 0u);
    EXPECT_EQ(after.relationship_types.size(), 2u);
}

TEST(TraversalTest, StatisticsEmptyGraph) {
    ContextGraph g;
    GraphTraversal t(g);
    auto stats = t.getStatistics();
    EXPECT_EQ(stats.node_count, 0u);
    EXPECT_DOUBLE_EQ(stats.average_degree, 0.0);
    EXPECT_DOUBLE_EQ(stats.density, 0.0);
    EXPECT_EQ(stats.components, 0u);
    EXPECT_TRUE(stats.edges_by_type.empty());
}
