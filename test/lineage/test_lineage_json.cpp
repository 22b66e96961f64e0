#include <catch2/catch_test_macros.hpp>

#include <kpi_lineage/lineage/lineage_json.hpp>

#include <nlohmann/json.hpp>

#include <string>

using namespace kpi_lineage;
using json = nlohmann::json;

namespace {

constexpr const char* kOrdersKpi =
    "SELECT DATE(o.created_at) AS x, SUM(o.amount) AS y "
    "FROM `p.d.orders` o JOIN `p.d.customers` c ON o.customer_id = c.id "
    "WHERE o.status = 'paid' GROUP BY x";

} // anonymous namespace

// ===========================================================================
// Lineage
// ===========================================================================

TEST_CASE("Lineage JSON: orders KPI document", "[lineage][json]") {
    auto lineage = ComputeLineage(kOrdersKpi);
    REQUIRE(lineage.IsOk());
    json j = lineage.Value();

    CHECK(j["sources"] == json::array({"p.d.orders", "p.d.customers"}));
    REQUIRE(j["joins"].size() == 1);
    CHECK(j["joins"][0]["left"] == "o.customer_id");
    CHECK(j["joins"][0]["right"] == "c.id");
    CHECK(j["joins"][0]["on"] == "o.customer_id = c.id");
    CHECK(j["filters"] == json::array({"o.status = 'paid'"}));
    CHECK(j["group_by"] == json::array({"x"}));
    CHECK(j["outputs"]["x"] == "DATE(o.created_at) AS x");
    CHECK(j["outputs"]["y"] == "SUM(o.amount) AS y");
    CHECK(j["filter_date_column"] == "x");
    CHECK_FALSE(j.contains("having"));
}

TEST_CASE("Lineage JSON: empty lineage keeps sources and joins", "[lineage][json]") {
    json j = Lineage{};
    CHECK(j["sources"] == json::array());
    CHECK(j["joins"] == json::array());
    CHECK_FALSE(j.contains("filters"));
    CHECK_FALSE(j.contains("group_by"));
    CHECK_FALSE(j.contains("outputs"));
    CHECK_FALSE(j.contains("filter_date_column"));
}

// ===========================================================================
// Graph
// ===========================================================================

TEST_CASE("Graph JSON: node and edge types use wire names", "[lineage][json]") {
    LineageGraph graph;
    graph.nodes = {{"t", NodeKind::Table, "t"}, {"__join__1", NodeKind::Join, "JOIN 1"},
                   {"y", NodeKind::Output, "Count"}};
    graph.edges = {{"t", "__join__1", EdgeKind::JoinIn, 1},
                   {"__join__1", "y", EdgeKind::JoinOut, 3}};
    json j = graph;
    CHECK(j["nodes"][1]["type"] == "join");
    CHECK(j["nodes"][2]["label"] == "Count");
    CHECK(j["edges"][0]["type"] == "join_in");
    CHECK(j["edges"][1]["type"] == "join_out");
    CHECK(j["edges"][1]["weight"] == 3);
    CHECK_FALSE(j.contains("warnings"));

    graph.warnings.push_back("graph truncated to 3 nodes and 2 edges");
    json warned = graph;
    CHECK(warned["warnings"].size() == 1);
}

TEST_CASE("Graph JSON: parse what was written", "[lineage][json]") {
    LineageGraph graph;
    graph.nodes = {{"t", NodeKind::Table, "orders"}, {"t.id", NodeKind::Column, "id"},
                   {"v", NodeKind::Output, "Value"}};
    graph.edges = {{"t", "t.id", EdgeKind::Contains, 1},
                   {"t.id", "v", EdgeKind::Projection, 2}};
    auto parsed = LineageGraphFromJson(json(graph));
    REQUIRE(parsed.IsOk());
    CHECK(parsed.Value().nodes == graph.nodes);
    CHECK(parsed.Value().edges == graph.edges);
}

TEST_CASE("LineageGraphFromJson: defaults for type, label and weight", "[lineage][json]") {
    auto parsed = LineageGraphFromJson(json::parse(R"({
        "nodes": [{"id": "a"}, {"id": "b", "type": "OUTPUT"}],
        "edges": [{"source": "a", "target": "b"}]
    })"));
    REQUIRE(parsed.IsOk());
    const auto& graph = parsed.Value();
    CHECK(graph.nodes[0] == LineageNode{"a", NodeKind::Table, "a"});
    CHECK(graph.nodes[1].kind == NodeKind::Output);
    REQUIRE(graph.edges.size() == 1);
    CHECK(graph.edges[0].kind == EdgeKind::Derives);
    CHECK(graph.edges[0].weight == 1);
    CHECK_FALSE(graph.truncated);
}

TEST_CASE("LineageGraphFromJson: edges are optional", "[lineage][json]") {
    auto parsed = LineageGraphFromJson(json::parse(R"({"nodes": [], "truncated": true})"));
    REQUIRE(parsed.IsOk());
    CHECK(parsed.Value().nodes.empty());
    CHECK(parsed.Value().truncated);
}

TEST_CASE("LineageGraphFromJson: rejects malformed documents", "[lineage][json]") {
    CHECK(LineageGraphFromJson(json::array()).IsErr());
    CHECK(LineageGraphFromJson(json::parse(R"({"edges": []})")).IsErr());
    CHECK(LineageGraphFromJson(json::parse(R"({"nodes": [{"label": "x"}]})")).IsErr());
    CHECK(LineageGraphFromJson(json::parse(R"({"nodes": [{"id": 7}]})")).IsErr());
    CHECK(LineageGraphFromJson(json::parse(R"({"nodes": [{"id": "a", "type": 1}]})")).IsErr());
    CHECK(LineageGraphFromJson(json::parse(R"({"nodes": [], "edges": {}})")).IsErr());
    CHECK(LineageGraphFromJson(
              json::parse(R"({"nodes": [], "edges": [{"source": "a"}]})")).IsErr());
    CHECK(LineageGraphFromJson(
              json::parse(R"({"nodes": [], "edges": [{"source": "a", "target": "b",
                                                     "weight": "heavy"}]})")).IsErr());
    CHECK(LineageGraphFromJson(json::parse(R"({"nodes": [], "truncated": "yes"})")).IsErr());
}

TEST_CASE("LineageGraphFromJson: unknown types are named in the error", "[lineage][json]") {
    auto node = LineageGraphFromJson(json::parse(R"({"nodes": [{"id": "a", "type": "view"}]})"));
    REQUIRE(node.IsErr());
    CHECK(node.Error() == "node 'a' has unknown type 'view'");

    auto edge = LineageGraphFromJson(json::parse(
        R"({"nodes": [], "edges": [{"source": "a", "target": "b", "type": "feeds"}]})"));
    REQUIRE(edge.IsErr());
    CHECK(edge.Error() == "edge a -> b has unknown type 'feeds'");
}

// ===========================================================================
// View
// ===========================================================================

TEST_CASE("View JSON: positions, links and transform", "[lineage][json]") {
    auto facts = ComputeLineageFacts(kOrdersKpi);
    REQUIRE(facts.IsOk());
    auto viewport = Viewport::Create(960, 540);
    REQUIRE(viewport.IsOk());
    json j = BuildGraphAndLayout(facts.Value(), viewport.Value());

    CHECK(j["graph"]["nodes"].size() == 5);
    CHECK(j["positions"].size() == 5);
    CHECK(j["positions"].contains("__join__1"));
    CHECK(j["positions"]["x"].contains("y1"));
    REQUIRE(j["links"].size() == 6);
    CHECK(j["links"][0]["path"].get<std::string>().rfind("M", 0) == 0);
    CHECK(j["view_transform"].contains("scale"));
    CHECK(j["truncated"] == false);
}
