#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <type_traits>

#include "evaluator.h"
#include "parser.h"
#include "routing_parser.h"

namespace {

const char *kTwoNets = R"(Net 0 (branchy)
Node: 1 SOURCE (0,0,0) Class: 0 Switch: 0
Node: 2 CHANY (1,1,0) Track: 0 Switch: 1
Node: 3 CHANX (2,1,0) Track: 1 Switch: 1
Node: 4 SINK (2,1,0) Class: 1 Switch: -1
Node: 2 CHANY (1,1,0) Track: 0 Switch: 1
Node: 5 CHANX (1,2,0) Track: 3 Switch: 1
Node: 6 SINK (1,2,0) Class: 1 Switch: -1
Net 1 (orphan)
Node: 7 OPIN (4,4,0) Pin: 1 Switch: 1
Node: 8 SINK (4,4,0) Class: 0 Switch: -1
)";

RoutingDocument parse_two_nets() {
    RoutingDocumentParser parser;
    std::istringstream in(kTwoNets);
    return parser.parse_stream(in, "two_nets.route");
}

std::string read_file(const std::filesystem::path &path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

}  // namespace

TEST(Evaluator, TreeStatistics) {
    RoutingDocument doc = parse_two_nets();
    Evaluator evaluator(doc);
    TreeStatistics stats = evaluator.calculate_tree_statistics();

    EXPECT_EQ(stats.total_nets, 2u);
    EXPECT_EQ(stats.nets_with_tree, 1u);
    EXPECT_EQ(stats.nets_with_branches, 1u);
    EXPECT_EQ(stats.max_fanout, 2u);
    EXPECT_EQ(stats.total_paths, 2u);
    EXPECT_EQ(stats.total_path_length, 8u);
    EXPECT_DOUBLE_EQ(stats.avg_path_length, 4.0);
    EXPECT_EQ(stats.total_records, 9u);

    EXPECT_EQ(Evaluator::net_fanout(doc.routes[0]), 2u);
    EXPECT_EQ(Evaluator::net_fanout(doc.routes[1]), 0u);
}

TEST(Evaluator, CongestionMetrics) {
    RoutingDocument doc = parse_two_nets();
    Evaluator evaluator(doc);
    CongestionMetrics metrics = evaluator.calculate_congestion_metrics(0.8);

    EXPECT_DOUBLE_EQ(metrics.max_congestion, 1.0);
    EXPECT_DOUBLE_EQ(metrics.min_congestion, 0.5);
    EXPECT_DOUBLE_EQ(metrics.avg_congestion, 2.0 / 3.0);
    EXPECT_EQ(metrics.congested_segments, 1u);
    EXPECT_EQ(metrics.total_segments, 3u);

    auto hot = evaluator.get_high_congestion_segments(0.8);
    ASSERT_EQ(hot.size(), 1u);
    EXPECT_EQ(hot[0], "CHANY_1_1_0");
    EXPECT_EQ(evaluator.get_high_congestion_segments(0.4).size(), 3u);
}

TEST(Evaluator, EmptyCongestionGivesZeroMetrics) {
    RoutingDocument doc;
    Evaluator evaluator(doc);
    CongestionMetrics metrics = evaluator.calculate_congestion_metrics();
    EXPECT_EQ(metrics.total_segments, 0u);
    EXPECT_DOUBLE_EQ(metrics.max_congestion, 0.0);
    EXPECT_TRUE(evaluator.get_high_congestion_segments().empty());
}

TEST(Evaluator, WritesSummaryAndTrees) {
    RoutingDocument doc = parse_two_nets();
    Evaluator evaluator(doc);

    std::filesystem::path summary = std::filesystem::temp_directory_path() / "route_tree_summary_test.txt";
    std::filesystem::path trees = std::filesystem::temp_directory_path() / "route_tree_trees_test.txt";
    evaluator.write_routing_summary(summary.string());
    evaluator.write_routing_trees(trees.string());

    std::string summary_text = read_file(summary);
    EXPECT_NE(summary_text.find("Total routes: 2"), std::string::npos);
    EXPECT_NE(summary_text.find("Total wire length (records): 9"), std::string::npos);
    EXPECT_NE(summary_text.find("Nets with branches: 1"), std::string::npos);
    EXPECT_NE(summary_text.find("missing_root: 1"), std::string::npos);

    std::string trees_text = read_file(trees);
    EXPECT_NE(trees_text.find("Net 0: branchy (7 records, fanout 2)"), std::string::npos);
    EXPECT_NE(trees_text.find("Path: (0,0) -> (1,1) -> (2,1) -> (2,1)"), std::string::npos);
    EXPECT_NE(trees_text.find("Path: (0,0) -> (1,1) -> (1,2) -> (1,2)"), std::string::npos);
    EXPECT_NE(trees_text.find("Net 1: orphan (2 records, tree unavailable)"), std::string::npos);

    std::filesystem::remove(summary);
    std::filesystem::remove(trees);
}

TEST(Evaluator, UnwritableReportIsIoFailure) {
    RoutingDocument doc = parse_two_nets();
    Evaluator evaluator(doc);
    EXPECT_THROW(evaluator.write_routing_summary("/nonexistent/dir/summary.txt"), RoutingIoError);
    EXPECT_THROW(evaluator.write_routing_trees("/nonexistent/dir/trees.txt"), RoutingIoError);
}

TEST(Evaluator, RefusesTemporaryDocuments) {
    static_assert(std::is_constructible<Evaluator, const RoutingDocument &>::value,
                  "Evaluator must accept a named document");
    static_assert(std::is_constructible<Evaluator, RoutingDocument &>::value,
                  "Evaluator must accept a mutable named document");
    static_assert(!std::is_constructible<Evaluator, RoutingDocument &&>::value,
                  "Evaluator must not bind to a temporary document");
    static_assert(!std::is_constructible<Evaluator, RoutingDocument>::value,
                  "Evaluator must not bind to a temporary document");

    RoutingDocument doc = parse_two_nets();
    Evaluator evaluator(doc);
    EXPECT_EQ(evaluator.calculate_tree_statistics().total_nets, 2u);
}
