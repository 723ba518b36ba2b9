#pragma once

#include "structures.h"
#include <string>
#include <vector>

struct TreeStatistics
{
    std::size_t total_nets = 0;
    std::size_t nets_with_tree = 0;
    std::size_t nets_with_branches = 0; // fanout > 1
    std::size_t max_fanout = 0;
    std::size_t total_paths = 0;
    std::size_t total_path_length = 0; // Nodes summed over all root-to-sink paths
    double avg_path_length = 0.0;
    std::size_t total_records = 0;
};

struct CongestionMetrics
{
    double max_congestion = 0.0;
    double avg_congestion = 0.0;
    double min_congestion = 0.0;
    std::size_t congested_segments = 0; // Strictly above the threshold
    std::size_t total_segments = 0;
};

class Evaluator
{
public:
    explicit Evaluator(const RoutingDocument &document);
    // The document is held by reference and must outlive the evaluator
    Evaluator(RoutingDocument &&) = delete;

    // --- Tree metrics ---

    TreeStatistics calculate_tree_statistics() const;

    // Number of root-to-sink paths, 0 when the net has no tree
    static std::size_t net_fanout(const NetRoute &route);

    // --- Congestion metrics ---

    CongestionMetrics calculate_congestion_metrics(double threshold = 0.8) const;

    // Boundary keys (KIND_x_y_track) above the threshold, in key order
    std::vector<std::string> get_high_congestion_segments(double threshold = 0.8) const;

    // --- Reports ---

    // Both throw RoutingIoError when the file cannot be written
    void write_routing_summary(const std::string &filename, double threshold = 0.8) const;
    void write_routing_trees(const std::string &filename) const;

private:
    const RoutingDocument &document_ref;
};
