#include "evaluator.h"
#include "parser.h" // For RoutingIoError
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <limits>

// --- Constructor ---

Evaluator::Evaluator(const RoutingDocument &document)
    : document_ref(document)
{
}

// --- Tree metrics ---

std::size_t Evaluator::net_fanout(const NetRoute &route)
{
    return route.has_root() ? route.fanout() : 0;
}

TreeStatistics Evaluator::calculate_tree_statistics() const
{
    TreeStatistics stats;
    stats.total_nets = document_ref.routes.size();

    for (const auto &route : document_ref.routes)
    {
        stats.total_records += route.records.size();
        if (!route.has_root())
        {
            continue;
        }
        stats.nets_with_tree++;

        SinkPathEnumerator paths(route);
        std::vector<std::size_t> path;
        std::size_t fanout = 0;
        while (paths.next(path))
        {
            fanout++;
            stats.total_path_length += path.size();
        }

        if (fanout > 1)
        {
            stats.nets_with_branches++;
        }
        stats.max_fanout = std::max(stats.max_fanout, fanout);
        stats.total_paths += fanout;
    }

    if (stats.total_paths > 0)
    {
        stats.avg_path_length = static_cast<double>(stats.total_path_length) / static_cast<double>(stats.total_paths);
    }
    return stats;
}

// --- Congestion metrics ---

CongestionMetrics Evaluator::calculate_congestion_metrics(double threshold) const
{
    CongestionMetrics metrics;
    const CongestionMap &congestion = document_ref.congestion;
    if (congestion.empty())
    {
        return metrics;
    }

    double max_value = std::numeric_limits<double>::lowest();
    double min_value = std::numeric_limits<double>::max();
    double sum = 0.0;
    for (const auto &entry : congestion)
    {
        max_value = std::max(max_value, entry.second);
        min_value = std::min(min_value, entry.second);
        sum += entry.second;
        if (entry.second > threshold)
        {
            metrics.congested_segments++;
        }
    }

    metrics.total_segments = congestion.size();
    metrics.max_congestion = max_value;
    metrics.min_congestion = min_value;
    metrics.avg_congestion = sum / static_cast<double>(congestion.size());
    return metrics;
}

std::vector<std::string> Evaluator::get_high_congestion_segments(double threshold) const
{
    std::vector<std::string> segments;
    for (const auto &entry : document_ref.congestion)
    {
        if (entry.second > threshold)
        {
            segments.push_back(entry.first.to_string());
        }
    }
    return segments;
}

// --- Reports ---

void Evaluator::write_routing_summary(const std::string &filename, double threshold) const
{
    std::ofstream outfile(filename);
    if (!outfile.is_open())
    {
        throw RoutingIoError("Could not open file for saving routing summary: " + filename);
    }

    TreeStatistics stats = calculate_tree_statistics();
    CongestionMetrics metrics = calculate_congestion_metrics(threshold);

    outfile << "Routing Summary" << std::endl;
    outfile << "---------------" << std::endl;
    outfile << "Source: " << document_ref.source_name << std::endl;
    if (!document_ref.placement_file.empty())
    {
        outfile << "Placement file: " << document_ref.placement_file;
        if (!document_ref.placement_id.empty())
            outfile << " (ID " << document_ref.placement_id << ")";
        outfile << std::endl;
    }
    if (document_ref.array_width && document_ref.array_height)
    {
        outfile << "Array size: " << *document_ref.array_width << " x " << *document_ref.array_height << std::endl;
    }

    outfile << std::endl
            << "Total routes: " << stats.total_nets << std::endl;
    outfile << "Total wire length (records): " << document_ref.total_wire_length << std::endl;
    outfile << std::fixed << std::setprecision(4);
    outfile << "Max congestion: " << metrics.max_congestion << std::endl;
    outfile << "Avg congestion: " << metrics.avg_congestion << std::endl;
    outfile << "Min congestion: " << metrics.min_congestion << std::endl;
    outfile << "Congested segments (> " << threshold << "): " << metrics.congested_segments
            << " of " << metrics.total_segments << std::endl;

    outfile << std::endl
            << "Tree Statistics:" << std::endl;
    outfile << "  Nets with tree: " << stats.nets_with_tree << std::endl;
    outfile << "  Nets with branches: " << stats.nets_with_branches << std::endl;
    outfile << "  Max fanout: " << stats.max_fanout << std::endl;
    outfile << "  Total paths: " << stats.total_paths << std::endl;
    outfile << "  Avg path length: " << std::setprecision(2) << stats.avg_path_length << std::endl;

    outfile << std::endl
            << "Diagnostics (" << document_ref.diagnostics.size() << "):" << std::endl;
    const DiagnosticKind kinds[] = {MALFORMED_LINE, MISSING_ROOT, ROOT_FALLBACK, ORPHAN_RECORD, UNATTACHED_RECORD, UNRECOGNIZED_LINE};
    for (DiagnosticKind kind : kinds)
    {
        outfile << "  " << diagnostic_kind_to_string(kind) << ": " << document_ref.count_diagnostics(kind) << std::endl;
    }
}

void Evaluator::write_routing_trees(const std::string &filename) const
{
    std::ofstream outfile(filename);
    if (!outfile.is_open())
    {
        throw RoutingIoError("Could not open file for saving routing trees: " + filename);
    }

    outfile << "Routing Trees (" << document_ref.routes.size() << " nets):" << std::endl;
    for (const auto &route : document_ref.routes)
    {
        outfile << std::endl
                << "Net " << route.net_id << ": " << route.name << " (" << route.records.size() << " records";
        if (!route.has_root())
        {
            outfile << ", tree unavailable)" << std::endl;
            continue;
        }
        outfile << ", fanout " << route.fanout();
        if (route.used_root_fallback)
        {
            outfile << ", reattached to SOURCE";
        }
        outfile << ")" << std::endl;

        for (const auto &path : route.path_coordinates())
        {
            outfile << "  Path: ";
            for (std::size_t i = 0; i < path.size(); ++i)
            {
                outfile << "(" << path[i].first << "," << path[i].second << ")";
                if (i < path.size() - 1)
                {
                    outfile << " -> ";
                }
            }
            outfile << std::endl;
        }
    }
}
