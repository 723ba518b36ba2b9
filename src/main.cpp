#include "../include/routing_parser.h"
#include "../include/evaluator.h"
#include "../include/parser.h"
#include <iostream>
#include <string>
#include <chrono>
#include <iomanip>

void print_usage(const char *program_name)
{
    std::cout << "Usage: " << program_name << " [options] <file.route>\n"
              << "  <file.route>: VPR routing result file (Net / Node lines)\n"
              << "Options:\n"
              << "  -h, --help              Show this help message\n"
              << "  -v, --verbose           Log every node, branch and reattachment\n"
              << "  -j, --threads <n>       Threads for building routing trees (default: 1, 0 = all cores)\n"
              << "  --summary <file>        Write a routing summary to <file>\n"
              << "  --trees <file>          Write every net's root-to-sink paths to <file>\n"
              << "  --threshold <value>     High-congestion threshold in [0,1] (default: 0.8)\n"
              << "\n"
              << "Examples:\n"
              << "  " << program_name << " design.route\n"
              << "  " << program_name << " -j 4 --summary design_summary.txt --trees design_trees.txt design.route\n"
              << std::endl;
}

void print_statistics(const RoutingDocument &doc, double threshold)
{
    Evaluator evaluator(doc);
    TreeStatistics stats = evaluator.calculate_tree_statistics();
    CongestionMetrics metrics = evaluator.calculate_congestion_metrics(threshold);

    std::cout << "============================================================" << std::endl;
    std::cout << "[Main] Nets parsed: " << stats.total_nets << " (" << stats.nets_with_tree << " with routing tree)" << std::endl;
    std::cout << "[Main] Total wire length (records): " << doc.total_wire_length << std::endl;
    std::cout << "[Main] Tree Statistics:" << std::endl;
    std::cout << "   - Nets with branches: " << stats.nets_with_branches << std::endl;
    std::cout << "   - Max fanout: " << stats.max_fanout << std::endl;
    std::cout << "   - Avg path length: " << std::fixed << std::setprecision(2) << stats.avg_path_length << std::endl;
    std::cout << "[Main] Congestion: max " << std::setprecision(3) << metrics.max_congestion
              << ", avg " << metrics.avg_congestion
              << ", " << metrics.congested_segments << " of " << metrics.total_segments
              << " tracks above " << threshold << std::endl;

    for (const auto &route : doc.routes)
    {
        if (route.used_root_fallback)
        {
            std::cout << "Warning: Net '" << route.name << "' had sub-paths reattached to its SOURCE; tree shape is a guess." << std::endl;
        }
    }
    std::cout << "============================================================" << std::endl;
}

int main(int argc, char *argv[])
{
    auto program_start_time = std::chrono::high_resolution_clock::now();

    ParseOptions options;
    std::string route_file;
    std::string summary_file;
    std::string trees_file;
    double threshold = 0.8;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help")
        {
            print_usage(argv[0]);
            return 0;
        }
        else if (arg == "-v" || arg == "--verbose")
        {
            options.verbose = true;
        }
        else if (arg == "-j" || arg == "--threads")
        {
            if (++i >= argc)
            {
                std::cerr << "Error: Threads argument requires a value" << std::endl;
                print_usage(argv[0]);
                return 1;
            }
            std::optional<unsigned int> threads = Parser::parse_thread_count(argv[i]);
            if (!threads)
            {
                std::cerr << "Error: Invalid thread count: " << argv[i] << std::endl;
                return 1;
            }
            options.threads = *threads;
        }
        else if (arg == "--summary")
        {
            if (++i < argc)
            {
                summary_file = argv[i];
            }
            else
            {
                std::cerr << "Error: Summary argument requires a value" << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }
        else if (arg == "--trees")
        {
            if (++i < argc)
            {
                trees_file = argv[i];
            }
            else
            {
                std::cerr << "Error: Trees argument requires a value" << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }
        else if (arg == "--threshold")
        {
            if (++i >= argc)
            {
                std::cerr << "Error: Threshold argument requires a value" << std::endl;
                print_usage(argv[0]);
                return 1;
            }
            std::optional<double> value = Parser::parse_ratio(argv[i]);
            if (!value)
            {
                std::cerr << "Error: Threshold must be a number within [0,1]: " << argv[i] << std::endl;
                return 1;
            }
            threshold = *value;
        }
        else
        {
            if (!route_file.empty())
            {
                std::cerr << "Error: Multiple routing files provided." << std::endl;
                print_usage(argv[0]);
                return 1;
            }
            route_file = arg;
        }
    }

    if (route_file.empty())
    {
        std::cerr << "Error: Routing file is required" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    try
    {
        RoutingDocumentParser parser(options);
        RoutingDocument doc = parser.parse_file(route_file);

        print_statistics(doc, threshold);

        Evaluator evaluator(doc);
        if (!summary_file.empty())
        {
            evaluator.write_routing_summary(summary_file, threshold);
            std::cout << "[Main] Routing summary written to " << summary_file << std::endl;
        }
        if (!trees_file.empty())
        {
            evaluator.write_routing_trees(trees_file);
            std::cout << "[Main] Routing trees written to " << trees_file << std::endl;
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - program_start_time);
    std::cout << "Total execution time: " << std::fixed << std::setprecision(3) << duration.count() / 1000.0 << " seconds." << std::endl;
    return 0;
}
