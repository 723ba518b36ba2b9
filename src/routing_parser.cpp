// routing_parser.cpp – one pass over a VPR .route file
// -----------------------------------------------------------------------------
//   * Lines are read in order. "Net <id> (<name>)" closes the previous record
//     group and opens a new one; node lines are parsed into NodeRecords and
//     appended to the open group; banners and comments are skipped.
//   * With one thread every group is turned into a tree as soon as it closes.
//     With more, the groups are collected first and the trees are built on
//     worker threads, each with its own CongestionAccumulator. The
//     accumulators are merged after join, so no counter is shared.
//   * A bad node line never stops the parse. Only an unreadable input or a
//     document without any nets or node lines is fatal.
// -----------------------------------------------------------------------------

#include "../include/routing_parser.h"
#include "../include/parser.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <functional> // For std::ref
#include <iostream>
#include <thread>

RoutingDocumentParser::RoutingDocumentParser(const ParseOptions &options) : options_(options)
{
}

unsigned int RoutingDocumentParser::resolve_thread_count() const
{
    unsigned int num_threads = options_.threads;
    if (num_threads == 0)
    {
        num_threads = std::thread::hardware_concurrency();
    }
    if (num_threads == 0)
        num_threads = 4;
    const unsigned int MAX_ALLOWED_THREADS = 8;
    return std::min(num_threads, MAX_ALLOWED_THREADS);
}

RoutingDocument RoutingDocumentParser::parse_file(const std::string &file_path) const
{
    std::error_code ec;
    if (std::filesystem::is_directory(file_path, ec))
    {
        throw RoutingIoError("Cannot read routing file: " + file_path + " is a directory");
    }

    std::ifstream route_file(file_path);
    if (!route_file.is_open())
    {
        throw RoutingIoError("Cannot open routing file: " + file_path);
    }
    // route_file is closed by its destructor on every path out of here
    return parse_stream(route_file, file_path);
}

RoutingDocument RoutingDocumentParser::parse_stream(std::istream &in, const std::string &source_name) const
{
    std::cout << "[Parser] Parsing routing file: " << source_name << std::endl;

    RoutingDocument doc;
    doc.source_name = source_name;

    const unsigned int num_threads = resolve_thread_count();
    const bool deferred_build = num_threads > 1;

    TreeBuilder builder(options_.verbose);
    CongestionAccumulator congestion;
    std::vector<PendingNet> pending;

    PendingNet current;
    bool in_net = false;
    std::size_t net_count = 0;

    auto close_current = [&]()
    {
        if (!in_net)
        {
            return;
        }
        if (deferred_build)
        {
            pending.push_back(std::move(current));
        }
        else
        {
            finalize_net(current, builder, doc, congestion);
        }
        current = PendingNet();
        in_net = false;
    };

    std::string raw_line;
    int line_number = 0;
    while (std::getline(in, raw_line))
    {
        line_number++;
        std::string line = Parser::trim(raw_line);

        if (Parser::is_ignored_line(line))
        {
            harvest_header(line, doc);
            continue;
        }

        std::optional<NetHeader> header = Parser::parse_net_header(line);
        if (header)
        {
            close_current();
            current.id = header->id;
            current.name = header->name;
            in_net = true;
            net_count++;
            if (options_.verbose)
            {
                std::cout << "[Parser] Starting Net " << header->id << " (" << header->name << ")" << std::endl;
            }
            continue;
        }

        if (Parser::is_node_line(line))
        {
            try
            {
                NodeRecord record = Parser::parse_node_line(line, line_number);
                doc.node_line_count++;

                if (!in_net)
                {
                    ParseDiagnostic diag;
                    diag.kind = ORPHAN_RECORD;
                    diag.line_number = line_number;
                    diag.message = "Node " + std::to_string(record.id) + " appears before any 'Net' line";
                    doc.diagnostics.push_back(diag);
                    std::cerr << "Warning: Line " << line_number << ": node line outside of any net, kept for congestion only." << std::endl;
                    congestion.add(record);
                    continue;
                }

                if (options_.verbose)
                {
                    std::cout << "    Node " << record.id << ": " << node_kind_to_string(record.kind) << " ("
                              << record.x << "," << record.y << ") trk=" << record.track;
                    if (record.switch_id != 0)
                        std::cout << " sw=" << record.switch_id;
                    if (record.is_io_pad())
                        std::cout << " pad=" << record.pad;
                    std::cout << std::endl;
                }
                current.records.push_back(std::move(record));
            }
            catch (const MalformedLineError &e)
            {
                ParseDiagnostic diag;
                diag.kind = MALFORMED_LINE;
                diag.line_number = e.line_number();
                diag.net_name = in_net ? current.name : "";
                diag.message = e.what();
                doc.diagnostics.push_back(diag);
                std::cerr << "Warning: " << e.what() << ". Skipping line: \"" << line.substr(0, 80) << "\"" << std::endl;
            }
            continue;
        }

        // VPR prints extra lines for global nets ("Block ... at (x,y), Pin class ...")
        ParseDiagnostic diag;
        diag.kind = UNRECOGNIZED_LINE;
        diag.line_number = line_number;
        diag.net_name = in_net ? current.name : "";
        diag.message = "Unrecognized line: " + line.substr(0, 80);
        doc.diagnostics.push_back(diag);
        if (options_.verbose)
        {
            std::cout << "[Parser] Skipping unrecognized line " << line_number << ": " << line << std::endl;
        }
    }

    if (in.bad())
    {
        throw RoutingIoError("Read failure on " + source_name + " after line " + std::to_string(line_number));
    }

    close_current();

    if (net_count == 0 && doc.node_line_count == 0)
    {
        throw UnrecognizedFormatError("No 'Net' lines and no node lines found in " + source_name +
                                      "; is this a VPR .route file?");
    }

    if (deferred_build)
    {
        build_parallel(pending, builder, doc, congestion, num_threads);
    }

    doc.congestion = congestion.normalize();
    if (!congestion.empty())
    {
        std::cout << "[Congestion] " << congestion.counts().size() << " channel tracks used, peak usage "
                  << congestion.max_count() << "." << std::endl;
    }

    std::size_t missing_roots = doc.count_diagnostics(MISSING_ROOT);
    std::size_t fallbacks = doc.count_diagnostics(ROOT_FALLBACK);
    std::cout << "[Parser] Finished parsing: " << doc.routes.size() << " nets, " << doc.node_line_count
              << " node lines, " << doc.congestion.size() << " congested channel tracks." << std::endl;
    if (doc.count_diagnostics(MALFORMED_LINE) > 0 || missing_roots > 0 || fallbacks > 0)
    {
        std::cout << "[Parser] " << doc.count_diagnostics(MALFORMED_LINE) << " malformed line(s), "
                  << missing_roots << " net(s) without SOURCE, " << fallbacks << " reattachment(s) to SOURCE." << std::endl;
    }
    return doc;
}

void RoutingDocumentParser::finalize_net(PendingNet &net, const TreeBuilder &builder, RoutingDocument &doc,
                                         CongestionAccumulator &congestion) const
{
    NetRoute route = builder.build(net.id, net.name, std::move(net.records), doc.diagnostics);
    congestion.add_all(route.records);
    doc.total_wire_length += static_cast<long long>(route.records.size());

    if (options_.verbose)
    {
        std::cout << "[Parser] Net '" << route.name << "': " << route.records.size() << " records";
        if (route.has_root())
            std::cout << ", " << route.fanout() << " path(s) to SINK";
        std::cout << std::endl;
    }
    doc.routes.push_back(std::move(route));
}

void RoutingDocumentParser::build_parallel(std::vector<PendingNet> &pending, const TreeBuilder &builder, RoutingDocument &doc,
                                           CongestionAccumulator &congestion, unsigned int num_threads) const
{
    const std::size_t num_nets = pending.size();
    if (num_nets == 0)
    {
        return;
    }
    num_threads = static_cast<unsigned int>(std::min<std::size_t>(num_threads, num_nets));
    std::cout << "[Parser] Building " << num_nets << " routing trees using " << num_threads << " threads." << std::endl;

    // Every slot is written by exactly one worker
    std::vector<NetRoute> built(num_nets);
    std::vector<std::vector<ParseDiagnostic>> net_diagnostics(num_nets);
    std::vector<CongestionAccumulator> local_congestion(num_threads);

    std::size_t chunk_size = (num_nets + num_threads - 1) / num_threads;
    auto worker = [&](std::size_t start_idx, std::size_t end_idx, CongestionAccumulator &my_congestion)
    {
        for (std::size_t i = start_idx; i < end_idx; ++i)
        {
            built[i] = builder.build(pending[i].id, pending[i].name, std::move(pending[i].records), net_diagnostics[i]);
            my_congestion.add_all(built[i].records);
        }
    };

    std::vector<std::thread> threads;
    for (unsigned int t = 0; t < num_threads; ++t)
    {
        std::size_t start = t * chunk_size;
        std::size_t end = std::min(start + chunk_size, num_nets);
        if (start < end)
        {
            threads.emplace_back(worker, start, end, std::ref(local_congestion[t]));
        }
    }
    for (auto &thread : threads)
    {
        thread.join();
    }

    for (std::size_t i = 0; i < num_nets; ++i)
    {
        doc.diagnostics.insert(doc.diagnostics.end(), net_diagnostics[i].begin(), net_diagnostics[i].end());
        doc.total_wire_length += static_cast<long long>(built[i].records.size());
        doc.routes.push_back(std::move(built[i]));
    }
    for (const auto &local : local_congestion)
    {
        congestion.merge(local);
    }
    pending.clear();
}

void RoutingDocumentParser::harvest_header(const std::string &line, RoutingDocument &doc) const
{
    if (auto banner = Parser::parse_placement_banner(line))
    {
        doc.placement_file = banner->first;
        doc.placement_id = banner->second;
        return;
    }
    if (auto size = Parser::parse_array_size(line))
    {
        doc.array_width = size->first;
        doc.array_height = size->second;
    }
}
