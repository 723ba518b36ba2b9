#ifndef ROUTING_PARSER_H
#define ROUTING_PARSER_H

#include "structures.h"
#include "congestion.h"
#include "tree_builder.h"
#include <istream>
#include <string>
#include <vector>

struct ParseOptions
{
    bool verbose = false;
    // Threads for the tree-building phase. 1 builds each net as soon as its
    // group ends; 0 uses the hardware concurrency.
    unsigned int threads = 1;
};

class RoutingDocumentParser
{
public:
    explicit RoutingDocumentParser(const ParseOptions &options = ParseOptions());

    // Throws RoutingIoError if the file cannot be opened or read and
    // UnrecognizedFormatError if it contains no nets and no node lines.
    RoutingDocument parse_file(const std::string &file_path) const;
    RoutingDocument parse_stream(std::istream &in, const std::string &source_name = "<stream>") const;

    unsigned int resolve_thread_count() const;

private:
    ParseOptions options_;

    struct PendingNet
    {
        long long id = -1;
        std::string name;
        std::vector<NodeRecord> records;
    };

    void finalize_net(PendingNet &net, const TreeBuilder &builder, RoutingDocument &doc,
                      CongestionAccumulator &congestion) const;
    void build_parallel(std::vector<PendingNet> &pending, const TreeBuilder &builder, RoutingDocument &doc,
                        CongestionAccumulator &congestion, unsigned int num_threads) const;
    void harvest_header(const std::string &line, RoutingDocument &doc) const;
};

#endif // ROUTING_PARSER_H
