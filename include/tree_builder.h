#ifndef TREE_BUILDER_H
#define TREE_BUILDER_H

#include "structures.h"
#include <optional>
#include <string>
#include <vector>

// Rebuilds the routing tree of one net from its record stream.
//
// VPR lists a net as a sequence of visited nodes. When the router branched,
// the branch point is printed again right before the next sub-path, so a
// repeated id means "continue from here". When the repeat is missing after a
// SINK, the builder looks for an already placed CHANX/CHANY/OPIN next to the
// following record and falls back to the root if there is none.
//
// The builder only touches the NetRoute it is given, so different nets can be
// built on different threads.
class TreeBuilder
{
public:
    explicit TreeBuilder(bool verbose = false);

    // Fills route.nodes / route.root from route.records. Structural problems
    // (no SOURCE, fallback to root, records before the SOURCE) are appended
    // to diagnostics; nothing here throws for bad input.
    void build(NetRoute &route, std::vector<ParseDiagnostic> &diagnostics) const;

    NetRoute build(long long net_id, const std::string &name, std::vector<NodeRecord> records,
                   std::vector<ParseDiagnostic> &diagnostics) const;

    static bool is_adjacent(const NodeRecord &a, const NodeRecord &b);

private:
    bool verbose_;

    std::optional<std::size_t> find_reattachment_point(const NetRoute &route, const NodeRecord &next) const;
};

#endif // TREE_BUILDER_H
