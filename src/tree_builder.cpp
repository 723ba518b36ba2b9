#include "../include/tree_builder.h"
#include <cstdlib> // For std::abs
#include <iostream>
#include <unordered_set>

TreeBuilder::TreeBuilder(bool verbose) : verbose_(verbose)
{
}

NetRoute TreeBuilder::build(long long net_id, const std::string &name, std::vector<NodeRecord> records,
                            std::vector<ParseDiagnostic> &diagnostics) const
{
    NetRoute route(net_id, name);
    route.records = std::move(records);
    build(route, diagnostics);
    return route;
}

void TreeBuilder::build(NetRoute &route, std::vector<ParseDiagnostic> &diagnostics) const
{
    route.nodes.clear();
    route.root.reset();
    route.used_root_fallback = false;

    const auto &records = route.records;

    std::size_t source_index = records.size();
    for (std::size_t i = 0; i < records.size(); ++i)
    {
        if (records[i].kind == SOURCE)
        {
            source_index = i;
            break;
        }
    }

    if (source_index == records.size())
    {
        ParseDiagnostic diag;
        diag.kind = MISSING_ROOT;
        diag.net_name = route.name;
        diag.message = "No SOURCE node among " + std::to_string(records.size()) + " records, tree unavailable";
        diagnostics.push_back(diag);
        std::cerr << "Warning: Net '" << route.name << "' has no SOURCE node; keeping flat record list only." << std::endl;
        return;
    }

    for (std::size_t i = 0; i < source_index; ++i)
    {
        ParseDiagnostic diag;
        diag.kind = UNATTACHED_RECORD;
        diag.line_number = records[i].line_number;
        diag.net_name = route.name;
        diag.message = "Node " + std::to_string(records[i].id) + " (" + node_kind_to_string(records[i].kind) +
                       ") precedes the SOURCE and was not placed in the tree";
        diagnostics.push_back(diag);
    }

    std::unordered_set<long long> processed;
    std::size_t root = route.add_node(source_index, std::nullopt);
    route.root = root;
    processed.insert(records[source_index].id);

    std::size_t current_parent = root;

    for (std::size_t i = source_index + 1; i < records.size(); ++i)
    {
        const NodeRecord &rec = records[i];

        // Repeated id: jump back to the branch point, no new node
        if (processed.count(rec.id))
        {
            std::optional<std::size_t> branch_point = route.find_node(rec.id);
            if (branch_point)
            {
                current_parent = *branch_point;
                if (verbose_)
                {
                    std::cout << "[TreeBuilder] Net " << route.name << ": branch at node " << rec.id << " ("
                              << node_kind_to_string(rec.kind) << " " << rec.x << "," << rec.y << ")" << std::endl;
                }
            }
            continue;
        }

        std::size_t node_index = route.add_node(i, current_parent);
        processed.insert(rec.id);

        if (rec.kind != SINK)
        {
            current_parent = node_index;
            continue;
        }

        // A SINK ends the current path. Decide where the next one starts.
        if (i + 1 >= records.size())
        {
            continue;
        }
        const NodeRecord &next = records[i + 1];
        if (processed.count(next.id))
        {
            // The repeat on the next line repositions current_parent
            continue;
        }

        std::optional<std::size_t> attach = find_reattachment_point(route, next);
        if (attach)
        {
            current_parent = *attach;
            if (verbose_)
            {
                std::cout << "[TreeBuilder] Net " << route.name << ": node " << next.id << " reattached to adjacent node "
                          << route.node_record(*attach).id << std::endl;
            }
        }
        else
        {
            current_parent = root;
            route.used_root_fallback = true;

            ParseDiagnostic diag;
            diag.kind = ROOT_FALLBACK;
            diag.line_number = next.line_number;
            diag.net_name = route.name;
            diag.message = "No adjacent routing node for node " + std::to_string(next.id) + " at (" +
                           std::to_string(next.x) + "," + std::to_string(next.y) + "), attached to the SOURCE";
            diagnostics.push_back(diag);
            if (verbose_)
            {
                std::cout << "[TreeBuilder] Net " << route.name << ": " << diag.message << std::endl;
            }
        }
    }
}

bool TreeBuilder::is_adjacent(const NodeRecord &a, const NodeRecord &b)
{
    return std::abs(a.x - b.x) <= 1 && std::abs(a.y - b.y) <= 1;
}

std::optional<std::size_t> TreeBuilder::find_reattachment_point(const NetRoute &route, const NodeRecord &next) const
{
    if (!route.root)
    {
        return std::nullopt;
    }

    // Same preorder as NetRoute::find_node, first hit wins
    std::vector<std::size_t> stack{*route.root};
    while (!stack.empty())
    {
        std::size_t current = stack.back();
        stack.pop_back();

        const NodeRecord &rec = route.node_record(current);
        if ((rec.kind == CHANX || rec.kind == CHANY || rec.kind == OPIN) && is_adjacent(rec, next))
        {
            return current;
        }

        const auto &children = route.nodes[current].children;
        for (auto it = children.rbegin(); it != children.rend(); ++it)
        {
            stack.push_back(*it);
        }
    }
    return std::nullopt;
}
