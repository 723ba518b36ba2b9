#include "../include/structures.h"
#include <algorithm>
#include <cctype>
#include <tuple>
#include <stdexcept> // For exceptions

// --- NodeKind helpers ---

std::string node_kind_to_string(NodeKind kind)
{
    switch (kind)
    {
    case SOURCE:
        return "SOURCE";
    case OPIN:
        return "OPIN";
    case CHANX:
        return "CHANX";
    case CHANY:
        return "CHANY";
    case IPIN:
        return "IPIN";
    case SINK:
        return "SINK";
    }
    throw std::invalid_argument("Unknown NodeKind value: " + std::to_string(static_cast<int>(kind)));
}

std::optional<NodeKind> node_kind_from_string(const std::string &text)
{
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::toupper(c)); });

    if (upper == "SOURCE")
        return SOURCE;
    if (upper == "OPIN")
        return OPIN;
    if (upper == "CHANX")
        return CHANX;
    if (upper == "CHANY")
        return CHANY;
    if (upper == "IPIN")
        return IPIN;
    if (upper == "SINK")
        return SINK;

    return std::nullopt;
}

bool is_channel_kind(NodeKind kind)
{
    return kind == CHANX || kind == CHANY;
}

// --- NetRoute ---

std::size_t NetRoute::add_node(std::size_t record_index, std::optional<std::size_t> parent)
{
    TreeNode node;
    node.record_index = record_index;
    node.parent = parent;
    nodes.push_back(node);
    std::size_t index = nodes.size() - 1;
    if (parent)
    {
        nodes.at(*parent).children.push_back(index);
    }
    return index;
}

std::optional<std::size_t> NetRoute::find_node(long long id) const
{
    if (!root)
    {
        return std::nullopt;
    }

    // Preorder, children in insertion order
    std::vector<std::size_t> stack{*root};
    while (!stack.empty())
    {
        std::size_t current = stack.back();
        stack.pop_back();
        if (node_record(current).id == id)
        {
            return current;
        }
        const auto &children = nodes[current].children;
        for (auto it = children.rbegin(); it != children.rend(); ++it)
        {
            stack.push_back(*it);
        }
    }
    return std::nullopt;
}

std::vector<std::vector<std::size_t>> NetRoute::sink_paths() const
{
    std::vector<std::vector<std::size_t>> paths;
    SinkPathEnumerator enumerator(*this);
    std::vector<std::size_t> path;
    while (enumerator.next(path))
    {
        paths.push_back(path);
    }
    return paths;
}

std::vector<std::vector<std::pair<int, int>>> NetRoute::path_coordinates() const
{
    std::vector<std::vector<std::pair<int, int>>> result;
    SinkPathEnumerator enumerator(*this);
    std::vector<std::size_t> path;
    while (enumerator.next(path))
    {
        std::vector<std::pair<int, int>> coords;
        coords.reserve(path.size());
        for (std::size_t node_index : path)
        {
            const NodeRecord &rec = node_record(node_index);
            coords.emplace_back(rec.x, rec.y);
        }
        result.push_back(std::move(coords));
    }
    return result;
}

std::size_t NetRoute::fanout() const
{
    std::size_t count = 0;
    SinkPathEnumerator enumerator(*this);
    std::vector<std::size_t> path;
    while (enumerator.next(path))
    {
        ++count;
    }
    return count;
}

std::size_t NetRoute::leaf_sink_count() const
{
    if (!root)
    {
        return 0;
    }
    std::size_t count = 0;
    for (std::size_t i = 0; i < nodes.size(); ++i)
    {
        if (nodes[i].children.empty() && node_record(i).kind == SINK)
        {
            ++count;
        }
    }
    return count;
}

// --- SinkPathEnumerator ---

SinkPathEnumerator::SinkPathEnumerator(const NetRoute &route) : route_(route)
{
}

bool SinkPathEnumerator::next(std::vector<std::size_t> &path)
{
    auto is_leaf_sink = [this](std::size_t node_index)
    {
        return route_.nodes[node_index].children.empty() && route_.node_record(node_index).kind == SINK;
    };
    auto fill_path = [this, &path]()
    {
        path.clear();
        for (const Frame &frame : stack_)
        {
            path.push_back(frame.node);
        }
    };

    if (!started_)
    {
        started_ = true;
        stack_.clear();
        if (!route_.root)
        {
            return false;
        }
        stack_.push_back({*route_.root, 0});
        if (is_leaf_sink(*route_.root))
        {
            fill_path();
            return true;
        }
    }

    while (!stack_.empty())
    {
        Frame &top = stack_.back();
        const TreeNode &tree_node = route_.nodes[top.node];
        if (top.next_child < tree_node.children.size())
        {
            std::size_t child = tree_node.children[top.next_child];
            ++top.next_child;
            stack_.push_back({child, 0});
            if (is_leaf_sink(child))
            {
                fill_path();
                return true;
            }
        }
        else
        {
            stack_.pop_back();
        }
    }
    return false;
}

void SinkPathEnumerator::reset()
{
    started_ = false;
    stack_.clear();
}

// --- CongestionKey ---

bool CongestionKey::operator<(const CongestionKey &o) const
{
    return std::tie(kind, x, y, track) < std::tie(o.kind, o.x, o.y, o.track);
}

std::string CongestionKey::to_string() const
{
    return node_kind_to_string(kind) + "_" + std::to_string(x) + "_" + std::to_string(y) + "_" + std::to_string(track);
}

// --- Diagnostics / RoutingDocument ---

std::string diagnostic_kind_to_string(DiagnosticKind kind)
{
    switch (kind)
    {
    case MALFORMED_LINE:
        return "malformed_line";
    case MISSING_ROOT:
        return "missing_root";
    case ROOT_FALLBACK:
        return "root_fallback";
    case ORPHAN_RECORD:
        return "orphan_record";
    case UNATTACHED_RECORD:
        return "unattached_record";
    case UNRECOGNIZED_LINE:
        return "unrecognized_line";
    }
    return "unknown";
}

std::size_t RoutingDocument::count_diagnostics(DiagnosticKind kind) const
{
    return static_cast<std::size_t>(std::count_if(diagnostics.begin(), diagnostics.end(),
                                                  [kind](const ParseDiagnostic &d)
                                                  { return d.kind == kind; }));
}

const NetRoute *RoutingDocument::find_route(const std::string &net_name) const
{
    for (const auto &route : routes)
    {
        if (route.name == net_name)
        {
            return &route;
        }
    }
    return nullptr;
}
