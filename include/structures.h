#ifndef STRUCTURES_H
#define STRUCTURES_H

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <variant>
#include <cstddef>
#include <utility> // For std::pair

// Routing-resource node kinds as printed by VPR in .route files
enum NodeKind
{
    SOURCE,
    OPIN,
    CHANX,
    CHANY,
    IPIN,
    SINK
};

std::string node_kind_to_string(NodeKind kind);
// Case-insensitive. Returns std::nullopt for anything outside the six kinds.
std::optional<NodeKind> node_kind_from_string(const std::string &text);
bool is_channel_kind(NodeKind kind);

// Value of a free-form "Key: Value" pair on a node line
using AttributeValue = std::variant<long long, std::string>;

struct NodeRecord
{
    long long id = 0;
    NodeKind kind = SOURCE;
    int x = -1; // -1 means unknown
    int y = -1;
    int track = 0;
    int switch_id = 0;
    int pad = -1;
    int line_number = 0; // Diagnostics only

    // Anything not covered above (Pin, Class, ...). Keys are lower-case.
    std::map<std::string, AttributeValue> extra_attributes;

    bool is_io_pad() const { return pad >= 0; }
    bool has_attribute(const std::string &key) const { return extra_attributes.count(key) > 0; }

    // Identity ignores extra_attributes and line_number
    bool operator==(const NodeRecord &o) const
    {
        return id == o.id && kind == o.kind && x == o.x && y == o.y &&
               track == o.track && switch_id == o.switch_id && pad == o.pad;
    }
    bool operator!=(const NodeRecord &o) const { return !(*this == o); }
};

struct TreeNode
{
    std::size_t record_index = 0; // Index into NetRoute::records
    std::optional<std::size_t> parent; // Empty for the root
    std::vector<std::size_t> children;
};

struct NetRoute
{
    long long net_id = -1;
    std::string name;
    std::vector<NodeRecord> records; // Raw stream order, repeats included
    std::vector<TreeNode> nodes;     // Arena, nodes[*root] is the SOURCE
    std::optional<std::size_t> root;
    // Set when a sub-path was reattached to the root because no adjacent
    // routing node was found. The tree is suspect in that case.
    bool used_root_fallback = false;

    NetRoute(long long id = -1, const std::string &n = "") : net_id(id), name(n) {}

    bool has_root() const { return root.has_value(); }
    const NodeRecord &node_record(std::size_t node_index) const { return records.at(nodes.at(node_index).record_index); }

    // Plain DFS from the root
    std::optional<std::size_t> find_node(long long id) const;

    std::vector<std::vector<std::size_t>> sink_paths() const;
    std::vector<std::vector<std::pair<int, int>>> path_coordinates() const;
    std::size_t fanout() const;
    std::size_t leaf_sink_count() const;

    std::size_t add_node(std::size_t record_index, std::optional<std::size_t> parent);
};

// Walks the root-to-sink paths of one net without caching them.
// A path ends at a SINK with no children; a dangling non-SINK leaf yields nothing.
class SinkPathEnumerator
{
public:
    explicit SinkPathEnumerator(const NetRoute &route);

    bool next(std::vector<std::size_t> &path);
    void reset();

private:
    struct Frame
    {
        std::size_t node;
        std::size_t next_child;
    };

    const NetRoute &route_;
    std::vector<Frame> stack_;
    bool started_ = false;
};

struct CongestionKey
{
    NodeKind kind = CHANX;
    int x = 0;
    int y = 0;
    int track = 0;

    bool operator<(const CongestionKey &o) const;
    bool operator==(const CongestionKey &o) const
    {
        return kind == o.kind && x == o.x && y == o.y && track == o.track;
    }

    // KIND_x_y_track, e.g. CHANX_0_0_2
    std::string to_string() const;
};

using CongestionMap = std::map<CongestionKey, double>;

enum DiagnosticKind
{
    MALFORMED_LINE,
    MISSING_ROOT,
    ROOT_FALLBACK,
    ORPHAN_RECORD,
    UNATTACHED_RECORD,
    UNRECOGNIZED_LINE
};

std::string diagnostic_kind_to_string(DiagnosticKind kind);

struct ParseDiagnostic
{
    DiagnosticKind kind = MALFORMED_LINE;
    int line_number = 0; // 0 when not tied to a line
    std::string net_name;
    std::string message;
};

struct RoutingDocument
{
    std::string source_name;
    std::vector<NetRoute> routes;
    CongestionMap congestion;
    long long total_wire_length = 0; // Sum of record counts, not a geometric length
    std::vector<ParseDiagnostic> diagnostics;
    std::size_t node_line_count = 0; // Node lines that parsed

    // Header banners, if the file had them
    std::string placement_file;
    std::string placement_id;
    std::optional<int> array_width;
    std::optional<int> array_height;

    std::size_t count_diagnostics(DiagnosticKind kind) const;
    const NetRoute *find_route(const std::string &net_name) const;
};

#endif // STRUCTURES_H
