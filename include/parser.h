#ifndef PARSER_H
#define PARSER_H

#include <string>
#include <optional>
#include <stdexcept>
#include <utility> // For std::pair
#include "structures.h"

// Input cannot be opened or read. Fatal.
class RoutingIoError : public std::runtime_error
{
public:
    explicit RoutingIoError(const std::string &what) : std::runtime_error(what) {}
};

// A single node line could not be parsed. The document parser skips the line.
class MalformedLineError : public std::runtime_error
{
public:
    MalformedLineError(const std::string &what, int line_number)
        : std::runtime_error(what), line_number_(line_number) {}

    int line_number() const { return line_number_; }

private:
    int line_number_;
};

// Neither net delimiters nor node lines were found: not a .route file. Fatal.
class UnrecognizedFormatError : public std::runtime_error
{
public:
    explicit UnrecognizedFormatError(const std::string &what) : std::runtime_error(what) {}
};

// "Net <id> (<name>)"
struct NetHeader
{
    long long id = -1;
    std::string name;
};

// Line-level parsing of VPR .route files. All functions are pure.
class Parser
{
public:
    // Parses "Node:\t<id>\t<KIND> (<x>,<y>[,<z>])  [Track: n] [Switch: n] [Pad: n] [Key: value ...]".
    // Throws MalformedLineError when the line has fewer than three fields after
    // the marker, a non-numeric id or coordinate, or an unknown node kind.
    static NodeRecord parse_node_line(const std::string &line, int line_number = 0);

    static std::optional<NetHeader> parse_net_header(const std::string &line);

    static bool is_node_line(const std::string &line);

    // Blank, '#' comments, "Placement_File:" and "Array size:" banners, bare "Routing:"
    static bool is_ignored_line(const std::string &line);

    // "Placement_File: <file> Placement_ID: <id>" -> (file, id); id may be empty
    static std::optional<std::pair<std::string, std::string>> parse_placement_banner(const std::string &line);
    // "Array size: <W> x <H> logic blocks" -> (W, H)
    static std::optional<std::pair<int, int>> parse_array_size(const std::string &line);

    static std::string trim(const std::string &s);
    static std::optional<long long> parse_integer(const std::string &text);
    // Command-line values. A thread count must fit an unsigned int; a ratio
    // must be a finite number within [0,1].
    static std::optional<unsigned int> parse_thread_count(const std::string &text);
    static std::optional<double> parse_ratio(const std::string &text);

private:
    static void parse_coordinates(const std::string &token, NodeRecord &record, int line_number);
    static void apply_attribute(const std::string &key, const std::string &value, NodeRecord &record);
};

#endif // PARSER_H
