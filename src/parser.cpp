#include "../include/parser.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <sstream>
#include <vector>

namespace
{
    const std::string NODE_MARKER = "Node:";

    void replace_all(std::string &text, const std::string &from, const std::string &to)
    {
        std::size_t pos = 0;
        while ((pos = text.find(from, pos)) != std::string::npos)
        {
            text.replace(pos, from.size(), to);
            pos += to.size();
        }
    }

    bool starts_with(const std::string &text, const std::string &prefix)
    {
        return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
    }

    std::string to_lower(std::string text)
    {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    std::optional<int> to_int(const std::optional<long long> &value)
    {
        if (!value || *value < std::numeric_limits<int>::min() || *value > std::numeric_limits<int>::max())
        {
            return std::nullopt;
        }
        return static_cast<int>(*value);
    }
}

std::string Parser::trim(const std::string &s)
{
    const char *whitespace = " \t\r\n\f\v";
    std::size_t first = s.find_first_not_of(whitespace);
    if (first == std::string::npos)
    {
        return "";
    }
    std::size_t last = s.find_last_not_of(whitespace);
    return s.substr(first, last - first + 1);
}

std::optional<long long> Parser::parse_integer(const std::string &text)
{
    if (text.empty())
    {
        return std::nullopt;
    }
    try
    {
        std::size_t pos = 0;
        long long value = std::stoll(text, &pos);
        if (pos != text.size())
        {
            return std::nullopt;
        }
        return value;
    }
    catch (const std::invalid_argument &)
    {
        return std::nullopt;
    }
    catch (const std::out_of_range &)
    {
        return std::nullopt;
    }
}

std::optional<unsigned int> Parser::parse_thread_count(const std::string &text)
{
    std::optional<long long> value = parse_integer(text);
    if (!value || *value < 0 || *value > static_cast<long long>(std::numeric_limits<unsigned int>::max()))
    {
        return std::nullopt;
    }
    return static_cast<unsigned int>(*value);
}

std::optional<double> Parser::parse_ratio(const std::string &text)
{
    if (text.empty())
    {
        return std::nullopt;
    }
    try
    {
        std::size_t pos = 0;
        double value = std::stod(text, &pos);
        if (pos != text.size() || !std::isfinite(value) || value < 0.0 || value > 1.0)
        {
            return std::nullopt;
        }
        return value;
    }
    catch (const std::invalid_argument &)
    {
        return std::nullopt;
    }
    catch (const std::out_of_range &)
    {
        return std::nullopt;
    }
}

bool Parser::is_node_line(const std::string &line)
{
    return starts_with(trim(line), NODE_MARKER);
}

bool Parser::is_ignored_line(const std::string &line)
{
    std::string t = trim(line);
    return t.empty() || t[0] == '#' ||
           starts_with(t, "Placement_File:") ||
           starts_with(t, "Array size:") ||
           t == "Routing:";
}

std::optional<NetHeader> Parser::parse_net_header(const std::string &line)
{
    std::string t = trim(line);
    std::istringstream ss(t);
    std::string keyword, id_token;
    if (!(ss >> keyword >> id_token) || keyword != "Net")
    {
        return std::nullopt;
    }
    if (id_token.empty() || !std::all_of(id_token.begin(), id_token.end(),
                                         [](unsigned char c)
                                         { return std::isdigit(c) != 0; }))
    {
        return std::nullopt;
    }

    std::string rest;
    std::getline(ss, rest);
    rest = trim(rest);
    // Name is at least one character, up to the first ')'
    if (rest.size() < 3 || rest[0] != '(')
    {
        return std::nullopt;
    }
    std::size_t close = rest.find(')', 2);
    if (close == std::string::npos)
    {
        return std::nullopt;
    }

    std::optional<long long> id = parse_integer(id_token);
    if (!id)
    {
        return std::nullopt;
    }

    NetHeader header;
    header.id = *id;
    header.name = rest.substr(1, close - 1);
    return header;
}

std::optional<std::pair<std::string, std::string>> Parser::parse_placement_banner(const std::string &line)
{
    std::istringstream ss(trim(line));
    std::string token;
    if (!(ss >> token) || token != "Placement_File:")
    {
        return std::nullopt;
    }

    std::pair<std::string, std::string> result;
    if (!(ss >> result.first))
    {
        return std::nullopt;
    }
    while (ss >> token)
    {
        if (token == "Placement_ID:" && (ss >> result.second))
        {
            break;
        }
    }
    return result;
}

std::optional<std::pair<int, int>> Parser::parse_array_size(const std::string &line)
{
    // Array size: 12 x 12 logic blocks.
    std::istringstream ss(trim(line));
    std::string array_word, size_word, w_token, x_word, h_token;
    if (!(ss >> array_word >> size_word >> w_token >> x_word >> h_token))
    {
        return std::nullopt;
    }
    if (array_word != "Array" || size_word != "size:" || x_word != "x")
    {
        return std::nullopt;
    }
    std::optional<int> w = to_int(parse_integer(w_token));
    std::optional<int> h = to_int(parse_integer(h_token));
    if (!w || !h)
    {
        return std::nullopt;
    }
    return std::make_pair(*w, *h);
}

NodeRecord Parser::parse_node_line(const std::string &raw_line, int line_number)
{
    std::string line = trim(raw_line);
    if (!starts_with(line, NODE_MARKER))
    {
        throw MalformedLineError("Line " + std::to_string(line_number) + ": missing 'Node:' marker", line_number);
    }

    replace_all(line, "Track::", "Track:");
    replace_all(line, "Switch::", "Switch:");
    replace_all(line, "Pad::", "Pad:");

    std::istringstream ss(line.substr(NODE_MARKER.size()));
    std::vector<std::string> tokens;
    std::string token;
    while (ss >> token)
    {
        tokens.push_back(token);
    }

    if (tokens.size() < 3)
    {
        throw MalformedLineError("Line " + std::to_string(line_number) + ": expected '<id> <kind> (<x>,<y>)', got " +
                                     std::to_string(tokens.size()) + " field(s)",
                                 line_number);
    }

    NodeRecord record;
    record.line_number = line_number;

    std::optional<long long> id = parse_integer(tokens[0]);
    if (!id)
    {
        throw MalformedLineError("Line " + std::to_string(line_number) + ": node id '" + tokens[0] + "' is not an integer", line_number);
    }
    record.id = *id;

    std::optional<NodeKind> kind = node_kind_from_string(tokens[1]);
    if (!kind)
    {
        throw MalformedLineError("Line " + std::to_string(line_number) + ": unknown node kind '" + tokens[1] + "'", line_number);
    }
    record.kind = *kind;

    parse_coordinates(tokens[2], record, line_number);

    std::size_t i = 3;
    while (i < tokens.size())
    {
        const std::string &key_token = tokens[i];
        if (key_token.size() > 1 && key_token.back() == ':' && i + 1 < tokens.size())
        {
            std::string key = key_token;
            while (!key.empty() && key.back() == ':')
            {
                key.pop_back();
            }
            apply_attribute(to_lower(key), tokens[i + 1], record);
            i += 2;
        }
        else
        {
            // Stray token, e.g. the "to (x,y,z)" span suffix of newer VPR versions
            ++i;
        }
    }

    return record;
}

void Parser::parse_coordinates(const std::string &token, NodeRecord &record, int line_number)
{
    std::string coord_str = token;
    while (!coord_str.empty() && coord_str.front() == '(')
    {
        coord_str.erase(coord_str.begin());
    }
    while (!coord_str.empty() && coord_str.back() == ')')
    {
        coord_str.pop_back();
    }

    std::vector<std::string> coords;
    std::stringstream cs(coord_str);
    std::string part;
    while (std::getline(cs, part, ','))
    {
        coords.push_back(trim(part));
    }

    if (coords.empty())
    {
        throw MalformedLineError("Line " + std::to_string(line_number) + ": missing coordinates", line_number);
    }

    std::optional<int> x = to_int(parse_integer(coords[0]));
    if (!x)
    {
        throw MalformedLineError("Line " + std::to_string(line_number) + ": bad coordinates '" + token + "'", line_number);
    }
    record.x = *x;

    if (coords.size() > 1)
    {
        std::optional<int> y = to_int(parse_integer(coords[1]));
        if (!y)
        {
            throw MalformedLineError("Line " + std::to_string(line_number) + ": bad coordinates '" + token + "'", line_number);
        }
        record.y = *y;
    }
    // Third component (layer / ptc) is not used
}

void Parser::apply_attribute(const std::string &key, const std::string &value, NodeRecord &record)
{
    std::optional<long long> number = parse_integer(value);

    if (key == "track")
    {
        if (std::optional<int> track = to_int(number))
            record.track = *track;
        return;
    }
    if (key == "switch")
    {
        if (std::optional<int> switch_id = to_int(number))
            record.switch_id = *switch_id;
        return;
    }
    if (key == "pad")
    {
        if (std::optional<int> pad = to_int(number))
        {
            record.pad = *pad;
            return;
        }
        record.extra_attributes[key] = value;
        return;
    }

    if (number)
    {
        record.extra_attributes[key] = *number;
    }
    else
    {
        record.extra_attributes[key] = value;
    }
}
