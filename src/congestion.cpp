#include "../include/congestion.h"
#include <algorithm>

void CongestionAccumulator::add(const NodeRecord &record)
{
    if (!is_channel_kind(record.kind))
    {
        return;
    }
    CongestionKey key;
    key.kind = record.kind;
    key.x = record.x;
    key.y = record.y;
    key.track = record.track;
    counts_[key]++;
}

void CongestionAccumulator::add_all(const std::vector<NodeRecord> &records)
{
    for (const auto &record : records)
    {
        add(record);
    }
}

void CongestionAccumulator::merge(const CongestionAccumulator &other)
{
    for (const auto &entry : other.counts_)
    {
        counts_[entry.first] += entry.second;
    }
}

long long CongestionAccumulator::max_count() const
{
    long long max_usage = 0;
    for (const auto &entry : counts_)
    {
        max_usage = std::max(max_usage, entry.second);
    }
    return max_usage;
}

CongestionMap CongestionAccumulator::normalize() const
{
    CongestionMap congestion;
    long long max_usage = max_count();
    if (max_usage <= 0)
    {
        return congestion;
    }
    for (const auto &entry : counts_)
    {
        congestion[entry.first] = static_cast<double>(entry.second) / static_cast<double>(max_usage);
    }
    return congestion;
}
