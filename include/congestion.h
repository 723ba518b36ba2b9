#ifndef CONGESTION_H
#define CONGESTION_H

#include "structures.h"
#include <map>
#include <vector>

// Per-track usage counts for CHANX/CHANY nodes. Each worker owns its own
// accumulator; results are combined with merge() before normalize().
class CongestionAccumulator
{
public:
    void add(const NodeRecord &record);
    void add_all(const std::vector<NodeRecord> &records);
    void merge(const CongestionAccumulator &other);

    // Divides every count by the maximum count. Empty in, empty out.
    CongestionMap normalize() const;

    const std::map<CongestionKey, long long> &counts() const { return counts_; }
    long long max_count() const;
    bool empty() const { return counts_.empty(); }

private:
    std::map<CongestionKey, long long> counts_;
};

#endif // CONGESTION_H
