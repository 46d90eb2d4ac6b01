#pragma once

#include "core/shared/types.h"

#include <vector>

namespace lc {

struct FusionConfig {
    int rrfK = 60;
    // Negative keeps every fused id.
    int maxResults = 5;
};

// Reciprocal Rank Fusion over any number of ranked lists.
class SearchMerger {
public:
    // Each list contributes 1 / (rrfK + rank + 1) for every id it holds,
    // rank being the 0-based position in that list. Output is ordered by
    // fused score descending, lowest id first on ties.
    static std::vector<FusedHit> fuse(const std::vector<std::vector<SearchHit>>& lists,
                                      const FusionConfig& config = {});

    static double rrfContribution(int rank, int rrfK);
};

} // namespace lc
