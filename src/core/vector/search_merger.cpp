#include "core/vector/search_merger.h"

#include <algorithm>
#include <cstdint>
#include <unordered_map>
#include <unordered_set>

namespace lc {

double SearchMerger::rrfContribution(int rank, int rrfK)
{
    const int denom = std::max(0, rrfK) + std::max(0, rank) + 1;
    return 1.0 / static_cast<double>(denom);
}

std::vector<FusedHit> SearchMerger::fuse(const std::vector<std::vector<SearchHit>>& lists,
                                         const FusionConfig& config)
{
    std::unordered_map<int64_t, double> scores;

    for (const auto& list : lists) {
        // A source listing the same id twice only counts its best position.
        std::unordered_set<int64_t> seen;
        seen.reserve(list.size());
        for (size_t position = 0; position < list.size(); ++position) {
            const int64_t id = list[position].id;
            if (!seen.insert(id).second) {
                continue;
            }
            scores[id] += rrfContribution(static_cast<int>(position), config.rrfK);
        }
    }

    std::vector<FusedHit> fused;
    fused.reserve(scores.size());
    for (const auto& [id, score] : scores) {
        fused.push_back(FusedHit{id, score});
    }

    std::sort(fused.begin(), fused.end(), [](const FusedHit& a, const FusedHit& b) {
        if (a.fusedScore != b.fusedScore) {
            return a.fusedScore > b.fusedScore;
        }
        return a.id < b.id;
    });

    if (config.maxResults >= 0 && static_cast<int>(fused.size()) > config.maxResults) {
        fused.resize(static_cast<size_t>(config.maxResults));
    }
    return fused;
}

} // namespace lc
