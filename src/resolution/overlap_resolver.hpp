#ifndef PHISCRUB_RESOLUTION_OVERLAP_RESOLVER_HPP
#define PHISCRUB_RESOLUTION_OVERLAP_RESOLVER_HPP

#include <algorithm>
#include <vector>

#include "core/entity.hpp"

/**
 * @file overlap_resolver.hpp
 * @brief Turns raw, possibly overlapping candidates into a disjoint set.
 *
 * Candidates are stable-sorted ascending on (-length, confidence, severity):
 * longer spans first; on equal length the LOWER confidence comes first, then
 * the LOWER severity. The sorted list is walked greedily and a candidate is
 * accepted only if it intersects no accepted span.
 *
 * The equal-length tie-break favours the less confident, less severe
 * candidate. It is kept as-is; see DESIGN.md before changing it.
 *
 * The result is in acceptance order, not detection order.
 */

namespace phiscrub {
namespace resolution {

class OverlapResolver
{
public:
    /// Sort key comparison: true if @p a is tried before @p b.
    static bool triedBefore(const core::Entity &a, const core::Entity &b)
    {
        if (a.length() != b.length()) {
            return a.length() > b.length();
        }
        if (a.confidence != b.confidence) {
            return a.confidence < b.confidence;
        }
        return core::severityRank(a.severity) < core::severityRank(b.severity);
    }

    /**
     * @brief Resolve @p candidates into a disjoint subset.
     *        Equal keys keep their input order.
     */
    static std::vector<core::Entity> resolve(const std::vector<core::Entity> &candidates)
    {
        std::vector<core::Entity> sorted(candidates);
        std::stable_sort(sorted.begin(), sorted.end(), triedBefore);

        std::vector<core::Entity> accepted;
        for (auto &candidate : sorted) {
            bool clash = std::any_of(accepted.begin(), accepted.end(),
                                     [&candidate](const core::Entity &kept) {
                                         return candidate.overlaps(kept);
                                     });
            if (!clash) {
                accepted.push_back(std::move(candidate));
            }
        }
        return accepted;
    }
};

} // namespace resolution
} // namespace phiscrub

#endif // PHISCRUB_RESOLUTION_OVERLAP_RESOLVER_HPP
