/// @file label_placer.cpp
/// @brief Label selection and commit.

#include "chart/label_placer.hpp"

#include "core/logger.hpp"

#include <limits>

namespace skychart::chart
{

std::size_t select_candidate(const RepulsionField& field,
                             const CandidateList& candidates,
                             std::size_t excluded_source)
{
    std::size_t best = 0;
    f64 best_potential = std::numeric_limits<f64>::infinity();

    for (std::size_t i = 0; i < candidates.size(); ++i)
    {
        const f64 potential = field.potential(candidates[i].center, excluded_source);
        if (potential < best_potential)
        {
            best_potential = potential;
            best = i;
        }
    }
    return best;
}

void commit_candidate(RepulsionField& field, const LabelCandidate& candidate, f64 label_width)
{
    field.add_position(candidate.center, label_width);
}

std::size_t place_label(RepulsionField& field,
                        const CandidateList& candidates,
                        f64 label_width,
                        std::size_t excluded_source)
{
    const std::size_t slot = select_candidate(field, candidates, excluded_source);
    commit_candidate(field, candidates[slot], label_width);
    SKC_CORE_TRACE("Label placed in slot {} at ({:.2f}, {:.2f})",
                   slot, candidates[slot].center.x, candidates[slot].center.y);
    return slot;
}

} // namespace skychart::chart
