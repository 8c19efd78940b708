#pragma once

/// @file label_placer.hpp
/// @brief Greedy choice of a label candidate against the repulsion field.

#include "chart/label_candidates.hpp"
#include "chart/repulsion_field.hpp"

#include <cstddef>

namespace skychart::chart
{
    /// @brief Index of the candidate whose center has the lowest potential.
    ///
    /// Ties go to the lowest index. @p excluded_source (usually the labelled
    /// symbol's own seed) is left out of the scoring.
    [[nodiscard]] std::size_t select_candidate(const RepulsionField& field,
                                               const CandidateList& candidates,
                                               std::size_t excluded_source = RepulsionField::kNoSource);

    /// @brief Record @p candidate as occupied by a label of @p label_width.
    void commit_candidate(RepulsionField& field, const LabelCandidate& candidate, f64 label_width);

    /// @brief select_candidate() followed by commit_candidate() on the winner.
    /// @return The selected index.
    std::size_t place_label(RepulsionField& field,
                            const CandidateList& candidates,
                            f64 label_width,
                            std::size_t excluded_source = RepulsionField::kNoSource);

} // namespace skychart::chart
