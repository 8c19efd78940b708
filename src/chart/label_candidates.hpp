#pragma once

/// @file label_candidates.hpp
/// @brief The four candidate label positions around a chart symbol.

#include "core/types.hpp"
#include "graphics/surface.hpp"

#include <array>
#include <cstddef>

namespace skychart::chart
{
    /// @brief Candidate index. The order is fixed for every symbol shape.
    enum class LabelSlot : u8
    {
        Below = 0,
        Above = 1,
        Left  = 2,
        Right = 3,
    };

    inline constexpr std::size_t kCandidateCount = 4;

    /// @brief One proposed label position.
    ///
    /// start, center and end lie on the horizontal line through the vertical
    /// middle of the text, with start.x <= center.x <= end.x in the frame the
    /// candidate was built in. anchor tells which of the three points the text
    /// is attached to when drawn.
    struct LabelCandidate
    {
        Vec2d start{0.0};
        Vec2d center{0.0};
        Vec2d end{0.0};
        graphics::TextAnchor anchor = graphics::TextAnchor::Centre;
    };

    using CandidateList = std::array<LabelCandidate, kCandidateCount>;

    /// @brief Candidates around a box of half extents (@p half_width, @p half_height)
    ///        centred on the origin: centred below, centred above, ending left, starting right.
    ///
    /// A margin of font_size/2 separates the text middle from the top and
    /// bottom edges, font_size/6 separates the text from the side edges.
    [[nodiscard]] CandidateList box_candidates(f64 half_width, f64 half_height,
                                               f64 label_width, f64 font_size);

    /// @brief Box candidates with an explicit gap between the text middle and
    ///        the top and bottom edges.
    [[nodiscard]] CandidateList box_candidates(f64 half_width, f64 half_height, f64 vertical_margin,
                                               f64 label_width, f64 font_size);

    /// @brief Candidates around a circular symbol whose ink reaches @p outer_radius.
    ///
    /// Same layout as a square box of that half size: symbols with ticks
    /// beyond the circle pass the tick length.
    [[nodiscard]] CandidateList circle_candidates(f64 outer_radius, f64 label_width, f64 font_size);

    /// @brief Candidates around a diamond of @p half_diagonal.
    ///
    /// The labels above and below keep 2·font_size/3 from the corners.
    [[nodiscard]] CandidateList diamond_candidates(f64 half_diagonal, f64 label_width, f64 font_size);

    /// @brief A label starting at the lower right of a circle, tucked against
    ///        the rim at the chord where the text's near corner meets it.
    ///
    /// Used for Greek letters beside constellation stars, which are not placed
    /// through the repulsion field.
    [[nodiscard]] LabelCandidate rim_candidate(f64 radius, f64 label_width, f64 font_size);

    /// @brief Half-angle from the vertical at which a rim-tucked label meets the circle.
    ///
    /// arccos(1 - 2·font_size / (3·radius)), clamped to π/2 when the font is
    /// large compared with the circle or the radius is not positive.
    [[nodiscard]] f64 circle_label_angle(f64 radius, f64 font_size);

    /// @brief Move candidates built around the origin to @p centre, rotated by @p angle.
    [[nodiscard]] CandidateList transform_candidates(const CandidateList& local, Vec2d centre, f64 angle);

    /// @brief Reduce an ellipse orientation into (-π/2, π/2].
    [[nodiscard]] f64 normalize_position_angle(f64 angle);

} // namespace skychart::chart
