/// @file label_candidates.cpp
/// @brief Candidate geometry for boxes, circles and diamonds.

#include "chart/label_candidates.hpp"

#include <algorithm>
#include <cmath>

namespace skychart::chart
{

namespace
{

using graphics::TextAnchor;

LabelCandidate centred_at(Vec2d center, f64 label_width)
{
    const Vec2d half{label_width / 2.0, 0.0};
    return LabelCandidate{center - half, center, center + half, TextAnchor::Centre};
}

LabelCandidate starting_at(Vec2d start, f64 label_width)
{
    const Vec2d half{label_width / 2.0, 0.0};
    return LabelCandidate{start, start + half, start + 2.0 * half, TextAnchor::Start};
}

LabelCandidate ending_at(Vec2d end, f64 label_width)
{
    const Vec2d half{label_width / 2.0, 0.0};
    return LabelCandidate{end - 2.0 * half, end - half, end, TextAnchor::End};
}

Vec2d rotate_point(Vec2d p, f64 c, f64 s)
{
    return Vec2d{c * p.x - s * p.y, s * p.x + c * p.y};
}

} // anonymous namespace

CandidateList box_candidates(f64 half_width, f64 half_height, f64 label_width, f64 font_size)
{
    return box_candidates(half_width, half_height, font_size / 2.0, label_width, font_size);
}

CandidateList box_candidates(f64 half_width, f64 half_height, f64 vertical_margin,
                             f64 label_width, f64 font_size)
{
    const f64 fh = font_size;
    const f64 w = std::max(half_width, 0.0);
    const f64 h = std::max(half_height, 0.0);

    return CandidateList{
        centred_at(Vec2d{0.0, -h - vertical_margin}, label_width),
        centred_at(Vec2d{0.0, h + vertical_margin}, label_width),
        ending_at(Vec2d{-w - fh / 6.0, 0.0}, label_width),
        starting_at(Vec2d{w + fh / 6.0, 0.0}, label_width),
    };
}

f64 circle_label_angle(f64 radius, f64 font_size)
{
    if (radius <= 0.0)
    {
        return astro_constants::kHalfPi;
    }
    const f64 arg = 1.0 - 2.0 * font_size / (3.0 * radius);
    if (arg <= -1.0 || arg >= 1.0)
    {
        return astro_constants::kHalfPi;
    }
    return std::min(std::acos(arg), astro_constants::kHalfPi);
}

CandidateList circle_candidates(f64 outer_radius, f64 label_width, f64 font_size)
{
    const f64 r = std::max(outer_radius, 0.0);
    return box_candidates(r, r, label_width, font_size);
}

CandidateList diamond_candidates(f64 half_diagonal, f64 label_width, f64 font_size)
{
    return box_candidates(half_diagonal, half_diagonal, 2.0 * font_size / 3.0, label_width, font_size);
}

LabelCandidate rim_candidate(f64 radius, f64 label_width, f64 font_size)
{
    const f64 fh = font_size;
    const f64 r = std::max(radius, 0.0);
    const f64 a = circle_label_angle(r, fh);
    return starting_at(Vec2d{r * std::sin(a) + fh / 6.0, -r + fh / 3.0}, label_width);
}

CandidateList transform_candidates(const CandidateList& local, Vec2d centre, f64 angle)
{
    const f64 c = std::cos(angle);
    const f64 s = std::sin(angle);

    CandidateList result = local;
    for (auto& candidate : result)
    {
        candidate.start = centre + rotate_point(candidate.start, c, s);
        candidate.center = centre + rotate_point(candidate.center, c, s);
        candidate.end = centre + rotate_point(candidate.end, c, s);
    }
    return result;
}

f64 normalize_position_angle(f64 angle)
{
    f64 p = std::remainder(angle, astro_constants::kPi);
    if (p <= -astro_constants::kHalfPi)
    {
        p += astro_constants::kPi;
    }
    return p;
}

} // namespace skychart::chart
