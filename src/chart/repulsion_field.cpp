/// @file repulsion_field.cpp
/// @brief RepulsionField implementation.

#include "chart/repulsion_field.hpp"

#include "core/logger.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace skychart::chart
{

RepulsionField::RepulsionField(f64 field_radius_mm, const std::vector<FieldSeed>& seeds)
    : m_min_size{kMinSizeFraction * std::abs(field_radius_mm)}
{
    m_sources.reserve(seeds.size() * 2);
    for (const auto& seed : seeds)
    {
        add_source(seed.position, seed.radius_mm);
    }
    SKC_CORE_TRACE("RepulsionField: {} seed sources, min size {:.4f} mm", m_sources.size(), m_min_size);
}

void RepulsionField::add_source(Vec2d position, f64 size)
{
    // Keeps the kernel finite and strictly decreasing even for zero-sized sources.
    const f64 s = std::max(std::isfinite(size) ? size : 0.0, m_min_size);
    const f64 s_sq = std::max(s * s, std::numeric_limits<f64>::min());
    m_sources.push_back(Source{position, s_sq});
}

f64 RepulsionField::potential(Vec2d point) const
{
    return potential(point, kNoSource);
}

f64 RepulsionField::potential(Vec2d point, std::size_t excluded_source) const
{
    f64 total = 0.0;
    for (std::size_t i = 0; i < m_sources.size(); ++i)
    {
        if (i == excluded_source)
        {
            continue;
        }
        const Vec2d d = point - m_sources[i].position;
        total += m_sources[i].size_sq / (glm::dot(d, d) + m_sources[i].size_sq);
    }
    return total;
}

void RepulsionField::add_position(Vec2d centre, f64 length_mm)
{
    add_source(centre, length_mm / 2.0);
}

} // namespace skychart::chart
