/// @file projected_object.cpp
/// @brief Deep-sky projection and label text.

#include "chart/projected_object.hpp"

#include <algorithm>
#include <vector>

#include <spdlog/fmt/fmt.h>

namespace skychart::chart
{

namespace
{

std::string join_names(std::vector<std::string> names, bool sorted)
{
    if (sorted)
    {
        std::sort(names.begin(), names.end());
    }
    std::string joined;
    for (const auto& name : names)
    {
        if (!joined.empty())
        {
            joined += '-';
        }
        joined += name;
    }
    return joined;
}

} // anonymous namespace

std::string deepsky_label(const catalog::DeepSkyObject& object, f64 label_limit)
{
    if (object.messier > 0)
    {
        return fmt::format("M {}", object.messier);
    }
    if (static_cast<f64>(object.mag) > label_limit)
    {
        return {};
    }
    if (object.cat == "NGC")
    {
        return join_names(object.names, true);
    }

    const std::string names = join_names(object.names, false);
    if (names.empty())
    {
        return object.cat;
    }
    if (object.cat.empty())
    {
        return names;
    }
    return object.cat + " " + names;
}

ProjectedObject project_deepsky_object(const catalog::DeepSkyObject& object,
                                       const FieldOfView& fov,
                                       f64 min_radius)
{
    using catalog::DsoType;

    const astro::EquatorialCoord pos{object.ra, object.dec};

    ProjectedObject projected;
    projected.object = &object;
    projected.position = fov.to_map(pos);
    projected.position_angle = object.position_angle
                             + astro::Projection::direction_ddec(pos, fov.centre)
                             + astro_constants::kHalfPi;

    f64 rlong = object.rlong * fov.drawing_scale;
    f64 rshort = object.rshort * fov.drawing_scale;

    projected.seed_radius_mm = object.type == DsoType::GalaxyCluster ? min_radius : std::max(rlong, min_radius);

    if (rlong <= 0.0)
    {
        rlong = min_radius;
        rshort = min_radius;
    }
    else if (rlong <= min_radius)
    {
        rshort *= min_radius / rlong;
        rlong = min_radius;
    }

    if (object.type == DsoType::GalaxyCluster)
    {
        rlong /= 3.0;
    }

    projected.rlong_mm = rlong;
    projected.rshort_mm = rshort;
    return projected;
}

} // namespace skychart::chart
