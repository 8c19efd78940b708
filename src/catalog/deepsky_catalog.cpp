/// @file deepsky_catalog.cpp

#include "catalog/deepsky_catalog.hpp"

namespace skychart::catalog
{

DeepskyCatalog::DeepskyCatalog(std::vector<DeepSkyObject> objects)
    : m_objects{std::move(objects)}
{
}

std::vector<const DeepSkyObject*> DeepskyCatalog::select(const astro::EquatorialCoord& centre,
                                                         f64 radius_rad) const
{
    std::vector<const DeepSkyObject*> result;
    for (const auto& object : m_objects)
    {
        if (astro::Projection::angular_distance({object.ra, object.dec}, centre) <= radius_rad)
        {
            result.push_back(&object);
        }
    }
    return result;
}

} // namespace skychart::catalog
