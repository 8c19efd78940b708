/// @file deepsky_object.cpp
/// @brief Deep-sky type code parsing.

#include "catalog/deepsky_object.hpp"

namespace skychart::catalog
{

DsoType parse_dso_type(std::string_view code)
{
    if (code == "G")                        return DsoType::Galaxy;
    if (code == "N")                        return DsoType::DiffuseNebula;
    if (code == "PN")                       return DsoType::PlanetaryNebula;
    if (code == "OC" || code == "OCL")      return DsoType::OpenCluster;
    if (code == "GC" || code == "GCL")      return DsoType::GlobularCluster;
    if (code == "SNR")                      return DsoType::SupernovaRemnant;
    if (code == "AST" || code == "STARS")   return DsoType::Asterism;
    if (code == "GALCL")                    return DsoType::GalaxyCluster;
    return DsoType::Unknown;
}

} // namespace skychart::catalog
