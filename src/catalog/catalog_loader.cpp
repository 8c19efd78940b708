/// @file catalog_loader.cpp
/// @brief Implementation of the CSV catalog loaders.

#include "catalog/catalog_loader.hpp"

#include "core/logger.hpp"
#include "core/types.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <functional>
#include <iterator>
#include <string>
#include <vector>

namespace skychart::catalog
{

namespace
{

/// @brief Row callback: receives the split fields and the 1-based line number.
/// Returns false when the row is malformed.
using RowHandler = std::function<bool(const std::vector<std::string_view>&, u32)>;

/// @brief Shared CSV driver: opens @p path, skips the header, feeds rows.
/// @return Number of accepted rows, or std::nullopt when the file is unreadable.
std::optional<u32> read_rows(const std::filesystem::path& path,
                             std::size_t column_count,
                             const std::function<std::vector<std::string_view>(std::string_view)>& splitter,
                             const RowHandler& handler)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        SKC_CORE_ERROR("CatalogLoader: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    std::string line;

    // Skip header line
    if (!std::getline(file, line))
    {
        SKC_CORE_ERROR("CatalogLoader: File is empty: {}", path.string());
        return std::nullopt;
    }

    u32 line_number = 1;
    u32 accepted = 0;
    u32 skipped = 0;

    while (std::getline(file, line))
    {
        ++line_number;

        if (line.empty() || line == "\r")
        {
            continue;
        }

        const auto fields = splitter(line);
        if (fields.size() != column_count)
        {
            SKC_CORE_WARN("CatalogLoader: Malformed line {}: {}", line_number, line);
            ++skipped;
            continue;
        }

        if (!handler(fields, line_number))
        {
            SKC_CORE_WARN("CatalogLoader: Failed to parse values on line {}: {}",
                          line_number, line);
            ++skipped;
            continue;
        }

        ++accepted;
    }

    if (skipped > 0)
    {
        SKC_CORE_WARN("CatalogLoader: Skipped {} malformed lines in {}", skipped, path.string());
    }

    return accepted;
}

} // anonymous namespace

// -----------------------------------------------------------------
// Field stars: ID,RA_deg,Dec_deg,Vmag,BV
// -----------------------------------------------------------------

std::optional<std::vector<StarEntry>>
CatalogLoader::load_star_csv(const std::filesystem::path& path)
{
    std::vector<StarEntry> stars;

    const auto rows = read_rows(path, 5,
        [](std::string_view line) { return split(line, ','); },
        [&stars](const std::vector<std::string_view>& f, u32 /*line_number*/)
        {
            const auto id      = parse_u32(trim(f[0]));
            const auto ra_deg  = parse_f64(trim(f[1]));
            const auto dec_deg = parse_f64(trim(f[2]));
            const auto mag_v   = parse_f64(trim(f[3]));
            const auto bv      = parse_f64_or(trim(f[4]), 0.0);

            if (!id || !ra_deg || !dec_deg || !mag_v || !bv)
            {
                return false;
            }

            stars.push_back(StarEntry{
                .ra         = *ra_deg * astro_constants::kDegToRad,
                .dec        = *dec_deg * astro_constants::kDegToRad,
                .mag_v      = static_cast<f32>(*mag_v),
                .color_bv   = static_cast<f32>(*bv),
                .catalog_id = *id,
            });
            return true;
        });

    if (!rows)
    {
        return std::nullopt;
    }

    if (stars.empty())
    {
        SKC_CORE_ERROR("CatalogLoader: No valid stars found in: {}", path.string());
        return std::nullopt;
    }

    SKC_CORE_INFO("CatalogLoader: Loaded {} stars from {}", stars.size(), path.string());

    return stars;
}

// -----------------------------------------------------------------
// Deep-sky: Cat,Names,Type,RA_deg,Dec_deg,Mag,Rlong_arcmin,Rshort_arcmin,PA_deg,Messier
// -----------------------------------------------------------------

std::optional<std::vector<DeepSkyObject>>
CatalogLoader::load_deepsky_csv(const std::filesystem::path& path)
{
    std::vector<DeepSkyObject> objects;

    const auto rows = read_rows(path, 10,
        [](std::string_view line) { return split(line, ','); },
        [&objects](const std::vector<std::string_view>& f, u32 /*line_number*/)
        {
            const auto ra_deg  = parse_f64(trim(f[3]));
            const auto dec_deg = parse_f64(trim(f[4]));
            const auto mag     = parse_f64(trim(f[5]));
            const auto rlong   = parse_f64_or(trim(f[6]), 0.0);
            const auto rshort  = parse_f64_or(trim(f[7]), rlong.value_or(0.0));
            const auto pa_deg  = parse_f64_or(trim(f[8]), 0.0);

            std::optional<u32> messier = 0;
            if (!trim(f[9]).empty())
            {
                messier = parse_u32(trim(f[9]));
            }

            if (!ra_deg || !dec_deg || !mag || !rlong || !rshort || !pa_deg || !messier)
            {
                return false;
            }

            std::vector<std::string> names;
            for (const auto name : split(f[1], ';'))
            {
                const auto trimmed = trim(name);
                if (!trimmed.empty())
                {
                    names.emplace_back(trimmed);
                }
            }

            const f64 rl = *rlong * astro_constants::kArcMinToRad;
            const f64 rs = *rshort * astro_constants::kArcMinToRad;

            objects.push_back(DeepSkyObject{
                .ra             = *ra_deg * astro_constants::kDegToRad,
                .dec            = *dec_deg * astro_constants::kDegToRad,
                .type           = parse_dso_type(trim(f[2])),
                .rlong          = std::max(rl, rs),
                .rshort         = std::min(rl, rs),
                .position_angle = *pa_deg * astro_constants::kDegToRad,
                .mag            = static_cast<f32>(*mag),
                .messier        = *messier,
                .cat            = std::string(trim(f[0])),
                .names          = std::move(names),
            });
            return true;
        });

    if (!rows)
    {
        return std::nullopt;
    }

    if (objects.empty())
    {
        SKC_CORE_ERROR("CatalogLoader: No valid deep-sky objects found in: {}", path.string());
        return std::nullopt;
    }

    SKC_CORE_INFO("CatalogLoader: Loaded {} deep-sky objects from {}", objects.size(), path.string());

    return objects;
}

// -----------------------------------------------------------------
// Constellation bright stars: Constellation,Greek,RA_deg,Dec_deg,Vmag
// -----------------------------------------------------------------

std::optional<std::vector<StarEntry>>
CatalogLoader::load_constellation_stars_csv(const std::filesystem::path& path)
{
    std::vector<StarEntry> stars;

    const auto rows = read_rows(path, 5,
        [](std::string_view line) { return split(line, ','); },
        [&stars](const std::vector<std::string_view>& f, u32 line_number)
        {
            const auto ra_deg  = parse_f64(trim(f[2]));
            const auto dec_deg = parse_f64(trim(f[3]));
            const auto mag_v   = parse_f64(trim(f[4]));

            if (!ra_deg || !dec_deg || !mag_v)
            {
                return false;
            }

            stars.push_back(StarEntry{
                .ra            = *ra_deg * astro_constants::kDegToRad,
                .dec           = *dec_deg * astro_constants::kDegToRad,
                .mag_v         = static_cast<f32>(*mag_v),
                .catalog_id    = line_number - 1,
                .greek         = std::string(trim(f[1])),
                .constellation = std::string(trim(f[0])),
            });
            return true;
        });

    if (!rows)
    {
        return std::nullopt;
    }

    if (stars.empty())
    {
        SKC_CORE_ERROR("CatalogLoader: No valid constellation stars found in: {}", path.string());
        return std::nullopt;
    }

    SKC_CORE_INFO("CatalogLoader: Loaded {} constellation stars from {}", stars.size(), path.string());

    return stars;
}

// -----------------------------------------------------------------
// Constellation lines: Constellation,From,To
// -----------------------------------------------------------------

std::optional<std::vector<Constellation>>
CatalogLoader::load_constellation_lines_csv(const std::filesystem::path& path)
{
    std::vector<Constellation> constellations;

    const auto rows = read_rows(path, 3,
        [](std::string_view line) { return split(line, ','); },
        [&constellations](const std::vector<std::string_view>& f, u32 /*line_number*/)
        {
            const auto name = trim(f[0]);
            const auto from = parse_u32(trim(f[1]));
            const auto to   = parse_u32(trim(f[2]));

            if (name.empty() || !from || !to)
            {
                return false;
            }

            auto it = std::find_if(constellations.begin(), constellations.end(),
                                   [name](const Constellation& c) { return c.abbreviation == name; });
            if (it == constellations.end())
            {
                constellations.push_back(Constellation{.abbreviation = std::string(name), .lines = {}});
                it = std::prev(constellations.end());
            }
            it->lines.emplace_back(*from, *to);
            return true;
        });

    if (!rows)
    {
        return std::nullopt;
    }

    if (constellations.empty())
    {
        SKC_CORE_ERROR("CatalogLoader: No valid constellation lines found in: {}", path.string());
        return std::nullopt;
    }

    SKC_CORE_INFO("CatalogLoader: Loaded {} constellations from {}", constellations.size(), path.string());

    return constellations;
}

std::optional<ConstellationCatalog>
CatalogLoader::load_constellations(const std::filesystem::path& stars_path,
                                   const std::filesystem::path& lines_path)
{
    auto stars = load_constellation_stars_csv(stars_path);
    if (!stars)
    {
        return std::nullopt;
    }

    auto lines = load_constellation_lines_csv(lines_path);
    if (!lines)
    {
        return std::nullopt;
    }

    ConstellationCatalog catalog{
        .bright_stars   = std::move(*stars),
        .constellations = std::move(*lines),
    };

    // Dangling indices are dropped here so drawing never has to check them.
    for (auto& constellation : catalog.constellations)
    {
        const auto before = constellation.lines.size();
        std::erase_if(constellation.lines, [&catalog](const std::pair<u32, u32>& line) {
            return catalog.star_for_index(line.first) == nullptr ||
                   catalog.star_for_index(line.second) == nullptr;
        });
        if (constellation.lines.size() != before)
        {
            SKC_CORE_WARN("CatalogLoader: {} has {} lines referencing unknown stars",
                          constellation.abbreviation, before - constellation.lines.size());
        }
    }

    return catalog;
}

// -----------------------------------------------------------------
// Utility: split on a separator
// -----------------------------------------------------------------

std::vector<std::string_view> CatalogLoader::split(std::string_view line, char separator)
{
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    while (true)
    {
        const auto pos = line.find(separator, start);
        if (pos == std::string_view::npos)
        {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

// -----------------------------------------------------------------
// Utility: trim whitespace
// -----------------------------------------------------------------

std::string_view CatalogLoader::trim(std::string_view sv)
{
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t' || sv.front() == '\r'))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    {
        sv.remove_suffix(1);
    }
    return sv;
}

// -----------------------------------------------------------------
// Utility: parse f64 from string_view
// -----------------------------------------------------------------

std::optional<f64> CatalogLoader::parse_f64(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    f64 value = 0.0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }

    return value;
}

std::optional<f64> CatalogLoader::parse_f64_or(std::string_view sv, f64 fallback)
{
    if (sv.empty())
    {
        return fallback;
    }
    return parse_f64(sv);
}

// -----------------------------------------------------------------
// Utility: parse u32 from string_view
// -----------------------------------------------------------------

std::optional<u32> CatalogLoader::parse_u32(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    u32 value = 0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }

    return value;
}

} // namespace skychart::catalog
