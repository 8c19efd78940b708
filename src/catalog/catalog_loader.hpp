#pragma once

/// @file catalog_loader.hpp
/// @brief Loads star, deep-sky and constellation catalogs from CSV files.

#include "catalog/constellation.hpp"
#include "catalog/deepsky_object.hpp"
#include "catalog/star_entry.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace skychart::catalog
{
    /// @brief Static utility class for loading catalog files.
    ///
    /// Every loader expects a header row, skips blank lines, logs and skips
    /// malformed lines, and returns std::nullopt when the file cannot be read
    /// or contains no valid rows. Angles in the files are degrees (RA of the
    /// star files too) and are converted to radians.
    class CatalogLoader
    {
    public:
        CatalogLoader() = delete;

        /// @brief Load a field star catalog.
        ///
        /// Expected CSV columns: ID, RA_deg, Dec_deg, Vmag, BV
        /// catalog_id is set to the ID column.
        [[nodiscard]] static std::optional<std::vector<StarEntry>>
            load_star_csv(const std::filesystem::path& path);

        /// @brief Load a deep-sky catalog.
        ///
        /// Expected CSV columns:
        ///   Cat, Names, Type, RA_deg, Dec_deg, Mag, Rlong_arcmin, Rshort_arcmin, PA_deg, Messier
        ///
        /// Names are separated by ';'. The radii, position angle and Messier
        /// columns may be empty (treated as 0). Rshort defaults to Rlong.
        [[nodiscard]] static std::optional<std::vector<DeepSkyObject>>
            load_deepsky_csv(const std::filesystem::path& path);

        /// @brief Load the bright stars referenced by constellation lines.
        ///
        /// Expected CSV columns: Constellation, Greek, RA_deg, Dec_deg, Vmag
        /// The Greek column may be empty.
        [[nodiscard]] static std::optional<std::vector<StarEntry>>
            load_constellation_stars_csv(const std::filesystem::path& path);

        /// @brief Load constellation figures.
        ///
        /// Expected CSV columns: Constellation, From, To
        /// From/To are 1-based line numbers of the bright-star file. Rows are
        /// grouped per constellation in order of first appearance.
        [[nodiscard]] static std::optional<std::vector<Constellation>>
            load_constellation_lines_csv(const std::filesystem::path& path);

        /// @brief Load both constellation files into one catalog.
        [[nodiscard]] static std::optional<ConstellationCatalog>
            load_constellations(const std::filesystem::path& stars_path,
                                const std::filesystem::path& lines_path);

    private:
        /// @brief Split a CSV line on @p separator without trimming.
        [[nodiscard]] static std::vector<std::string_view> split(std::string_view line, char separator);

        /// @brief Trim leading and trailing whitespace from a string_view.
        [[nodiscard]] static std::string_view trim(std::string_view sv);

        /// @brief Parse a single f64 value from a trimmed string_view.
        /// @return The parsed value, or std::nullopt on failure.
        [[nodiscard]] static std::optional<f64> parse_f64(std::string_view sv);

        /// @brief Parse an optional f64: an empty field yields @p fallback.
        [[nodiscard]] static std::optional<f64> parse_f64_or(std::string_view sv, f64 fallback);

        /// @brief Parse a single u32 value from a trimmed string_view.
        /// @return The parsed value, or std::nullopt on failure.
        [[nodiscard]] static std::optional<u32> parse_u32(std::string_view sv);
    };

} // namespace skychart::catalog
