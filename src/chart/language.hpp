#pragma once

/// @file language.hpp
/// @brief Legend translations and the Bayer Greek-letter table.

#include "core/types.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace skychart::chart
{
    enum class Language : u8
    {
        English,
        Dutch,
    };

    /// @brief Entries of the deep-sky symbol legend.
    enum class LegendSymbol : u8
    {
        Galaxy,
        OpenCluster,
        GlobularCluster,
        Asterism,
        PlanetaryNebula,
        DiffuseNebula,
        SupernovaRemnant,
        GalaxyPart,
    };

    inline constexpr std::size_t kLegendSymbolCount = 8;

    struct LanguageTable
    {
        std::string_view hour_unit;
        std::string_view minute_unit;
        std::string_view second_unit;
        std::array<std::string_view, kLegendSymbolCount> symbol_names;

        [[nodiscard]] std::string_view symbol_name(LegendSymbol symbol) const
        {
            return symbol_names[static_cast<std::size_t>(symbol)];
        }
    };

    [[nodiscard]] const LanguageTable& language_table(Language language);

    /// @brief Language from a code such as "en" or "nl" (case-insensitive).
    [[nodiscard]] std::optional<Language> parse_language(std::string_view code);

    /// @brief UTF-8 Greek letter for a Bayer abbreviation ("alp" -> "α").
    [[nodiscard]] std::optional<std::string_view> greek_letter(std::string_view abbreviation);

} // namespace skychart::chart
