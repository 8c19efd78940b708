/// @file language.cpp
/// @brief Translation tables.

#include "chart/language.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

namespace skychart::chart
{

namespace
{

// Symbol names follow the LegendSymbol order.
constexpr LanguageTable kEnglish{
    .hour_unit = "h",
    .minute_unit = "m",
    .second_unit = "s",
    .symbol_names = {
        "Galaxy",
        "Open cluster",
        "Globular cluster",
        "Asterism",
        "Planetary nebula",
        "Diffuse nebula",
        "Supernova remnant",
        "Part of external galaxy",
    },
};

constexpr LanguageTable kDutch{
    .hour_unit = "u",
    .minute_unit = "m",
    .second_unit = "s",
    .symbol_names = {
        "Sterrenstelsel",
        "Open sterrenhoop",
        "Bolhoop",
        "Groepje sterren",
        "Planetaire nevel",
        "Diffuse emissienevel",
        "Supernovarest",
        "Deel van sterrenstelsel",
    },
};

constexpr std::array<std::pair<std::string_view, std::string_view>, 24> kGreekLetters{{
    {"alp", "α"}, {"bet", "β"}, {"gam", "γ"}, {"del", "δ"},
    {"eps", "ε"}, {"zet", "ζ"}, {"eta", "η"}, {"the", "θ"},
    {"iot", "ι"}, {"kap", "κ"}, {"lam", "λ"}, {"mu", "μ"},
    {"nu", "ν"},  {"xi", "ξ"},  {"omi", "ο"}, {"pi", "π"},
    {"rho", "ρ"}, {"sig", "σ"}, {"tau", "τ"}, {"ups", "υ"},
    {"phi", "φ"}, {"chi", "χ"}, {"psi", "ψ"}, {"ome", "ω"},
}};

} // anonymous namespace

const LanguageTable& language_table(Language language)
{
    switch (language)
    {
        case Language::English: return kEnglish;
        case Language::Dutch:   return kDutch;
    }
    return kEnglish;
}

std::optional<Language> parse_language(std::string_view code)
{
    std::string lower(code);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "en") return Language::English;
    if (lower == "nl") return Language::Dutch;
    return std::nullopt;
}

std::optional<std::string_view> greek_letter(std::string_view abbreviation)
{
    const auto it = std::find_if(kGreekLetters.begin(), kGreekLetters.end(),
                                 [abbreviation](const auto& entry) { return entry.first == abbreviation; });
    if (it == kGreekLetters.end())
    {
        return std::nullopt;
    }
    return it->second;
}

} // namespace skychart::chart
