/// @file main.cpp
/// @brief Skychart command-line driver: parse options, load catalogs, render one chart.

#include "catalog/catalog_loader.hpp"
#include "catalog/deepsky_catalog.hpp"
#include "catalog/star_catalog.hpp"
#include "chart/chart_engine.hpp"
#include "chart/field_of_view.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "graphics/cairo_surface.hpp"
#include "graphics/recording_surface.hpp"

#include <getopt.h>

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace skychart;

namespace
{

constexpr std::string_view kUsage =
    "Usage: skychart [options] <output.pdf|output.svg|output.png>\n"
    "\n"
    "Field:\n"
    "  --ra HOURS                 Right ascension of the field centre\n"
    "  --dec DEGREES              Declination of the field centre\n"
    "  --radius DEGREES           Field radius (default 2)\n"
    "  --width MM                 Width of the map (default 180)\n"
    "\n"
    "Catalogs (CSV):\n"
    "  --stars FILE               Field stars\n"
    "  --deepsky FILE             Deep-sky objects\n"
    "  --constellation-stars FILE Bright stars of the constellation figures\n"
    "  --constellation-lines FILE Constellation figures\n"
    "  --extra RA_H,DEC_DEG,LABEL[,SLOT]  Extra marked position (repeatable)\n"
    "\n"
    "Appearance:\n"
    "  --lm MAG                   Limiting star magnitude (default 13.8)\n"
    "  --label-lm MAG             Faintest labelled deep-sky object (default 15)\n"
    "  --caption TEXT             Caption above the map\n"
    "  --language en|nl           Legend language\n"
    "  --mirror-x, --mirror-y     Flip the map horizontally / vertically\n"
    "  --invert                   White on black\n"
    "  --dso-legend               Draw the deep-sky symbol legend\n"
    "  --star-border-lw MM, --open-cluster-lw MM, --dso-lw MM,\n"
    "  --legend-lw MM, --constellation-lw MM   Line widths\n"
    "\n"
    "Logging:\n"
    "  --verbose                  Log render progress in detail\n"
    "  --quiet                    Log warnings and errors only\n"
    "  --log-file FILE            Also write a rotating log file\n"
    "\n"
    "  --dry-run                  Render in memory only and print a summary\n"
    "  --help                     Show this text\n";

enum class CliOption : int
{
    Ra = 256,
    Dec,
    Radius,
    Width,
    Stars,
    Deepsky,
    ConstellationStars,
    ConstellationLines,
    LimitingMagnitude,
    LabelMagnitude,
    Caption,
    Language,
    MirrorX,
    MirrorY,
    Invert,
    DsoLegend,
    Extra,
    StarBorderLw,
    OpenClusterLw,
    DsoLw,
    LegendLw,
    ConstellationLw,
    Verbose,
    Quiet,
    LogFile,
    DryRun,
    Help,
};

struct CliOptions
{
    f64 ra_hours = 0.0;
    f64 dec_deg = 0.0;
    f64 radius_deg = 2.0;
    std::filesystem::path stars_path;
    std::filesystem::path deepsky_path;
    std::filesystem::path constellation_stars_path;
    std::filesystem::path constellation_lines_path;
    std::vector<chart::ExtraPosition> extras;
    chart::ChartOptions chart{};
    core::LogConfig logging{};
    std::filesystem::path output;
    bool dry_run = false;
};

std::optional<f64> parse_number(std::string_view text)
{
    const std::string owned(text);
    char* end = nullptr;
    const f64 value = std::strtod(owned.c_str(), &end);
    if (owned.empty() || end != owned.c_str() + owned.size())
    {
        return std::nullopt;
    }
    return value;
}

/// @brief Read a numeric option argument or report it and fail.
bool read_number(const char* option, const char* argument, f64& target)
{
    const auto value = parse_number(argument != nullptr ? argument : "");
    if (!value)
    {
        SKC_ERROR("Option --{} expects a number, got '{}'", option, argument != nullptr ? argument : "");
        return false;
    }
    target = *value;
    return true;
}

/// @brief Parse "ra_hours,dec_degrees,label[,slot]".
std::optional<chart::ExtraPosition> parse_extra(std::string_view text)
{
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    while (true)
    {
        const std::size_t comma = text.find(',', start);
        fields.push_back(text.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start));
        if (comma == std::string_view::npos)
        {
            break;
        }
        start = comma + 1;
    }
    if (fields.size() < 3 || fields.size() > 4)
    {
        return std::nullopt;
    }

    const auto ra = parse_number(fields[0]);
    const auto dec = parse_number(fields[1]);
    if (!ra || !dec)
    {
        return std::nullopt;
    }

    chart::ExtraPosition extra{
        .position = {*ra * astro_constants::kHourToRad, *dec * astro_constants::kDegToRad},
        .label = std::string(fields[2]),
        .slot = std::nullopt,
    };
    if (fields.size() == 4)
    {
        const auto slot = parse_number(fields[3]);
        if (!slot || *slot < 0.0 || *slot >= static_cast<f64>(chart::kCandidateCount) || *slot != static_cast<i32>(*slot))
        {
            return std::nullopt;
        }
        extra.slot = static_cast<chart::LabelSlot>(static_cast<i32>(*slot));
    }
    return extra;
}

/// @return Parsed options, or nullopt with @p exit_code set (0 after --help).
std::optional<CliOptions> parse_command_line(int argc, char** argv, int& exit_code)
{
    static const struct option long_options[] = {
        {"ra", required_argument, nullptr, static_cast<int>(CliOption::Ra)},
        {"dec", required_argument, nullptr, static_cast<int>(CliOption::Dec)},
        {"radius", required_argument, nullptr, static_cast<int>(CliOption::Radius)},
        {"width", required_argument, nullptr, static_cast<int>(CliOption::Width)},
        {"stars", required_argument, nullptr, static_cast<int>(CliOption::Stars)},
        {"deepsky", required_argument, nullptr, static_cast<int>(CliOption::Deepsky)},
        {"constellation-stars", required_argument, nullptr, static_cast<int>(CliOption::ConstellationStars)},
        {"constellation-lines", required_argument, nullptr, static_cast<int>(CliOption::ConstellationLines)},
        {"lm", required_argument, nullptr, static_cast<int>(CliOption::LimitingMagnitude)},
        {"label-lm", required_argument, nullptr, static_cast<int>(CliOption::LabelMagnitude)},
        {"caption", required_argument, nullptr, static_cast<int>(CliOption::Caption)},
        {"language", required_argument, nullptr, static_cast<int>(CliOption::Language)},
        {"mirror-x", no_argument, nullptr, static_cast<int>(CliOption::MirrorX)},
        {"mirror-y", no_argument, nullptr, static_cast<int>(CliOption::MirrorY)},
        {"invert", no_argument, nullptr, static_cast<int>(CliOption::Invert)},
        {"dso-legend", no_argument, nullptr, static_cast<int>(CliOption::DsoLegend)},
        {"extra", required_argument, nullptr, static_cast<int>(CliOption::Extra)},
        {"star-border-lw", required_argument, nullptr, static_cast<int>(CliOption::StarBorderLw)},
        {"open-cluster-lw", required_argument, nullptr, static_cast<int>(CliOption::OpenClusterLw)},
        {"dso-lw", required_argument, nullptr, static_cast<int>(CliOption::DsoLw)},
        {"legend-lw", required_argument, nullptr, static_cast<int>(CliOption::LegendLw)},
        {"constellation-lw", required_argument, nullptr, static_cast<int>(CliOption::ConstellationLw)},
        {"verbose", no_argument, nullptr, static_cast<int>(CliOption::Verbose)},
        {"quiet", no_argument, nullptr, static_cast<int>(CliOption::Quiet)},
        {"log-file", required_argument, nullptr, static_cast<int>(CliOption::LogFile)},
        {"dry-run", no_argument, nullptr, static_cast<int>(CliOption::DryRun)},
        {"help", no_argument, nullptr, static_cast<int>(CliOption::Help)},
        {nullptr, 0, nullptr, 0},
    };

    CliOptions cli;
    exit_code = 1;
    int index = 0;
    int option = 0;

    while ((option = getopt_long(argc, argv, "", long_options, &index)) != -1)
    {
        bool ok = true;
        switch (static_cast<CliOption>(option))
        {
            case CliOption::Ra:                 ok = read_number("ra", optarg, cli.ra_hours); break;
            case CliOption::Dec:                ok = read_number("dec", optarg, cli.dec_deg); break;
            case CliOption::Radius:             ok = read_number("radius", optarg, cli.radius_deg); break;
            case CliOption::Width:              ok = read_number("width", optarg, cli.chart.drawing_width); break;
            case CliOption::Stars:              cli.stars_path = optarg; break;
            case CliOption::Deepsky:            cli.deepsky_path = optarg; break;
            case CliOption::ConstellationStars: cli.constellation_stars_path = optarg; break;
            case CliOption::ConstellationLines: cli.constellation_lines_path = optarg; break;
            case CliOption::LimitingMagnitude:  ok = read_number("lm", optarg, cli.chart.limiting_magnitude); break;
            case CliOption::LabelMagnitude:     ok = read_number("label-lm", optarg, cli.chart.deepsky_label_limit); break;
            case CliOption::Caption:            cli.chart.caption = optarg; break;
            case CliOption::MirrorX:            cli.chart.mirror_x = true; break;
            case CliOption::MirrorY:            cli.chart.mirror_y = true; break;
            case CliOption::Invert:             cli.chart.invert_colors = true; break;
            case CliOption::DsoLegend:          cli.chart.show_dso_legend = true; break;
            case CliOption::StarBorderLw:       ok = read_number("star-border-lw", optarg, cli.chart.line_widths.star_border); break;
            case CliOption::OpenClusterLw:      ok = read_number("open-cluster-lw", optarg, cli.chart.line_widths.open_cluster); break;
            case CliOption::DsoLw:              ok = read_number("dso-lw", optarg, cli.chart.line_widths.dso); break;
            case CliOption::LegendLw:           ok = read_number("legend-lw", optarg, cli.chart.line_widths.legend); break;
            case CliOption::ConstellationLw:    ok = read_number("constellation-lw", optarg, cli.chart.line_widths.constellation); break;
            case CliOption::Verbose:            cli.logging.console_level = spdlog::level::debug; break;
            case CliOption::Quiet:              cli.logging.console_level = spdlog::level::warn; break;
            case CliOption::LogFile:            cli.logging.file = optarg; break;
            case CliOption::DryRun:             cli.dry_run = true; break;

            case CliOption::Language:
            {
                const auto language = chart::parse_language(optarg);
                if (!language)
                {
                    SKC_ERROR("Unknown language '{}' (expected en or nl)", optarg);
                    ok = false;
                    break;
                }
                cli.chart.language = *language;
                break;
            }

            case CliOption::Extra:
            {
                auto extra = parse_extra(optarg);
                if (!extra)
                {
                    SKC_ERROR("Invalid --extra '{}' (expected RA_H,DEC_DEG,LABEL[,SLOT])", optarg);
                    ok = false;
                    break;
                }
                cli.extras.push_back(std::move(*extra));
                break;
            }

            case CliOption::Help:
                std::cout << kUsage;
                exit_code = 0;
                return std::nullopt;

            default:
                std::cerr << kUsage;
                return std::nullopt;
        }
        if (!ok)
        {
            return std::nullopt;
        }
    }

    if (optind < argc)
    {
        cli.output = argv[optind];
    }
    if (cli.output.empty() && !cli.dry_run)
    {
        SKC_ERROR("No output file given");
        std::cerr << kUsage;
        return std::nullopt;
    }
    if (cli.radius_deg <= 0.0 || cli.radius_deg >= 90.0)
    {
        SKC_ERROR("Field radius must be between 0 and 90 degrees, got {}", cli.radius_deg);
        return std::nullopt;
    }
    if (cli.chart.drawing_width <= 0.0)
    {
        SKC_ERROR("Drawing width must be positive, got {}", cli.chart.drawing_width);
        return std::nullopt;
    }
    return cli;
}

int run(const CliOptions& cli)
{
    std::optional<catalog::StarCatalog> stars;
    std::optional<catalog::DeepskyCatalog> deepsky;
    std::optional<catalog::ConstellationCatalog> constellations;

    if (!cli.stars_path.empty())
    {
        auto loaded = catalog::CatalogLoader::load_star_csv(cli.stars_path);
        if (!loaded)
        {
            SKC_CRITICAL("Failed to load star catalog {}", cli.stars_path.string());
            return 1;
        }
        stars.emplace(std::move(*loaded));
    }
    if (!cli.deepsky_path.empty())
    {
        auto loaded = catalog::CatalogLoader::load_deepsky_csv(cli.deepsky_path);
        if (!loaded)
        {
            SKC_CRITICAL("Failed to load deep-sky catalog {}", cli.deepsky_path.string());
            return 1;
        }
        deepsky.emplace(std::move(*loaded));
    }
    if (!cli.constellation_stars_path.empty() || !cli.constellation_lines_path.empty())
    {
        if (cli.constellation_stars_path.empty() || cli.constellation_lines_path.empty())
        {
            SKC_CRITICAL("--constellation-stars and --constellation-lines must be given together");
            return 1;
        }
        constellations = catalog::CatalogLoader::load_constellations(cli.constellation_stars_path,
                                                                      cli.constellation_lines_path);
        if (!constellations)
        {
            SKC_CRITICAL("Failed to load constellations");
            return 1;
        }
    }

    const auto fov = chart::FieldOfView::from_drawing_width(
        astro::EquatorialCoord{cli.ra_hours * astro_constants::kHourToRad, cli.dec_deg * astro_constants::kDegToRad},
        cli.radius_deg * astro_constants::kDegToRad,
        cli.chart.drawing_width);

    const chart::ChartCatalogs catalogs{
        .stars = stars ? &*stars : nullptr,
        .deepsky = deepsky ? &*deepsky : nullptr,
        .constellations = constellations ? &*constellations : nullptr,
        .extra_positions = cli.extras,
    };

    if (cli.dry_run)
    {
        graphics::RecordingSurface surface;
        const auto report = chart::render_chart(surface, fov, catalogs, cli.chart);
        SKC_INFO("Dry run: {} primitives, {} stars, {} deep-sky objects, {} labels, ruler {}",
                 surface.commands().size(), report.stars, report.deepsky_objects,
                 report.labels.size(), report.ruler_label);
        for (const auto& label : report.labels)
        {
            SKC_INFO("  {:<20} slot {}", label.text, static_cast<int>(label.slot));
        }
        return 0;
    }

    const auto format = graphics::CairoSurface::format_for(cli.output);
    if (!format)
    {
        SKC_CRITICAL("Unsupported output format '{}' (use .pdf, .svg or .png)", cli.output.string());
        return 1;
    }

    graphics::CairoSurface surface{cli.output, *format};
    const auto report = chart::render_chart(surface, fov, catalogs, cli.chart);
    SKC_INFO("Wrote {} ({} stars, {} deep-sky objects, {} labels)",
             cli.output.string(), report.stars, report.deepsky_objects, report.labels.size());
    return 0;
}

} // anonymous namespace

int main(int argc, char** argv)
{
    core::Logger::init();

    int exit_code = 1;
    const auto cli = parse_command_line(argc, argv, exit_code);
    if (cli)
    {
        try
        {
            core::Logger::init(cli->logging);
            exit_code = run(*cli);
        }
        catch (const std::exception& e)
        {
            SKC_CRITICAL("Rendering failed: {}", e.what());
            exit_code = 1;
        }
    }

    core::Logger::shutdown();
    return exit_code;
}
