#pragma once

/// @file cairo_surface.hpp
/// @brief Cairo-backed Surface writing PDF, SVG or PNG files.

#include "graphics/surface.hpp"

#include <cairo/cairo.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace skychart::graphics
{
    enum class OutputFormat : u8
    {
        Pdf,
        Svg,
        Png,
    };

    /// @brief Surface drawing through cairo.
    ///
    /// The cairo objects are created in begin(), when the page size is known,
    /// and the file is complete after finish(). Every cairo status is checked;
    /// failures are logged and thrown as std::runtime_error.
    class CairoSurface final : public Surface
    {
    public:
        /// Raster resolution for PNG output.
        static constexpr f64 kPngDotsPerInch = 200.0;

        CairoSurface(std::filesystem::path path, OutputFormat format);
        ~CairoSurface() override;

        CairoSurface(const CairoSurface&) = delete;
        CairoSurface& operator=(const CairoSurface&) = delete;
        CairoSurface(CairoSurface&&) = delete;
        CairoSurface& operator=(CairoSurface&&) = delete;

        /// @brief Output format implied by the file extension (.pdf, .svg, .png).
        [[nodiscard]] static std::optional<OutputFormat> format_for(const std::filesystem::path& path);

        void begin(f64 width_mm, f64 height_mm, Vec2d origin_mm) override;
        void finish() override;

        void set_line_width(f64 width_mm) override;
        void set_dash(f64 on_mm, f64 off_mm) override;
        void set_pen_color(const Rgb& color) override;
        void set_fill_color(const Rgb& color) override;
        void set_font(const std::string& family, f64 size_mm) override;

        void line(Vec2d from, Vec2d to) override;
        void circle(Vec2d centre, f64 radius, DrawMode mode) override;
        void ellipse(Vec2d centre, f64 rx, f64 ry, f64 angle, DrawMode mode) override;
        void polygon(const std::vector<Vec2d>& points, DrawMode mode) override;
        void text(Vec2d baseline, f64 angle, TextAnchor anchor, const std::string& text) override;
        [[nodiscard]] f64 text_width(const std::string& text) const override;

        void clip_polygon(const std::vector<Vec2d>& points) override;
        void reset_clip() override;

    private:
        /// @brief Fill and/or stroke the current path according to @p mode.
        void paint_path(DrawMode mode);

        /// @brief Throw if the context or surface is in an error state.
        void check(const char* operation) const;

        /// @brief Throw if begin() has not been called.
        void require_context(const char* operation) const;

        void destroy();

        std::filesystem::path m_path;
        OutputFormat m_format;
        cairo_surface_t* m_surface = nullptr;
        cairo_t* m_cr = nullptr;
        Rgb m_pen{};
        Rgb m_fill{};
        f64 m_line_width = 0.2;
        std::vector<f64> m_dash;
        std::string m_font_family = "sans-serif";
        f64 m_font_size = 2.6;
    };

} // namespace skychart::graphics
