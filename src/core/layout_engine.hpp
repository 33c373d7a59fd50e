/**
 * @file    layout_engine.hpp
 * @brief   Watermark grid layout computation
 * @author  BatchMark Authors
 * @license MIT
 *
 * @details
 * Pure geometry: given image dimensions and a WatermarkConfig, computes the
 * tile grid, the effective font size and one placement per tile.
 *
 * Layout rules:
 *   - margin      = 0.1 * min(W, H) on all four sides
 *   - usable rect = image inset by margin, split into rows x cols cells
 *   - placement   = geometric center of a cell, row-major order
 *   - font size   = clamp(round(min(W, H) * ratio), 12, 200)   (adaptive)
 *                   clamp(manual_font_size, 12, 200)            (manual)
 */

#pragma once

#include "core/watermark_config.hpp"

#include <vector>

namespace bmk {

inline constexpr double kMarginRatio = 0.10;

/**
 * One watermark tile
 */
struct Placement {
    double center_x{0.0};
    double center_y{0.0};
    double font_size{0.0};
    double rotation_degrees{0.0};

    bool operator==(const Placement&) const = default;
};

/**
 * Grid shape chosen for a tile count
 */
struct GridShape {
    int rows{1};
    int cols{1};

    constexpr bool operator==(const GridShape&) const noexcept = default;
};

/**
 * Derived, per-image layout (never persisted)
 */
struct Layout {
    int image_width{0};
    int image_height{0};
    int rows{1};
    int cols{1};
    double margin{0.0};
    double cell_width{0.0};
    double cell_height{0.0};
    double font_size{0.0};
    double rotation_degrees{0.0};
    double scale{1.0};              // 1.0 for export layouts
    std::vector<Placement> placements;

    /**
     * Uniformly scaled copy of this layout
     *
     * Every length (image size, margin, cells, centers, font size) is
     * multiplied by factor; rotation and grid shape are untouched. Used for previews so
     * the preview is never laid out independently of the export.
     *
     * @param factor  Scale factor (> 0)
     */
    [[nodiscard]] Layout scaled(double factor) const;

    bool operator==(const Layout&) const = default;
};

/**
 * Effective font size for an image
 * @throws WatermarkError(InvalidImageDimensions) if either side <= 0
 */
[[nodiscard]] int compute_font_size(int image_width, int image_height,
                                    const WatermarkConfig& config);

/**
 * Choose rows x cols for count tiles on an image
 *
 * Candidate column counts around round(sqrt(count * W / H)) are trimmed
 * to the smallest grid holding count tiles, then ranked by wasted cells,
 * cell squareness, and finally orientation (more columns on landscape
 * images, more rows otherwise).
 */
[[nodiscard]] GridShape compute_grid_shape(int count, int image_width, int image_height);

/**
 * Compute the full layout for one image
 *
 * @throws WatermarkError(InvalidImageDimensions) if either side <= 0
 * @throws WatermarkError(InvalidConfig) if config.count < 1
 */
[[nodiscard]] Layout compute_layout(int image_width, int image_height,
                                    const WatermarkConfig& config);

}  // namespace bmk
