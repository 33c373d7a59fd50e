/**
 * @file    layout_engine.cpp
 * @brief   Watermark grid layout computation
 * @author  BatchMark Authors
 * @license MIT
 */

#include "core/layout_engine.hpp"
#include "core/types.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace bmk {

namespace {

void check_dimensions(int image_width, int image_height) {
    if (image_width <= 0 || image_height <= 0) {
        throw WatermarkError(ErrorKind::InvalidImageDimensions,
                             fmt::format("Invalid image dimensions {}x{}",
                                         image_width, image_height));
    }
}

struct GridCandidate {
    GridShape shape;
    int waste;      // Empty cells
    double skew;    // |log(cell_w / cell_h)|, 0 for square cells
};

GridCandidate make_candidate(int cols, int count, double usable_w, double usable_h) {
    const int rows = (count + cols - 1) / cols;
    // Smallest column count that still holds count tiles in this many rows
    cols = (count + rows - 1) / rows;

    const double cell_w = usable_w / cols;
    const double cell_h = usable_h / rows;
    return GridCandidate{
        GridShape{rows, cols},
        rows * cols - count,
        std::abs(std::log(cell_w / cell_h))
    };
}

bool is_better(const GridCandidate& a, const GridCandidate& b, bool landscape) {
    if (a.waste != b.waste) {
        return a.waste < b.waste;
    }
    constexpr double kSkewEpsilon = 1e-9;
    if (std::abs(a.skew - b.skew) > kSkewEpsilon) {
        return a.skew < b.skew;
    }
    return landscape ? a.shape.cols > b.shape.cols
                     : a.shape.rows > b.shape.rows;
}

}  // anonymous namespace

// =============================================================================
// Layout
// =============================================================================

Layout Layout::scaled(double factor) const {
    Layout out = *this;
    out.image_width = std::max(1, static_cast<int>(std::lround(image_width * factor)));
    out.image_height = std::max(1, static_cast<int>(std::lround(image_height * factor)));
    out.margin *= factor;
    out.cell_width *= factor;
    out.cell_height *= factor;
    out.font_size *= factor;
    out.scale *= factor;
    for (auto& p : out.placements) {
        p.center_x *= factor;
        p.center_y *= factor;
        p.font_size *= factor;
    }
    return out;
}

// =============================================================================
// Font size
// =============================================================================

int compute_font_size(int image_width, int image_height, const WatermarkConfig& config) {
    check_dimensions(image_width, image_height);

    long size = 0;
    if (config.font_size_mode == FontSizeMode::Manual) {
        size = config.manual_font_size;
    } else {
        const int min_side = std::min(image_width, image_height);
        size = std::lround(static_cast<double>(min_side) *
                           static_cast<double>(config.adaptive_ratio));
    }
    return static_cast<int>(std::clamp<long>(size, kMinFontSize, kMaxFontSize));
}

// =============================================================================
// Grid shape
// =============================================================================

GridShape compute_grid_shape(int count, int image_width, int image_height) {
    check_dimensions(image_width, image_height);
    if (count < 1) {
        throw WatermarkError(ErrorKind::InvalidConfig,
                             fmt::format("Watermark count must be >= 1 (got {})", count));
    }
    if (count == 1) {
        return GridShape{1, 1};
    }

    const bool landscape = image_width > image_height;
    const double margin = kMarginRatio * std::min(image_width, image_height);
    const double usable_w = image_width - 2.0 * margin;
    const double usable_h = image_height - 2.0 * margin;

    const double raw = std::sqrt(static_cast<double>(count) * image_width / image_height);
    int cols0 = static_cast<int>(std::floor(raw));
    const double frac = raw - cols0;
    if (frac > 0.5 || (frac == 0.5 && landscape)) {
        ++cols0;
    }
    cols0 = std::clamp(cols0, 1, count);

    GridCandidate best = make_candidate(cols0, count, usable_w, usable_h);
    for (int cols : {cols0 - 1, cols0 + 1}) {
        if (cols < 1 || cols > count) continue;
        GridCandidate c = make_candidate(cols, count, usable_w, usable_h);
        if (is_better(c, best, landscape)) {
            best = c;
        }
    }

    spdlog::debug("Grid for {} tiles on {}x{}: raw cols {:.3f} -> {}x{} (waste {}, skew {:.3f})",
                  count, image_width, image_height, raw,
                  best.shape.rows, best.shape.cols, best.waste, best.skew);
    return best.shape;
}

// =============================================================================
// Layout
// =============================================================================

Layout compute_layout(int image_width, int image_height, const WatermarkConfig& config) {
    check_dimensions(image_width, image_height);
    if (config.count < 1) {
        throw WatermarkError(ErrorKind::InvalidConfig,
                             fmt::format("Watermark count must be >= 1 (got {})", config.count));
    }

    const GridShape grid = compute_grid_shape(config.count, image_width, image_height);

    Layout layout;
    layout.image_width = image_width;
    layout.image_height = image_height;
    layout.rows = grid.rows;
    layout.cols = grid.cols;
    layout.margin = kMarginRatio * std::min(image_width, image_height);
    layout.cell_width = (image_width - 2.0 * layout.margin) / grid.cols;
    layout.cell_height = (image_height - 2.0 * layout.margin) / grid.rows;
    layout.font_size = compute_font_size(image_width, image_height, config);
    layout.rotation_degrees = config.rotation_degrees;

    const int tiles = std::min(config.count, grid.rows * grid.cols);
    layout.placements.reserve(static_cast<size_t>(tiles));

    for (int i = 0; i < tiles; ++i) {
        const int r = i / grid.cols;
        const int c = i % grid.cols;
        layout.placements.push_back(Placement{
            .center_x = layout.margin + (c + 0.5) * layout.cell_width,
            .center_y = layout.margin + (r + 0.5) * layout.cell_height,
            .font_size = layout.font_size,
            .rotation_degrees = layout.rotation_degrees
        });
    }

    spdlog::debug("Layout {}x{}: grid {}x{}, margin {:.1f}, cell {:.1f}x{:.1f}, font {}, {} tiles",
                  image_width, image_height, layout.rows, layout.cols, layout.margin,
                  layout.cell_width, layout.cell_height, layout.font_size,
                  layout.placements.size());
    return layout;
}

}  // namespace bmk
