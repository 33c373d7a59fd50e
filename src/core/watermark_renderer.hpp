/**
 * @file    watermark_renderer.hpp
 * @brief   Watermark tile rendering and compositing
 * @author  BatchMark Authors
 * @license MIT
 *
 * @details
 * Applies a Layout to an image:
 *   1. Rasterize the text into a coverage mask, pad it
 *   2. Color it, alpha = coverage * opacity
 *   3. Rotate with bounding-box expansion (corners never cropped)
 *   4. Alpha-composite the tile centered on every placement
 *
 * Preview renders work on a downscaled copy and reuse the export layout
 * scaled by the same factor, so preview and export always agree.
 */

#pragma once

#include "core/layout_engine.hpp"
#include "core/text_rasterizer.hpp"
#include "core/watermark_config.hpp"

#include <opencv2/core.hpp>

#include <cstdint>
#include <string_view>
#include <vector>

namespace bmk {

inline constexpr int kDefaultPreviewMaxSize = 800;

enum class RenderMode {
    Preview,    // Downscaled copy, scaled layout
    Export      // Full resolution, encoded output
};

[[nodiscard]] constexpr std::string_view to_string(RenderMode mode) noexcept {
    switch (mode) {
        case RenderMode::Preview: return "Preview";
        case RenderMode::Export:  return "Export";
        default:                  return "Unknown";
    }
}

/**
 * Result of one render call
 */
struct RenderedImage {
    cv::Mat image;                  // 8-bit BGR, or BGRA for a transparent PNG export
    Layout layout;                  // Layout actually drawn (scaled for previews)
    double scale{1.0};              // image size / source size
    std::vector<uint8_t> encoded;   // Export only: JPEG/PNG bytes
};

class WatermarkRenderer {
public:
    /**
     * @param rasterizer        Text rasterizer (must outlive the renderer)
     * @param preview_max_size  Longest preview side in pixels
     */
    explicit WatermarkRenderer(const ITextRasterizer& rasterizer,
                               int preview_max_size = kDefaultPreviewMaxSize);

    /**
     * Draw layout onto source
     *
     * @param source  8-bit image with 1, 3 or 4 channels (16-bit is reduced).
     *                A 4-channel source keeps its alpha for PNG output.
     * @param layout  Full-resolution layout from compute_layout()
     * @param config  Watermark parameters (text, color, opacity)
     * @param output  Encoding parameters (Export only)
     * @param mode    Preview or Export
     * @throws WatermarkError  InvalidImageDimensions, UnsupportedImageFormat,
     *                         TextRenderError, IOFailure (encoding)
     */
    [[nodiscard]] RenderedImage render(const cv::Mat& source,
                                       const Layout& layout,
                                       const WatermarkConfig& config,
                                       const OutputConfig& output,
                                       RenderMode mode) const;

    /**
     * Compute the full-resolution layout and render a preview from it
     */
    [[nodiscard]] RenderedImage render_preview(const cv::Mat& source,
                                               const WatermarkConfig& config,
                                               const OutputConfig& output) const;

    /**
     * Build one colored, padded and rotated BGRA tile
     *
     * @param font_size  Pixel size (fractional sizes are rounded, min 1)
     */
    [[nodiscard]] cv::Mat build_tile(const WatermarkConfig& config, double font_size) const;

    /**
     * Scale factor used for a preview of an image of this size (<= 1)
     */
    [[nodiscard]] double preview_scale(int image_width, int image_height) const noexcept;

    [[nodiscard]] int preview_max_size() const noexcept { return m_preview_max_size; }

private:
    const ITextRasterizer& m_rasterizer;
    int m_preview_max_size;
};

// =============================================================================
// Tile / image helpers
// =============================================================================

/**
 * Padding around the text box: max(2, round(0.15 * font_size))
 */
[[nodiscard]] int text_padding(double font_size) noexcept;

/**
 * Size of the axis-aligned box bounding a w x h rectangle rotated by degrees
 */
[[nodiscard]] cv::Size rotated_bounds(cv::Size size, double degrees);

/**
 * Rotate a BGRA surface counter-clockwise into an expanded surface
 * whose size is rotated_bounds(surface.size(), degrees)
 */
[[nodiscard]] cv::Mat rotate_expanded(const cv::Mat& bgra, double degrees);

/**
 * Alpha-composite a BGRA tile over a BGR or BGRA image, centered at center.
 * Parts outside the image are clipped. A BGRA destination gets the
 * straight-alpha "over" result, including its alpha.
 */
void composite_tile(cv::Mat& image, const cv::Mat& bgra_tile, cv::Point2d center);

/**
 * Convert a decoded image to 8-bit BGR, or BGRA when keep_alpha is set
 * and the source has an alpha channel
 * @throws WatermarkError  InvalidImageDimensions (empty), UnsupportedImageFormat
 */
[[nodiscard]] cv::Mat to_working8(const cv::Mat& source, bool keep_alpha);

/**
 * Convert a decoded image to 8-bit BGR
 * @throws WatermarkError  InvalidImageDimensions (empty), UnsupportedImageFormat
 */
[[nodiscard]] cv::Mat to_bgr8(const cv::Mat& source);

/**
 * Encode with the configured format and JPEG quality
 * @throws WatermarkError(IOFailure) if the encoder fails
 */
[[nodiscard]] std::vector<uint8_t> encode_image(const cv::Mat& image, const OutputConfig& output);

}  // namespace bmk
