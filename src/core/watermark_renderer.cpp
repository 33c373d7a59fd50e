/**
 * @file    watermark_renderer.cpp
 * @brief   Watermark tile rendering and compositing
 * @author  BatchMark Authors
 * @license MIT
 *
 * @details
 * Compositing uses the standard "over" operator on straight alpha:
 *   result = alpha * tile + (1 - alpha) * image
 * Rotated tiles are resampled with a transparent border of the tile color
 * so anti-aliased edges do not darken.
 */

#include "core/watermark_renderer.hpp"
#include "core/types.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace bmk {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kPaddingRatio = 0.15;
constexpr int kMinPadding = 2;
constexpr int kPngCompression = 6;

double normalize_degrees(double degrees) {
    double d = std::fmod(degrees, 360.0);
    if (d < 0.0) d += 360.0;
    return d;
}

std::vector<std::string> non_empty_lines(const std::vector<std::string>& text) {
    std::vector<std::string> lines;
    for (const auto& line : text) {
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

}  // anonymous namespace

// =============================================================================
// Helpers
// =============================================================================

int text_padding(double font_size) noexcept {
    return std::max(kMinPadding, static_cast<int>(std::lround(font_size * kPaddingRatio)));
}

cv::Size rotated_bounds(cv::Size size, double degrees) {
    const double rad = normalize_degrees(degrees) * kPi / 180.0;
    const double c = std::abs(std::cos(rad));
    const double s = std::abs(std::sin(rad));
    // Tolerance keeps exact right angles from growing by one pixel
    constexpr double kEps = 1e-6;
    const int w = static_cast<int>(std::ceil(size.width * c + size.height * s - kEps));
    const int h = static_cast<int>(std::ceil(size.width * s + size.height * c - kEps));
    return cv::Size(std::max(1, w), std::max(1, h));
}

cv::Mat rotate_expanded(const cv::Mat& bgra, double degrees) {
    CV_Assert(bgra.type() == CV_8UC4);

    const double d = normalize_degrees(degrees);
    if (d == 0.0) {
        return bgra.clone();
    }

    // Exact right angles: lossless transpose/flip
    cv::Mat out;
    if (d == 90.0) {
        cv::rotate(bgra, out, cv::ROTATE_90_COUNTERCLOCKWISE);
        return out;
    }
    if (d == 180.0) {
        cv::rotate(bgra, out, cv::ROTATE_180);
        return out;
    }
    if (d == 270.0) {
        cv::rotate(bgra, out, cv::ROTATE_90_CLOCKWISE);
        return out;
    }

    const cv::Size bounds = rotated_bounds(bgra.size(), d);
    const cv::Point2f center(bgra.cols / 2.0f, bgra.rows / 2.0f);

    // Positive angle = counter-clockwise; shift so the rotated box is centered
    cv::Mat m = cv::getRotationMatrix2D(center, d, 1.0);
    m.at<double>(0, 2) += (bounds.width - bgra.cols) / 2.0;
    m.at<double>(1, 2) += (bounds.height - bgra.rows) / 2.0;

    // Transparent border carrying the tile color (avoids dark fringes)
    const cv::Vec4b edge = bgra.at<cv::Vec4b>(0, 0);
    const cv::Scalar border(edge[0], edge[1], edge[2], 0);

    cv::warpAffine(bgra, out, m, bounds, cv::INTER_LINEAR, cv::BORDER_CONSTANT, border);
    return out;
}

void composite_tile(cv::Mat& image, const cv::Mat& bgra_tile, cv::Point2d center) {
    CV_Assert((image.type() == CV_8UC3 || image.type() == CV_8UC4) && bgra_tile.type() == CV_8UC4);

    const int x0 = static_cast<int>(std::lround(center.x - bgra_tile.cols / 2.0));
    const int y0 = static_cast<int>(std::lround(center.y - bgra_tile.rows / 2.0));

    // Clamp to image bounds
    const cv::Rect tile_rect(x0, y0, bgra_tile.cols, bgra_tile.rows);
    const cv::Rect clipped = tile_rect & cv::Rect(0, 0, image.cols, image.rows);
    if (clipped.empty()) {
        spdlog::debug("Tile at ({:.1f}, {:.1f}) is outside the image", center.x, center.y);
        return;
    }

    const bool has_alpha = image.channels() == 4;

    for (int y = clipped.y; y < clipped.y + clipped.height; ++y) {
        const cv::Vec4b* src = bgra_tile.ptr<cv::Vec4b>(y - y0);

        for (int x = clipped.x; x < clipped.x + clipped.width; ++x) {
            const cv::Vec4b& s = src[x - x0];
            if (s[3] == 0) continue;

            const float a = s[3] / 255.0f;
            if (!has_alpha) {
                cv::Vec3b& d = image.ptr<cv::Vec3b>(y)[x];
                for (int c = 0; c < 3; ++c) {
                    d[c] = cv::saturate_cast<uchar>(a * s[c] + (1.0f - a) * d[c]);
                }
                continue;
            }

            // Straight-alpha "over" onto a transparent-capable destination
            cv::Vec4b& d = image.ptr<cv::Vec4b>(y)[x];
            const float da = d[3] / 255.0f;
            const float out_a = a + da * (1.0f - a);
            for (int c = 0; c < 3; ++c) {
                const float v = (a * s[c] + da * (1.0f - a) * d[c]) / out_a;
                d[c] = cv::saturate_cast<uchar>(v);
            }
            d[3] = cv::saturate_cast<uchar>(out_a * 255.0f);
        }
    }
}

cv::Mat to_working8(const cv::Mat& source, bool keep_alpha) {
    if (source.empty() || source.cols <= 0 || source.rows <= 0) {
        throw WatermarkError(ErrorKind::InvalidImageDimensions,
                             fmt::format("Invalid image dimensions {}x{}", source.cols, source.rows));
    }

    cv::Mat src8;
    switch (source.depth()) {
        case CV_8U:
            src8 = source;
            break;
        case CV_16U:
            source.convertTo(src8, CV_8U, 1.0 / 257.0);
            break;
        default:
            throw WatermarkError(ErrorKind::UnsupportedImageFormat,
                                 fmt::format("Unsupported pixel depth {}", source.depth()));
    }

    cv::Mat out;
    switch (src8.channels()) {
        case 1:
            cv::cvtColor(src8, out, cv::COLOR_GRAY2BGR);
            break;
        case 3:
            out = src8.clone();
            break;
        case 4:
            if (keep_alpha) {
                out = src8.clone();
            } else {
                cv::cvtColor(src8, out, cv::COLOR_BGRA2BGR);
            }
            break;
        default:
            throw WatermarkError(ErrorKind::UnsupportedImageFormat,
                                 fmt::format("Unsupported channel count {}", src8.channels()));
    }
    return out;
}

cv::Mat to_bgr8(const cv::Mat& source) {
    return to_working8(source, false);
}

std::vector<uint8_t> encode_image(const cv::Mat& image, const OutputConfig& output) {
    std::vector<int> params;
    const char* ext = nullptr;

    if (output.format == ImageFormat::JPEG) {
        ext = ".jpg";
        params = {cv::IMWRITE_JPEG_QUALITY, output.jpeg_quality};
    } else {
        ext = ".png";
        params = {cv::IMWRITE_PNG_COMPRESSION, kPngCompression};
    }

    std::vector<uint8_t> buffer;
    bool ok = false;
    try {
        ok = cv::imencode(ext, image, buffer, params);
    } catch (const cv::Exception& e) {
        throw WatermarkError(ErrorKind::IOFailure,
                             fmt::format("Failed to encode {}: {}", to_string(output.format), e.what()));
    }
    if (!ok || buffer.empty()) {
        throw WatermarkError(ErrorKind::IOFailure,
                             fmt::format("Failed to encode {}", to_string(output.format)));
    }
    return buffer;
}

// =============================================================================
// WatermarkRenderer
// =============================================================================

WatermarkRenderer::WatermarkRenderer(const ITextRasterizer& rasterizer, int preview_max_size)
    : m_rasterizer(rasterizer)
    , m_preview_max_size(std::max(1, preview_max_size))
{
}

double WatermarkRenderer::preview_scale(int image_width, int image_height) const noexcept {
    const int longest = std::max(image_width, image_height);
    if (longest <= m_preview_max_size || longest <= 0) {
        return 1.0;
    }
    return static_cast<double>(m_preview_max_size) / longest;
}

cv::Mat WatermarkRenderer::build_tile(const WatermarkConfig& config, double font_size) const {
    const std::vector<std::string> lines = non_empty_lines(config.text);
    if (lines.empty()) {
        throw WatermarkError(ErrorKind::TextRenderError, "Watermark text is empty");
    }

    const int pixel_size = std::max(1, static_cast<int>(std::lround(font_size)));
    const cv::Mat mask = m_rasterizer.rasterize(lines, pixel_size);
    if (mask.empty() || mask.type() != CV_8UC1) {
        throw WatermarkError(ErrorKind::TextRenderError,
                             fmt::format("{} returned an unusable mask", m_rasterizer.name()));
    }

    // Padding keeps anti-aliased edges away from the surface border
    const int pad = text_padding(font_size);
    cv::Mat padded;
    cv::copyMakeBorder(mask, padded, pad, pad, pad, pad, cv::BORDER_CONSTANT, cv::Scalar(0));

    cv::Mat alpha;
    padded.convertTo(alpha, CV_8U, std::clamp(config.opacity, 0.0f, 1.0f));

    const cv::Size size = padded.size();
    const cv::Mat b(size, CV_8UC1, cv::Scalar(config.color.b));
    const cv::Mat g(size, CV_8UC1, cv::Scalar(config.color.g));
    const cv::Mat r(size, CV_8UC1, cv::Scalar(config.color.r));

    cv::Mat surface;
    cv::merge(std::vector<cv::Mat>{b, g, r, alpha}, surface);

    cv::Mat tile = rotate_expanded(surface, config.rotation_degrees);

    spdlog::debug("Tile: text {}x{}, pad {}, surface {}x{}, rotated {:.1f} -> {}x{}",
                  mask.cols, mask.rows, pad, surface.cols, surface.rows,
                  config.rotation_degrees, tile.cols, tile.rows);
    return tile;
}

RenderedImage WatermarkRenderer::render(const cv::Mat& source,
                                        const Layout& layout,
                                        const WatermarkConfig& config,
                                        const OutputConfig& output,
                                        RenderMode mode) const {
    // JPEG has no alpha channel; PNG keeps the source transparency
    const bool keep_alpha = source.channels() == 4 && output.format == ImageFormat::PNG;
    cv::Mat canvas = to_working8(source, keep_alpha);

    if (layout.image_width != canvas.cols || layout.image_height != canvas.rows) {
        throw WatermarkError(ErrorKind::InvalidImageDimensions,
                             fmt::format("Layout computed for {}x{} but image is {}x{}",
                                         layout.image_width, layout.image_height,
                                         canvas.cols, canvas.rows));
    }

    RenderedImage result;

    if (mode == RenderMode::Preview) {
        const double s = preview_scale(canvas.cols, canvas.rows);
        if (s < 1.0) {
            const cv::Size preview_size(
                std::max(1, static_cast<int>(std::lround(canvas.cols * s))),
                std::max(1, static_cast<int>(std::lround(canvas.rows * s))));
            cv::Mat small;
            cv::resize(canvas, small, preview_size, 0, 0, cv::INTER_AREA);
            canvas = small;
        }
        result.scale = s;
        result.layout = layout.scaled(s);
    } else {
        result.scale = 1.0;
        result.layout = layout;
    }

    if (!result.layout.placements.empty()) {
        const cv::Mat tile = build_tile(config, result.layout.font_size);
        for (const auto& p : result.layout.placements) {
            composite_tile(canvas, tile, cv::Point2d(p.center_x, p.center_y));
        }
    }

    spdlog::debug("{} render: {}x{} (scale {:.3f}), {} tiles",
                  to_string(mode), canvas.cols, canvas.rows, result.scale,
                  result.layout.placements.size());

    if (mode == RenderMode::Export) {
        result.encoded = encode_image(canvas, output);
    }

    result.image = canvas;
    return result;
}

RenderedImage WatermarkRenderer::render_preview(const cv::Mat& source,
                                                const WatermarkConfig& config,
                                                const OutputConfig& output) const {
    // Layout always comes from the full-resolution size
    const Layout layout = compute_layout(source.cols, source.rows, config);
    return render(source, layout, config, output, RenderMode::Preview);
}

}  // namespace bmk
