/**
 * @file    watermark_config.hpp
 * @brief   Watermark and output parameter bundles
 * @author  BatchMark Authors
 * @license MIT
 *
 * @details
 * Typed parameters consumed by the layout engine, the renderer and the
 * batch scheduler. Both structs are plain values; call validate() before
 * handing them to the engine (the scheduler does this itself).
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bmk {

// =============================================================================
// Domain limits
// =============================================================================

inline constexpr int kMinFontSize = 12;
inline constexpr int kMaxFontSize = 200;
inline constexpr float kMinAdaptiveRatio = 0.01f;
inline constexpr float kMaxAdaptiveRatio = 0.20f;
inline constexpr int kMinCount = 1;
inline constexpr int kMaxCount = 20;
inline constexpr int kMinJpegQuality = 50;
inline constexpr int kMaxJpegQuality = 100;
inline constexpr std::size_t kMaxTextLines = 2;

// =============================================================================
// Enumerations
// =============================================================================

enum class FontSizeMode {
    Adaptive,   // Derived from min(image width, image height)
    Manual      // Fixed manual_font_size
};

enum class ImageFormat {
    JPEG,
    PNG
};

/**
 * Output file naming rule used by the file service
 */
enum class NameRule {
    Original,   // <stem>
    Numbered,   // <stem>_001
    Timestamp   // <stem>_<8 hex chars>
};

[[nodiscard]] constexpr std::string_view to_string(FontSizeMode mode) noexcept {
    switch (mode) {
        case FontSizeMode::Adaptive: return "adaptive";
        case FontSizeMode::Manual:   return "manual";
        default:                     return "unknown";
    }
}

[[nodiscard]] constexpr std::string_view to_string(ImageFormat format) noexcept {
    switch (format) {
        case ImageFormat::JPEG: return "JPEG";
        case ImageFormat::PNG:  return "PNG";
        default:                return "unknown";
    }
}

[[nodiscard]] constexpr std::string_view to_string(NameRule rule) noexcept {
    switch (rule) {
        case NameRule::Original:  return "original";
        case NameRule::Numbered:  return "numbered";
        case NameRule::Timestamp: return "timestamp";
        default:                  return "unknown";
    }
}

// Case-insensitive parsers, nullopt for unknown names
[[nodiscard]] std::optional<FontSizeMode> parse_font_size_mode(std::string_view name);
[[nodiscard]] std::optional<ImageFormat> parse_image_format(std::string_view name);
[[nodiscard]] std::optional<NameRule> parse_name_rule(std::string_view name);

// =============================================================================
// Color
// =============================================================================

struct RgbColor {
    uint8_t r{255};
    uint8_t g{0};
    uint8_t b{0};

    constexpr bool operator==(const RgbColor&) const noexcept = default;
};

/**
 * Parse "#RRGGBB" or "RRGGBB"
 * @return  nullopt if the string is not a 6-digit hex color
 */
[[nodiscard]] std::optional<RgbColor> parse_hex_color(std::string_view hex);

/**
 * Format as "#RRGGBB"
 */
[[nodiscard]] std::string to_hex(const RgbColor& color);

// =============================================================================
// Watermark Configuration
// =============================================================================

struct WatermarkConfig {
    std::vector<std::string> text{"Watermark"};   // UTF-8, at most 2 lines
    FontSizeMode font_size_mode{FontSizeMode::Adaptive};
    float adaptive_ratio{0.04f};
    int manual_font_size{36};
    RgbColor color{};
    float opacity{0.7f};            // 0.0 - 1.0
    float rotation_degrees{45.0f};  // [0, 360)
    int count{1};
    std::filesystem::path font_path;  // Empty = resolve a system font

    /**
     * Check every field against its domain
     * @throws WatermarkError(InvalidConfig) naming the first offending field
     */
    void validate() const;

    bool operator==(const WatermarkConfig&) const = default;
};

// =============================================================================
// Output Configuration
// =============================================================================

struct OutputConfig {
    ImageFormat format{ImageFormat::JPEG};
    int jpeg_quality{90};                       // Ignored for PNG
    std::filesystem::path destination_directory;  // Empty = <input dir>/watermarked
    NameRule name_rule{NameRule::Original};
    std::string suffix{"watermarked"};

    /**
     * @throws WatermarkError(InvalidConfig)
     */
    void validate() const;

    /**
     * File extension for the configured format (".jpg" or ".png")
     */
    [[nodiscard]] std::string_view extension() const noexcept {
        return format == ImageFormat::PNG ? ".png" : ".jpg";
    }

    bool operator==(const OutputConfig&) const = default;
};

}  // namespace bmk
