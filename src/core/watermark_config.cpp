/**
 * @file    watermark_config.cpp
 * @brief   Watermark and output parameter validation
 * @author  BatchMark Authors
 * @license MIT
 */

#include "core/watermark_config.hpp"
#include "core/types.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace bmk {

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

[[noreturn]] void invalid(const std::string& message) {
    throw WatermarkError(ErrorKind::InvalidConfig, message);
}

}  // anonymous namespace

// =============================================================================
// Enum parsing
// =============================================================================

std::optional<FontSizeMode> parse_font_size_mode(std::string_view name) {
    const std::string n = to_lower(name);
    if (n == "adaptive") return FontSizeMode::Adaptive;
    if (n == "manual")   return FontSizeMode::Manual;
    return std::nullopt;
}

std::optional<ImageFormat> parse_image_format(std::string_view name) {
    const std::string n = to_lower(name);
    if (n == "jpeg" || n == "jpg") return ImageFormat::JPEG;
    if (n == "png")                return ImageFormat::PNG;
    return std::nullopt;
}

std::optional<NameRule> parse_name_rule(std::string_view name) {
    const std::string n = to_lower(name);
    if (n == "original")  return NameRule::Original;
    if (n == "numbered")  return NameRule::Numbered;
    if (n == "timestamp") return NameRule::Timestamp;
    return std::nullopt;
}

// =============================================================================
// Color
// =============================================================================

std::optional<RgbColor> parse_hex_color(std::string_view hex) {
    if (!hex.empty() && hex.front() == '#') {
        hex.remove_prefix(1);
    }
    if (hex.size() != 6) {
        return std::nullopt;
    }

    uint8_t channels[3];
    for (int i = 0; i < 3; ++i) {
        const int hi = hex_digit(hex[i * 2]);
        const int lo = hex_digit(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        channels[i] = static_cast<uint8_t>(hi * 16 + lo);
    }
    return RgbColor{channels[0], channels[1], channels[2]};
}

std::string to_hex(const RgbColor& color) {
    return fmt::format("#{:02X}{:02X}{:02X}", color.r, color.g, color.b);
}

// =============================================================================
// Validation
// =============================================================================

void WatermarkConfig::validate() const {
    if (text.size() > kMaxTextLines) {
        invalid(fmt::format("text has {} lines, at most {} allowed", text.size(), kMaxTextLines));
    }
    const bool has_text = std::any_of(text.begin(), text.end(),
                                      [](const std::string& line) { return !line.empty(); });
    if (!has_text) {
        invalid("text is empty");
    }

    if (!(adaptive_ratio >= kMinAdaptiveRatio && adaptive_ratio <= kMaxAdaptiveRatio)) {
        invalid(fmt::format("adaptive_ratio {} outside [{}, {}]",
                            adaptive_ratio, kMinAdaptiveRatio, kMaxAdaptiveRatio));
    }
    if (manual_font_size < kMinFontSize || manual_font_size > kMaxFontSize) {
        invalid(fmt::format("manual_font_size {} outside [{}, {}]",
                            manual_font_size, kMinFontSize, kMaxFontSize));
    }
    if (!(opacity >= 0.0f && opacity <= 1.0f)) {
        invalid(fmt::format("opacity {} outside [0, 1]", opacity));
    }
    if (!(rotation_degrees >= 0.0f && rotation_degrees < 360.0f)) {
        invalid(fmt::format("rotation {} outside [0, 360)", rotation_degrees));
    }
    if (count < kMinCount || count > kMaxCount) {
        invalid(fmt::format("count {} outside [{}, {}]", count, kMinCount, kMaxCount));
    }
}

void OutputConfig::validate() const {
    if (format != ImageFormat::JPEG && format != ImageFormat::PNG) {
        invalid("unknown output format");
    }
    if (jpeg_quality < kMinJpegQuality || jpeg_quality > kMaxJpegQuality) {
        invalid(fmt::format("jpeg_quality {} outside [{}, {}]",
                            jpeg_quality, kMinJpegQuality, kMaxJpegQuality));
    }
    if (suffix.find_first_of("/\\") != std::string::npos) {
        invalid(fmt::format("suffix '{}' contains a path separator", suffix));
    }
}

}  // namespace bmk
