/**
 * @file    text_rasterizer.hpp
 * @brief   Text to coverage mask rasterization
 * @author  BatchMark Authors
 * @license MIT
 *
 * @details
 * The renderer only needs an 8-bit coverage mask for the watermark text.
 * ITextRasterizer decouples it from the font engine; FreeTypeRasterizer is
 * the production implementation.
 */

#pragma once

#include <opencv2/core.hpp>

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Forward declarations (FreeType handles are pointers to opaque records)
typedef struct FT_LibraryRec_* FT_Library;
typedef struct FT_FaceRec_* FT_Face;

namespace bmk {

// =============================================================================
// Rasterizer Interface
// =============================================================================

class ITextRasterizer {
public:
    virtual ~ITextRasterizer() = default;

    ITextRasterizer(const ITextRasterizer&) = delete;
    ITextRasterizer& operator=(const ITextRasterizer&) = delete;

    /**
     * Rasterize text lines, each centered horizontally, stacked top-down
     *
     * @param lines       UTF-8 lines (empty lines keep their line height)
     * @param pixel_size  Font size in pixels (>= 1)
     * @return            CV_8UC1 coverage mask cropped to the text box
     * @throws WatermarkError(TextRenderError) if the text cannot be drawn
     */
    [[nodiscard]] virtual cv::Mat rasterize(const std::vector<std::string>& lines,
                                            int pixel_size) const = 0;

    /**
     * Short description for logs
     */
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

protected:
    ITextRasterizer() = default;
};

// =============================================================================
// FreeType Implementation
// =============================================================================

class FreeTypeRasterizer final : public ITextRasterizer {
public:
    /**
     * Load a font face
     * @param font_path  TrueType/OpenType file, empty to use find_system_font()
     * @throws WatermarkError(TextRenderError) if no font can be loaded
     */
    explicit FreeTypeRasterizer(const std::filesystem::path& font_path = {});
    ~FreeTypeRasterizer() override;

    [[nodiscard]] cv::Mat rasterize(const std::vector<std::string>& lines,
                                    int pixel_size) const override;

    [[nodiscard]] std::string_view name() const noexcept override { return m_name; }

    [[nodiscard]] const std::filesystem::path& font_path() const noexcept { return m_font_path; }

private:
    FT_Library m_library{nullptr};
    FT_Face m_face{nullptr};
    std::filesystem::path m_font_path;
    std::string m_name;

    // FT_Face is not thread-safe; the batch pool may share one rasterizer
    mutable std::mutex m_mutex;
};

// =============================================================================
// Helpers
// =============================================================================

/**
 * First existing font from a list of well-known system locations
 * (CJK-capable faces preferred)
 */
[[nodiscard]] std::optional<std::filesystem::path> find_system_font();

/**
 * Decode UTF-8 into code points
 * @throws WatermarkError(TextRenderError) on malformed input
 */
[[nodiscard]] std::u32string decode_utf8(std::string_view text);

}  // namespace bmk
