/**
 * @file    text_rasterizer.cpp
 * @brief   FreeType text rasterization
 * @author  BatchMark Authors
 * @license MIT
 *
 * @details
 * Two passes per call:
 *   1. Load glyph metrics, lay lines out on their baselines and union the
 *      ink boxes with the line boxes to size the mask.
 *   2. Render each glyph (8-bit AA) and blit it with max() into the mask.
 */

#include "core/text_rasterizer.hpp"
#include "core/types.hpp"
#include "utils/path_formatter.hpp"

#include <ft2build.h>
#include FT_FREETYPE_H

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <climits>

namespace bmk {

namespace {

[[noreturn]] void render_error(const std::string& message) {
    throw WatermarkError(ErrorKind::TextRenderError, message);
}

// 26.6 fixed point to integer pixels
constexpr long ft_floor(FT_Pos v) { return v >= 0 ? v >> 6 : -((-v + 63) >> 6); }
constexpr long ft_ceil(FT_Pos v) { return ft_floor(v + 63); }

struct GlyphSlot {
    FT_UInt index;
    long pen_x;     // Pen position relative to the line start
};

struct LineLayout {
    std::vector<GlyphSlot> glyphs;
    long advance{0};
};

struct Bounds {
    long left{LONG_MAX};
    long top{LONG_MAX};
    long right{LONG_MIN};
    long bottom{LONG_MIN};

    void add(long l, long t, long r, long b) {
        left = std::min(left, l);
        top = std::min(top, t);
        right = std::max(right, r);
        bottom = std::max(bottom, b);
    }

    [[nodiscard]] bool empty() const { return right <= left || bottom <= top; }
};

bool is_control(char32_t cp) {
    return cp < 0x20 || (cp >= 0x7F && cp < 0xA0);
}

}  // anonymous namespace

// =============================================================================
// UTF-8
// =============================================================================

std::u32string decode_utf8(std::string_view text) {
    std::u32string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        const auto c = static_cast<unsigned char>(text[i]);
        char32_t cp = 0;
        int extra = 0;

        if (c < 0x80)                { cp = c;        extra = 0; }
        else if ((c & 0xE0) == 0xC0) { cp = c & 0x1F; extra = 1; }
        else if ((c & 0xF0) == 0xE0) { cp = c & 0x0F; extra = 2; }
        else if ((c & 0xF8) == 0xF0) { cp = c & 0x07; extra = 3; }
        else {
            render_error(fmt::format("Malformed UTF-8 at byte {}", i));
        }

        if (i + static_cast<size_t>(extra) >= text.size()) {
            render_error(fmt::format("Truncated UTF-8 sequence at byte {}", i));
        }
        for (int k = 1; k <= extra; ++k) {
            const auto cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) {
                render_error(fmt::format("Malformed UTF-8 at byte {}", i + k));
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        constexpr char32_t kMinForLength[] = {0, 0x80, 0x800, 0x10000};
        if (cp < kMinForLength[extra] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            render_error(fmt::format("Invalid code point U+{:04X}", static_cast<uint32_t>(cp)));
        }

        out.push_back(cp);
        i += static_cast<size_t>(extra) + 1;
    }
    return out;
}

// =============================================================================
// Font discovery
// =============================================================================

std::optional<std::filesystem::path> find_system_font() {
    static const std::array<const char*, 14> kCandidates = {
        "/usr/share/fonts/opentype/noto/NotoSansCJK-Regular.ttc",
        "/usr/share/fonts/noto-cjk/NotoSansCJK-Regular.ttc",
        "/usr/share/fonts/google-noto-cjk/NotoSansCJK-Regular.ttc",
        "/usr/share/fonts/truetype/wqy/wqy-microhei.ttc",
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
        "/usr/share/fonts/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/dejavu-sans-fonts/DejaVuSans.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
        "/usr/share/fonts/liberation-sans/LiberationSans-Regular.ttf",
        "/System/Library/Fonts/PingFang.ttc",
        "/Library/Fonts/Arial Unicode.ttf",
        "C:/Windows/Fonts/msyh.ttc",
        "C:/Windows/Fonts/arial.ttf",
    };

    std::error_code ec;
    for (const char* candidate : kCandidates) {
        std::filesystem::path p(candidate);
        if (std::filesystem::is_regular_file(p, ec)) {
            return p;
        }
    }
    return std::nullopt;
}

// =============================================================================
// FreeTypeRasterizer
// =============================================================================

FreeTypeRasterizer::FreeTypeRasterizer(const std::filesystem::path& font_path) {
    if (font_path.empty()) {
        auto found = find_system_font();
        if (!found) {
            render_error("No font specified and no system font found");
        }
        m_font_path = *found;
    } else {
        m_font_path = font_path;
    }

    if (FT_Init_FreeType(&m_library) != 0) {
        m_library = nullptr;
        render_error("Failed to initialize FreeType");
    }

    if (FT_New_Face(m_library, to_utf8(m_font_path).c_str(), 0, &m_face) != 0) {
        m_face = nullptr;
        FT_Done_FreeType(m_library);
        m_library = nullptr;
        render_error(fmt::format("Failed to load font: {}", m_font_path));
    }

    if (FT_Select_Charmap(m_face, FT_ENCODING_UNICODE) != 0) {
        spdlog::warn("Font {} has no Unicode charmap, using default", m_font_path);
    }

    m_name = fmt::format("FreeType {} {}",
                         m_face->family_name ? m_face->family_name : "?",
                         m_face->style_name ? m_face->style_name : "");
    spdlog::info("Loaded font: {} ({})", m_font_path.filename(), m_name);
}

FreeTypeRasterizer::~FreeTypeRasterizer() {
    if (m_face) {
        FT_Done_Face(m_face);
    }
    if (m_library) {
        FT_Done_FreeType(m_library);
    }
}

cv::Mat FreeTypeRasterizer::rasterize(const std::vector<std::string>& lines,
                                      int pixel_size) const {
    if (lines.empty()) {
        render_error("No text to render");
    }

    std::lock_guard lock(m_mutex);

    if (FT_Set_Pixel_Sizes(m_face, 0, static_cast<FT_UInt>(std::max(1, pixel_size))) != 0) {
        render_error(fmt::format("Font does not support size {}px", pixel_size));
    }

    const FT_Size_Metrics& metrics = m_face->size->metrics;
    const long ascender = ft_ceil(metrics.ascender);
    const long descender = ft_floor(metrics.descender);   // Negative
    const long line_height = std::max(ft_ceil(metrics.height), ascender - descender);
    const bool kerning = FT_HAS_KERNING(m_face);

    // -------------------------------------------------------------------------
    // Pass 1: layout and bounds
    // -------------------------------------------------------------------------
    std::vector<LineLayout> layouts(lines.size());
    long max_advance = 0;

    for (size_t li = 0; li < lines.size(); ++li) {
        LineLayout& line = layouts[li];
        FT_UInt previous = 0;
        long pen = 0;

        for (char32_t cp : decode_utf8(lines[li])) {
            if (is_control(cp)) {
                render_error(fmt::format("Control character U+{:04X} in text",
                                         static_cast<uint32_t>(cp)));
            }

            const FT_UInt index = FT_Get_Char_Index(m_face, cp);
            if (index == 0) {
                render_error(fmt::format("Font {} has no glyph for U+{:04X}",
                                         m_font_path.filename(), static_cast<uint32_t>(cp)));
            }

            if (kerning && previous != 0) {
                FT_Vector delta{};
                if (FT_Get_Kerning(m_face, previous, index, FT_KERNING_DEFAULT, &delta) == 0) {
                    pen += delta.x >> 6;
                }
            }

            if (FT_Load_Glyph(m_face, index, FT_LOAD_DEFAULT) != 0) {
                render_error(fmt::format("Failed to load glyph for U+{:04X}",
                                         static_cast<uint32_t>(cp)));
            }

            line.glyphs.push_back(GlyphSlot{index, pen});
            pen += m_face->glyph->advance.x >> 6;
            previous = index;
        }

        line.advance = pen;
        max_advance = std::max(max_advance, pen);
    }

    Bounds bounds;
    for (size_t li = 0; li < layouts.size(); ++li) {
        const long baseline = static_cast<long>(li) * line_height + ascender;
        const long offset = (max_advance - layouts[li].advance) / 2;

        // Line box keeps spacing stable for lines without descenders
        bounds.add(offset, baseline - ascender, offset + layouts[li].advance, baseline - descender);

        for (const auto& g : layouts[li].glyphs) {
            if (FT_Load_Glyph(m_face, g.index, FT_LOAD_DEFAULT) != 0) {
                render_error("Failed to reload glyph metrics");
            }
            const FT_Glyph_Metrics& gm = m_face->glyph->metrics;
            const long x = offset + g.pen_x;
            bounds.add(x + ft_floor(gm.horiBearingX),
                       baseline - ft_ceil(gm.horiBearingY),
                       x + ft_ceil(gm.horiBearingX + gm.width),
                       baseline - ft_floor(gm.horiBearingY - gm.height));
        }
    }

    if (bounds.empty()) {
        render_error("Text produced an empty surface");
    }

    // -------------------------------------------------------------------------
    // Pass 2: render glyphs
    // -------------------------------------------------------------------------
    cv::Mat mask = cv::Mat::zeros(static_cast<int>(bounds.bottom - bounds.top),
                                  static_cast<int>(bounds.right - bounds.left), CV_8UC1);

    for (size_t li = 0; li < layouts.size(); ++li) {
        const long baseline = static_cast<long>(li) * line_height + ascender;
        const long offset = (max_advance - layouts[li].advance) / 2;

        for (const auto& g : layouts[li].glyphs) {
            if (FT_Load_Glyph(m_face, g.index, FT_LOAD_RENDER) != 0) {
                render_error("Failed to render glyph");
            }

            const FT_GlyphSlot slot = m_face->glyph;
            const FT_Bitmap& bmp = slot->bitmap;
            if (bmp.width == 0 || bmp.rows == 0) continue;
            if (bmp.pixel_mode != FT_PIXEL_MODE_GRAY) {
                render_error("Unsupported glyph bitmap mode");
            }

            const long x0 = offset + g.pen_x + slot->bitmap_left - bounds.left;
            const long y0 = baseline - slot->bitmap_top - bounds.top;

            for (unsigned int row = 0; row < bmp.rows; ++row) {
                const long y = y0 + row;
                if (y < 0 || y >= mask.rows) continue;
                const unsigned char* src = bmp.buffer + static_cast<long>(row) * bmp.pitch;
                uchar* dst = mask.ptr<uchar>(static_cast<int>(y));
                for (unsigned int col = 0; col < bmp.width; ++col) {
                    const long x = x0 + col;
                    if (x < 0 || x >= mask.cols) continue;
                    dst[x] = std::max(dst[x], src[col]);
                }
            }
        }
    }

    if (cv::countNonZero(mask) == 0) {
        render_error("Text has no visible glyphs");
    }

    return mask;
}

}  // namespace bmk
