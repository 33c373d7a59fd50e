/**
 * @file    path_formatter.hpp
 * @brief   UTF-8 path helpers and fmt formatter for std::filesystem::path
 * @author  BatchMark Authors
 * @license MIT
 *
 * @details
 * Log messages are UTF-8 but path.string() is in the local code page on
 * Windows. Everything that prints a path goes through u8string() instead.
 *
 * Usage:
 *   #include "utils/path_formatter.hpp"
 *   spdlog::info("Saved: {}", output_path);
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <fmt/format.h>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace bmk {

/**
 * Convert filesystem path to UTF-8 encoded std::string
 *
 * C++20 u8string() returns std::u8string (char8_t), copy it into a
 * plain std::string.
 */
inline std::string to_utf8(const std::filesystem::path& path) {
    auto u8str = path.u8string();
    return std::string(
        reinterpret_cast<const char*>(u8str.data()),
        u8str.size()
    );
}

/**
 * Build a path from a UTF-8 string (command-line arguments, JSON values)
 *
 * On Windows a narrow string is otherwise interpreted in the ANSI code
 * page, corrupting CJK file names.
 */
inline std::filesystem::path path_from_utf8(const std::string& utf8_str) {
#ifdef _WIN32
    if (utf8_str.empty()) return {};

    int len = MultiByteToWideChar(CP_UTF8, 0, utf8_str.c_str(), -1, nullptr, 0);
    if (len <= 0) return std::filesystem::path(utf8_str);

    std::wstring wstr(len - 1, L'\0');
    MultiByteToWideChar(CP_UTF8, 0, utf8_str.c_str(), -1, wstr.data(), len);
    return std::filesystem::path(wstr);
#else
    return std::filesystem::path(utf8_str);
#endif
}

/**
 * Human readable byte count: "512 B", "1.5 KB", "3.2 MB", "1.0 GB"
 */
inline std::string format_file_size(std::uintmax_t bytes) {
    constexpr double kKiB = 1024.0;
    constexpr double kMiB = kKiB * 1024.0;
    constexpr double kGiB = kMiB * 1024.0;

    const auto b = static_cast<double>(bytes);
    if (b < kKiB) return fmt::format("{} B", bytes);
    if (b < kMiB) return fmt::format("{:.1f} KB", b / kKiB);
    if (b < kGiB) return fmt::format("{:.1f} MB", b / kMiB);
    return fmt::format("{:.1f} GB", b / kGiB);
}

}  // namespace bmk

// =============================================================================
// fmt formatter specialization for std::filesystem::path
// =============================================================================

template <>
struct fmt::formatter<std::filesystem::path> : fmt::formatter<std::string_view> {
    auto format(const std::filesystem::path& p, format_context& ctx) const {
        auto u8 = p.u8string();
        std::string_view sv{
            reinterpret_cast<const char*>(u8.data()),
            u8.size()
        };
        return fmt::formatter<std::string_view>::format(sv, ctx);
    }
};
