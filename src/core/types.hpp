/**
 * @file    types.hpp
 * @brief   Shared type definitions for BatchMark
 * @author  BatchMark Authors
 * @license MIT
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace bmk {

// Version info
inline constexpr const char* kVersion = "1.0.0";

// Failure categories reported by the engine and the batch scheduler
enum class ErrorKind {
    InvalidConfig,            // Parameter out of domain (fatal before batch start)
    InvalidImageDimensions,   // Zero/negative size or empty buffer
    UnsupportedImageFormat,   // Undecodable file or unsupported pixel layout
    TextRenderError,          // Font missing or glyphs not renderable
    IOFailure                 // Read/write failure reported by the file service
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidConfig:          return "InvalidConfig";
        case ErrorKind::InvalidImageDimensions: return "InvalidImageDimensions";
        case ErrorKind::UnsupportedImageFormat: return "UnsupportedImageFormat";
        case ErrorKind::TextRenderError:        return "TextRenderError";
        case ErrorKind::IOFailure:              return "IOFailure";
        default:                                return "Unknown";
    }
}

/**
 * Exception carrying an ErrorKind
 *
 * Thrown by the layout engine, renderer, image store and template store.
 * The batch scheduler catches it per job and records the kind.
 */
class WatermarkError : public std::runtime_error {
public:
    WatermarkError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return m_kind; }

private:
    ErrorKind m_kind;
};

}  // namespace bmk
