/**
 * @file    file_service.cpp
 * @brief   Input discovery, output naming and local image I/O
 * @author  BatchMark Authors
 * @license MIT
 */

#include "io/file_service.hpp"
#include "core/types.hpp"
#include "utils/path_formatter.hpp"

#include <opencv2/imgcodecs.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <random>
#include <set>
#include <utility>

namespace fs = std::filesystem;

namespace bmk::io {

namespace {

std::string lower_extension(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string random_hex_id() {
    std::random_device rd;
    std::uniform_int_distribution<uint32_t> dist;
    return fmt::format("{:08x}", dist(rd));
}

}  // anonymous namespace

// =============================================================================
// Input discovery
// =============================================================================

const std::vector<std::string>& supported_extensions() {
    static const std::vector<std::string> kExtensions = {
        ".jpg", ".jpeg", ".png", ".gif", ".bmp"
    };
    return kExtensions;
}

bool is_supported_extension(const fs::path& path) {
    const std::string ext = lower_extension(path);
    const auto& supported = supported_extensions();
    return std::find(supported.begin(), supported.end(), ext) != supported.end();
}

bool validate_image(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec) || !is_supported_extension(path)) {
        return false;
    }
    try {
        return cv::haveImageReader(path.string());
    } catch (const cv::Exception& e) {
        spdlog::debug("No decoder for {}: {}", path, e.what());
        return false;
    }
}

std::vector<fs::path> collect_images(const fs::path& directory) {
    std::vector<fs::path> images;

    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        spdlog::warn("Not a directory: {}", directory);
        return images;
    }

    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        if (!entry.is_regular_file()) continue;
        if (!is_supported_extension(entry.path())) continue;
        images.push_back(entry.path());
    }
    if (ec) {
        spdlog::warn("Error while scanning {}: {}", directory, ec.message());
    }

    std::sort(images.begin(), images.end());
    spdlog::debug("Found {} images in {}", images.size(), directory);
    return images;
}

// =============================================================================
// Output naming
// =============================================================================

fs::path make_output_path(const fs::path& input, const OutputConfig& output, size_t index) {
    const fs::path dir = output.destination_directory.empty()
        ? input.parent_path() / "watermarked"
        : output.destination_directory;

    std::string stem = to_utf8(input.stem());
    switch (output.name_rule) {
        case NameRule::Original:
            break;
        case NameRule::Numbered:
            stem = fmt::format("{}_{:03d}", stem, index + 1);
            break;
        case NameRule::Timestamp:
            stem = fmt::format("{}_{}", stem, random_hex_id());
            break;
    }

    if (!output.suffix.empty()) {
        stem += "_" + output.suffix;
    }

    return dir / path_from_utf8(stem + std::string(output.extension()));
}

std::vector<ImageJob> make_jobs(const std::vector<fs::path>& inputs, const OutputConfig& output) {
    std::vector<ImageJob> jobs;
    jobs.reserve(inputs.size());
    std::set<fs::path> taken;

    for (size_t i = 0; i < inputs.size(); ++i) {
        fs::path dest = make_output_path(inputs[i], output, i);

        // a.jpg and a.png share a stem; never let two jobs write one file
        if (taken.count(dest.lexically_normal())) {
            const fs::path first = dest;
            const std::string stem = to_utf8(dest.stem());
            const std::string ext = to_utf8(dest.extension());
            for (int n = 2; taken.count(dest.lexically_normal()); ++n) {
                dest = first.parent_path() / path_from_utf8(fmt::format("{}_{}{}", stem, n, ext));
            }
            spdlog::warn("Output name collision: {} -> {} (renamed to {})",
                         inputs[i], first.filename(), dest.filename());
        }

        taken.insert(dest.lexically_normal());
        jobs.push_back(ImageJob{inputs[i], std::move(dest)});
    }
    return jobs;
}

// =============================================================================
// Pre-flight checks
// =============================================================================

std::uintmax_t estimate_output_size(const std::vector<fs::path>& inputs, const OutputConfig& output) {
    std::uintmax_t total = 0;
    for (const auto& input : inputs) {
        std::error_code ec;
        const auto size = fs::file_size(input, ec);
        if (!ec) total += size;
    }

    const double factor = output.format == ImageFormat::JPEG
        ? 0.8 * (output.jpeg_quality / 100.0)
        : 1.2;
    return static_cast<std::uintmax_t>(std::llround(static_cast<double>(total) * factor));
}

std::uintmax_t available_space(const fs::path& directory) {
    // The destination may not exist yet; query the nearest existing parent
    fs::path probe = directory.empty() ? fs::current_path() : directory;
    std::error_code ec;
    while (!probe.empty() && !fs::exists(probe, ec)) {
        const fs::path parent = probe.parent_path();
        if (parent == probe) break;
        probe = parent;
    }
    if (probe.empty()) {
        probe = fs::current_path();
    }

    const fs::space_info info = fs::space(probe, ec);
    if (ec) {
        spdlog::warn("Cannot query free space for {}: {}", probe, ec.message());
        return 0;
    }
    return info.available;
}

bool check_disk_space(const std::vector<fs::path>& inputs,
                      const OutputConfig& output,
                      const fs::path& directory) {
    const auto needed = estimate_output_size(inputs, output);
    const auto free = available_space(directory);

    spdlog::debug("Disk space: need ~{}, available {}",
                  format_file_size(needed), format_file_size(free));
    return free >= needed;
}

std::pair<bool, std::string> validate_output_directory(const fs::path& directory) {
    std::error_code ec;
    if (fs::exists(directory, ec) && !fs::is_directory(directory, ec)) {
        return {false, fmt::format("{} is a file, not a directory", directory)};
    }

    fs::create_directories(directory, ec);
    if (ec) {
        return {false, fmt::format("Cannot create {}: {}", directory, ec.message())};
    }

    const fs::path probe = directory / ".batchmark_write_test";
    {
        std::ofstream out(probe, std::ios::binary);
        if (!out) {
            return {false, fmt::format("No write permission for {}", directory)};
        }
    }
    fs::remove(probe, ec);
    return {true, "Directory is writable"};
}

// =============================================================================
// LocalImageStore
// =============================================================================

cv::Mat LocalImageStore::load(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw WatermarkError(ErrorKind::IOFailure, fmt::format("File not found: {}", path));
    }

    cv::Mat image = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
    if (image.empty()) {
        throw WatermarkError(ErrorKind::UnsupportedImageFormat,
                             fmt::format("Failed to decode image: {}", path.filename()));
    }

    spdlog::debug("Loaded {} ({}x{}, {} channels)",
                  path.filename(), image.cols, image.rows, image.channels());
    return image;
}

void LocalImageStore::write(const fs::path& path, const std::vector<uint8_t>& data) {
    // Create output directory if needed
    const auto output_dir = path.parent_path();
    std::error_code ec;
    if (!output_dir.empty() && !fs::exists(output_dir, ec)) {
        fs::create_directories(output_dir, ec);
        if (ec) {
            throw WatermarkError(ErrorKind::IOFailure,
                                 fmt::format("Cannot create {}: {}", output_dir, ec.message()));
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw WatermarkError(ErrorKind::IOFailure, fmt::format("Cannot open {} for writing", path));
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    out.close();
    if (!out) {
        throw WatermarkError(ErrorKind::IOFailure, fmt::format("Failed to write image: {}", path));
    }
}

}  // namespace bmk::io
