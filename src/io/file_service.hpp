/**
 * @file    file_service.hpp
 * @brief   Input discovery, output naming and local image I/O
 * @author  BatchMark Authors
 * @license MIT
 *
 * @details
 * Everything the batch needs from the file system: collecting supported
 * images, naming outputs, pre-flight checks (format, disk space) and the
 * LocalImageStore used by the scheduler to decode and write files.
 */

#pragma once

#include "core/batch_scheduler.hpp"
#include "core/watermark_config.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace bmk::io {

/**
 * Supported input extensions (lower case, with dot)
 */
[[nodiscard]] const std::vector<std::string>& supported_extensions();

/**
 * Check if file extension is supported (case-insensitive)
 */
[[nodiscard]] bool is_supported_extension(const std::filesystem::path& path);

/**
 * Check that a file exists, has a supported extension and that OpenCV
 * has a decoder for it
 */
[[nodiscard]] bool validate_image(const std::filesystem::path& path);

/**
 * Supported image files directly inside a directory, sorted by path
 */
[[nodiscard]] std::vector<std::filesystem::path> collect_images(const std::filesystem::path& directory);

/**
 * Output path for one input
 *
 * Directory: output.destination_directory, or <input dir>/watermarked
 * Stem:      by name rule, then "_<suffix>" when the suffix is non-empty
 * Extension: from output.format
 *
 * @param index  Zero-based position of the input in the batch
 */
[[nodiscard]] std::filesystem::path make_output_path(const std::filesystem::path& input,
                                                     const OutputConfig& output,
                                                     size_t index);

/**
 * One job per input, in order
 *
 * Destinations are unique: when two inputs map to the same output path
 * (a.jpg and a.png), the later one gets a _2, _3, ... stem suffix and a
 * warning is logged.
 */
[[nodiscard]] std::vector<ImageJob> make_jobs(const std::vector<std::filesystem::path>& inputs,
                                              const OutputConfig& output);

/**
 * Rough size of the outputs (JPEG: 0.8 * quality/100 of input, PNG: 1.2x)
 */
[[nodiscard]] std::uintmax_t estimate_output_size(const std::vector<std::filesystem::path>& inputs,
                                                  const OutputConfig& output);

/**
 * Free bytes on the volume holding directory (nearest existing parent)
 * @return 0 if unknown
 */
[[nodiscard]] std::uintmax_t available_space(const std::filesystem::path& directory);

/**
 * Whether the destination has room for estimate_output_size()
 */
[[nodiscard]] bool check_disk_space(const std::vector<std::filesystem::path>& inputs,
                                    const OutputConfig& output,
                                    const std::filesystem::path& directory);

/**
 * Create the directory if needed and verify it is writable
 * @return  (ok, message)
 */
[[nodiscard]] std::pair<bool, std::string> validate_output_directory(const std::filesystem::path& directory);

// =============================================================================
// Local Image Store
// =============================================================================

/**
 * IImageStore backed by the local file system (OpenCV codecs)
 */
class LocalImageStore final : public IImageStore {
public:
    [[nodiscard]] cv::Mat load(const std::filesystem::path& path) override;
    void write(const std::filesystem::path& path, const std::vector<uint8_t>& data) override;
};

}  // namespace bmk::io
