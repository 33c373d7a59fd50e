/**
 * @file    test_fakes.hpp
 * @brief   Test doubles shared by the unit tests
 * @author  BatchMark Authors
 * @license MIT
 */

#pragma once

#include "core/batch_scheduler.hpp"
#include "core/text_rasterizer.hpp"
#include "core/types.hpp"

#include <opencv2/core.hpp>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace bmk::test {

/**
 * Draws every line as a solid box, 0.6 * pixel_size wide per byte
 */
class BoxRasterizer final : public ITextRasterizer {
public:
    [[nodiscard]] cv::Mat rasterize(const std::vector<std::string>& lines,
                                    int pixel_size) const override {
        if (lines.empty()) {
            throw WatermarkError(ErrorKind::TextRenderError, "No text to render");
        }
        ++m_calls;

        size_t longest = 0;
        for (const auto& line : lines) {
            longest = std::max(longest, line.size());
        }
        const int width = std::max(1, static_cast<int>(longest * pixel_size * 6 / 10));
        const int height = std::max(1, pixel_size * static_cast<int>(lines.size()));
        return cv::Mat(height, width, CV_8UC1, cv::Scalar(255));
    }

    [[nodiscard]] std::string_view name() const noexcept override { return "BoxRasterizer"; }

    [[nodiscard]] int calls() const noexcept { return m_calls.load(); }

private:
    mutable std::atomic<int> m_calls{0};
};

/**
 * Image store backed by memory
 *
 * Paths listed in corrupt() fail to decode; unknown paths are missing files.
 */
class MemoryImageStore final : public IImageStore {
public:
    void add(const std::filesystem::path& path, cv::Mat image) {
        std::lock_guard lock(m_mutex);
        m_images[path] = std::move(image);
    }

    void add_corrupt(const std::filesystem::path& path) {
        std::lock_guard lock(m_mutex);
        m_corrupt.insert(path);
    }

    [[nodiscard]] cv::Mat load(const std::filesystem::path& path) override {
        if (on_load) {
            on_load(path);
        }

        std::lock_guard lock(m_mutex);
        if (m_corrupt.count(path)) {
            throw WatermarkError(ErrorKind::UnsupportedImageFormat, "Failed to decode image");
        }
        auto it = m_images.find(path);
        if (it == m_images.end()) {
            throw WatermarkError(ErrorKind::IOFailure, "File not found");
        }
        ++m_loads;
        return it->second.clone();
    }

    void write(const std::filesystem::path& path, const std::vector<uint8_t>& data) override {
        std::lock_guard lock(m_mutex);
        if (m_fail_writes) {
            throw WatermarkError(ErrorKind::IOFailure, "Disk full");
        }
        m_written[path] = data;
    }

    void fail_writes(bool fail) {
        std::lock_guard lock(m_mutex);
        m_fail_writes = fail;
    }

    [[nodiscard]] std::map<std::filesystem::path, std::vector<uint8_t>> written() const {
        std::lock_guard lock(m_mutex);
        return m_written;
    }

    [[nodiscard]] int loads() const {
        std::lock_guard lock(m_mutex);
        return m_loads;
    }

    // Called before every load, outside the store lock
    std::function<void(const std::filesystem::path&)> on_load;

private:
    mutable std::mutex m_mutex;
    std::map<std::filesystem::path, cv::Mat> m_images;
    std::set<std::filesystem::path> m_corrupt;
    std::map<std::filesystem::path, std::vector<uint8_t>> m_written;
    bool m_fail_writes{false};
    int m_loads{0};
};

/**
 * Records every progress update
 */
class RecordingProgress final : public IProgressSink {
public:
    struct Update {
        size_t completed;
        size_t total;
        std::filesystem::path path;
    };

    void update(size_t completed, size_t total, const std::filesystem::path& current_path) override {
        std::lock_guard lock(m_mutex);
        m_updates.push_back(Update{completed, total, current_path});
    }

    [[nodiscard]] std::vector<Update> updates() const {
        std::lock_guard lock(m_mutex);
        return m_updates;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<Update> m_updates;
};

/**
 * Progress sink that throws on the given update
 */
class ThrowingProgress final : public IProgressSink {
public:
    explicit ThrowingProgress(size_t throw_at) : m_throw_at(throw_at) {}

    void update(size_t completed, size_t, const std::filesystem::path&) override {
        if (completed == m_throw_at) {
            throw std::runtime_error("progress sink failed");
        }
    }

private:
    size_t m_throw_at;
};

}  // namespace bmk::test
