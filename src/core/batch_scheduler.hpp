/**
 * @file    batch_scheduler.hpp
 * @brief   Batch watermarking scheduler
 * @author  BatchMark Authors
 * @license MIT
 *
 * @details
 * Drives layout + render + write over an ordered list of jobs.
 * A failing job is recorded and skipped; it never aborts the batch.
 * Cancellation is cooperative and only checked between jobs.
 *
 * State machine (per run):
 *   Idle -> Running -> Completed | Canceled | Failed (every job failed)
 */

#pragma once

#include "core/types.hpp"
#include "core/watermark_config.hpp"
#include "core/watermark_renderer.hpp"

#include <opencv2/core.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace bmk {

// =============================================================================
// Jobs and Results
// =============================================================================

struct ImageJob {
    std::filesystem::path source_path;
    std::filesystem::path destination_path;
};

struct BatchFailure {
    std::filesystem::path path;
    ErrorKind kind{ErrorKind::IOFailure};
    std::string message;
};

enum class BatchStatus {
    Idle,
    Running,
    Completed,
    Canceled,
    Failed      // Every job failed
};

[[nodiscard]] constexpr std::string_view to_string(BatchStatus status) noexcept {
    switch (status) {
        case BatchStatus::Idle:      return "Idle";
        case BatchStatus::Running:   return "Running";
        case BatchStatus::Completed: return "Completed";
        case BatchStatus::Canceled:  return "Canceled";
        case BatchStatus::Failed:    return "Failed";
        default:                     return "Unknown";
    }
}

struct BatchResult {
    size_t total{0};
    size_t succeeded{0};
    std::vector<BatchFailure> failed;   // In job order
    bool canceled{false};
    BatchStatus status{BatchStatus::Idle};

    [[nodiscard]] size_t processed() const noexcept { return succeeded + failed.size(); }
};

// =============================================================================
// Collaborator Interfaces
// =============================================================================

/**
 * Cooperative cancellation flag, owned by the caller
 */
using CancelToken = std::atomic<bool>;

/**
 * Progress receiver (e.g. a progress bar)
 *
 * update() is called once after every job, with completed strictly
 * increasing. Calls are serialized. Implementations must return promptly;
 * the scheduler waits for them.
 */
class IProgressSink {
public:
    virtual ~IProgressSink() = default;

    virtual void update(size_t completed, size_t total,
                        const std::filesystem::path& current_path) = 0;
};

/**
 * Image source/destination (file service seam)
 */
class IImageStore {
public:
    virtual ~IImageStore() = default;

    /**
     * Decode an image
     * @throws WatermarkError  IOFailure (unreadable), UnsupportedImageFormat (undecodable)
     */
    [[nodiscard]] virtual cv::Mat load(const std::filesystem::path& path) = 0;

    /**
     * Write encoded bytes
     * @throws WatermarkError(IOFailure)
     */
    virtual void write(const std::filesystem::path& path, const std::vector<uint8_t>& data) = 0;
};

// =============================================================================
// Batch Scheduler
// =============================================================================

class BatchScheduler {
public:
    /**
     * @param store     Image store (must outlive the scheduler)
     * @param renderer  Renderer (must outlive the scheduler)
     * @param workers   Concurrent jobs; 1 = sequential
     */
    BatchScheduler(IImageStore& store, const WatermarkRenderer& renderer, int workers = 1);

    // Non-copyable (holds references)
    BatchScheduler(const BatchScheduler&) = delete;
    BatchScheduler& operator=(const BatchScheduler&) = delete;

    /**
     * Process jobs in order
     *
     * @param jobs      Ordered jobs
     * @param config    Watermark parameters (validated before any job)
     * @param output    Output parameters (validated before any job)
     * @param progress  Optional progress sink
     * @param cancel    Optional cancel flag, checked between jobs
     * @return          Summary; failures listed in job order
     * @throws WatermarkError(InvalidConfig)  before any job runs
     * @throws std::logic_error               if a run is already in progress
     *
     * An exception thrown by the progress sink stops job claiming, waits for
     * in-flight jobs, and is rethrown. The run then ends as Failed.
     */
    BatchResult run_batch(const std::vector<ImageJob>& jobs,
                          const WatermarkConfig& config,
                          const OutputConfig& output,
                          IProgressSink* progress = nullptr,
                          const CancelToken* cancel = nullptr);

    [[nodiscard]] BatchStatus status() const noexcept { return m_status.load(); }
    [[nodiscard]] int workers() const noexcept { return m_workers; }

private:
    IImageStore& m_store;
    const WatermarkRenderer& m_renderer;
    int m_workers;
    std::atomic<BatchStatus> m_status{BatchStatus::Idle};

    // Load -> layout -> render -> write; throws on failure
    void process_job(const ImageJob& job,
                     const WatermarkConfig& config,
                     const OutputConfig& output) const;
};

}  // namespace bmk
