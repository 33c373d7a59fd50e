/**
 * @file    batch_scheduler.cpp
 * @brief   Batch watermarking scheduler
 * @author  BatchMark Authors
 * @license MIT
 */

#include "core/batch_scheduler.hpp"
#include "core/layout_engine.hpp"
#include "utils/path_formatter.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>

namespace bmk {

namespace {

struct IndexedFailure {
    size_t index;
    BatchFailure failure;
};

/**
 * Run one job and translate any exception into a failure record
 */
template <typename Fn>
std::optional<BatchFailure> run_guarded(const ImageJob& job, Fn&& fn) {
    try {
        fn();
        return std::nullopt;
    } catch (const WatermarkError& e) {
        return BatchFailure{job.source_path, e.kind(), e.what()};
    } catch (const cv::Exception& e) {
        return BatchFailure{job.source_path, ErrorKind::UnsupportedImageFormat,
                            fmt::format("OpenCV: {}", e.what())};
    } catch (const std::filesystem::filesystem_error& e) {
        return BatchFailure{job.source_path, ErrorKind::IOFailure, e.what()};
    } catch (const std::exception& e) {
        return BatchFailure{job.source_path, ErrorKind::IOFailure, e.what()};
    }
}

/**
 * Leaves Running on every exit path; a run that unwinds ends as Failed
 */
class RunStatusGuard {
public:
    explicit RunStatusGuard(std::atomic<BatchStatus>& status) : m_status(status) {}
    ~RunStatusGuard() {
        BatchStatus expected = BatchStatus::Running;
        m_status.compare_exchange_strong(expected, BatchStatus::Failed);
    }

    RunStatusGuard(const RunStatusGuard&) = delete;
    RunStatusGuard& operator=(const RunStatusGuard&) = delete;

private:
    std::atomic<BatchStatus>& m_status;
};

}  // anonymous namespace

BatchScheduler::BatchScheduler(IImageStore& store, const WatermarkRenderer& renderer, int workers)
    : m_store(store)
    , m_renderer(renderer)
    , m_workers(std::max(1, workers))
{
}

void BatchScheduler::process_job(const ImageJob& job,
                                 const WatermarkConfig& config,
                                 const OutputConfig& output) const {
    // The decoded buffer lives only for the duration of this job
    cv::Mat image = m_store.load(job.source_path);

    const Layout layout = compute_layout(image.cols, image.rows, config);
    RenderedImage rendered = m_renderer.render(image, layout, config, output, RenderMode::Export);
    image.release();
    rendered.image.release();

    m_store.write(job.destination_path, rendered.encoded);
}

BatchResult BatchScheduler::run_batch(const std::vector<ImageJob>& jobs,
                                      const WatermarkConfig& config,
                                      const OutputConfig& output,
                                      IProgressSink* progress,
                                      const CancelToken* cancel) {
    // Misconfiguration is fatal for the whole run, before any job
    config.validate();
    output.validate();

    BatchStatus expected = m_status.load();
    if (expected == BatchStatus::Running ||
        !m_status.compare_exchange_strong(expected, BatchStatus::Running)) {
        throw std::logic_error("run_batch called while a batch is running");
    }
    RunStatusGuard status_guard(m_status);

    const auto start_time = std::chrono::steady_clock::now();
    const size_t total = jobs.size();
    const int workers = static_cast<int>(std::min<size_t>(static_cast<size_t>(m_workers),
                                                          std::max<size_t>(total, 1)));

    spdlog::info("Batch started: {} images, {} worker{}", total, workers, workers > 1 ? "s" : "");

    BatchResult result;
    result.total = total;

    // Shared run state, guarded by mutex (single writer at a time)
    std::mutex mutex;
    size_t next_index = 0;
    size_t completed = 0;
    bool canceled = false;
    std::vector<IndexedFailure> failures;
    // First exception thrown outside a job (progress sink, bookkeeping)
    std::exception_ptr fatal;

    auto worker_loop = [&]() {
        for (;;) {
            size_t index = 0;
            {
                std::lock_guard lock(mutex);
                if (fatal || canceled || next_index >= total) return;
                if (cancel && cancel->load()) {
                    canceled = true;
                    return;
                }
                index = next_index++;
            }

            const ImageJob& job = jobs[index];
            spdlog::debug("[{}/{}] {}", index + 1, total, job.source_path.filename());

            auto failure = run_guarded(job, [&] { process_job(job, config, output); });

            std::lock_guard lock(mutex);
            if (failure) {
                spdlog::error("Failed: {} ({}: {})", job.source_path,
                              to_string(failure->kind), failure->message);
                failures.push_back(IndexedFailure{index, std::move(*failure)});
            } else {
                ++result.succeeded;
                spdlog::debug("Saved: {}", job.destination_path);
            }

            ++completed;
            if (progress) {
                progress->update(completed, total, job.source_path);
            }
        }
    };

    // Escaping a std::thread body would terminate; hand the error back to run_batch
    auto worker = [&]() {
        try {
            worker_loop();
        } catch (...) {
            std::lock_guard lock(mutex);
            if (!fatal) {
                fatal = std::current_exception();
            }
        }
    };

    if (workers <= 1) {
        worker();
    } else {
        std::vector<std::jthread> pool;
        pool.reserve(static_cast<size_t>(workers));
        for (int i = 0; i < workers; ++i) {
            pool.emplace_back(worker);
        }
        for (auto& t : pool) {
            t.join();
        }
    }

    if (fatal) {
        spdlog::error("Batch aborted after {} of {} jobs", completed, total);
        std::rethrow_exception(fatal);
    }

    std::sort(failures.begin(), failures.end(),
              [](const IndexedFailure& a, const IndexedFailure& b) { return a.index < b.index; });
    result.failed.reserve(failures.size());
    for (auto& f : failures) {
        result.failed.push_back(std::move(f.failure));
    }

    result.canceled = canceled;
    if (canceled) {
        result.status = BatchStatus::Canceled;
    } else if (total > 0 && result.succeeded == 0) {
        result.status = BatchStatus::Failed;
    } else {
        result.status = BatchStatus::Completed;
    }
    m_status.store(result.status);

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();
    spdlog::info("Batch {}: {} succeeded, {} failed, {} of {} processed in {} ms",
                 to_string(result.status), result.succeeded, result.failed.size(),
                 result.processed(), total, elapsed);

    return result;
}

}  // namespace bmk
