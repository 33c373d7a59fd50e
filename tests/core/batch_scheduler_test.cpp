/**
 * @file    batch_scheduler_test.cpp
 * @brief   Unit tests for the batch scheduler
 * @author  BatchMark Authors
 * @license MIT
 */

#include <gtest/gtest.h>
#include "core/batch_scheduler.hpp"
#include "core/types.hpp"
#include "test_fakes.hpp"

#include <opencv2/core.hpp>

#include <fmt/format.h>

#include <atomic>
#include <stdexcept>

namespace bmk {

namespace fs = std::filesystem;

class BatchSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.text = {"SAMPLE"};
        config_.count = 2;
        output_.format = ImageFormat::PNG;
    }

    // Adds n valid images and returns their jobs
    std::vector<ImageJob> add_images(int n) {
        std::vector<ImageJob> jobs;
        for (int i = 0; i < n; ++i) {
            const fs::path src = fmt::format("in/img_{:02d}.jpg", i);
            const fs::path dst = fmt::format("out/img_{:02d}.png", i);
            store_.add(src, cv::Mat(120 + i, 160, CV_8UC3, cv::Scalar(90, 90, 90)));
            jobs.push_back(ImageJob{src, dst});
        }
        return jobs;
    }

    test::BoxRasterizer rasterizer_;
    WatermarkRenderer renderer_{rasterizer_};
    test::MemoryImageStore store_;
    WatermarkConfig config_;
    OutputConfig output_;
};

// =============================================================================
// Success and Failure Isolation
// =============================================================================

TEST_F(BatchSchedulerTest, ProcessesEveryJob) {
    const auto jobs = add_images(5);
    BatchScheduler scheduler(store_, renderer_);
    EXPECT_EQ(scheduler.status(), BatchStatus::Idle);

    const BatchResult result = scheduler.run_batch(jobs, config_, output_);

    EXPECT_EQ(result.total, 5u);
    EXPECT_EQ(result.succeeded, 5u);
    EXPECT_TRUE(result.failed.empty());
    EXPECT_FALSE(result.canceled);
    EXPECT_EQ(result.status, BatchStatus::Completed);
    EXPECT_EQ(scheduler.status(), BatchStatus::Completed);

    const auto written = store_.written();
    ASSERT_EQ(written.size(), 5u);
    for (const auto& job : jobs) {
        ASSERT_TRUE(written.count(job.destination_path)) << job.destination_path;
        EXPECT_FALSE(written.at(job.destination_path).empty());
    }
}

TEST_F(BatchSchedulerTest, ZeroSizedImageFailsAlone) {
    auto jobs = add_images(4);
    store_.add("in/empty.png", cv::Mat());
    jobs.insert(jobs.begin() + 2, ImageJob{"in/empty.png", "out/empty.png"});

    BatchScheduler scheduler(store_, renderer_);
    const BatchResult result = scheduler.run_batch(jobs, config_, output_);

    EXPECT_EQ(result.succeeded, 4u);
    ASSERT_EQ(result.failed.size(), 1u);
    EXPECT_EQ(result.failed[0].path, fs::path("in/empty.png"));
    EXPECT_EQ(result.failed[0].kind, ErrorKind::InvalidImageDimensions);
    EXPECT_EQ(result.status, BatchStatus::Completed);
    EXPECT_EQ(store_.written().count("out/empty.png"), 0u);
}

TEST_F(BatchSchedulerTest, CorruptFileIsReportedAndSkipped) {
    auto jobs = add_images(9);
    store_.add_corrupt("in/broken.jpg");
    jobs.insert(jobs.begin() + 6, ImageJob{"in/broken.jpg", "out/broken.png"});
    ASSERT_EQ(jobs.size(), 10u);

    BatchScheduler scheduler(store_, renderer_);
    const BatchResult result = scheduler.run_batch(jobs, config_, output_);

    EXPECT_EQ(result.total, 10u);
    EXPECT_EQ(result.succeeded, 9u);
    ASSERT_EQ(result.failed.size(), 1u);
    EXPECT_EQ(result.failed[0].path, fs::path("in/broken.jpg"));
    EXPECT_EQ(result.failed[0].kind, ErrorKind::UnsupportedImageFormat);
    EXPECT_EQ(store_.written().size(), 9u);
}

TEST_F(BatchSchedulerTest, MissingFileIsIoFailure) {
    std::vector<ImageJob> jobs{ImageJob{"in/nowhere.jpg", "out/nowhere.png"}};

    BatchScheduler scheduler(store_, renderer_);
    const BatchResult result = scheduler.run_batch(jobs, config_, output_);

    ASSERT_EQ(result.failed.size(), 1u);
    EXPECT_EQ(result.failed[0].kind, ErrorKind::IOFailure);
    EXPECT_EQ(result.status, BatchStatus::Failed);
}

TEST_F(BatchSchedulerTest, AllJobsFailingMarksRunFailed) {
    const auto jobs = add_images(3);
    store_.fail_writes(true);

    BatchScheduler scheduler(store_, renderer_);
    const BatchResult result = scheduler.run_batch(jobs, config_, output_);

    EXPECT_EQ(result.succeeded, 0u);
    EXPECT_EQ(result.failed.size(), 3u);
    EXPECT_EQ(result.status, BatchStatus::Failed);
    for (const auto& f : result.failed) {
        EXPECT_EQ(f.kind, ErrorKind::IOFailure);
    }
}

TEST_F(BatchSchedulerTest, EmptyBatchCompletes) {
    BatchScheduler scheduler(store_, renderer_);
    const BatchResult result = scheduler.run_batch({}, config_, output_);

    EXPECT_EQ(result.total, 0u);
    EXPECT_EQ(result.processed(), 0u);
    EXPECT_EQ(result.status, BatchStatus::Completed);
}

// =============================================================================
// Configuration
// =============================================================================

TEST_F(BatchSchedulerTest, InvalidConfigFailsBeforeAnyJob) {
    const auto jobs = add_images(3);
    config_.count = 0;

    BatchScheduler scheduler(store_, renderer_);
    try {
        (void)scheduler.run_batch(jobs, config_, output_);
        FAIL() << "expected WatermarkError";
    } catch (const WatermarkError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidConfig);
    }

    EXPECT_EQ(store_.loads(), 0);
    EXPECT_TRUE(store_.written().empty());
    EXPECT_EQ(scheduler.status(), BatchStatus::Idle);
}

TEST_F(BatchSchedulerTest, InvalidOutputConfigFailsBeforeAnyJob) {
    const auto jobs = add_images(2);
    output_.jpeg_quality = 10;

    BatchScheduler scheduler(store_, renderer_);
    EXPECT_THROW((void)scheduler.run_batch(jobs, config_, output_), WatermarkError);
    EXPECT_EQ(store_.loads(), 0);
}

// =============================================================================
// Progress and Cancellation
// =============================================================================

TEST_F(BatchSchedulerTest, ProgressIsMonotonic) {
    const auto jobs = add_images(6);
    test::RecordingProgress progress;

    BatchScheduler scheduler(store_, renderer_);
    (void)scheduler.run_batch(jobs, config_, output_, &progress);

    const auto updates = progress.updates();
    ASSERT_EQ(updates.size(), 6u);
    for (size_t i = 0; i < updates.size(); ++i) {
        EXPECT_EQ(updates[i].completed, i + 1);
        EXPECT_EQ(updates[i].total, 6u);
        // Sequential runs report in job order
        EXPECT_EQ(updates[i].path, jobs[i].source_path);
    }
}

TEST_F(BatchSchedulerTest, CancelStopsBetweenJobs) {
    const auto jobs = add_images(8);
    CancelToken cancel{false};
    int loads = 0;
    store_.on_load = [&](const fs::path&) {
        if (++loads == 3) {
            cancel.store(true);
        }
    };

    BatchScheduler scheduler(store_, renderer_);
    const BatchResult result = scheduler.run_batch(jobs, config_, output_, nullptr, &cancel);

    // The job in flight when cancel was requested still finishes
    EXPECT_TRUE(result.canceled);
    EXPECT_EQ(result.status, BatchStatus::Canceled);
    EXPECT_EQ(result.processed(), 3u);
    EXPECT_EQ(result.succeeded, 3u);
    EXPECT_EQ(store_.written().size(), 3u);
    EXPECT_EQ(loads, 3);
}

TEST_F(BatchSchedulerTest, CancelBeforeStartProcessesNothing) {
    const auto jobs = add_images(3);
    CancelToken cancel{true};

    BatchScheduler scheduler(store_, renderer_);
    const BatchResult result = scheduler.run_batch(jobs, config_, output_, nullptr, &cancel);

    EXPECT_EQ(result.processed(), 0u);
    EXPECT_EQ(result.status, BatchStatus::Canceled);
    EXPECT_EQ(store_.loads(), 0);
}

TEST_F(BatchSchedulerTest, SchedulerIsReusable) {
    const auto jobs = add_images(2);
    BatchScheduler scheduler(store_, renderer_);

    EXPECT_EQ(scheduler.run_batch(jobs, config_, output_).succeeded, 2u);
    EXPECT_EQ(scheduler.run_batch(jobs, config_, output_).succeeded, 2u);
}

TEST_F(BatchSchedulerTest, ConcurrentRunIsRejected) {
    const auto jobs = add_images(2);
    BatchScheduler scheduler(store_, renderer_);

    bool rejected = false;
    store_.on_load = [&](const fs::path&) {
        if (rejected) return;
        try {
            (void)scheduler.run_batch(jobs, config_, output_);
        } catch (const std::logic_error&) {
            rejected = true;
        }
    };

    const BatchResult result = scheduler.run_batch(jobs, config_, output_);
    EXPECT_TRUE(rejected);
    EXPECT_EQ(result.succeeded, 2u);
}

TEST_F(BatchSchedulerTest, ProgressSinkErrorPropagatesAndReleasesScheduler) {
    const auto jobs = add_images(5);
    test::ThrowingProgress progress(2);

    BatchScheduler scheduler(store_, renderer_);
    EXPECT_THROW((void)scheduler.run_batch(jobs, config_, output_, &progress), std::runtime_error);

    // No further jobs are claimed once the sink has thrown
    EXPECT_EQ(store_.loads(), 2);
    EXPECT_EQ(scheduler.status(), BatchStatus::Failed);

    // The scheduler accepts the next run
    EXPECT_EQ(scheduler.run_batch(jobs, config_, output_).status, BatchStatus::Completed);
}

// =============================================================================
// Worker Pool
// =============================================================================

TEST_F(BatchSchedulerTest, ProgressSinkErrorInWorkerThreadIsRethrown) {
    const auto jobs = add_images(12);
    test::ThrowingProgress progress(3);

    BatchScheduler scheduler(store_, renderer_, 4);
    EXPECT_THROW((void)scheduler.run_batch(jobs, config_, output_, &progress), std::runtime_error);
    EXPECT_LT(store_.loads(), 12);
    EXPECT_NE(scheduler.status(), BatchStatus::Running);

    EXPECT_EQ(scheduler.run_batch(jobs, config_, output_).succeeded, 12u);
}

TEST_F(BatchSchedulerTest, ParallelWorkersMatchSequentialResult) {
    auto jobs = add_images(12);
    store_.add_corrupt("in/bad_a.jpg");
    store_.add_corrupt("in/bad_b.jpg");
    jobs.insert(jobs.begin() + 9, ImageJob{"in/bad_b.jpg", "out/bad_b.png"});
    jobs.insert(jobs.begin() + 3, ImageJob{"in/bad_a.jpg", "out/bad_a.png"});
    test::RecordingProgress progress;

    BatchScheduler scheduler(store_, renderer_, 4);
    EXPECT_EQ(scheduler.workers(), 4);
    const BatchResult result = scheduler.run_batch(jobs, config_, output_, &progress);

    EXPECT_EQ(result.total, 14u);
    EXPECT_EQ(result.succeeded, 12u);
    ASSERT_EQ(result.failed.size(), 2u);
    // Failures are reported in job order regardless of completion order
    EXPECT_EQ(result.failed[0].path, fs::path("in/bad_a.jpg"));
    EXPECT_EQ(result.failed[1].path, fs::path("in/bad_b.jpg"));
    EXPECT_EQ(store_.written().size(), 12u);

    const auto updates = progress.updates();
    ASSERT_EQ(updates.size(), 14u);
    for (size_t i = 0; i < updates.size(); ++i) {
        EXPECT_EQ(updates[i].completed, i + 1);
    }
}

TEST_F(BatchSchedulerTest, WorkerCountHasFloor) {
    BatchScheduler scheduler(store_, renderer_, 0);
    EXPECT_EQ(scheduler.workers(), 1);
}

}  // namespace bmk
