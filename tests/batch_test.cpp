#include "batch_processor.hpp"
#include "gt3x_fixture.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace acti::fixture;

namespace {

constexpr std::uint32_t kStart = 1600000000;

std::unique_ptr<TempFile> recording(const std::string& name, std::size_t seconds, int zCounts) {
    return std::make_unique<TempFile>(
        name, gt3xArchive(infoText(30.0, kStart), constantActivity2Log(kStart, seconds, 30, {0, 0, zCounts})));
}

acti::BatchProcessor::Config batchConfig(std::size_t workers) {
    acti::BatchProcessor::Config config;
    config.workers = workers;
    config.pipeline.calibrate = false;
    config.pipeline.nonwearAlgorithm = "none";
    return config;
}

}  // namespace

// ============================================================================
// Batch processing
// ============================================================================

TEST(BatchProcessor, KeepsInputOrderAndIsolatesFailures) {
    auto first = recording("acticore_batch_a.gt3x", 300, 256);
    auto second = recording("acticore_batch_b.gt3x", 180, 512);
    std::vector<std::string> paths{first->path(), "/nonexistent/acticore/missing.gt3x", second->path()};

    acti::BatchProcessor batch(batchConfig(2));
    std::vector<acti::FileReport> reports = batch.run(paths);

    ASSERT_EQ(reports.size(), 3u);
    EXPECT_EQ(reports[0].path, paths[0]);
    EXPECT_EQ(reports[1].path, paths[1]);
    EXPECT_EQ(reports[2].path, paths[2]);
    EXPECT_TRUE(reports[0].ok()) << reports[0].error;
    EXPECT_FALSE(reports[1].ok());
    EXPECT_NE(reports[1].error.find("File not found"), std::string::npos);
    EXPECT_TRUE(reports[2].ok()) << reports[2].error;
    ASSERT_TRUE(reports[0].epochs.has_value());
    ASSERT_TRUE(reports[2].epochs.has_value());
    EXPECT_EQ(reports[0].epochs->size(), 5u);
    EXPECT_EQ(reports[2].epochs->size(), 3u);
    EXPECT_NEAR(reports[2].meanEnmo, 1.0, 1e-12);
}

TEST(BatchProcessor, MatchesSingleFileRuns) {
    auto a = recording("acticore_batch_single_a.gt3x", 240, 256);
    auto b = recording("acticore_batch_single_b.gt3x", 240, 300);
    std::vector<std::string> paths{a->path(), b->path()};

    acti::BatchProcessor::Config config = batchConfig(2);
    std::vector<acti::FileReport> batched = acti::BatchProcessor(config).run(paths);
    acti::FilePipeline single(config.pipeline);
    for (std::size_t i = 0; i < paths.size(); ++i) {
        acti::FileReport alone = single.run(paths[i]);
        ASSERT_TRUE(alone.ok()) << alone.error;
        ASSERT_TRUE(batched[i].ok()) << batched[i].error;
        EXPECT_EQ(batched[i].epochs->counts, alone.epochs->counts);
        EXPECT_EQ(batched[i].scores->scores, alone.scores->scores);
        EXPECT_DOUBLE_EQ(batched[i].meanEnmo, alone.meanEnmo);
    }
}

TEST(BatchProcessor, ReportsProgress) {
    auto a = recording("acticore_batch_progress_a.gt3x", 120, 256);
    auto b = recording("acticore_batch_progress_b.gt3x", 120, 256);
    acti::BatchProcessor batch(batchConfig(1));
    std::vector<std::size_t> completed;
    batch.setProgressCallback([&](const acti::BatchProgress& p) {
        EXPECT_EQ(p.total, 2u);
        ASSERT_NE(p.report, nullptr);
        completed.push_back(p.completed);
    });
    batch.run({a->path(), b->path()});
    EXPECT_EQ(completed, (std::vector<std::size_t>{1, 2}));
}

TEST(BatchProcessor, CancelBeforeRunMarksEveryFile) {
    auto a = recording("acticore_batch_cancel.gt3x", 120, 256);
    acti::BatchProcessor batch(batchConfig(2));
    batch.requestCancel();
    EXPECT_TRUE(batch.cancelRequested());
    std::vector<acti::FileReport> reports = batch.run({a->path(), a->path()});
    ASSERT_EQ(reports.size(), 2u);
    for (const auto& r : reports) {
        EXPECT_TRUE(r.cancelled);
        EXPECT_FALSE(r.ok());
        EXPECT_EQ(r.path, a->path());
    }
}

TEST(BatchProcessor, InvalidConfigThrowsUpFront) {
    acti::BatchProcessor::Config config = batchConfig(1);
    config.pipeline.sleepAlgorithm = "guess";
    EXPECT_THROW(acti::BatchProcessor batch(config), std::invalid_argument);

    EXPECT_TRUE(acti::BatchProcessor(batchConfig(3)).run({}).empty());
    EXPECT_GE(acti::BatchProcessor(batchConfig(0)).workers(), 1u);
}
