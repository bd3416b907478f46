#pragma once

#include "file_pipeline.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace acti {

struct BatchProgress {
    std::size_t completed{0};
    std::size_t total{0};
    const FileReport* report{nullptr};  // the file that just finished
};

// Runs one FilePipeline per worker over independent files. Results keep the
// input order.
class BatchProcessor {
public:
    struct Config {
        PipelineConfig pipeline;
        std::size_t workers{0};  // 0 = hardware concurrency
    };

    using ProgressCallback = std::function<void(const BatchProgress&)>;

    // Validates the pipeline config and backend up front; throws on failure.
    explicit BatchProcessor(Config config);
    BatchProcessor(Config config, const BackendRegistry& registry);

    void setProgressCallback(ProgressCallback callback);

    std::vector<FileReport> run(const std::vector<std::string>& paths);

    // Files not yet started when this is observed are reported as cancelled.
    void requestCancel() { cancelRequested_.store(true); }
    bool cancelRequested() const { return cancelRequested_.load(); }

    std::size_t workers() const { return workers_; }

private:
    Config config_;
    const BackendRegistry& registry_;
    std::size_t workers_{1};
    ProgressCallback progress_;
    std::atomic<bool> cancelRequested_{false};
};

}  // namespace acti
