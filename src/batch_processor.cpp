#include "batch_processor.hpp"

#include "parallel.hpp"

#include <algorithm>
#include <exception>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

namespace acti {

BatchProcessor::BatchProcessor(Config config)
    : BatchProcessor(std::move(config), defaultRegistry()) {}

BatchProcessor::BatchProcessor(Config config, const BackendRegistry& registry)
    : config_(std::move(config)),
      registry_(registry),
      workers_(config_.workers == 0 ? hardwareWorkers() : config_.workers) {
    // Fails early on a bad config or backend id.
    FilePipeline check(config_.pipeline, registry_);
}

void BatchProcessor::setProgressCallback(ProgressCallback callback) {
    progress_ = std::move(callback);
}

std::vector<FileReport> BatchProcessor::run(const std::vector<std::string>& paths) {
    std::vector<FileReport> reports(paths.size());
    if (paths.empty()) {
        return reports;
    }

    std::size_t threadCount = std::min(workers_, paths.size());
    std::vector<std::unique_ptr<FilePipeline>> pipelines;
    pipelines.reserve(threadCount);
    for (std::size_t w = 0; w < threadCount; ++w) {
        pipelines.push_back(std::make_unique<FilePipeline>(config_.pipeline, registry_));
    }

    std::atomic<std::size_t> next{0};
    std::size_t completed = 0;
    std::mutex progressMutex;
    std::vector<std::exception_ptr> errors(threadCount);

    auto worker = [&](std::size_t w) {
        try {
            for (;;) {
                std::size_t index = next.fetch_add(1);
                if (index >= paths.size()) {
                    break;
                }
                if (cancelRequested_.load()) {
                    reports[index].path = paths[index];
                    reports[index].cancelled = true;
                    continue;
                }
                reports[index] = pipelines[w]->run(paths[index]);

                std::lock_guard<std::mutex> lock(progressMutex);
                ++completed;
                if (progress_) {
                    BatchProgress progress;
                    progress.completed = completed;
                    progress.total = paths.size();
                    progress.report = &reports[index];
                    progress_(progress);
                }
            }
        } catch (...) {
            errors[w] = std::current_exception();
        }
    };

    if (threadCount == 1) {
        worker(0);
    } else {
        std::vector<std::thread> threads;
        threads.reserve(threadCount);
        for (std::size_t w = 0; w < threadCount; ++w) {
            threads.emplace_back(worker, w);
        }
        for (auto& t : threads) {
            t.join();
        }
    }

    for (const auto& e : errors) {
        if (e) {
            std::rethrow_exception(e);
        }
    }
    return reports;
}

}  // namespace acti
