#include "parallel.hpp"

#include <algorithm>
#include <exception>
#include <thread>
#include <vector>

namespace acti {

std::size_t hardwareWorkers() {
    unsigned int n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : static_cast<std::size_t>(n);
}

void parallelFor(std::size_t count,
                 std::size_t workers,
                 const std::function<void(std::size_t, std::size_t)>& body,
                 std::size_t minChunk) {
    if (count == 0) {
        return;
    }
    std::size_t chunks = std::min(workers, (count + minChunk - 1) / std::max<std::size_t>(minChunk, 1));
    if (chunks <= 1) {
        body(0, count);
        return;
    }

    std::size_t chunkSize = (count + chunks - 1) / chunks;
    std::vector<std::exception_ptr> errors(chunks);
    std::vector<std::thread> threads;
    threads.reserve(chunks);
    for (std::size_t c = 0; c < chunks; ++c) {
        std::size_t begin = c * chunkSize;
        std::size_t end = std::min(count, begin + chunkSize);
        if (begin >= end) {
            break;
        }
        threads.emplace_back([&body, &errors, c, begin, end]() {
            try {
                body(begin, end);
            } catch (...) {
                errors[c] = std::current_exception();
            }
        });
    }
    for (auto& t : threads) {
        if (t.joinable()) {
            t.join();
        }
    }
    for (const auto& e : errors) {
        if (e) {
            std::rethrow_exception(e);
        }
    }
}

void runConcurrently(const std::function<void()>& a,
                     const std::function<void()>& b,
                     const std::function<void()>& c) {
    const std::function<void()>* tasks[3] = {&a, &b, &c};
    std::exception_ptr errors[3];
    std::vector<std::thread> threads;
    threads.reserve(3);
    for (int i = 0; i < 3; ++i) {
        threads.emplace_back([&tasks, &errors, i]() {
            try {
                (*tasks[i])();
            } catch (...) {
                errors[i] = std::current_exception();
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    for (const auto& e : errors) {
        if (e) {
            std::rethrow_exception(e);
        }
    }
}

}  // namespace acti
