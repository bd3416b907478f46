#pragma once

#include <cstddef>
#include <functional>

namespace acti {

std::size_t hardwareWorkers();

// Splits [0, count) into contiguous chunks and runs body(begin, end) on each
// chunk in its own thread. Runs inline when one worker is requested or the
// range is shorter than minChunk. The first exception thrown by a chunk is
// rethrown after all threads have joined.
void parallelFor(std::size_t count,
                 std::size_t workers,
                 const std::function<void(std::size_t, std::size_t)>& body,
                 std::size_t minChunk = 4096);

// Runs every task on its own thread and waits for all of them.
void runConcurrently(const std::function<void()>& a,
                     const std::function<void()>& b,
                     const std::function<void()>& c);

}  // namespace acti
