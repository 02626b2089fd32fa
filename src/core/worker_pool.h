#pragma once

#include <cstddef>
#include <functional>

namespace tessera::core {

// 0 means one worker per hardware thread. Never more workers than jobs.
unsigned int resolve_worker_count(unsigned int thread_limit, size_t job_count);

// Runs job(i) for every i in [begin, end) on a fixed set of workers and
// returns once all of them have finished. Jobs must not touch each other's data.
void parallel_for(size_t begin, size_t end, unsigned int thread_limit, const std::function<void(size_t)>& job);

} // namespace tessera::core
