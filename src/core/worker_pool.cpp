#include "worker_pool.h"

#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

namespace tessera::core {

unsigned int resolve_worker_count(unsigned int thread_limit, size_t job_count) {
    unsigned int worker_count = thread_limit > 0 ? thread_limit : std::thread::hardware_concurrency();
    if (worker_count == 0) {
        worker_count = 1;
    }
    return std::min<unsigned int>(worker_count, static_cast<unsigned int>(std::max<size_t>(1, job_count)));
}

void parallel_for(size_t begin, size_t end, unsigned int thread_limit, const std::function<void(size_t)>& job) {
    if (end <= begin) {
        return;
    }
    const unsigned int worker_count = resolve_worker_count(thread_limit, end - begin);
    if (worker_count <= 1) {
        for (size_t i = begin; i < end; ++i) {
            job(i);
        }
        return;
    }

    std::atomic<size_t> next_index{begin};
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (unsigned int i = 0; i < worker_count; ++i) {
        workers.emplace_back([&]() {
            while (true) {
                const size_t idx = next_index.fetch_add(1, std::memory_order_relaxed);
                if (idx >= end) {
                    break;
                }
                job(idx);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
}

} // namespace tessera::core
