#ifndef TALLY_PARALLEL_HPP
#define TALLY_PARALLEL_HPP

#include <job_system/job_system.hpp>
#include <algorithm>
#include <cstddef>
#include <thread>

namespace tally {

enum class AnalysisJobType {
    EDGE_CONSTRUCTION,
    BASIN_COMPUTATION,
    MACRO_VERIFICATION
};

inline std::size_t resolve_thread_count(std::size_t requested) {
    if (requested != 0) {
        return requested;
    }
    std::size_t hw = std::thread::hardware_concurrency();
    return hw == 0 ? 1 : hw;
}

/**
 * Run body(i) for i in [0, count). Work is split into contiguous chunks, one
 * job per chunk. With a single thread (or a single item) the loop runs inline.
 * Each index must write only to its own output slot.
 * The first exception thrown by any body is rethrown here.
 */
template<typename Body>
void parallel_for(std::size_t count, std::size_t num_threads, AnalysisJobType type, Body&& body) {
    std::size_t threads = resolve_thread_count(num_threads);
    if (threads <= 1 || count <= 1) {
        for (std::size_t i = 0; i < count; ++i) {
            body(i);
        }
        return;
    }

    threads = std::min(threads, count);
    std::size_t chunk_count = std::min(count, threads * 4);
    std::size_t chunk_size = (count + chunk_count - 1) / chunk_count;

    job_system::JobSystem<AnalysisJobType> jobs(threads);
    jobs.start();

    for (std::size_t begin = 0; begin < count; begin += chunk_size) {
        std::size_t end = std::min(count, begin + chunk_size);
        jobs.submit_function([&body, begin, end]() {
            for (std::size_t i = begin; i < end; ++i) {
                body(i);
            }
        }, type, job_system::ScheduleMode::FIFO);
    }

    jobs.wait_for_completion();
    jobs.shutdown();
    jobs.rethrow_if_error();
}

} // namespace tally

#endif // TALLY_PARALLEL_HPP
