#ifndef JOB_SYSTEM_JOB_SYSTEM_HPP
#define JOB_SYSTEM_JOB_SYSTEM_HPP

#include <job_system/job.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <new>
#include <random>
#include <stdexcept>
#include <thread>
#include <vector>

namespace job_system {

// Error types that can occur during job execution
enum class ErrorType {
    None = 0,
    OutOfMemory,   // std::bad_alloc caught
    Exception,     // std::exception caught
    Unhandled      // Non-std::exception type caught
};

/**
 * Fixed-size worker pool with per-worker deques and work stealing.
 * The first exception thrown by a job stops all workers; it is kept and can be
 * rethrown on the submitting thread after wait_for_completion().
 */
template<typename JobType>
class JobSystem {
private:
    struct WorkerData {
        std::deque<JobPtr<JobType>> tasks;  // Supports both LIFO and FIFO
        std::mutex mutex;
        std::condition_variable cv;
        std::thread thread;
        std::atomic<bool> stop{false};
        std::atomic<size_t> jobs_executed{0};
        std::atomic<size_t> jobs_executing{0};
        std::atomic<size_t> jobs_stolen{0};
    };

    std::vector<std::unique_ptr<WorkerData>> workers_;
    std::atomic<size_t> round_robin_{0};
    std::atomic<bool> is_running_{false};

    std::atomic<size_t> total_submitted_{0};
    std::atomic<size_t> total_completed_{0};
    std::mutex completion_mutex_;
    std::condition_variable completion_cv_;

    std::atomic<ErrorType> error_type_{ErrorType::None};
    std::mutex error_mutex_;
    std::exception_ptr first_error_;

    // Try to steal half the tasks from a victim worker
    std::vector<JobPtr<JobType>> try_steal_from(WorkerData* victim) {
        std::vector<JobPtr<JobType>> stolen;
        std::unique_lock<std::mutex> lock(victim->mutex, std::try_to_lock);

        if (!lock.owns_lock() || victim->tasks.empty()) {
            return stolen;
        }

        size_t steal_count = std::max(size_t(1), victim->tasks.size() / 2);
        stolen.reserve(steal_count);

        for (size_t i = 0; i < steal_count && !victim->tasks.empty(); ++i) {
            stolen.push_back(std::move(victim->tasks.front()));
            victim->tasks.pop_front();
        }

        return stolen;
    }

    void record_error(ErrorType type, std::exception_ptr error) {
        {
            std::lock_guard<std::mutex> lock(error_mutex_);
            if (!first_error_) {
                first_error_ = error;
                error_type_.store(type, std::memory_order_release);
            }
        }
        for (auto& w : workers_) {
            w->stop.store(true);
        }
    }

    void worker_loop(WorkerData* data) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<size_t> dist(0, workers_.size() - 1);

        while (true) {
            JobPtr<JobType> job;

            {
                std::unique_lock<std::mutex> lock(data->mutex);

                if (data->tasks.empty() && !data->stop.load()) {
                    lock.unlock();

                    for (size_t attempt = 0; attempt < workers_.size(); ++attempt) {
                        auto* victim = workers_[dist(gen)].get();
                        if (victim == data) continue;

                        auto stolen = try_steal_from(victim);
                        if (!stolen.empty()) {
                            std::lock_guard<std::mutex> local_lock(data->mutex);
                            for (auto& stolen_job : stolen) {
                                data->tasks.push_back(std::move(stolen_job));
                            }
                            data->jobs_stolen.fetch_add(stolen.size());
                            break;
                        }
                    }

                    lock.lock();
                }

                data->cv.wait_for(lock, std::chrono::milliseconds(1), [data] {
                    return data->stop.load() || !data->tasks.empty();
                });

                if (data->stop.load()) {
                    // Drop queued work after an error or shutdown, but keep the counters consistent
                    size_t dropped = data->tasks.size();
                    data->tasks.clear();
                    if (dropped > 0) {
                        total_completed_.fetch_add(dropped);
                        completion_cv_.notify_all();
                    }
                    break;
                }

                if (!data->tasks.empty()) {
                    job = std::move(data->tasks.back());
                    data->tasks.pop_back();
                }
            }

            if (job) {
                data->jobs_executing.fetch_add(1);

                // Worker threads must not throw; the exception is handed back to the submitter
                try {
                    job->execute();
                } catch (const std::bad_alloc&) {
                    record_error(ErrorType::OutOfMemory, std::current_exception());
                } catch (const std::exception&) {
                    record_error(ErrorType::Exception, std::current_exception());
                } catch (...) {
                    record_error(ErrorType::Unhandled, std::current_exception());
                }

                data->jobs_executing.fetch_sub(1);
                data->jobs_executed.fetch_add(1);

                total_completed_.fetch_add(1);
                completion_cv_.notify_all();
            }
        }
    }

public:
    explicit JobSystem(size_t num_threads = 0) {
        size_t count = num_threads == 0 ? std::thread::hardware_concurrency() : num_threads;
        if (count == 0) count = 1;

        workers_.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            workers_.emplace_back(std::make_unique<WorkerData>());
        }
    }

    JobSystem(const JobSystem&) = delete;
    JobSystem& operator=(const JobSystem&) = delete;

    ~JobSystem() {
        shutdown();
    }

    void start() {
        if (is_running_.load()) return;

        total_submitted_.store(0);
        total_completed_.store(0);
        error_type_.store(ErrorType::None, std::memory_order_relaxed);
        {
            std::lock_guard<std::mutex> lock(error_mutex_);
            first_error_ = nullptr;
        }

        for (auto& worker : workers_) {
            worker->stop.store(false);
            auto* data = worker.get();
            worker->thread = std::thread([this, data] {
                worker_loop(data);
            });
        }

        is_running_.store(true);
    }

    void shutdown() {
        if (!is_running_.load()) return;

        for (auto& worker : workers_) {
            {
                std::lock_guard<std::mutex> lock(worker->mutex);
                worker->stop.store(true);
            }
            worker->cv.notify_all();
        }

        for (auto& worker : workers_) {
            if (worker->thread.joinable()) {
                worker->thread.join();
            }
        }

        is_running_.store(false);
    }

    void submit(JobPtr<JobType> job, ScheduleMode mode = ScheduleMode::LIFO) {
        if (!is_running_.load()) {
            throw std::runtime_error("JobSystem is not running");
        }

        total_submitted_.fetch_add(1);

        size_t worker_idx = round_robin_.fetch_add(1) % workers_.size();
        auto* worker = workers_[worker_idx].get();

        {
            std::lock_guard<std::mutex> lock(worker->mutex);
            if (mode == ScheduleMode::LIFO) {
                worker->tasks.push_back(std::move(job));
            } else {
                worker->tasks.push_front(std::move(job));
            }
        }
        worker->cv.notify_one();
    }

    template<typename F>
    void submit_function(F&& func, JobType job_type, ScheduleMode mode = ScheduleMode::LIFO) {
        submit(make_job(std::forward<F>(func), job_type), mode);
    }

    // Blocks until every submitted job has completed or been dropped after an error
    void wait_for_completion() {
        while (true) {
            std::unique_lock<std::mutex> lock(completion_mutex_);
            completion_cv_.wait_for(lock, std::chrono::milliseconds(10), [this] {
                return total_submitted_.load() == total_completed_.load();
            });

            if (total_submitted_.load() != total_completed_.load()) {
                if (!has_error()) {
                    continue;
                }
                // After an error, stopped workers drain their queues on exit
                bool all_stopped = std::all_of(workers_.begin(), workers_.end(),
                    [](const auto& w) { return w->stop.load() && w->jobs_executing.load() == 0; });
                if (!all_stopped) {
                    continue;
                }
                lock.unlock();
                shutdown();
                return;
            }

            bool any_executing = std::any_of(workers_.begin(), workers_.end(),
                [](const auto& w) { return w->jobs_executing.load() > 0; });
            if (!any_executing) {
                return;
            }
        }
    }

    size_t get_num_workers() const {
        return workers_.size();
    }

    size_t get_pending_count() const {
        size_t submitted = total_submitted_.load(std::memory_order_relaxed);
        size_t completed = total_completed_.load(std::memory_order_relaxed);
        return submitted > completed ? submitted - completed : 0;
    }

    bool is_running() const {
        return is_running_.load();
    }

    ErrorType get_error_type() const {
        return error_type_.load(std::memory_order_acquire);
    }

    bool has_error() const {
        return get_error_type() != ErrorType::None;
    }

    const char* get_error_description() const {
        switch (get_error_type()) {
            case ErrorType::None: return "No error";
            case ErrorType::OutOfMemory: return "Out of memory";
            case ErrorType::Exception: return "Exception thrown";
            case ErrorType::Unhandled: return "Unhandled exception type";
        }
        return "Unknown error";
    }

    // Rethrow the first job exception on the calling thread, if any
    void rethrow_if_error() {
        std::exception_ptr error;
        {
            std::lock_guard<std::mutex> lock(error_mutex_);
            error = first_error_;
        }
        if (error) {
            std::rethrow_exception(error);
        }
    }

    struct SystemStatistics {
        size_t total_jobs_executed;
        size_t total_jobs_stolen;
    };

    SystemStatistics get_statistics() const {
        size_t total_executed = 0;
        size_t total_stolen = 0;
        for (const auto& worker : workers_) {
            total_executed += worker->jobs_executed.load();
            total_stolen += worker->jobs_stolen.load();
        }
        return SystemStatistics{total_executed, total_stolen};
    }
};

} // namespace job_system

#endif // JOB_SYSTEM_JOB_SYSTEM_HPP
