#ifndef JOB_SYSTEM_JOB_SYSTEM_HPP
#define JOB_SYSTEM_JOB_SYSTEM_HPP

#include <job_system/job.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <limits>
#include <memory>
#include <mutex>
#include <new>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace job_system {

// Error types that can occur during job execution
enum class ErrorType {
    None = 0,
    OutOfMemory,   // std::bad_alloc caught
    Aborted,       // AbortedException caught (cancellation requested)
    Exception,     // std::exception caught
    Unhandled      // Non-std::exception type caught
};

/**
 * Fixed-size work-stealing pool.
 *
 * Each worker owns a deque guarded by its own mutex. Idle workers steal half
 * of a random victim's queue. Unlike a fire-and-forget pool, a failing job does
 * not tear the pool down: the failure is recorded and the remaining jobs keep
 * running, so one pool can serve many consecutive supersteps.
 *
 * Completion is tracked with a single pending counter (incremented on submit,
 * decremented after execution or cancellation).
 */
template<typename JobType>
class JobSystem {
private:
    struct WorkerData {
        std::deque<JobPtr<JobType>> tasks;  // back = next to run
        std::mutex mutex;
        std::condition_variable cv;
        std::thread thread;
        std::atomic<bool> stop{false};
        std::atomic<std::size_t> jobs_executed{0};
        std::atomic<std::size_t> jobs_stolen{0};
        std::atomic<std::size_t> jobs_failed{0};
    };

    static constexpr std::size_t NOT_A_WORKER = std::numeric_limits<std::size_t>::max();
    static inline thread_local std::size_t current_worker_ = NOT_A_WORKER;

    std::vector<std::unique_ptr<WorkerData>> workers_;
    std::atomic<std::size_t> round_robin_{0};
    std::atomic<bool> is_running_{false};

    std::atomic<std::size_t> pending_{0};
    std::atomic<std::size_t> cancelled_{0};
    std::mutex completion_mutex_;
    std::condition_variable completion_cv_;

    std::atomic<ErrorType> error_type_{ErrorType::None};
    mutable std::mutex error_mutex_;
    std::string first_error_message_;

    void record_error(ErrorType type, const char* message) {
        ErrorType expected = ErrorType::None;
        error_type_.compare_exchange_strong(expected, type, std::memory_order_acq_rel);
        std::lock_guard<std::mutex> lock(error_mutex_);
        if (first_error_message_.empty()) {
            first_error_message_ = message;
        }
    }

    void finish_jobs(std::size_t count) {
        if (count == 0) return;
        std::size_t before = pending_.fetch_sub(count, std::memory_order_acq_rel);
        if (before == count) {
            std::lock_guard<std::mutex> lock(completion_mutex_);
            completion_cv_.notify_all();
        }
    }

    void enqueue(WorkerData* worker, JobPtr<JobType> job, ScheduleMode mode) {
        if (!is_running_.load()) {
            throw std::runtime_error("JobSystem is not running");
        }
        pending_.fetch_add(1, std::memory_order_acq_rel);
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

    // Move the oldest half of a victim's queue to the caller
    std::vector<JobPtr<JobType>> try_steal_from(WorkerData* victim) {
        std::vector<JobPtr<JobType>> stolen;
        std::unique_lock<std::mutex> lock(victim->mutex, std::try_to_lock);
        if (!lock.owns_lock() || victim->tasks.empty()) {
            return stolen;
        }

        std::size_t steal_count = std::max<std::size_t>(1, victim->tasks.size() / 2);
        stolen.reserve(steal_count);
        for (std::size_t i = 0; i < steal_count && !victim->tasks.empty(); ++i) {
            stolen.push_back(std::move(victim->tasks.front()));
            victim->tasks.pop_front();
        }
        return stolen;
    }

    bool steal_into(WorkerData* data, std::mt19937& gen) {
        if (workers_.size() < 2) return false;
        std::uniform_int_distribution<std::size_t> dist(0, workers_.size() - 1);
        for (std::size_t attempt = 0; attempt < workers_.size(); ++attempt) {
            auto* victim = workers_[dist(gen)].get();
            if (victim == data) continue;

            auto stolen = try_steal_from(victim);
            if (stolen.empty()) continue;

            std::lock_guard<std::mutex> lock(data->mutex);
            for (auto& stolen_job : stolen) {
                data->tasks.push_back(std::move(stolen_job));
            }
            data->jobs_stolen.fetch_add(stolen.size());
            return true;
        }
        return false;
    }

    void run_job(WorkerData* data, Job<JobType>& job) {
        try {
            job.execute();
        } catch (const AbortedException& e) {
            record_error(ErrorType::Aborted, e.what());
        } catch (const std::bad_alloc&) {
            // Recorded only; workers keep draining their queues
            record_error(ErrorType::OutOfMemory, "std::bad_alloc");
            data->jobs_failed.fetch_add(1);
        } catch (const std::exception& e) {
            record_error(ErrorType::Exception, e.what());
            data->jobs_failed.fetch_add(1);
        } catch (...) {
            record_error(ErrorType::Unhandled, "non-standard exception");
            data->jobs_failed.fetch_add(1);
        }
    }

    void worker_loop(std::size_t index) {
        WorkerData* data = workers_[index].get();
        current_worker_ = index;
        std::mt19937 gen(std::random_device{}());

        while (true) {
            JobPtr<JobType> job;
            {
                std::unique_lock<std::mutex> lock(data->mutex);
                if (data->tasks.empty() && !data->stop.load()) {
                    lock.unlock();
                    steal_into(data, gen);
                    lock.lock();
                }

                data->cv.wait_for(lock, std::chrono::milliseconds(1), [data] {
                    return data->stop.load() || !data->tasks.empty();
                });

                if (data->stop.load() && data->tasks.empty()) {
                    break;
                }
                if (!data->tasks.empty()) {
                    job = std::move(data->tasks.back());
                    data->tasks.pop_back();
                }
            }

            if (job) {
                run_job(data, *job);
                job.reset();
                data->jobs_executed.fetch_add(1);
                finish_jobs(1);
            }
        }
        current_worker_ = NOT_A_WORKER;
    }

public:
    explicit JobSystem(std::size_t num_threads = 0) {
        if (num_threads == 0) {
            num_threads = std::max(1u, std::thread::hardware_concurrency());
        }
        workers_.reserve(num_threads);
        for (std::size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back(std::make_unique<WorkerData>());
        }
    }

    ~JobSystem() {
        shutdown();
    }

    JobSystem(const JobSystem&) = delete;
    JobSystem& operator=(const JobSystem&) = delete;

    void start() {
        if (is_running_.load()) return;

        pending_.store(0);
        cancelled_.store(0);
        error_type_.store(ErrorType::None, std::memory_order_relaxed);
        {
            std::lock_guard<std::mutex> lock(error_mutex_);
            first_error_message_.clear();
        }

        for (std::size_t i = 0; i < workers_.size(); ++i) {
            workers_[i]->stop.store(false);
            workers_[i]->thread = std::thread([this, i] { worker_loop(i); });
        }
        is_running_.store(true);
    }

    /**
     * Stops the workers once their queues drain. Call cancel_pending() first
     * to drop queued work instead of running it.
     */
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
        std::size_t worker_idx = round_robin_.fetch_add(1) % workers_.size();
        enqueue(workers_[worker_idx].get(), std::move(job), mode);
    }

    void submit_to_worker(std::size_t worker_id, JobPtr<JobType> job, ScheduleMode mode = ScheduleMode::LIFO) {
        if (worker_id >= workers_.size()) {
            throw std::out_of_range("Invalid worker ID");
        }
        enqueue(workers_[worker_id].get(), std::move(job), mode);
    }

    template<typename F>
    void submit_function(F&& func, JobType job_type, int priority = 0, ScheduleMode mode = ScheduleMode::LIFO) {
        submit(make_job(std::forward<F>(func), job_type, priority), mode);
    }

    template<typename F>
    void submit_function_to_worker(std::size_t worker_id, F&& func, JobType job_type,
                                   ScheduleMode mode = ScheduleMode::LIFO) {
        submit_to_worker(worker_id, make_job(std::forward<F>(func), job_type), mode);
    }

    /**
     * Drops every queued job that has not started yet.
     * Jobs already executing are unaffected.
     * @return number of jobs dropped
     */
    std::size_t cancel_pending() {
        std::size_t dropped = 0;
        for (auto& worker : workers_) {
            std::deque<JobPtr<JobType>> discarded;
            {
                std::lock_guard<std::mutex> lock(worker->mutex);
                discarded.swap(worker->tasks);
            }
            dropped += discarded.size();
        }
        cancelled_.fetch_add(dropped);
        finish_jobs(dropped);
        return dropped;
    }

    /**
     * Wait until all submitted jobs finished or abort_check() returns true.
     * abort_check is polled on the calling thread between short waits.
     * @return true if aborted, false if all work completed
     */
    template<typename AbortCheck>
    bool wait_for_completion_with_abort(AbortCheck&& abort_check,
                                        std::chrono::milliseconds poll = std::chrono::milliseconds(10)) {
        while (true) {
            if (abort_check()) {
                return true;
            }
            std::unique_lock<std::mutex> lock(completion_mutex_);
            if (completion_cv_.wait_for(lock, poll, [this] { return pending_.load() == 0; })) {
                return false;
            }
        }
    }

    /**
     * @return true if all work completed before the deadline
     */
    template<typename Clock, typename Duration>
    bool wait_for_completion_until(const std::chrono::time_point<Clock, Duration>& deadline) {
        return !wait_for_completion_with_abort([&deadline] { return Clock::now() >= deadline; });
    }

    void wait_for_completion() {
        std::unique_lock<std::mutex> lock(completion_mutex_);
        completion_cv_.wait(lock, [this] { return pending_.load() == 0; });
    }

    std::size_t get_num_workers() const {
        return workers_.size();
    }

    // Index of the worker running the calling thread, if it is one of ours
    static std::optional<std::size_t> current_worker_index() {
        if (current_worker_ == NOT_A_WORKER) return std::nullopt;
        return current_worker_;
    }

    std::size_t get_pending_count() const {
        return pending_.load(std::memory_order_relaxed);
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
            case ErrorType::Aborted: return "Aborted";
            case ErrorType::Exception: return "Exception thrown";
            case ErrorType::Unhandled: return "Unhandled exception type";
        }
        return "Unknown error";
    }

    // Message of the first job failure since start()
    std::string get_first_error_message() const {
        std::lock_guard<std::mutex> lock(error_mutex_);
        return first_error_message_;
    }

    struct SystemStatistics {
        std::size_t total_jobs_executed;
        std::size_t total_jobs_stolen;
        std::size_t total_jobs_failed;
        std::size_t total_jobs_cancelled;
    };

    SystemStatistics get_statistics() const {
        SystemStatistics stats{0, 0, 0, cancelled_.load()};
        for (const auto& worker : workers_) {
            stats.total_jobs_executed += worker->jobs_executed.load();
            stats.total_jobs_stolen += worker->jobs_stolen.load();
            stats.total_jobs_failed += worker->jobs_failed.load();
        }
        return stats;
    }
};

} // namespace job_system

#endif // JOB_SYSTEM_JOB_SYSTEM_HPP
