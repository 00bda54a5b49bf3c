#ifndef JOB_SYSTEM_JOB_HPP
#define JOB_SYSTEM_JOB_HPP

#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace job_system {

enum class ScheduleMode {
    LIFO,  // Last In, First Out (cache-friendly for related tasks)
    FIFO   // First In, First Out (submission order, used for supersteps)
};

/**
 * Thrown by a job body that noticed a cancellation request.
 * The pool records it as ErrorType::Aborted instead of a failure.
 */
class AbortedException : public std::runtime_error {
public:
    AbortedException() : std::runtime_error("Operation aborted") {}
    explicit AbortedException(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Unit of work. Type and priority are fixed at construction so the pool
 * can inspect them without a virtual call.
 */
template<typename JobType>
class Job {
public:
    Job(JobType type, int priority) : type_(type), priority_(priority) {}
    virtual ~Job() = default;

    Job(const Job&) = delete;
    Job& operator=(const Job&) = delete;

    virtual void execute() = 0;

    JobType get_type() const { return type_; }
    int get_priority() const { return priority_; }

private:
    JobType type_;
    int priority_;
};

template<typename JobType, typename Func>
class FunctionJob final : public Job<JobType> {
    static_assert(std::is_invocable_v<Func>, "Job body must be callable without arguments");

public:
    template<typename F>
    FunctionJob(F&& func, JobType type, int priority)
        : Job<JobType>(type, priority), body_(std::forward<F>(func)) {}

    void execute() override { body_(); }

private:
    Func body_;
};

template<typename JobType>
using JobPtr = std::unique_ptr<Job<JobType>>;

template<typename JobType, typename Func>
JobPtr<JobType> make_job(Func&& func, JobType type, int priority = 0) {
    return std::make_unique<FunctionJob<JobType, std::decay_t<Func>>>(
        std::forward<Func>(func), type, priority);
}

} // namespace job_system

#endif // JOB_SYSTEM_JOB_HPP
