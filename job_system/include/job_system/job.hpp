#ifndef JOB_SYSTEM_JOB_HPP
#define JOB_SYSTEM_JOB_HPP

#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace job_system {

template<typename JobType>
class Job {
public:
    virtual ~Job() = default;

    virtual void execute() = 0;
    virtual JobType get_type() const = 0;

    // Higher runs first among queued jobs of the same worker.
    virtual long get_priority() const { return 0; }
};

template<typename JobType, typename Func>
class FunctionJob : public Job<JobType> {
private:
    Func function_;
    JobType type_;
    long priority_;

public:
    template<typename F>
    FunctionJob(F&& func, JobType type, long priority = 0)
        : function_(std::forward<F>(func)), type_(type), priority_(priority) {}

    void execute() override {
        static_assert(std::is_invocable_v<Func>, "Function must be callable");
        function_();
    }

    JobType get_type() const override { return type_; }
    long get_priority() const override { return priority_; }
};

template<typename JobType, typename Func>
auto make_job(Func&& func, JobType type, long priority = 0) {
    return std::make_unique<FunctionJob<JobType, std::decay_t<Func>>>(
        std::forward<Func>(func), type, priority);
}

template<typename JobType>
using JobPtr = std::unique_ptr<Job<JobType>>;

// Tie-break between queued jobs of equal priority.
enum class ScheduleMode {
    LIFO,  // newest first
    FIFO   // oldest first
};

// Thrown by a job to stop the whole system without reporting a failure.
class JobAborted : public std::runtime_error {
public:
    explicit JobAborted(const std::string& reason = "Operation aborted")
        : std::runtime_error(reason) {}
};

} // namespace job_system

#endif // JOB_SYSTEM_JOB_HPP
