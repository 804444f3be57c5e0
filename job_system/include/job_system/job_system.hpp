#ifndef JOB_SYSTEM_JOB_SYSTEM_HPP
#define JOB_SYSTEM_JOB_SYSTEM_HPP

#include <job_system/job.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
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
    Aborted,       // JobAborted caught
    Exception,     // std::exception caught
    Unhandled      // Non-std::exception type caught
};

/**
 * Fixed pool of workers, each owning a queue ordered by job priority.
 *
 * Idle workers steal the lower-priority half of a random victim's queue.
 * Jobs may submit further jobs while running. A job that throws stops the
 * system: the error is recorded, queued jobs are discarded, and later
 * submissions are dropped until the next start().
 */
template<typename JobType>
class JobSystem {
private:
    struct WorkerData {
        std::deque<JobPtr<JobType>> tasks;  // descending priority
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

    // Completion tracking; discarded jobs count as completed
    std::atomic<size_t> total_submitted_{0};
    std::atomic<size_t> total_completed_{0};
    std::atomic<size_t> total_discarded_{0};
    std::mutex completion_mutex_;
    std::condition_variable completion_cv_;

    std::atomic<ErrorType> error_type_{ErrorType::None};
    mutable std::mutex error_mutex_;
    std::string error_message_;

    mutable std::mutex type_stats_mutex_;
    std::map<JobType, size_t> executed_by_type_;

    static void enqueue(WorkerData* worker, JobPtr<JobType> job, ScheduleMode mode) {
        const long priority = job->get_priority();
        auto& tasks = worker->tasks;
        auto pos = std::find_if(tasks.begin(), tasks.end(), [&](const JobPtr<JobType>& queued) {
            return mode == ScheduleMode::LIFO ? queued->get_priority() <= priority
                                              : queued->get_priority() < priority;
        });
        tasks.insert(pos, std::move(job));
    }

    // Take the lower-priority half of a victim's queue.
    std::vector<JobPtr<JobType>> try_steal_from(WorkerData* victim) {
        std::vector<JobPtr<JobType>> stolen;
        std::unique_lock<std::mutex> lock(victim->mutex, std::try_to_lock);

        if (!lock.owns_lock() || victim->tasks.empty()) {
            return stolen;
        }

        size_t steal_count = std::max(size_t(1), victim->tasks.size() / 2);
        stolen.reserve(steal_count);
        for (size_t i = 0; i < steal_count; ++i) {
            stolen.push_back(std::move(victim->tasks.back()));
            victim->tasks.pop_back();
        }
        return stolen;
    }

    void record_error(ErrorType type, const std::string& message) {
        {
            std::lock_guard<std::mutex> lock(error_mutex_);
            if (error_type_.load(std::memory_order_relaxed) == ErrorType::None) {
                error_message_ = message;
                error_type_.store(type, std::memory_order_release);
            }
        }
        for (auto& w : workers_) {
            w->stop.store(true);
            w->cv.notify_all();
        }
    }

    void discard_queue(WorkerData* data) {
        size_t discarded = 0;
        {
            std::lock_guard<std::mutex> lock(data->mutex);
            discarded = data->tasks.size();
            data->tasks.clear();
        }
        if (discarded > 0) {
            total_discarded_.fetch_add(discarded);
            total_completed_.fetch_add(discarded);
            completion_cv_.notify_all();
        }
    }

    void run_job(WorkerData* data, JobPtr<JobType> job) {
        data->jobs_executing.fetch_add(1);
        const JobType type = job->get_type();

        // Worker threads must not throw
        try {
            job->execute();
        } catch (const std::bad_alloc&) {
            record_error(ErrorType::OutOfMemory, "out of memory");
        } catch (const JobAborted& e) {
            record_error(ErrorType::Aborted, e.what());
        } catch (const std::exception& e) {
            record_error(ErrorType::Exception, e.what());
        } catch (...) {
            record_error(ErrorType::Unhandled, "non-standard exception");
        }
        job.reset();

        {
            std::lock_guard<std::mutex> lock(type_stats_mutex_);
            ++executed_by_type_[type];
        }
        data->jobs_executing.fetch_sub(1);
        data->jobs_executed.fetch_add(1);

        total_completed_.fetch_add(1);
        completion_cv_.notify_all();
    }

    void worker_loop(WorkerData* data) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<size_t> dist(0, workers_.size() - 1);

        while (true) {
            if (has_error()) {
                discard_queue(data);
                break;
            }

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
                                enqueue(data, std::move(stolen_job), ScheduleMode::FIFO);
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

                if (data->stop.load() && data->tasks.empty()) {
                    break;
                }

                if (!data->tasks.empty()) {
                    job = std::move(data->tasks.front());
                    data->tasks.pop_front();
                }
            }

            if (job) {
                run_job(data, std::move(job));
            }
        }
    }

    bool all_done() {
        if (total_submitted_.load() != total_completed_.load()) return false;
        for (const auto& worker : workers_) {
            std::lock_guard<std::mutex> worker_lock(worker->mutex);
            if (!worker->tasks.empty() || worker->jobs_executing.load() > 0) {
                return false;
            }
        }
        // A job that was executing above may have submitted more work
        std::atomic_thread_fence(std::memory_order_acquire);
        return total_submitted_.load() == total_completed_.load();
    }

    void push(WorkerData* worker, JobPtr<JobType> job, ScheduleMode mode) {
        if (has_error()) {
            total_discarded_.fetch_add(1);
            return;
        }
        total_submitted_.fetch_add(1);
        {
            std::lock_guard<std::mutex> lock(worker->mutex);
            enqueue(worker, std::move(job), mode);
        }
        worker->cv.notify_one();
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

    ~JobSystem() {
        shutdown();
    }

    JobSystem(const JobSystem&) = delete;
    JobSystem& operator=(const JobSystem&) = delete;

    void start() {
        if (is_running_.load()) return;

        total_submitted_.store(0);
        total_completed_.store(0);
        total_discarded_.store(0);
        {
            std::lock_guard<std::mutex> lock(error_mutex_);
            error_message_.clear();
            error_type_.store(ErrorType::None, std::memory_order_relaxed);
        }
        {
            std::lock_guard<std::mutex> lock(type_stats_mutex_);
            executed_by_type_.clear();
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

    // Runs every queued job, then joins the workers.
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

    void submit(JobPtr<JobType> job, ScheduleMode mode = ScheduleMode::FIFO) {
        if (!is_running_.load()) {
            throw std::runtime_error("JobSystem is not running");
        }
        size_t worker_idx = round_robin_.fetch_add(1) % workers_.size();
        push(workers_[worker_idx].get(), std::move(job), mode);
    }

    void submit_to_worker(size_t worker_id, JobPtr<JobType> job, ScheduleMode mode = ScheduleMode::FIFO) {
        if (!is_running_.load()) {
            throw std::runtime_error("JobSystem is not running");
        }
        if (worker_id >= workers_.size()) {
            throw std::out_of_range("Invalid worker ID");
        }
        push(workers_[worker_id].get(), std::move(job), mode);
    }

    template<typename F>
    void submit_function(F&& func, JobType job_type, long priority = 0, ScheduleMode mode = ScheduleMode::FIFO) {
        submit(make_job(std::forward<F>(func), job_type, priority), mode);
    }

    // Returns true if `abort_check` fired before all work completed.
    template<typename AbortCheck>
    bool wait_for_completion_with_abort(AbortCheck&& abort_check) {
#ifdef JOBSYSTEM_DEBUG
        int debug_count = 0;
#endif
        while (true) {
            if (abort_check()) {
                return true;
            }

            {
                std::unique_lock<std::mutex> lock(completion_mutex_);
                completion_cv_.wait_for(lock, std::chrono::milliseconds(20), [this] {
                    return total_submitted_.load() == total_completed_.load();
                });
            }

#ifdef JOBSYSTEM_DEBUG
            if (++debug_count % 100 == 0) {
                printf("[JOB_SYSTEM DEBUG] wait loop %d: submitted=%zu, completed=%zu\n",
                       debug_count, total_submitted_.load(), total_completed_.load());
                fflush(stdout);
            }
#endif
            if (all_done()) {
                return false;
            }
        }
    }

    void wait_for_completion() {
        wait_for_completion_with_abort([] { return false; });
    }

    size_t get_num_workers() const {
        return workers_.size();
    }

    size_t get_pending_count() const {
        size_t submitted = total_submitted_.load(std::memory_order_relaxed);
        size_t completed = total_completed_.load(std::memory_order_relaxed);
        return submitted > completed ? submitted - completed : 0;
    }

    size_t get_executing_count() const {
        size_t count = 0;
        for (const auto& worker : workers_) {
            count += worker->jobs_executing.load(std::memory_order_relaxed);
        }
        return count;
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

    // what() of the first failing job, empty if none
    std::string get_error_message() const {
        std::lock_guard<std::mutex> lock(error_mutex_);
        return error_message_;
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

    struct SystemStatistics {
        size_t total_jobs_executed;
        size_t total_jobs_stolen;
        size_t total_jobs_discarded;
        std::map<JobType, size_t> executed_by_type;
    };

    SystemStatistics get_statistics() const {
        SystemStatistics stats{0, 0, total_discarded_.load(), {}};
        for (const auto& worker : workers_) {
            stats.total_jobs_executed += worker->jobs_executed.load();
            stats.total_jobs_stolen += worker->jobs_stolen.load();
        }
        std::lock_guard<std::mutex> lock(type_stats_mutex_);
        stats.executed_by_type = executed_by_type_;
        return stats;
    }
};

} // namespace job_system

#endif // JOB_SYSTEM_JOB_SYSTEM_HPP
