#include <gtest/gtest.h>
#include <job_system/job_system.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

enum class TestJobType {
    BASIS,
    MATRIX,
    RANK
};

namespace {

// Occupy the single worker of `system` until `release` is set.
void block_worker(job_system::JobSystem<TestJobType>& system,
                  std::atomic<bool>& started, std::atomic<bool>& release) {
    system.submit_function([&started, &release]() {
        started.store(true);
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }, TestJobType::BASIS, 1000);
    while (!started.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

} // namespace

class JobSystemTest : public ::testing::Test {
protected:
    void SetUp() override {
        job_system = std::make_unique<job_system::JobSystem<TestJobType>>(4);
    }

    void TearDown() override {
        job_system->shutdown();
        job_system.reset();
    }

    std::unique_ptr<job_system::JobSystem<TestJobType>> job_system;
};

TEST_F(JobSystemTest, RunsSubmittedJobs) {
    std::atomic<int> counter{0};
    const int num_jobs = 200;

    job_system->start();
    for (int i = 0; i < num_jobs; ++i) {
        job_system->submit_function([&counter]() { counter.fetch_add(1); }, TestJobType::BASIS);
    }
    job_system->wait_for_completion();

    EXPECT_EQ(counter.load(), num_jobs);
    EXPECT_FALSE(job_system->has_error());
}

TEST_F(JobSystemTest, SubmitRequiresRunningSystem) {
    EXPECT_THROW(job_system->submit_function([]() {}, TestJobType::BASIS), std::runtime_error);
}

TEST_F(JobSystemTest, JobsSubmitFollowUpWork) {
    std::atomic<int> leaves{0};
    job_system->start();

    // Binary fan-out, depth 6
    std::function<void(int)> spawn = [&](int depth) {
        if (depth == 0) {
            leaves.fetch_add(1);
            return;
        }
        for (int i = 0; i < 2; ++i) {
            job_system->submit_function([&spawn, depth]() { spawn(depth - 1); }, TestJobType::MATRIX);
        }
    };
    job_system->submit_function([&spawn]() { spawn(6); }, TestJobType::MATRIX);
    job_system->wait_for_completion();

    EXPECT_EQ(leaves.load(), 64);
}

TEST(JobSystemPriorityTest, HigherPriorityRunsFirst) {
    job_system::JobSystem<TestJobType> system(1);
    system.start();

    std::atomic<bool> started{false};
    std::atomic<bool> release{false};
    block_worker(system, started, release);

    std::vector<long> order;
    std::mutex order_mutex;
    for (long priority : {1L, 5L, 3L, 5L, 0L}) {
        system.submit_function([&order, &order_mutex, priority]() {
            std::lock_guard<std::mutex> lock(order_mutex);
            order.push_back(priority);
        }, TestJobType::RANK, priority);
    }
    release.store(true);
    system.wait_for_completion();
    system.shutdown();

    EXPECT_EQ(order, (std::vector<long>{5, 5, 3, 1, 0}));
}

TEST(JobSystemPriorityTest, ScheduleModeBreaksTies) {
    for (auto mode : {job_system::ScheduleMode::FIFO, job_system::ScheduleMode::LIFO}) {
        job_system::JobSystem<TestJobType> system(1);
        system.start();

        std::atomic<bool> started{false};
        std::atomic<bool> release{false};
        block_worker(system, started, release);

        std::vector<int> order;
        std::mutex order_mutex;
        for (int i = 0; i < 4; ++i) {
            system.submit_to_worker(0, job_system::make_job([&order, &order_mutex, i]() {
                std::lock_guard<std::mutex> lock(order_mutex);
                order.push_back(i);
            }, TestJobType::RANK), mode);
        }
        release.store(true);
        system.wait_for_completion();
        system.shutdown();

        if (mode == job_system::ScheduleMode::FIFO) {
            EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3}));
        } else {
            EXPECT_EQ(order, (std::vector<int>{3, 2, 1, 0}));
        }
    }
}

TEST_F(JobSystemTest, ThrowingJobStopsSystemAndRecordsMessage) {
    job_system->start();
    job_system->submit_function([]() { throw std::runtime_error("matrix exploded"); }, TestJobType::MATRIX);
    job_system->wait_for_completion();

    EXPECT_TRUE(job_system->has_error());
    EXPECT_EQ(job_system->get_error_type(), job_system::ErrorType::Exception);
    EXPECT_EQ(job_system->get_error_message(), "matrix exploded");

    // Dropped, not queued forever
    job_system->submit_function([]() {}, TestJobType::MATRIX);
    job_system->wait_for_completion();
    EXPECT_GE(job_system->get_statistics().total_jobs_discarded, 1u);
}

TEST_F(JobSystemTest, AbortIsDistinguishedFromFailure) {
    job_system->start();
    job_system->submit_function([]() { throw job_system::JobAborted(); }, TestJobType::RANK);
    job_system->wait_for_completion();

    EXPECT_EQ(job_system->get_error_type(), job_system::ErrorType::Aborted);
    EXPECT_STREQ(job_system->get_error_description(), "Aborted");
}

TEST_F(JobSystemTest, RestartClearsErrorState) {
    job_system->start();
    job_system->submit_function([]() { throw std::runtime_error("first session"); }, TestJobType::RANK);
    job_system->wait_for_completion();
    job_system->shutdown();
    ASSERT_TRUE(job_system->has_error());

    std::atomic<int> counter{0};
    job_system->start();
    EXPECT_FALSE(job_system->has_error());
    job_system->submit_function([&counter]() { counter.fetch_add(1); }, TestJobType::RANK);
    job_system->wait_for_completion();
    EXPECT_EQ(counter.load(), 1);
}

TEST_F(JobSystemTest, WaitWithAbortReturnsEarly) {
    std::atomic<bool> release{false};
    job_system->start();
    job_system->submit_function([&release]() {
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }, TestJobType::RANK);

    int polls = 0;
    bool aborted = job_system->wait_for_completion_with_abort([&polls]() { return ++polls > 3; });
    EXPECT_TRUE(aborted);

    release.store(true);
    EXPECT_FALSE(job_system->wait_for_completion_with_abort([]() { return false; }));
}

TEST_F(JobSystemTest, StatisticsCountJobsPerType) {
    job_system->start();
    for (int i = 0; i < 7; ++i) job_system->submit_function([]() {}, TestJobType::BASIS);
    for (int i = 0; i < 3; ++i) job_system->submit_function([]() {}, TestJobType::RANK);
    job_system->wait_for_completion();

    auto stats = job_system->get_statistics();
    EXPECT_EQ(stats.total_jobs_executed, 10u);
    EXPECT_EQ(stats.executed_by_type[TestJobType::BASIS], 7u);
    EXPECT_EQ(stats.executed_by_type[TestJobType::RANK], 3u);
    EXPECT_EQ(stats.executed_by_type.count(TestJobType::MATRIX), 0u);
}

TEST_F(JobSystemTest, IdleWorkersStealQueuedWork) {
    std::atomic<int> counter{0};
    job_system->start();

    for (int i = 0; i < 64; ++i) {
        job_system->submit_to_worker(0, job_system::make_job([&counter]() {
            std::this_thread::sleep_for(std::chrono::microseconds(200));
            counter.fetch_add(1);
        }, TestJobType::MATRIX));
    }
    job_system->wait_for_completion();

    EXPECT_EQ(counter.load(), 64);
    EXPECT_GT(job_system->get_statistics().total_jobs_stolen, 0u);
}
