#include <gtest/gtest.h>
#include <job_system/job_system.hpp>
#include <tally/parallel.hpp>
#include <atomic>
#include <mutex>
#include <numeric>
#include <stdexcept>
#include <vector>

class JobSystemTest : public ::testing::Test {
protected:
    void SetUp() override {
        jobs = std::make_unique<job_system::JobSystem<tally::AnalysisJobType>>(4);
    }

    void TearDown() override {
        jobs->shutdown();
        jobs.reset();
    }

    std::unique_ptr<job_system::JobSystem<tally::AnalysisJobType>> jobs;
};

// === JOB SYSTEM ===

TEST_F(JobSystemTest, BasicJobExecution) {
    std::atomic<int> counter{0};
    jobs->start();

    auto job = job_system::make_job([&counter]() {
        counter.fetch_add(1);
    }, tally::AnalysisJobType::EDGE_CONSTRUCTION);

    jobs->submit(std::move(job));
    jobs->wait_for_completion();

    EXPECT_EQ(counter.load(), 1);
}

TEST_F(JobSystemTest, MultipleJobsExecution) {
    std::atomic<int> counter{0};
    const int num_jobs = 500;
    jobs->start();

    for (int i = 0; i < num_jobs; ++i) {
        jobs->submit_function([&counter]() {
            counter.fetch_add(1);
        }, tally::AnalysisJobType::BASIN_COMPUTATION,
           i % 2 ? job_system::ScheduleMode::FIFO : job_system::ScheduleMode::LIFO);
    }
    jobs->wait_for_completion();

    EXPECT_EQ(counter.load(), num_jobs);
    EXPECT_EQ(jobs->get_pending_count(), 0u);
    EXPECT_EQ(jobs->get_statistics().total_jobs_executed, static_cast<size_t>(num_jobs));
    EXPECT_FALSE(jobs->has_error());
}

TEST_F(JobSystemTest, SubmitBeforeStartThrows) {
    EXPECT_FALSE(jobs->is_running());
    EXPECT_THROW(jobs->submit_function([]() {}, tally::AnalysisJobType::MACRO_VERIFICATION),
                 std::runtime_error);
}

TEST_F(JobSystemTest, RestartAfterShutdown) {
    std::atomic<int> counter{0};

    jobs->start();
    jobs->submit_function([&counter]() { counter.fetch_add(1); }, tally::AnalysisJobType::EDGE_CONSTRUCTION);
    jobs->wait_for_completion();
    jobs->shutdown();
    EXPECT_FALSE(jobs->is_running());

    jobs->start();
    jobs->submit_function([&counter]() { counter.fetch_add(1); }, tally::AnalysisJobType::EDGE_CONSTRUCTION);
    jobs->wait_for_completion();
    EXPECT_EQ(counter.load(), 2);
}

TEST_F(JobSystemTest, ExceptionIsCapturedAndRethrown) {
    jobs->start();

    for (int i = 0; i < 20; ++i) {
        jobs->submit_function([i]() {
            if (i == 7) {
                throw std::invalid_argument("job 7 failed");
            }
        }, tally::AnalysisJobType::MACRO_VERIFICATION);
    }
    jobs->wait_for_completion();

    EXPECT_TRUE(jobs->has_error());
    EXPECT_EQ(jobs->get_error_type(), job_system::ErrorType::Exception);
    EXPECT_STREQ(jobs->get_error_description(), "Exception thrown");
    EXPECT_THROW(jobs->rethrow_if_error(), std::invalid_argument);
}

TEST_F(JobSystemTest, NoErrorMeansNoRethrow) {
    jobs->start();
    jobs->submit_function([]() {}, tally::AnalysisJobType::EDGE_CONSTRUCTION);
    jobs->wait_for_completion();
    EXPECT_NO_THROW(jobs->rethrow_if_error());
    EXPECT_STREQ(jobs->get_error_description(), "No error");
}

// === PARALLEL FOR ===

class ParallelForTest : public ::testing::Test {};

TEST_F(ParallelForTest, EveryIndexRunsOnce) {
    for (std::size_t threads : {1u, 2u, 4u, 0u}) {
        std::vector<int> hits(1000, 0);
        tally::parallel_for(hits.size(), threads, tally::AnalysisJobType::EDGE_CONSTRUCTION,
            [&hits](std::size_t i) { hits[i]++; });

        for (std::size_t i = 0; i < hits.size(); ++i) {
            EXPECT_EQ(hits[i], 1) << "index " << i << " with " << threads << " threads";
        }
    }
}

TEST_F(ParallelForTest, SlotsMatchSerialResult) {
    std::vector<std::size_t> squares(257);
    tally::parallel_for(squares.size(), 4, tally::AnalysisJobType::BASIN_COMPUTATION,
        [&squares](std::size_t i) { squares[i] = i * i; });

    for (std::size_t i = 0; i < squares.size(); ++i) {
        EXPECT_EQ(squares[i], i * i);
    }
}

TEST_F(ParallelForTest, EmptyRangeDoesNothing) {
    bool called = false;
    tally::parallel_for(0, 4, tally::AnalysisJobType::EDGE_CONSTRUCTION,
        [&called](std::size_t) { called = true; });
    EXPECT_FALSE(called);
}

TEST_F(ParallelForTest, BodyExceptionPropagates) {
    auto body = [](std::size_t i) {
        if (i == 42) {
            throw std::out_of_range("index 42");
        }
    };
    EXPECT_THROW(tally::parallel_for(100, 4, tally::AnalysisJobType::MACRO_VERIFICATION, body),
                 std::out_of_range);
    EXPECT_THROW(tally::parallel_for(100, 1, tally::AnalysisJobType::MACRO_VERIFICATION, body),
                 std::out_of_range);
}

TEST_F(ParallelForTest, ResolveThreadCount) {
    EXPECT_EQ(tally::resolve_thread_count(3), 3u);
    EXPECT_GE(tally::resolve_thread_count(0), 1u);
}
