#include <gtest/gtest.h>

#include "metrics_accumulator.hpp"
#include "operations/simulated_query.hpp"
#include "operations/simulated_vote.hpp"
#include "test_support.hpp"
#include "workers.hpp"

#include <atomic>
#include <cstdio>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::trunc);
    out << content;
}

MetricsRecord finish(MetricsAccumulator& m) {
    return m.finalize(PercentileMethod::IndexApprox, 60s);
}

}  // namespace

TEST(QueryWorker, RecordsOneLatencyPerOperationUntilDeadline) {
    FakeClock clock;
    MetricsAccumulator m(ExperimentConfig{1, 1, 1}, std::chrono::system_clock::now());

    // 10 ms operation + 100 ms pause: iterations start at 0, 110, ..., 990 ms
    QueryWorker worker(clock, std::make_unique<SimulatedQuery>(clock, 10.0, 10.0), 100ms, 1);
    auto stopped = worker.run(m, clock.now(), 1s);

    MetricsRecord r = finish(m);
    ASSERT_EQ(r.latencies_ms.size(), 10u);
    for (double l : r.latencies_ms) EXPECT_DOUBLE_EQ(l, 10.0);
    EXPECT_TRUE(r.errors.empty());
    EXPECT_EQ(stopped - IClock::time_point{}, 1100ms);
}

TEST(QueryWorker, OperationThatThrowsIsRecordedAndLoopContinues) {
    FakeClock clock;
    MetricsAccumulator m(ExperimentConfig{1, 1, 1}, std::chrono::system_clock::now());

    QueryWorker worker(clock, std::make_unique<ThrowingQuery>(), 100ms, 1);
    worker.run(m, clock.now(), 1s);

    MetricsRecord r = finish(m);
    EXPECT_TRUE(r.latencies_ms.empty());
    ASSERT_EQ(r.errors.size(), 10u);
    EXPECT_EQ(r.errors.front(), "Query error: connection refused");
}

TEST(QueryWorker, RejectedQueryKeepsLatencyAndLogsError) {
    FakeClock clock;
    MetricsAccumulator m(ExperimentConfig{1, 1, 1}, std::chrono::system_clock::now());

    QueryWorker worker(clock, std::make_unique<RejectingQuery>(), 500ms, 1);
    worker.run(m, clock.now(), 1s);

    MetricsRecord r = finish(m);
    EXPECT_EQ(r.latencies_ms.size(), 2u);
    ASSERT_EQ(r.errors.size(), 2u);
    EXPECT_EQ(r.errors.front(), "Query error: GET /metrics returned HTTP 503");
}

TEST(QueryWorker, WaitsForSharedStart) {
    FakeClock clock;
    MetricsAccumulator m(ExperimentConfig{1, 1, 1}, std::chrono::system_clock::now());

    const auto start = clock.now() + 5s;
    QueryWorker worker(clock, std::make_unique<SimulatedQuery>(clock, 10.0, 10.0), 90ms, 1);
    auto stopped = worker.run(m, start, 1s);

    EXPECT_EQ(finish(m).latencies_ms.size(), 10u);
    EXPECT_EQ(stopped - start, 1s);
}

TEST(QueryWorker, HundredConcurrentWorkersLoseNoUpdates) {
    FakeClock clock;
    MetricsAccumulator m(ExperimentConfig{100, 1, 1}, std::chrono::system_clock::now());
    const auto start = clock.now();

    std::vector<std::unique_ptr<QueryWorker>> workers;
    for (int i = 0; i < 100; ++i) {
        workers.push_back(std::make_unique<QueryWorker>(
            clock, std::make_unique<SimulatedQuery>(clock, 10.0, 10.0), 100ms, i));
    }
    std::vector<std::thread> threads;
    for (auto& w : workers) {
        threads.emplace_back([&m, &w, start] { w->run(m, start, 10s); });
    }
    for (auto& t : threads) t.join();

    // 110 ms per iteration: 91 iterations start before the 10 s deadline
    EXPECT_EQ(finish(m).latencies_ms.size(), 100u * 91u);
}

TEST(QueryWorker, HundredConcurrentWorkersOnRealClock) {
    SteadyClock clock;
    std::atomic<long long> executions{0};
    MetricsAccumulator m(ExperimentConfig{100, 1, 1}, std::chrono::system_clock::now());
    const auto start = clock.now();

    std::vector<std::unique_ptr<QueryWorker>> workers;
    for (int i = 0; i < 100; ++i) {
        workers.push_back(std::make_unique<QueryWorker>(
            clock, std::make_unique<CountingQuery>(executions), 1ms, i));
    }
    std::vector<std::thread> threads;
    for (auto& w : workers) {
        threads.emplace_back([&m, &w, start] { w->run(m, start, 500ms); });
    }
    for (auto& t : threads) t.join();

    MetricsRecord r = finish(m);
    EXPECT_GT(executions.load(), 100);
    EXPECT_EQ(static_cast<long long>(r.latencies_ms.size()), executions.load());
}

TEST(VoteWorker, BallotsRoundRobinOverCandidates) {
    EXPECT_EQ(VoteWorker::make_ballot(0, 5).candidate_id, "CAND_1");
    EXPECT_EQ(VoteWorker::make_ballot(4, 5).candidate_id, "CAND_5");
    EXPECT_EQ(VoteWorker::make_ballot(5, 5).candidate_id, "CAND_1");
    EXPECT_EQ(VoteWorker::make_ballot(7, 5).vote_id.rfind("VOTE_7_", 0), 0u);
}

TEST(VoteWorker, PacesAttemptsByInterval) {
    FakeClock clock;
    MetricsAccumulator m(ExperimentConfig{1, 60, 1}, std::chrono::system_clock::now());

    // 20 ms submission + 1 s pause: attempts start at 0, 1.02, ..., 9.18 s
    VoteWorker worker(clock, std::make_unique<SimulatedVote>(clock, 20.0, 20.0), 0.0, 5, 1);
    worker.run(m, clock.now(), std::chrono::duration<double>(1.0), 10s);

    MetricsRecord r = finish(m);
    EXPECT_EQ(r.votes_processed, 10);
    EXPECT_EQ(r.votes_failed, 0);
    ASSERT_EQ(r.latencies_ms.size(), 10u);
    for (double l : r.latencies_ms) EXPECT_DOUBLE_EQ(l, 20.0);
}

TEST(VoteWorker, CertainFailureRecordsNoLatency) {
    FakeClock clock;
    MetricsAccumulator m(ExperimentConfig{1, 60, 1}, std::chrono::system_clock::now());

    VoteWorker worker(clock, std::make_unique<SimulatedVote>(clock, 20.0, 20.0), 1.0, 5, 1);
    worker.run(m, clock.now(), std::chrono::duration<double>(1.0), 10s);

    MetricsRecord r = finish(m);
    EXPECT_EQ(r.votes_processed, 0);
    EXPECT_EQ(r.votes_failed, 10);
    EXPECT_TRUE(r.latencies_ms.empty());
    EXPECT_DOUBLE_EQ(r.error_rate_percent, 100.0);
}

TEST(VoteWorker, ThrowingSubmissionCountsAsFailedVote) {
    FakeClock clock;
    MetricsAccumulator m(ExperimentConfig{1, 60, 1}, std::chrono::system_clock::now());

    VoteWorker worker(clock, std::make_unique<ThrowingVote>(), 0.0, 5, 1);
    worker.run(m, clock.now(), std::chrono::duration<double>(2.0), 10s);

    MetricsRecord r = finish(m);
    EXPECT_EQ(r.votes_processed, 0);
    EXPECT_EQ(r.votes_failed, 5);
    ASSERT_EQ(r.errors.size(), 5u);
    EXPECT_EQ(r.errors.front(), "Vote error: broker down");
}

TEST(VoteWorker, RejectedSubmissionCountsAsFailedVote) {
    FakeClock clock;
    MetricsAccumulator m(ExperimentConfig{1, 60, 1}, std::chrono::system_clock::now());

    VoteWorker worker(clock, std::make_unique<RejectingVote>(), 0.0, 5, 1);
    worker.run(m, clock.now(), std::chrono::duration<double>(2.0), 10s);

    MetricsRecord r = finish(m);
    EXPECT_EQ(r.votes_failed, 5);
    EXPECT_EQ(r.errors.front(), "Vote error: POST /votes returned HTTP 500");
}

TEST(VoteWorker, RejectsInvalidParameters) {
    FakeClock clock;
    EXPECT_THROW(VoteWorker(clock, std::make_unique<ThrowingVote>(), 1.5, 5, 1), std::invalid_argument);
    EXPECT_THROW(VoteWorker(clock, std::make_unique<ThrowingVote>(), 0.1, 0, 1), std::invalid_argument);
}

TEST(ResourceSampler, SamplesAtCadenceAndToleratesFailures) {
    FakeClock clock;
    ScriptedProbe probe(25.0, 2048.0, 3);   // every third reading fails
    MetricsAccumulator m(ExperimentConfig{1, 1, 1}, std::chrono::system_clock::now());

    ResourceSampler sampler(clock, probe, 2s);
    sampler.run(m, clock.now(), 60s);

    MetricsRecord r = finish(m);
    EXPECT_EQ(probe.calls.load(), 30);
    EXPECT_EQ(r.cpu_samples.size(), 20u);
    EXPECT_EQ(r.memory_samples.size(), 20u);
    ASSERT_EQ(r.errors.size(), 10u);
    EXPECT_EQ(r.errors.front(), "Resource sampling error: probe unavailable");
    EXPECT_DOUBLE_EQ(r.cpu_mean_percent, 25.0);
    EXPECT_DOUBLE_EQ(r.memory_mean_mb, 2048.0);
}

TEST(ProcResourceProbe, ReadsHostCounters) {
    FakeClock clock;
    ProcResourceProbe probe(clock, 1s);
    ResourceSample s = probe.sample();
    EXPECT_GE(s.cpu_percent, 0.0);
    EXPECT_LE(s.cpu_percent, 100.0);
    EXPECT_GT(s.memory_used_mb, 0.0);
}

TEST(ProcResourceProbe, MissingCountersThrow) {
    FakeClock clock;
    ProcResourceProbe probe(clock, 1s, "/nonexistent/stat", "/nonexistent/meminfo");
    EXPECT_THROW(probe.sample(), std::runtime_error);
}

TEST(ProcResourceProbe, UsedMemoryExcludesBuffersAndPageCache) {
    const std::string stat_path = "loadgen_fixture_stat.txt";
    const std::string meminfo_path = "loadgen_fixture_meminfo.txt";
    write_file(stat_path, "cpu  100 0 100 800 0 0 0 0\ncpu0 100 0 100 800 0 0 0 0\n");
    write_file(meminfo_path,
               "MemTotal:        8000000 kB\n"
               "MemFree:         1000000 kB\n"
               "MemAvailable:    3800000 kB\n"
               "Buffers:          500000 kB\n"
               "Cached:          2000000 kB\n"
               "SwapCached:            0 kB\n"
               "SReclaimable:     500000 kB\n");

    FakeClock clock;
    ProcResourceProbe probe(clock, 1s, stat_path, meminfo_path);
    ResourceSample s = probe.sample();

    // (8000000 - 1000000 - 500000 - 2500000) kB
    EXPECT_DOUBLE_EQ(s.memory_used_mb, 3906.25);
    EXPECT_DOUBLE_EQ(s.cpu_percent, 0.0);

    std::remove(stat_path.c_str());
    std::remove(meminfo_path.c_str());
}

TEST(ProcResourceProbe, UsedMemoryFallsBackWhenCacheExceedsTotal) {
    const std::string stat_path = "loadgen_fixture_stat_fallback.txt";
    const std::string meminfo_path = "loadgen_fixture_meminfo_fallback.txt";
    write_file(stat_path, "cpu  100 0 100 800 0 0 0 0\n");
    write_file(meminfo_path,
               "MemTotal:           2048 kB\n"
               "MemFree:            1024 kB\n"
               "Cached:             4096 kB\n");

    FakeClock clock;
    ProcResourceProbe probe(clock, 1s, stat_path, meminfo_path);
    EXPECT_DOUBLE_EQ(probe.sample().memory_used_mb, 1.0);

    write_file(meminfo_path, "MemTotal:           2048 kB\n");
    EXPECT_THROW(probe.sample(), std::runtime_error);

    std::remove(stat_path.c_str());
    std::remove(meminfo_path.c_str());
}
