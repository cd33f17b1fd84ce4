// ---------------------------------------------------------------------------
// test_stats_collector.cpp
//
// StatsCollector 단위 테스트
//
// [테스트 범위]
// - 초기 상태 스냅샷
// - on_query: 성공/실패 분류별 집계
// - on_execution_start / on_execution_end: in_flight 증감, 0 하한
// - ExecutionScope: 예외 경로에서도 in_flight 복구
// - deny_rate 계산 (0 나누기 방지 포함)
// - captured_at / qps
// - 동시 접근 시 data race 없음 (TSan 빌드 대상)
// ---------------------------------------------------------------------------

#include "stats/stats_collector.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <new>
#include <thread>
#include <vector>

// ---------------------------------------------------------------------------
// InitialState_AllZero
//   생성 직후 모든 카운터는 0 이어야 한다.
// ---------------------------------------------------------------------------
TEST(StatsCollector, InitialState_AllZero) {
    StatsCollector stats;
    const auto snap = stats.snapshot();

    EXPECT_EQ(snap.total_queries, 0u);
    EXPECT_EQ(snap.succeeded_queries, 0u);
    EXPECT_EQ(snap.in_flight, 0u);
    for (const auto e : snap.errors) {
        EXPECT_EQ(e, 0u);
    }
}

// ---------------------------------------------------------------------------
// OnQuery_CountsByKind
//   실패는 해당 kind 카운터에만 반영되고, 성공은 succeeded_queries 에 반영된다.
// ---------------------------------------------------------------------------
TEST(StatsCollector, OnQuery_CountsByKind) {
    StatsCollector stats;

    stats.on_query(std::nullopt);
    stats.on_query(std::nullopt);
    stats.on_query(QueryErrorKind::kSyntaxInvalid);
    stats.on_query(QueryErrorKind::kExecutionTimeout);
    stats.on_query(QueryErrorKind::kExecutionTimeout);

    const auto snap = stats.snapshot();
    EXPECT_EQ(snap.total_queries, 5u);
    EXPECT_EQ(snap.succeeded_queries, 2u);
    EXPECT_EQ(snap.error_count(QueryErrorKind::kSyntaxInvalid), 1u);
    EXPECT_EQ(snap.error_count(QueryErrorKind::kExecutionTimeout), 2u);
    EXPECT_EQ(snap.error_count(QueryErrorKind::kRuntimeFailure), 0u);
    EXPECT_EQ(snap.error_count(QueryErrorKind::kSerializationFailure), 0u);
}

// ---------------------------------------------------------------------------
// InFlight_StartEnd
// ---------------------------------------------------------------------------
TEST(StatsCollector, InFlight_StartEnd) {
    StatsCollector stats;

    stats.on_execution_start();
    stats.on_execution_start();
    EXPECT_EQ(stats.snapshot().in_flight, 2u);

    stats.on_execution_end();
    EXPECT_EQ(stats.snapshot().in_flight, 1u);
}

// ---------------------------------------------------------------------------
// InFlight_NeverNegative
//   start 없이 end 가 호출되어도 in_flight 는 0 아래로 내려가지 않는다
//   (unsigned wrap-around 방지).
// ---------------------------------------------------------------------------
TEST(StatsCollector, InFlight_NeverNegative) {
    StatsCollector stats;
    stats.on_execution_end();
    stats.on_execution_end();

    EXPECT_EQ(stats.snapshot().in_flight, 0u)
        << "in_flight must not wrap around below zero";
}

// ---------------------------------------------------------------------------
// ExecutionScope_RestoresInFlightOnException
//   실행 구간에서 예외가 나도 in_flight 는 원래 값으로 돌아온다.
// ---------------------------------------------------------------------------
TEST(StatsCollector, ExecutionScope_RestoresInFlightOnException) {
    StatsCollector stats;

    {
        const ExecutionScope scope{&stats};
        EXPECT_EQ(stats.snapshot().in_flight, 1u);
    }
    EXPECT_EQ(stats.snapshot().in_flight, 0u);

    EXPECT_THROW({
        const ExecutionScope scope{&stats};
        throw std::bad_alloc{};
    }, std::bad_alloc);
    EXPECT_EQ(stats.snapshot().in_flight, 0u)
        << "in_flight must come back down when execution throws";

    // nullptr 은 아무것도 하지 않는다
    EXPECT_NO_THROW({ const ExecutionScope scope{nullptr}; });
}

// ---------------------------------------------------------------------------
// Snapshot_DenyRate
//   deny_rate = CapabilityDenied / total_queries
// ---------------------------------------------------------------------------
TEST(StatsCollector, Snapshot_DenyRate) {
    StatsCollector stats;

    stats.on_query(QueryErrorKind::kCapabilityDenied);
    stats.on_query(QueryErrorKind::kRuntimeFailure);
    stats.on_query(std::nullopt);
    stats.on_query(QueryErrorKind::kCapabilityDenied);

    const auto snap = stats.snapshot();
    EXPECT_NEAR(snap.deny_rate, 0.5, 1e-9)
        << "deny_rate should be 0.5 (2 denied / 4 total)";
}

// 다른 실패 kind 는 deny_rate 에 포함되지 않는다
TEST(StatsCollector, Snapshot_DenyRate_IgnoresOtherFailures) {
    StatsCollector stats;

    stats.on_query(QueryErrorKind::kSyntaxInvalid);
    stats.on_query(QueryErrorKind::kExecutionTimeout);

    EXPECT_NEAR(stats.snapshot().deny_rate, 0.0, 1e-9);
}

// ---------------------------------------------------------------------------
// Snapshot_DenyRate_ZeroTotal
//   total_queries == 0 일 때 deny_rate == 0.0 이어야 한다 (div-by-zero 방지).
// ---------------------------------------------------------------------------
TEST(StatsCollector, Snapshot_DenyRate_ZeroTotal) {
    StatsCollector stats;
    const auto snap = stats.snapshot();

    EXPECT_NEAR(snap.deny_rate, 0.0, 1e-9)
        << "deny_rate should be 0.0 when total_queries == 0 (no div-by-zero)";
}

// ---------------------------------------------------------------------------
// Snapshot_CapturedAt_IsSet
// ---------------------------------------------------------------------------
TEST(StatsCollector, Snapshot_CapturedAt_IsSet) {
    using clock = std::chrono::system_clock;
    const auto before = clock::now();

    StatsCollector stats;
    const auto snap = stats.snapshot();

    const auto after = clock::now();

    EXPECT_GE(snap.captured_at, before) << "captured_at should be >= before snapshot call";
    EXPECT_LE(snap.captured_at, after)  << "captured_at should be <= after snapshot call";
}

// ---------------------------------------------------------------------------
// Snapshot_Qps_PositiveAfterQuery
// ---------------------------------------------------------------------------
TEST(StatsCollector, Snapshot_Qps_PositiveAfterQuery) {
    StatsCollector stats;
    std::this_thread::sleep_for(std::chrono::milliseconds{1});
    stats.on_query(std::nullopt);

    const auto snap = stats.snapshot();
    EXPECT_GT(snap.qps, 0.0)
        << "qps should be > 0 after at least one query";
}

// ---------------------------------------------------------------------------
// ConcurrentAccess_NoDataRace
//   여러 스레드에서 동시에 on_execution_start/end, on_query, snapshot 을
//   호출해도 data race 없이 안전해야 한다.
//
//   [TSan 검증 포인트]
//   TSan 빌드에서 실행 시 이 테스트에서 data race 가 발생하면 안 된다.
// ---------------------------------------------------------------------------
TEST(StatsCollector, ConcurrentAccess_NoDataRace) {
    StatsCollector stats;

    constexpr int kWriterThreads = 4;
    constexpr int kOpsPerThread  = 1000;

    std::vector<std::thread> writers;
    writers.reserve(static_cast<std::size_t>(kWriterThreads));

    for (int i = 0; i < kWriterThreads; ++i) {
        writers.emplace_back([&stats]() {
            for (int j = 0; j < kOpsPerThread; ++j) {
                stats.on_execution_start();
                stats.on_query(j % 2 == 0 ? std::optional{QueryErrorKind::kCapabilityDenied}
                                          : std::nullopt);
                stats.on_execution_end();
            }
        });
    }

    // reader 스레드: snapshot() 반복
    std::atomic<bool> stop_reader{false};
    std::thread reader([&stats, &stop_reader]() {
        while (!stop_reader.load(std::memory_order_relaxed)) {
            const auto snap = stats.snapshot();
            EXPECT_LE(snap.in_flight, static_cast<std::uint64_t>(kWriterThreads))
                << "in_flight cannot exceed the number of writers";
        }
    });

    for (auto& t : writers) { t.join(); }
    stop_reader.store(true, std::memory_order_relaxed);
    reader.join();

    const auto snap = stats.snapshot();
    const auto expected_total =
        static_cast<std::uint64_t>(kWriterThreads) *
        static_cast<std::uint64_t>(kOpsPerThread);

    EXPECT_EQ(snap.total_queries, expected_total)
        << "total_queries must equal kWriterThreads * kOpsPerThread";
    EXPECT_EQ(snap.succeeded_queries + snap.error_count(QueryErrorKind::kCapabilityDenied),
              expected_total);
    EXPECT_EQ(snap.in_flight, 0u);

    // 홀짝 교번 → 절반 거부 → 0.5
    EXPECT_NEAR(snap.deny_rate, 0.5, 1e-9);
}
