#pragma once

// ---------------------------------------------------------------------------
// stats_collector.hpp
//
// 실시간 통계 수집기. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - on_execution_start / on_execution_end / on_query:
//   요청 처리 경로에서 concurrent 호출 안전 (atomic 사용).
// - snapshot():
//   조회 경로에서 호출. 갱신 경로와 contention 없이 읽기 가능.
//
// [격리 원칙]
// - 통계 수집 실패가 요청 처리 실패로 전파되지 않도록
//   모든 갱신 메서드는 noexcept 로 선언한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>

inline constexpr std::size_t kQueryErrorKindCount = 5;

// ---------------------------------------------------------------------------
// StatsSnapshot
//   특정 시점의 통계 스냅샷 (불변 값 객체).
//   errors    : QueryErrorKind 값을 인덱스로 사용
//   qps       : 수집기 생성 이후 평균 초당 요청 수
//   deny_rate : CapabilityDenied / total_queries (total == 0 이면 0.0)
// ---------------------------------------------------------------------------
struct StatsSnapshot {
    std::uint64_t                                     total_queries{0};
    std::uint64_t                                     succeeded_queries{0};
    std::array<std::uint64_t, kQueryErrorKindCount>   errors{};
    std::uint64_t                                     in_flight{0};
    double                                            qps{0.0};
    double                                            deny_rate{0.0};
    std::chrono::system_clock::time_point             captured_at{};

    [[nodiscard]] std::uint64_t error_count(QueryErrorKind kind) const noexcept {
        return errors[static_cast<std::size_t>(kind)];
    }
};

// ---------------------------------------------------------------------------
// StatsCollector
//   요청 처리 이벤트를 집계하고 StatsSnapshot 을 제공한다.
// ---------------------------------------------------------------------------
class StatsCollector {
public:
    StatsCollector() noexcept
        : total_queries_{0}
        , succeeded_queries_{0}
        , in_flight_{0}
        , started_at_(std::chrono::system_clock::now())
    {
        for (auto& e : errors_) {
            e.store(0, std::memory_order_relaxed);
        }
    }

    ~StatsCollector() = default;

    // 복사 금지 (atomic 은 복사 불가)
    StatsCollector(const StatsCollector&)            = delete;
    StatsCollector& operator=(const StatsCollector&) = delete;

    // 이동 금지 (atomic 소유권 명확화)
    StatsCollector(StatsCollector&&)            = delete;
    StatsCollector& operator=(StatsCollector&&) = delete;

    // on_execution_start / on_execution_end
    //   sandbox worker 실행 구간. in_flight 는 0 아래로 내려가지 않는다.
    void on_execution_start() noexcept {
        in_flight_.fetch_add(1, std::memory_order_relaxed);
    }

    void on_execution_end() noexcept {
        std::uint64_t current = in_flight_.load(std::memory_order_relaxed);
        while (current > 0 &&
               !in_flight_.compare_exchange_weak(current, current - 1, std::memory_order_relaxed)) {
        }
    }

    // on_query
    //   execute_query 한 건 완료 시 호출.
    //   error: 실패면 분류, 성공이면 nullopt
    void on_query(std::optional<QueryErrorKind> error) noexcept {
        total_queries_.fetch_add(1, std::memory_order_relaxed);
        if (!error) {
            succeeded_queries_.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        const auto index = static_cast<std::size_t>(*error);
        if (index < errors_.size()) {
            errors_[index].fetch_add(1, std::memory_order_relaxed);
        }
    }

    // snapshot
    //   현재 통계의 불변 스냅샷을 반환한다 (조회 경로).
    [[nodiscard]] StatsSnapshot snapshot() const noexcept {
        const auto now       = std::chrono::system_clock::now();
        const auto total_q   = total_queries_.load(std::memory_order_relaxed);

        StatsSnapshot snap{};
        snap.total_queries     = total_q;
        snap.succeeded_queries = succeeded_queries_.load(std::memory_order_relaxed);
        snap.in_flight         = in_flight_.load(std::memory_order_relaxed);
        snap.captured_at       = now;
        for (std::size_t i = 0; i < errors_.size(); ++i) {
            snap.errors[i] = errors_[i].load(std::memory_order_relaxed);
        }

        const double elapsed_sec = std::chrono::duration<double>(now - started_at_).count();
        if (elapsed_sec > 0.0) {
            snap.qps = static_cast<double>(total_q) / elapsed_sec;
        }
        if (total_q > 0) {
            snap.deny_rate = static_cast<double>(snap.error_count(QueryErrorKind::kCapabilityDenied)) /
                             static_cast<double>(total_q);
        }
        return snap;
    }

private:
    std::atomic<std::uint64_t>                                   total_queries_;
    std::atomic<std::uint64_t>                                   succeeded_queries_;
    std::array<std::atomic<std::uint64_t>, kQueryErrorKindCount> errors_;
    std::atomic<std::uint64_t>                                   in_flight_;
    const std::chrono::system_clock::time_point                  started_at_;
};

// ---------------------------------------------------------------------------
// ExecutionScope
//   on_execution_start / on_execution_end 를 짝지어 호출한다.
//   실행 중 예외가 나도 in_flight 가 복구된다. stats 가 nullptr 이면 무시.
// ---------------------------------------------------------------------------
class ExecutionScope {
public:
    explicit ExecutionScope(StatsCollector* stats) noexcept : stats_(stats) {
        if (stats_ != nullptr) {
            stats_->on_execution_start();
        }
    }

    ~ExecutionScope() {
        if (stats_ != nullptr) {
            stats_->on_execution_end();
        }
    }

    ExecutionScope(const ExecutionScope&)            = delete;
    ExecutionScope& operator=(const ExecutionScope&) = delete;
    ExecutionScope(ExecutionScope&&)                 = delete;
    ExecutionScope& operator=(ExecutionScope&&)      = delete;

private:
    StatsCollector* stats_;
};
