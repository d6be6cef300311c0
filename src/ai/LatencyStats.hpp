// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>

namespace vocatype
{

/// @brief Aggregates over the samples currently in a LatencyWindow.
struct LatencySummary
{
    std::uint64_t sampleCount = 0;
    std::chrono::milliseconds average { 0 };
    std::chrono::milliseconds min { 0 };
    std::chrono::milliseconds max { 0 };
    std::chrono::milliseconds p50 { 0 };
    std::chrono::milliseconds p95 { 0 };
    std::chrono::milliseconds p99 { 0 };
    std::chrono::milliseconds target { 0 };
    std::uint64_t violations = 0;
    /// Percentage of samples at or below the target (100 when empty).
    double complianceRate = 100.0;
};

/// @brief Rolling window of latency samples with a target bound. Thread-safe.
class LatencyWindow
{
  public:
    explicit LatencyWindow(std::chrono::milliseconds target, std::size_t capacity = 100);

    /// @brief Records a sample, evicting the oldest one when the window is full.
    /// @return true if the sample exceeded the target.
    auto record(std::chrono::milliseconds latency) -> bool;

    [[nodiscard]] auto summary() const -> LatencySummary;

    void clear();

    [[nodiscard]] auto target() const -> std::chrono::milliseconds { return _target; }

  private:
    std::chrono::milliseconds _target;
    std::size_t _capacity;
    mutable std::mutex _mutex;
    std::deque<std::chrono::milliseconds> _samples;
};

/// @brief Nearest-rank percentile over an ascending sample list (rounded index).
[[nodiscard]] auto percentile(const std::deque<std::chrono::milliseconds>& sorted, double p)
    -> std::chrono::milliseconds;

/// @brief Per-provider latency and outcome counters.
struct ProviderStatsSnapshot
{
    LatencySummary firstToken;
    LatencySummary total;
    std::uint64_t requests = 0;
    std::uint64_t failures = 0;
};

/// @brief Latency statistics of one provider: time to first token and total request time.
class ProviderLatencyStats
{
  public:
    ProviderLatencyStats(std::chrono::milliseconds firstTokenTarget, std::chrono::milliseconds totalTarget);

    void recordSuccess(std::chrono::milliseconds firstToken, std::chrono::milliseconds total);
    void recordFailure();

    [[nodiscard]] auto snapshot() const -> ProviderStatsSnapshot;

  private:
    LatencyWindow _firstToken;
    LatencyWindow _total;
    std::atomic<std::uint64_t> _requests { 0 };
    std::atomic<std::uint64_t> _failures { 0 };
};

} // namespace vocatype
