// SPDX-License-Identifier: Apache-2.0
#include "LatencyStats.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace vocatype
{

auto percentile(const std::deque<std::chrono::milliseconds>& sorted, double p) -> std::chrono::milliseconds
{
    if (sorted.empty())
        return std::chrono::milliseconds { 0 };

    auto const index = static_cast<std::size_t>(std::round(p / 100.0 * static_cast<double>(sorted.size() - 1)));
    return sorted[std::min(index, sorted.size() - 1)];
}

LatencyWindow::LatencyWindow(std::chrono::milliseconds target, std::size_t capacity):
    _target(target), _capacity(std::max<std::size_t>(capacity, 1))
{
}

auto LatencyWindow::record(std::chrono::milliseconds latency) -> bool
{
    auto lock = std::lock_guard(_mutex);
    _samples.push_back(latency);
    if (_samples.size() > _capacity)
        _samples.pop_front();
    return latency > _target;
}

auto LatencyWindow::summary() const -> LatencySummary
{
    auto sorted = std::deque<std::chrono::milliseconds> {};
    {
        auto lock = std::lock_guard(_mutex);
        sorted = _samples;
    }

    auto result = LatencySummary { .target = _target };
    if (sorted.empty())
        return result;

    std::ranges::sort(sorted);
    auto const count = sorted.size();
    auto const sum = std::accumulate(sorted.begin(), sorted.end(), std::chrono::milliseconds { 0 });

    result.sampleCount = count;
    result.average = sum / static_cast<std::int64_t>(count);
    result.min = sorted.front();
    result.max = sorted.back();
    result.p50 = percentile(sorted, 50.0);
    result.p95 = percentile(sorted, 95.0);
    result.p99 = percentile(sorted, 99.0);
    result.violations = static_cast<std::uint64_t>(std::ranges::count_if(sorted, [&](auto v) { return v > _target; }));
    result.complianceRate = 100.0 * static_cast<double>(count - result.violations) / static_cast<double>(count);
    return result;
}

void LatencyWindow::clear()
{
    auto lock = std::lock_guard(_mutex);
    _samples.clear();
}

ProviderLatencyStats::ProviderLatencyStats(std::chrono::milliseconds firstTokenTarget,
                                           std::chrono::milliseconds totalTarget):
    _firstToken(firstTokenTarget), _total(totalTarget)
{
}

void ProviderLatencyStats::recordSuccess(std::chrono::milliseconds firstToken, std::chrono::milliseconds total)
{
    ++_requests;
    _firstToken.record(firstToken);
    _total.record(total);
}

void ProviderLatencyStats::recordFailure()
{
    ++_requests;
    ++_failures;
}

auto ProviderLatencyStats::snapshot() const -> ProviderStatsSnapshot
{
    return ProviderStatsSnapshot {
        .firstToken = _firstToken.summary(),
        .total = _total.summary(),
        .requests = _requests.load(),
        .failures = _failures.load(),
    };
}

} // namespace vocatype
