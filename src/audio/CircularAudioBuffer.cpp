// SPDX-License-Identifier: Apache-2.0
#include "CircularAudioBuffer.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <thread>

namespace vocatype
{

auto CircularAudioBuffer::create(std::uint32_t sampleRate, std::chrono::milliseconds duration)
    -> Result<std::unique_ptr<CircularAudioBuffer>>
{
    auto const capacity = durationToSamples(duration, sampleRate);
    if (capacity == 0)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Audio buffer capacity cannot be zero ({} Hz, {} ms)",
                                     sampleRate,
                                     duration.count()));

    log::debug("Creating circular audio buffer: {} samples, {} ms", capacity, duration.count());
    return std::make_unique<CircularAudioBuffer>(sampleRate, capacity);
}

CircularAudioBuffer::CircularAudioBuffer(std::uint32_t sampleRate, std::size_t capacity):
    _sampleRate(sampleRate), _capacity(capacity), _samples(capacity)
{
}

void CircularAudioBuffer::push(AudioFrame frame) noexcept
{
    if (frame.empty() || _capacity == 0)
        return;

    auto const kept = std::min(frame.size(), _capacity);
    auto const skipped = frame.size() - kept;

    auto const sequence = _sequence.load(std::memory_order_relaxed);
    _sequence.store(sequence + 1, std::memory_order_relaxed);
    std::atomic_thread_fence(std::memory_order_release);

    auto const written = _written.load(std::memory_order_relaxed);
    auto const start = written + skipped;
    for (auto i = std::size_t { 0 }; i < kept; ++i)
        _samples[(start + i) % _capacity].store(frame[skipped + i], std::memory_order_relaxed);

    _written.store(written + frame.size(), std::memory_order_relaxed);
    _sequence.store(sequence + 2, std::memory_order_release);
}

auto CircularAudioBuffer::snapshot(std::chrono::milliseconds duration) const -> std::vector<float>
{
    return snapshotSamples(durationToSamples(duration, _sampleRate));
}

auto CircularAudioBuffer::snapshotSamples(std::size_t count) const -> std::vector<float>
{
    auto const end = totalWritten();
    auto const begin = end > count ? end - count : 0;
    return copyRange(begin, end);
}

auto CircularAudioBuffer::copyRange(std::uint64_t begin, std::uint64_t end) const -> std::vector<float>
{
    auto result = std::vector<float> {};
    if (begin >= end)
        return result;

    result.reserve(static_cast<std::size_t>(std::min<std::uint64_t>(end - begin, _capacity)));

    while (true)
    {
        auto const sequence = _sequence.load(std::memory_order_acquire);
        if (sequence & 1u)
        {
            std::this_thread::yield();
            continue;
        }

        auto const written = _written.load(std::memory_order_relaxed);
        auto const origin = _origin.load(std::memory_order_relaxed);
        auto const oldest = std::max<std::uint64_t>(origin, written > _capacity ? written - _capacity : 0);
        auto const from = std::max(begin, oldest);
        auto const to = std::min(end, written);

        result.clear();
        for (auto index = from; index < to; ++index)
            result.push_back(_samples[index % _capacity].load(std::memory_order_relaxed));

        std::atomic_thread_fence(std::memory_order_acquire);
        if (_sequence.load(std::memory_order_relaxed) == sequence)
            return result;
    }
}

void CircularAudioBuffer::clear() noexcept
{
    auto const sequence = _sequence.load(std::memory_order_relaxed);
    _sequence.store(sequence + 1, std::memory_order_relaxed);
    std::atomic_thread_fence(std::memory_order_release);

    _origin.store(_written.load(std::memory_order_relaxed), std::memory_order_relaxed);

    _sequence.store(sequence + 2, std::memory_order_release);
}

auto CircularAudioBuffer::size() const noexcept -> std::size_t
{
    auto const written = _written.load(std::memory_order_acquire);
    auto const origin = _origin.load(std::memory_order_acquire);
    auto const retained = written - std::min(origin, written);
    return static_cast<std::size_t>(std::min<std::uint64_t>(retained, _capacity));
}

auto CircularAudioBuffer::totalWritten() const noexcept -> std::uint64_t
{
    return _written.load(std::memory_order_acquire);
}

auto CircularAudioBuffer::hasSufficientData(std::chrono::milliseconds minDuration) const noexcept -> bool
{
    return size() >= durationToSamples(minDuration, _sampleRate);
}

auto CircularAudioBuffer::stats() const noexcept -> BufferStats
{
    auto const currentSize = size();
    return BufferStats {
        .capacity = _capacity,
        .size = currentSize,
        .usagePercent = _capacity ? 100.0f * static_cast<float>(currentSize) / static_cast<float>(_capacity) : 0.0f,
        .isFull = currentSize == _capacity,
        .durationStored = samplesToDuration(currentSize, _sampleRate),
        .totalWritten = totalWritten(),
    };
}

} // namespace vocatype
