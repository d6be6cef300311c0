// SPDX-License-Identifier: Apache-2.0

#include "AudioCapture.hpp"

#include <core/Log.hpp>

// AudioCapture is the only miniaudio user, so the implementation lives in this translation unit.
#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <optional>
#include <string>

namespace vocatype
{

struct AudioCapture::Impl
{
    ma_context context {};
    ma_device device {};
    AudioCallback callback;
    std::string deviceName;
    std::uint32_t sampleRate = 0;
    std::atomic<bool> capturing = false;
    bool contextInitialized = false;
    bool deviceInitialized = false;

    void release()
    {
        if (deviceInitialized)
            ma_device_uninit(&device);
        if (contextInitialized)
            ma_context_uninit(&context);
        deviceInitialized = false;
        contextInitialized = false;
    }
};

namespace
{

    void audioDataCallback(ma_device* device, void* /*output*/, const void* input, ma_uint32 frameCount)
    {
        auto* impl = static_cast<AudioCapture::Impl*>(device->pUserData);
        if (impl && impl->callback && input && impl->capturing.load(std::memory_order_acquire))
            impl->callback(std::span<const float>(static_cast<const float*>(input), frameCount));
    }

    auto toLower(std::string_view text) -> std::string
    {
        auto s = std::string(text);
        std::ranges::transform(s, s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    /// Picks a capture device by case-insensitive substring, else the first non-monitor source.
    auto selectDevice(ma_device_info* devices, ma_uint32 count, std::string_view filter) -> std::optional<ma_uint32>
    {
        if (!filter.empty())
        {
            auto const target = toLower(filter);
            for (auto i = ma_uint32 { 0 }; i < count; ++i)
            {
                if (toLower(devices[i].name).find(target) != std::string::npos)
                {
                    log::info("Matched capture device '{}' for filter '{}'", devices[i].name, filter);
                    return i;
                }
            }
            return std::nullopt;
        }

        // Monitors are loopback sources, not microphones
        for (auto i = ma_uint32 { 0 }; i < count; ++i)
        {
            if (!toLower(devices[i].name).starts_with("monitor"))
            {
                log::info("Auto-selected capture device '{}'", devices[i].name);
                return i;
            }
        }
        return count > 0 ? std::optional<ma_uint32> { 0 } : std::nullopt;
    }

} // namespace

AudioCapture::AudioCapture(): _impl(std::make_unique<Impl>())
{
}

AudioCapture::~AudioCapture()
{
    close();
}

auto AudioCapture::open(std::string_view deviceName, std::uint32_t sampleRate, AudioCallback callback)
    -> VoidResult
{
    close();
    _impl->callback = std::move(callback);
    _impl->sampleRate = sampleRate;

    // The context must outlive the device
    auto const ctxResult = ma_context_init(nullptr, 0, nullptr, &_impl->context);
    if (ctxResult != MA_SUCCESS)
        return makeError(ErrorCode::StreamInitError,
                         std::format("Failed to initialize audio context: {}", static_cast<int>(ctxResult)));
    _impl->contextInitialized = true;

    ma_device_info* captureDevices = nullptr;
    auto captureCount = ma_uint32 { 0 };
    auto const enumResult = ma_context_get_devices(&_impl->context, nullptr, nullptr, &captureDevices, &captureCount);

    auto deviceId = std::optional<ma_device_id> {};
    if (enumResult == MA_SUCCESS)
    {
        log::debug("Found {} capture device(s)", captureCount);
        if (captureCount == 0)
        {
            _impl->release();
            return makeError(ErrorCode::DeviceUnavailable, "No audio input device available");
        }

        auto const index = selectDevice(captureDevices, captureCount, deviceName);
        if (!index)
        {
            _impl->release();
            return makeError(ErrorCode::DeviceUnavailable,
                             std::format("No capture device matching '{}' found", deviceName));
        }
        deviceId = captureDevices[*index].id;
    }
    else
    {
        log::warning("Failed to enumerate capture devices (code: {}), using default", static_cast<int>(enumResult));
    }

    auto deviceConfig = ma_device_config_init(ma_device_type_capture);
    deviceConfig.capture.format = ma_format_f32;
    deviceConfig.capture.channels = 1;
    deviceConfig.sampleRate = sampleRate;
    deviceConfig.periodSizeInFrames = sampleRate / 100;
    deviceConfig.performanceProfile = ma_performance_profile_low_latency;
    deviceConfig.dataCallback = audioDataCallback;
    deviceConfig.pUserData = _impl.get();
    if (deviceId)
        deviceConfig.capture.pDeviceID = &*deviceId;

    auto const result = ma_device_init(&_impl->context, &deviceConfig, &_impl->device);
    if (result != MA_SUCCESS)
    {
        _impl->release();
        auto const code = result == MA_NO_DEVICE ? ErrorCode::DeviceUnavailable : ErrorCode::StreamInitError;
        return makeError(code, std::format("Failed to initialize audio device: {}", static_cast<int>(result)));
    }
    _impl->deviceInitialized = true;
    _impl->deviceName = _impl->device.capture.name;

    log::info("Audio capture initialized on '{}' ({} Hz, mono, float32)", _impl->deviceName, sampleRate);
    return {};
}

auto AudioCapture::start() -> VoidResult
{
    if (!_impl->deviceInitialized)
        return makeError(ErrorCode::StreamInitError, "Audio device not opened");

    if (_impl->capturing)
        return {};

    _impl->capturing = true;
    auto const result = ma_device_start(&_impl->device);
    if (result != MA_SUCCESS)
    {
        _impl->capturing = false;
        return makeError(ErrorCode::StreamInitError,
                         std::format("Failed to start audio capture: {}", static_cast<int>(result)));
    }

    log::info("Audio capture started");
    return {};
}

void AudioCapture::stop()
{
    if (!_impl->capturing.exchange(false))
        return;

    // ma_device_stop() waits for an in-flight data callback to return
    ma_device_stop(&_impl->device);
    log::info("Audio capture stopped");
}

void AudioCapture::close()
{
    stop();
    _impl->release();
}

auto AudioCapture::isCapturing() const -> bool
{
    return _impl->capturing;
}

auto AudioCapture::deviceName() const -> std::string
{
    return _impl->deviceName;
}

auto AudioCapture::listDevices() -> Result<std::vector<AudioDeviceInfo>>
{
    auto context = ma_context {};
    if (auto const rc = ma_context_init(nullptr, 0, nullptr, &context); rc != MA_SUCCESS)
        return makeError(ErrorCode::StreamInitError,
                         std::format("Failed to initialize audio context: {}", static_cast<int>(rc)));

    ma_device_info* captureDevices = nullptr;
    auto captureCount = ma_uint32 { 0 };
    auto const rc = ma_context_get_devices(&context, nullptr, nullptr, &captureDevices, &captureCount);
    if (rc != MA_SUCCESS)
    {
        ma_context_uninit(&context);
        return makeError(ErrorCode::DeviceUnavailable,
                         std::format("Failed to enumerate capture devices: {}", static_cast<int>(rc)));
    }

    auto devices = std::vector<AudioDeviceInfo> {};
    devices.reserve(captureCount);
    for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
        devices.push_back(AudioDeviceInfo { .name = captureDevices[i].name,
                                            .isDefault = captureDevices[i].isDefault != 0 });

    ma_context_uninit(&context);
    return devices;
}

} // namespace vocatype
