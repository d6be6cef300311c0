// SPDX-License-Identifier: Apache-2.0
#include "TokenChannel.hpp"

#include <format>

namespace vocatype
{

void TokenChannel::push(std::string text)
{
    {
        auto lock = std::lock_guard(_mutex);
        if (_closed || _error || isCancelled())
            return;
        _tokens.push_back(StreamToken { .text = std::move(text), .index = _nextIndex++ });
    }
    _ready.notify_one();
}

void TokenChannel::close()
{
    {
        auto lock = std::lock_guard(_mutex);
        _closed = true;
    }
    _ready.notify_all();
}

void TokenChannel::fail(Error error)
{
    {
        auto lock = std::lock_guard(_mutex);
        if (!_closed && !_error)
            _error = std::move(error);
    }
    _ready.notify_all();
}

auto TokenChannel::next(std::chrono::milliseconds timeout) -> Result<std::optional<StreamToken>>
{
    auto lock = std::unique_lock(_mutex);
    _ready.wait_for(lock, timeout, [&] { return !_tokens.empty() || _closed || _error || isCancelled(); });

    if (isCancelled())
        return makeError(ErrorCode::Cancelled, "Stream cancelled");
    if (!_tokens.empty())
    {
        auto token = std::move(_tokens.front());
        _tokens.pop_front();
        return token;
    }
    if (_error)
        return std::unexpected(*_error);
    if (_closed)
        return std::nullopt;
    return makeError(ErrorCode::Timeout, std::format("No token within {} ms", timeout.count()));
}

void TokenChannel::cancel()
{
    {
        auto lock = std::lock_guard(_mutex);
        _cancelled.store(true, std::memory_order_release);
    }
    _ready.notify_all();
}

} // namespace vocatype
