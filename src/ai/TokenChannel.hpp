// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ai/ProviderClient.hpp>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace vocatype
{

/// @brief Hand-off of streamed tokens from a producer thread to a TokenStream consumer.
///
/// The producer calls push() for each token and ends the stream with close() or fail(). The
/// consumer side implements TokenStream. cancel() may be called from any thread.
class TokenChannel: public TokenStream
{
  public:
    /// @brief Appends a token; ignored once the channel is finished or cancelled.
    void push(std::string text);

    /// @brief Ends the stream successfully.
    void close();

    /// @brief Ends the stream with an error.
    void fail(Error error);

    [[nodiscard]] auto next(std::chrono::milliseconds timeout) -> Result<std::optional<StreamToken>> override;

    void cancel() override;

    [[nodiscard]] auto isCancelled() const -> bool { return _cancelled.load(std::memory_order_acquire); }

  private:
    std::mutex _mutex;
    std::condition_variable _ready;
    std::deque<StreamToken> _tokens;
    std::optional<Error> _error;
    bool _closed = false;
    std::size_t _nextIndex = 0;
    std::atomic<bool> _cancelled = false;
};

} // namespace vocatype
