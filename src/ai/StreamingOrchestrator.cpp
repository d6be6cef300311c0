// SPDX-License-Identifier: Apache-2.0
#include "StreamingOrchestrator.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <format>
#include <optional>

namespace vocatype
{

namespace
{

    using Clock = std::chrono::steady_clock;

    auto elapsedSince(Clock::time_point start) -> std::chrono::milliseconds
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    }

    auto exhausted(std::optional<Error> lastError, std::size_t attempts) -> std::unexpected<Error>
    {
        if (!lastError)
            return makeError(ErrorCode::AllProvidersExhausted, "No enabled AI provider available");
        return makeError(ErrorCode::AllProvidersExhausted,
                         std::format("All AI providers failed after {} attempt(s)", attempts),
                         std::move(*lastError));
    }

} // namespace

StreamingOrchestrator::StreamingOrchestrator(std::vector<std::unique_ptr<ProviderClient>> providers,
                                             OrchestratorConfig config):
    _providers(std::move(providers)), _config(config)
{
    std::erase_if(_providers, [](auto const& p) { return p == nullptr; });
}

auto StreamingOrchestrator::attemptOrder(const AiRequest& request) const -> std::vector<ProviderClient*>
{
    auto order = std::vector<ProviderClient*> {};
    order.reserve(_providers.size());

    if (!request.preferredProvider.empty())
    {
        if (auto* preferred = provider(request.preferredProvider))
            order.push_back(preferred);
        else
            log::warning("Preferred provider '{}' is not configured", request.preferredProvider);
    }

    for (auto const& p: _providers)
        if (std::ranges::find(order, p.get()) == order.end())
            order.push_back(p.get());
    return order;
}

auto StreamingOrchestrator::handleFailure(ProviderClient& provider, const Error& error) -> bool
{
    provider.stats().recordFailure();

    if (error.code == ErrorCode::AuthError)
    {
        auto lock = std::lock_guard(_disabledMutex);
        _disabled.insert(provider.name());
        log::error("Provider '{}' disabled after authentication failure: {}", provider.name(), error.message);
    }
    else
    {
        log::warning("Provider '{}' failed: {}", provider.name(), error);
    }

    return isProviderRecoverable(error.code);
}

auto StreamingOrchestrator::run(const AiRequest& request, const StreamCallbacks& callbacks, std::stop_token stopToken)
    -> Result<OrchestrationResult>
{
    auto const runStart = Clock::now();
    auto const timeLimit = std::min(request.timeLimit, _config.requestTimeout);

    // Guards token delivery and the active stream; the stop callback takes it too, so no token is
    // delivered once request_stop() has returned.
    auto sinkMutex = std::mutex {};
    auto cancelled = false;
    TokenStream* activeStream = nullptr;

    auto const onStop = std::stop_callback(stopToken, [&] {
        auto lock = std::lock_guard(sinkMutex);
        cancelled = true;
        if (activeStream)
            activeStream->cancel();
    });

    auto const isCancelled = [&] {
        auto lock = std::lock_guard(sinkMutex);
        return cancelled;
    };
    auto const cancelledError = [] { return makeError(ErrorCode::Cancelled, "AI request cancelled"); };

    auto lastError = std::optional<Error> {};
    auto attempts = std::size_t { 0 };

    for (auto* provider: attemptOrder(request))
    {
        if (isCancelled())
            return cancelledError();
        if (isProviderDisabled(provider->name()))
        {
            log::debug("Skipping disabled provider '{}'", provider->name());
            continue;
        }

        ++attempts;
        auto const start = Clock::now();
        auto const deadline = start + timeLimit;
        log::debug("Attempt {}: streaming from '{}'", attempts, provider->name());

        auto stream = provider->issueStreamingRequest(request);
        if (!stream)
        {
            if (!handleFailure(*provider, stream.error()))
                return std::unexpected(stream.error());
            lastError = stream.error();
            continue;
        }

        {
            auto lock = std::lock_guard(sinkMutex);
            if (cancelled)
                return cancelledError();
            activeStream = stream->get();
        }

        auto text = std::string {};
        auto firstToken = std::optional<std::chrono::milliseconds> {};
        auto delivered = false;
        auto failure = std::optional<Error> {};

        while (true)
        {
            auto const now = Clock::now();
            auto const waitUntil = std::min(deadline,
                                            firstToken ? now + _config.interTokenTimeout
                                                       : start + _config.firstTokenTimeout);
            auto const wait = std::chrono::duration_cast<std::chrono::milliseconds>(waitUntil - now);

            auto next = Result<std::optional<StreamToken>> {};
            if (wait.count() > 0)
                next = (*stream)->next(wait);
            else
                next = makeError(ErrorCode::Timeout, "Deadline reached");
            if (!next)
            {
                if (next.error().code == ErrorCode::Cancelled && isCancelled())
                    break;

                failure = next.error();
                if (failure->code == ErrorCode::Timeout && Clock::now() >= waitUntil)
                {
                    if (waitUntil == deadline)
                        failure->message = std::format("Request exceeded {} ms", timeLimit.count());
                    else if (!firstToken)
                        failure->message =
                            std::format("No first token within {} ms", _config.firstTokenTimeout.count());
                    else
                        failure->message = std::format("No token within {} ms", _config.interTokenTimeout.count());
                }
                break;
            }

            if (!*next)
            {
                if (text.empty())
                    failure = Error { .code = ErrorCode::ProtocolError, .message = "Empty response" };
                break;
            }

            auto lock = std::lock_guard(sinkMutex);
            if (cancelled)
                break;
            if (!firstToken)
                firstToken = elapsedSince(start);
            text += (*next)->text;
            delivered = true;
            if (callbacks.onToken)
                callbacks.onToken(**next);
        }

        {
            auto lock = std::lock_guard(sinkMutex);
            activeStream = nullptr;
        }
        if (failure || isCancelled())
            (*stream)->cancel();
        // Joins the transfer and returns its connection to the pool.
        stream->reset();

        if (isCancelled())
        {
            log::debug("Request to '{}' cancelled", provider->name());
            return cancelledError();
        }

        if (!failure)
        {
            auto const total = elapsedSince(start);
            provider->stats().recordSuccess(firstToken.value_or(total), total);
            log::info("'{}' answered in {} ms (first token {} ms, {} attempt(s))",
                      provider->name(),
                      total.count(),
                      firstToken.value_or(total).count(),
                      attempts);
            return OrchestrationResult {
                .text = std::move(text),
                .provider = provider->name(),
                .firstTokenLatency = firstToken.value_or(total),
                .totalLatency = elapsedSince(runStart),
                .attempts = attempts,
            };
        }

        if (!handleFailure(*provider, *failure))
            return std::unexpected(*failure);
        if (delivered)
        {
            log::warning("Discarding partial response from '{}' ({} chars)", provider->name(), text.size());
            if (callbacks.onFallback)
                callbacks.onFallback(provider->name(), *failure);
        }
        lastError = std::move(failure);
    }

    if (isCancelled())
        return cancelledError();
    return exhausted(std::move(lastError), attempts);
}

auto StreamingOrchestrator::complete(const AiRequest& request, std::stop_token stopToken)
    -> Result<OrchestrationResult>
{
    auto const runStart = Clock::now();
    auto lastError = std::optional<Error> {};
    auto attempts = std::size_t { 0 };

    for (auto* provider: attemptOrder(request))
    {
        if (stopToken.stop_requested())
            return makeError(ErrorCode::Cancelled, "AI request cancelled");
        if (isProviderDisabled(provider->name()))
            continue;

        ++attempts;
        auto const start = Clock::now();
        auto result = provider->issueRequest(request, stopToken);

        if (stopToken.stop_requested())
            return makeError(ErrorCode::Cancelled, "AI request cancelled");

        if (result)
        {
            auto const total = elapsedSince(start);
            provider->stats().recordSuccess(total, total);
            return OrchestrationResult {
                .text = std::move(*result),
                .provider = provider->name(),
                .firstTokenLatency = total,
                .totalLatency = elapsedSince(runStart),
                .attempts = attempts,
            };
        }

        if (!handleFailure(*provider, result.error()))
            return std::unexpected(result.error());
        lastError = result.error();
    }

    return exhausted(std::move(lastError), attempts);
}

auto StreamingOrchestrator::resetProvider(std::string_view name) -> bool
{
    if (!provider(name))
        return false;
    auto lock = std::lock_guard(_disabledMutex);
    _disabled.erase(std::string(name));
    log::info("Provider '{}' re-enabled", name);
    return true;
}

auto StreamingOrchestrator::isProviderDisabled(std::string_view name) const -> bool
{
    auto lock = std::lock_guard(_disabledMutex);
    return _disabled.contains(std::string(name));
}

auto StreamingOrchestrator::providerNames() const -> std::vector<std::string>
{
    auto names = std::vector<std::string> {};
    names.reserve(_providers.size());
    for (auto const& p: _providers)
        names.push_back(p->name());
    return names;
}

auto StreamingOrchestrator::provider(std::string_view name) const -> ProviderClient*
{
    auto const it = std::ranges::find_if(_providers, [&](auto const& p) { return p->name() == name; });
    return it != _providers.end() ? it->get() : nullptr;
}

} // namespace vocatype
