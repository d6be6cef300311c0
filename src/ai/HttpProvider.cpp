// SPDX-License-Identifier: Apache-2.0
#include "HttpProvider.hpp"

#include <ai/TokenChannel.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <curl/curl.h>

#include <algorithm>
#include <format>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>

namespace vocatype
{

namespace
{

    constexpr auto MaxErrorBody = std::size_t { 16 * 1024 };
    constexpr auto UserAgent = "vocatype/0.1";

    // curl_global_init() is not thread-safe and must be balanced by curl_global_cleanup().
    auto curlGlobalMutex = std::mutex {};
    auto curlGlobalRefCount = 0;

    auto acquireCurlGlobal() -> bool
    {
        auto lock = std::lock_guard(curlGlobalMutex);
        if (curlGlobalRefCount == 0)
        {
            if (auto const rc = curl_global_init(CURL_GLOBAL_DEFAULT); rc != CURLE_OK)
            {
                log::error("curl_global_init failed: {}", curl_easy_strerror(rc));
                return false;
            }
        }
        ++curlGlobalRefCount;
        return true;
    }

    void releaseCurlGlobal()
    {
        auto lock = std::lock_guard(curlGlobalMutex);
        if (curlGlobalRefCount <= 0)
            return;
        if (--curlGlobalRefCount == 0)
            curl_global_cleanup();
    }

    struct CurlGlobalGuard
    {
        bool acquired = acquireCurlGlobal();

        CurlGlobalGuard() = default;
        CurlGlobalGuard(const CurlGlobalGuard&) = delete;
        CurlGlobalGuard& operator=(const CurlGlobalGuard&) = delete;

        ~CurlGlobalGuard()
        {
            if (acquired)
                releaseCurlGlobal();
        }
    };

    constexpr auto PollInterval = 1'000; // ms; curl shortens it to its own internal timers

    struct TransferState
    {
        CURL* handle = nullptr;
        std::function<VoidResult(std::string_view)> onData;
        long status = 0;
        std::string errorBody;
        std::optional<Error> dataError;

        [[nodiscard]] auto succeeded() const -> bool { return status >= 200 && status < 300; }
    };

    auto writeCallback(char* ptr, std::size_t size, std::size_t nmemb, void* userData) -> std::size_t
    {
        auto* state = static_cast<TransferState*>(userData);
        auto const bytes = size * nmemb;

        if (state->status == 0)
            curl_easy_getinfo(state->handle, CURLINFO_RESPONSE_CODE, &state->status);

        if (!state->succeeded())
        {
            if (state->errorBody.size() < MaxErrorBody)
                state->errorBody.append(ptr, std::min(bytes, MaxErrorBody - state->errorBody.size()));
            return bytes;
        }

        if (auto result = state->onData(std::string_view(ptr, bytes)); !result)
        {
            state->dataError = std::move(result.error());
            return 0;
        }
        return bytes;
    }

    auto mapCurlError(CURLcode code) -> Error
    {
        auto const message = std::string(curl_easy_strerror(code));
        if (code == CURLE_OPERATION_TIMEDOUT)
            return Error { .code = ErrorCode::Timeout, .message = message };
        if (code == CURLE_ABORTED_BY_CALLBACK)
            return Error { .code = ErrorCode::Cancelled, .message = message };
        return Error { .code = ErrorCode::NetworkError, .message = message };
    }

    /// One pooled connection slot: an easy handle driven through its own multi handle.
    ///
    /// The multi handle owns the keep-alive connection cache, so it lives as long as the slot.
    /// Waiting in curl_multi_poll() instead of curl_easy_perform() lets wakeup() end a stalled
    /// transfer immediately.
    struct CurlHandle
    {
        CURL* handle = nullptr;
        CURLM* multi = nullptr;

        CurlHandle(CURL* easy, CURLM* m): handle(easy), multi(m) {}
        CurlHandle(const CurlHandle&) = delete;
        CurlHandle& operator=(const CurlHandle&) = delete;

        ~CurlHandle()
        {
            if (multi)
                curl_multi_cleanup(multi);
            if (handle)
                curl_easy_cleanup(handle);
        }

        /// Interrupts a running perform(); callable from any thread.
        void wakeup() const { curl_multi_wakeup(multi); }

        /// Runs the configured transfer to completion or until @p stopToken is triggered.
        auto perform(const std::stop_token& stopToken) -> Result<CURLcode>
        {
            if (auto const mc = curl_multi_add_handle(multi, handle); mc != CURLM_OK)
                return makeError(ErrorCode::NetworkError, curl_multi_strerror(mc));

            auto result = Result<CURLcode> { CURLE_ABORTED_BY_CALLBACK };
            auto running = 1;
            while (!stopToken.stop_requested())
            {
                if (auto const mc = curl_multi_perform(multi, &running); mc != CURLM_OK)
                {
                    result = makeError(ErrorCode::NetworkError, curl_multi_strerror(mc));
                    break;
                }
                if (running == 0)
                {
                    result = CURLE_OK;
                    auto queued = 0;
                    while (auto const* message = curl_multi_info_read(multi, &queued))
                        if (message->msg == CURLMSG_DONE && message->easy_handle == handle)
                            result = message->data.result;
                    break;
                }
                if (auto const mc = curl_multi_poll(multi, nullptr, 0, PollInterval, nullptr); mc != CURLM_OK)
                {
                    result = makeError(ErrorCode::NetworkError, curl_multi_strerror(mc));
                    break;
                }
            }

            curl_multi_remove_handle(multi, handle);
            return result;
        }
    };

    /// Runs one POST on @p connection, feeding 2xx response bytes to @p onData.
    auto performTransfer(CurlHandle& connection,
                         const HttpRequest& request,
                         const HttpProviderConfig& config,
                         std::chrono::milliseconds timeout,
                         std::function<VoidResult(std::string_view)> onData,
                         const std::stop_token& stopToken) -> VoidResult
    {
        curl_slist* list = nullptr;
        for (auto const& header: request.headers)
        {
            auto* appended = curl_slist_append(list, header.c_str());
            if (!appended)
            {
                curl_slist_free_all(list);
                return makeError(ErrorCode::NetworkError, "Failed to build request headers");
            }
            list = appended;
        }
        auto headers = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>(list, &curl_slist_free_all);

        auto* handle = connection.handle;
        auto state = TransferState {
            .handle = handle,
            .onData = std::move(onData),
        };

        curl_easy_reset(handle);
        curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(handle, CURLOPT_POST, 1L);
        curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
        curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(handle, CURLOPT_USERAGENT, UserAgent);
        curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(handle, CURLOPT_WRITEDATA, &state);
        curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
        curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config.connectTimeout.count()));
        curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(handle, CURLOPT_TCP_KEEPALIVE, 1L);
        curl_easy_setopt(handle, CURLOPT_ACCEPT_ENCODING, "");

        auto const wake = std::stop_callback(stopToken, [&connection] { connection.wakeup(); });
        auto const rc = connection.perform(stopToken);

        if (stopToken.stop_requested())
            return makeError(ErrorCode::Cancelled, "Request cancelled");
        if (!rc)
            return std::unexpected(rc.error());
        if (state.dataError)
            return std::unexpected(std::move(*state.dataError));
        if (*rc != CURLE_OK)
            return std::unexpected(mapCurlError(*rc));

        if (state.status == 0)
            curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &state.status);
        if (!state.succeeded())
            return std::unexpected(httpStatusToError(state.status, state.errorBody));
        return {};
    }

    /// TokenStream backed by a transfer thread.
    class HttpTokenStream: public TokenStream
    {
      public:
        HttpTokenStream(std::shared_ptr<TokenChannel> channel, std::jthread worker):
            _channel(std::move(channel)), _worker(std::move(worker))
        {
        }

        ~HttpTokenStream() override
        {
            // request_stop() wakes the worker out of curl_multi_poll(); the jthread then joins.
            cancel();
        }

        auto next(std::chrono::milliseconds timeout) -> Result<std::optional<StreamToken>> override
        {
            return _channel->next(timeout);
        }

        void cancel() override
        {
            _channel->cancel();
            _worker.request_stop();
        }

      private:
        std::shared_ptr<TokenChannel> _channel;
        std::jthread _worker;
    };

} // namespace

auto extractApiErrorMessage(std::string_view body) -> std::string
{
    auto const truncated = [&] {
        auto text = std::string(body.substr(0, 200));
        std::ranges::replace(text, '\n', ' ');
        return text;
    };

    auto parsed = json::parse(body);
    if (!parsed || !parsed->is_object())
        return truncated();

    auto const it = parsed->find("error");
    if (it == parsed->end())
        return truncated();
    if (it->is_string())
        return it->get<std::string>();
    if (it->is_object())
    {
        if (auto message = json::getStringOr(*it, "message", ""); !message.empty())
            return message;
    }
    return truncated();
}

auto httpStatusToError(long status, std::string_view body) -> Error
{
    auto const message = std::format("HTTP {}: {}", status, extractApiErrorMessage(body));
    auto code = ErrorCode::ProtocolError;
    if (status == 401 || status == 403)
        code = ErrorCode::AuthError;
    else if (status == 429)
        code = ErrorCode::RateLimited;
    else if (status == 408 || status == 504)
        code = ErrorCode::Timeout;
    else if (status >= 500 && status < 600)
        code = ErrorCode::NetworkError;
    return Error { .code = code, .message = message };
}

struct HttpProvider::Impl
{
    CurlGlobalGuard curlGlobal;
    ConnectionPool<CurlHandle> pool;
    ProviderLatencyStats stats;

    explicit Impl(const HttpProviderConfig& config):
        pool(config.name,
             config.pool,
             [name = config.name]() -> Result<std::unique_ptr<CurlHandle>> {
                 auto* handle = curl_easy_init();
                 auto* multi = curl_multi_init();
                 auto connection = std::make_unique<CurlHandle>(handle, multi);
                 if (!handle || !multi)
                     return makeError(ErrorCode::NetworkError,
                                      std::format("{}: failed to create HTTP handle", name));
                 return connection;
             }),
        stats(std::chrono::milliseconds { 2'000 }, config.requestTimeout)
    {
    }
};

HttpProvider::HttpProvider(HttpProviderConfig config, std::shared_ptr<const PromptLibrary> prompts):
    _config(std::move(config)),
    _prompts(prompts ? std::move(prompts) : std::make_shared<const PromptLibrary>()),
    _impl(std::make_unique<Impl>(_config))
{
}

HttpProvider::~HttpProvider() = default;

auto HttpProvider::name() const -> const std::string&
{
    return _config.name;
}

auto HttpProvider::effectiveTimeout(const AiRequest& request) const -> std::chrono::milliseconds
{
    return std::min(request.timeLimit, _config.requestTimeout);
}

auto HttpProvider::issueRequest(const AiRequest& request, std::stop_token stopToken) -> Result<std::string>
{
    auto prompt = _prompts->render(request);
    if (!prompt)
        return std::unexpected(prompt.error());

    auto lease = _impl->pool.acquire(stopToken);
    if (!lease)
        return std::unexpected(lease.error());

    auto const httpRequest = buildRequest(request, *prompt, false);
    auto body = std::string {};
    auto const timeout = effectiveTimeout(request);

    log::debug("{}: request ({} chars, action {})", _config.name, request.text.size(), actionToString(request.action));
    auto result = performTransfer(
        **lease,
        httpRequest,
        _config,
        timeout,
        [&](std::string_view chunk) -> VoidResult {
            body.append(chunk);
            return {};
        },
        stopToken);

    if (!result)
    {
        if (result.error().code == ErrorCode::NetworkError)
            lease->discard();
        return std::unexpected(result.error());
    }
    lease->release();

    return parseResponse(body);
}

auto HttpProvider::issueStreamingRequest(const AiRequest& request) -> Result<std::unique_ptr<TokenStream>>
{
    auto prompt = _prompts->render(request);
    if (!prompt)
        return std::unexpected(prompt.error());

    auto acquired = _impl->pool.acquire();
    if (!acquired)
        return std::unexpected(acquired.error());

    auto channel = std::make_shared<TokenChannel>();
    auto worker = std::jthread(
        [this,
         channel,
         lease = std::move(*acquired),
         httpRequest = buildRequest(request, *prompt, true),
         timeout = effectiveTimeout(request)](std::stop_token stopToken) mutable {
            auto parser = SseParser {};
            auto finished = false;

            auto handleEvent = [&](const SseEvent& event) -> VoidResult {
                if (finished)
                    return {};
                auto delta = parseStreamEvent(event);
                if (!delta)
                    return std::unexpected(delta.error());
                if (!delta->text.empty())
                    channel->push(std::move(delta->text));
                finished = delta->done;
                return {};
            };

            auto result = performTransfer(
                *lease,
                httpRequest,
                _config,
                timeout,
                [&](std::string_view chunk) -> VoidResult {
                    for (auto const& event: parser.feed(chunk))
                        if (auto handled = handleEvent(event); !handled)
                            return handled;
                    return {};
                },
                stopToken);

            if (result)
            {
                if (auto tail = parser.finish())
                    result = handleEvent(*tail);
            }

            if (result)
            {
                channel->close();
                log::trace("{}: stream finished", _config.name);
            }
            else
            {
                if (result.error().code == ErrorCode::NetworkError)
                    lease.discard();
                log::debug("{}: stream failed: {}", _config.name, result.error());
                channel->fail(std::move(result.error()));
            }
        });

    return std::make_unique<HttpTokenStream>(std::move(channel), std::move(worker));
}

auto HttpProvider::stats() -> ProviderLatencyStats&
{
    return _impl->stats;
}

} // namespace vocatype
