// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <format>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

namespace vocatype
{

/// @brief Limits and timeouts of a ConnectionPool.
struct ConnectionPoolConfig
{
    std::size_t maxConnections = 4;
    std::chrono::milliseconds idleTimeout { 90'000 };
    std::chrono::milliseconds acquireTimeout { 5'000 };
};

/// @brief Bounded pool of reusable connections with idle-timeout eviction.
///
/// Connections are created lazily by the factory and handed out as move-only leases that return
/// the connection to the pool when destroyed. A lease may outlive the pool object itself.
/// @tparam Connection The pooled resource type.
template <typename Connection>
class ConnectionPool
{
    using Clock = std::chrono::steady_clock;

    struct IdleEntry
    {
        std::unique_ptr<Connection> connection;
        Clock::time_point lastUsed;
    };

    struct State
    {
        std::string name;
        ConnectionPoolConfig config;
        std::mutex mutex;
        std::condition_variable_any available;
        std::vector<IdleEntry> idle;
        std::size_t active = 0;
        std::size_t created = 0;

        auto evictExpired(Clock::time_point now) -> std::size_t
        {
            auto const before = idle.size();
            std::erase_if(idle, [&](const IdleEntry& entry) { return now - entry.lastUsed >= config.idleTimeout; });
            return before - idle.size();
        }
    };

  public:
    using Factory = std::function<Result<std::unique_ptr<Connection>>()>;

    /// @brief Exclusive use of one pooled connection.
    class Lease
    {
      public:
        Lease() = default;

        Lease(std::shared_ptr<State> state, std::unique_ptr<Connection> connection):
            _state(std::move(state)), _connection(std::move(connection))
        {
        }

        Lease(Lease&& other) noexcept = default;

        Lease& operator=(Lease&& other) noexcept
        {
            if (this != &other)
            {
                release();
                _state = std::move(other._state);
                _connection = std::move(other._connection);
                _discarded = other._discarded;
            }
            return *this;
        }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        ~Lease() { release(); }

        [[nodiscard]] auto get() const -> Connection* { return _connection.get(); }
        auto operator->() const -> Connection* { return _connection.get(); }
        auto operator*() const -> Connection& { return *_connection; }
        explicit operator bool() const { return _connection != nullptr; }

        /// @brief Marks the connection as unusable; it is destroyed instead of returned to the pool.
        void discard() { _discarded = true; }

        /// @brief Returns the connection to the pool now.
        void release()
        {
            if (!_state)
                return;

            auto connection = std::move(_connection);
            {
                auto lock = std::lock_guard(_state->mutex);
                --_state->active;
                if (connection && !_discarded)
                    _state->idle.push_back(IdleEntry { .connection = std::move(connection), .lastUsed = Clock::now() });
            }
            _state->available.notify_one();
            _state.reset();
        }

      private:
        std::shared_ptr<State> _state;
        std::unique_ptr<Connection> _connection;
        bool _discarded = false;
    };

    ConnectionPool(std::string name, ConnectionPoolConfig config, Factory factory):
        _state(std::make_shared<State>()), _factory(std::move(factory))
    {
        _state->name = std::move(name);
        _state->config = config;
        if (_state->config.maxConnections == 0)
            _state->config.maxConnections = 1;
    }

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /// @brief Borrows a connection, reusing an idle one when possible.
    ///
    /// Blocks while all connections are leased, up to ConnectionPoolConfig::acquireTimeout.
    /// @return A lease, Timeout when the pool stays exhausted, Cancelled when @p stopToken fires,
    ///         or the factory's error.
    [[nodiscard]] auto acquire(std::stop_token stopToken = {}) -> Result<Lease>
    {
        auto const deadline = Clock::now() + _state->config.acquireTimeout;
        auto lock = std::unique_lock(_state->mutex);

        while (true)
        {
            _state->evictExpired(Clock::now());

            if (!_state->idle.empty())
            {
                auto connection = std::move(_state->idle.back().connection);
                _state->idle.pop_back();
                ++_state->active;
                return Lease(_state, std::move(connection));
            }

            if (_state->active < _state->config.maxConnections)
            {
                ++_state->active;
                lock.unlock();

                auto created = _factory();
                if (!created)
                {
                    {
                        auto relock = std::lock_guard(_state->mutex);
                        --_state->active;
                    }
                    _state->available.notify_one();
                    return std::unexpected(created.error());
                }

                {
                    auto relock = std::lock_guard(_state->mutex);
                    ++_state->created;
                }
                log::trace("Pool '{}': opened connection", _state->name);
                return Lease(_state, std::move(*created));
            }

            auto const ready = _state->available.wait_until(lock, stopToken, deadline, [&] {
                return !_state->idle.empty() || _state->active < _state->config.maxConnections;
            });
            if (stopToken.stop_requested())
                return makeError(ErrorCode::Cancelled, std::format("Pool '{}': acquire cancelled", _state->name));
            if (!ready)
                return makeError(ErrorCode::Timeout,
                                 std::format("Pool '{}': no connection available within {} ms",
                                             _state->name,
                                             _state->config.acquireTimeout.count()));
        }
    }

    /// @brief Drops idle connections that exceeded the idle timeout.
    /// @return Number of connections dropped.
    auto evictIdle() -> std::size_t
    {
        auto lock = std::lock_guard(_state->mutex);
        return _state->evictExpired(Clock::now());
    }

    [[nodiscard]] auto idleCount() const -> std::size_t
    {
        auto lock = std::lock_guard(_state->mutex);
        return _state->idle.size();
    }

    [[nodiscard]] auto activeCount() const -> std::size_t
    {
        auto lock = std::lock_guard(_state->mutex);
        return _state->active;
    }

    /// @brief Total connections created by the factory since construction.
    [[nodiscard]] auto createdCount() const -> std::size_t
    {
        auto lock = std::lock_guard(_state->mutex);
        return _state->created;
    }

    [[nodiscard]] auto config() const -> const ConnectionPoolConfig& { return _state->config; }

  private:
    std::shared_ptr<State> _state;
    Factory _factory;
};

} // namespace vocatype
