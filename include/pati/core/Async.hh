#pragma once

#include <asio/any_io_executor.hpp>
#include <asio/as_tuple.hpp>
#include <asio/awaitable.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>

#include <chrono>

namespace pati::async {

using Executor = asio::any_io_executor;

/// Create a steady_timer bound to `executor`.
asio::steady_timer makeTimer(const Executor& executor);
asio::steady_timer makeTimer(const Executor& executor, std::chrono::steady_clock::duration duration);

/// Suspend the calling coroutine for `duration` on its own executor.
/// Throws asio::system_error if the wait is cancelled.
asio::awaitable<void> sleep(std::chrono::steady_clock::duration duration);

/// Default completion token: returns tuple<error_code, T> instead of throwing.
inline const auto use_nothrow = asio::as_tuple(asio::use_awaitable);

} // namespace pati::async
