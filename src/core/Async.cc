#include "pati/core/Async.hh"

namespace pati::async {

asio::steady_timer makeTimer(const Executor& executor) {
  return asio::steady_timer(executor);
}

asio::steady_timer makeTimer(const Executor& executor, std::chrono::steady_clock::duration duration) {
  return asio::steady_timer(executor, duration);
}

asio::awaitable<void> sleep(std::chrono::steady_clock::duration duration) {
  auto timer = makeTimer(co_await asio::this_coro::executor, duration);
  co_await timer.async_wait(asio::use_awaitable);
}

} // namespace pati::async
