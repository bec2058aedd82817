#pragma once

#include "pati/core/Dispatcher.hh"

#include <chrono>
#include <memory>

namespace pati {

/// Dispatcher that settles by itself once `delay` has elapsed, with the
/// configured value or, when constructed with an exception, as cancelled.
///
/// end() or cancel() before the deadline stops the timer and ends the
/// dispatcher without a value; only the timer can make it fail. Adopt one to
/// put a deadline on another dispatcher.
class TimeoutDispatcher : public Dispatcher {
public:
  using Duration = std::chrono::steady_clock::duration;

  /// Throws PatiException(InvalidArgument) for a negative delay.
  static std::shared_ptr<TimeoutDispatcher> create(async::Executor executor, Duration delay, Value result = {});
  /// Also throws PatiException(InvalidArgument) for a null `error`.
  static std::shared_ptr<TimeoutDispatcher> create(async::Executor executor, Duration delay, Error error);

  void end(Value value = {}) override;
  void cancel(Error error) override;

  /// True until the timer fires or is released by an early end/cancel.
  bool armed() const;

protected:
  TimeoutDispatcher(async::Executor executor, Duration delay, Value result);
  TimeoutDispatcher(async::Executor executor, Duration delay, Error error);

private:
  void start(Duration delay);
  void expire();
  void release();

  asio::steady_timer timer_;
  Value result_;
  Error failure_;
  bool armed_ = false;
  // Lets a completion that was already queued detect a destroyed dispatcher.
  std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace pati
