#pragma once

#include "pati/core/Async.hh"

#include <any>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace pati {

enum class DispatcherState {
  Pending,
  Ended,
  Cancelled
};

std::string dispatcherStateToString(DispatcherState state);

/// Single-outcome completion cell. The first end() or cancel() fixes the
/// outcome; every later call is ignored. All members must be used from the
/// dispatcher's executor.
///
/// Dispatchers are shared-owned: composition operators and in-flight work
/// keep a reference until they settle. Instances are only built through
/// create().
class Dispatcher : public std::enable_shared_from_this<Dispatcher> {
public:
  using Value = std::any;
  using Error = std::exception_ptr;
  using Cleanup = std::function<void()>;

  /// `cleanup` runs once, on the transition out of Pending.
  static std::shared_ptr<Dispatcher> create(async::Executor executor, Cleanup cleanup = {});
  virtual ~Dispatcher() = default;

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  virtual void end(Value value = {});

  /// A null `error` is replaced by PatiException(ErrorCode::Cancelled).
  virtual void cancel(Error error);

  /// Completes with the ended value, or rethrows the cancellation error.
  /// May be awaited any number of times, before or after settlement.
  virtual asio::awaitable<Value> finish();

  /// Ends with the result of `future`, or cancels with its exception.
  std::shared_ptr<Dispatcher> chain(asio::awaitable<Value> future);
  std::shared_ptr<Dispatcher> chain(asio::awaitable<void> future);

  /// Races `future` against this dispatcher's cancellation. `future` keeps
  /// running in the background when it loses.
  asio::awaitable<Value> shortCircuit(asio::awaitable<Value> future);

  /// Binds both outcomes together: whichever dispatcher settles first
  /// settles the other the same way. `other` is kept alive until this
  /// dispatcher settles; it holds no reference back.
  std::shared_ptr<Dispatcher> adopt(const std::shared_ptr<Dispatcher>& other);

  DispatcherState getState() const;
  bool isSettled() const;
  const async::Executor& getExecutor() const;

protected:
  using Observer = std::function<void(Dispatcher&)>;
  using ObserverId = uint64_t;

  explicit Dispatcher(async::Executor executor, Cleanup cleanup = {});

  /// Performs the transition. Returns false if already settled.
  bool settle(DispatcherState state, Value value, Error error);

  /// Registers a one-shot continuation for the transition. Runs immediately
  /// when the dispatcher is already settled, and then returns 0.
  ObserverId onSettled(Observer observer);

  /// Drops a continuation that is no longer needed. Unknown ids are ignored.
  void removeObserver(ObserverId id);

  size_t observerCount() const;

private:
  // Applies the settled outcome of `source` to `target`.
  static void replay(const Dispatcher& source, Dispatcher& target);

  void runCleanup();

  async::Executor executor_;
  Cleanup cleanup_;
  DispatcherState state_ = DispatcherState::Pending;
  Value value_;
  Error error_;
  // Keyed by registration order.
  std::map<ObserverId, Observer> observers_;
  ObserverId nextObserverId_ = 1;
  // Never expires; cancelled on settlement to wake suspended waiters.
  asio::steady_timer signal_;
};

} // namespace pati
