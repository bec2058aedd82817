#pragma once

#include "pati/core/Dispatcher.hh"
#include "pati/core/Event.hh"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace pati {

namespace detail {

template <typename T> struct IsAwaitable : std::false_type {};

template <typename T, typename Executor> struct IsAwaitable<asio::awaitable<T, Executor>> : std::true_type {};

} // namespace detail

struct EventDispatcherOptions {
  /// Runs once, after the listeners are removed and before finish() waiters
  /// are resumed.
  Dispatcher::Cleanup cleanup;

  /// Keep cancelling on "error" events after finish() returns. The listener
  /// is still removed when the dispatcher is destroyed.
  bool keepErrorListener = false;
};

/// Dispatcher driven by the events of an EventSource.
///
/// Handlers registered with on() are counted while they run. end() stops the
/// delivery of events at once, but only settles after every running handler
/// has returned. cancel() and handler failures settle immediately.
class EventDispatcher : public Dispatcher {
public:
  /// Built-in reactions that can be registered in place of a handler.
  enum class Action {
    End,   ///< end() with the first event argument
    Cancel ///< cancel() with the exception carried by the event
  };

  using SyncHandler = std::function<void(const EventArgs&)>;
  using AsyncHandler = std::function<asio::awaitable<void>(EventArgs)>;
  using Handler = std::variant<Action, SyncHandler, AsyncHandler>;

  /// Throws PatiException(InvalidArgument) if `source` is null.
  static std::shared_ptr<EventDispatcher> create(async::Executor executor, std::shared_ptr<EventSource> source,
                                                 EventDispatcherOptions options = {});
  ~EventDispatcher() override;

  /// Throws PatiException(InvalidArgument) for an empty event type or an
  /// empty callable, or once the listeners have been removed.
  void on(const std::string& eventType, Handler handler);

  void on(const std::string& eventType, Action action) {
    on(eventType, Handler(action));
  }

  /// Callables returning an asio::awaitable are awaited before the handler
  /// counts as finished. The awaited result is discarded.
  template <typename F>
    requires std::is_invocable_v<F&, EventArgs>
  void on(const std::string& eventType, F&& handler) {
    using Result = std::invoke_result_t<F&, EventArgs>;
    if constexpr (std::is_same_v<Result, asio::awaitable<void>>) {
      on(eventType, Handler(std::in_place_type<AsyncHandler>, std::forward<F>(handler)));
    } else if constexpr (detail::IsAwaitable<Result>::value) {
      on(eventType, Handler(std::in_place_type<AsyncHandler>,
                            [fn = std::forward<F>(handler)](EventArgs args) mutable -> asio::awaitable<void> {
                              co_await fn(std::move(args));
                            }));
    } else {
      on(eventType, Handler(std::in_place_type<SyncHandler>, std::forward<F>(handler)));
    }
  }

  /// Removes the listeners immediately. Settles with `result` once no
  /// handler is running.
  void end(Value result = {}) override;

  asio::awaitable<Value> finish() override;

  size_t inFlight() const;
  bool listening() const;

protected:
  EventDispatcher(async::Executor executor, std::shared_ptr<EventSource> source,
                  EventDispatcherOptions options = {});

  /// Settles with the pending end result when the dispatcher has stopped
  /// listening and no handler is running.
  virtual void checkFinish();

  void removeListeners();
  void removeErrorListener();

private:
  struct Registration {
    std::string eventType;
    std::string listenerId;
  };

  // Wraps `fn` so that it is skipped once this dispatcher is destroyed.
  template <typename Fn> EventListener guarded(Fn fn) {
    return [alive = std::weak_ptr<bool>(alive_), fn = std::move(fn)](const EventArgs& args) {
      if (!alive.expired()) {
        fn(args);
      }
    };
  }

  EventListener wrapHandler(Handler handler);
  void dispatchSync(const SyncHandler& handler, const EventArgs& args);
  void dispatchAsync(const AsyncHandler& handler, const EventArgs& args);
  void handlerDone();

  std::shared_ptr<EventSource> source_;
  std::vector<Registration> listeners_;
  size_t inFlight_ = 0;
  std::optional<Value> pendingEnd_;

  Dispatcher::Cleanup userCleanup_;
  bool keepErrorListener_;
  std::shared_ptr<EventSource> errorSource_;
  std::string errorListenerId_;
  // Expires with the dispatcher. Emitters deliver to a snapshot of their
  // listeners, which may outlive a dispatcher destroyed mid-emission.
  std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace pati
