#include "pati/core/EventDispatcher.hh"
#include "pati/core/Log.hh"
#include "pati/utils/ErrorHandling.hh"

#include <exception>
#include <utility>

namespace pati {

namespace {

// Owns a copy of the handler so that a coroutine lambda's captures outlive
// the listener that launched it.
asio::awaitable<void> runHandler(EventDispatcher::AsyncHandler handler, EventArgs args) {
    co_await handler(std::move(args));
}

} // anonymous namespace

std::shared_ptr<EventDispatcher> EventDispatcher::create(async::Executor executor,
                                                         std::shared_ptr<EventSource> source,
                                                         EventDispatcherOptions options) {
    return std::shared_ptr<EventDispatcher>(
        new EventDispatcher(std::move(executor), std::move(source), std::move(options)));
}

EventDispatcher::EventDispatcher(async::Executor executor, std::shared_ptr<EventSource> source,
                                 EventDispatcherOptions options)
    : Dispatcher(std::move(executor),
                 [this] {
                     removeListeners();
                     if (userCleanup_) {
                         userCleanup_();
                     }
                 }),
      source_(std::move(source)),
      userCleanup_(std::move(options.cleanup)),
      keepErrorListener_(options.keepErrorListener) {
    if (!source_) {
        throwError(ErrorCode::InvalidArgument, "EventDispatcher requires an event source");
    }

    // Stays registered past settlement, until the first finish() returns.
    errorSource_ = source_;
    errorListenerId_ = errorSource_->addListener(kErrorEvent, guarded([this](const EventArgs& args) {
        cancel(errorFromArgs(args));
    }));
}

EventDispatcher::~EventDispatcher() {
    try {
        removeListeners();
    } catch (const std::exception& e) {
        PATI_LOG_ERROR("EventDispatcher: failed to remove listeners on destruction: {}", e.what());
    } catch (...) {
        PATI_LOG_ERROR("EventDispatcher: unknown exception removing listeners on destruction");
    }

    try {
        removeErrorListener();
    } catch (const std::exception& e) {
        PATI_LOG_ERROR("EventDispatcher: failed to remove error listener on destruction: {}", e.what());
    } catch (...) {
        PATI_LOG_ERROR("EventDispatcher: unknown exception removing error listener on destruction");
    }
}

void EventDispatcher::on(const std::string& eventType, Handler handler) {
    if (eventType.empty()) {
        throwError(ErrorCode::InvalidArgument, "Event type cannot be empty");
    }
    if (!source_) {
        throwError(ErrorCode::InvalidState, "EventDispatcher no longer accepts listeners for '" + eventType + "'");
    }

    auto listener = wrapHandler(std::move(handler));
    auto listenerId = source_->addListener(eventType, std::move(listener));
    listeners_.push_back(Registration{eventType, std::move(listenerId)});
}

void EventDispatcher::end(Value result) {
    try {
        if (!pendingEnd_) {
            pendingEnd_ = std::move(result);
        }
        removeListeners();
        checkFinish();
    } catch (...) {
        cancel(std::current_exception());
    }
}

asio::awaitable<Dispatcher::Value> EventDispatcher::finish() {
    auto self = shared_from_this();

    Value value;
    try {
        value = co_await Dispatcher::finish();
    } catch (...) {
        if (isSettled() && !keepErrorListener_) {
            removeErrorListener();
        }
        throw;
    }

    if (!keepErrorListener_) {
        removeErrorListener();
    }
    co_return value;
}

size_t EventDispatcher::inFlight() const {
    return inFlight_;
}

bool EventDispatcher::listening() const {
    return source_ != nullptr;
}

void EventDispatcher::checkFinish() {
    if (!source_ && inFlight_ == 0 && pendingEnd_) {
        Dispatcher::end(*pendingEnd_);
    }
}

void EventDispatcher::removeListeners() {
    if (!source_) {
        return;
    }

    auto source = std::move(source_);
    auto listeners = std::exchange(listeners_, {});

    // Every listener captures this dispatcher, so keep going past a failure
    // and report the first one afterwards.
    std::exception_ptr failure;
    for (const auto& registration : listeners) {
        try {
            if (!source->removeListener(registration.eventType, registration.listenerId)) {
                PATI_LOG_WARN("EventDispatcher: listener '{}' for '{}' was already removed", registration.listenerId,
                              registration.eventType);
            }
        } catch (...) {
            if (!failure) {
                failure = std::current_exception();
            }
        }
    }

    PATI_LOG_DEBUG("EventDispatcher: removed {} listener(s)", listeners.size());
    if (failure) {
        std::rethrow_exception(failure);
    }
}

void EventDispatcher::removeErrorListener() {
    if (!errorSource_) {
        return;
    }

    auto source = std::move(errorSource_);
    if (!source->removeListener(kErrorEvent, errorListenerId_)) {
        PATI_LOG_WARN("EventDispatcher: error listener '{}' was already removed", errorListenerId_);
    }
}

EventListener EventDispatcher::wrapHandler(Handler handler) {
    if (const auto* action = std::get_if<Action>(&handler)) {
        if (*action == Action::Cancel) {
            return guarded([this](const EventArgs& args) { cancel(errorFromArgs(args)); });
        }
        return guarded([this](const EventArgs& args) { end(args.empty() ? Value() : args.front()); });
    }

    if (auto* syncHandler = std::get_if<SyncHandler>(&handler)) {
        if (!*syncHandler) {
            throwError(ErrorCode::InvalidArgument, "Event handler must be callable");
        }
        return guarded([this, fn = std::move(*syncHandler)](const EventArgs& args) { dispatchSync(fn, args); });
    }

    auto& asyncHandler = std::get<AsyncHandler>(handler);
    if (!asyncHandler) {
        throwError(ErrorCode::InvalidArgument, "Event handler must be callable");
    }
    return guarded([this, fn = std::move(asyncHandler)](const EventArgs& args) { dispatchAsync(fn, args); });
}

void EventDispatcher::dispatchSync(const SyncHandler& handler, const EventArgs& args) {
    ++inFlight_;
    try {
        handler(args);
    } catch (...) {
        cancel(std::current_exception());
    }
    handlerDone();
}

void EventDispatcher::dispatchAsync(const AsyncHandler& handler, const EventArgs& args) {
    ++inFlight_;
    auto self = std::static_pointer_cast<EventDispatcher>(shared_from_this());
    asio::co_spawn(getExecutor(), runHandler(handler, args), [self](std::exception_ptr error) {
        if (error) {
            self->cancel(std::move(error));
        }
        self->handlerDone();
    });
}

void EventDispatcher::handlerDone() {
    --inFlight_;
    try {
        checkFinish();
    } catch (...) {
        cancel(std::current_exception());
    }
}

} // namespace pati
