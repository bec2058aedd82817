#include "pati/core/Dispatcher.hh"
#include "pati/core/Log.hh"
#include "pati/utils/ErrorHandling.hh"

#include <asio/error.hpp>
#include <asio/system_error.hpp>

#include <utility>

namespace pati {

std::string dispatcherStateToString(DispatcherState state) {
    switch (state) {
        case DispatcherState::Pending:
            return "Pending";
        case DispatcherState::Ended:
            return "Ended";
        case DispatcherState::Cancelled:
            return "Cancelled";
        default:
            return "Unknown";
    }
}

namespace {

// Holds the race dispatcher for as long as the caller awaits it.
asio::awaitable<Dispatcher::Value> awaitRace(std::shared_ptr<Dispatcher> race) {
    co_return co_await race->finish();
}

} // anonymous namespace

std::shared_ptr<Dispatcher> Dispatcher::create(async::Executor executor, Cleanup cleanup) {
    return std::shared_ptr<Dispatcher>(new Dispatcher(std::move(executor), std::move(cleanup)));
}

Dispatcher::Dispatcher(async::Executor executor, Cleanup cleanup)
    : executor_(std::move(executor)),
      cleanup_(std::move(cleanup)),
      signal_(executor_, asio::steady_timer::time_point::max()) {}

void Dispatcher::end(Value value) {
    settle(DispatcherState::Ended, std::move(value), nullptr);
}

void Dispatcher::cancel(Error error) {
    if (!error) {
        error = std::make_exception_ptr(PatiException("Dispatcher cancelled", ErrorCode::Cancelled));
    }
    settle(DispatcherState::Cancelled, {}, std::move(error));
}

asio::awaitable<Dispatcher::Value> Dispatcher::finish() {
    auto self = shared_from_this();

    while (state_ == DispatcherState::Pending) {
        auto [ec] = co_await signal_.async_wait(async::use_nothrow);
        if (state_ == DispatcherState::Pending) {
            // The awaiting coroutine was cancelled, not the dispatcher.
            throw asio::system_error(ec ? ec : asio::error::operation_aborted);
        }
    }

    if (state_ == DispatcherState::Cancelled) {
        std::rethrow_exception(error_);
    }
    co_return value_;
}

std::shared_ptr<Dispatcher> Dispatcher::chain(asio::awaitable<Value> future) {
    if (!future.valid()) {
        throwError(ErrorCode::InvalidArgument, "chain() requires a valid awaitable");
    }

    auto self = shared_from_this();
    asio::co_spawn(executor_, std::move(future), [self](std::exception_ptr error, Value value) {
        if (error) {
            self->cancel(std::move(error));
        } else {
            self->end(std::move(value));
        }
    });
    return self;
}

std::shared_ptr<Dispatcher> Dispatcher::chain(asio::awaitable<void> future) {
    if (!future.valid()) {
        throwError(ErrorCode::InvalidArgument, "chain() requires a valid awaitable");
    }

    auto self = shared_from_this();
    asio::co_spawn(executor_, std::move(future), [self](std::exception_ptr error) {
        if (error) {
            self->cancel(std::move(error));
        } else {
            self->end();
        }
    });
    return self;
}

asio::awaitable<Dispatcher::Value> Dispatcher::shortCircuit(asio::awaitable<Value> future) {
    if (!future.valid()) {
        throwError(ErrorCode::InvalidArgument, "shortCircuit() requires a valid awaitable");
    }

    auto race = create(executor_);
    race->chain(std::move(future));

    std::weak_ptr<Dispatcher> weakRace = race;
    auto id = onSettled([weakRace](Dispatcher& source) {
        if (source.state_ != DispatcherState::Cancelled) {
            return;
        }
        if (auto target = weakRace.lock()) {
            target->cancel(source.error_);
        }
    });

    // Once the race is decided the observer has nothing left to cancel.
    if (id != 0) {
        race->onSettled([weakSelf = weak_from_this(), id](Dispatcher&) {
            if (auto self = weakSelf.lock()) {
                self->removeObserver(id);
            }
        });
    }

    return awaitRace(std::move(race));
}

std::shared_ptr<Dispatcher> Dispatcher::adopt(const std::shared_ptr<Dispatcher>& other) {
    if (!other) {
        throwError(ErrorCode::InvalidArgument, "adopt() requires a dispatcher");
    }
    if (other.get() == this) {
        throwError(ErrorCode::InvalidArgument, "A dispatcher cannot adopt itself");
    }

    auto self = shared_from_this();
    other->onSettled([weakSelf = std::weak_ptr<Dispatcher>(self)](Dispatcher& source) {
        if (auto target = weakSelf.lock()) {
            replay(source, *target);
        }
    });
    onSettled([other](Dispatcher& source) { replay(source, *other); });
    return self;
}

DispatcherState Dispatcher::getState() const {
    return state_;
}

bool Dispatcher::isSettled() const {
    return state_ != DispatcherState::Pending;
}

const async::Executor& Dispatcher::getExecutor() const {
    return executor_;
}

bool Dispatcher::settle(DispatcherState state, Value value, Error error) {
    if (state_ != DispatcherState::Pending) {
        PATI_LOG_DEBUG("Dispatcher: discarding {} request, already {}", dispatcherStateToString(state),
                       dispatcherStateToString(state_));
        return false;
    }

    state_ = state;
    value_ = std::move(value);
    error_ = std::move(error);
    if (state_ == DispatcherState::Cancelled) {
        PATI_LOG_DEBUG("Dispatcher: Pending -> Cancelled ({})", describeError(error_));
    } else {
        PATI_LOG_DEBUG("Dispatcher: Pending -> Ended");
    }

    runCleanup();
    signal_.cancel();

    auto observers = std::exchange(observers_, {});
    for (const auto& [id, observer] : observers) {
        observer(*this);
    }
    return true;
}

Dispatcher::ObserverId Dispatcher::onSettled(Observer observer) {
    if (isSettled()) {
        observer(*this);
        return 0;
    }
    auto id = nextObserverId_++;
    observers_.emplace(id, std::move(observer));
    return id;
}

void Dispatcher::removeObserver(ObserverId id) {
    observers_.erase(id);
}

size_t Dispatcher::observerCount() const {
    return observers_.size();
}

void Dispatcher::replay(const Dispatcher& source, Dispatcher& target) {
    if (source.state_ == DispatcherState::Ended) {
        target.end(source.value_);
    } else {
        target.cancel(source.error_);
    }
}

void Dispatcher::runCleanup() {
    auto cleanup = std::exchange(cleanup_, nullptr);
    if (!cleanup) {
        return;
    }

    try {
        cleanup();
    } catch (const std::exception& e) {
        PATI_LOG_ERROR("Exception in dispatcher cleanup: {}", e.what());
    } catch (...) {
        PATI_LOG_ERROR("Unknown exception in dispatcher cleanup");
    }
}

} // namespace pati
