#include "pati/core/TimeoutDispatcher.hh"
#include "pati/core/Log.hh"
#include "pati/utils/ErrorHandling.hh"

#include <asio/error.hpp>

#include <utility>

namespace pati {

std::shared_ptr<TimeoutDispatcher> TimeoutDispatcher::create(async::Executor executor, Duration delay, Value result) {
    return std::shared_ptr<TimeoutDispatcher>(new TimeoutDispatcher(std::move(executor), delay, std::move(result)));
}

std::shared_ptr<TimeoutDispatcher> TimeoutDispatcher::create(async::Executor executor, Duration delay, Error error) {
    return std::shared_ptr<TimeoutDispatcher>(new TimeoutDispatcher(std::move(executor), delay, std::move(error)));
}

TimeoutDispatcher::TimeoutDispatcher(async::Executor executor, Duration delay, Value result)
    : Dispatcher(std::move(executor), [this] { release(); }),
      timer_(async::makeTimer(getExecutor())),
      result_(std::move(result)) {
    start(delay);
}

TimeoutDispatcher::TimeoutDispatcher(async::Executor executor, Duration delay, Error error)
    : Dispatcher(std::move(executor), [this] { release(); }),
      timer_(async::makeTimer(getExecutor())),
      failure_(std::move(error)) {
    if (!failure_) {
        throwError(ErrorCode::InvalidArgument, "TimeoutDispatcher error result cannot be null");
    }
    start(delay);
}

void TimeoutDispatcher::end(Value) {
    Dispatcher::end();
}

void TimeoutDispatcher::cancel(Error) {
    // Stopping a timeout early is a normal termination.
    Dispatcher::end();
}

bool TimeoutDispatcher::armed() const {
    return armed_;
}

void TimeoutDispatcher::start(Duration delay) {
    if (delay < Duration::zero()) {
        throwError(ErrorCode::InvalidArgument, "TimeoutDispatcher delay cannot be negative");
    }

    timer_.expires_after(delay);
    armed_ = true;
    timer_.async_wait([this, alive = std::weak_ptr<bool>(alive_)](const asio::error_code& ec) {
        if (ec == asio::error::operation_aborted || alive.expired()) {
            return;
        }
        expire();
    });
}

void TimeoutDispatcher::expire() {
    if (!armed_) {
        return;
    }
    armed_ = false;

    if (failure_) {
        PATI_LOG_DEBUG("TimeoutDispatcher: expired, cancelling ({})", describeError(failure_));
        Dispatcher::cancel(failure_);
    } else {
        PATI_LOG_DEBUG("TimeoutDispatcher: expired, ending");
        Dispatcher::end(result_);
    }
}

void TimeoutDispatcher::release() {
    if (!armed_) {
        return;
    }
    armed_ = false;
    timer_.cancel();
    PATI_LOG_DEBUG("TimeoutDispatcher: timer released before expiry");
}

} // namespace pati
