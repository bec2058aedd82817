#include "pati/core/Dispatcher.hh"
#include "pati/utils/ErrorHandling.hh"
#include "support/Testing.hh"
#include <asio/post.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

using namespace pati;
using namespace std::chrono_literals;

namespace {

asio::awaitable<Dispatcher::Value> delayedValue(std::chrono::milliseconds delay, std::string value) {
    co_await async::sleep(delay);
    co_return Dispatcher::Value(std::move(value));
}

asio::awaitable<Dispatcher::Value> delayedFailure(std::chrono::milliseconds delay, std::string message) {
    co_await async::sleep(delay);
    throw std::runtime_error(message);
}

asio::awaitable<void> delayedVoid(std::chrono::milliseconds delay) {
    co_await async::sleep(delay);
}

std::exception_ptr makeError(const std::string& message) {
    return std::make_exception_ptr(std::runtime_error(message));
}

std::string errorMessage(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    }
    return {};
}

// Exposes the number of pending settle continuations.
class ObservedDispatcher : public Dispatcher {
  public:
    static std::shared_ptr<ObservedDispatcher> create(async::Executor executor) {
        return std::shared_ptr<ObservedDispatcher>(new ObservedDispatcher(std::move(executor)));
    }

    using Dispatcher::observerCount;

  protected:
    using Dispatcher::Dispatcher;
};

static_assert(!std::is_constructible_v<Dispatcher, async::Executor>, "dispatchers are built through create()");

} // namespace

class DispatcherTest : public ::testing::Test {
  protected:
    std::shared_ptr<Dispatcher> makeDispatcher(Dispatcher::Cleanup cleanup = {}) {
        return Dispatcher::create(io.get_executor(), std::move(cleanup));
    }

    Dispatcher::Value finish(const std::shared_ptr<Dispatcher>& dispatcher) {
        return Testing::runAwaitable(io, dispatcher->finish());
    }

    std::exception_ptr finishError(const std::shared_ptr<Dispatcher>& dispatcher) {
        try {
            finish(dispatcher);
        } catch (...) {
            return std::current_exception();
        }
        return nullptr;
    }

    asio::io_context io;
};

TEST_F(DispatcherTest, StartsPending) {
    auto dispatcher = makeDispatcher();
    EXPECT_EQ(dispatcher->getState(), DispatcherState::Pending);
    EXPECT_FALSE(dispatcher->isSettled());
}

TEST_F(DispatcherTest, EndSettlesWithValue) {
    auto dispatcher = makeDispatcher();
    dispatcher->end(std::string("done"));

    EXPECT_EQ(dispatcher->getState(), DispatcherState::Ended);
    EXPECT_EQ(std::any_cast<std::string>(finish(dispatcher)), "done");
}

TEST_F(DispatcherTest, EndWithoutValue) {
    auto dispatcher = makeDispatcher();
    dispatcher->end();
    EXPECT_FALSE(finish(dispatcher).has_value());
}

TEST_F(DispatcherTest, CancelSettlesWithError) {
    auto dispatcher = makeDispatcher();
    dispatcher->cancel(makeError("boom"));

    EXPECT_EQ(dispatcher->getState(), DispatcherState::Cancelled);
    auto error = finishError(dispatcher);
    ASSERT_TRUE(error);
    EXPECT_EQ(errorMessage(error), "boom");
}

TEST_F(DispatcherTest, CancelWithoutErrorUsesCancelledCode) {
    auto dispatcher = makeDispatcher();
    dispatcher->cancel(nullptr);

    try {
        finish(dispatcher);
        FAIL() << "Expected PatiException";
    } catch (const PatiException& e) {
        EXPECT_EQ(e.code(), ErrorCode::Cancelled);
    }
}

TEST_F(DispatcherTest, FirstEndWins) {
    auto dispatcher = makeDispatcher();
    dispatcher->end(1);
    EXPECT_NO_THROW(dispatcher->cancel(makeError("late")));
    EXPECT_NO_THROW(dispatcher->end(2));

    EXPECT_EQ(dispatcher->getState(), DispatcherState::Ended);
    EXPECT_EQ(std::any_cast<int>(finish(dispatcher)), 1);
}

TEST_F(DispatcherTest, FirstCancelWins) {
    auto dispatcher = makeDispatcher();
    dispatcher->cancel(makeError("first"));
    dispatcher->end(2);
    dispatcher->cancel(makeError("second"));

    EXPECT_EQ(errorMessage(finishError(dispatcher)), "first");
}

TEST_F(DispatcherTest, CleanupRunsOnceOnEnd) {
    int cleanups = 0;
    auto dispatcher = makeDispatcher([&cleanups] { ++cleanups; });

    EXPECT_EQ(cleanups, 0);
    dispatcher->end();
    dispatcher->end();
    dispatcher->cancel(makeError("late"));
    EXPECT_EQ(cleanups, 1);
}

TEST_F(DispatcherTest, CleanupRunsOnceOnCancel) {
    int cleanups = 0;
    auto dispatcher = makeDispatcher([&cleanups] { ++cleanups; });

    dispatcher->cancel(makeError("boom"));
    dispatcher->end();
    EXPECT_EQ(cleanups, 1);
}

TEST_F(DispatcherTest, CleanupFailureKeepsOutcome) {
    auto dispatcher = makeDispatcher([] { throw std::runtime_error("cleanup failed"); });

    EXPECT_NO_THROW(dispatcher->end(std::string("kept")));
    EXPECT_EQ(std::any_cast<std::string>(finish(dispatcher)), "kept");
}

TEST_F(DispatcherTest, ConsecutiveFinishCalls) {
    auto dispatcher = makeDispatcher();
    dispatcher->end(5);

    EXPECT_EQ(std::any_cast<int>(finish(dispatcher)), 5);
    EXPECT_EQ(std::any_cast<int>(finish(dispatcher)), 5);
}

TEST_F(DispatcherTest, ConsecutiveFinishCallsWithRejection) {
    auto dispatcher = makeDispatcher();
    dispatcher->cancel(makeError("rejected"));

    EXPECT_EQ(errorMessage(finishError(dispatcher)), "rejected");
    EXPECT_EQ(errorMessage(finishError(dispatcher)), "rejected");
}

TEST_F(DispatcherTest, SimultaneousFinishCallsObserveSameValue) {
    auto dispatcher = makeDispatcher();
    auto results = std::make_shared<std::vector<int>>();

    for (int i = 0; i < 3; ++i) {
        asio::co_spawn(
            io,
            [dispatcher, results]() -> asio::awaitable<void> {
                auto value = co_await dispatcher->finish();
                results->push_back(std::any_cast<int>(value));
            },
            asio::detached);
    }
    asio::post(io, [dispatcher] { dispatcher->end(7); });
    Testing::drain(io);

    ASSERT_EQ(results->size(), 3u);
    for (int value : *results) {
        EXPECT_EQ(value, 7);
    }
}

TEST_F(DispatcherTest, SimultaneousFinishCallsObserveSameError) {
    auto dispatcher = makeDispatcher();
    auto messages = std::make_shared<std::vector<std::string>>();

    for (int i = 0; i < 2; ++i) {
        asio::co_spawn(
            io,
            [dispatcher, messages]() -> asio::awaitable<void> {
                try {
                    co_await dispatcher->finish();
                } catch (const std::runtime_error& e) {
                    messages->push_back(e.what());
                }
            },
            asio::detached);
    }
    asio::post(io, [dispatcher] { dispatcher->cancel(makeError("rejected")); });
    Testing::drain(io);

    ASSERT_EQ(messages->size(), 2u);
    EXPECT_EQ((*messages)[0], "rejected");
    EXPECT_EQ((*messages)[1], "rejected");
}

TEST_F(DispatcherTest, ChainEndsWithFutureValue) {
    auto dispatcher = makeDispatcher();
    auto returned = dispatcher->chain(delayedValue(2ms, "chained"));

    EXPECT_EQ(returned, dispatcher);
    EXPECT_EQ(std::any_cast<std::string>(finish(dispatcher)), "chained");
}

TEST_F(DispatcherTest, ChainCancelsWithFutureFailure) {
    auto dispatcher = makeDispatcher();
    dispatcher->chain(delayedFailure(2ms, "chain failed"));

    EXPECT_EQ(errorMessage(finishError(dispatcher)), "chain failed");
    EXPECT_EQ(dispatcher->getState(), DispatcherState::Cancelled);
}

TEST_F(DispatcherTest, ChainVoidFutureEndsWithoutValue) {
    auto dispatcher = makeDispatcher();
    dispatcher->chain(delayedVoid(1ms));

    EXPECT_FALSE(finish(dispatcher).has_value());
}

TEST_F(DispatcherTest, ChainAfterSettlementIsIgnored) {
    auto dispatcher = makeDispatcher();
    dispatcher->end(std::string("first"));
    dispatcher->chain(delayedFailure(1ms, "late"));
    Testing::drain(io);

    EXPECT_EQ(std::any_cast<std::string>(finish(dispatcher)), "first");
}

TEST_F(DispatcherTest, ChainRejectsInvalidAwaitable) {
    auto dispatcher = makeDispatcher();
    try {
        dispatcher->chain(asio::awaitable<Dispatcher::Value>());
        FAIL() << "Expected PatiException";
    } catch (const PatiException& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidArgument);
    }
    EXPECT_FALSE(dispatcher->isSettled());
}

TEST_F(DispatcherTest, ShortCircuitSettlesLikeFuture) {
    auto dispatcher = makeDispatcher();
    auto value = Testing::runAwaitable(io, dispatcher->shortCircuit(delayedValue(2ms, "raced")));

    EXPECT_EQ(std::any_cast<std::string>(value), "raced");
    EXPECT_FALSE(dispatcher->isSettled());
}

TEST_F(DispatcherTest, ShortCircuitPropagatesFutureFailure) {
    auto dispatcher = makeDispatcher();
    EXPECT_THROW(Testing::runAwaitable(io, dispatcher->shortCircuit(delayedFailure(1ms, "nope"))),
                 std::runtime_error);
    EXPECT_FALSE(dispatcher->isSettled());
}

TEST_F(DispatcherTest, ShortCircuitFailsEarlyOnCancel) {
    auto dispatcher = makeDispatcher();
    asio::co_spawn(
        io,
        [dispatcher]() -> asio::awaitable<void> {
            co_await async::sleep(5ms);
            dispatcher->cancel(makeError("aborted"));
        },
        asio::detached);

    const auto start = Testing::Clock::now();
    try {
        Testing::runAwaitable(io, dispatcher->shortCircuit(delayedValue(300ms, "too late")));
        FAIL() << "Expected cancellation";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "aborted");
    }
    EXPECT_LT(Testing::elapsedSince(start), 250ms);

    Testing::drain(io);
}

TEST_F(DispatcherTest, ShortCircuitOnCancelledDispatcherFailsImmediately) {
    auto dispatcher = makeDispatcher();
    dispatcher->cancel(makeError("already"));

    EXPECT_THROW(Testing::runAwaitable(io, dispatcher->shortCircuit(delayedValue(100ms, "unused"))),
                 std::runtime_error);
    Testing::drain(io);
}

TEST_F(DispatcherTest, ShortCircuitIgnoresEnd) {
    auto dispatcher = makeDispatcher();
    dispatcher->end();

    auto value = Testing::runAwaitable(io, dispatcher->shortCircuit(delayedValue(2ms, "still raced")));
    EXPECT_EQ(std::any_cast<std::string>(value), "still raced");
}

TEST_F(DispatcherTest, ShortCircuitRejectsInvalidAwaitable) {
    auto dispatcher = makeDispatcher();
    EXPECT_THROW(dispatcher->shortCircuit(asio::awaitable<Dispatcher::Value>()), PatiException);
}

TEST_F(DispatcherTest, ShortCircuitTracksOnlyUndecidedRaces) {
    auto dispatcher = ObservedDispatcher::create(io.get_executor());
    auto first = dispatcher->shortCircuit(delayedValue(1ms, "a"));
    auto second = dispatcher->shortCircuit(delayedValue(2ms, "b"));
    EXPECT_EQ(dispatcher->observerCount(), 2u);

    EXPECT_EQ(std::any_cast<std::string>(Testing::runAwaitable(io, std::move(first))), "a");
    EXPECT_EQ(std::any_cast<std::string>(Testing::runAwaitable(io, std::move(second))), "b");
    EXPECT_EQ(dispatcher->observerCount(), 0u);
}

TEST_F(DispatcherTest, RepeatedShortCircuitsDoNotAccumulateObservers) {
    auto dispatcher = ObservedDispatcher::create(io.get_executor());

    for (int i = 0; i < 100; ++i) {
        Testing::runAwaitable(io, dispatcher->shortCircuit(delayedValue(0ms, "lap")));
        ASSERT_EQ(dispatcher->observerCount(), 0u);
    }

    dispatcher->cancel(makeError("late"));
    EXPECT_EQ(dispatcher->getState(), DispatcherState::Cancelled);
}

TEST_F(DispatcherTest, FailedRaceReleasesItsObserver) {
    auto dispatcher = ObservedDispatcher::create(io.get_executor());

    EXPECT_THROW(Testing::runAwaitable(io, dispatcher->shortCircuit(delayedFailure(0ms, "nope"))), std::runtime_error);
    EXPECT_EQ(dispatcher->observerCount(), 0u);
}

TEST_F(DispatcherTest, AdoptPropagatesOtherEnd) {
    auto dispatcher = makeDispatcher();
    auto other = makeDispatcher();

    EXPECT_EQ(dispatcher->adopt(other), dispatcher);
    other->end(std::string("from other"));

    EXPECT_EQ(std::any_cast<std::string>(finish(dispatcher)), "from other");
}

TEST_F(DispatcherTest, AdoptPropagatesOtherCancel) {
    auto dispatcher = makeDispatcher();
    auto other = makeDispatcher();

    dispatcher->adopt(other);
    other->cancel(makeError("other failed"));

    EXPECT_EQ(errorMessage(finishError(dispatcher)), "other failed");
}

TEST_F(DispatcherTest, AdoptPropagatesToOther) {
    auto dispatcher = makeDispatcher();
    auto other = makeDispatcher();

    dispatcher->adopt(other);
    dispatcher->cancel(makeError("self failed"));

    EXPECT_EQ(other->getState(), DispatcherState::Cancelled);
    EXPECT_EQ(errorMessage(finishError(other)), "self failed");
}

TEST_F(DispatcherTest, AdoptFirstSettlementWinsForBoth) {
    auto dispatcher = makeDispatcher();
    auto other = makeDispatcher();

    dispatcher->adopt(other);
    dispatcher->end(1);
    other->cancel(makeError("late"));

    EXPECT_EQ(std::any_cast<int>(finish(dispatcher)), 1);
    EXPECT_EQ(std::any_cast<int>(finish(other)), 1);
}

TEST_F(DispatcherTest, AdoptSettledDispatcher) {
    auto dispatcher = makeDispatcher();
    auto other = makeDispatcher();
    other->end(3);

    dispatcher->adopt(other);

    EXPECT_EQ(dispatcher->getState(), DispatcherState::Ended);
    EXPECT_EQ(std::any_cast<int>(finish(dispatcher)), 3);
}

TEST_F(DispatcherTest, AdoptRejectsInvalidArguments) {
    auto dispatcher = makeDispatcher();
    EXPECT_THROW(dispatcher->adopt(nullptr), PatiException);
    EXPECT_THROW(dispatcher->adopt(dispatcher), PatiException);
}

TEST_F(DispatcherTest, AdoptKeepsAdoptedDispatcherAlive) {
    auto dispatcher = makeDispatcher();
    std::weak_ptr<Dispatcher> weakOther;
    {
        auto other = makeDispatcher();
        weakOther = other;
        dispatcher->adopt(other);
    }
    EXPECT_FALSE(weakOther.expired());

    dispatcher->end(4);
    EXPECT_TRUE(weakOther.expired());
}

TEST_F(DispatcherTest, AdoptedDoesNotKeepAdopterAlive) {
    auto other = makeDispatcher();
    std::weak_ptr<Dispatcher> weakDispatcher;
    {
        auto dispatcher = makeDispatcher();
        weakDispatcher = dispatcher;
        dispatcher->adopt(other);
    }
    EXPECT_TRUE(weakDispatcher.expired());
    EXPECT_NO_THROW(other->end());
}

TEST_F(DispatcherTest, StateToString) {
    EXPECT_EQ(dispatcherStateToString(DispatcherState::Pending), "Pending");
    EXPECT_EQ(dispatcherStateToString(DispatcherState::Ended), "Ended");
    EXPECT_EQ(dispatcherStateToString(DispatcherState::Cancelled), "Cancelled");
}
