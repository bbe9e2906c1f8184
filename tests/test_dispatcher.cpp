#include "nvrpc/runtime/dispatcher.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace nvrpc::runtime;

namespace
{

class DispatcherTest : public ::testing::Test
{
protected:
    Dispatcher make_dispatcher()
    {
        return Dispatcher{std::make_shared<InlineExecutor>(), [this](const Frame& frame) -> Result<void> {
                              responses.push_back(std::get<Response>(frame));
                              return {};
                          }};
    }

    std::vector<Response> responses;
};

}  // namespace

TEST_F(DispatcherTest, RequestHandlerResultBecomesResponse)
{
    auto dispatcher = make_dispatcher();
    ASSERT_TRUE(dispatcher.on_request("add", [](const Array& params) -> Result<Value> {
        return Value{*params.at(0).as_int64() + *params.at(1).as_int64()};
    }));

    dispatcher.handle(Request{9, "add", {Value{2}, Value{3}}});

    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0].id, 9u);
    EXPECT_TRUE(responses[0].error.is_nil());
    EXPECT_EQ(responses[0].result, Value{5});
}

TEST_F(DispatcherTest, HandlerErrorBecomesErrorString)
{
    auto dispatcher = make_dispatcher();
    ASSERT_TRUE(dispatcher.on_request("ping", [](const Array&) -> Result<Value> {
        return unexpected_result<Value>(ErrorCode::HandlerError, "boom");
    }));
    ASSERT_TRUE(dispatcher.on_request("throws", [](const Array&) -> Result<Value> {
        throw std::runtime_error("kaboom");
    }));

    dispatcher.handle(Request{4, "ping", {}});
    dispatcher.handle(Request{5, "throws", {}});

    ASSERT_EQ(responses.size(), 2u);
    EXPECT_EQ(responses[0].id, 4u);
    EXPECT_EQ(responses[0].error, Value{"boom"});
    EXPECT_TRUE(responses[0].result.is_nil());
    EXPECT_EQ(responses[1].id, 5u);
    EXPECT_EQ(responses[1].error, Value{"kaboom"});
}

TEST_F(DispatcherTest, NonStandardThrowBecomesErrorResponse)
{
    auto pool = std::make_shared<ThreadPoolExecutor>(1);
    std::mutex sent_mutex;
    std::vector<Response> sent;
    Dispatcher dispatcher{pool, [&](const Frame& frame) -> Result<void> {
                              std::lock_guard lock(sent_mutex);
                              sent.push_back(std::get<Response>(frame));
                              return {};
                          }};
    ASSERT_TRUE(dispatcher.on_request("ping", [](const Array&) -> Result<Value> { throw 42; }));
    ASSERT_TRUE(dispatcher.on_notify("quiet", [](const Array&) { throw 7; }));

    dispatcher.handle(Notification{"quiet", {}});
    dispatcher.handle(Request{1, "ping", {Value{1}, Value{2}}});
    pool->wait_idle();

    std::lock_guard lock(sent_mutex);
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].id, 1u);
    EXPECT_EQ(sent[0].error, Value{"unknown exception"});
    EXPECT_TRUE(sent[0].result.is_nil());
}

TEST_F(DispatcherTest, InlineNonStandardThrowBecomesErrorResponse)
{
    auto dispatcher = make_dispatcher();
    ASSERT_TRUE(dispatcher.on_request("ping", [](const Array&) -> Result<Value> { throw 42; }));

    dispatcher.handle(Request{3, "ping", {}});

    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0].error, Value{"unknown exception"});
}

TEST_F(DispatcherTest, ShutdownWaitsForRunningHandlers)
{
    auto pool = std::make_shared<ThreadPoolExecutor>(1);
    std::promise<void> started;
    std::promise<void> proceed;
    auto proceed_future = proceed.get_future().share();
    std::atomic<bool> finished{false};

    auto dispatcher = std::make_unique<Dispatcher>(pool, [](const Frame&) -> Result<void> { return {}; });
    ASSERT_TRUE(dispatcher->on_request("slow", [&](const Array&) -> Result<Value> {
        started.set_value();
        proceed_future.wait();
        finished.store(true);
        return Value{};
    }));
    ASSERT_TRUE(dispatcher->on_notify("late", [](const Array&) { FAIL() << "dispatched after shutdown"; }));

    dispatcher->handle(Request{1, "slow", {}});
    dispatcher->handle(Notification{"late", {}});
    started.get_future().wait();
    EXPECT_EQ(dispatcher->in_flight(), 2u);

    std::thread releaser([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        proceed.set_value();
    });
    dispatcher->shutdown();
    EXPECT_TRUE(finished.load());
    EXPECT_EQ(dispatcher->in_flight(), 0u);

    dispatcher->handle(Notification{"late", {}});
    dispatcher.reset();
    releaser.join();
    pool->stop();
}

TEST_F(DispatcherTest, NotificationHandlerReceivesParams)
{
    auto dispatcher = make_dispatcher();
    std::vector<Array> seen;
    ASSERT_TRUE(dispatcher.on_notify("nvim_buf_lines_event", [&](const Array& params) { seen.push_back(params); }));
    ASSERT_TRUE(dispatcher.on_notify("noisy", [](const Array&) { throw std::runtime_error("ignored"); }));

    dispatcher.handle(Notification{"nvim_buf_lines_event", {Value{1}}});
    dispatcher.handle(Notification{"noisy", {}});

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], Array{Value{1}});
    EXPECT_TRUE(responses.empty());
}

TEST_F(DispatcherTest, MissingHandlerIsIgnored)
{
    auto dispatcher = make_dispatcher();
    dispatcher.handle(Request{1, "unknown", {}});
    dispatcher.handle(Notification{"unknown", {}});
    EXPECT_TRUE(responses.empty());
    EXPECT_FALSE(dispatcher.has_handler("unknown"));
}

TEST_F(DispatcherTest, DuplicateRegistrationKeepsFirstHandler)
{
    auto dispatcher = make_dispatcher();
    ASSERT_TRUE(dispatcher.on_request("m", [](const Array&) -> Result<Value> { return Value{"first"}; }));

    auto again = dispatcher.on_request("m", [](const Array&) -> Result<Value> { return Value{"second"}; });
    ASSERT_FALSE(again);
    EXPECT_TRUE(again.error().is(ErrorCode::DuplicateHandler));

    auto as_notify = dispatcher.on_notify("m", [](const Array&) {});
    ASSERT_FALSE(as_notify);
    EXPECT_TRUE(as_notify.error().is(ErrorCode::DuplicateHandler));

    dispatcher.handle(Request{1, "m", {}});
    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0].result, Value{"first"});
}

TEST_F(DispatcherTest, HeldFramesReplayInOrder)
{
    auto dispatcher = make_dispatcher();
    std::vector<std::string> order;
    ASSERT_TRUE(dispatcher.on_notify("n", [&](const Array& params) {
        order.emplace_back(*params.at(0).as_string());
    }));
    ASSERT_TRUE(dispatcher.on_request("r", [&](const Array&) -> Result<Value> {
        order.emplace_back("request");
        return Value{};
    }));

    dispatcher.hold();
    dispatcher.handle(Notification{"n", {Value{"one"}}});
    dispatcher.handle(Request{1, "r", {}});
    dispatcher.handle(Notification{"n", {Value{"two"}}});
    EXPECT_TRUE(order.empty());

    dispatcher.release();
    EXPECT_EQ(order, (std::vector<std::string>{"one", "request", "two"}));
    ASSERT_EQ(responses.size(), 1u);

    dispatcher.handle(Notification{"n", {Value{"three"}}});
    EXPECT_EQ(order.back(), "three");
}
