#include <gtest/gtest.h>

#include <beacon/tools/completion_slot.h>

#include <future>
#include <optional>
#include <stdexcept>
#include <thread>

using beacon::ErrorCode;
using beacon::Result;
using beacon::tools::CompletionSlot;
using beacon::tools::json;

TEST(CompletionSlotTest, FirstResolutionWins) {
    std::optional<Result<json>> got;
    int calls = 0;
    CompletionSlot slot([&](Result<json> r) {
        ++calls;
        got.emplace(std::move(r));
    });

    EXPECT_FALSE(slot.resolved());
    EXPECT_TRUE(slot.resolve(json{{"n", 1}}));
    EXPECT_TRUE(slot.resolved());
    EXPECT_FALSE(slot.resolve(json{{"n", 2}}));
    EXPECT_FALSE(slot.reject("late"));

    EXPECT_EQ(calls, 1);
    ASSERT_TRUE(got.has_value());
    ASSERT_TRUE(got->has_value());
    EXPECT_EQ(got->value()["n"], 1);
}

TEST(CompletionSlotTest, CopiesShareState) {
    int calls = 0;
    CompletionSlot slot([&](Result<json>) { ++calls; });
    CompletionSlot copy = slot;
    EXPECT_TRUE(copy.reject("boom"));
    EXPECT_TRUE(slot.resolved());
    EXPECT_FALSE(slot.resolve(json(1)));
    EXPECT_EQ(calls, 1);
}

TEST(CompletionSlotTest, RejectWithExceptionPointerCarriesMessage) {
    std::optional<Result<json>> got;
    CompletionSlot slot([&](Result<json> r) { got.emplace(std::move(r)); });
    slot.reject(std::make_exception_ptr(std::runtime_error("disk on fire")));

    ASSERT_TRUE(got.has_value());
    ASSERT_FALSE(got->has_value());
    EXPECT_EQ(got->error().message, "disk on fire");
}

TEST(CompletionSlotTest, DroppingUnresolvedSlotReportsNotImplemented) {
    std::optional<Result<json>> got;
    {
        CompletionSlot slot([&](Result<json> r) { got.emplace(std::move(r)); });
        CompletionSlot copy = slot;
        (void)copy;
    }
    ASSERT_TRUE(got.has_value());
    ASSERT_FALSE(got->has_value());
    EXPECT_EQ(got->error().code, ErrorCode::NotImplemented);
}

TEST(CompletionSlotTest, DroppingResolvedSlotDoesNotFireAgain) {
    int calls = 0;
    {
        CompletionSlot slot([&](Result<json>) { ++calls; });
        slot.resolve(nullptr);
    }
    EXPECT_EQ(calls, 1);
}

TEST(CompletionSlotTest, ResolvesFromAnotherThread) {
    std::promise<Result<json>> promise;
    auto future = promise.get_future();
    CompletionSlot slot([&](Result<json> r) { promise.set_value(std::move(r)); });

    std::thread worker([slot]() mutable { slot.resolve(json("from worker")); });
    worker.join();

    auto r = future.get();
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), "from worker");
}
