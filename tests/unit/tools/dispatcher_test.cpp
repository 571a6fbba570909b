#include <gtest/gtest.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_future.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

#include <beacon/tools/dispatcher.h>
#include <beacon/tools/envelope.h>
#include <beacon/tools/tool_catalog.h>

namespace {

using beacon::Error;
using beacon::ErrorCode;
using beacon::Result;
using beacon::tools::CompletionSlot;
using beacon::tools::Dispatcher;
using beacon::tools::errorTypeOf;
using beacon::tools::json;
using beacon::tools::ParameterKind;
using beacon::tools::ToolCatalog;
using beacon::tools::ToolDescriptor;
using beacon::tools::ToolParameter;
using beacon::tools::ToolWrapper;

struct EchoRequest {
    using RequestType = EchoRequest;

    std::string text;

    static EchoRequest fromJson(const json& j) {
        EchoRequest req;
        req.text = j.value("text", "");
        return req;
    }

    json toJson() const { return json{{"text", text}}; }
};

struct EchoResponse {
    using ResponseType = EchoResponse;

    std::string echoed;

    static EchoResponse fromJson(const json& j) {
        EchoResponse resp;
        resp.echoed = j.value("echoed", "");
        return resp;
    }

    json toJson() const { return json{{"echoed", echoed}}; }
};

ToolDescriptor syncTool(std::string name, beacon::tools::SyncHandler handler) {
    ToolDescriptor d;
    d.name = std::move(name);
    d.handler = std::move(handler);
    return d;
}

ToolDescriptor asyncTool(std::string name, beacon::tools::AsyncHandler handler) {
    ToolDescriptor d;
    d.name = std::move(name);
    d.asynchronous = true;
    d.asyncHandler = std::move(handler);
    return d;
}

// Drives callTool on a private loop; the work guard covers completions from other threads
json runCall(const Dispatcher& dispatcher, std::string name, json args) {
    boost::asio::io_context io;
    auto guard = boost::asio::make_work_guard(io);
    std::thread runner([&io] { io.run(); });
    auto future = boost::asio::co_spawn(io, dispatcher.callTool(std::move(name), std::move(args)),
                                        boost::asio::use_future);
    auto result = future.get();
    guard.reset();
    runner.join();
    return result;
}

} // namespace

class DispatcherTest : public ::testing::Test {
protected:
    ToolCatalog catalog_;
    Dispatcher dispatcher_{catalog_};
};

TEST_F(DispatcherTest, UnknownToolYieldsUnknownToolError) {
    auto r = dispatcher_.execute("nope", json::object());
    ASSERT_TRUE(r.contains("error"));
    EXPECT_EQ(r["error"]["type"], "unknown_tool");
    EXPECT_EQ(r["error"]["message"], "Unknown tool: nope");
}

TEST_F(DispatcherTest, SyncSuccessIsWrapped) {
    ASSERT_TRUE(catalog_.registerTool(syncTool("add", [](const json& a) {
        return json{{"sum", a["x"].get<int>() + a["y"].get<int>()}};
    })));
    auto r = dispatcher_.execute("add", json{{"x", 2}, {"y", 3}});
    EXPECT_EQ(r, (json{{"success", true}, {"result", {{"sum", 5}}}}));
}

TEST_F(DispatcherTest, SyncNullResultIsSuccess) {
    ASSERT_TRUE(catalog_.registerTool(syncTool("noop", [](const json&) { return json(); })));
    auto r = dispatcher_.execute("noop", json::object());
    EXPECT_EQ(r["success"], true);
    EXPECT_TRUE(r["result"].is_null());
}

TEST_F(DispatcherTest, SyncThrowBecomesExecutionError) {
    ASSERT_TRUE(catalog_.registerTool(
        syncTool("boom", [](const json&) -> json { throw std::runtime_error("kaboom"); })));
    auto r = dispatcher_.execute("boom", json::object());
    EXPECT_EQ(errorTypeOf(r), "execution_error");
    EXPECT_EQ(r["error"]["message"], "kaboom");
}

TEST_F(DispatcherTest, EnvelopeShapedResultPassesThrough) {
    ASSERT_TRUE(catalog_.registerTool(syncTool("custom", [](const json&) {
        return beacon::tools::makeError("execution_error", "handled inside");
    })));
    ASSERT_TRUE(catalog_.registerTool(syncTool("already", [](const json&) {
        return beacon::tools::makeSuccess(json{{"x", 1}});
    })));

    auto err = dispatcher_.execute("custom", json::object());
    EXPECT_EQ(err, beacon::tools::makeError("execution_error", "handled inside"));
    auto ok = dispatcher_.execute("already", json::object());
    EXPECT_EQ(ok, beacon::tools::makeSuccess(json{{"x", 1}}));
}

TEST_F(DispatcherTest, ResultsWithEnvelopeKeysAreStillWrapped) {
    const json counted{{"success", false}, {"count", 3}};
    const json diskFull{{"error", "disk full"}, {"code", 5}};
    ASSERT_TRUE(
        catalog_.registerTool(syncTool("counted", [counted](const json&) { return counted; })));
    ASSERT_TRUE(
        catalog_.registerTool(syncTool("disk", [diskFull](const json&) { return diskFull; })));
    ASSERT_TRUE(catalog_.registerTool(asyncTool(
        "disk_async", [diskFull](const json&, CompletionSlot slot) { slot.resolve(diskFull); })));

    EXPECT_EQ(dispatcher_.execute("counted", json::object()),
              (json{{"success", true}, {"result", counted}}));
    EXPECT_EQ(dispatcher_.execute("disk", json::object()),
              (json{{"success", true}, {"result", diskFull}}));
    EXPECT_EQ(dispatcher_.execute("disk_async", json::object()),
              (json{{"success", true}, {"result", diskFull}}));
}

TEST_F(DispatcherTest, MissingSyncHandlerIsImplementationError) {
    ToolDescriptor d;
    d.name = "hollow";
    ASSERT_TRUE(catalog_.registerTool(std::move(d)));
    EXPECT_EQ(errorTypeOf(dispatcher_.execute("hollow", json::object())), "implementation_error");
}

TEST_F(DispatcherTest, MissingAsyncHandlerIsImplementationError) {
    ToolDescriptor d;
    d.name = "hollow_async";
    d.asynchronous = true;
    ASSERT_TRUE(catalog_.registerTool(std::move(d)));
    EXPECT_EQ(errorTypeOf(dispatcher_.execute("hollow_async", json::object())),
              "implementation_error");
}

TEST_F(DispatcherTest, MissingRequiredArgumentSkipsHandler) {
    std::atomic<int> calls{0};
    auto d = syncTool("need", [&](const json&) {
        ++calls;
        return json("ran");
    });
    d.parameters = {ToolParameter{"id", "", ParameterKind::String, true, std::nullopt}};
    ASSERT_TRUE(catalog_.registerTool(std::move(d)));

    auto missing = dispatcher_.execute("need", json::object());
    EXPECT_EQ(errorTypeOf(missing), "invalid_argument");
    auto nulled = dispatcher_.execute("need", json{{"id", nullptr}});
    EXPECT_EQ(errorTypeOf(nulled), "invalid_argument");
    EXPECT_EQ(calls.load(), 0);

    auto ok = dispatcher_.execute("need", json{{"id", "x"}});
    EXPECT_EQ(ok["result"], "ran");
    EXPECT_EQ(calls.load(), 1);
}

TEST_F(DispatcherTest, WrongKindIsInvalidArgument) {
    auto d = syncTool("typed", [](const json&) { return json(true); });
    d.parameters = {ToolParameter{"count", "", ParameterKind::Number, false, std::nullopt},
                    ToolParameter{"flag", "", ParameterKind::Boolean, false, std::nullopt},
                    ToolParameter{"items", "", ParameterKind::Array, false, std::nullopt}};
    ASSERT_TRUE(catalog_.registerTool(std::move(d)));

    EXPECT_EQ(errorTypeOf(dispatcher_.execute("typed", json{{"count", "three"}})),
              "invalid_argument");
    EXPECT_EQ(errorTypeOf(dispatcher_.execute("typed", json{{"flag", 1}})), "invalid_argument");
    EXPECT_EQ(errorTypeOf(dispatcher_.execute("typed", json{{"items", json::object()}})),
              "invalid_argument");
    auto ok = dispatcher_.execute("typed", json{{"count", 2.5}, {"items", json::array()}});
    EXPECT_EQ(ok["success"], true);
}

TEST_F(DispatcherTest, NonObjectArgumentsAreRejectedButNullIsEmpty) {
    ASSERT_TRUE(catalog_.registerTool(syncTool("echo", [](const json& a) { return a; })));
    EXPECT_EQ(errorTypeOf(dispatcher_.execute("echo", json::array({1, 2}))), "invalid_argument");
    EXPECT_EQ(errorTypeOf(dispatcher_.execute("echo", json("str"))), "invalid_argument");

    auto r = dispatcher_.execute("echo", nullptr);
    EXPECT_EQ(r["success"], true);
    EXPECT_EQ(r["result"], json::object());
}

TEST_F(DispatcherTest, DefaultsAreFilledBeforeHandler) {
    json seen;
    auto d = syncTool("defaults", [&](const json& a) {
        seen = a;
        return json();
    });
    d.parameters = {ToolParameter{"message", "", ParameterKind::String, false, json("pong")},
                    ToolParameter{"limit", "", ParameterKind::Number, false, json(10)},
                    ToolParameter{"free", "", ParameterKind::String, false, std::nullopt}};
    ASSERT_TRUE(catalog_.registerTool(std::move(d)));

    dispatcher_.execute("defaults", json{{"limit", 3}, {"extra", "kept"}});
    EXPECT_EQ(seen["message"], "pong");
    EXPECT_EQ(seen["limit"], 3);
    EXPECT_EQ(seen["extra"], "kept");
    EXPECT_FALSE(seen.contains("free"));
}

TEST_F(DispatcherTest, TypedWrapperMapsErrorsToEnvelopes) {
    auto d = syncTool("echo", ToolWrapper<EchoRequest, EchoResponse>(
                                  [](const EchoRequest& req) -> Result<EchoResponse> {
                                      if (req.text.empty()) {
                                          return Error{ErrorCode::InvalidArgument, "empty text"};
                                      }
                                      return EchoResponse{req.text + "!"};
                                  }));
    ASSERT_TRUE(catalog_.registerTool(std::move(d)));

    auto ok = dispatcher_.execute("echo", json{{"text", "hi"}});
    EXPECT_EQ(ok["result"]["echoed"], "hi!");

    auto bad = dispatcher_.execute("echo", json::object());
    EXPECT_EQ(errorTypeOf(bad), "invalid_argument");
    EXPECT_EQ(bad["error"]["message"], "empty text");
}

TEST_F(DispatcherTest, AsyncResolvedFromWorkerThread) {
    boost::asio::thread_pool pool(2);
    auto handler = [&pool](const json& a, CompletionSlot slot) {
        boost::asio::post(pool, [slot, a]() mutable {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            slot.resolve(json{{"value", a.value("v", 0) * 2}});
        });
    };
    ASSERT_TRUE(catalog_.registerTool(asyncTool("later", handler)));

    auto r = dispatcher_.execute("later", json{{"v", 21}});
    EXPECT_EQ(r, (json{{"success", true}, {"result", {{"value", 42}}}}));
    pool.join();
}

TEST_F(DispatcherTest, AsyncRejectIsExecutionError) {
    ASSERT_TRUE(catalog_.registerTool(asyncTool(
        "fail", [](const json&, CompletionSlot slot) { slot.reject("remote side refused"); })));
    auto r = dispatcher_.execute("fail", json::object());
    EXPECT_EQ(errorTypeOf(r), "execution_error");
    EXPECT_EQ(r["error"]["message"], "remote side refused");
}

TEST_F(DispatcherTest, AsyncDroppedSlotIsImplementationError) {
    ASSERT_TRUE(
        catalog_.registerTool(asyncTool("forgetful", [](const json&, CompletionSlot) {})));
    auto r = dispatcher_.execute("forgetful", json::object());
    EXPECT_EQ(errorTypeOf(r), "implementation_error");
}

TEST_F(DispatcherTest, AsyncHandlerThrowBeforeResolvingIsExecutionError) {
    ASSERT_TRUE(catalog_.registerTool(asyncTool("throws", [](const json&, CompletionSlot) {
        throw std::runtime_error("setup failed");
    })));
    auto r = dispatcher_.execute("throws", json::object());
    EXPECT_EQ(errorTypeOf(r), "execution_error");
    EXPECT_EQ(r["error"]["message"], "setup failed");
}

TEST_F(DispatcherTest, AsyncResolveThenThrowKeepsResult) {
    ASSERT_TRUE(catalog_.registerTool(asyncTool("eager", [](const json&, CompletionSlot slot) {
        slot.resolve(json("done"));
        throw std::runtime_error("ignored");
    })));
    auto r = dispatcher_.execute("eager", json::object());
    EXPECT_EQ(r["success"], true);
    EXPECT_EQ(r["result"], "done");
}

TEST_F(DispatcherTest, CallToolSync) {
    ASSERT_TRUE(catalog_.registerTool(syncTool("echo", [](const json& a) { return a; })));
    auto r = runCall(dispatcher_, "echo", json{{"k", "v"}});
    EXPECT_EQ(r["result"]["k"], "v");
    EXPECT_EQ(errorTypeOf(runCall(dispatcher_, "missing", json::object())), "unknown_tool");
}

TEST_F(DispatcherTest, CallToolAwaitsWorkerCompletion) {
    boost::asio::thread_pool pool(1);
    auto handler = [&pool](const json&, CompletionSlot slot) {
        boost::asio::post(pool, [slot]() mutable {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            slot.resolve(json("finished"));
        });
    };
    ASSERT_TRUE(catalog_.registerTool(asyncTool("later", handler)));

    auto r = runCall(dispatcher_, "later", json::object());
    EXPECT_EQ(r["result"], "finished");
    pool.join();
}

TEST_F(DispatcherTest, CallToolSurfacesDroppedSlotAndRejection) {
    ASSERT_TRUE(
        catalog_.registerTool(asyncTool("forgetful", [](const json&, CompletionSlot) {})));
    ASSERT_TRUE(catalog_.registerTool(
        asyncTool("fail", [](const json&, CompletionSlot slot) { slot.reject("nope"); })));

    EXPECT_EQ(errorTypeOf(runCall(dispatcher_, "forgetful", json::object())),
              "implementation_error");
    EXPECT_EQ(errorTypeOf(runCall(dispatcher_, "fail", json::object())), "execution_error");
}

TEST_F(DispatcherTest, CallToolResolvedInlineOnLoopThread) {
    ASSERT_TRUE(catalog_.registerTool(
        asyncTool("inline", [](const json&, CompletionSlot slot) { slot.resolve(json(7)); })));

    // Single-threaded loop without a guard: the completion is posted back to it
    boost::asio::io_context io;
    auto future = boost::asio::co_spawn(io, dispatcher_.callTool("inline", json::object()),
                                        boost::asio::use_future);
    io.run();
    EXPECT_EQ(future.get()["result"], 7);
}
