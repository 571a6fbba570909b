#pragma once

#include <beacon/core/types.h>
#include <beacon/tools/completion_slot.h>
#include <beacon/tools/tool_catalog.h>
#include <beacon/tools/tool_descriptor.h>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace beacon::tools {

/**
 * @class Dispatcher
 * @brief Executes catalog entries by name and always answers with an envelope.
 *
 * Unknown names, argument mismatches, handler exceptions and handler contract violations
 * are converted into error envelopes; nothing escapes to the caller.
 *
 * execute() blocks the calling thread until an asynchronous handler completes its slot.
 * Code running on an io_context should use callTool() instead, since a handler that
 * completes through the same loop would otherwise never be serviced. Neither has a timeout.
 */
class Dispatcher {
public:
    explicit Dispatcher(const ToolCatalog& catalog);

    json execute(std::string_view name, const json& arguments) const;

    // Suspends the calling coroutine until the tool finishes, resuming on its executor
    boost::asio::awaitable<json> callTool(std::string name, json arguments) const;

    // Object check, required/kind validation and default filling
    static Result<json> prepareArguments(const ToolDescriptor& descriptor, const json& arguments);

    // Result -> envelope; envelope-shaped values are passed through
    static json toEnvelope(Result<json> result);

private:
    template <typename CompletionToken>
    auto asyncRun(std::shared_ptr<const ToolDescriptor> descriptor, json arguments,
                  CompletionToken&& token) const;

    json runSync(const ToolDescriptor& descriptor, const json& arguments) const;
    void startAsync(const ToolDescriptor& descriptor, const json& arguments,
                    CompletionSlot slot) const;
    void logOutcome(std::string_view name, const json& response,
                    std::chrono::steady_clock::time_point start) const;

    const ToolCatalog& catalog_;
};

} // namespace beacon::tools
