#include <beacon/tools/dispatcher.h>
#include <beacon/tools/envelope.h>

#include <spdlog/spdlog.h>
#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/execution/outstanding_work.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/prefer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <future>

namespace beacon::tools {

Dispatcher::Dispatcher(const ToolCatalog& catalog) : catalog_(catalog) {}

Result<json> Dispatcher::prepareArguments(const ToolDescriptor& descriptor,
                                          const json& arguments) {
    json prepared = arguments.is_null() ? json::object() : arguments;
    if (!prepared.is_object()) {
        return Error{ErrorCode::InvalidArgument,
                     "Arguments for tool '" + descriptor.name + "' must be a JSON object"};
    }

    for (const auto& param : descriptor.parameters) {
        auto it = prepared.find(param.name);
        if (it == prepared.end() || it->is_null()) {
            if (param.required) {
                return Error{ErrorCode::InvalidArgument,
                             "Missing required parameter '" + param.name + "'"};
            }
            if (param.defaultValue) {
                prepared[param.name] = *param.defaultValue;
            }
            continue;
        }
        if (!param.accepts(*it)) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("Parameter '{}' must be of type {}, got {}", param.name,
                                     kindToString(param.kind), it->type_name())};
        }
    }
    return prepared;
}

json Dispatcher::toEnvelope(Result<json> result) {
    if (!result) {
        return errorEnvelope(result.error());
    }
    json value = std::move(result).value();
    if (isEnvelope(value)) {
        return value;
    }
    return makeSuccess(std::move(value));
}

json Dispatcher::runSync(const ToolDescriptor& descriptor, const json& arguments) const {
    if (!descriptor.handler) {
        return makeError(error_type::kImplementationError,
                         "Tool '" + descriptor.name + "' has no synchronous handler");
    }
    try {
        return toEnvelope(descriptor.handler(arguments));
    } catch (const std::exception& e) {
        return makeError(error_type::kExecutionError, e.what());
    } catch (...) {
        return makeError(error_type::kExecutionError,
                         "Tool '" + descriptor.name + "' threw a non-standard exception");
    }
}

void Dispatcher::startAsync(const ToolDescriptor& descriptor, const json& arguments,
                            CompletionSlot slot) const {
    if (!descriptor.asyncHandler) {
        slot.reject(Error{ErrorCode::NotImplemented,
                          "Tool '" + descriptor.name + "' has no asynchronous handler"});
        return;
    }
    try {
        descriptor.asyncHandler(arguments, slot);
    } catch (...) {
        // A handler that already completed its slot keeps that result
        slot.reject(std::current_exception());
    }
}

void Dispatcher::logOutcome(std::string_view name, const json& response,
                            std::chrono::steady_clock::time_point start) const {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - start)
                        .count();
    if (isErrorEnvelope(response)) {
        spdlog::warn("[Dispatcher] Tool '{}' failed after {}ms: {} ({})", name, ms,
                     response["error"]["message"].get<std::string>(), errorTypeOf(response));
    } else {
        spdlog::debug("[Dispatcher] Tool '{}' completed in {}ms", name, ms);
    }
}

json Dispatcher::execute(std::string_view name, const json& arguments) const {
    const auto start = std::chrono::steady_clock::now();
    spdlog::debug("[Dispatcher] Executing tool '{}'", name);

    auto descriptor = catalog_.resolve(name);
    if (!descriptor) {
        auto response = makeError(error_type::kUnknownTool, "Unknown tool: " + std::string(name));
        logOutcome(name, response, start);
        return response;
    }

    json response;
    auto prepared = prepareArguments(*descriptor, arguments);
    if (!prepared) {
        response = errorEnvelope(prepared.error());
    } else if (!descriptor->asynchronous) {
        response = runSync(*descriptor, prepared.value());
    } else {
        auto promise = std::make_shared<std::promise<Result<json>>>();
        auto future = promise->get_future();
        startAsync(*descriptor, prepared.value(),
                   CompletionSlot([promise](Result<json> r) { promise->set_value(std::move(r)); }));
        response = toEnvelope(future.get());
    }

    logOutcome(name, response, start);
    return response;
}

template <typename CompletionToken>
auto Dispatcher::asyncRun(std::shared_ptr<const ToolDescriptor> descriptor, json arguments,
                          CompletionToken&& token) const {
    auto initiation = [this, descriptor = std::move(descriptor),
                       arguments = std::move(arguments)](auto handler) mutable {
        // Keep the loop alive while the slot is outstanding
        auto work = boost::asio::prefer(boost::asio::get_associated_executor(handler),
                                        boost::asio::execution::outstanding_work.tracked);
        auto shared = std::make_shared<decltype(handler)>(std::move(handler));
        CompletionSlot slot([shared, work](Result<json> r) {
            boost::asio::post(work,
                              [shared, r = std::move(r)]() mutable { (*shared)(std::move(r)); });
        });
        startAsync(*descriptor, arguments, std::move(slot));
    };
    return boost::asio::async_initiate<CompletionToken, void(Result<json>)>(std::move(initiation),
                                                                            token);
}

boost::asio::awaitable<json> Dispatcher::callTool(std::string name, json arguments) const {
    const auto start = std::chrono::steady_clock::now();
    spdlog::debug("[Dispatcher] Calling tool '{}'", name);

    auto descriptor = catalog_.resolve(name);
    if (!descriptor) {
        auto response = makeError(error_type::kUnknownTool, "Unknown tool: " + name);
        logOutcome(name, response, start);
        co_return response;
    }

    json response;
    auto prepared = prepareArguments(*descriptor, arguments);
    if (!prepared) {
        response = errorEnvelope(prepared.error());
    } else if (!descriptor->asynchronous) {
        response = runSync(*descriptor, prepared.value());
    } else {
        auto result =
            co_await asyncRun(descriptor, std::move(prepared).value(), boost::asio::use_awaitable);
        response = toEnvelope(std::move(result));
    }

    logOutcome(name, response, start);
    co_return response;
}

} // namespace beacon::tools
