#pragma once

#include <beacon/core/types.h>

#include <nlohmann/json.hpp>

#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace beacon::tools {

using json = nlohmann::json;

/**
 * @class CompletionSlot
 * @brief Single-assignment completion handle given to asynchronous tool handlers.
 *
 * Copies share one state. The first resolve()/reject() wins and later calls return
 * false. If every copy is destroyed before the slot completes, the waiter receives
 * ErrorCode::NotImplemented so that a handler which forgets to complete is reported
 * instead of hanging. A handler that keeps a copy alive without completing it makes
 * the waiter wait forever; there is no timeout here.
 *
 * resolve() and reject() may be called from any thread.
 */
class CompletionSlot {
public:
    using Callback = std::function<void(Result<json>)>;

    explicit CompletionSlot(Callback onComplete);

    bool resolve(json value);
    bool reject(Error error);
    bool reject(const std::string& message);
    bool reject(std::exception_ptr ep);

    bool resolved() const;

private:
    struct State {
        explicit State(Callback cb) : callback(std::move(cb)) {}
        ~State();

        bool complete(Result<json> result);

        std::mutex mutex;
        bool done{false};
        Callback callback;
    };

    std::shared_ptr<State> state_;
};

} // namespace beacon::tools
