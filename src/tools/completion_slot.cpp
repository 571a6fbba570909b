#include <beacon/tools/completion_slot.h>

#include <spdlog/spdlog.h>

namespace beacon::tools {

CompletionSlot::CompletionSlot(Callback onComplete)
    : state_(std::make_shared<State>(std::move(onComplete))) {}

CompletionSlot::State::~State() {
    if (done) {
        return;
    }
    spdlog::warn("[CompletionSlot] Slot released without a result");
    try {
        if (callback) {
            callback(Error{ErrorCode::NotImplemented,
                           "Asynchronous handler released its completion slot without a result"});
        }
    } catch (const std::exception& e) {
        spdlog::error("[CompletionSlot] Completion callback failed: {}", e.what());
    }
}

bool CompletionSlot::State::complete(Result<json> result) {
    Callback cb;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (done) {
            return false;
        }
        done = true;
        cb = std::move(callback);
    }
    if (cb) {
        cb(std::move(result));
    }
    return true;
}

bool CompletionSlot::resolve(json value) {
    return state_->complete(Result<json>(std::move(value)));
}

bool CompletionSlot::reject(Error error) {
    return state_->complete(Result<json>(std::move(error)));
}

bool CompletionSlot::reject(const std::string& message) {
    return reject(Error{ErrorCode::InternalError, message});
}

bool CompletionSlot::reject(std::exception_ptr ep) {
    try {
        if (ep) {
            std::rethrow_exception(ep);
        }
        return reject(std::string("unknown failure"));
    } catch (const std::exception& e) {
        return reject(std::string(e.what()));
    } catch (...) {
        return reject(std::string("non-standard exception"));
    }
}

bool CompletionSlot::resolved() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->done;
}

} // namespace beacon::tools
