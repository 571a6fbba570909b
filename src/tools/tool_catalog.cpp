#include <beacon/tools/tool_catalog.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace beacon::tools {

Result<void> ToolCatalog::registerTool(std::shared_ptr<ToolDescriptor> descriptor) {
    if (!descriptor) {
        return Error{ErrorCode::InvalidArgument, "Tool descriptor is null"};
    }
    if (descriptor->name.empty()) {
        return Error{ErrorCode::InvalidArgument, "Tool name must not be empty"};
    }
    if (descriptor->asynchronous ? !descriptor->asyncHandler : !descriptor->handler) {
        spdlog::debug("[ToolCatalog] Tool '{}' registered without a {} handler", descriptor->name,
                      descriptor->asynchronous ? "async" : "sync");
    }

    std::string name = descriptor->name;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tools_.find(name);
    if (it != tools_.end()) {
        spdlog::warn("[ToolCatalog] Tool '{}' already registered, replacing", name);
        it->second = std::move(descriptor);
        return Result<void>();
    }
    tools_.emplace(name, std::move(descriptor));
    order_.push_back(std::move(name));
    return Result<void>();
}

Result<void> ToolCatalog::registerTool(ToolDescriptor descriptor) {
    return registerTool(std::make_shared<ToolDescriptor>(std::move(descriptor)));
}

bool ToolCatalog::unregisterTool(std::string_view name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tools_.find(std::string(name));
    if (it == tools_.end()) {
        return false;
    }
    tools_.erase(it);
    order_.erase(std::remove(order_.begin(), order_.end(), name), order_.end());
    return true;
}

std::shared_ptr<const ToolDescriptor> ToolCatalog::resolve(std::string_view name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = tools_.find(std::string(name)); it != tools_.end()) {
        return it->second;
    }
    return nullptr;
}

bool ToolCatalog::contains(std::string_view name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.find(std::string(name)) != tools_.end();
}

size_t ToolCatalog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.size();
}

std::vector<std::string> ToolCatalog::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_;
}

void ToolCatalog::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    tools_.clear();
    order_.clear();
}

json ToolCatalog::exportSchema() const {
    std::lock_guard<std::mutex> lock(mutex_);
    json tools = json::array();
    for (const auto& name : order_) {
        tools.push_back(tools_.at(name)->toJson());
    }
    return tools;
}

} // namespace beacon::tools
