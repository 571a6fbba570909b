#pragma once

#include <beacon/core/types.h>
#include <beacon/tools/tool_descriptor.h>

#include <nlohmann/json.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace beacon::tools {

/**
 * @class ToolCatalog
 * @brief Name-keyed set of tool descriptors, kept in registration order.
 *
 * Registering an existing name replaces the descriptor in place (its position is kept).
 * Resolved descriptors are shared, so a replacement does not invalidate a dispatch that
 * is already running against the old one.
 */
class ToolCatalog {
public:
    ToolCatalog() = default;
    ToolCatalog(const ToolCatalog&) = delete;
    ToolCatalog& operator=(const ToolCatalog&) = delete;

    Result<void> registerTool(std::shared_ptr<ToolDescriptor> descriptor);
    Result<void> registerTool(ToolDescriptor descriptor);

    bool unregisterTool(std::string_view name);

    std::shared_ptr<const ToolDescriptor> resolve(std::string_view name) const;
    bool contains(std::string_view name) const;
    size_t size() const;
    std::vector<std::string> names() const;
    void clear();

    // JSON array of descriptor schemas in catalog order
    json exportSchema() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<const ToolDescriptor>> tools_;
    std::vector<std::string> order_;
};

} // namespace beacon::tools
