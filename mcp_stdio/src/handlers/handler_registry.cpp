#include "handler_registry.hpp"

#include "../logger.hpp"

#include <algorithm>

#include <log4cplus/loggingmacros.h>

namespace mcp::handlers {

void HandlerRegistry::add(std::unique_ptr<MethodHandler> handler) {
    if (!handler) {
        return;
    }
    std::string method = handler->name();
    auto [it, inserted] = handlers_.emplace(method, std::move(handler));
    if (!inserted) {
        LOG4CPLUS_WARN(server_logger(), "Handler for " << method << " already registered, keeping the first one");
    }
}

MethodHandler* HandlerRegistry::find(const std::string& method) const {
    auto it = handlers_.find(method);
    if (it == handlers_.end()) {
        return nullptr;
    }
    return it->second.get();
}

std::vector<std::string> HandlerRegistry::methods() const {
    std::vector<std::string> names;
    names.reserve(handlers_.size());
    for (const auto& entry : handlers_) {
        names.push_back(entry.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

void register_default_handlers(HandlerRegistry& registry) {
    register_tool_handlers(registry);
    register_prompt_handlers(registry);
    register_resource_handlers(registry);
}

} // namespace mcp::handlers
