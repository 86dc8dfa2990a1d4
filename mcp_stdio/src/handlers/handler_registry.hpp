#pragma once

#include "handler_base.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace mcp::handlers {

/**
 * Method name -> handler table. Populated at startup, read-only afterwards.
 */
class HandlerRegistry {
public:
    void add(std::unique_ptr<MethodHandler> handler);
    MethodHandler* find(const std::string& method) const;
    bool contains(const std::string& method) const { return find(method) != nullptr; }
    std::vector<std::string> methods() const;

private:
    std::unordered_map<std::string, std::unique_ptr<MethodHandler>> handlers_;
};

void register_tool_handlers(HandlerRegistry& registry);
void register_prompt_handlers(HandlerRegistry& registry);
void register_resource_handlers(HandlerRegistry& registry);
void register_default_handlers(HandlerRegistry& registry);

} // namespace mcp::handlers
