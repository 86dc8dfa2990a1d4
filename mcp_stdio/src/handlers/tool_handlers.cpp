#include "handler_registry.hpp"
#include "random_text.hpp"

#include "../logger.hpp"
#include "../mcp_types.hpp"

#include <log4cplus/loggingmacros.h>

namespace mcp::handlers {

namespace {

constexpr const char* kRandomStringTool = "random_string";

Tool random_string_tool() {
    Tool tool;
    tool.name = kRandomStringTool;
    tool.description = "Generates a random alphanumeric string of the requested length (1-1024).";
    tool.input_schema = {
        {"type", "object"},
        {"properties",
         {{"length",
           {{"type", "integer"},
            {"description", "Number of characters to generate"},
            {"minimum", 1},
            {"maximum", kMaxRandomLength}}}}},
        {"required", nlohmann::json::array({"length"})},
    };
    return tool;
}

} // namespace

class ListToolsHandler final : public MethodHandler {
public:
    const char* name() const override { return method::tools_list; }

    HandlerOutcome handle(HandlerContext& ctx) override {
        PaginatedParams params;
        HandlerOutcome outcome;
        if (!decode_params(ctx, params, outcome)) {
            return outcome;
        }
        LOG4CPLUS_DEBUG(server_logger(), "tools/list (id=" << ctx.id.to_string() << ")");

        ListToolsResult result;
        result.tools.push_back(random_string_tool());
        return HandlerOutcome::success(result);
    }
};

class CallToolHandler final : public MethodHandler {
public:
    const char* name() const override { return method::tools_call; }

    HandlerOutcome handle(HandlerContext& ctx) override {
        HandlerOutcome outcome;
        if (!ensure_params_object(ctx, outcome)) {
            return outcome;
        }
        CallToolParams params;
        if (!decode_params(ctx, params, outcome)) {
            return outcome;
        }

        LOG4CPLUS_INFO(server_logger(), "tools/call " << params.name << " (id=" << ctx.id.to_string() << ")");
        if (params.name == kRandomStringTool) {
            return random_string(ctx, params.arguments);
        }
        return invalid_params(ctx, "unknown tool '" + params.name + "'");
    }

private:
    HandlerOutcome random_string(const HandlerContext& ctx, const nlohmann::json& arguments) {
        if (!arguments.is_object()) {
            return invalid_params(ctx, "arguments must be an object");
        }
        auto it = arguments.find("length");
        if (it == arguments.end() || it->is_null()) {
            return invalid_params(ctx, "missing 'length' argument");
        }

        std::size_t length = 0;
        std::string problem;
        bool valid = false;
        if (it->is_number_integer()) {
            valid = check_length(it->get<long long>(), length, problem);
        } else if (it->is_string()) {
            valid = parse_length(it->get<std::string>(), length, problem);
        } else {
            problem = "'length' must be an integer";
        }
        if (!valid) {
            return invalid_params(ctx, problem);
        }

        CallToolResult result;
        result.content.push_back(TextContent{"text", random_text(length, kAlphanumericChars)});
        return HandlerOutcome::success(result);
    }
};

void register_tool_handlers(HandlerRegistry& registry) {
    registry.add(std::make_unique<ListToolsHandler>());
    registry.add(std::make_unique<CallToolHandler>());
}

} // namespace mcp::handlers
