#include "handler_registry.hpp"

#include "../logger.hpp"
#include "../mcp_types.hpp"

#include <log4cplus/loggingmacros.h>

namespace mcp::handlers {

namespace {

constexpr const char* kQueryPrompt = "query";

constexpr const char* kQueryPromptText =
    "You are an AI assistant that helps users query information from various sources.\n"
    "Please respond to the user's query in a helpful, accurate, and concise manner.\n"
    "If you don't know the answer, it's better to say so than to make up information.\n"
    "Always cite your sources when providing factual information.";

Prompt query_prompt() {
    Prompt prompt;
    prompt.name = kQueryPrompt;
    prompt.description = "A prompt for querying information from various sources";
    return prompt;
}

} // namespace

class ListPromptsHandler final : public MethodHandler {
public:
    const char* name() const override { return method::prompts_list; }

    HandlerOutcome handle(HandlerContext& ctx) override {
        PaginatedParams params;
        HandlerOutcome outcome;
        if (!decode_params(ctx, params, outcome)) {
            return outcome;
        }

        ListPromptsResult result;
        result.prompts.push_back(query_prompt());
        return HandlerOutcome::success(result);
    }
};

class GetPromptHandler final : public MethodHandler {
public:
    const char* name() const override { return method::prompts_get; }

    HandlerOutcome handle(HandlerContext& ctx) override {
        HandlerOutcome outcome;
        if (!ensure_params_object(ctx, outcome)) {
            return outcome;
        }
        GetPromptParams params;
        if (!decode_params(ctx, params, outcome)) {
            return outcome;
        }

        LOG4CPLUS_INFO(server_logger(), "prompts/get " << params.name << " (id=" << ctx.id.to_string() << ")");
        if (params.name != kQueryPrompt) {
            return invalid_params(ctx, "unknown prompt '" + params.name + "'");
        }

        PromptMessage message;
        message.role = role::assistant;
        message.content.text = kQueryPromptText;

        GetPromptResult result;
        result.description = query_prompt().description;
        result.messages.push_back(message);
        return HandlerOutcome::success(result);
    }
};

void register_prompt_handlers(HandlerRegistry& registry) {
    registry.add(std::make_unique<ListPromptsHandler>());
    registry.add(std::make_unique<GetPromptHandler>());
}

} // namespace mcp::handlers
