#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mcp {

inline constexpr const char* kProtocolVersion = "2024-11-05";

namespace role {
inline constexpr const char* assistant = "assistant";
inline constexpr const char* user = "user";
} // namespace role

struct Implementation {
    std::string name;
    std::string version;
};

struct ClientCapabilities {
    std::optional<nlohmann::json> experimental;
    std::optional<nlohmann::json> roots;
    std::optional<nlohmann::json> sampling;
};

// Absent members are not advertised; an empty object means basic support.
struct ServerCapabilities {
    std::optional<nlohmann::json> experimental;
    std::optional<nlohmann::json> logging;
    std::optional<nlohmann::json> prompts;
    std::optional<nlohmann::json> resources;
    std::optional<nlohmann::json> tools;
};

struct InitializeParams {
    std::string protocol_version;
    ClientCapabilities capabilities;
    Implementation client_info;
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;
    std::string instructions;
};

// Only the opaque cursor token is carried; list results are not paged by the core.
struct PaginatedParams {
    std::string cursor;
};

struct TextContent {
    std::string type = "text";
    std::string text;
};

struct Tool {
    std::string name;
    std::string description;
    nlohmann::json input_schema = nlohmann::json::object();
};

struct ListToolsResult {
    std::vector<Tool> tools;
    std::string next_cursor;
};

struct CallToolParams {
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
};

struct CallToolResult {
    std::vector<TextContent> content;
    bool is_error = false;
};

struct PromptArgument {
    std::string name;
    std::string description;
    bool required = false;
};

struct Prompt {
    std::string name;
    std::string description;
    std::vector<PromptArgument> arguments;
};

struct ListPromptsResult {
    std::vector<Prompt> prompts;
    std::string next_cursor;
};

struct GetPromptParams {
    std::string name;
    std::map<std::string, std::string> arguments;
};

struct PromptMessage {
    std::string role;
    TextContent content;
};

struct GetPromptResult {
    std::string description;
    std::vector<PromptMessage> messages;
};

struct Resource {
    std::string uri;
    std::string name;
    std::string description;
    std::string mime_type;
};

struct ResourceTemplate {
    std::string uri_template;
    std::string name;
    std::string description;
    std::string mime_type;
};

struct ListResourcesResult {
    std::vector<Resource> resources;
    std::string next_cursor;
};

struct ListResourceTemplatesResult {
    std::vector<ResourceTemplate> resource_templates;
    std::string next_cursor;
};

struct ReadResourceParams {
    std::string uri;
};

struct TextResourceContents {
    std::string uri;
    std::string mime_type;
    std::string text;
};

struct ReadResourceResult {
    std::vector<TextResourceContents> contents;
};

void to_json(nlohmann::json& j, const Implementation& v);
void from_json(const nlohmann::json& j, Implementation& v);
void to_json(nlohmann::json& j, const ClientCapabilities& v);
void from_json(const nlohmann::json& j, ClientCapabilities& v);
void to_json(nlohmann::json& j, const ServerCapabilities& v);
void from_json(const nlohmann::json& j, ServerCapabilities& v);
void to_json(nlohmann::json& j, const InitializeParams& v);
void from_json(const nlohmann::json& j, InitializeParams& v);
void to_json(nlohmann::json& j, const InitializeResult& v);
void from_json(const nlohmann::json& j, InitializeResult& v);
void to_json(nlohmann::json& j, const PaginatedParams& v);
void from_json(const nlohmann::json& j, PaginatedParams& v);
void to_json(nlohmann::json& j, const TextContent& v);
void from_json(const nlohmann::json& j, TextContent& v);
void to_json(nlohmann::json& j, const Tool& v);
void from_json(const nlohmann::json& j, Tool& v);
void to_json(nlohmann::json& j, const ListToolsResult& v);
void from_json(const nlohmann::json& j, ListToolsResult& v);
void to_json(nlohmann::json& j, const CallToolParams& v);
void from_json(const nlohmann::json& j, CallToolParams& v);
void to_json(nlohmann::json& j, const CallToolResult& v);
void from_json(const nlohmann::json& j, CallToolResult& v);
void to_json(nlohmann::json& j, const PromptArgument& v);
void from_json(const nlohmann::json& j, PromptArgument& v);
void to_json(nlohmann::json& j, const Prompt& v);
void from_json(const nlohmann::json& j, Prompt& v);
void to_json(nlohmann::json& j, const ListPromptsResult& v);
void from_json(const nlohmann::json& j, ListPromptsResult& v);
void to_json(nlohmann::json& j, const GetPromptParams& v);
void from_json(const nlohmann::json& j, GetPromptParams& v);
void to_json(nlohmann::json& j, const PromptMessage& v);
void from_json(const nlohmann::json& j, PromptMessage& v);
void to_json(nlohmann::json& j, const GetPromptResult& v);
void from_json(const nlohmann::json& j, GetPromptResult& v);
void to_json(nlohmann::json& j, const Resource& v);
void from_json(const nlohmann::json& j, Resource& v);
void to_json(nlohmann::json& j, const ResourceTemplate& v);
void from_json(const nlohmann::json& j, ResourceTemplate& v);
void to_json(nlohmann::json& j, const ListResourcesResult& v);
void from_json(const nlohmann::json& j, ListResourcesResult& v);
void to_json(nlohmann::json& j, const ListResourceTemplatesResult& v);
void from_json(const nlohmann::json& j, ListResourceTemplatesResult& v);
void to_json(nlohmann::json& j, const ReadResourceParams& v);
void from_json(const nlohmann::json& j, ReadResourceParams& v);
void to_json(nlohmann::json& j, const TextResourceContents& v);
void from_json(const nlohmann::json& j, TextResourceContents& v);
void to_json(nlohmann::json& j, const ReadResourceResult& v);
void from_json(const nlohmann::json& j, ReadResourceResult& v);

} // namespace mcp
