#include "mcp_types.hpp"

#include <stdexcept>

namespace mcp {

namespace {

template <typename T>
void read_optional(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        it->get_to(out);
    }
}

void read_optional_json(const nlohmann::json& j, const char* key, std::optional<nlohmann::json>& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = *it;
    }
}

void write_optional_json(nlohmann::json& j, const char* key, const std::optional<nlohmann::json>& value) {
    if (value) {
        j[key] = *value;
    }
}

void write_non_empty(nlohmann::json& j, const char* key, const std::string& value) {
    if (!value.empty()) {
        j[key] = value;
    }
}

void require_object(const nlohmann::json& j, const char* what) {
    if (!j.is_object()) {
        throw std::invalid_argument(std::string(what) + " must be an object");
    }
}

} // namespace

void to_json(nlohmann::json& j, const Implementation& v) {
    j = nlohmann::json{{"name", v.name}, {"version", v.version}};
}

void from_json(const nlohmann::json& j, Implementation& v) {
    require_object(j, "implementation");
    j.at("name").get_to(v.name);
    read_optional(j, "version", v.version);
}

void to_json(nlohmann::json& j, const ClientCapabilities& v) {
    j = nlohmann::json::object();
    write_optional_json(j, "experimental", v.experimental);
    write_optional_json(j, "roots", v.roots);
    write_optional_json(j, "sampling", v.sampling);
}

void from_json(const nlohmann::json& j, ClientCapabilities& v) {
    require_object(j, "capabilities");
    read_optional_json(j, "experimental", v.experimental);
    read_optional_json(j, "roots", v.roots);
    read_optional_json(j, "sampling", v.sampling);
}

void to_json(nlohmann::json& j, const ServerCapabilities& v) {
    j = nlohmann::json::object();
    write_optional_json(j, "experimental", v.experimental);
    write_optional_json(j, "logging", v.logging);
    write_optional_json(j, "prompts", v.prompts);
    write_optional_json(j, "resources", v.resources);
    write_optional_json(j, "tools", v.tools);
}

void from_json(const nlohmann::json& j, ServerCapabilities& v) {
    require_object(j, "capabilities");
    read_optional_json(j, "experimental", v.experimental);
    read_optional_json(j, "logging", v.logging);
    read_optional_json(j, "prompts", v.prompts);
    read_optional_json(j, "resources", v.resources);
    read_optional_json(j, "tools", v.tools);
}

void to_json(nlohmann::json& j, const InitializeParams& v) {
    j = nlohmann::json{
        {"protocolVersion", v.protocol_version},
        {"capabilities", v.capabilities},
        {"clientInfo", v.client_info},
    };
}

// protocolVersion is left empty when missing so the handshake can report it precisely.
void from_json(const nlohmann::json& j, InitializeParams& v) {
    require_object(j, "initialize params");
    read_optional(j, "protocolVersion", v.protocol_version);
    read_optional(j, "capabilities", v.capabilities);
    read_optional(j, "clientInfo", v.client_info);
}

void to_json(nlohmann::json& j, const InitializeResult& v) {
    j = nlohmann::json{
        {"protocolVersion", v.protocol_version},
        {"capabilities", v.capabilities},
        {"serverInfo", v.server_info},
    };
    write_non_empty(j, "instructions", v.instructions);
}

void from_json(const nlohmann::json& j, InitializeResult& v) {
    require_object(j, "initialize result");
    j.at("protocolVersion").get_to(v.protocol_version);
    j.at("serverInfo").get_to(v.server_info);
    read_optional(j, "capabilities", v.capabilities);
    read_optional(j, "instructions", v.instructions);
}

void to_json(nlohmann::json& j, const PaginatedParams& v) {
    j = nlohmann::json::object();
    write_non_empty(j, "cursor", v.cursor);
}

void from_json(const nlohmann::json& j, PaginatedParams& v) {
    require_object(j, "params");
    read_optional(j, "cursor", v.cursor);
}

void to_json(nlohmann::json& j, const TextContent& v) {
    j = nlohmann::json{{"type", v.type}, {"text", v.text}};
}

void from_json(const nlohmann::json& j, TextContent& v) {
    require_object(j, "content");
    j.at("type").get_to(v.type);
    read_optional(j, "text", v.text);
}

void to_json(nlohmann::json& j, const Tool& v) {
    j = nlohmann::json{{"name", v.name}, {"inputSchema", v.input_schema}};
    write_non_empty(j, "description", v.description);
}

void from_json(const nlohmann::json& j, Tool& v) {
    require_object(j, "tool");
    j.at("name").get_to(v.name);
    read_optional(j, "description", v.description);
    read_optional(j, "inputSchema", v.input_schema);
}

void to_json(nlohmann::json& j, const ListToolsResult& v) {
    j = nlohmann::json{{"tools", v.tools}};
    write_non_empty(j, "nextCursor", v.next_cursor);
}

void from_json(const nlohmann::json& j, ListToolsResult& v) {
    require_object(j, "tools/list result");
    j.at("tools").get_to(v.tools);
    read_optional(j, "nextCursor", v.next_cursor);
}

void to_json(nlohmann::json& j, const CallToolParams& v) {
    j = nlohmann::json{{"name", v.name}, {"arguments", v.arguments}};
}

void from_json(const nlohmann::json& j, CallToolParams& v) {
    require_object(j, "tools/call params");
    j.at("name").get_to(v.name);
    read_optional(j, "arguments", v.arguments);
}

void to_json(nlohmann::json& j, const CallToolResult& v) {
    j = nlohmann::json{{"content", v.content}};
    if (v.is_error) {
        j["isError"] = true;
    }
}

void from_json(const nlohmann::json& j, CallToolResult& v) {
    require_object(j, "tools/call result");
    j.at("content").get_to(v.content);
    read_optional(j, "isError", v.is_error);
}

void to_json(nlohmann::json& j, const PromptArgument& v) {
    j = nlohmann::json{{"name", v.name}};
    write_non_empty(j, "description", v.description);
    if (v.required) {
        j["required"] = true;
    }
}

void from_json(const nlohmann::json& j, PromptArgument& v) {
    require_object(j, "prompt argument");
    j.at("name").get_to(v.name);
    read_optional(j, "description", v.description);
    read_optional(j, "required", v.required);
}

void to_json(nlohmann::json& j, const Prompt& v) {
    j = nlohmann::json{{"name", v.name}};
    write_non_empty(j, "description", v.description);
    if (!v.arguments.empty()) {
        j["arguments"] = v.arguments;
    }
}

void from_json(const nlohmann::json& j, Prompt& v) {
    require_object(j, "prompt");
    j.at("name").get_to(v.name);
    read_optional(j, "description", v.description);
    read_optional(j, "arguments", v.arguments);
}

void to_json(nlohmann::json& j, const ListPromptsResult& v) {
    j = nlohmann::json{{"prompts", v.prompts}};
    write_non_empty(j, "nextCursor", v.next_cursor);
}

void from_json(const nlohmann::json& j, ListPromptsResult& v) {
    require_object(j, "prompts/list result");
    j.at("prompts").get_to(v.prompts);
    read_optional(j, "nextCursor", v.next_cursor);
}

void to_json(nlohmann::json& j, const GetPromptParams& v) {
    j = nlohmann::json{{"name", v.name}};
    if (!v.arguments.empty()) {
        j["arguments"] = v.arguments;
    }
}

void from_json(const nlohmann::json& j, GetPromptParams& v) {
    require_object(j, "prompts/get params");
    j.at("name").get_to(v.name);
    read_optional(j, "arguments", v.arguments);
}

void to_json(nlohmann::json& j, const PromptMessage& v) {
    j = nlohmann::json{{"role", v.role}, {"content", v.content}};
}

void from_json(const nlohmann::json& j, PromptMessage& v) {
    require_object(j, "prompt message");
    j.at("role").get_to(v.role);
    j.at("content").get_to(v.content);
}

void to_json(nlohmann::json& j, const GetPromptResult& v) {
    j = nlohmann::json{{"messages", v.messages}};
    write_non_empty(j, "description", v.description);
}

void from_json(const nlohmann::json& j, GetPromptResult& v) {
    require_object(j, "prompts/get result");
    j.at("messages").get_to(v.messages);
    read_optional(j, "description", v.description);
}

void to_json(nlohmann::json& j, const Resource& v) {
    j = nlohmann::json{{"uri", v.uri}, {"name", v.name}};
    write_non_empty(j, "description", v.description);
    write_non_empty(j, "mimeType", v.mime_type);
}

void from_json(const nlohmann::json& j, Resource& v) {
    require_object(j, "resource");
    j.at("uri").get_to(v.uri);
    j.at("name").get_to(v.name);
    read_optional(j, "description", v.description);
    read_optional(j, "mimeType", v.mime_type);
}

void to_json(nlohmann::json& j, const ResourceTemplate& v) {
    j = nlohmann::json{{"uriTemplate", v.uri_template}, {"name", v.name}};
    write_non_empty(j, "description", v.description);
    write_non_empty(j, "mimeType", v.mime_type);
}

void from_json(const nlohmann::json& j, ResourceTemplate& v) {
    require_object(j, "resource template");
    j.at("uriTemplate").get_to(v.uri_template);
    j.at("name").get_to(v.name);
    read_optional(j, "description", v.description);
    read_optional(j, "mimeType", v.mime_type);
}

void to_json(nlohmann::json& j, const ListResourcesResult& v) {
    j = nlohmann::json{{"resources", v.resources}};
    write_non_empty(j, "nextCursor", v.next_cursor);
}

void from_json(const nlohmann::json& j, ListResourcesResult& v) {
    require_object(j, "resources/list result");
    j.at("resources").get_to(v.resources);
    read_optional(j, "nextCursor", v.next_cursor);
}

void to_json(nlohmann::json& j, const ListResourceTemplatesResult& v) {
    j = nlohmann::json{{"resourceTemplates", v.resource_templates}};
    write_non_empty(j, "nextCursor", v.next_cursor);
}

void from_json(const nlohmann::json& j, ListResourceTemplatesResult& v) {
    require_object(j, "resources/templates/list result");
    j.at("resourceTemplates").get_to(v.resource_templates);
    read_optional(j, "nextCursor", v.next_cursor);
}

void to_json(nlohmann::json& j, const ReadResourceParams& v) {
    j = nlohmann::json{{"uri", v.uri}};
}

void from_json(const nlohmann::json& j, ReadResourceParams& v) {
    require_object(j, "resources/read params");
    j.at("uri").get_to(v.uri);
}

void to_json(nlohmann::json& j, const TextResourceContents& v) {
    j = nlohmann::json{{"uri", v.uri}, {"text", v.text}};
    write_non_empty(j, "mimeType", v.mime_type);
}

void from_json(const nlohmann::json& j, TextResourceContents& v) {
    require_object(j, "resource contents");
    j.at("uri").get_to(v.uri);
    read_optional(j, "mimeType", v.mime_type);
    read_optional(j, "text", v.text);
}

void to_json(nlohmann::json& j, const ReadResourceResult& v) {
    j = nlohmann::json{{"contents", v.contents}};
}

void from_json(const nlohmann::json& j, ReadResourceResult& v) {
    require_object(j, "resources/read result");
    j.at("contents").get_to(v.contents);
}

} // namespace mcp
