#include "handler_registry.hpp"
#include "random_text.hpp"

#include "../logger.hpp"
#include "../mcp_types.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <sstream>
#include <system_error>

#include <log4cplus/loggingmacros.h>

namespace mcp::handlers {

namespace {

constexpr const char* kRandomDataName = "random_data";

// The serializer rejects invalid UTF-8 when the response is written.
bool is_valid_utf8(const std::string& content) {
    try {
        nlohmann::json(content).dump();
    } catch (const nlohmann::json::type_error&) {
        return false;
    }
    return true;
}
constexpr const char* kRandomDataUri = "data://random_data";
constexpr const char* kRandomDataDescription =
    "Returns a string of random printable ASCII characters. Use URI like 'data://random_data?length=N' in "
    "resources/read, where N is the desired length.";
constexpr const char* kTextPlain = "text/plain";

struct Uri {
    std::string scheme;
    std::string authority;
    std::string path;
    std::map<std::string, std::string> query;
};

int hex_value(char ch) {
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
    return -1;
}

bool percent_decode(const std::string& text, std::string& out, bool plus_as_space) {
    out.clear();
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        char ch = text[i];
        if (ch == '%') {
            if (i + 2 >= text.size()) {
                return false;
            }
            int hi = hex_value(text[i + 1]);
            int lo = hex_value(text[i + 2]);
            if (hi < 0 || lo < 0) {
                return false;
            }
            out.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else if (ch == '+' && plus_as_space) {
            out.push_back(' ');
        } else {
            out.push_back(ch);
        }
    }
    return true;
}

// scheme "://" authority path ["?" query] ["#" fragment]
bool parse_uri(const std::string& text, Uri& uri, std::string& problem) {
    auto scheme_end = text.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        problem = "invalid URI '" + text + "'";
        return false;
    }
    uri.scheme = text.substr(0, scheme_end);

    std::string rest = text.substr(scheme_end + 3);
    auto fragment = rest.find('#');
    if (fragment != std::string::npos) {
        rest.erase(fragment);
    }

    std::string query;
    auto query_start = rest.find('?');
    if (query_start != std::string::npos) {
        query = rest.substr(query_start + 1);
        rest.erase(query_start);
    }

    auto path_start = rest.find('/');
    uri.authority = rest.substr(0, path_start);
    std::string raw_path = path_start == std::string::npos ? std::string() : rest.substr(path_start);
    if (!percent_decode(raw_path, uri.path, false)) {
        problem = "invalid percent-encoding in URI '" + text + "'";
        return false;
    }

    std::istringstream pairs(query);
    std::string pair;
    while (std::getline(pairs, pair, '&')) {
        if (pair.empty()) {
            continue;
        }
        auto eq = pair.find('=');
        std::string key;
        std::string value;
        if (!percent_decode(pair.substr(0, eq), key, true) ||
            !percent_decode(eq == std::string::npos ? std::string() : pair.substr(eq + 1), value, true)) {
            problem = "invalid percent-encoding in URI '" + text + "'";
            return false;
        }
        // first occurrence wins
        uri.query.emplace(key, value);
    }
    return true;
}

bool is_within(const std::filesystem::path& root, const std::filesystem::path& target) {
    auto root_it = root.begin();
    auto target_it = target.begin();
    for (; root_it != root.end(); ++root_it, ++target_it) {
        if (root_it->empty()) {
            // trailing separator
            continue;
        }
        if (target_it == target.end() || *root_it != *target_it) {
            return false;
        }
    }
    return true;
}

} // namespace

class ListResourcesHandler final : public MethodHandler {
public:
    const char* name() const override { return method::resources_list; }

    HandlerOutcome handle(HandlerContext& ctx) override {
        PaginatedParams params;
        HandlerOutcome outcome;
        if (!decode_params(ctx, params, outcome)) {
            return outcome;
        }

        Resource random_data;
        random_data.uri = kRandomDataUri;
        random_data.name = kRandomDataName;
        random_data.description = kRandomDataDescription;
        random_data.mime_type = kTextPlain;

        ListResourcesResult result;
        result.resources.push_back(random_data);
        return HandlerOutcome::success(result);
    }
};

class ListResourceTemplatesHandler final : public MethodHandler {
public:
    const char* name() const override { return method::resources_templates_list; }

    HandlerOutcome handle(HandlerContext& ctx) override {
        PaginatedParams params;
        HandlerOutcome outcome;
        if (!decode_params(ctx, params, outcome)) {
            return outcome;
        }

        ResourceTemplate random_data;
        random_data.uri_template = std::string(kRandomDataUri) + "?length={length}";
        random_data.name = kRandomDataName;
        random_data.description = kRandomDataDescription;
        random_data.mime_type = kTextPlain;

        ListResourceTemplatesResult result;
        result.resource_templates.push_back(random_data);
        return HandlerOutcome::success(result);
    }
};

class ReadResourceHandler final : public MethodHandler {
public:
    const char* name() const override { return method::resources_read; }

    HandlerOutcome handle(HandlerContext& ctx) override {
        HandlerOutcome outcome;
        if (!ensure_params_object(ctx, outcome)) {
            return outcome;
        }
        ReadResourceParams params;
        if (!decode_params(ctx, params, outcome)) {
            return outcome;
        }

        LOG4CPLUS_INFO(server_logger(), "resources/read " << params.uri << " (id=" << ctx.id.to_string() << ")");

        Uri uri;
        std::string problem;
        if (!parse_uri(params.uri, uri, problem)) {
            return invalid_params(ctx, problem);
        }

        if (uri.scheme == "data" && uri.authority == kRandomDataName) {
            return read_random_data(ctx, params.uri, uri);
        }
        if (uri.scheme == "file") {
            return read_file(ctx, params.uri, uri);
        }
        return invalid_params(ctx, "resource '" + params.uri + "' not found or not supported");
    }

private:
    HandlerOutcome read_random_data(const HandlerContext& ctx, const std::string& text, const Uri& uri) {
        auto it = uri.query.find("length");
        if (it == uri.query.end() || it->second.empty()) {
            return invalid_params(ctx, "missing 'length' query parameter in URI " + text);
        }
        std::size_t length = 0;
        std::string problem;
        if (!parse_length(it->second, length, problem)) {
            return invalid_params(ctx, problem);
        }

        ReadResourceResult result;
        result.contents.push_back(TextResourceContents{text, kTextPlain, random_text(length, kPrintableAsciiChars)});
        return HandlerOutcome::success(result);
    }

    HandlerOutcome read_file(const HandlerContext& ctx, const std::string& text, const Uri& uri) {
        namespace fs = std::filesystem;

        const std::string& root_setting = ctx.context.config.resource_root;
        if (root_setting.empty()) {
            return invalid_params(ctx, "file resources are not enabled");
        }
        if (!uri.authority.empty() && uri.authority != "localhost") {
            LOG4CPLUS_WARN(server_logger(), "Ignoring host '" << uri.authority << "' in " << text);
        }

        fs::path requested(uri.path);
        if (!requested.is_absolute()) {
            return invalid_params(ctx, "file URI path must be absolute: " + uri.path);
        }

        std::error_code ec;
        fs::path root = fs::weakly_canonical(fs::path(root_setting), ec);
        if (ec) {
            LOG4CPLUS_ERROR(server_logger(), "Cannot resolve resource root " << root_setting << ": " << ec.message());
            return HandlerOutcome::failure(error_code::internal_error, "resource root is not accessible");
        }
        fs::path target = fs::weakly_canonical(requested, ec);
        if (ec) {
            return invalid_params(ctx, "file not found: " + uri.path);
        }
        if (!is_within(root, target)) {
            LOG4CPLUS_WARN(server_logger(), "Rejecting " << target.string() << ": outside " << root.string());
            return invalid_params(ctx, "file is outside the resource root: " + uri.path);
        }
        if (!fs::is_regular_file(target, ec)) {
            return invalid_params(ctx, "file not found: " + uri.path);
        }

        std::ifstream file(target, std::ios::binary);
        if (!file) {
            return invalid_params(ctx, "cannot open file: " + uri.path);
        }
        std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        if (file.bad()) {
            LOG4CPLUS_ERROR(server_logger(), "Read error on " << target.string());
            return HandlerOutcome::failure(error_code::internal_error, "error reading file: " + uri.path);
        }

        if (!is_valid_utf8(content)) {
            return invalid_params(ctx, "not a text file: " + uri.path);
        }

        ReadResourceResult result;
        result.contents.push_back(TextResourceContents{text, kTextPlain, std::move(content)});
        return HandlerOutcome::success(result);
    }
};

void register_resource_handlers(HandlerRegistry& registry) {
    registry.add(std::make_unique<ListResourcesHandler>());
    registry.add(std::make_unique<ListResourceTemplatesHandler>());
    registry.add(std::make_unique<ReadResourceHandler>());
}

} // namespace mcp::handlers
