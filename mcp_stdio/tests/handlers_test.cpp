#include <gtest/gtest.h>

#include "handlers/handler_registry.hpp"
#include "handlers/random_text.hpp"
#include "mcp_types.hpp"
#include "test_helpers.hpp"

#include <unistd.h>

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using mcp::handlers::HandlerContext;
using mcp::handlers::HandlerOutcome;
using mcp::handlers::HandlerRegistry;

namespace {

class HandlersTest : public ::testing::Test {
protected:
    void SetUp() override { mcp::handlers::register_default_handlers(registry_); }

    HandlerOutcome invoke(const std::string& method, const nlohmann::json& params, bool has_params = true) {
        auto* handler = registry_.find(method);
        EXPECT_NE(handler, nullptr) << method;
        if (!handler) {
            return HandlerOutcome::failure(mcp::error_code::method_not_found, method);
        }
        mcp::RequestId id(int64_t{1});
        HandlerContext ctx{method, id, params, has_params, context_};
        return handler->handle(ctx);
    }

    static void expect_invalid_params(const HandlerOutcome& outcome) {
        EXPECT_FALSE(outcome.result.has_value());
        ASSERT_TRUE(outcome.error.has_value());
        EXPECT_EQ(outcome.error->code, mcp::error_code::invalid_params);
    }

    mcp::ServerContext context_;
    HandlerRegistry registry_;
};

/**
 * A scratch directory holding a resource root and a file outside it.
 */
class FileResourceTest : public HandlersTest {
protected:
    void SetUp() override {
        HandlersTest::SetUp();
        char pattern[] = "/tmp/mcp_stdio_test_XXXXXX";
        ASSERT_NE(::mkdtemp(pattern), nullptr);
        base_ = pattern;
        root_ = base_ / "root";
        fs::create_directories(root_ / "docs");
        std::ofstream(root_ / "docs" / "note.txt") << "hello from a file\n";
        std::ofstream(base_ / "secret.txt") << "outside";
        context_.config.resource_root = root_.string();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(base_, ec);
    }

    HandlerOutcome read(const std::string& uri) { return invoke("resources/read", {{"uri", uri}}); }

    fs::path base_;
    fs::path root_;
};

} // namespace

TEST(RandomText, LengthAndCharset) {
    std::string text = mcp::handlers::random_text(64, mcp::handlers::kAlphanumericChars);
    EXPECT_EQ(text.size(), 64u);
    for (char c : text) {
        EXPECT_TRUE(std::isalnum(static_cast<unsigned char>(c))) << c;
    }

    std::string printable = mcp::handlers::random_text(512, mcp::handlers::kPrintableAsciiChars);
    for (char c : printable) {
        EXPECT_GE(c, ' ');
        EXPECT_LE(c, '~');
    }
}

TEST(RandomText, LengthBounds) {
    std::size_t length = 0;
    std::string problem;
    EXPECT_TRUE(mcp::handlers::check_length(1, length, problem));
    EXPECT_EQ(length, 1u);
    EXPECT_TRUE(mcp::handlers::check_length(1024, length, problem));
    EXPECT_EQ(length, 1024u);

    EXPECT_FALSE(mcp::handlers::check_length(0, length, problem));
    EXPECT_EQ(problem, "length must be positive");
    EXPECT_FALSE(mcp::handlers::check_length(-3, length, problem));
    EXPECT_FALSE(mcp::handlers::check_length(1025, length, problem));
    EXPECT_EQ(problem, "requested length 1025 exceeds maximum allowed length 1024");
}

TEST(RandomText, ParseLengthFromText) {
    std::size_t length = 0;
    std::string problem;
    EXPECT_TRUE(mcp::handlers::parse_length("32", length, problem));
    EXPECT_EQ(length, 32u);
    EXPECT_FALSE(mcp::handlers::parse_length("abc", length, problem));
    EXPECT_FALSE(mcp::handlers::parse_length("12abc", length, problem));
    EXPECT_FALSE(mcp::handlers::parse_length("", length, problem));
    EXPECT_FALSE(mcp::handlers::parse_length("5000", length, problem));
}

TEST_F(HandlersTest, RegistryHoldsEveryMcpMethod) {
    for (const char* method : {"tools/list", "tools/call", "prompts/list", "prompts/get", "resources/list",
                               "resources/templates/list", "resources/read"}) {
        EXPECT_TRUE(registry_.contains(method)) << method;
    }
    EXPECT_FALSE(registry_.contains("initialize"));

    std::vector<std::string> expected = {"prompts/get",    "prompts/list",
                                         "resources/list", "resources/read",
                                         "resources/templates/list", "tools/call",
                                         "tools/list"};
    EXPECT_EQ(registry_.methods(), expected);
}

TEST_F(HandlersTest, ListToolsDescribesRandomString) {
    auto outcome = invoke("tools/list", nullptr, false);
    ASSERT_TRUE(outcome.result.has_value());
    auto result = outcome.result->get<mcp::ListToolsResult>();
    ASSERT_EQ(result.tools.size(), 1u);
    EXPECT_EQ(result.tools[0].name, "random_string");
    EXPECT_EQ(result.tools[0].input_schema["type"], "object");
    EXPECT_EQ(result.tools[0].input_schema["required"][0], "length");
    EXPECT_FALSE(outcome.result->contains("nextCursor"));
}

TEST_F(HandlersTest, RandomStringAcceptsIntegerAndStringLength) {
    auto outcome = invoke("tools/call", {{"name", "random_string"}, {"arguments", {{"length", 20}}}});
    ASSERT_TRUE(outcome.result.has_value());
    auto result = outcome.result->get<mcp::CallToolResult>();
    ASSERT_EQ(result.content.size(), 1u);
    EXPECT_EQ(result.content[0].type, "text");
    EXPECT_EQ(result.content[0].text.size(), 20u);

    auto as_string = invoke("tools/call", {{"name", "random_string"}, {"arguments", {{"length", "7"}}}});
    ASSERT_TRUE(as_string.result.has_value());
    EXPECT_EQ(as_string.result->get<mcp::CallToolResult>().content[0].text.size(), 7u);
}

TEST_F(HandlersTest, RandomStringRejectsBadLengths) {
    for (const nlohmann::json& length : {nlohmann::json(0), nlohmann::json(1025), nlohmann::json(-1),
                                         nlohmann::json("x"), nlohmann::json(2.5), nlohmann::json(true)}) {
        SCOPED_TRACE(length.dump());
        expect_invalid_params(invoke("tools/call", {{"name", "random_string"}, {"arguments", {{"length", length}}}}));
    }
    expect_invalid_params(invoke("tools/call", {{"name", "random_string"}, {"arguments", nlohmann::json::object()}}));
}

TEST_F(HandlersTest, UnknownToolIsInvalidParams) {
    auto outcome = invoke("tools/call", {{"name", "does_not_exist"}});
    expect_invalid_params(outcome);
    EXPECT_NE(outcome.error->message.find("does_not_exist"), std::string::npos);
}

TEST_F(HandlersTest, CallToolRequiresParamsObject) {
    expect_invalid_params(invoke("tools/call", nullptr, false));
    expect_invalid_params(invoke("tools/call", nlohmann::json::array({1, 2})));
}

TEST_F(HandlersTest, QueryPrompt) {
    auto list = invoke("prompts/list", nlohmann::json::object());
    ASSERT_TRUE(list.result.has_value());
    auto prompts = list.result->get<mcp::ListPromptsResult>();
    ASSERT_EQ(prompts.prompts.size(), 1u);
    EXPECT_EQ(prompts.prompts[0].name, "query");
    EXPECT_EQ(prompts.prompts[0].description, "A prompt for querying information from various sources");

    auto get = invoke("prompts/get", {{"name", "query"}});
    ASSERT_TRUE(get.result.has_value());
    auto prompt = get.result->get<mcp::GetPromptResult>();
    ASSERT_EQ(prompt.messages.size(), 1u);
    EXPECT_EQ(prompt.messages[0].role, "assistant");
    EXPECT_EQ(prompt.messages[0].content.type, "text");
    EXPECT_EQ(prompt.messages[0].content.text.rfind("You are an AI assistant", 0), 0u);
}

TEST_F(HandlersTest, UnknownPromptIsInvalidParams) {
    expect_invalid_params(invoke("prompts/get", {{"name", "other"}}));
}

TEST_F(HandlersTest, ResourceListAndTemplates) {
    auto list = invoke("resources/list", nullptr, false);
    ASSERT_TRUE(list.result.has_value());
    auto resources = list.result->get<mcp::ListResourcesResult>();
    ASSERT_EQ(resources.resources.size(), 1u);
    EXPECT_EQ(resources.resources[0].uri, "data://random_data");
    EXPECT_EQ(resources.resources[0].mime_type, "text/plain");
    EXPECT_EQ((*list.result)["resources"][0]["mimeType"], "text/plain");

    auto templates = invoke("resources/templates/list", nullptr, false);
    ASSERT_TRUE(templates.result.has_value());
    EXPECT_EQ((*templates.result)["resourceTemplates"][0]["uriTemplate"], "data://random_data?length={length}");
}

TEST_F(HandlersTest, RandomDataResource) {
    auto outcome = invoke("resources/read", {{"uri", "data://random_data?length=50"}});
    ASSERT_TRUE(outcome.result.has_value());
    auto result = outcome.result->get<mcp::ReadResourceResult>();
    ASSERT_EQ(result.contents.size(), 1u);
    EXPECT_EQ(result.contents[0].uri, "data://random_data?length=50");
    EXPECT_EQ(result.contents[0].mime_type, "text/plain");
    ASSERT_EQ(result.contents[0].text.size(), 50u);
    for (char c : result.contents[0].text) {
        EXPECT_GE(c, ' ');
        EXPECT_LE(c, '~');
    }
}

TEST_F(HandlersTest, RandomDataResourceRejectsBadLength) {
    for (const char* uri : {"data://random_data", "data://random_data?length=", "data://random_data?length=abc",
                            "data://random_data?length=0", "data://random_data?length=2000"}) {
        SCOPED_TRACE(uri);
        expect_invalid_params(invoke("resources/read", {{"uri", uri}}));
    }
}

TEST_F(HandlersTest, UnknownResourceIsInvalidParams) {
    expect_invalid_params(invoke("resources/read", {{"uri", "data://other"}}));
    expect_invalid_params(invoke("resources/read", {{"uri", "not a uri"}}));
    expect_invalid_params(invoke("resources/read", nlohmann::json::object()));
}

TEST_F(HandlersTest, FileResourcesDisabledWithoutRoot) {
    auto outcome = invoke("resources/read", {{"uri", "file:///etc/hostname"}});
    expect_invalid_params(outcome);
    EXPECT_NE(outcome.error->message.find("not enabled"), std::string::npos);
}

TEST_F(FileResourceTest, ReadsFileInsideRoot) {
    std::string uri = "file://" + (root_ / "docs" / "note.txt").string();
    auto outcome = read(uri);
    ASSERT_TRUE(outcome.result.has_value());
    auto result = outcome.result->get<mcp::ReadResourceResult>();
    ASSERT_EQ(result.contents.size(), 1u);
    EXPECT_EQ(result.contents[0].uri, uri);
    EXPECT_EQ(result.contents[0].text, "hello from a file\n");
}

TEST_F(FileResourceTest, PercentEncodedPathAndLocalhost) {
    std::ofstream(root_ / "with space.txt") << "spaced";
    auto outcome = read("file://localhost" + root_.string() + "/with%20space.txt");
    ASSERT_TRUE(outcome.result.has_value());
    EXPECT_EQ(outcome.result->get<mcp::ReadResourceResult>().contents[0].text, "spaced");
}

TEST_F(FileResourceTest, RejectsPathsOutsideRoot) {
    expect_invalid_params(read("file://" + (base_ / "secret.txt").string()));
    expect_invalid_params(read("file://" + root_.string() + "/../secret.txt"));
    expect_invalid_params(read("file://" + root_.string() + "/docs/%2E%2E/%2E%2E/secret.txt"));
}

TEST_F(FileResourceTest, MissingFileAndDirectory) {
    expect_invalid_params(read("file://" + (root_ / "nope.txt").string()));
    expect_invalid_params(read("file://" + (root_ / "docs").string()));
}

TEST_F(FileResourceTest, BinaryFileIsInvalidParams) {
    std::ofstream(root_ / "binary.bin", std::ios::binary) << "ok\xff\xfe";
    auto outcome = read("file://" + (root_ / "binary.bin").string());
    expect_invalid_params(outcome);
    EXPECT_NE(outcome.error->message.find("not a text file"), std::string::npos);
}
