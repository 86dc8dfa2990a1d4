#include <gtest/gtest.h>

#include "child_process.hpp"
#include "client.hpp"
#include "json_codec.hpp"
#include "stdio_server.hpp"
#include "test_helpers.hpp"

#include <chrono>
#include <csignal>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using mcp::Client;
using mcp::ClientError;
using mcp::RequestId;
using mcp::RpcCallError;
using mcp::test::Pipe;

namespace {

/**
 * Client wired to a real StdioServer running on a thread.
 */
class ClientServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        context_.config.worker_count = 4;
        mcp::handlers::register_default_handlers(registry_);
        mcp::test::register_test_handlers(registry_);

        server_ = std::make_unique<mcp::StdioServer>(to_server_.release_read(), from_server_.release_write(), context_,
                                                     registry_, true);
        server_thread_ = std::thread([this]() { reason_ = server_->run(); });

        mcp::ClientConfig config;
        config.default_timeout_ms = 5000;
        client_ = std::make_unique<Client>(from_server_.release_read(), to_server_.release_write(), config);
        client_->start();
    }

    void TearDown() override {
        client_->close();
        if (server_thread_.joinable()) {
            server_thread_.join();
        }
        client_.reset();
    }

    mcp::ServerContext context_;
    mcp::handlers::HandlerRegistry registry_;
    Pipe to_server_;
    Pipe from_server_;
    std::unique_ptr<mcp::StdioServer> server_;
    std::thread server_thread_;
    mcp::ExitReason reason_ = mcp::ExitReason::stopped;
    std::unique_ptr<Client> client_;
};

/**
 * Client whose peer is the test itself, reading requests and writing
 * whatever responses the test wants.
 */
class ClientPeerTest : public ::testing::Test {
protected:
    void SetUp() override {
        client_ = std::make_unique<Client>(from_peer_.release_read(), to_peer_.release_write());
        client_->start();
        reader_ = std::make_unique<mcp::FrameReader>(to_peer_.read_fd);
    }

    nlohmann::json next_request() {
        auto message = mcp::test::receive_message(*reader_);
        EXPECT_TRUE(message.has_value());
        return message.value_or(nlohmann::json());
    }

    bool reply(const nlohmann::json& message) {
        return mcp::test::send_message(from_peer_.write_fd, message);
    }

    Pipe to_peer_;
    Pipe from_peer_;
    std::unique_ptr<Client> client_;
    std::unique_ptr<mcp::FrameReader> reader_;
};

} // namespace

TEST_F(ClientServerTest, InitializeThenListEverything) {
    auto init = client_->initialize();
    EXPECT_EQ(init.protocol_version, mcp::kProtocolVersion);
    EXPECT_EQ(init.server_info.name, "mcp_stdio");
    EXPECT_TRUE(init.capabilities.tools.has_value());
    EXPECT_TRUE(init.capabilities.prompts.has_value());
    EXPECT_TRUE(init.capabilities.resources.has_value());

    auto tools = client_->list_tools();
    ASSERT_EQ(tools.tools.size(), 1u);
    EXPECT_EQ(tools.tools[0].name, "random_string");

    auto prompts = client_->list_prompts();
    ASSERT_EQ(prompts.prompts.size(), 1u);
    EXPECT_EQ(prompts.prompts[0].name, "query");

    auto resources = client_->list_resources();
    ASSERT_EQ(resources.resources.size(), 1u);
    EXPECT_EQ(resources.resources[0].uri, "data://random_data");

    auto templates = client_->list_resource_templates();
    ASSERT_EQ(templates.resource_templates.size(), 1u);
    EXPECT_EQ(templates.resource_templates[0].uri_template, "data://random_data?length={length}");
}

TEST_F(ClientServerTest, TypedCalls) {
    client_->initialize();

    auto tool = client_->call_tool("random_string", {{"length", 16}});
    ASSERT_EQ(tool.content.size(), 1u);
    EXPECT_EQ(tool.content[0].text.size(), 16u);
    EXPECT_FALSE(tool.is_error);

    auto prompt = client_->get_prompt("query");
    ASSERT_EQ(prompt.messages.size(), 1u);
    EXPECT_EQ(prompt.messages[0].role, "assistant");

    auto resource = client_->read_resource("data://random_data?length=8");
    ASSERT_EQ(resource.contents.size(), 1u);
    EXPECT_EQ(resource.contents[0].text.size(), 8u);
    EXPECT_EQ(resource.contents[0].mime_type, "text/plain");
}

TEST_F(ClientServerTest, ErrorResponseBecomesRpcCallError) {
    client_->initialize();

    try {
        client_->call("no/such/method");
        FAIL() << "expected RpcCallError";
    } catch (const RpcCallError& err) {
        EXPECT_EQ(err.error().code, mcp::error_code::method_not_found);
    }

    EXPECT_THROW(client_->call_tool("random_string", {{"length", 0}}), RpcCallError);
    EXPECT_EQ(client_->pending_count(), 0u);
}

TEST_F(ClientServerTest, ConcurrentCallsResolveOutOfOrder) {
    client_->initialize();

    RequestId slow = client_->send("test/sleep", {{"ms", 300}});
    RequestId fast = client_->send("test/echo", {{"value", "fast"}});
    EXPECT_NE(slow, fast);

    auto fast_response = client_->await(fast, std::chrono::milliseconds(5000));
    ASSERT_TRUE(fast_response.result.has_value());
    EXPECT_EQ((*fast_response.result)["value"], "fast");
    EXPECT_EQ(client_->pending_count(), 1u);

    auto slow_response = client_->await(slow, std::chrono::milliseconds(5000));
    ASSERT_TRUE(slow_response.result.has_value());
    EXPECT_EQ((*slow_response.result)["ms"], 300);
    EXPECT_EQ(client_->pending_count(), 0u);
}

TEST_F(ClientServerTest, ManyThreadsShareOneClient) {
    client_->initialize();

    std::vector<std::future<int>> results;
    for (int i = 0; i < 16; ++i) {
        results.push_back(std::async(std::launch::async, [this, i]() {
            return client_->call("test/echo", {{"n", i}})["n"].get<int>();
        }));
    }
    for (int i = 0; i < 16; ++i) {
        EXPECT_EQ(results[i].get(), i);
    }
}

TEST_F(ClientServerTest, ResponseArrivingBeforeAwaitIsKept) {
    client_->initialize();

    RequestId id = client_->send("test/echo", {{"k", 1}});
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    auto response = client_->await(id);
    ASSERT_TRUE(response.result.has_value());
    EXPECT_EQ((*response.result)["k"], 1);
}

TEST_F(ClientServerTest, AwaitUnknownIdThrows) {
    client_->initialize();
    EXPECT_THROW(client_->await(RequestId("never-sent")), ClientError);

    RequestId id = client_->send("test/echo");
    client_->await(id);
    EXPECT_THROW(client_->await(id), ClientError);
}

TEST_F(ClientServerTest, CloseShutsServerDownCleanly) {
    client_->initialize();
    client_->close();
    server_thread_.join();
    EXPECT_EQ(reason_, mcp::ExitReason::end_of_stream);
}

TEST_F(ClientPeerTest, IdsAreUniqueAndMonotonic) {
    RequestId first = client_->send("a");
    RequestId second = client_->send("b");
    EXPECT_EQ(next_request()["id"], first.to_json());
    EXPECT_EQ(next_request()["id"], second.to_json());
    ASSERT_TRUE(first.is_number());
    ASSERT_TRUE(second.is_number());
    EXPECT_LT(first.number(), second.number());
}

TEST_F(ClientPeerTest, TimeoutFailsOnlyThatCall) {
    RequestId id = client_->send("slow/method");
    next_request();

    EXPECT_THROW(client_->await(id, std::chrono::milliseconds(50)), ClientError);
    EXPECT_EQ(client_->pending_count(), 0u);

    // A late reply is dropped and the connection stays usable.
    ASSERT_TRUE(reply({{"jsonrpc", "2.0"}, {"id", id.to_json()}, {"result", {}}}));
    RequestId next = client_->send("other");
    auto request = next_request();
    EXPECT_EQ(request["method"], "other");
    ASSERT_TRUE(reply({{"jsonrpc", "2.0"}, {"id", next.to_json()}, {"result", {{"ok", true}}}}));
    auto response = client_->await(next, std::chrono::milliseconds(2000));
    ASSERT_TRUE(response.result.has_value());
    EXPECT_EQ((*response.result)["ok"], true);
}

TEST_F(ClientPeerTest, EndOfStreamFailsPendingCalls) {
    RequestId a = client_->send("a");
    RequestId b = client_->send("b");
    next_request();
    next_request();

    from_peer_.close_write();
    EXPECT_THROW(client_->await(a), ClientError);
    EXPECT_THROW(client_->await(b), ClientError);
    EXPECT_FALSE(client_->connected());
    EXPECT_THROW(client_->send("c"), ClientError);
}

TEST_F(ClientPeerTest, MalformedResponseWithMatchingIdFailsThatCall) {
    RequestId id = client_->send("x");
    next_request();
    ASSERT_TRUE(reply({{"jsonrpc", "2.0"}, {"id", id.to_json()}, {"result", 1}, {"error", {{"code", 1}}}}));
    EXPECT_THROW(client_->await(id, std::chrono::milliseconds(2000)), ClientError);
}

TEST_F(ClientPeerTest, ServerRequestIsAnsweredWithMethodNotFound) {
    ASSERT_TRUE(reply({{"jsonrpc", "2.0"}, {"id", "srv-1"}, {"method", "sampling/createMessage"}}));

    auto answer = next_request();
    EXPECT_EQ(answer["id"], "srv-1");
    EXPECT_EQ(answer["error"]["code"], mcp::error_code::method_not_found);
}

TEST_F(ClientPeerTest, InitializeSendsInitializedNotification) {
    auto pending = std::async(std::launch::async, [this]() { return client_->initialize(); });

    auto request = next_request();
    EXPECT_EQ(request["method"], "initialize");
    EXPECT_EQ(request["params"]["protocolVersion"], mcp::kProtocolVersion);
    EXPECT_EQ(request["params"]["clientInfo"]["name"], "mcp_stdio_client");

    ASSERT_TRUE(reply({{"jsonrpc", "2.0"},
                       {"id", request["id"]},
                       {"result",
                        {{"protocolVersion", "2024-11-05"},
                         {"capabilities", {{"tools", nlohmann::json::object()}}},
                         {"serverInfo", {{"name", "peer"}, {"version", "9"}}}}}}));

    auto result = pending.get();
    EXPECT_EQ(result.server_info.name, "peer");

    auto notification = next_request();
    EXPECT_EQ(notification["method"], "notifications/initialized");
    EXPECT_FALSE(notification.contains("id"));
}

TEST_F(ClientPeerTest, UnexpectedResultShapeIsClientError) {
    auto pending = std::async(std::launch::async, [this]() { return client_->list_tools(); });
    auto request = next_request();
    ASSERT_TRUE(reply({{"jsonrpc", "2.0"}, {"id", request["id"]}, {"result", {{"tools", "not-a-list"}}}}));
    EXPECT_THROW(pending.get(), ClientError);
}

TEST(Client, SendBeforeStartThrows) {
    Pipe in;
    Pipe out;
    Client client(in.release_read(), out.release_write());
    EXPECT_THROW(client.send("tools/list"), ClientError);
    EXPECT_EQ(client.pending_count(), 0u);

    client.start();
    EXPECT_NO_THROW(client.send("tools/list"));
    EXPECT_EQ(client.pending_count(), 1u);
}

TEST(ChildProcess, CatEchoesRequestBack) {
    mcp::ChildProcess child;
    ASSERT_TRUE(child.spawn({"cat"}));
    EXPECT_TRUE(child.running());

    {
        // cat hands our request back, the client answers it with an error,
        // and cat echoes that error back as the response to our call.
        Client client(child.release_stdout(), child.release_stdin());
        client.start();
        try {
            client.call("echo/me");
            FAIL() << "expected RpcCallError";
        } catch (const RpcCallError& err) {
            EXPECT_EQ(err.error().code, mcp::error_code::method_not_found);
        }
        client.close();
    }

    EXPECT_EQ(child.wait(), 0);
    EXPECT_FALSE(child.running());
}

TEST(ChildProcess, MissingProgramFailsToSpawn) {
    mcp::ChildProcess child;
    EXPECT_FALSE(child.spawn({"/nonexistent/mcp-server-binary"}));
    EXPECT_FALSE(child.running());
    EXPECT_EQ(child.wait(), -1);
}

TEST(ChildProcess, ExitCodeAndSignalAreReported) {
    mcp::ChildProcess exits;
    ASSERT_TRUE(exits.spawn({"sh", "-c", "exit 3"}));
    EXPECT_EQ(exits.wait(), 3);

    mcp::ChildProcess sleeper;
    ASSERT_TRUE(sleeper.spawn({"sleep", "30"}));
    sleeper.terminate(SIGKILL);
    EXPECT_EQ(sleeper.wait(), 128 + SIGKILL);
}
