#include "child_process.hpp"
#include "client.hpp"
#include "core_context.hpp"
#include "logger.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include <signal.h>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--config FILE] [--framing header|newline] [--timeout-ms N] [--pdeathsig]"
                 " SERVER [SERVER_ARGS...]"
              << std::endl;
}

void print_section(const char* title, const nlohmann::json& value) {
    std::cout << "== " << title << " ==" << std::endl;
    std::cout << value.dump(2) << std::endl;
}

void run_session(mcp::Client& client) {
    mcp::InitializeResult init = client.initialize();
    print_section("initialize", init);

    if (init.capabilities.tools) {
        print_section("tools/list", client.list_tools());
        print_section("tools/call random_string", client.call_tool("random_string", {{"length", 16}}));
    }
    if (init.capabilities.prompts) {
        print_section("prompts/list", client.list_prompts());
        print_section("prompts/get query", client.get_prompt("query"));
    }
    if (init.capabilities.resources) {
        print_section("resources/list", client.list_resources());
        print_section("resources/templates/list", client.list_resource_templates());
        print_section("resources/read", client.read_resource("data://random_data?length=32"));
    }
}

} // namespace

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    bool enable_pdeathsig = false;
    std::string config_path = "log4cplus.ini";
    std::string framing_text;
    mcp::ClientConfig config;
    std::vector<std::string> server_argv;

    int i = 1;
    for (; i < argc; ++i) {
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "Version: " << MCP_STDIO_VERSION_STRING << std::endl;
            std::cout << "Commit: " << MCP_STDIO_GIT_VERSION_STRING << std::endl;
            std::cout << "Build Time: " << MCP_STDIO_BUILD_TIMESTAMP << std::endl;
            return 0;
        }

        if (strcmp(argv[i], "--pdeathsig") == 0) {
            enable_pdeathsig = true;
            continue;
        }

        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
            continue;
        }

        if (strncmp(argv[i], "--config=", 9) == 0) {
            config_path = argv[i] + 9;
            continue;
        }

        if (strcmp(argv[i], "--framing") == 0 && i + 1 < argc) {
            framing_text = argv[++i];
            continue;
        }

        if (strncmp(argv[i], "--framing=", 10) == 0) {
            framing_text = argv[i] + 10;
            continue;
        }

        if (strcmp(argv[i], "--timeout-ms") == 0 && i + 1 < argc) {
            config.default_timeout_ms = std::atoi(argv[++i]);
            continue;
        }

        if (strncmp(argv[i], "--timeout-ms=", 13) == 0) {
            config.default_timeout_ms = std::atoi(argv[i] + 13);
            continue;
        }

        if (argv[i][0] == '-') {
            std::cerr << "Unknown argument: " << argv[i] << std::endl;
            print_usage(argv[0]);
            return 2;
        }
        break;
    }
    for (; i < argc; ++i) {
        server_argv.emplace_back(argv[i]);
    }

    if (server_argv.empty()) {
        print_usage(argv[0]);
        return 2;
    }
    if (!framing_text.empty() && !mcp::parse_framing_mode(framing_text, config.framing)) {
        std::cerr << "Invalid --framing value: " << framing_text << std::endl;
        print_usage(argv[0]);
        return 2;
    }
    if (config.default_timeout_ms < 0) {
        config.default_timeout_ms = 0;
    }

    signal(SIGPIPE, SIG_IGN);

    init_logging(config_path);

    LOG4CPLUS_INFO(core_logger(), "mcp_stdio_client starting");
    LOG4CPLUS_INFO(core_logger(), "Version: " << MCP_STDIO_VERSION_STRING << ", Commit: " << MCP_STDIO_GIT_VERSION_STRING);
    LOG4CPLUS_INFO(core_logger(), "Server: " << server_argv.front() << ", timeout: " << config.default_timeout_ms << " ms");

    mcp::ChildProcess child;
    if (!child.spawn(server_argv, enable_pdeathsig)) {
        LOG4CPLUS_ERROR(core_logger(), "Failed to start server " << server_argv.front());
        return 1;
    }

    int result = 0;
    {
        mcp::Client client(child.release_stdout(), child.release_stdin(), config);
        client.start();

        try {
            run_session(client);
        } catch (const mcp::RpcCallError& exc) {
            LOG4CPLUS_ERROR(core_logger(), "Server returned error " << exc.error().code << ": " << exc.error().message);
            result = 1;
        } catch (const mcp::ClientError& exc) {
            LOG4CPLUS_ERROR(core_logger(), "Session failed: " << exc.what());
            result = 1;
        }

        client.close();
        int status = child.wait();
        LOG4CPLUS_INFO(core_logger(), "Server exited with status " << status);
        if (status != 0 && result == 0) {
            result = 1;
        }
    }

    return result;
}
