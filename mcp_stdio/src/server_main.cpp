#include "core_context.hpp"
#include "framing.hpp"
#include "handlers/handler_registry.hpp"
#include "logger.hpp"
#include "stdio_server.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

#include <signal.h>
#include <sys/prctl.h>
#include <unistd.h>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--config FILE] [--framing header|newline] [--workers N] [--max-queued N]"
                 " [--resource-root DIR]"
                 " [--pdeathsig] [-v|--version]"
              << std::endl;
}

bool parse_count(const char* text, size_t& out) {
    char* end = nullptr;
    long value = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || value < 0) {
        return false;
    }
    out = static_cast<size_t>(value);
    return true;
}

} // namespace

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    bool enable_pdeathsig = false;
    std::string config_path = "log4cplus.ini";
    mcp::ServerContext context;
    std::string framing_text;
    std::string workers_text;
    std::string queued_text;

    for (int i = 1; i < argc; ++i) {
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

        if (strcmp(argv[i], "--workers") == 0 && i + 1 < argc) {
            workers_text = argv[++i];
            continue;
        }

        if (strncmp(argv[i], "--workers=", 10) == 0) {
            workers_text = argv[i] + 10;
            continue;
        }

        if (strcmp(argv[i], "--max-queued") == 0 && i + 1 < argc) {
            queued_text = argv[++i];
            continue;
        }

        if (strncmp(argv[i], "--max-queued=", 13) == 0) {
            queued_text = argv[i] + 13;
            continue;
        }

        if (strcmp(argv[i], "--resource-root") == 0 && i + 1 < argc) {
            context.config.resource_root = argv[++i];
            continue;
        }

        if (strncmp(argv[i], "--resource-root=", 16) == 0) {
            context.config.resource_root = argv[i] + 16;
            continue;
        }

        std::cerr << "Unknown argument: " << argv[i] << std::endl;
        print_usage(argv[0]);
        return 2;
    }

    if (!framing_text.empty() && !mcp::parse_framing_mode(framing_text, context.config.framing)) {
        std::cerr << "Invalid --framing value: " << framing_text << std::endl;
        print_usage(argv[0]);
        return 2;
    }
    if (!workers_text.empty() && !parse_count(workers_text.c_str(), context.config.worker_count)) {
        std::cerr << "Invalid --workers value: " << workers_text << std::endl;
        print_usage(argv[0]);
        return 2;
    }

    if (!queued_text.empty() && !parse_count(queued_text.c_str(), context.config.max_queued_requests)) {
        std::cerr << "Invalid --max-queued value: " << queued_text << std::endl;
        print_usage(argv[0]);
        return 2;
    }

#ifdef __linux__
    if (enable_pdeathsig) {
        prctl(PR_SET_PDEATHSIG, SIGTERM);
        if (getppid() == 1) {
            return 1;
        }
    }
#endif

    // A vanished peer must surface as a failed write, not kill the process.
    signal(SIGPIPE, SIG_IGN);

    init_logging(config_path);

    LOG4CPLUS_INFO(core_logger(), "mcp_stdio_server starting");
    LOG4CPLUS_INFO(core_logger(), "Version: " << MCP_STDIO_VERSION_STRING << ", Commit: " << MCP_STDIO_GIT_VERSION_STRING);
    LOG4CPLUS_INFO(core_logger(), "Build Time: " << MCP_STDIO_BUILD_TIMESTAMP);
    LOG4CPLUS_INFO(core_logger(), "Protocol: " << context.config.protocol_version << ", framing: "
                                  << (context.config.framing == mcp::FramingMode::content_length ? "header" : "newline")
                                  << ", workers: " << context.config.worker_count
                                  << ", max queued: " << context.config.max_queued_requests);
    LOG4CPLUS_INFO(core_logger(), "Resource root: "
                                  << (context.config.resource_root.empty() ? "(disabled)" : context.config.resource_root));
    LOG4CPLUS_INFO(core_logger(), "Parent death signal: " << (enable_pdeathsig ? "enabled" : "disabled"));

    mcp::handlers::HandlerRegistry registry;
    mcp::handlers::register_default_handlers(registry);
    for (const auto& method : registry.methods()) {
        LOG4CPLUS_DEBUG(core_logger(), "Registered method " << method);
    }

    // owned, so a failed connection closes stdout and the client sees end of stream
    mcp::StdioServer server(STDIN_FILENO, STDOUT_FILENO, context, registry, true);
    mcp::ExitReason reason = server.run();

    LOG4CPLUS_INFO(core_logger(), "mcp_stdio_server exiting: " << mcp::to_string(reason) << " (session "
                                  << mcp::to_string(server.state()) << ")");

    switch (reason) {
        case mcp::ExitReason::end_of_stream:
        case mcp::ExitReason::stopped:
            return 0;
        case mcp::ExitReason::framing_error:
        case mcp::ExitReason::protocol_violation:
            return 1;
    }
    return 1;
}
