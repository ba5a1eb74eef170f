#include "dispatcher.hpp"
#include "logger.hpp"
#include "process_executor.hpp"
#include "stdio_server.hpp"
#include "tool/tool_registry.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <atomic>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>

#include <signal.h>
#include <sys/prctl.h>
#include <unistd.h>

namespace {

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]" << std::endl;
    std::cout << "  -v, --version        print version information and exit" << std::endl;
    std::cout << "  -h, --help           print this help and exit" << std::endl;
    std::cout << "  --config <path>      log4cplus configuration file (default: log4cplus.ini)" << std::endl;
    std::cout << "  --pdeathsig          exit when the parent process dies" << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    bool enable_pdeathsig = false;
    std::string config_path = "log4cplus.ini";

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "Version: " << VERSION_STRING << std::endl;
            std::cout << "Commit: " << GIT_VERSION_STRING << std::endl;
            std::cout << "Build Time: " << BUILD_TIMESTAMP << std::endl;
            return 0;
        }

        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
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

        std::cerr << "Unknown option: " << argv[i] << std::endl;
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

    init_logging(config_path);

    LOG4CPLUS_INFO(core_logger(), "kali_mcp_server starting");
    LOG4CPLUS_INFO(core_logger(), "Version: " << VERSION_STRING << ", Commit: " << GIT_VERSION_STRING);
    LOG4CPLUS_INFO(core_logger(), "Build Time: " << BUILD_TIMESTAMP);
    LOG4CPLUS_INFO(core_logger(), "Parent death signal: " << (enable_pdeathsig ? "enabled" : "disabled"));

    const std::atomic<bool>& interrupted = mcp::install_interrupt_handlers();

    try {
        mcp::tools::ToolRegistry registry = mcp::tools::build_default_registry();
        mcp::exec::ProcessExecutor executor;
        mcp::Dispatcher dispatcher(registry, executor);

        std::string tool_names;
        for (const auto& name : registry.names()) {
            tool_names += (tool_names.empty() ? "" : ", ") + name;
        }
        LOG4CPLUS_INFO(core_logger(), "Registered " << registry.size() << " tools: " << tool_names);

        // stdin is read through a polling buffer so SIGINT/SIGTERM end an idle loop.
        mcp::InterruptibleFdBuf stdin_buf(STDIN_FILENO, interrupted);
        std::istream input(&stdin_buf);
        mcp::StdioServer server(input, std::cout, [&dispatcher](const mcp::Request& request) {
            return dispatcher.dispatch(request);
        }, interrupted);
        return server.run();
    } catch (const std::exception& exc) {
        LOG4CPLUS_FATAL(core_logger(), "Startup failed: " << exc.what());
        return 1;
    }
}
