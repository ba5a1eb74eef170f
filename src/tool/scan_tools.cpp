#include "tool_base.hpp"
#include "tool_registry.hpp"

#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <chrono>
#include <memory>
#include <string>

namespace mcp::tools {

namespace {

constexpr std::chrono::seconds kNmapTimeout{300};
constexpr std::chrono::seconds kWebScanTimeout{600};

struct NmapParams {
    std::string target;
    std::string scan_type;
    std::string ports;
};

class NmapScanTool final : public ToolHandler {
public:
    NmapScanTool()
        : ToolHandler({
              "nmap_scan",
              "Perform network scanning with nmap",
              {
                  {"target", ParamType::String, "Target host or IP address", std::nullopt},
                  {"scan_type", ParamType::String, "Scan type (stealth, full, quick)", "quick"},
                  {"ports", ParamType::String, "Port range (e.g., '80,443' or '1-1000')", ""},
              },
              {"target"},
          }) {}

protected:
    nlohmann::json handle(ToolContext& ctx, const nlohmann::json& arguments) const override {
        NmapParams params = parse(arguments);
        if (!ctx.runner.is_available("nmap")) {
            return not_installed("nmap");
        }

        exec::Command command;
        command.argv = {"nmap"};
        if (params.scan_type == "stealth") {
            command.argv.insert(command.argv.end(), {"-sS", "-T2"});
        } else if (params.scan_type == "full") {
            command.argv.insert(command.argv.end(), {"-sV", "-sC", "-A"});
        } else {
            command.argv.insert(command.argv.end(), {"-sV", "-sC"});
        }
        if (!params.ports.empty()) {
            command.argv.insert(command.argv.end(), {"-p", params.ports});
        }
        command.argv.push_back(params.target);
        command.timeout = kNmapTimeout;

        LOG4CPLUS_INFO(tool_logger(), "nmap " << params.scan_type << " scan of " << params.target);
        auto result = ctx.runner.run(command);

        nlohmann::json payload = {
            {"tool", "nmap"},
            {"target", params.target},
        };
        attach_result(payload, result);
        return payload;
    }

private:
    NmapParams parse(const nlohmann::json& arguments) const {
        NmapParams params;
        params.target = get_string(arguments, "target");
        reject_option_like("target", params.target);

        params.scan_type = get_string(arguments, "scan_type");
        if (params.scan_type != "quick" && params.scan_type != "stealth" && params.scan_type != "full") {
            LOG4CPLUS_DEBUG(tool_logger(), "Unknown scan_type '" << params.scan_type << "', using quick");
            params.scan_type = "quick";
        }

        params.ports = get_string(arguments, "ports");
        if (!params.ports.empty() && params.ports.front() == '-') {
            throw ParamError("ports", "Parameter 'ports' must not start with '-'");
        }
        return params;
    }
};

struct SqlmapParams {
    std::string url;
    int64_t level = 1;
    int64_t risk = 1;
};

class SqlmapScanTool final : public ToolHandler {
public:
    SqlmapScanTool()
        : ToolHandler({
              "sqlmap_scan",
              "Test for SQL injection vulnerabilities",
              {
                  {"url", ParamType::String, "Target URL to test", std::nullopt},
                  {"level", ParamType::Integer, "Scan level (1-5)", 1},
                  {"risk", ParamType::Integer, "Risk level (1-3)", 1},
              },
              {"url"},
          }) {}

protected:
    nlohmann::json handle(ToolContext& ctx, const nlohmann::json& arguments) const override {
        SqlmapParams params = parse(arguments);
        if (params.level < 1 || params.level > 5) {
            return {{"error", "Parameter 'level' must be between 1 and 5"}};
        }
        if (params.risk < 1 || params.risk > 3) {
            return {{"error", "Parameter 'risk' must be between 1 and 3"}};
        }
        if (!ctx.runner.is_available("sqlmap")) {
            return not_installed("sqlmap");
        }

        exec::Command command;
        command.argv = {
            "sqlmap", "-u", params.url, "--batch",
            "--level", std::to_string(params.level),
            "--risk", std::to_string(params.risk),
        };
        command.timeout = kWebScanTimeout;

        auto result = ctx.runner.run(command);

        nlohmann::json payload = {
            {"tool", "sqlmap"},
            {"url", params.url},
        };
        attach_result(payload, result);
        return payload;
    }

private:
    SqlmapParams parse(const nlohmann::json& arguments) const {
        SqlmapParams params;
        params.url = get_string(arguments, "url");
        reject_option_like("url", params.url);

        params.level = get_integer(arguments, "level");
        params.risk = get_integer(arguments, "risk");
        return params;
    }
};

struct GobusterParams {
    std::string url;
    std::string wordlist;
    std::string extensions;
};

class GobusterScanTool final : public ToolHandler {
public:
    GobusterScanTool()
        : ToolHandler({
              "gobuster_scan",
              "Directory/file brute-forcing with gobuster",
              {
                  {"url", ParamType::String, "Target URL", std::nullopt},
                  {"wordlist", ParamType::String, "Wordlist path", "/usr/share/wordlists/dirb/common.txt"},
                  {"extensions", ParamType::String, "File extensions to search (e.g., 'php,html,txt')", ""},
              },
              {"url"},
          }) {}

protected:
    nlohmann::json handle(ToolContext& ctx, const nlohmann::json& arguments) const override {
        GobusterParams params = parse(arguments);
        if (!ctx.runner.is_available("gobuster")) {
            return not_installed("gobuster");
        }

        exec::Command command;
        command.argv = {"gobuster", "dir", "-u", params.url, "-w", params.wordlist};
        if (!params.extensions.empty()) {
            command.argv.insert(command.argv.end(), {"-x", params.extensions});
        }
        command.timeout = kWebScanTimeout;

        auto result = ctx.runner.run(command);

        nlohmann::json payload = {
            {"tool", "gobuster"},
            {"url", params.url},
        };
        attach_result(payload, result);
        return payload;
    }

private:
    GobusterParams parse(const nlohmann::json& arguments) const {
        GobusterParams params;
        params.url = get_string(arguments, "url");
        reject_option_like("url", params.url);
        params.wordlist = get_string(arguments, "wordlist");
        reject_option_like("wordlist", params.wordlist);
        params.extensions = get_string(arguments, "extensions");
        if (!params.extensions.empty() && params.extensions.front() == '-') {
            throw ParamError("extensions", "Parameter 'extensions' must not start with '-'");
        }
        return params;
    }
};

} // namespace

void register_scan_tools(ToolRegistry& registry) {
    registry.add(std::make_unique<NmapScanTool>());
    registry.add(std::make_unique<SqlmapScanTool>());
    registry.add(std::make_unique<GobusterScanTool>());
}

} // namespace mcp::tools
