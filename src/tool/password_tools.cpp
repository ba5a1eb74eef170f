#include "output_parsers.hpp"
#include "tool_base.hpp"
#include "tool_registry.hpp"

#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace mcp::tools {

namespace {

constexpr std::chrono::seconds kIdentifyTimeout{30};
constexpr std::chrono::seconds kCrackTimeout{3600};

struct HashIdentifyParams {
    std::string hash;
};

class HashIdentifyTool final : public ToolHandler {
public:
    HashIdentifyTool()
        : ToolHandler({
              "hash_identify",
              "Identify hash type",
              {
                  {"hash", ParamType::String, "Hash to identify", std::nullopt},
              },
              {"hash"},
          }) {}

protected:
    nlohmann::json handle(ToolContext& ctx, const nlohmann::json& arguments) const override {
        HashIdentifyParams params;
        params.hash = get_string(arguments, "hash");
        if (params.hash.empty()) {
            return heuristic_payload(params.hash);
        }

        if (ctx.runner.is_available("hashid")) {
            reject_option_like("hash", params.hash);
            exec::Command command;
            command.argv = {"hashid", params.hash};
            command.timeout = kIdentifyTimeout;
            return with_result("hashid", params.hash, ctx.runner.run(command));
        }

        if (ctx.runner.is_available("hash-identifier")) {
            exec::Command command;
            command.argv = {"hash-identifier"};
            command.input = params.hash + "\n";
            command.timeout = kIdentifyTimeout;
            return with_result("hash-identifier", params.hash, ctx.runner.run(command));
        }

        LOG4CPLUS_DEBUG(tool_logger(), "No hash identifier installed, using length/prefix heuristics");
        return heuristic_payload(params.hash);
    }

private:
    static nlohmann::json with_result(const char* tool, const std::string& hash,
                                      const exec::ExecutionResult& result) {
        nlohmann::json payload = {
            {"tool", tool},
            {"hash", hash},
        };
        attach_result(payload, result);
        return payload;
    }

    static nlohmann::json heuristic_payload(const std::string& hash) {
        auto types = identify_hash_types(hash);

        std::string summary = "Hash length: " + std::to_string(hash.size()) + ", Possible types: ";
        if (types.empty()) {
            summary += "Unknown";
        } else {
            for (std::size_t i = 0; i < types.size(); ++i) {
                summary += (i > 0 ? ", " : "") + types[i];
            }
        }

        nlohmann::json possible_types = types;
        if (types.empty()) {
            possible_types = nlohmann::json::array({"Unknown - install hashid for better detection"});
        }

        return {
            {"tool", "hash_identify"},
            {"hash", hash},
            {"length", hash.size()},
            {"possible_types", possible_types},
            {"output", summary},
        };
    }
};

struct JohnParams {
    std::string hash_file;
    std::string wordlist;
};

class JohnCrackTool final : public ToolHandler {
public:
    JohnCrackTool()
        : ToolHandler({
              "john_crack",
              "Crack password hash with John the Ripper",
              {
                  {"hash_file", ParamType::String, "Path to hash file", std::nullopt},
                  {"wordlist", ParamType::String, "Wordlist path", "/usr/share/wordlists/rockyou.txt"},
              },
              {"hash_file"},
          }) {}

protected:
    nlohmann::json handle(ToolContext& ctx, const nlohmann::json& arguments) const override {
        JohnParams params;
        params.hash_file = get_string(arguments, "hash_file");
        reject_option_like("hash_file", params.hash_file);
        params.wordlist = get_string(arguments, "wordlist");
        reject_option_like("wordlist", params.wordlist);

        if (!ctx.runner.is_available("john")) {
            return not_installed("john");
        }

        std::error_code ec;
        if (!std::filesystem::exists(params.hash_file, ec)) {
            return {{"error", "Hash file not found: " + params.hash_file}};
        }
        if (!std::filesystem::exists(params.wordlist, ec)) {
            return {{"error", "Wordlist not found: " + params.wordlist}};
        }

        exec::Command command;
        command.argv = {"john", "--wordlist=" + params.wordlist, params.hash_file};
        command.timeout = kCrackTimeout;

        LOG4CPLUS_INFO(tool_logger(), "john cracking " << params.hash_file << " with " << params.wordlist);
        auto result = ctx.runner.run(command);

        nlohmann::json payload = {
            {"tool", "john"},
            {"hash_file", params.hash_file},
            {"wordlist", params.wordlist},
        };
        attach_result(payload, result);
        return payload;
    }
};

} // namespace

void register_password_tools(ToolRegistry& registry) {
    registry.add(std::make_unique<HashIdentifyTool>());
    registry.add(std::make_unique<JohnCrackTool>());
}

} // namespace mcp::tools
