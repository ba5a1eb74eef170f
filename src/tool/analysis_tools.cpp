#include "output_parsers.hpp"
#include "tool_base.hpp"
#include "tool_registry.hpp"

#include "../json_codec.hpp"
#include "../logger.hpp"

#include <httplib.h>
#include <log4cplus/loggingmacros.h>

#include <ctime>
#include <memory>
#include <stdexcept>
#include <string>

namespace mcp::tools {

namespace {

constexpr const char* kAnalysisModel = "llama-3-8b";
constexpr double kAnalysisTemperature = 0.3;
constexpr time_t kConnectTimeoutSec = 10;
constexpr time_t kReadTimeoutSec = 60;

const char* system_prompt_for(const std::string& analysis_type) {
    if (analysis_type == "vulnerability") {
        return "You are a vulnerability assessment expert. Analyze the data and identify security vulnerabilities.";
    }
    if (analysis_type == "report") {
        return "You are a cybersecurity consultant. Generate a professional security assessment report.";
    }
    return "You are a cybersecurity expert. Analyze the provided data and provide security insights.";
}

struct AnalyzeParams {
    std::string data;
    std::string analysis_type;
    std::string localai_url;
};

class AnalyzeWithLocalAiTool final : public ToolHandler {
public:
    AnalyzeWithLocalAiTool()
        : ToolHandler({
              "analyze_with_localai",
              "Send tool output to LocalAI for analysis",
              {
                  {"data", ParamType::String, "Data to analyze", std::nullopt},
                  {"analysis_type", ParamType::String, "Type of analysis (security, vulnerability, report)", "security"},
                  {"localai_url", ParamType::String, "LocalAI API URL", "http://localhost:8080"},
              },
              {"data"},
          }) {}

protected:
    nlohmann::json handle(ToolContext&, const nlohmann::json& arguments) const override {
        AnalyzeParams params = parse(arguments);
        if (params.localai_url.rfind("http://", 0) != 0 && params.localai_url.rfind("https://", 0) != 0) {
            return connect_failure("unsupported URL " + params.localai_url);
        }

        nlohmann::json request_body = {
            {"model", kAnalysisModel},
            {"messages", nlohmann::json::array({
                {{"role", "system"}, {"content", system_prompt_for(params.analysis_type)}},
                {{"role", "user"}, {"content", params.data}},
            })},
            {"temperature", kAnalysisTemperature},
        };

        auto [base, prefix] = split_base_url(params.localai_url);
        std::unique_ptr<httplib::Client> cli;
        try {
            cli = std::make_unique<httplib::Client>(base);
        } catch (const std::invalid_argument& exc) {
            return connect_failure(exc.what());
        }
        if (!cli->is_valid()) {
            return connect_failure("invalid URL " + params.localai_url);
        }
        cli->set_connection_timeout(kConnectTimeoutSec);
        cli->set_read_timeout(kReadTimeoutSec);

        LOG4CPLUS_INFO(tool_logger(), "Requesting " << params.analysis_type << " analysis from " << base);
        auto res = cli->Post(prefix + "/v1/chat/completions",
                            request_body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                            "application/json");
        if (!res) {
            return connect_failure(httplib::to_string(res.error()));
        }
        if (res->status != 200) {
            return connect_failure("HTTP status " + std::to_string(res->status));
        }

        nlohmann::json body = nlohmann::json::parse(res->body, nullptr, false);
        if (body.is_discarded()) {
            return connect_failure("response is not valid JSON");
        }

        std::string content;
        const auto choices = body.find("choices");
        if (choices != body.end() && choices->is_array() && !choices->empty()) {
            const auto& first = choices->front();
            if (first.is_object() && first.contains("message") && first["message"].is_object()) {
                content = codec::as_string(first["message"].value("content", nlohmann::json()), "");
            }
        }

        return {
            {"tool", "localai_analysis"},
            {"analysis_type", params.analysis_type},
            {"output", content},
        };
    }

private:
    AnalyzeParams parse(const nlohmann::json& arguments) const {
        AnalyzeParams params;
        params.data = get_string(arguments, "data");
        params.analysis_type = get_string(arguments, "analysis_type");
        params.localai_url = get_string(arguments, "localai_url");
        return params;
    }

    static nlohmann::json connect_failure(const std::string& detail) {
        LOG4CPLUS_WARN(tool_logger(), "LocalAI request failed: " << detail);
        return {{"error", "Failed to connect to LocalAI: " + detail}};
    }
};

} // namespace

void register_analysis_tools(ToolRegistry& registry) {
    registry.add(std::make_unique<AnalyzeWithLocalAiTool>());
}

} // namespace mcp::tools
