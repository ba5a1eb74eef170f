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

constexpr std::chrono::seconds kWifiScanTimeout{30};
constexpr std::chrono::seconds kCrackTimeout{3600};

class WifiScanTool final : public ToolHandler {
public:
    WifiScanTool()
        : ToolHandler({
              "wifi_scan",
              "Scan for WiFi networks",
              {
                  {"interface", ParamType::String, "WiFi interface (e.g., wlan0)", "wlan0"},
              },
              {},
          }) {}

protected:
    nlohmann::json handle(ToolContext& ctx, const nlohmann::json& arguments) const override {
        std::string interface_name = get_string(arguments, "interface");
        reject_option_like("interface", interface_name);

        exec::Command command;
        if (ctx.runner.is_available("iwlist")) {
            command.argv = {"iwlist", interface_name, "scan"};
        } else if (ctx.runner.is_available("iw")) {
            command.argv = {"iw", "dev", interface_name, "scan"};
        } else {
            LOG4CPLUS_WARN(tool_logger(), "Neither iwlist nor iw is installed");
            return {{"error", "WiFi scanning tools not found. Install wireless-tools or iw"}};
        }
        command.timeout = kWifiScanTimeout;

        auto result = ctx.runner.run(command);

        nlohmann::json payload = {
            {"tool", "wifi_scan"},
            {"interface", interface_name},
        };
        attach_result(payload, result);
        return payload;
    }
};

struct AircrackParams {
    std::string capture_file;
    std::string bssid;
    std::string wordlist;
};

class AircrackCrackTool final : public ToolHandler {
public:
    AircrackCrackTool()
        : ToolHandler({
              "aircrack_crack",
              "Crack WiFi password with aircrack-ng",
              {
                  {"capture_file", ParamType::String, "Path to .cap file", std::nullopt},
                  {"bssid", ParamType::String, "BSSID of target network", std::nullopt},
                  {"wordlist", ParamType::String, "Wordlist path", "/usr/share/wordlists/rockyou.txt"},
              },
              {"capture_file", "bssid"},
          }) {}

protected:
    nlohmann::json handle(ToolContext& ctx, const nlohmann::json& arguments) const override {
        AircrackParams params = parse(arguments);
        if (!ctx.runner.is_available("aircrack-ng")) {
            return not_installed("aircrack-ng");
        }

        std::error_code ec;
        if (!std::filesystem::exists(params.capture_file, ec)) {
            return {{"error", "Capture file not found: " + params.capture_file}};
        }
        if (!std::filesystem::exists(params.wordlist, ec)) {
            return {{"error", "Wordlist not found: " + params.wordlist}};
        }

        exec::Command command;
        command.argv = {"aircrack-ng", "-w", params.wordlist, "-b", params.bssid, params.capture_file};
        command.timeout = kCrackTimeout;

        LOG4CPLUS_INFO(tool_logger(), "aircrack-ng against " << params.bssid << " using " << params.capture_file);
        auto result = ctx.runner.run(command);

        nlohmann::json password = nullptr;
        if (result.success) {
            if (auto key = extract_recovered_key(result.output)) {
                password = *key;
            }
        }

        nlohmann::json payload = {
            {"tool", "aircrack-ng"},
            {"capture_file", params.capture_file},
            {"bssid", params.bssid},
            {"wordlist", params.wordlist},
            {"password", password},
        };
        attach_result(payload, result);
        return payload;
    }

private:
    AircrackParams parse(const nlohmann::json& arguments) const {
        AircrackParams params;
        params.capture_file = get_string(arguments, "capture_file");
        reject_option_like("capture_file", params.capture_file);
        params.bssid = get_string(arguments, "bssid");
        reject_option_like("bssid", params.bssid);
        params.wordlist = get_string(arguments, "wordlist");
        reject_option_like("wordlist", params.wordlist);
        return params;
    }
};

} // namespace

void register_wireless_tools(ToolRegistry& registry) {
    registry.add(std::make_unique<WifiScanTool>());
    registry.add(std::make_unique<AircrackCrackTool>());
}

} // namespace mcp::tools
