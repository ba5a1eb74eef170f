#include <gtest/gtest.h>

#include "dispatcher.hpp"
#include "logger.hpp"
#include "tool/tool_registry.hpp"
#include "test_helpers.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace {
class LoggingEnvironment final : public ::testing::Environment {
public:
	void SetUp() override {
		static std::once_flag once;
		std::call_once(once, []() { init_logging("../src/log4cplus.ini"); });
	}
};

::testing::Environment* const kLoggingEnvironment = ::testing::AddGlobalTestEnvironment(new LoggingEnvironment());

class DispatcherTest : public ::testing::Test {
protected:
	mcp::tools::ToolRegistry registry = mcp::tools::build_default_registry();
	FakeCommandRunner runner;
	mcp::Dispatcher dispatcher{registry, runner};

	int error_code(const mcp::Response& response) const {
		return response.error ? static_cast<int>(response.error->code) : 0;
	}

	std::string error_message(const mcp::Response& response) const {
		return response.error ? response.error->message : "";
	}
};
}

TEST_F(DispatcherTest, InitializeReportsServerInfo) {
	auto response = dispatcher.dispatch(make_request("initialize", nullptr, 0));
	ASSERT_TRUE(response.result.has_value());
	EXPECT_EQ(response.id, 0);
	EXPECT_EQ((*response.result)["protocolVersion"], "2024-11-05");
	EXPECT_TRUE((*response.result)["capabilities"]["tools"].is_object());
	EXPECT_EQ((*response.result)["serverInfo"]["name"], "kali-tools-mcp-server");
	EXPECT_EQ((*response.result)["serverInfo"]["version"], VERSION_STRING);
}

TEST_F(DispatcherTest, ToolsListReturnsWholeCatalog) {
	auto response = dispatcher.dispatch(make_request("tools/list", nullptr, 1));
	ASSERT_TRUE(response.result.has_value());
	EXPECT_EQ(response.id, 1);
	EXPECT_EQ((*response.result)["tools"].size(), 8u);
}

TEST_F(DispatcherTest, UnknownMethodIsMethodNotFound) {
	auto response = dispatcher.dispatch(make_request("resources/list", nullptr, "x"));
	EXPECT_EQ(response.id, "x");
	EXPECT_EQ(error_code(response), -32601);
	EXPECT_EQ(error_message(response), "Unknown method: resources/list");
}

TEST_F(DispatcherTest, MissingMethodIsMethodNotFound) {
	auto response = dispatcher.dispatch(make_request("null", nullptr, 4));
	EXPECT_EQ(error_code(response), -32601);
}

TEST_F(DispatcherTest, UnknownToolIsToolNotFound) {
	auto response = dispatcher.dispatch(make_tool_call("metasploit", nlohmann::json::object(), 3));
	EXPECT_EQ(error_code(response), -32001);
	EXPECT_EQ(error_message(response), "Unknown tool: metasploit");
	EXPECT_TRUE(runner.calls.empty());
}

TEST_F(DispatcherTest, MissingToolNameIsInvalidParams) {
	auto response = dispatcher.dispatch(make_request("tools/call", {{"arguments", nlohmann::json::object()}}, 5));
	EXPECT_EQ(error_code(response), -32602);
	EXPECT_EQ(error_message(response), "Tool name is required");
}

TEST_F(DispatcherTest, NonObjectArgumentsIsInvalidParams) {
	auto response = dispatcher.dispatch(make_request("tools/call", {{"name", "nmap_scan"}, {"arguments", "x"}}, 6));
	EXPECT_EQ(error_code(response), -32602);
}

TEST_F(DispatcherTest, MissingRequiredParameterNamesField) {
	runner.installed = {"nmap"};
	auto response = dispatcher.dispatch(make_tool_call("nmap_scan", nlohmann::json::object(), nullptr));
	EXPECT_TRUE(response.id.is_null());
	EXPECT_EQ(error_code(response), -32602);
	EXPECT_NE(error_message(response).find("target"), std::string::npos);
	EXPECT_TRUE(runner.calls.empty());
}

TEST_F(DispatcherTest, WrongParameterTypeIsInvalidParams) {
	runner.installed = {"sqlmap"};
	auto response = dispatcher.dispatch(make_tool_call("sqlmap_scan", {{"url", "http://t"}, {"level", "high"}}));
	EXPECT_EQ(error_code(response), -32602);
	EXPECT_NE(error_message(response).find("level"), std::string::npos);
}

TEST_F(DispatcherTest, OptionLikeTargetIsInvalidParams) {
	runner.installed = {"nmap"};
	auto response = dispatcher.dispatch(make_tool_call("nmap_scan", {{"target", "-oN/etc/passwd"}}));
	EXPECT_EQ(error_code(response), -32602);
	EXPECT_TRUE(runner.calls.empty());
}

TEST_F(DispatcherTest, NmapQuickScanBuildsCommand) {
	runner.installed = {"nmap"};
	runner.next_result.output = "PORT 22/tcp open";
	auto response = dispatcher.dispatch(make_tool_call("nmap_scan", {{"target", "10.0.0.1"}}, 9));
	ASSERT_TRUE(response.result.has_value());
	EXPECT_EQ(response.id, 9);

	ASSERT_EQ(runner.calls.size(), 1u);
	std::vector<std::string> expected = {"nmap", "-sV", "-sC", "10.0.0.1"};
	EXPECT_EQ(runner.calls[0].argv, expected);
	EXPECT_EQ(runner.calls[0].timeout.count(), 300);

	const auto& content = (*response.result)["content"];
	ASSERT_EQ(content.size(), 1u);
	EXPECT_EQ(content[0]["type"], "text");

	auto payload = tool_payload(response);
	EXPECT_EQ(payload["tool"], "nmap");
	EXPECT_EQ(payload["target"], "10.0.0.1");
	EXPECT_EQ(payload["output"], "PORT 22/tcp open");
	EXPECT_TRUE(payload["error"].is_null());
}

TEST_F(DispatcherTest, NmapStealthWithPorts) {
	runner.installed = {"nmap"};
	dispatcher.dispatch(make_tool_call("nmap_scan", {{"target", "host"}, {"scan_type", "stealth"}, {"ports", "80,443"}}));
	ASSERT_EQ(runner.calls.size(), 1u);
	std::vector<std::string> expected = {"nmap", "-sS", "-T2", "-p", "80,443", "host"};
	EXPECT_EQ(runner.calls[0].argv, expected);
}

TEST_F(DispatcherTest, NmapUnknownScanTypeFallsBackToQuick) {
	runner.installed = {"nmap"};
	auto response = dispatcher.dispatch(make_tool_call("nmap_scan", {{"target", "host"}, {"scan_type", "udp"}}));
	ASSERT_TRUE(response.result.has_value());
	ASSERT_EQ(runner.calls.size(), 1u);
	std::vector<std::string> expected = {"nmap", "-sV", "-sC", "host"};
	EXPECT_EQ(runner.calls[0].argv, expected);
}

TEST_F(DispatcherTest, SqlmapBuildsCommandWithLevels) {
	runner.installed = {"sqlmap"};
	dispatcher.dispatch(make_tool_call("sqlmap_scan", {{"url", "http://t/?id=1"}, {"level", 3}, {"risk", 2}}));
	ASSERT_EQ(runner.calls.size(), 1u);
	std::vector<std::string> expected = {"sqlmap", "-u", "http://t/?id=1", "--batch", "--level", "3", "--risk", "2"};
	EXPECT_EQ(runner.calls[0].argv, expected);
	EXPECT_EQ(runner.calls[0].timeout.count(), 600);
}

TEST_F(DispatcherTest, SqlmapLevelOutOfRangeIsPayloadError) {
	runner.installed = {"sqlmap"};
	auto response = dispatcher.dispatch(make_tool_call("sqlmap_scan", {{"url", "http://t"}, {"level", 9}}));
	ASSERT_TRUE(response.result.has_value());
	EXPECT_EQ(tool_payload(response)["error"], "Parameter 'level' must be between 1 and 5");
	EXPECT_TRUE(runner.calls.empty());
}

TEST_F(DispatcherTest, SqlmapRiskOutOfRangeIsPayloadError) {
	runner.installed = {"sqlmap"};
	auto response = dispatcher.dispatch(make_tool_call("sqlmap_scan", {{"url", "http://t"}, {"risk", 0}}));
	ASSERT_TRUE(response.result.has_value());
	EXPECT_EQ(tool_payload(response)["error"], "Parameter 'risk' must be between 1 and 3");
	EXPECT_TRUE(runner.calls.empty());
}

TEST_F(DispatcherTest, SqlmapAcceptsNumericStrings) {
	runner.installed = {"sqlmap"};
	auto response = dispatcher.dispatch(make_tool_call("sqlmap_scan", {{"url", "http://t"}, {"level", "3"}, {"risk", "2"}}));
	ASSERT_TRUE(response.result.has_value());
	ASSERT_EQ(runner.calls.size(), 1u);
	std::vector<std::string> expected = {"sqlmap", "-u", "http://t", "--batch", "--level", "3", "--risk", "2"};
	EXPECT_EQ(runner.calls[0].argv, expected);
}

TEST_F(DispatcherTest, GobusterWithExtensions) {
	runner.installed = {"gobuster"};
	dispatcher.dispatch(make_tool_call("gobuster_scan", {{"url", "http://t"}, {"extensions", "php,txt"}}));
	ASSERT_EQ(runner.calls.size(), 1u);
	std::vector<std::string> expected = {
		"gobuster", "dir", "-u", "http://t", "-w", "/usr/share/wordlists/dirb/common.txt", "-x", "php,txt",
	};
	EXPECT_EQ(runner.calls[0].argv, expected);
}

TEST_F(DispatcherTest, MissingBinaryIsPayloadNotProtocolError) {
	auto response = dispatcher.dispatch(make_tool_call("gobuster_scan", {{"url", "http://t"}}));
	ASSERT_TRUE(response.result.has_value());
	auto payload = tool_payload(response);
	EXPECT_EQ(payload["error"], "gobuster not found. Install with: just install-kali-tools");
	EXPECT_TRUE(runner.calls.empty());
}

TEST_F(DispatcherTest, ExecutionFailureIsPayloadNotProtocolError) {
	runner.installed = {"nmap"};
	runner.next_result.success = false;
	runner.next_result.output = "";
	runner.next_result.error = "Command timed out after 300 seconds";
	runner.next_result.failure = mcp::exec::FailureKind::TimedOut;

	auto response = dispatcher.dispatch(make_tool_call("nmap_scan", {{"target", "host"}}));
	ASSERT_TRUE(response.result.has_value());
	EXPECT_EQ(tool_payload(response)["error"], "Command timed out after 300 seconds");
}

TEST_F(DispatcherTest, HandlerExceptionIsInternalError) {
	runner.installed = {"nmap"};
	runner.throw_on_run = true;
	auto response = dispatcher.dispatch(make_tool_call("nmap_scan", {{"target", "host"}}, 11));
	EXPECT_EQ(response.id, 11);
	EXPECT_EQ(error_code(response), -32603);
	EXPECT_NE(error_message(response).find("runner exploded"), std::string::npos);
}

TEST_F(DispatcherTest, HashIdentifyHeuristicWithoutBinaries) {
	auto response = dispatcher.dispatch(
		make_tool_call("hash_identify", {{"hash", "5f4dcc3b5aa765d61d8327deb882cf99"}}, 2));
	ASSERT_TRUE(response.result.has_value());
	EXPECT_EQ(response.id, 2);

	auto payload = tool_payload(response);
	EXPECT_EQ(payload["length"], 32);
	EXPECT_EQ(payload["possible_types"], nlohmann::json::array({"MD5"}));
	EXPECT_EQ(payload["output"], "Hash length: 32, Possible types: MD5");
	EXPECT_TRUE(runner.calls.empty());
}

TEST_F(DispatcherTest, MissingArgumentsDefaultsToEmptyObject) {
	auto response = dispatcher.dispatch(make_request("tools/call", {{"name", "wifi_scan"}}, 12));
	ASSERT_TRUE(response.result.has_value());
	EXPECT_EQ(tool_payload(response)["error"], "WiFi scanning tools not found. Install wireless-tools or iw");
}
