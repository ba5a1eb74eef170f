#include <gtest/gtest.h>

#include "logger.hpp"
#include "tool/tool_registry.hpp"
#include "test_helpers.hpp"

#include <memory>
#include <mutex>
#include <stdexcept>
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

class EchoTool final : public mcp::tools::ToolHandler {
public:
	explicit EchoTool(const std::string& name)
		: ToolHandler({name, "echo arguments", {}, {}}) {}

protected:
	nlohmann::json handle(mcp::tools::ToolContext&, const nlohmann::json& arguments) const override {
		return arguments;
	}
};

const nlohmann::json* find_tool(const nlohmann::json& tools, const std::string& name) {
	for (const auto& tool : tools) {
		if (tool["name"] == name) {
			return &tool;
		}
	}
	return nullptr;
}
}

TEST(ToolRegistry, DefaultCatalogHasEightToolsInOrder) {
	auto registry = mcp::tools::build_default_registry();
	std::vector<std::string> expected = {
		"nmap_scan", "sqlmap_scan", "gobuster_scan", "hash_identify",
		"john_crack", "analyze_with_localai", "wifi_scan", "aircrack_crack",
	};
	EXPECT_EQ(registry.size(), 8u);
	EXPECT_EQ(registry.names(), expected);
}

TEST(ToolRegistry, ListedNamesAreExactlyTheCallableNames) {
	auto registry = mcp::tools::build_default_registry();
	auto tools = registry.descriptors_json();
	ASSERT_EQ(tools.size(), registry.size());
	for (const auto& tool : tools) {
		EXPECT_NE(registry.find(tool["name"].get<std::string>()), nullptr);
	}
	EXPECT_EQ(registry.find("metasploit"), nullptr);
}

TEST(ToolRegistry, NmapSchemaShape) {
	auto tools = mcp::tools::build_default_registry().descriptors_json();
	const auto* nmap = find_tool(tools, "nmap_scan");
	ASSERT_NE(nmap, nullptr);

	const auto& schema = (*nmap)["inputSchema"];
	EXPECT_EQ(schema["type"], "object");
	EXPECT_EQ(schema["required"], nlohmann::json::array({"target"}));
	EXPECT_EQ(schema["properties"]["target"]["type"], "string");
	EXPECT_EQ(schema["properties"]["scan_type"]["default"], "quick");
	EXPECT_FALSE(schema["properties"]["target"].contains("default"));
}

TEST(ToolRegistry, SqlmapLevelIsIntegerWithDefault) {
	auto tools = mcp::tools::build_default_registry().descriptors_json();
	const auto* sqlmap = find_tool(tools, "sqlmap_scan");
	ASSERT_NE(sqlmap, nullptr);
	const auto& level = (*sqlmap)["inputSchema"]["properties"]["level"];
	EXPECT_EQ(level["type"], "integer");
	EXPECT_EQ(level["default"], 1);
}

TEST(ToolRegistry, WifiScanHasNoRequiredList) {
	auto tools = mcp::tools::build_default_registry().descriptors_json();
	const auto* wifi = find_tool(tools, "wifi_scan");
	ASSERT_NE(wifi, nullptr);
	EXPECT_FALSE((*wifi)["inputSchema"].contains("required"));
	EXPECT_EQ((*wifi)["inputSchema"]["properties"]["interface"]["default"], "wlan0");
}

TEST(ToolRegistry, DuplicateNameIsRejected) {
	mcp::tools::ToolRegistry registry;
	registry.add(std::make_unique<EchoTool>("echo"));
	EXPECT_THROW(registry.add(std::make_unique<EchoTool>("echo")), std::invalid_argument);
	EXPECT_EQ(registry.size(), 1u);
}

TEST(ToolRegistry, SubstituteRegistryIsUsable) {
	mcp::tools::ToolRegistry registry;
	registry.add(std::make_unique<EchoTool>("echo"));

	FakeCommandRunner runner;
	mcp::tools::ToolContext ctx{runner};
	const auto* handler = registry.find("echo");
	ASSERT_NE(handler, nullptr);
	EXPECT_EQ(handler->invoke(ctx, {{"x", 1}}), nlohmann::json({{"x", 1}}));
}
