#include "test_helpers.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <utility>

#include <unistd.h>

FakeCommandRunner::FakeCommandRunner() {
	next_result.success = true;
	next_result.exit_code = 0;
	next_result.output = "fake output";
}

bool FakeCommandRunner::is_available(const std::string& program) const {
	return installed.count(program) > 0;
}

mcp::exec::ExecutionResult FakeCommandRunner::run(const mcp::exec::Command& command) {
	calls.push_back(command);
	if (throw_on_run) {
		throw std::runtime_error("runner exploded");
	}
	return next_result;
}

mcp::Request make_request(const std::string& method, nlohmann::json params, nlohmann::json id) {
	mcp::Request request;
	request.method = method;
	request.params = std::move(params);
	request.id = std::move(id);
	return request;
}

mcp::Request make_tool_call(const std::string& tool, nlohmann::json arguments, nlohmann::json id) {
	return make_request("tools/call", {{"name", tool}, {"arguments", std::move(arguments)}}, std::move(id));
}

nlohmann::json tool_payload(const mcp::Response& response) {
	if (!response.result) {
		throw std::runtime_error("response carries no result");
	}
	const auto& content = response.result->at("content");
	return nlohmann::json::parse(content.at(0).at("text").get<std::string>());
}

std::string write_temp_file(const std::string& name, const std::string& content) {
	auto dir = std::filesystem::temp_directory_path() / ("kali_mcp_test_" + std::to_string(::getpid()));
	std::filesystem::create_directories(dir);
	auto path = dir / name;
	std::ofstream out(path, std::ios::trunc);
	out << content;
	return path.string();
}
