#include "logger.hpp"

#include <filesystem>

#include <log4cplus/configurator.h>
#include <log4cplus/helpers/loglog.h>

log4cplus::Logger& core_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("kali_mcp"));
	return logger;
}

log4cplus::Logger& dispatch_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("kali_mcp.dispatch"));
	return logger;
}

log4cplus::Logger& tool_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("kali_mcp.tools"));
	return logger;
}

log4cplus::Logger& exec_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("kali_mcp.exec"));
	return logger;
}

static std::filesystem::path resolve_config_path(const std::string& config_path) {
	std::filesystem::path path(config_path);
	if (path.is_absolute()) {
		return path;
	}

	return std::filesystem::current_path() / path;
}

// stdout carries protocol frames, so every appender configured here must
// write to stderr or to files.
void init_logging(const std::string& config_path) {
	try {
		if (!config_path.empty()) {
			auto resolved = resolve_config_path(config_path);
			if (std::filesystem::exists(resolved)) {
				std::filesystem::create_directories("logs");
				log4cplus::PropertyConfigurator::doConfigure(LOG4CPLUS_STRING_TO_TSTRING(resolved.string()));
				return;
			}
		}
	} catch (const std::exception& exc) {
		log4cplus::helpers::LogLog::getLogLog()->error(
			LOG4CPLUS_TEXT("Failed to load logging config: ") + LOG4CPLUS_STRING_TO_TSTRING(std::string(exc.what())));
	}

	log4cplus::BasicConfigurator fallback(log4cplus::Logger::getDefaultHierarchy(), true);
	fallback.configure();
	log4cplus::Logger::getRoot().setLogLevel(log4cplus::INFO_LOG_LEVEL);
}
