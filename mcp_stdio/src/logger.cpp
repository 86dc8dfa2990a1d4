#include "logger.hpp"

#include <filesystem>

#include <log4cplus/configurator.h>
#include <log4cplus/helpers/loglog.h>
#include <log4cplus/helpers/property.h>

log4cplus::Logger& core_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("mcp_stdio"));
	return logger;
}

log4cplus::Logger& server_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("mcp_stdio.server"));
	return logger;
}

log4cplus::Logger& client_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("mcp_stdio.client"));
	return logger;
}

log4cplus::Logger& transport_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("mcp_stdio.transport"));
	return logger;
}

static std::filesystem::path resolve_config_path(const std::string& config_path) {
	std::filesystem::path path(config_path);
	if (path.is_absolute()) {
		return path;
	}
	return std::filesystem::current_path() / path;
}

void init_logging(const std::string& config_path) {
	try {
		auto resolved = resolve_config_path(config_path);
		if (std::filesystem::exists(resolved)) {
			std::filesystem::create_directories("logs");
			log4cplus::PropertyConfigurator::doConfigure(LOG4CPLUS_STRING_TO_TSTRING(resolved.string()));
			return;
		}
	} catch (const std::exception& exc) {
		log4cplus::helpers::LogLog::getLogLog()->error(
			LOG4CPLUS_TEXT("Failed to load logging config: ") + LOG4CPLUS_C_STR_TO_TSTRING(exc.what()));
	}

	// stdout carries protocol frames, so the fallback appender must not use it
	log4cplus::helpers::Properties props;
	props.setProperty(LOG4CPLUS_TEXT("log4cplus.rootLogger"), LOG4CPLUS_TEXT("INFO, STDERR"));
	props.setProperty(LOG4CPLUS_TEXT("log4cplus.appender.STDERR"), LOG4CPLUS_TEXT("log4cplus::ConsoleAppender"));
	props.setProperty(LOG4CPLUS_TEXT("log4cplus.appender.STDERR.logToStdErr"), LOG4CPLUS_TEXT("true"));
	props.setProperty(LOG4CPLUS_TEXT("log4cplus.appender.STDERR.layout"), LOG4CPLUS_TEXT("log4cplus::PatternLayout"));
	props.setProperty(LOG4CPLUS_TEXT("log4cplus.appender.STDERR.layout.ConversionPattern"),
	                  LOG4CPLUS_TEXT("%D{%Y-%m-%d %H:%M:%S.%q} [%t] %-5p %c - %m%n"));
	log4cplus::PropertyConfigurator fallback(props);
	fallback.configure();
}
