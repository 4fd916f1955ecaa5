#include "lookup/geocode_log.hpp"

#include "duckdb/common/string_util.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace census_geocode {

static constexpr const char *LOGGER_NAME = "census_geocode";

std::shared_ptr<spdlog::logger> GeocodeLogger() {
	static std::mutex lock;
	static std::shared_ptr<spdlog::logger> logger;

	std::lock_guard<std::mutex> guard(lock);
	if (!logger) {
		logger = spdlog::get(LOGGER_NAME);
	}
	if (!logger) {
		auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
		logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sink);
		logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
		logger->set_level(spdlog::level::info);
		spdlog::register_logger(logger);
	}
	return logger;
}

bool SetGeocodeLogLevel(const std::string &level) {
	auto name = duckdb::StringUtil::Lower(level);
	duckdb::StringUtil::Trim(name);
	if (name == "warning") {
		name = "warn";
	}
	auto parsed = spdlog::level::from_str(name);
	// from_str maps unknown names to off
	if (parsed == spdlog::level::off && name != "off") {
		return false;
	}
	GeocodeLogger()->set_level(parsed);
	return true;
}

} // namespace census_geocode
