#include "lookup/geocode_config.hpp"

#include "lookup/geocode_log.hpp"

#include <algorithm>
#include <climits>
#include <cstdlib>
#include <thread>

namespace census_geocode {

static const char *GetEnv(const char *name) {
	const char *value = std::getenv(name);
	return (value && *value) ? value : nullptr;
}

std::string GeocodeConfig::DefaultDataDir() {
	const char *home = GetEnv("HOME");
	return std::string(home ? home : ".") + "/.census-lookup";
}

GeocodeConfig GeocodeConfig::FromEnvironment() {
	GeocodeConfig config;
	if (auto dir = GetEnv("CENSUS_GEOCODE_DATA_DIR")) {
		config.data_dir = dir;
	}
	if (auto threads = GetEnv("CENSUS_GEOCODE_THREADS")) {
		char *end = nullptr;
		auto parsed = std::strtoll(threads, &end, 10);
		if (end && *end == '\0' && parsed >= 0) {
			config.batch_threads = parsed > UINT_MAX ? UINT_MAX : static_cast<unsigned>(parsed);
		} else {
			GeocodeLogger()->warn("Ignoring CENSUS_GEOCODE_THREADS='{}': not a non-negative integer", threads);
		}
	}
	if (auto level = GetEnv("CENSUS_GEOCODE_LOG_LEVEL")) {
		config.log_level = level;
	}
	if (auto state = GetEnv("CENSUS_GEOCODE_DEFAULT_STATE")) {
		config.default_state = state;
	}
	return config;
}

unsigned GeocodeConfig::HardwareThreads() {
	auto hw = std::thread::hardware_concurrency();
	return hw > 0 ? hw : 1;
}

unsigned GeocodeConfig::EffectiveThreads() const {
	const auto hw = HardwareThreads();
	if (batch_threads > 0) {
		return std::min(batch_threads, hw);
	}
	return hw;
}

} // namespace census_geocode
