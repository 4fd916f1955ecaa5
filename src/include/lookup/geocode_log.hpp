#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace census_geocode {

// Process-wide "census_geocode" logger writing to stderr.
std::shared_ptr<spdlog::logger> GeocodeLogger();

// trace|debug|info|warn|error|off. Unknown names leave the level unchanged
// and return false.
bool SetGeocodeLogLevel(const std::string &level);

} // namespace census_geocode
