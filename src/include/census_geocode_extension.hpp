#pragma once

#include "duckdb.hpp"

namespace duckdb {

class CensusGeocodeExtension : public Extension {
public:
	// Registers the census_* functions and options
	void Load(ExtensionLoader &loader) override;

	std::string Name() override;

	std::string Version() const override;
};

} // namespace duckdb
// no extern "C" declarations here; DUCKDB_CPP_EXTENSION_ENTRY is defined in the .cpp for v1.4+
