#include "duckdb.hpp"
#include "duckdb/function/scalar_function.hpp"

#include "census_geocode_functions.hpp"
#include "address/street_normalizer.hpp"

#include <string>

namespace duckdb {

static void NormalizeStreetScalar(DataChunk &args, ExpressionState & /*state*/, Vector &result) {
	const idx_t count = args.size();
	auto &input = args.data[0];

	UnaryExecutor::Execute<string_t, string_t>(input, result, count, [&](const string_t &val) -> string_t {
		if (val.GetSize() == 0) {
			return StringVector::AddString(result, "");
		}
		auto label = census_geocode::ParseStreetLabel(val.GetString());
		return StringVector::AddString(result, label.ToString());
	});
}

ScalarFunction GetCensusNormalizeStreetFunction() {
	return ScalarFunction("census_normalize_street", {LogicalType::VARCHAR}, LogicalType::VARCHAR,
	                      NormalizeStreetScalar);
}

} // namespace duckdb
