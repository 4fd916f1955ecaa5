#include "duckdb.hpp"
#include "duckdb/function/scalar_function.hpp"

#include "census_geocode_functions.hpp"
#include "address/address_token.hpp"

#include <string>

namespace duckdb {

struct ParseAddressLocalState : public FunctionLocalState {
	census_geocode::RuleBasedTokenizer tokenizer;
};

static unique_ptr<FunctionLocalState> ParseAddressInitLocal(ExpressionState &, const BoundFunctionExpression &,
                                                            FunctionData *) {
	return make_uniq<ParseAddressLocalState>();
}

static void SetField(Vector &field, idx_t row, const std::string &value) {
	if (value.empty()) {
		FlatVector::SetNull(field, row, true);
		return;
	}
	FlatVector::GetData<string_t>(field)[row] = StringVector::AddString(field, value);
}

static void ParseAddressExec(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &local = ExecuteFunctionState::GetFunctionState(state)->Cast<ParseAddressLocalState>();
	const idx_t count = args.size();

	// house_number, predirectional, street_name, street_type, postdirectional,
	// occupancy, city, state, zip, status
	auto &fields = StructVector::GetEntries(result);
	D_ASSERT(fields.size() == 10);

	UnifiedVectorFormat input;
	args.data[0].ToUnifiedFormat(count, input);
	auto values = UnifiedVectorFormat::GetData<string_t>(input);

	result.SetVectorType(VectorType::FLAT_VECTOR);
	for (idx_t row = 0; row < count; ++row) {
		const auto idx = input.sel->get_index(row);
		if (!input.validity.RowIsValid(idx)) {
			FlatVector::SetNull(result, row, true);
			continue;
		}
		census_geocode::AddressToken token;
		const auto status = local.tokenizer.Tokenize(values[idx].GetString(), token);
		SetField(*fields[0], row, token.house_number);
		SetField(*fields[1], row, token.predirectional);
		SetField(*fields[2], row, token.street_name);
		SetField(*fields[3], row, token.street_type);
		SetField(*fields[4], row, token.postdirectional);
		SetField(*fields[5], row, token.occupancy);
		SetField(*fields[6], row, token.city);
		SetField(*fields[7], row, token.state);
		SetField(*fields[8], row, token.zip);
		SetField(*fields[9], row, census_geocode::ParseStatusName(status));
	}
	if (args.AllConstant()) {
		result.SetVectorType(VectorType::CONSTANT_VECTOR);
	}
}

ScalarFunction GetCensusParseAddressFunction() {
	child_list_t<LogicalType> children;
	for (auto name : {"house_number", "predirectional", "street_name", "street_type", "postdirectional",
	                  "occupancy", "city", "state", "zip", "status"}) {
		children.emplace_back(name, LogicalType::VARCHAR);
	}
	ScalarFunction fun("census_parse_address", {LogicalType::VARCHAR}, LogicalType::STRUCT(std::move(children)),
	                   ParseAddressExec);
	fun.init_local_state = ParseAddressInitLocal;
	return fun;
}

} // namespace duckdb
