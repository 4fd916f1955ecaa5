#include "duckdb.hpp"
#include "duckdb/common/error_data.hpp"
#include "duckdb/execution/expression_executor.hpp"
#include "duckdb/function/function_set.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/planner/expression/bound_function_expression.hpp"

#include "census_geocode_functions.hpp"
#include "lookup/dataset_errors.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace duckdb {

using census_geocode::GeocodePipeline;
using census_geocode::GeocodeResult;
using census_geocode::GeoLevel;

struct CensusGeocodeBindData : public FunctionData {
	std::shared_ptr<GeocodePipeline> pipeline;
	GeoLevel level;
	vector<string> variables;

	CensusGeocodeBindData(std::shared_ptr<GeocodePipeline> pipeline_p, GeoLevel level_p, vector<string> variables_p)
	    : pipeline(std::move(pipeline_p)), level(level_p), variables(std::move(variables_p)) {
	}

	unique_ptr<FunctionData> Copy() const override {
		return make_uniq<CensusGeocodeBindData>(pipeline, level, variables);
	}
	bool Equals(const FunctionData &other_p) const override {
		auto &other = other_p.Cast<CensusGeocodeBindData>();
		return pipeline == other.pipeline && level == other.level && variables == other.variables;
	}
};

static LogicalType CensusGeocodeResultType() {
	child_list_t<LogicalType> value_children;
	value_children.emplace_back("code", LogicalType::VARCHAR);
	value_children.emplace_back("value", LogicalType::DOUBLE);

	child_list_t<LogicalType> children;
	children.emplace_back("input_address", LogicalType::VARCHAR);
	children.emplace_back("matched_address", LogicalType::VARCHAR);
	children.emplace_back("latitude", LogicalType::DOUBLE);
	children.emplace_back("longitude", LogicalType::DOUBLE);
	children.emplace_back("match_type", LogicalType::VARCHAR);
	children.emplace_back("match_score", LogicalType::DOUBLE);
	children.emplace_back("geoid", LogicalType::VARCHAR);
	children.emplace_back("state_fips", LogicalType::VARCHAR);
	children.emplace_back("county_fips", LogicalType::VARCHAR);
	children.emplace_back("tract", LogicalType::VARCHAR);
	children.emplace_back("block_group", LogicalType::VARCHAR);
	children.emplace_back("block", LogicalType::VARCHAR);
	children.emplace_back("variables", LogicalType::LIST(LogicalType::STRUCT(std::move(value_children))));
	children.emplace_back("failure", LogicalType::VARCHAR);
	children.emplace_back("error", LogicalType::VARCHAR);
	return LogicalType::STRUCT(std::move(children));
}

//===--------------------------------------------------------------------===//
// Binder: geo level and variable list must be constants
//===--------------------------------------------------------------------===//
static GeoLevel BindGeoLevel(ClientContext &context, vector<unique_ptr<Expression>> &args, idx_t index,
                             const GeocodePipeline &pipeline) {
	if (args.size() <= index) {
		return GetCensusDefaultGeoLevel(context, pipeline);
	}
	if (!args[index]->IsFoldable()) {
		throw BinderException("geo_level must be a constant");
	}
	auto value = ExpressionExecutor::EvaluateScalar(context, *args[index]);
	if (value.IsNull()) {
		return GetCensusDefaultGeoLevel(context, pipeline);
	}
	return census_geocode::ParseGeoLevel(value.ToString());
}

static vector<string> BindVariables(ClientContext &context, vector<unique_ptr<Expression>> &args, idx_t index) {
	vector<string> variables;
	if (args.size() <= index) {
		return variables;
	}
	if (!args[index]->IsFoldable()) {
		throw BinderException("variables must be a constant list");
	}
	auto value = ExpressionExecutor::EvaluateScalar(context, *args[index]);
	if (value.IsNull()) {
		return variables;
	}
	for (auto &child : ListValue::GetChildren(value)) {
		if (!child.IsNull()) {
			variables.push_back(child.ToString());
		}
	}
	return variables;
}

template <idx_t LEVEL_INDEX>
static unique_ptr<FunctionData> CensusGeocodeBind(ClientContext &context, ScalarFunction & /*bound_function*/,
                                                  vector<unique_ptr<Expression>> &args) {
	auto pipeline = GetCensusGeocodePipeline(context);
	auto level = BindGeoLevel(context, args, LEVEL_INDEX, *pipeline);
	auto variables = BindVariables(context, args, LEVEL_INDEX + 1);
	return make_uniq<CensusGeocodeBindData>(std::move(pipeline), level, std::move(variables));
}

//===--------------------------------------------------------------------===//
// Result writer
//===--------------------------------------------------------------------===//
static void SetString(Vector &field, idx_t row, const std::string &value) {
	FlatVector::GetData<string_t>(field)[row] = StringVector::AddString(field, value);
}

static void SetOptionalString(Vector &field, idx_t row, const std::optional<std::string> &value) {
	if (!value) {
		FlatVector::SetNull(field, row, true);
		return;
	}
	SetString(field, row, *value);
}

static void SetOptionalDouble(Vector &field, idx_t row, const std::optional<double> &value) {
	if (!value) {
		FlatVector::SetNull(field, row, true);
		return;
	}
	FlatVector::GetData<double>(field)[row] = *value;
}

// results[row] is null for rows whose inputs were NULL.
static void WriteGeocodeResults(Vector &result, idx_t count, const vector<unique_ptr<GeocodeResult>> &results) {
	result.SetVectorType(VectorType::FLAT_VECTOR);
	auto &fields = StructVector::GetEntries(result);
	D_ASSERT(fields.size() == 15);

	auto &list_vec = *fields[12];
	idx_t total_values = 0;
	for (auto &row : results) {
		if (row) {
			total_values += row->variables.size();
		}
	}
	ListVector::Reserve(list_vec, total_values);
	auto list_entries = FlatVector::GetData<list_entry_t>(list_vec);
	auto &value_struct = ListVector::GetEntry(list_vec);
	auto &value_fields = StructVector::GetEntries(value_struct);
	auto &code_vec = *value_fields[0];
	auto &value_vec = *value_fields[1];

	idx_t child_offset = 0;
	for (idx_t row = 0; row < count; ++row) {
		list_entries[row].offset = child_offset;
		list_entries[row].length = 0;
		if (!results[row]) {
			FlatVector::SetNull(result, row, true);
			continue;
		}
		const auto &r = *results[row];
		SetString(*fields[0], row, r.input_address);
		SetOptionalString(*fields[1], row, r.matched_address);
		SetOptionalDouble(*fields[2], row, r.latitude);
		SetOptionalDouble(*fields[3], row, r.longitude);
		SetString(*fields[4], row, census_geocode::MatchTypeName(r.match_type));
		FlatVector::GetData<double>(*fields[5])[row] = r.match_score;
		SetOptionalString(*fields[6], row, r.geoid);
		SetOptionalString(*fields[7], row, r.state_fips);
		SetOptionalString(*fields[8], row, r.county_fips);
		SetOptionalString(*fields[9], row, r.tract);
		SetOptionalString(*fields[10], row, r.block_group);
		SetOptionalString(*fields[11], row, r.block);
		for (auto &value : r.variables) {
			SetString(code_vec, child_offset, value.code);
			SetOptionalDouble(value_vec, child_offset, value.value);
			child_offset++;
		}
		list_entries[row].length = r.variables.size();
		if (r.failure == census_geocode::GeocodeFailure::NONE) {
			FlatVector::SetNull(*fields[13], row, true);
		} else {
			SetString(*fields[13], row, census_geocode::GeocodeFailureName(r.failure));
		}
		SetOptionalString(*fields[14], row, r.error);
	}
	ListVector::SetListSize(list_vec, child_offset);
}

//===--------------------------------------------------------------------===//
// census_geocode
//===--------------------------------------------------------------------===//
static void CensusGeocodeExec(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &bind = state.expr.Cast<BoundFunctionExpression>().bind_info->Cast<CensusGeocodeBindData>();
	const idx_t count = args.size();

	UnifiedVectorFormat input;
	args.data[0].ToUnifiedFormat(count, input);
	auto values = UnifiedVectorFormat::GetData<string_t>(input);

	vector<string> addresses;
	vector<idx_t> positions;
	for (idx_t row = 0; row < count; ++row) {
		const auto idx = input.sel->get_index(row);
		if (!input.validity.RowIsValid(idx)) {
			continue;
		}
		addresses.push_back(values[idx].GetString());
		positions.push_back(row);
	}

	auto batch = bind.pipeline->GeocodeBatch(addresses, bind.level, bind.variables);
	vector<unique_ptr<GeocodeResult>> rows(count);
	for (idx_t i = 0; i < batch.size(); ++i) {
		rows[positions[i]] = make_uniq<GeocodeResult>(std::move(batch[i]));
	}
	WriteGeocodeResults(result, count, rows);
}

ScalarFunctionSet GetCensusGeocodeFunctionSet() {
	ScalarFunctionSet set("census_geocode");
	const auto out_type = CensusGeocodeResultType();
	const auto vars_type = LogicalType::LIST(LogicalType::VARCHAR);

	set.AddFunction(ScalarFunction({LogicalType::VARCHAR}, out_type, CensusGeocodeExec, CensusGeocodeBind<1>));
	set.AddFunction(ScalarFunction({LogicalType::VARCHAR, LogicalType::VARCHAR}, out_type, CensusGeocodeExec,
	                               CensusGeocodeBind<1>));
	set.AddFunction(ScalarFunction({LogicalType::VARCHAR, LogicalType::VARCHAR, vars_type}, out_type,
	                               CensusGeocodeExec, CensusGeocodeBind<1>));
	return set;
}

//===--------------------------------------------------------------------===//
// census_lookup_point
//===--------------------------------------------------------------------===//
static void CensusLookupPointExec(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &bind = state.expr.Cast<BoundFunctionExpression>().bind_info->Cast<CensusGeocodeBindData>();
	const idx_t count = args.size();

	UnifiedVectorFormat lon_data, lat_data, state_data;
	args.data[0].ToUnifiedFormat(count, lon_data);
	args.data[1].ToUnifiedFormat(count, lat_data);
	args.data[2].ToUnifiedFormat(count, state_data);
	auto lons = UnifiedVectorFormat::GetData<double>(lon_data);
	auto lats = UnifiedVectorFormat::GetData<double>(lat_data);
	auto states = UnifiedVectorFormat::GetData<string_t>(state_data);

	vector<unique_ptr<GeocodeResult>> rows(count);
	for (idx_t row = 0; row < count; ++row) {
		const auto lon_idx = lon_data.sel->get_index(row);
		const auto lat_idx = lat_data.sel->get_index(row);
		const auto state_idx = state_data.sel->get_index(row);
		if (!lon_data.validity.RowIsValid(lon_idx) || !lat_data.validity.RowIsValid(lat_idx) ||
		    !state_data.validity.RowIsValid(state_idx)) {
			continue;
		}
		try {
			rows[row] = make_uniq<GeocodeResult>(bind.pipeline->LookupCoordinate(
			    lons[lon_idx], lats[lat_idx], states[state_idx].GetString(), bind.level, bind.variables));
		} catch (const census_geocode::DatasetUnavailableException &ex) {
			auto failed = make_uniq<GeocodeResult>();
			failed->longitude = lons[lon_idx];
			failed->latitude = lats[lat_idx];
			failed->variables = census_geocode::NullCensusValues(bind.variables);
			failed->failure = census_geocode::GeocodeFailure::DATASET_UNAVAILABLE;
			failed->error = ErrorData(ex).RawMessage();
			rows[row] = std::move(failed);
		}
	}
	WriteGeocodeResults(result, count, rows);
}

ScalarFunctionSet GetCensusLookupPointFunctionSet() {
	ScalarFunctionSet set("census_lookup_point");
	const auto out_type = CensusGeocodeResultType();
	const auto vars_type = LogicalType::LIST(LogicalType::VARCHAR);
	const vector<LogicalType> point_args = {LogicalType::DOUBLE, LogicalType::DOUBLE, LogicalType::VARCHAR};

	auto with = [&](vector<LogicalType> extra) {
		auto arguments = point_args;
		arguments.insert(arguments.end(), extra.begin(), extra.end());
		return ScalarFunction(arguments, out_type, CensusLookupPointExec, CensusGeocodeBind<3>);
	};
	set.AddFunction(with({}));
	set.AddFunction(with({LogicalType::VARCHAR}));
	set.AddFunction(with({LogicalType::VARCHAR, vars_type}));
	return set;
}

} // namespace duckdb
