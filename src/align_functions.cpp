#include "align_functions.hpp"

#include "MutationStats.hpp"
#include "PairwiseAligner.hpp"
#include "scoring_bind_data.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/types/string_type.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

#include <string_view>

namespace duckdb {

// ---------------------------------------------------------------------------
// Shared local state: per-thread PairwiseAligner reused across all rows
// ---------------------------------------------------------------------------
struct PairwiseLocalState : public FunctionLocalState {
	seqdiff::PairwiseAligner aligner;
	seqdiff::AlignmentMode mode;
	idx_t width;

	explicit PairwiseLocalState(const ScoringBindData &data)
	    : aligner(data.Scoring()), mode(data.mode), width(data.width) {
	}
};

static unique_ptr<FunctionLocalState> PairwiseInitLocalState(ExpressionState &state, const BoundFunctionExpression &expr,
                                                             FunctionData *bind_data) {
	return make_uniq<PairwiseLocalState>(bind_data->Cast<ScoringBindData>());
}

// ---------------------------------------------------------------------------
// Shared execute helpers
// ---------------------------------------------------------------------------

// Prepared reference/query vectors for the execute loop
struct PairInputVectors {
	UnifiedVectorFormat reference_data;
	UnifiedVectorFormat query_data;
	const string_t *reference_ptr;
	const string_t *query_ptr;
};

static PairInputVectors PrepareInputs(DataChunk &args) {
	PairInputVectors v;
	args.data[0].ToUnifiedFormat(args.size(), v.reference_data);
	args.data[1].ToUnifiedFormat(args.size(), v.query_data);
	v.reference_ptr = UnifiedVectorFormat::GetData<string_t>(v.reference_data);
	v.query_ptr = UnifiedVectorFormat::GetData<string_t>(v.query_data);
	return v;
}

// Views into row i of both inputs. Returns false if either input is NULL.
static bool GetPairInput(const PairInputVectors &v, idx_t i, std::string_view &reference, std::string_view &query) {
	auto ri = v.reference_data.sel->get_index(i);
	auto qi = v.query_data.sel->get_index(i);
	if (!v.reference_data.validity.RowIsValid(ri) || !v.query_data.validity.RowIsValid(qi)) {
		return false;
	}
	reference = std::string_view(v.reference_ptr[ri].GetData(), v.reference_ptr[ri].GetSize());
	query = std::string_view(v.query_ptr[qi].GetData(), v.query_ptr[qi].GetSize());
	return true;
}

// reference, query, mode, match, mismatch, gap_open, gap_extend
static vector<LogicalType> FullArgTypes() {
	return {LogicalType::VARCHAR, LogicalType::VARCHAR, LogicalType::VARCHAR, LogicalType::INTEGER,
	        LogicalType::INTEGER, LogicalType::INTEGER, LogicalType::INTEGER};
}

// Registers the two-sequence overload (defaults) and the fully configured overload
static void RegisterPairwiseOverloads(ExtensionLoader &loader, const std::string &name, LogicalType return_type,
                                      scalar_function_t execute) {
	ScalarFunctionSet function_set(name);

	ScalarFunction defaults_fn(name, {LogicalType::VARCHAR, LogicalType::VARCHAR}, return_type, execute);
	defaults_fn.null_handling = FunctionNullHandling::SPECIAL_HANDLING;
	defaults_fn.bind = [](ClientContext &ctx, ScalarFunction &fn, vector<unique_ptr<Expression>> &args) {
		return unique_ptr<FunctionData>(ScoringBindData::Defaults().release());
	};
	defaults_fn.init_local_state = PairwiseInitLocalState;
	function_set.AddFunction(defaults_fn);

	ScalarFunction configured_fn(name, FullArgTypes(), return_type, execute);
	configured_fn.null_handling = FunctionNullHandling::SPECIAL_HANDLING;
	configured_fn.bind = [](ClientContext &ctx, ScalarFunction &fn, vector<unique_ptr<Expression>> &args) {
		return unique_ptr<FunctionData>(ScoringBindData::FromArgs(ctx, args, 2, fn.name).release());
	};
	configured_fn.init_local_state = PairwiseInitLocalState;
	function_set.AddFunction(configured_fn);

	loader.RegisterFunction(function_set);
}

// ---------------------------------------------------------------------------
// sequence_align → STRUCT(score, cigar, reference_start, reference_end,
//                         query_start, query_end, reference_aligned, query_aligned)
// ---------------------------------------------------------------------------
static LogicalType AlignReturnType() {
	return LogicalType::STRUCT({{"score", LogicalType::BIGINT},
	                            {"cigar", LogicalType::VARCHAR},
	                            {"reference_start", LogicalType::BIGINT},
	                            {"reference_end", LogicalType::BIGINT},
	                            {"query_start", LogicalType::BIGINT},
	                            {"query_end", LogicalType::BIGINT},
	                            {"reference_aligned", LogicalType::VARCHAR},
	                            {"query_aligned", LogicalType::VARCHAR}});
}

static void SequenceAlignExecute(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &lstate = ExecuteFunctionState::GetFunctionState(state)->Cast<PairwiseLocalState>();
	auto inputs = PrepareInputs(args);

	auto &entries = StructVector::GetEntries(result);
	auto score_data = FlatVector::GetData<int64_t>(*entries[0]);
	auto &cigar_vec = *entries[1];
	auto cigar_data = FlatVector::GetData<string_t>(cigar_vec);
	auto reference_start_data = FlatVector::GetData<int64_t>(*entries[2]);
	auto reference_end_data = FlatVector::GetData<int64_t>(*entries[3]);
	auto query_start_data = FlatVector::GetData<int64_t>(*entries[4]);
	auto query_end_data = FlatVector::GetData<int64_t>(*entries[5]);
	auto &reference_aligned_vec = *entries[6];
	auto &query_aligned_vec = *entries[7];
	auto reference_aligned_data = FlatVector::GetData<string_t>(reference_aligned_vec);
	auto query_aligned_data = FlatVector::GetData<string_t>(query_aligned_vec);
	auto &result_validity = FlatVector::Validity(result);

	std::string_view reference;
	std::string_view query;
	for (idx_t i = 0; i < args.size(); i++) {
		if (!GetPairInput(inputs, i, reference, query)) {
			result_validity.SetInvalid(i);
			continue;
		}
		auto alignment = lstate.aligner.align(reference, query, lstate.mode);
		auto aligned = alignment.aligned_sequences(reference, query);

		score_data[i] = alignment.score;
		cigar_data[i] = StringVector::AddString(cigar_vec, alignment.cigar());
		reference_start_data[i] = static_cast<int64_t>(alignment.xstart);
		reference_end_data[i] = static_cast<int64_t>(alignment.xend);
		query_start_data[i] = static_cast<int64_t>(alignment.ystart);
		query_end_data[i] = static_cast<int64_t>(alignment.yend);
		reference_aligned_data[i] = StringVector::AddString(reference_aligned_vec, aligned.x_aligned);
		query_aligned_data[i] = StringVector::AddString(query_aligned_vec, aligned.y_aligned);
	}
}

void SequenceAlignFunction::Register(ExtensionLoader &loader) {
	RegisterPairwiseOverloads(loader, "sequence_align", AlignReturnType(), SequenceAlignExecute);
}

// ---------------------------------------------------------------------------
// sequence_align_pretty → VARCHAR (reference row, marker row, query row)
// ---------------------------------------------------------------------------
static void SequenceAlignPrettyExecute(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &lstate = ExecuteFunctionState::GetFunctionState(state)->Cast<PairwiseLocalState>();
	auto inputs = PrepareInputs(args);

	auto result_data = FlatVector::GetData<string_t>(result);
	auto &result_validity = FlatVector::Validity(result);

	std::string_view reference;
	std::string_view query;
	for (idx_t i = 0; i < args.size(); i++) {
		if (!GetPairInput(inputs, i, reference, query)) {
			result_validity.SetInvalid(i);
			continue;
		}
		auto alignment = lstate.aligner.align(reference, query, lstate.mode);
		result_data[i] = StringVector::AddString(result, alignment.pretty(reference, query, lstate.width));
	}
}

void SequenceAlignPrettyFunction::Register(ExtensionLoader &loader) {
	ScalarFunctionSet function_set("sequence_align_pretty");

	ScalarFunction width_fn("sequence_align_pretty", {LogicalType::VARCHAR, LogicalType::VARCHAR, LogicalType::BIGINT},
	                        LogicalType::VARCHAR, SequenceAlignPrettyExecute);
	width_fn.null_handling = FunctionNullHandling::SPECIAL_HANDLING;
	width_fn.bind = [](ClientContext &ctx, ScalarFunction &fn, vector<unique_ptr<Expression>> &args) {
		auto width = ScoringBindData::ParseWidth(ctx, *args[2], fn.name);
		return unique_ptr<FunctionData>(
		    ScoringBindData::Defaults(seqdiff::AlignmentMode::SEMIGLOBAL, width).release());
	};
	width_fn.init_local_state = PairwiseInitLocalState;
	function_set.AddFunction(width_fn);

	vector<LogicalType> configured_args = FullArgTypes();
	configured_args.insert(configured_args.begin() + 2, LogicalType::BIGINT);
	ScalarFunction configured_fn("sequence_align_pretty", configured_args, LogicalType::VARCHAR,
	                             SequenceAlignPrettyExecute);
	configured_fn.null_handling = FunctionNullHandling::SPECIAL_HANDLING;
	configured_fn.bind = [](ClientContext &ctx, ScalarFunction &fn, vector<unique_ptr<Expression>> &args) {
		auto width = ScoringBindData::ParseWidth(ctx, *args[2], fn.name);
		return unique_ptr<FunctionData>(ScoringBindData::FromArgs(ctx, args, 3, fn.name, width).release());
	};
	configured_fn.init_local_state = PairwiseInitLocalState;
	function_set.AddFunction(configured_fn);

	loader.RegisterFunction(function_set);
}

// ---------------------------------------------------------------------------
// sequence_mutation_stats → STRUCT(matches, mismatches, substitutions, insertions,
//                                  deletions, total, gap_opens, identity)
// ---------------------------------------------------------------------------
static LogicalType MutationStatsReturnType() {
	return LogicalType::STRUCT({{"matches", LogicalType::BIGINT},
	                            {"mismatches", LogicalType::BIGINT},
	                            {"substitutions", LogicalType::BIGINT},
	                            {"insertions", LogicalType::BIGINT},
	                            {"deletions", LogicalType::BIGINT},
	                            {"total", LogicalType::BIGINT},
	                            {"gap_opens", LogicalType::BIGINT},
	                            {"identity", LogicalType::DOUBLE}});
}

static void SequenceMutationStatsExecute(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &lstate = ExecuteFunctionState::GetFunctionState(state)->Cast<PairwiseLocalState>();
	auto inputs = PrepareInputs(args);

	auto &entries = StructVector::GetEntries(result);
	auto matches_data = FlatVector::GetData<int64_t>(*entries[0]);
	auto mismatches_data = FlatVector::GetData<int64_t>(*entries[1]);
	auto substitutions_data = FlatVector::GetData<int64_t>(*entries[2]);
	auto insertions_data = FlatVector::GetData<int64_t>(*entries[3]);
	auto deletions_data = FlatVector::GetData<int64_t>(*entries[4]);
	auto total_data = FlatVector::GetData<int64_t>(*entries[5]);
	auto gap_opens_data = FlatVector::GetData<int64_t>(*entries[6]);
	auto identity_data = FlatVector::GetData<double>(*entries[7]);
	auto &result_validity = FlatVector::Validity(result);

	std::string_view reference;
	std::string_view query;
	for (idx_t i = 0; i < args.size(); i++) {
		if (!GetPairInput(inputs, i, reference, query)) {
			result_validity.SetInvalid(i);
			continue;
		}
		auto stats = seqdiff::ReduceMutations(lstate.aligner.align(reference, query, lstate.mode));
		matches_data[i] = stats.matches;
		mismatches_data[i] = stats.mismatches;
		substitutions_data[i] = stats.substitutions;
		insertions_data[i] = stats.insertions;
		deletions_data[i] = stats.deletions;
		total_data[i] = stats.total;
		gap_opens_data[i] = stats.gap_opens;
		identity_data[i] = stats.identity();
	}
}

void SequenceMutationStatsFunction::Register(ExtensionLoader &loader) {
	RegisterPairwiseOverloads(loader, "sequence_mutation_stats", MutationStatsReturnType(),
	                          SequenceMutationStatsExecute);
}

} // namespace duckdb
