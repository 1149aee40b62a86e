#include "poa_functions.hpp"

#include "PartialOrderAligner.hpp"
#include "scoring_bind_data.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/printer.hpp"
#include "duckdb/common/types/string_type.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/planner/expression/bound_function_expression.hpp"

#include <string_view>
#include <vector>

namespace duckdb {

static LogicalType PoaReturnType() {
	return LogicalType::STRUCT({{"score", LogicalType::BIGINT},
	                            {"cigar", LogicalType::VARCHAR},
	                            {"consensus", LogicalType::VARCHAR},
	                            {"graph_nodes", LogicalType::BIGINT}});
}

static void SequencePoaAlignExecute(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &func_expr = state.expr.Cast<BoundFunctionExpression>();
	auto &bind_data = func_expr.bind_info->Cast<ScoringBindData>();
	auto scoring = bind_data.Scoring();

	auto &references_vec = args.data[0];
	UnifiedVectorFormat references_data;
	references_vec.ToUnifiedFormat(args.size(), references_data);
	auto list_entries = UnifiedVectorFormat::GetData<list_entry_t>(references_data);

	auto &child_vec = ListVector::GetEntry(references_vec);
	UnifiedVectorFormat child_data;
	child_vec.ToUnifiedFormat(ListVector::GetListSize(references_vec), child_data);
	auto child_ptr = UnifiedVectorFormat::GetData<string_t>(child_data);

	UnifiedVectorFormat query_data;
	args.data[1].ToUnifiedFormat(args.size(), query_data);
	auto query_ptr = UnifiedVectorFormat::GetData<string_t>(query_data);

	auto &entries = StructVector::GetEntries(result);
	auto score_data = FlatVector::GetData<int64_t>(*entries[0]);
	auto &cigar_vec = *entries[1];
	auto cigar_data = FlatVector::GetData<string_t>(cigar_vec);
	auto &consensus_vec = *entries[2];
	auto consensus_data = FlatVector::GetData<string_t>(consensus_vec);
	auto graph_nodes_data = FlatVector::GetData<int64_t>(*entries[3]);
	auto &result_validity = FlatVector::Validity(result);

	for (idx_t i = 0; i < args.size(); i++) {
		auto ri = references_data.sel->get_index(i);
		auto qi = query_data.sel->get_index(i);
		if (!references_data.validity.RowIsValid(ri) || !query_data.validity.RowIsValid(qi)) {
			result_validity.SetInvalid(i);
			continue;
		}

		const auto &entry = list_entries[ri];
		if (entry.length == 0) {
			throw InvalidInputException("sequence_poa_align: references must contain at least one sequence");
		}
		std::vector<std::string_view> references;
		references.reserve(entry.length);
		for (idx_t k = entry.offset; k < entry.offset + entry.length; k++) {
			auto ci = child_data.sel->get_index(k);
			if (!child_data.validity.RowIsValid(ci)) {
				throw InvalidInputException("sequence_poa_align: references must not contain NULL");
			}
			references.emplace_back(child_ptr[ci].GetData(), child_ptr[ci].GetSize());
		}
		std::string_view query(query_ptr[qi].GetData(), query_ptr[qi].GetSize());

		try {
			seqdiff::PartialOrderAligner aligner(scoring, references[0]);
			aligner.set_warning_handler([](const std::string &msg) { Printer::Print("sequence_poa_align: " + msg); });
			for (size_t k = 1; k < references.size(); k++) {
				aligner.add_sequence(references[k]);
			}
			auto consensus = aligner.consensus();
			auto graph_nodes = aligner.graph().node_count();
			const auto &aligned = aligner.global(query);

			score_data[i] = aligned.alignment.score;
			cigar_data[i] = StringVector::AddString(cigar_vec, aligned.alignment.cigar());
			consensus_data[i] = StringVector::AddString(consensus_vec, consensus);
			graph_nodes_data[i] = static_cast<int64_t>(graph_nodes);
		} catch (const seqdiff::AlignmentSizeError &e) {
			throw InvalidInputException("sequence_poa_align: %s", e.what());
		}
	}
}

static vector<LogicalType> PoaArgTypes(bool configured) {
	vector<LogicalType> types {LogicalType::LIST(LogicalType::VARCHAR), LogicalType::VARCHAR};
	if (configured) {
		types.insert(types.end(), 4, LogicalType::INTEGER);
	}
	return types;
}

void SequencePoaAlignFunction::Register(ExtensionLoader &loader) {
	ScalarFunctionSet function_set("sequence_poa_align");

	ScalarFunction defaults_fn("sequence_poa_align", PoaArgTypes(false), PoaReturnType(), SequencePoaAlignExecute);
	defaults_fn.null_handling = FunctionNullHandling::SPECIAL_HANDLING;
	defaults_fn.bind = [](ClientContext &ctx, ScalarFunction &fn, vector<unique_ptr<Expression>> &args) {
		return unique_ptr<FunctionData>(ScoringBindData::Defaults(seqdiff::AlignmentMode::GLOBAL).release());
	};
	function_set.AddFunction(defaults_fn);

	ScalarFunction configured_fn("sequence_poa_align", PoaArgTypes(true), PoaReturnType(), SequencePoaAlignExecute);
	configured_fn.null_handling = FunctionNullHandling::SPECIAL_HANDLING;
	configured_fn.bind = [](ClientContext &ctx, ScalarFunction &fn, vector<unique_ptr<Expression>> &args) {
		return unique_ptr<FunctionData>(ScoringBindData::FromScoringArgs(ctx, args, 2, fn.name).release());
	};
	function_set.AddFunction(configured_fn);

	loader.RegisterFunction(function_set);
}

} // namespace duckdb
