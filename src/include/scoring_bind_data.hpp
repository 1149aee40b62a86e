#pragma once

#include "AlignmentResult.hpp"
#include "ScoringPolicy.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/execution/expression_executor.hpp"
#include "duckdb/function/function.hpp"
#include "duckdb/main/client_context.hpp"

namespace duckdb {

// Scoring constants shared by the alignment functions, validated at bind time
struct ScoringBindData : public FunctionData {
	seqdiff::AlignmentMode mode;
	int32_t match;
	int32_t mismatch;
	int32_t gap_open;
	int32_t gap_extend;
	idx_t width;

	static constexpr idx_t DEFAULT_WIDTH = 120;

	ScoringBindData(seqdiff::AlignmentMode mode_p, int32_t match_p, int32_t mismatch_p, int32_t gap_open_p,
	                int32_t gap_extend_p, idx_t width_p)
	    : mode(mode_p), match(match_p), mismatch(mismatch_p), gap_open(gap_open_p), gap_extend(gap_extend_p),
	      width(width_p) {
	}

	unique_ptr<FunctionData> Copy() const override {
		return make_uniq<ScoringBindData>(mode, match, mismatch, gap_open, gap_extend, width);
	}

	bool Equals(const FunctionData &other_p) const override {
		auto &other = other_p.Cast<ScoringBindData>();
		return mode == other.mode && match == other.match && mismatch == other.mismatch &&
		       gap_open == other.gap_open && gap_extend == other.gap_extend && width == other.width;
	}

	seqdiff::ScoringPolicy Scoring() const {
		return seqdiff::ScoringPolicy(match, mismatch, seqdiff::GapPenalty(gap_open, gap_extend));
	}

	// Penalty validation is delegated to the ScoringPolicy constructor with exception type translation
	static void ValidateScoring(int32_t match, int32_t mismatch, int32_t gap_open, int32_t gap_extend) {
		try {
			seqdiff::ScoringPolicy test(match, mismatch, seqdiff::GapPenalty(gap_open, gap_extend));
		} catch (const std::invalid_argument &e) {
			throw InvalidInputException(e.what());
		}
	}

	static seqdiff::AlignmentMode ParseMode(const std::string &name) {
		auto mode = seqdiff::ParseAlignmentMode(name);
		if (!mode.has_value()) {
			throw InvalidInputException("Invalid mode '%s'. Supported modes: 'global', 'local', 'semiglobal'.", name);
		}
		return mode.value();
	}

	static Value EvaluateConstant(ClientContext &context, Expression &expr, const std::string &function_name) {
		if (!expr.IsFoldable()) {
			throw InvalidInputException("%s scoring parameters must be constant values, not column references",
			                            function_name);
		}
		auto value = ExpressionExecutor::EvaluateScalar(context, expr);
		if (value.IsNull()) {
			throw InvalidInputException("%s scoring parameters must not be NULL", function_name);
		}
		return value;
	}

	static idx_t ParseWidth(ClientContext &context, Expression &expr, const std::string &function_name) {
		auto width = EvaluateConstant(context, expr, function_name).GetValue<int64_t>();
		if (width <= 0) {
			throw InvalidInputException("%s width must be > 0, got %lld", function_name, width);
		}
		return static_cast<idx_t>(width);
	}

	// mode, match, mismatch, gap_open, gap_extend starting at arguments[first]
	static unique_ptr<ScoringBindData> FromArgs(ClientContext &context, vector<unique_ptr<Expression>> &arguments,
	                                            idx_t first, const std::string &function_name,
	                                            idx_t width = DEFAULT_WIDTH) {
		auto mode = ParseMode(EvaluateConstant(context, *arguments[first], function_name).GetValue<string>());
		auto match = EvaluateConstant(context, *arguments[first + 1], function_name).GetValue<int32_t>();
		auto mismatch = EvaluateConstant(context, *arguments[first + 2], function_name).GetValue<int32_t>();
		auto gap_open = EvaluateConstant(context, *arguments[first + 3], function_name).GetValue<int32_t>();
		auto gap_extend = EvaluateConstant(context, *arguments[first + 4], function_name).GetValue<int32_t>();
		ValidateScoring(match, mismatch, gap_open, gap_extend);
		return make_uniq<ScoringBindData>(mode, match, mismatch, gap_open, gap_extend, width);
	}

	// Same as FromArgs without the mode argument (graph alignment is always global)
	static unique_ptr<ScoringBindData> FromScoringArgs(ClientContext &context,
	                                                   vector<unique_ptr<Expression>> &arguments, idx_t first,
	                                                   const std::string &function_name) {
		auto match = EvaluateConstant(context, *arguments[first], function_name).GetValue<int32_t>();
		auto mismatch = EvaluateConstant(context, *arguments[first + 1], function_name).GetValue<int32_t>();
		auto gap_open = EvaluateConstant(context, *arguments[first + 2], function_name).GetValue<int32_t>();
		auto gap_extend = EvaluateConstant(context, *arguments[first + 3], function_name).GetValue<int32_t>();
		ValidateScoring(match, mismatch, gap_open, gap_extend);
		return make_uniq<ScoringBindData>(seqdiff::AlignmentMode::GLOBAL, match, mismatch, gap_open, gap_extend,
		                                  DEFAULT_WIDTH);
	}

	// Defaults of the command-line tool: semiglobal, match 1, mismatch -1, gap open -5, gap extend -1
	static unique_ptr<ScoringBindData> Defaults(seqdiff::AlignmentMode mode = seqdiff::AlignmentMode::SEMIGLOBAL,
	                                            idx_t width = DEFAULT_WIDTH) {
		return make_uniq<ScoringBindData>(mode, 1, -1, -5, -1, width);
	}
};

} // namespace duckdb
