#include "distance_functions.hpp"

#include "DistanceMetrics.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/types/string_type.hpp"
#include "duckdb/common/vector_operations/binary_executor.hpp"
#include "duckdb/function/scalar_function.hpp"

#include <string_view>

namespace duckdb {

static std::string_view AsView(const string_t &value) {
	return std::string_view(value.GetData(), value.GetSize());
}

static void SequenceLevenshteinFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	BinaryExecutor::Execute<string_t, string_t, int64_t>(
	    args.data[0], args.data[1], result, args.size(), [](string_t a, string_t b) {
		    return static_cast<int64_t>(seqdiff::Levenshtein(AsView(a), AsView(b)));
	    });
}

static void SequenceHammingFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	BinaryExecutor::Execute<string_t, string_t, int64_t>(
	    args.data[0], args.data[1], result, args.size(), [](string_t a, string_t b) {
		    try {
			    return static_cast<int64_t>(seqdiff::Hamming(AsView(a), AsView(b)));
		    } catch (const seqdiff::LengthMismatchError &e) {
			    throw InvalidInputException("sequence_hamming: %s", e.what());
		    }
	    });
}

void SequenceDistanceFunctions::Register(ExtensionLoader &loader) {
	ScalarFunction sequence_levenshtein("sequence_levenshtein", {LogicalType::VARCHAR, LogicalType::VARCHAR},
	                                    LogicalType::BIGINT, SequenceLevenshteinFunction);
	loader.RegisterFunction(sequence_levenshtein);

	ScalarFunction sequence_hamming("sequence_hamming", {LogicalType::VARCHAR, LogicalType::VARCHAR},
	                                LogicalType::BIGINT, SequenceHammingFunction);
	loader.RegisterFunction(sequence_hamming);
}

} // namespace duckdb
