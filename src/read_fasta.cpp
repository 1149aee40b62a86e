#include "read_fasta.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/vector_size.hpp"
#include <algorithm>
#include <stdexcept>
#include <thread>

namespace duckdb {

ReadFastaTableFunction::GlobalState::GlobalState(const InputPaths &inputs) : uses_stdin(inputs.uses_stdin) {
	readers.reserve(inputs.paths.size());
	for (const auto &path : inputs.paths) {
		try {
			readers.push_back(std::make_unique<seqdiff::SequenceReader>(path));
		} catch (const std::runtime_error &e) {
			throw IOException("read_fasta: %s", e.what());
		}
	}
}

std::optional<ReadFastaTableFunction::FileCursor> ReadFastaTableFunction::GlobalState::Claim() {
	lock_guard<mutex> guard(lock);
	if (next_file_idx >= readers.size()) {
		return std::nullopt;
	}
	auto file_idx = next_file_idx++;
	return FileCursor {file_idx, readers[file_idx].get(), 1};
}

idx_t ReadFastaTableFunction::GlobalState::MaxThreads() const {
	if (uses_stdin) {
		return 1;
	}
	return std::max<idx_t>(1, std::min<idx_t>(readers.size(), std::thread::hardware_concurrency()));
}

unique_ptr<FunctionData> ReadFastaTableFunction::Bind(ClientContext &context, TableFunctionBindInput &input,
                                                      vector<LogicalType> &return_types,
                                                      vector<std::string> &names) {
	auto inputs = ResolveInputPaths(context, input.inputs[0], "read_fasta");
	bool include_filepath = ParseIncludeFilepathParameter(input.named_parameters);

	names = {"sequence_index", "read_id", "comment", "sequence"};
	return_types = {LogicalType::BIGINT, LogicalType::VARCHAR, LogicalType::VARCHAR, LogicalType::VARCHAR};
	if (include_filepath) {
		names.emplace_back("filepath");
		return_types.emplace_back(LogicalType::VARCHAR);
	}
	return make_uniq<Data>(std::move(inputs), include_filepath);
}

unique_ptr<GlobalTableFunctionState> ReadFastaTableFunction::InitGlobal(ClientContext &context,
                                                                        TableFunctionInitInput &input) {
	auto &data = input.bind_data->Cast<Data>();
	return make_uniq<GlobalState>(data.inputs);
}

unique_ptr<LocalTableFunctionState> ReadFastaTableFunction::InitLocal(ExecutionContext &context,
                                                                       TableFunctionInitInput &input,
                                                                       GlobalTableFunctionState *global_state) {
	return make_uniq<LocalState>();
}

static void WriteStrings(Vector &column, const std::vector<std::string> &values) {
	auto out = FlatVector::GetData<string_t>(column);
	for (idx_t row = 0; row < values.size(); row++) {
		out[row] = StringVector::AddString(column, values[row]);
	}
}

// Records without a comment get NULL
static void WriteComments(Vector &column, const std::vector<std::string> &comments) {
	auto out = FlatVector::GetData<string_t>(column);
	auto &validity = FlatVector::Validity(column);
	for (idx_t row = 0; row < comments.size(); row++) {
		if (comments[row].empty()) {
			validity.SetInvalid(row);
		} else {
			out[row] = StringVector::AddString(column, comments[row]);
		}
	}
}

void ReadFastaTableFunction::Execute(ClientContext &context, TableFunctionInput &data_p, DataChunk &output) {
	auto &bind_data = data_p.bind_data->Cast<Data>();
	auto &global_state = data_p.global_state->Cast<GlobalState>();
	auto &local_state = data_p.local_state->Cast<LocalState>();

	seqdiff::SequenceRecordBatch batch;
	while (batch.empty()) {
		if (!local_state.cursor) {
			local_state.cursor = global_state.Claim();
			if (!local_state.cursor) {
				output.SetCardinality(0);
				return;
			}
		}
		// The claimed reader belongs to this thread alone
		batch = local_state.cursor->reader->read(STANDARD_VECTOR_SIZE);
		if (batch.empty()) {
			local_state.cursor.reset();
		}
	}

	auto &cursor = *local_state.cursor;
	auto index_data = FlatVector::GetData<int64_t>(output.data[SEQUENCE_INDEX_COLUMN]);
	for (idx_t row = 0; row < batch.size(); row++) {
		index_data[row] = cursor.next_sequence_index++;
	}
	WriteStrings(output.data[READ_ID_COLUMN], batch.read_ids);
	WriteComments(output.data[COMMENT_COLUMN], batch.comments);
	WriteStrings(output.data[SEQUENCE_COLUMN], batch.sequences);

	if (bind_data.include_filepath) {
		auto &column = output.data[FILEPATH_COLUMN];
		column.SetVectorType(VectorType::CONSTANT_VECTOR);
		ConstantVector::GetData<string_t>(column)[0] =
		    StringVector::AddString(column, bind_data.inputs.paths[cursor.file_idx]);
	}

	output.SetCardinality(batch.size());
}

TableFunction ReadFastaTableFunction::GetFunction() {
	TableFunction tf("read_fasta", {LogicalType::ANY}, Execute, Bind, InitGlobal, InitLocal);
	tf.named_parameters["include_filepath"] = LogicalType::BOOLEAN;
	return tf;
}

void ReadFastaTableFunction::Register(ExtensionLoader &loader) {
	loader.RegisterFunction(GetFunction());
}

} // namespace duckdb
