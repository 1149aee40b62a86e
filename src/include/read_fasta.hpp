#pragma once

#include "SequenceReader.hpp"
#include "SequenceRecord.hpp"
#include "table_function_common.hpp"
#include "duckdb/common/types.hpp"
#include "duckdb/function/table_function.hpp"
#include "duckdb/main/client_context.hpp"
#include "duckdb/main/extension/extension_loader.hpp"
#include <memory>
#include <optional>
#include <vector>

namespace duckdb {

// read_fasta(path | [paths], include_filepath := false)
//
// One row per record. Files are handed out whole to scanning threads, so the
// records of a file stay in order and sequence_index counts from 1 per file.
class ReadFastaTableFunction {
public:
	static constexpr idx_t SEQUENCE_INDEX_COLUMN = 0;
	static constexpr idx_t READ_ID_COLUMN = 1;
	static constexpr idx_t COMMENT_COLUMN = 2;
	static constexpr idx_t SEQUENCE_COLUMN = 3;
	static constexpr idx_t FILEPATH_COLUMN = 4;

	struct Data : public TableFunctionData {
		InputPaths inputs;
		bool include_filepath;

		Data(InputPaths inputs_p, bool include_filepath_p)
		    : inputs(std::move(inputs_p)), include_filepath(include_filepath_p) {
		}
	};

	// A file being read by one thread
	struct FileCursor {
		idx_t file_idx;
		seqdiff::SequenceReader *reader;
		int64_t next_sequence_index;
	};

	struct GlobalState : public GlobalTableFunctionState {
		mutex lock;
		std::vector<std::unique_ptr<seqdiff::SequenceReader>> readers;
		idx_t next_file_idx = 0;
		bool uses_stdin;

		explicit GlobalState(const InputPaths &inputs);

		// Next unread file, or nullopt when every file has been claimed
		std::optional<FileCursor> Claim();

		// stdin cannot be read in parallel
		idx_t MaxThreads() const override;
	};

	struct LocalState : public LocalTableFunctionState {
		std::optional<FileCursor> cursor;
	};

	static unique_ptr<FunctionData> Bind(ClientContext &context, TableFunctionBindInput &input,
	                                     vector<LogicalType> &return_types, vector<std::string> &names);

	static unique_ptr<GlobalTableFunctionState> InitGlobal(ClientContext &context, TableFunctionInitInput &input);

	static unique_ptr<LocalTableFunctionState> InitLocal(ExecutionContext &context, TableFunctionInitInput &input,
	                                                     GlobalTableFunctionState *global_state);

	static void Execute(ClientContext &context, TableFunctionInput &data_p, DataChunk &output);

	static TableFunction GetFunction();
	static void Register(ExtensionLoader &loader);
};

} // namespace duckdb
