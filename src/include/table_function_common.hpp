#pragma once
#include <string>
#include <vector>
#include "duckdb/common/types/value.hpp"
#include "duckdb/common/named_parameter_map.hpp"
#include "duckdb/common/file_system.hpp"
#include "duckdb/main/client_context.hpp"

namespace duckdb {

// Input files of a reader table function after glob expansion and stdin handling
struct InputPaths {
	std::vector<std::string> paths;
	bool uses_stdin = false;
};

// True for the spellings of standard input accepted as a file path
bool IsStdinPath(const std::string &path);

//! Resolves the first argument of a reader function. A VARCHAR is glob-expanded
//! (sorted), a VARCHAR[] is taken literally. Standard input must be the only path
//! and is rewritten to /dev/stdin. Every other path must exist.
InputPaths ResolveInputPaths(ClientContext &context, const Value &input, const std::string &function_name);

// include_filepath named parameter (optional BOOLEAN, default false)
bool ParseIncludeFilepathParameter(const named_parameter_map_t &named_parameters);

} // namespace duckdb
