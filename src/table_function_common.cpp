#include "table_function_common.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/file_system.hpp"
#include "duckdb/common/types/value.hpp"
#include <algorithm>

namespace duckdb {

bool IsStdinPath(const std::string &path) {
	return path == "-" || path == "/dev/stdin" || path == "/dev/fd/0" || path == "/proc/self/fd/0";
}

// Any pattern under the stdin device directories, or starting with '-'
static bool GlobCouldMatchStdin(const std::string &pattern) {
	for (const char *prefix : {"/dev/std", "/dev/fd/", "/proc/self/fd/"}) {
		if (pattern.find(prefix) != std::string::npos) {
			return true;
		}
	}
	return !pattern.empty() && pattern[0] == '-';
}

static std::vector<std::string> ExpandGlob(FileSystem &fs, ClientContext &context, const std::string &pattern) {
	if (!FileSystem::HasGlob(pattern)) {
		return {pattern};
	}
	if (GlobCouldMatchStdin(pattern)) {
		throw InvalidInputException("Glob patterns cannot include stdin paths");
	}

	std::vector<std::string> matched;
	for (const auto &file : fs.GlobFiles(pattern, context, FileGlobOptions::ALLOW_EMPTY)) {
		matched.push_back(file.path);
	}
	if (matched.empty()) {
		throw IOException("No files matched pattern: " + pattern);
	}
	std::sort(matched.begin(), matched.end());
	return matched;
}

static std::vector<std::string> ListPaths(const Value &input, const std::string &function_name) {
	std::vector<std::string> listed;
	for (const auto &child : ListValue::GetChildren(input)) {
		if (child.IsNull()) {
			throw InvalidInputException(function_name + ": file paths must not be NULL");
		}
		listed.push_back(child.ToString());
	}
	return listed;
}

InputPaths ResolveInputPaths(ClientContext &context, const Value &input, const std::string &function_name) {
	if (input.IsNull()) {
		throw InvalidInputException(function_name + ": file path must not be NULL");
	}

	auto &fs = FileSystem::GetFileSystem(context);
	InputPaths resolved;
	switch (input.type().id()) {
	case LogicalTypeId::VARCHAR:
		resolved.paths = ExpandGlob(fs, context, input.ToString());
		break;
	case LogicalTypeId::LIST:
		resolved.paths = ListPaths(input, function_name);
		break;
	default:
		throw InvalidInputException(function_name + ": first argument must be VARCHAR or VARCHAR[]");
	}
	if (resolved.paths.empty()) {
		throw InvalidInputException(function_name + ": at least one file path must be provided");
	}

	auto stdin_count = std::count_if(resolved.paths.begin(), resolved.paths.end(), IsStdinPath);
	if (stdin_count > 0) {
		if (resolved.paths.size() > 1) {
			throw InvalidInputException(function_name +
			                            ": stdin ('-' or '/dev/stdin') must be the only file path");
		}
		// kseq++ opens stdin through its device path
		resolved.paths[0] = "/dev/stdin";
		resolved.uses_stdin = true;
		return resolved;
	}

	for (const auto &path : resolved.paths) {
		if (!fs.FileExists(path)) {
			throw IOException(function_name + ": file not found: " + path);
		}
	}
	return resolved;
}

bool ParseIncludeFilepathParameter(const named_parameter_map_t &named_parameters) {
	auto param = named_parameters.find("include_filepath");
	if (param == named_parameters.end() || param->second.IsNull()) {
		return false;
	}
	return param->second.GetValue<bool>();
}

} // namespace duckdb
