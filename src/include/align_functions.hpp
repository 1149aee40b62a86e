#pragma once

#include "duckdb/function/scalar_function.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

namespace duckdb {

class SequenceAlignFunction {
public:
	static void Register(ExtensionLoader &loader);
};

class SequenceAlignPrettyFunction {
public:
	static void Register(ExtensionLoader &loader);
};

class SequenceMutationStatsFunction {
public:
	static void Register(ExtensionLoader &loader);
};

} // namespace duckdb
