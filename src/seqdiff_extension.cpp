#define DUCKDB_EXTENSION_MAIN

#include "seqdiff_extension.hpp"
#include <align_functions.hpp>
#include <distance_functions.hpp>
#include <poa_functions.hpp>
#include <read_fasta.hpp>
#include <seqdiff_macros.hpp>

namespace duckdb {

static void LoadInternal(ExtensionLoader &loader) {
	ReadFastaTableFunction::Register(loader);

	SequenceAlignFunction::Register(loader);
	SequenceAlignPrettyFunction::Register(loader);
	SequenceMutationStatsFunction::Register(loader);
	SequenceDistanceFunctions::Register(loader);
	SequencePoaAlignFunction::Register(loader);

	SeqdiffMacros::Register(loader);
}

void SeqdiffExtension::Load(ExtensionLoader &loader) {
	LoadInternal(loader);
}

std::string SeqdiffExtension::Name() {
	return "seqdiff";
}

std::string SeqdiffExtension::Version() const {
#ifdef EXT_VERSION_SEQDIFF
	return EXT_VERSION_SEQDIFF;
#else
	return "unversioned";
#endif
}

} // namespace duckdb

extern "C" {

DUCKDB_CPP_EXTENSION_ENTRY(seqdiff, loader) {
	duckdb::LoadInternal(loader);
}
}
