#pragma once

#include "duckdb.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

namespace duckdb {

// sequence_identity(reference, query)
//
// Fraction of aligned columns that are matches, using the default semiglobal
// scoring of sequence_mutation_stats. NULL if either input is NULL.
const std::string SEQUENCE_IDENTITY = // NOLINT
    "CREATE OR REPLACE MACRO sequence_identity(reference, query) AS "
    "(sequence_mutation_stats(reference, query)).identity; ";

// diff_fasta(reference_path, query_path)
//
// Compare every record of a query FASTA file against a single reference record.
//
// Parameters:
// reference_path : VARCHAR, FASTA file holding the reference. Only the first
//     record is used; for a glob, the first record of the first matching file
//     in sorted order.
// query_path : VARCHAR, FASTA file(s) to compare; supports glob patterns
//
// Returns a table with columns:
// - reference_id: VARCHAR
// - query_id: VARCHAR
// - score: BIGINT (semiglobal alignment score)
// - cigar: VARCHAR (reference as the read)
// - stats: STRUCT (see sequence_mutation_stats)
const std::string DIFF_FASTA = // NOLINT
    "CREATE OR REPLACE MACRO diff_fasta(reference_path, query_path) AS TABLE "
    "WITH "
    "    reference AS ( "
    "        SELECT read_id, sequence "
    "        FROM read_fasta(reference_path, include_filepath := true) "
    "        WHERE sequence_index = 1 "
    "        ORDER BY filepath "
    "        LIMIT 1 "
    "    ), "
    "    aligned AS ( "
    "        SELECT "
    "            r.read_id AS reference_id, "
    "            q.read_id AS query_id, "
    "            sequence_align(r.sequence, q.sequence) AS alignment, "
    "            sequence_mutation_stats(r.sequence, q.sequence) AS stats "
    "        FROM reference r, read_fasta(query_path) q "
    "    ) "
    "SELECT "
    "    reference_id, "
    "    query_id, "
    "    alignment.score AS score, "
    "    alignment.cigar AS cigar, "
    "    stats "
    "FROM aligned; ";

class SeqdiffMacros {
public:
	static void Register(ExtensionLoader &loader) {
		auto &instance = loader.GetDatabaseInstance();
		Connection con(instance);

		for (const auto &macro : {SEQUENCE_IDENTITY, DIFF_FASTA}) {
			auto result = con.Query(macro);
			if (result->HasError()) {
				result->ThrowError();
			}
		}
	}
};

} // namespace duckdb
