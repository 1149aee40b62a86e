#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <string>
#include <vector>
#include "DiffStat.hpp"
#include "MutationStats.hpp"
#include "PairwiseAligner.hpp"

using seqdiff::AlignmentOperation;
using seqdiff::AlignmentResult;
using seqdiff::DiffStat;
using seqdiff::GapPenalty;
using seqdiff::MutationReducer;
using seqdiff::MutationStats;
using seqdiff::NotAlignedError;
using seqdiff::ScoringPolicy;

static void RequireInvariants(const MutationStats &stats) {
	REQUIRE(stats.total == stats.matches + stats.mismatches);
	REQUIRE(stats.mismatches == stats.substitutions + stats.insertions + stats.deletions);
}

TEST_CASE("MutationStats - classification", "[MutationStats]") {
	using Op = AlignmentOperation;
	AlignmentResult result;
	result.operations = {Op::XCLIP, Op::MATCH, Op::SUBST, Op::INS, Op::DEL, Op::MATCH, Op::YCLIP};

	auto stats = MutationReducer(result).reduce();
	REQUIRE(stats.matches == 2);
	REQUIRE(stats.substitutions == 1);
	REQUIRE(stats.insertions == 1);
	REQUIRE(stats.deletions == 1);
	REQUIRE(stats.mismatches == 3);
	REQUIRE(stats.total == 5);
	RequireInvariants(stats);
}

TEST_CASE("MutationStats - gap opens", "[MutationStats]") {
	using Op = AlignmentOperation;

	SECTION("A run of one kind is one gap") {
		AlignmentResult result;
		result.operations = {Op::MATCH, Op::DEL, Op::DEL, Op::DEL, Op::MATCH};
		REQUIRE(seqdiff::ReduceMutations(result).gap_opens == 1);
	}
	SECTION("Insertion next to deletion counts twice") {
		AlignmentResult result;
		result.operations = {Op::MATCH, Op::INS, Op::INS, Op::DEL, Op::MATCH};
		REQUIRE(seqdiff::ReduceMutations(result).gap_opens == 2);
	}
	SECTION("Clips do not interrupt a run") {
		AlignmentResult result;
		result.operations = {Op::INS, Op::YCLIP, Op::INS, Op::MATCH, Op::INS};
		REQUIRE(seqdiff::ReduceMutations(result).gap_opens == 2);
	}
	SECTION("Matches and substitutions end a run") {
		AlignmentResult result;
		result.operations = {Op::DEL, Op::SUBST, Op::DEL, Op::MATCH, Op::DEL};
		REQUIRE(seqdiff::ReduceMutations(result).gap_opens == 3);
	}
}

TEST_CASE("MutationStats - identity", "[MutationStats]") {
	using Op = AlignmentOperation;

	SECTION("Empty trace") {
		REQUIRE(MutationStats().identity() == 0.0);
	}
	SECTION("Clips only") {
		AlignmentResult result;
		result.operations = {Op::XCLIP, Op::YCLIP};
		auto stats = seqdiff::ReduceMutations(result);
		REQUIRE(stats.total == 0);
		REQUIRE(stats.identity() == 0.0);
	}
	SECTION("Fraction of matches") {
		AlignmentResult result;
		result.operations = {Op::MATCH, Op::MATCH, Op::MATCH, Op::SUBST};
		REQUIRE(seqdiff::ReduceMutations(result).identity() == Catch::Approx(0.75));
	}
}

TEST_CASE("MutationStats - from aligned pairs", "[MutationStats]") {
	SECTION("Golden global alignment") {
		DiffStat diff("CCGTCCGGCAAGGG", "AAAAACCGTTGACGGCCAA", ScoringPolicy(1, -1, GapPenalty(-1, -1)));
		diff.global();
		auto stats = MutationReducer(diff).reduce();
		REQUIRE(stats.matches == 9);
		REQUIRE(stats.substitutions == 3);
		REQUIRE(stats.insertions == 2);
		REQUIRE(stats.deletions == 7);
		REQUIRE(stats.mismatches == 12);
		REQUIRE(stats.total == 21);
		REQUIRE(stats.gap_opens == 3);
		RequireInvariants(stats);
	}
	SECTION("Total equals the non-clip part of the trace") {
		DiffStat diff("ACCGTGGAT", "AAAAACCGTTGAT", ScoringPolicy(1, -1, GapPenalty(-5, -1)));
		for (auto mode : {seqdiff::AlignmentMode::GLOBAL, seqdiff::AlignmentMode::LOCAL,
		                  seqdiff::AlignmentMode::SEMIGLOBAL}) {
			const auto &alignment = diff.align(mode);
			int64_t non_clip = 0;
			for (auto op : alignment.operations) {
				if (op != AlignmentOperation::XCLIP && op != AlignmentOperation::YCLIP) {
					non_clip++;
				}
			}
			auto stats = MutationReducer(diff).reduce();
			REQUIRE(stats.total == non_clip);
			RequireInvariants(stats);
		}
	}
	SECTION("Semiglobal clips are not counted") {
		DiffStat diff("ACCGTGGAT", "AAAAACCGTTGAT", ScoringPolicy(1, -1, GapPenalty(-5, -1)));
		diff.semiglobal();
		auto stats = MutationReducer(diff).reduce();
		REQUIRE(stats.matches == 8);
		REQUIRE(stats.substitutions == 1);
		REQUIRE(stats.total == 9);
		REQUIRE(stats.gap_opens == 0);
	}
}

TEST_CASE("MutationReducer - requires an alignment", "[MutationStats]") {
	DiffStat diff("ACGT", "ACGT", ScoringPolicy(1, -1, GapPenalty(-5, -1)));

	SECTION("Before any alignment") {
		REQUIRE_THROWS_AS(MutationReducer(diff), NotAlignedError);
	}
	SECTION("Distance metrics do not count as an alignment") {
		REQUIRE(diff.levenshtein() == 0);
		REQUIRE_THROWS_AS(MutationReducer(diff), NotAlignedError);
	}
	SECTION("After an alignment") {
		diff.local();
		REQUIRE_NOTHROW(MutationReducer(diff));
		REQUIRE(MutationReducer(diff).reduce().matches == 4);
	}
}
