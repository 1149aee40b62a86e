#include <catch2/catch_test_macros.hpp>
#include <string>
#include "DiffStat.hpp"
#include "DistanceMetrics.hpp"

using seqdiff::AlignmentMode;
using seqdiff::DiffStat;
using seqdiff::GapPenalty;
using seqdiff::NotAlignedError;
using seqdiff::ScoringPolicy;

TEST_CASE("DiffStat - distances", "[DiffStat]") {
	SECTION("Equal lengths") {
		DiffStat diff("ACGTACGT", "ACGAACGA", ScoringPolicy(1, -1, GapPenalty(-5, -1)));
		REQUIRE(diff.hamming_distance() == 2);
		REQUIRE(diff.levenshtein() == 2);
	}
	SECTION("Unequal lengths") {
		DiffStat diff("ACGT", "ACGTT", ScoringPolicy(1, -1, GapPenalty(-5, -1)));
		REQUIRE(diff.levenshtein() == 1);
		REQUIRE_THROWS_AS(diff.hamming_distance(), seqdiff::LengthMismatchError);
	}
}

TEST_CASE("DiffStat - current alignment", "[DiffStat]") {
	std::string reference = "ACCGTGGAT";
	std::string query = "AAAAACCGTTGAT";
	DiffStat diff(reference, query, ScoringPolicy(1, -1, GapPenalty(-5, -1)));

	SECTION("Absent before the first alignment") {
		REQUIRE_FALSE(diff.alignment().has_value());
		REQUIRE_THROWS_AS(diff.pretty(120), NotAlignedError);
	}
	SECTION("Each call replaces the previous alignment") {
		diff.global();
		REQUIRE(diff.alignment()->mode == AlignmentMode::GLOBAL);
		REQUIRE(diff.alignment()->score == -2);

		diff.semiglobal();
		REQUIRE(diff.alignment()->mode == AlignmentMode::SEMIGLOBAL);
		REQUIRE(diff.alignment()->score == 7);

		diff.local();
		REQUIRE(diff.alignment()->mode == AlignmentMode::LOCAL);
	}
	SECTION("Rendering uses the borrowed sequences") {
		diff.semiglobal();
		REQUIRE(diff.pretty(120) == "    ACCGTGGAT\n    |||||\\|||\nAAAAACCGTTGAT\n\n\n");
	}
	SECTION("align(mode) matches the shorthands") {
		auto via_mode = diff.align(AlignmentMode::LOCAL);
		auto via_shorthand = diff.local();
		REQUIRE(via_mode == via_shorthand);
	}
}

TEST_CASE("DiffStat - golden rendering", "[DiffStat]") {
	DiffStat diff("CCGTCCGGCAAGGG", "AAAAACCGTTGACGGCCAA", ScoringPolicy(1, -1, GapPenalty(-1, -1)));
	diff.global();
	REQUIRE(diff.pretty(120) == "-----CCGT--CCGGCAAGGG\nxxxxx||||xx\\||||\\|++\\\nAAAAACCGTTGACGGCCA--A\n\n\n");
}
