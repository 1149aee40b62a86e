#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>
#include "DistanceMetrics.hpp"

using seqdiff::Hamming;
using seqdiff::LengthMismatchError;
using seqdiff::Levenshtein;

TEST_CASE("Levenshtein - known distances", "[DistanceMetrics]") {
	REQUIRE(Levenshtein("kitten", "sitting") == 3);
	REQUIRE(Levenshtein("ACGT", "ACGT") == 0);
	REQUIRE(Levenshtein("ACGT", "AGT") == 1);
	REQUIRE(Levenshtein("ACGT", "TGCA") == 4);
	REQUIRE(Levenshtein("", "ACG") == 3);
	REQUIRE(Levenshtein("ACG", "") == 3);
	REQUIRE(Levenshtein("", "") == 0);
}

TEST_CASE("Levenshtein - metric properties", "[DistanceMetrics]") {
	std::vector<std::string> sequences = {"", "A", "ACGT", "ACCGTGGAT", "AAAAACCGTTGAT", "TTACGTTT", "GGACGTACG"};

	SECTION("Zero exactly for identical sequences") {
		for (const auto &a : sequences) {
			for (const auto &b : sequences) {
				REQUIRE((Levenshtein(a, b) == 0) == (a == b));
			}
		}
	}
	SECTION("Symmetric") {
		for (const auto &a : sequences) {
			for (const auto &b : sequences) {
				REQUIRE(Levenshtein(a, b) == Levenshtein(b, a));
			}
		}
	}
	SECTION("Triangle inequality") {
		for (const auto &a : sequences) {
			for (const auto &b : sequences) {
				for (const auto &c : sequences) {
					REQUIRE(Levenshtein(a, c) <= Levenshtein(a, b) + Levenshtein(b, c));
				}
			}
		}
	}
}

TEST_CASE("Hamming - distances", "[DistanceMetrics]") {
	SECTION("Counts differing positions") {
		REQUIRE(Hamming("ACGT", "ACGT") == 0);
		REQUIRE(Hamming("ACGT", "ACAT") == 1);
		REQUIRE(Hamming("AAAA", "TTTT") == 4);
		REQUIRE(Hamming("", "") == 0);
	}
	SECTION("Bytes are compared as-is") {
		REQUIRE(Hamming("acgt", "ACGT") == 4);
	}
	SECTION("Unequal lengths fail") {
		REQUIRE_THROWS_AS(Hamming("ACGT", "ACG"), LengthMismatchError);
		REQUIRE_THROWS_AS(Hamming("", "A"), std::invalid_argument);
	}
	SECTION("Error carries both lengths") {
		try {
			Hamming("ACGT", "AC");
			FAIL("Expected LengthMismatchError");
		} catch (const LengthMismatchError &e) {
			REQUIRE(e.a_length == 4);
			REQUIRE(e.b_length == 2);
		}
	}
}
