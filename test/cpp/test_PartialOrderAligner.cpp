#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>
#include "MutationStats.hpp"
#include "PartialOrderAligner.hpp"

using seqdiff::AlignmentOperation;
using seqdiff::AlignmentSizeError;
using seqdiff::GapPenalty;
using seqdiff::NotAlignedError;
using seqdiff::PartialOrderAligner;
using seqdiff::PartialOrderGraph;
using seqdiff::PartialOrderLimits;
using seqdiff::ScoringPolicy;

static ScoringPolicy DefaultScoring() {
	return ScoringPolicy(1, -1, GapPenalty(-5, -1));
}

TEST_CASE("PartialOrderGraph - seed path", "[PartialOrderAligner]") {
	PartialOrderGraph graph("ACGT");
	REQUIRE(graph.node_count() == 4);
	REQUIRE(graph.edge_count() == 3);
	REQUIRE(graph.order() == std::vector<uint32_t> {0, 1, 2, 3});
	REQUIRE(graph.consensus() == "ACGT");

	SECTION("Empty seed") {
		PartialOrderGraph empty("");
		REQUIRE(empty.empty());
		REQUIRE(empty.consensus().empty());
	}
}

TEST_CASE("PartialOrderAligner - seed only", "[PartialOrderAligner]") {
	auto aligned = seqdiff::AlignToReferences(DefaultScoring(), "ACGT", {}, "ACGT");

	REQUIRE(aligned.alignment.score == 4);
	REQUIRE(aligned.alignment.operations == std::vector<AlignmentOperation>(4, AlignmentOperation::MATCH));
	REQUIRE(aligned.nodes == std::vector<int64_t> {0, 1, 2, 3});
	REQUIRE(aligned.path == "ACGT");

	auto stats = seqdiff::ReduceMutations(aligned.alignment);
	REQUIRE(stats.matches == 4);
	REQUIRE(stats.mismatches == 0);
}

TEST_CASE("PartialOrderAligner - building a graph", "[PartialOrderAligner]") {
	PartialOrderAligner aligner(DefaultScoring(), "ACGTACGT");

	auto substituted = aligner.add_sequence("ACGTTCGT");
	REQUIRE(substituted.alignment.score == 6);
	REQUIRE(substituted.alignment.cigar() == "4=1X3=");

	auto inserted = aligner.add_sequence("ACGACGT");
	REQUIRE(inserted.alignment.score == 1);
	REQUIRE(inserted.alignment.cigar() == "3=1I4=");

	// The substitution added one node, the skipped T added none
	REQUIRE(aligner.graph().node_count() == 9);
	REQUIRE(aligner.consensus() == "ACGTACGT");

	SECTION("Query following the substituted branch") {
		const auto &aligned = aligner.global("ACGTTCGT");
		REQUIRE(aligned.alignment.score == 8);
		REQUIRE(aligned.nodes == std::vector<int64_t> {0, 1, 2, 3, 8, 5, 6, 7});
		REQUIRE(aligned.path == "ACGTTCGT");
	}
	SECTION("Query following the seed") {
		REQUIRE(aligner.global("ACGTACGT").alignment.score == 8);
	}
	SECTION("Query skipping a node") {
		REQUIRE(aligner.global("ACGACGT").alignment.score == 7);
	}
	SECTION("Rendering against the node path") {
		const auto &aligned = aligner.global("ACGTTCGT");
		REQUIRE(aligned.alignment.pretty(aligned.path, "ACGTTCGT", 120) == "ACGTTCGT\n||||||||\nACGTTCGT\n\n\n");
	}
}

TEST_CASE("PartialOrderAligner - empty inputs", "[PartialOrderAligner]") {
	SECTION("Empty seed, query is all deletions") {
		auto aligned = seqdiff::AlignToReferences(DefaultScoring(), "", {}, "ACG");
		REQUIRE(aligned.alignment.score == -8);
		REQUIRE(aligned.alignment.cigar() == "3D");
		REQUIRE(aligned.nodes == std::vector<int64_t> {-1, -1, -1});
	}
	SECTION("Empty seed and query") {
		auto aligned = seqdiff::AlignToReferences(DefaultScoring(), "", {}, "");
		REQUIRE(aligned.alignment.score == 0);
		REQUIRE(aligned.alignment.operations.empty());
	}
	SECTION("Empty query skips every node") {
		auto aligned = seqdiff::AlignToReferences(DefaultScoring(), "ACGT", {}, "");
		REQUIRE(aligned.alignment.score == -9);
		REQUIRE(aligned.alignment.cigar() == "4I");
	}
}

TEST_CASE("PartialOrderAligner - merge requires an alignment", "[PartialOrderAligner]") {
	PartialOrderAligner aligner(DefaultScoring(), "ACGT");

	SECTION("Nothing aligned yet") {
		REQUIRE_THROWS_AS(aligner.add_to_graph(), NotAlignedError);
	}
	SECTION("Each alignment merges once") {
		aligner.global("ACGT");
		REQUIRE_NOTHROW(aligner.add_to_graph());
		REQUIRE_THROWS_AS(aligner.add_to_graph(), NotAlignedError);
	}
	SECTION("Merging an identical sequence only adds weight") {
		aligner.add_sequence("ACGT");
		REQUIRE(aligner.graph().node_count() == 4);
		REQUIRE(aligner.graph().edge_count() == 3);
		REQUIRE(aligner.graph().edge(0).weight == 2);
	}
}

TEST_CASE("PartialOrderAligner - size limits", "[PartialOrderAligner]") {
	PartialOrderLimits limits;
	limits.max_cells = 30;
	limits.warn_cells = 10;

	SECTION("Over the limit fails before aligning") {
		// (4 nodes + 1) * (6 + 1) = 35 cells
		PartialOrderAligner aligner(DefaultScoring(), "ACGT", limits);
		REQUIRE_THROWS_AS(aligner.global("ACGTAC"), AlignmentSizeError);
		REQUIRE_THROWS_AS(aligner.add_to_graph(), NotAlignedError);
	}
	SECTION("Over the warning threshold calls the handler once") {
		std::vector<std::string> warnings;
		PartialOrderAligner aligner(DefaultScoring(), "ACGT", limits);
		aligner.set_warning_handler([&](const std::string &msg) { warnings.push_back(msg); });
		// (4 + 1) * (4 + 1) = 25 cells
		aligner.global("ACGT");
		REQUIRE(warnings.size() == 1);
	}
	SECTION("Under the threshold stays silent") {
		std::vector<std::string> warnings;
		PartialOrderAligner aligner(DefaultScoring(), "AC", limits);
		aligner.set_warning_handler([&](const std::string &msg) { warnings.push_back(msg); });
		// (2 + 1) * (2 + 1) = 9 cells
		aligner.global("AC");
		REQUIRE(warnings.empty());
	}
	SECTION("Zero limit is rejected") {
		PartialOrderLimits zero;
		zero.max_cells = 0;
		REQUIRE_THROWS_AS(PartialOrderAligner(DefaultScoring(), "ACGT", zero), seqdiff::ConfigurationError);
	}
}

TEST_CASE("PartialOrderAligner - extreme scoring values", "[PartialOrderAligner]") {
	ScoringPolicy scoring(2000000000, -1, GapPenalty(-2000000000, -2000000000));

	SECTION("Matches summing past 32 bits") {
		auto aligned = seqdiff::AlignToReferences(scoring, "ACGT", {}, "ACGT");
		REQUIRE(aligned.alignment.score == 8000000000LL);
	}
	SECTION("Skipped nodes summing past 32 bits") {
		// open + 4 * extend
		auto aligned = seqdiff::AlignToReferences(scoring, "ACGT", {}, "");
		REQUIRE(aligned.alignment.score == -10000000000LL);
		REQUIRE(aligned.alignment.cigar() == "4I");
	}
}
