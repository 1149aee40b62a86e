#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "SequenceRecord.hpp"
#include "SequenceReader.hpp"

// Test fixture for RAII-based temp file management
class TempFileFixture {
public:
	~TempFileFixture() {
		for (const auto &path : temp_files_) {
			std::filesystem::remove(path);
		}
	}

	void write_temp(const std::string &path, const std::vector<std::string> &records) {
		std::ofstream out(path);
		if (!out) {
			throw std::runtime_error("Failed to create temp file: " + path);
		}
		for (const auto &r : records) {
			out << r;
		}
		out.close();
		temp_files_.push_back(path);
	}

	std::string simple_read(const std::string &id, const std::string &seq, const std::string &qual,
	                        const std::string &comment = "") {
		return "@" + id + (comment.empty() ? "" : " " + comment) + "\n" + seq + "\n+\n" + qual + "\n";
	}

	std::string simple_fasta(const std::string &id, const std::string &seq, const std::string &comment = "") {
		return ">" + id + (comment.empty() ? "" : " " + comment) + "\n" + seq + "\n";
	}

private:
	std::vector<std::string> temp_files_;
};

TEST_CASE("SequenceReader FASTA", "[SequenceReader]") {
	TempFileFixture fixture;
	auto path = "seqdiff_test_ref.fasta";
	fixture.write_temp(path, {fixture.simple_fasta("ref1", "ACGTACGT", "first reference"),
	                          fixture.simple_fasta("ref2", "TTGACC")});

	seqdiff::SequenceReader reader(path);
	auto batch = reader.read(10);

	REQUIRE(batch.size() == 2);
	REQUIRE(batch.read_ids[0] == "ref1");
	REQUIRE(batch.comments[0] == "first reference");
	REQUIRE(batch.sequences[0] == "ACGTACGT");
	REQUIRE(batch.read_ids[1] == "ref2");
	REQUIRE(batch.comments[1].empty());
	REQUIRE(batch.sequences[1] == "TTGACC");

	REQUIRE(reader.read(10).empty());
}

TEST_CASE("SequenceReader FASTQ drops qualities", "[SequenceReader]") {
	TempFileFixture fixture;
	auto path = "seqdiff_test_query.fastq";
	fixture.write_temp(path, {fixture.simple_read("q1/1", "ACGT", "IIII"), fixture.simple_read("q2", "TGCA", "HHHH")});

	seqdiff::SequenceReader reader(path);
	auto batch = reader.read(5);

	REQUIRE(batch.size() == 2);
	REQUIRE(batch.read_ids[0] == "q1");
	REQUIRE(batch.sequences[0] == "ACGT");
	REQUIRE(batch.read_ids[1] == "q2");
	REQUIRE(batch.sequences[1] == "TGCA");
}

TEST_CASE("SequenceReader batches", "[SequenceReader]") {
	TempFileFixture fixture;
	auto path = "seqdiff_test_batches.fasta";
	fixture.write_temp(path, {fixture.simple_fasta("a", "A"), fixture.simple_fasta("b", "C"),
	                          fixture.simple_fasta("c", "G")});

	seqdiff::SequenceReader reader(path);

	SECTION("First batch includes the buffered record") {
		auto first = reader.read(2);
		REQUIRE(first.size() == 2);
		REQUIRE(first.read_ids[0] == "a");
		REQUIRE(first.read_ids[1] == "b");

		auto second = reader.read(2);
		REQUIRE(second.size() == 1);
		REQUIRE(second.read_ids[0] == "c");

		REQUIRE(reader.read(2).empty());
	}
	SECTION("Single record batches") {
		REQUIRE(reader.read(1).read_ids[0] == "a");
		REQUIRE(reader.read(1).read_ids[0] == "b");
		REQUIRE(reader.read(1).read_ids[0] == "c");
		REQUIRE(reader.read(1).empty());
	}
	SECTION("Non-positive batch size") {
		REQUIRE(reader.read(0).empty());
	}
}

TEST_CASE("SequenceReader errors", "[SequenceReader]") {
	TempFileFixture fixture;

	SECTION("Missing file") {
		REQUIRE_THROWS_AS(seqdiff::SequenceReader("seqdiff_test_does_not_exist.fasta"), std::runtime_error);
	}
	SECTION("Empty file") {
		auto path = "seqdiff_test_empty.fasta";
		fixture.write_temp(path, {});
		REQUIRE_THROWS_AS(seqdiff::SequenceReader(path), std::runtime_error);
	}
}

TEST_CASE("BaseReadId", "[SequenceReader]") {
	REQUIRE(seqdiff::BaseReadId("read/1") == "read");
	REQUIRE(seqdiff::BaseReadId("read/2") == "read");
	REQUIRE(seqdiff::BaseReadId("read/0") == "read/0");
	REQUIRE(seqdiff::BaseReadId("read extra words") == "read");
	REQUIRE(seqdiff::BaseReadId("/1") == "/1");
	REQUIRE(seqdiff::BaseReadId("r") == "r");
}
