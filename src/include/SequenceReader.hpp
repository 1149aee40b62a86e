#pragma once
#include <memory>
#include <string>
#include <vector>
#include <kseq++/seqio.hpp>
#include "SequenceRecord.hpp"

namespace seqdiff {

// Reads FASTA or FASTQ records, plain or gzip-compressed. Quality strings of
// FASTQ input are dropped.
class SequenceReader {
public:
	// Throws std::runtime_error when the file cannot be opened or holds no records
	explicit SequenceReader(const std::string &path);

	// Up to n records; an empty batch signals the end of the input
	SequenceRecordBatch read(const int n);

private:
	using SeqStreamIn = klibpp::SeqStreamIn;

	std::unique_ptr<SeqStreamIn> reader_;
	bool first_read_; // Track if we need to return buffered data
	std::vector<klibpp::KSeq> buffered_;
};

// Read id without its comment and without a trailing /1 style mate suffix
std::string BaseReadId(const std::string &id);

}; // namespace seqdiff
