#include <SequenceReader.hpp>

#include <fstream>
#include <stdexcept>

namespace seqdiff {

std::string BaseReadId(const std::string &id) {
	// First, strip comments (everything after first space)
	size_t space_pos = id.find(' ');
	std::string base = (space_pos == std::string::npos) ? id : id.substr(0, space_pos);

	// Need at least 3 chars for pattern "x/1"
	if (base.length() >= 3) {
		size_t len = base.length();
		char last_char = base[len - 1];
		char second_last = base[len - 2];

		if (second_last == '/' && last_char >= '1' && last_char <= '9') {
			base = base.substr(0, len - 2);
		}
	}

	return base;
}

SequenceReader::SequenceReader(const std::string &path) : first_read_(true) {
	if (!std::ifstream(path).good()) {
		throw std::runtime_error("Cannot open file: " + path);
	}
	reader_ = std::make_unique<SeqStreamIn>(path.c_str());

	// Peek at the first record so empty input fails at construction.
	// It is handed out by the first read() call instead of recreating the reader.
	buffered_ = reader_->read(1);
	if (buffered_.empty()) {
		throw std::runtime_error("Empty file: " + path);
	}
}

SequenceRecordBatch SequenceReader::read(const int n) {
	SequenceRecordBatch batch;
	if (n <= 0) {
		return batch;
	}
	batch.reserve(n);

	std::vector<klibpp::KSeq> reads;
	if (first_read_) {
		first_read_ = false;
		reads = std::move(buffered_);

		int remaining = n - (int)reads.size();
		if (remaining > 0) {
			auto more = reader_->read(remaining);
			reads.insert(reads.end(), more.begin(), more.end());
		}
	} else {
		reads = reader_->read(n);
	}

	for (auto &rec : reads) {
		batch.read_ids.emplace_back(BaseReadId(rec.name));
		batch.comments.emplace_back(rec.comment);
		batch.sequences.emplace_back(rec.seq);
	}

	return batch;
}
}; // namespace seqdiff
