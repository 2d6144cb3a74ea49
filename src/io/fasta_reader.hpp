#pragma once

#include <cstdint>
#include <fstream>
#include <istream>
#include <string>
#include <vector>

namespace contigsift {

struct FastaRecord {
    std::string header;   // text after '>' up to the line break, verbatim
    std::string sequence; // concatenated sequence lines, no whitespace
};

// Streaming FASTA parser yielding one record per next() call.
//
// A line starting with '>' (after optional spaces or tabs) opens a record;
// anything before the first such line is discarded, as is a leading UTF-8
// byte order mark. "\n", "\r\n" and a lone "\r" all end a line. Blank
// lines and whitespace inside the sequence block contribute nothing.
//
// The reader either owns an input file (open()) or borrows a stream
// supplied by the caller. rewind() restarts from the first byte, so a
// second pass yields the same records in the same order.
class FastaReader {
public:
    FastaReader() = default;
    explicit FastaReader(std::istream& in) : in_(&in), at_start_(true) {}

    FastaReader(const FastaReader&) = delete;
    FastaReader& operator=(const FastaReader&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return in_ != nullptr; }

    // Read the next record. Returns false at end of input or on a read error
    // (check failed() to tell them apart).
    bool next(FastaRecord& rec);

    // Seek back to the start of the input. Returns false if the stream
    // cannot be repositioned.
    bool rewind();

    // True if the underlying stream reported an I/O error.
    bool failed() const { return in_ != nullptr && in_->bad(); }

    uint64_t records_read() const { return records_read_; }

private:
    std::ifstream file_;
    std::istream* in_ = nullptr;
    std::string line_;
    std::string pending_header_;
    bool has_pending_ = false;
    bool at_start_ = false;
    uint64_t records_read_ = 0;

    bool read_line(std::string& line);
};

// Read all records from an input stream.
std::vector<FastaRecord> read_fasta_stream(std::istream& in);

// Read all records from a FASTA file.
// Returns false if the file cannot be opened or read.
bool read_fasta(const std::string& path, std::vector<FastaRecord>& records);

} // namespace contigsift
