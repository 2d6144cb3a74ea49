#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>

#include "core/config.hpp"
#include "io/fasta_reader.hpp"
#include "util/logger.hpp"

namespace contigsift {

// Number of characters in a sequence. UTF-8 continuation bytes are not
// counted, so a multi-byte character counts once.
std::size_t sequence_length(const std::string& seq);

// Keeps a record whole iff sequence_length(sequence) >= min_length.
class LengthFilter {
public:
    explicit LengthFilter(std::size_t min_length = DEFAULT_MIN_LENGTH)
        : min_length_(min_length) {}

    bool accepts(const FastaRecord& rec) const {
        return sequence_length(rec.sequence) >= min_length_;
    }
    bool operator()(const FastaRecord& rec) const { return accepts(rec); }

    std::size_t min_length() const { return min_length_; }

private:
    std::size_t min_length_;
};

struct FilterStats {
    uint64_t records_in = 0;
    uint64_t records_out = 0;
    uint64_t bases_out = 0;
    uint64_t malformed = 0;  // records with an empty header

    uint64_t records_dropped() const { return records_in - records_out; }
};

// Filter records from a stream into another stream, preserving order.
void filter_fasta_stream(std::istream& in, std::ostream& out,
                         const LengthFilter& filter, FilterStats& stats);

// Filter one FASTA file into output_path. The output is replaced only if
// the whole input was read and written successfully.
bool filter_fasta_file(const std::string& input_path,
                       const std::string& output_path,
                       const LengthFilter& filter,
                       FilterStats& stats,
                       const Logger& logger);

} // namespace contigsift
