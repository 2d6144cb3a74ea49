#pragma once

#include <cstdint>
#include <fstream>
#include <ostream>
#include <string>

#include "io/fasta_reader.hpp"

namespace contigsift {

// Write one record as ">" + header + "\n" + sequence + "\n".
void write_fasta_record(std::ostream& out, const FastaRecord& rec);

// Writes a FASTA file that replaces its destination atomically.
//
// Records go to "<path>.tmp"; commit() renames the temporary file over
// <path>. If the writer is destroyed or aborted before commit(), the
// temporary file is removed and any previous <path> is left as it was.
class FastaWriter {
public:
    FastaWriter() = default;
    ~FastaWriter();

    FastaWriter(const FastaWriter&) = delete;
    FastaWriter& operator=(const FastaWriter&) = delete;

    bool open(const std::string& path);
    bool write(const FastaRecord& rec);
    bool commit();
    void abort();

    bool is_open() const { return out_.is_open(); }
    uint64_t records_written() const { return records_written_; }

    // Description of the last failure (empty if none).
    const std::string& error() const { return error_; }

private:
    std::string path_;
    std::string tmp_path_;
    std::ofstream out_;
    uint64_t records_written_ = 0;
    std::string error_;

    void set_error(const std::string& what);
};

} // namespace contigsift
