#include "io/fasta_reader.hpp"
#include "core/config.hpp"

#include <string>

namespace contigsift {

static bool is_sequence_space(char c) {
    return c == ' ' || c == '\t' || c == '\v' || c == '\f';
}

// If line is a marker line (optionally indented by spaces or tabs), store
// the text after the marker in header and return true.
static bool marker_header(const std::string& line, std::string& header) {
    size_t i = 0;
    while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) i++;
    if (i == line.size() || line[i] != FASTA_MARKER) return false;
    header.assign(line, i + 1, std::string::npos);
    return true;
}

static void append_sequence_line(std::string& seq, const std::string& line) {
    for (char c : line) {
        if (!is_sequence_space(c)) seq.push_back(c);
    }
}

bool FastaReader::open(const std::string& path) {
    close();
    file_.open(path, std::ios::in | std::ios::binary);
    if (!file_.is_open()) return false;
    in_ = &file_;
    at_start_ = true;
    return true;
}

void FastaReader::close() {
    if (file_.is_open()) file_.close();
    file_.clear();
    in_ = nullptr;
    pending_header_.clear();
    has_pending_ = false;
    records_read_ = 0;
}

// Read one line, accepting "\n", "\r\n" or "\r" as terminator.
// A UTF-8 byte order mark at the start of the input is dropped.
// Returns false only when no characters remain.
bool FastaReader::read_line(std::string& line) {
    using traits = std::istream::traits_type;
    line.clear();
    if (at_start_) {
        at_start_ = false;
        bool got = read_line(line);
        if (line.compare(0, 3, UTF8_BOM) == 0) line.erase(0, 3);
        return got;
    }
    std::streambuf* sb = in_->rdbuf();
    bool got_any = false;
    for (;;) {
        traits::int_type c = sb->sbumpc();
        if (traits::eq_int_type(c, traits::eof())) {
            in_->setstate(std::ios::eofbit);
            return got_any;
        }
        got_any = true;
        char ch = traits::to_char_type(c);
        if (ch == '\n') return true;
        if (ch == '\r') {
            if (traits::eq_int_type(sb->sgetc(), traits::to_int_type('\n')))
                sb->sbumpc();
            return true;
        }
        line.push_back(ch);
    }
}

bool FastaReader::next(FastaRecord& rec) {
    rec.header.clear();
    rec.sequence.clear();
    if (in_ == nullptr) return false;

    if (!has_pending_) {
        // Skip anything before the first marker line
        while (read_line(line_)) {
            if (marker_header(line_, pending_header_)) {
                has_pending_ = true;
                break;
            }
        }
        if (!has_pending_) return false;
    }

    rec.header.swap(pending_header_);
    pending_header_.clear();
    has_pending_ = false;

    while (read_line(line_)) {
        if (marker_header(line_, pending_header_)) {
            has_pending_ = true;
            break;
        }
        append_sequence_line(rec.sequence, line_);
    }

    records_read_++;
    return true;
}

bool FastaReader::rewind() {
    if (in_ == nullptr) return false;
    in_->clear();
    in_->seekg(0, std::ios::beg);
    if (in_->fail()) return false;
    pending_header_.clear();
    has_pending_ = false;
    at_start_ = true;
    records_read_ = 0;
    return true;
}

std::vector<FastaRecord> read_fasta_stream(std::istream& in) {
    std::vector<FastaRecord> records;
    FastaReader reader(in);
    FastaRecord rec;
    while (reader.next(rec)) {
        records.push_back(std::move(rec));
    }
    return records;
}

bool read_fasta(const std::string& path, std::vector<FastaRecord>& records) {
    records.clear();
    FastaReader reader;
    if (!reader.open(path)) return false;
    FastaRecord rec;
    while (reader.next(rec)) {
        records.push_back(std::move(rec));
    }
    return !reader.failed();
}

} // namespace contigsift
