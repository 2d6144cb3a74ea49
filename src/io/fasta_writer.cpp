#include "io/fasta_writer.hpp"
#include "core/config.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

namespace contigsift {

void write_fasta_record(std::ostream& out, const FastaRecord& rec) {
    out << FASTA_MARKER << rec.header << '\n' << rec.sequence << '\n';
}

FastaWriter::~FastaWriter() {
    abort();
}

void FastaWriter::set_error(const std::string& what) {
    error_ = what;
    if (errno != 0) {
        error_ += ": ";
        error_ += std::strerror(errno);
    }
}

bool FastaWriter::open(const std::string& path) {
    abort();
    path_ = path;
    tmp_path_ = path + TMP_SUFFIX;
    records_written_ = 0;
    error_.clear();

    errno = 0;
    out_.open(tmp_path_, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out_.is_open()) {
        set_error("cannot create " + tmp_path_);
        return false;
    }
    return true;
}

bool FastaWriter::write(const FastaRecord& rec) {
    if (!out_.is_open()) return false;
    errno = 0;
    write_fasta_record(out_, rec);
    if (!out_) {
        set_error("write failed on " + tmp_path_);
        return false;
    }
    records_written_++;
    return true;
}

bool FastaWriter::commit() {
    if (!out_.is_open()) {
        if (error_.empty()) error_ = "commit without open file";
        return false;
    }

    errno = 0;
    out_.flush();
    out_.close();
    if (!out_) {
        set_error("cannot finish " + tmp_path_);
        std::remove(tmp_path_.c_str());
        return false;
    }

    errno = 0;
    if (std::rename(tmp_path_.c_str(), path_.c_str()) != 0) {
        set_error("failed to rename " + tmp_path_ + " -> " + path_);
        std::remove(tmp_path_.c_str());
        return false;
    }
    return true;
}

void FastaWriter::abort() {
    if (out_.is_open()) {
        out_.close();
        std::remove(tmp_path_.c_str());
    }
    out_.clear();
}

} // namespace contigsift
