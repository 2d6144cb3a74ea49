#include "filter/length_filter.hpp"
#include "io/fasta_writer.hpp"

namespace contigsift {

std::size_t sequence_length(const std::string& seq) {
    std::size_t n = 0;
    for (char c : seq) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) n++;
    }
    return n;
}

// Pull every record from reader, count it, and hand the ones that pass
// to emit in input order. Stops early if emit returns false.
template <typename Emit>
static bool filter_records(FastaReader& reader, const LengthFilter& filter,
                           FilterStats& stats, const Logger* logger,
                           const std::string& source, Emit emit) {
    FastaRecord rec;
    while (reader.next(rec)) {
        stats.records_in++;
        if (rec.header.empty()) {
            stats.malformed++;
            if (logger) {
                logger->debug("filter: %s: record %lu has an empty header (length %zu)",
                              source.c_str(),
                              static_cast<unsigned long>(stats.records_in),
                              sequence_length(rec.sequence));
            }
        }
        if (!filter.accepts(rec)) continue;
        if (!emit(rec)) return false;
        stats.records_out++;
        stats.bases_out += sequence_length(rec.sequence);
    }
    return true;
}

void filter_fasta_stream(std::istream& in, std::ostream& out,
                         const LengthFilter& filter, FilterStats& stats) {
    FastaReader reader(in);
    filter_records(reader, filter, stats, nullptr, "stream",
                   [&](const FastaRecord& rec) {
                       write_fasta_record(out, rec);
                       return true;
                   });
}

bool filter_fasta_file(const std::string& input_path,
                       const std::string& output_path,
                       const LengthFilter& filter,
                       FilterStats& stats,
                       const Logger& logger) {
    stats = FilterStats{};

    FastaReader reader;
    if (!reader.open(input_path)) {
        logger.error("filter: cannot open %s", input_path.c_str());
        return false;
    }

    FastaWriter writer;
    if (!writer.open(output_path)) {
        logger.error("filter: %s", writer.error().c_str());
        return false;
    }

    bool written = filter_records(reader, filter, stats, &logger, input_path,
                                  [&](const FastaRecord& rec) {
                                      return writer.write(rec);
                                  });
    if (!written) {
        logger.error("filter: %s", writer.error().c_str());
        writer.abort();
        return false;
    }

    if (reader.failed()) {
        logger.error("filter: read error on %s", input_path.c_str());
        writer.abort();
        return false;
    }

    if (!writer.commit()) {
        logger.error("filter: %s", writer.error().c_str());
        return false;
    }
    return true;
}

} // namespace contigsift
