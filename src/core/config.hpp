#pragma once

#include <cstddef>

namespace contigsift {

// Record marker that starts every FASTA record line.
inline constexpr char FASTA_MARKER = '>';

// UTF-8 byte order mark some editors put at the start of text files.
inline constexpr const char* UTF8_BOM = "\xEF\xBB\xBF";

// Contigs shorter than this are dropped by default.
inline constexpr std::size_t DEFAULT_MIN_LENGTH = 1000;

// Fixed file names inside each sample directory.
inline constexpr const char* DEFAULT_INPUT_NAME = "contigs.fasta";
inline constexpr const char* DEFAULT_OUTPUT_NAME = "contigs_filtered.fasta";

// Suffix of the per-sample MLST report: <sample>_mlst_output
inline constexpr const char* MLST_OUTPUT_SUFFIX = "_mlst_output";
inline constexpr const char* DEFAULT_MLST_EXE = "mlst";

// Suffix for files under construction, renamed to final on success.
inline constexpr const char* TMP_SUFFIX = ".tmp";

} // namespace contigsift
