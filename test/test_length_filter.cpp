#include "test_util.hpp"
#include "filter/length_filter.hpp"
#include "io/fasta_reader.hpp"
#include "util/logger.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace contigsift;

static std::string g_test_dir;

static std::string read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    std::ostringstream oss;
    oss << f.rdbuf();
    return oss.str();
}

static void write_file(const std::string& path, const std::string& content) {
    std::ofstream f(path, std::ios::binary);
    f << content;
}

static std::string filter_text(const std::string& text, size_t min_length,
                               FilterStats& stats) {
    std::istringstream in(text);
    std::ostringstream out;
    filter_fasta_stream(in, out, LengthFilter(min_length), stats);
    return out.str();
}

static void test_default_threshold() {
    std::fprintf(stderr, "-- test_default_threshold\n");
    LengthFilter f;
    CHECK_EQ(f.min_length(), 1000u);
    CHECK(f.accepts({"exact", std::string(1000, 'A')}));
    CHECK(!f.accepts({"short", std::string(999, 'A')}));
    CHECK(f({"long", std::string(5000, 'C')}));
    CHECK(!f({"empty", ""}));
}

static void test_character_count() {
    std::fprintf(stderr, "-- test_character_count\n");
    CHECK_EQ(sequence_length("ACGT"), 4u);
    CHECK_EQ(sequence_length(""), 0u);
    // "\xC3\xA9" is one two-byte character
    CHECK_EQ(sequence_length("A\xC3\xA9G"), 3u);
    LengthFilter f(3);
    CHECK(f.accepts({"u", "A\xC3\xA9G"}));
    CHECK(!f.accepts({"u", "\xC3\xA9\xC3\xA9"}));
}

static void test_wrapped_boundary_scenario() {
    std::fprintf(stderr, "-- test_wrapped_boundary_scenario\n");
    std::string seq1(998, 'A');
    std::string seq2a(600, 'C');
    std::string seq2b(400, 'G');
    std::string input = ">seq1\n" + seq1 + "\n>seq2\n" + seq2a + "\n" + seq2b + "\n";

    FilterStats stats;
    std::string out = filter_text(input, 1000, stats);
    CHECK_STR(out, ">seq2\n" + seq2a + seq2b + "\n");
    CHECK_EQ(stats.records_in, 2u);
    CHECK_EQ(stats.records_out, 1u);
    CHECK_EQ(stats.records_dropped(), 1u);
    CHECK_EQ(stats.bases_out, 1000u);
}

static void test_order_and_content_preserved() {
    std::fprintf(stderr, "-- test_order_and_content_preserved\n");
    std::string input =
        ">c3 desc three\n" + std::string(12, 'T') + "\n" +
        ">c1\n" + std::string(3, 'A') + "\n" +
        ">c2 x=1\n" + std::string(10, 'G') + "\n" + std::string(5, 'C') + "\n";

    FilterStats stats;
    std::string out = filter_text(input, 10, stats);

    std::istringstream iss(out);
    auto recs = read_fasta_stream(iss);
    CHECK_EQ(recs.size(), 2u);
    if (recs.size() == 2) {
        CHECK_STR(recs[0].header, "c3 desc three");
        CHECK_STR(recs[1].header, "c2 x=1");
        CHECK_STR(recs[1].sequence, std::string(10, 'G') + std::string(5, 'C'));
    }
    for (const auto& r : recs) CHECK(sequence_length(r.sequence) >= 10);
}

static void test_refilter_is_identical() {
    std::fprintf(stderr, "-- test_refilter_is_identical\n");
    std::string input = "pre\n>a\nAAAAA\nAAAAA\n>b\nCC\n>c d e\r\nGGGGGGGGGGGG\r\n";
    FilterStats s1;
    FilterStats s2;
    std::string once = filter_text(input, 10, s1);
    std::string twice = filter_text(once, 10, s2);
    CHECK_STR(once, twice);
    CHECK_EQ(s2.records_in, s1.records_out);
    CHECK_EQ(s2.records_out, s1.records_out);
}

static void test_malformed_records() {
    std::fprintf(stderr, "-- test_malformed_records\n");
    FilterStats stats;
    std::string out = filter_text(">\nACGTACGT\n>\n>ok\nACGTACGT\n", 8, stats);
    CHECK_EQ(stats.records_in, 3u);
    CHECK_EQ(stats.malformed, 2u);
    CHECK_EQ(stats.records_out, 2u);
    CHECK_STR(out, ">\nACGTACGT\n>ok\nACGTACGT\n");
}

static void test_zero_threshold_keeps_all() {
    std::fprintf(stderr, "-- test_zero_threshold_keeps_all\n");
    FilterStats stats;
    filter_text(">a\n>b\nA\n", 0, stats);
    CHECK_EQ(stats.records_out, 2u);
}

static void test_filter_file() {
    std::fprintf(stderr, "-- test_filter_file\n");
    Logger logger(Logger::kError);
    std::string in = g_test_dir + "/contigs.fasta";
    std::string out = g_test_dir + "/contigs_filtered.fasta";
    write_file(in, ">NODE_1\n" + std::string(1200, 'A') + "\n>NODE_2\n" +
                   std::string(100, 'C') + "\n");
    write_file(out, ">left_over_from_previous_run\nA\n");

    FilterStats stats;
    CHECK(filter_fasta_file(in, out, LengthFilter(), stats, logger));
    CHECK_EQ(stats.records_in, 2u);
    CHECK_EQ(stats.records_out, 1u);
    CHECK_STR(read_file(out), ">NODE_1\n" + std::string(1200, 'A') + "\n");

    // Running again over the filtered file changes nothing
    std::string again = g_test_dir + "/again.fasta";
    CHECK(filter_fasta_file(out, again, LengthFilter(), stats, logger));
    CHECK_STR(read_file(again), read_file(out));
}

static void test_filter_file_scenarios() {
    std::fprintf(stderr, "-- test_filter_file_scenarios\n");
    Logger logger(Logger::kError);
    std::string in = g_test_dir + "/wrapped.fasta";
    std::string out = g_test_dir + "/wrapped_filtered.fasta";
    write_file(in, ">seq1\n" + std::string(998, 'A') + "\n>seq2\n" +
                   std::string(600, 'C') + "\n" + std::string(400, 'G') + "\n");

    FilterStats stats;
    CHECK(filter_fasta_file(in, out, LengthFilter(), stats, logger));
    CHECK_EQ(stats.records_in, 2u);
    CHECK_EQ(stats.records_out, 1u);
    CHECK_EQ(stats.bases_out, 1000u);
    CHECK_STR(read_file(out), ">seq2\n" + std::string(600, 'C') +
                              std::string(400, 'G') + "\n");

    std::string edge = g_test_dir + "/edge.fasta";
    std::string edge_out = g_test_dir + "/edge_filtered.fasta";
    write_file(edge, ">short\n" + std::string(999, 'T') + "\n>exact\n" +
                     std::string(1000, 'T') + "\n");
    FilterStats edge_stats;
    CHECK(filter_fasta_file(edge, edge_out, LengthFilter(), edge_stats, logger));
    CHECK_EQ(edge_stats.records_out, 1u);
    CHECK_EQ(edge_stats.records_dropped(), 1u);
    CHECK_STR(read_file(edge_out), ">exact\n" + std::string(1000, 'T') + "\n");

    // A second pass over a filtered file reproduces it byte for byte
    std::string second = g_test_dir + "/edge_second.fasta";
    FilterStats second_stats;
    CHECK(filter_fasta_file(edge_out, second, LengthFilter(), second_stats, logger));
    CHECK_EQ(second_stats.records_in, 1u);
    CHECK_STR(read_file(second), read_file(edge_out));
}

static void test_filter_file_errors() {
    std::fprintf(stderr, "-- test_filter_file_errors\n");
    Logger logger(Logger::kError);
    FilterStats stats;
    std::string out = g_test_dir + "/never.fasta";
    CHECK(!filter_fasta_file(g_test_dir + "/missing.fasta", out,
                             LengthFilter(), stats, logger));
    CHECK(!std::filesystem::exists(out));

    std::string in = g_test_dir + "/in2.fasta";
    write_file(in, ">a\nACGT\n");
    CHECK(!filter_fasta_file(in, g_test_dir + "/nodir/out.fasta",
                             LengthFilter(1), stats, logger));
}

int main() {
    g_test_dir = "/tmp/contigsift_length_filter_test";
    std::filesystem::remove_all(g_test_dir);
    std::filesystem::create_directories(g_test_dir);

    test_default_threshold();
    test_character_count();
    test_wrapped_boundary_scenario();
    test_order_and_content_preserved();
    test_refilter_is_identical();
    test_malformed_records();
    test_zero_threshold_keeps_all();
    test_filter_file();
    test_filter_file_scenarios();
    test_filter_file_errors();

    std::filesystem::remove_all(g_test_dir);

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
