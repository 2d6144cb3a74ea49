#include "pipeline/directory_walker.hpp"
#include "core/config.hpp"
#include "core/version.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <string>

using namespace contigsift;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options]\n"
        "\n"
        "Writes <sample>/%s with the contigs of <sample>/%s that are at\n"
        "least -min_length long, for every sample directory under the root.\n"
        "\n"
        "Options:\n"
        "  -root <dir>            Directory holding the sample directories (default: .)\n"
        "  -min_length <int>      Minimum contig length to keep (default: %zu)\n"
        "  -input <name>          Input file name per sample (default: %s)\n"
        "  -output <name>         Output file name per sample (default: %s)\n"
        "  -threads <int>         Samples processed concurrently (default: 1, 0 = all cores)\n"
        "  -v, --verbose          Verbose logging\n"
        "  -h, --help             Show this help\n"
        "  --version              Show version\n",
        prog, DEFAULT_OUTPUT_NAME, DEFAULT_INPUT_NAME,
        DEFAULT_MIN_LENGTH, DEFAULT_INPUT_NAME, DEFAULT_OUTPUT_NAME);
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv);

    if (check_version(cli, "contigsiftfilter")) return 0;

    if (cli.has("-h") || cli.has("--help")) {
        print_usage(argv[0]);
        return 0;
    }

    int min_length = 0;
    if (!cli.get_int_checked("-min_length", static_cast<int>(DEFAULT_MIN_LENGTH),
                             min_length) || min_length < 0) {
        std::fprintf(stderr, "Error: -min_length must be a non-negative integer\n");
        return 1;
    }

    WalkerConfig config;
    config.min_length = static_cast<size_t>(min_length);
    config.layout.input_name = cli.get_string("-input", DEFAULT_INPUT_NAME);
    config.layout.output_name = cli.get_string("-output", DEFAULT_OUTPUT_NAME);
    if (!resolve_threads(cli, config.threads)) {
        std::fprintf(stderr, "Error: -threads must be an integer\n");
        return 1;
    }

    if (config.layout.input_name == config.layout.output_name) {
        std::fprintf(stderr, "Error: -input and -output must name different files\n");
        return 1;
    }

    Logger logger = make_logger(cli);

    DirectoryWalker walker(cli.get_string("-root", "."), config, logger);
    WalkSummary summary;
    if (!walker.run(summary)) {
        return 1;
    }

    logger.info("Samples: %zu filtered, %zu skipped, %zu failed",
                summary.filtered, summary.skipped, summary.failed);
    for (const auto& r : summary.samples) {
        if (r.status == SampleStatus::kFailed) {
            logger.warn("  %s: %s", r.name.c_str(), r.error.c_str());
        }
    }

    std::printf("Filtering complete.\n");
    return 0;
}
