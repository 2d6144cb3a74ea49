#include "mlst/mlst_runner.hpp"
#include "mlst/mlst_task.hpp"
#include "core/config.hpp"
#include "core/version.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

using namespace contigsift;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options]\n"
        "\n"
        "Runs the MLST typing tool on <sample>/%s for every sample directory\n"
        "under the root and saves its output as <outdir>/<sample>%s.\n"
        "\n"
        "Options:\n"
        "  -root <dir>            Directory holding the sample directories (default: .)\n"
        "  -o <dir>               Output directory (default: the root)\n"
        "  -input <name>          FASTA file name per sample (default: %s)\n"
        "  -mlst <path>           Typing tool executable (default: %s)\n"
        "  --mlst_args=<args>     Extra arguments passed before the FASTA path\n"
        "  -timeout <sec>         Kill the tool after this many seconds (default: 0 = none)\n"
        "  -threads <int>         Samples typed concurrently (default: 1, 0 = all cores)\n"
        "  -v, --verbose          Verbose logging\n"
        "  -h, --help             Show this help\n"
        "  --version              Show version\n",
        prog, DEFAULT_INPUT_NAME, MLST_OUTPUT_SUFFIX,
        DEFAULT_INPUT_NAME, DEFAULT_MLST_EXE);
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv);

    if (check_version(cli, "contigsiftmlst")) return 0;

    if (cli.has("-h") || cli.has("--help")) {
        print_usage(argv[0]);
        return 0;
    }

    int timeout = 0;
    if (!cli.get_int_checked("-timeout", 0, timeout) || timeout < 0) {
        std::fprintf(stderr, "Error: -timeout must be a non-negative integer\n");
        return 1;
    }

    std::string root = cli.get_string("-root", ".");
    std::string out_dir = cli.get_string("-o", root);

    SampleLayout layout;
    layout.input_name = cli.get_string("-input", DEFAULT_INPUT_NAME);

    MlstOptions opts;
    opts.executable = cli.get_string("-mlst", DEFAULT_MLST_EXE);
    opts.extra_args = split_args(cli.get_string("--mlst_args"));
    opts.timeout_sec = static_cast<unsigned>(timeout);

    int threads = 1;
    if (!resolve_threads(cli, threads)) {
        std::fprintf(stderr, "Error: -threads must be an integer\n");
        return 1;
    }
    Logger logger = make_logger(cli);

    // The root must exist before anything is created below it
    std::vector<MlstTask> tasks;
    std::string err;
    if (!plan_mlst_tasks(root, out_dir, layout, tasks, err)) {
        logger.error("%s", err.c_str());
        return 1;
    }

    std::error_code ec;
    std::filesystem::create_directories(out_dir, ec);
    if (ec) {
        std::fprintf(stderr, "Error: cannot create output directory '%s': %s\n",
                     out_dir.c_str(), ec.message().c_str());
        return 1;
    }
    logger.info("Typing %zu sample(s) with %s", tasks.size(), opts.executable.c_str());

    MlstSummary summary = run_mlst_tasks(tasks, opts, threads, logger);

    logger.info("MLST: %zu succeeded, %zu failed", summary.succeeded, summary.failed);
    std::printf("MLST typing complete.\n");
    return 0;
}
