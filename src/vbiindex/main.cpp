#include "core/config.hpp"
#include "core/version.hpp"
#include "index/index_builder.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <string>

#include <tbb/global_control.h>

using namespace vbi;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options]\n\n"
        "Required:\n"
        "  -vcf <path>            VCF, bgzipped VCF or BCF file\n\n"
        "Options:\n"
        "  -o <path>              Output index (default: <vcf>%s)\n"
        "  -threads <int>         Decompression threads (default: 1, 0 = all cores)\n"
        "  -v, --verbose          Verbose output\n"
        "  -q, --quiet            Errors only\n"
        "  -h, --help             Show this help\n",
        prog, VBI_DEFAULT_EXTENSION);
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv);

    if (check_version(cli, "vbiindex")) return 0;

    if (cli.has("-h") || cli.has("--help") || argc < 2) {
        print_usage(argv[0]);
        return (argc < 2) ? EXIT_USAGE : 0;
    }

    IndexBuilderConfig config;
    config.source_path = cli.get_string("-vcf");
    if (config.source_path.empty()) {
        std::fprintf(stderr, "Error: -vcf is required\n");
        print_usage(argv[0]);
        return EXIT_USAGE;
    }
    config.index_path = cli.get_string("-o", config.source_path + VBI_DEFAULT_EXTENSION);
    config.threads = resolve_threads(cli);

    Logger logger = make_logger(cli);
    config.verbose = logger.verbose();

    tbb::global_control gc(tbb::global_control::max_allowed_parallelism, config.threads);

    logger.info("Indexing %s -> %s", config.source_path.c_str(), config.index_path.c_str());
    logger.debug("Threads: %d", config.threads);

    Error err;
    if (!build_index(config, logger, &err)) {
        return report_error(logger, err);
    }
    return 0;
}
