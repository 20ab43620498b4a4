#include "core/config.hpp"
#include "core/types.hpp"
#include "core/version.hpp"
#include "index/variant_index.hpp"
#include "io/row_writer.hpp"
#include "materialize/record_materializer.hpp"
#include "query/query_engine.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <tbb/global_control.h>

using namespace vbi;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options]\n\n"
        "Required:\n"
        "  -vcf <path>            Source VCF, bgzipped VCF or BCF\n"
        "  -region <str>          Comma-separated regions (CHROM, CHROM:POS,\n"
        "                         CHROM:START-END)\n"
        "    or\n"
        "  -start <int> -end <int>\n"
        "                         Inclusive 1-based marker ordinal range\n\n"
        "Options:\n"
        "  -ix <path>             Index file (default: <vcf>%s)\n"
        "  -linear                Scan all markers instead of the interval lookup\n"
        "  -info                  Include INFO key/value pairs\n"
        "  -format                Include FORMAT ids\n"
        "  -gt                    Include one genotype column per sample\n"
        "  -ann <key>             Annotation INFO key (default: auto-detect)\n"
        "  -noann                 Do not decode annotations\n"
        "  -outfmt <tab|json|vcf> Output format (default: tab); vcf writes the\n"
        "                         source header and the selected records\n"
        "  -o <path>              Output file (default: stdout)\n"
        "  -threads <int>         Materialization threads (default: 1, 0 = all cores)\n"
        "  -v, --verbose          Verbose output\n"
        "  -q, --quiet            Errors only\n"
        "  -h, --help             Show this help\n",
        prog, VBI_DEFAULT_EXTENSION);
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv);

    if (check_version(cli, "vbiquery")) return 0;

    if (cli.has("-h") || cli.has("--help") || argc < 2) {
        print_usage(argv[0]);
        return (argc < 2) ? EXIT_USAGE : 0;
    }

    std::string vcf_path = cli.get_string("-vcf");
    if (vcf_path.empty()) {
        std::fprintf(stderr, "Error: -vcf is required\n");
        print_usage(argv[0]);
        return EXIT_USAGE;
    }
    std::string ix_path = cli.get_string("-ix", vcf_path + VBI_DEFAULT_EXTENSION);

    bool by_region = cli.has("-region");
    bool by_range = cli.has("-start") || cli.has("-end");
    if (by_region == by_range) {
        std::fprintf(stderr, "Error: specify either -region or -start/-end\n");
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    int64_t range_start = 0;
    int64_t range_end = 0;
    if (by_range) {
        if (!cli.get_int64("-start", range_start) || !cli.get_int64("-end", range_end)) {
            std::fprintf(stderr, "Error: -start and -end must both be integers\n");
            return EXIT_USAGE;
        }
    }

    // Parse regions before touching any file so syntax errors are usage errors.
    std::vector<RegionDescriptor> regions;
    if (by_region) {
        Error err;
        if (!parse_regions(cli.get_string("-region"), regions, &err)) {
            std::fprintf(stderr, "Error: %s\n", err.message.c_str());
            return EXIT_USAGE;
        }
    }

    OutputFormat outfmt = OutputFormat::kTab;
    {
        std::string msg;
        if (!parse_output_format(cli.get_string("-outfmt", "tab"), outfmt, msg)) {
            std::fprintf(stderr, "%s\n", msg.c_str());
            return EXIT_USAGE;
        }
    }

    if (cli.has("-ann") && cli.has("-noann")) {
        std::fprintf(stderr, "Error: -ann and -noann are mutually exclusive\n");
        return EXIT_USAGE;
    }

    MaterializeOptions options;
    options.include_info = cli.has("-info");
    options.include_format = cli.has("-format");
    options.include_genotypes = cli.has("-gt");
    options.annotate = !cli.has("-noann");
    options.annotation_key = cli.get_string("-ann");
    options.include_vcf_text = (outfmt == OutputFormat::kVcf);
    options.threads = resolve_threads(cli);

    Logger logger = make_logger(cli);
    options.verbose = logger.verbose();

    tbb::global_control gc(tbb::global_control::max_allowed_parallelism, options.threads);

    VariantIndex index;
    Error err;
    if (!index.load(ix_path, &err)) {
        return report_error(logger, err);
    }
    logger.debug("Loaded %s: %lu markers, %u chromosomes", ix_path.c_str(),
                 static_cast<unsigned long>(index.num_markers()), index.num_chroms());

    std::vector<Ordinal> ordinals;
    if (by_region) {
        if (cli.has("-linear")) {
            query_regions(index, regions, ordinals);
        } else {
            query_regions_indexed(index, regions, ordinals);
        }
    } else {
        ordinals = query_index_range(index, range_start, range_end);
    }
    logger.info("%zu markers selected", ordinals.size());

    MaterializeResult result;
    if (!materialize(vcf_path, index, ordinals, options, logger, result, &err)) {
        return report_error(logger, err);
    }

    std::string out_path = cli.get_string("-o");
    if (out_path.empty()) {
        write_rows(std::cout, result, options, outfmt);
        std::cout.flush();
        if (!std::cout) {
            logger.error("failed to write output");
            return EXIT_IO;
        }
    } else {
        std::ofstream ofs(out_path);
        if (!ofs) {
            logger.error("cannot open output file %s", out_path.c_str());
            return EXIT_IO;
        }
        write_rows(ofs, result, options, outfmt);
        ofs.close();
        if (!ofs) {
            logger.error("failed to write %s", out_path.c_str());
            return EXIT_IO;
        }
    }
    return 0;
}
