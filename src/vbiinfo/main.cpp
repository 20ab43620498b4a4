#include "core/types.hpp"
#include "core/version.hpp"
#include "index/variant_index.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using namespace vbi;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options]\n"
        "\n"
        "Required:\n"
        "  -ix <path>               Variant block index (.vbi)\n"
        "\n"
        "Options:\n"
        "  -n <int>                 Print the first N markers (0 = all)\n"
        "  -ranges                  Print (chrom, start, end, ordinal) ranges\n"
        "                           instead of markers; limited by -n\n"
        "  -v, --verbose            Verbose output\n"
        "  -h, --help               Show this help\n",
        prog);
}

static std::string format_size(uint64_t bytes) {
    static const char* const kUnits[] = {"GiB", "MiB", "KiB"};
    for (int i = 0; i < 3; i++) {
        uint64_t unit = uint64_t(1) << (10 * (3 - i));
        if (bytes >= unit) {
            return std::to_string(bytes / unit) + "."
                 + std::to_string((bytes % unit) * 10 / unit) + " " + kUnits[i];
        }
    }
    return std::to_string(bytes) + " B";
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv);

    if (check_version(cli, "vbiinfo")) return 0;

    if (cli.has("-h") || cli.has("--help") || argc < 2) {
        print_usage(argv[0]);
        return (argc < 2) ? EXIT_USAGE : 0;
    }

    std::string ix_path = cli.get_string("-ix");
    if (ix_path.empty()) {
        std::fprintf(stderr, "Error: -ix is required\n");
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    int64_t n = -1;
    if (cli.has("-n") && (!cli.get_int64("-n", n) || n < 0)) {
        std::fprintf(stderr, "Error: -n must be a non-negative integer\n");
        return EXIT_USAGE;
    }

    Logger logger = make_logger(cli);

    VariantIndex index;
    Error err;
    if (!index.load(ix_path, &err)) {
        return report_error(logger, err);
    }

    std::error_code ec;
    uint64_t file_bytes = std::filesystem::file_size(ix_path, ec);
    MemoryUsage mem = index.memory_usage();

    std::printf("Index:            %s\n", ix_path.c_str());
    if (!ec) std::printf("File size:        %s\n", format_size(file_bytes).c_str());
    std::printf("Samples:          %ld\n", static_cast<long>(index.num_samples()));
    std::printf("Markers:          %lu\n", static_cast<unsigned long>(index.num_markers()));
    std::printf("Chromosomes:      %u\n", index.num_chroms());
    std::printf("Offset codec:     %s\n", offset_codec_name(index.codec()));
    std::printf("Memory (markers): %s\n", format_size(mem.index_bytes).c_str());
    std::printf("Memory (lookup):  %s\n", format_size(mem.interval_index_bytes).c_str());

    if (logger.verbose()) {
        std::vector<uint64_t> per_chrom(index.num_chroms(), 0);
        for (ChromId id : index.chrom_ids()) per_chrom[id]++;
        std::printf("\nPer-chromosome markers:\n");
        for (uint32_t c = 0; c < index.num_chroms(); c++) {
            std::printf("  %-20s %lu\n", index.chrom_names()[c].c_str(),
                        static_cast<unsigned long>(per_chrom[c]));
        }
    }

    if (cli.has("-ranges")) {
        std::fflush(stdout);
        uint64_t limit = n > 0 ? static_cast<uint64_t>(n) : 0;
        for (const auto& r : index.extract_ranges(limit)) {
            std::cout << r.chrom << '\t' << r.start << '\t' << r.end << '\t'
                      << r.ordinal << '\n';
        }
    } else if (n >= 0) {
        std::fflush(stdout);
        index.print(std::cout, n);
    }
    std::cout.flush();
    return 0;
}
