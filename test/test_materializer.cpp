#include "test_util.hpp"
#include "vcf_fixture.hpp"
#include "index/index_builder.hpp"
#include "index/variant_index.hpp"
#include "io/variant_reader.hpp"
#include "materialize/record_materializer.hpp"
#include "query/query_engine.hpp"
#include "core/config.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

using namespace vbi;
using vcf_fixture::ExpectedRecord;
using vcf_fixture::FixtureOptions;

static std::string g_output_dir;
static vcf_fixture::SourceSet g_csq;     // with CSQ annotations
static vcf_fixture::SourceSet g_plain;   // without annotation header
static std::vector<ExpectedRecord> g_expected;

static bool build_and_load(const std::string& source, VariantIndex& index) {
    Logger logger(Logger::kError);
    IndexBuilderConfig config;
    config.source_path = source;
    config.index_path = source + VBI_DEFAULT_EXTENSION;
    if (!build_index(config, logger)) return false;
    return index.load(config.index_path);
}

static std::vector<Ordinal> all_ordinals(const VariantIndex& index) {
    return query_index_range(index, 1, static_cast<int64_t>(index.num_markers()));
}

static bool run(const std::string& source, const VariantIndex& index,
                const std::vector<Ordinal>& ordinals, const MaterializeOptions& options,
                MaterializeResult& result, Error* err = nullptr) {
    Logger logger(Logger::kError);
    return materialize(source, index, ordinals, options, logger, result, err);
}

// What a sequential scan of the source reports for one record.
struct ScannedRecord {
    std::string chrom;
    int64_t pos;
    std::string ref;
    std::string id;
    int n_allele;
};

static std::vector<ScannedRecord> rescan(const std::string& source) {
    std::vector<ScannedRecord> out;
    VariantReader reader;
    CHECK(reader.open(source));
    BcfRecord rec;
    while (reader.read(rec.get()) == 1) {
        bcf_unpack(rec.get(), BCF_UN_STR);
        out.push_back({reader.chrom_name(rec.get()), rec->pos + 1,
                       rec->d.allele[0], rec->d.id, rec->n_allele});
    }
    return out;
}

// Materialized rows, requested in the given order, against a sequential
// re-scan of the same source.
static void check_fidelity(const std::string& source, const std::vector<Ordinal>& ordinals,
                           int threads) {
    VariantIndex index;
    CHECK(build_and_load(source, index));
    std::vector<ScannedRecord> scanned = rescan(source);
    CHECK_EQ(scanned.size(), index.num_markers());

    MaterializeOptions options;
    options.threads = threads;
    MaterializeResult result;
    CHECK(run(source, index, ordinals, options, result));
    CHECK_EQ(result.rows.size(), ordinals.size());
    CHECK_EQ(result.not_found, 0u);

    bool all_match = true;
    for (size_t i = 0; i < result.rows.size() && i < ordinals.size(); i++) {
        const MaterializedRow& row = result.rows[i];
        if (row.ordinal != ordinals[i] || row.ordinal >= scanned.size()) {
            all_match = false;
            break;
        }
        const ScannedRecord& exp = scanned[row.ordinal];
        std::string id = row.id ? *row.id : ".";
        if (!row.found ||
            row.chrom != exp.chrom ||
            row.pos != exp.pos ||
            row.ref != exp.ref ||
            id != exp.id ||
            row.n_allele != exp.n_allele) {
            all_match = false;
            std::fprintf(stderr, "  mismatch at row %zu, ordinal %llu (%s:%ld)\n", i,
                         static_cast<unsigned long long>(row.ordinal),
                         row.chrom.c_str(), static_cast<long>(row.pos));
            break;
        }
    }
    CHECK(all_match);
}

static std::vector<Ordinal> ordinals_of(const std::string& source) {
    VariantIndex index;
    CHECK(build_and_load(source, index));
    return all_ordinals(index);
}

static void check_fidelity_all_orders(const std::string& source) {
    std::vector<Ordinal> ascending = ordinals_of(source);
    check_fidelity(source, ascending, 1);

    std::vector<Ordinal> reversed(ascending.rbegin(), ascending.rend());
    check_fidelity(source, reversed, 1);

    std::vector<Ordinal> shuffled = ascending;
    std::mt19937 rng(20240917);
    std::shuffle(shuffled.begin(), shuffled.end(), rng);
    check_fidelity(source, shuffled, 1);
    check_fidelity(source, shuffled, 4);
}

static void test_fidelity_plain_vcf() {
    std::fprintf(stderr, "-- test_fidelity_plain_vcf\n");
    check_fidelity_all_orders(g_csq.vcf);
}

static void test_fidelity_bgzipped_vcf() {
    std::fprintf(stderr, "-- test_fidelity_bgzipped_vcf\n");
    check_fidelity_all_orders(g_csq.vcf_gz);
}

static void test_fidelity_bcf() {
    std::fprintf(stderr, "-- test_fidelity_bcf\n");
    check_fidelity_all_orders(g_csq.bcf);
}

// The second region lies before the first in the file, so the reader
// has to seek backwards between them.
static void check_multi_region_backward_seek(const std::string& source) {
    VariantIndex index;
    CHECK(build_and_load(source, index));

    std::vector<Ordinal> ordinals;
    Error err;
    CHECK(query_region_indexed(index, "chr21:5030300-5030400,chr21:5030000-5030050",
                               ordinals, &err));
    // 5030300..5030400 holds records 100..133, 5030000..5030050 records 0..16
    CHECK_EQ(ordinals.size(), 34u + 17u);
    if (ordinals.empty()) return;
    CHECK(ordinals.front() > ordinals.back());

    MaterializeOptions options;
    MaterializeResult result;
    CHECK(run(source, index, ordinals, options, result));
    CHECK_EQ(result.rows.size(), ordinals.size());
    CHECK_EQ(result.not_found, 0u);

    int bad = 0;
    for (size_t i = 0; i < result.rows.size() && i < ordinals.size(); i++) {
        const MaterializedRow& row = result.rows[i];
        if (row.ordinal != ordinals[i] || row.ordinal >= g_expected.size()) {
            bad++;
            continue;
        }
        const ExpectedRecord& exp = g_expected[row.ordinal];
        if (!row.found || row.chrom != exp.chrom || row.pos != exp.pos ||
            row.ref != exp.ref || row.alt != exp.alt) {
            bad++;
        }
    }
    CHECK_EQ(bad, 0);
}

static void test_multi_region_backward_seek() {
    std::fprintf(stderr, "-- test_multi_region_backward_seek\n");
    check_multi_region_backward_seek(g_csq.vcf);
    check_multi_region_backward_seek(g_csq.vcf_gz);
    check_multi_region_backward_seek(g_csq.bcf);
}

static std::vector<std::string> source_data_lines(const std::string& vcf_path) {
    std::vector<std::string> lines;
    std::ifstream in(vcf_path);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line[0] != '#') lines.push_back(line);
    }
    return lines;
}

// Formatted records reproduce the lines of the generated VCF.
static void check_vcf_text(const std::string& source, const std::vector<std::string>& lines) {
    VariantIndex index;
    CHECK(build_and_load(source, index));

    MaterializeOptions options;
    options.include_vcf_text = true;
    MaterializeResult result;
    std::vector<Ordinal> ordinals = {7, 0, 1, 2, 999, 500};
    CHECK(run(source, index, ordinals, options, result));
    CHECK_EQ(result.rows.size(), ordinals.size());

    CHECK(result.vcf_header.compare(0, 12, "##fileformat") == 0);
    CHECK(result.vcf_header.find(
              "#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO\tFORMAT\tS1\tS2\n")
          != std::string::npos);

    for (const auto& row : result.rows) {
        CHECK(row.found);
        if (row.ordinal < lines.size()) CHECK_STR_EQ(row.vcf_line, lines[row.ordinal]);
    }
}

static void test_vcf_text_matches_source() {
    std::fprintf(stderr, "-- test_vcf_text_matches_source\n");
    std::vector<std::string> lines = source_data_lines(g_csq.vcf);
    CHECK_EQ(lines.size(), g_expected.size());
    check_vcf_text(g_csq.vcf, lines);
    check_vcf_text(g_csq.vcf_gz, lines);
    check_vcf_text(g_csq.bcf, lines);

    // off by default
    VariantIndex index;
    CHECK(build_and_load(g_csq.vcf, index));
    MaterializeOptions options;
    MaterializeResult result;
    CHECK(run(g_csq.vcf, index, {0}, options, result));
    CHECK(result.vcf_header.empty());
    if (!result.rows.empty()) CHECK(result.rows[0].vcf_line.empty());
}

static void test_core_fields() {
    std::fprintf(stderr, "-- test_core_fields\n");
    VariantIndex index;
    CHECK(build_and_load(g_csq.vcf_gz, index));

    MaterializeOptions options;
    MaterializeResult result;
    CHECK(run(g_csq.vcf_gz, index, all_ordinals(index), options, result));
    CHECK_EQ(result.rows.size(), g_expected.size());

    int bad_id = 0, bad_alt = 0, bad_qual = 0, bad_filter = 0;
    for (size_t i = 0; i < result.rows.size() && i < g_expected.size(); i++) {
        const MaterializedRow& row = result.rows[i];
        const ExpectedRecord& exp = g_expected[i];
        // Missing ID is a sentinel, never the literal "."
        if (exp.id == ".") {
            if (row.id) bad_id++;
        } else if (!row.id || *row.id != exp.id) {
            bad_id++;
        }
        if (row.alt != exp.alt) bad_alt++;
        if (exp.qual_missing) {
            if (row.qual) bad_qual++;
        } else if (!row.qual || *row.qual != 50.0f) {
            bad_qual++;
        }
        if (row.filter != exp.filter) bad_filter++;
    }
    CHECK_EQ(bad_id, 0);
    CHECK_EQ(bad_alt, 0);
    CHECK_EQ(bad_qual, 0);
    CHECK_EQ(bad_filter, 0);

    // ordinal 0: no ID, multi-allelic, missing QUAL, filtered
    if (!result.rows.empty()) {
        const MaterializedRow& r0 = result.rows[0];
        CHECK(!r0.id.has_value());
        CHECK_STR_EQ(r0.alt, "C,G");
        CHECK_EQ(r0.n_allele, 3);
        CHECK(!r0.qual.has_value());
        CHECK_STR_EQ(r0.filter, "q10");
    }
    // extras are off by default
    if (result.rows.size() > 1) {
        CHECK(result.rows[1].info.empty());
        CHECK(result.rows[1].format_ids.empty());
        CHECK(result.rows[1].genotypes.empty());
    }
}

static void test_info_format_genotypes() {
    std::fprintf(stderr, "-- test_info_format_genotypes\n");
    VariantIndex index;
    CHECK(build_and_load(g_plain.bcf, index));

    MaterializeOptions options;
    options.include_info = true;
    options.include_format = true;
    options.include_genotypes = true;
    MaterializeResult result;
    std::vector<Ordinal> ordinals = {1, 7};
    CHECK(run(g_plain.bcf, index, ordinals, options, result));
    CHECK_EQ(result.rows.size(), 2u);
    CHECK_EQ(result.sample_names.size(), 2u);
    if (result.sample_names.size() == 2) {
        CHECK_STR_EQ(result.sample_names[0], "S1");
        CHECK_STR_EQ(result.sample_names[1], "S2");
    }
    if (result.rows.size() != 2) return;

    // ordinal 1: AC=1;DB
    const MaterializedRow& r1 = result.rows[0];
    CHECK(r1.found);
    CHECK_EQ(r1.info.size(), 2u);
    if (r1.info.size() == 2) {
        CHECK_STR_EQ(r1.info[0].first, "AC");
        CHECK_STR_EQ(r1.info[0].second, "1");
        CHECK_STR_EQ(r1.info[1].first, "DB");
        CHECK(r1.info[1].second.empty());
    }
    CHECK_EQ(r1.format_ids.size(), 2u);
    if (r1.format_ids.size() == 2) {
        CHECK_STR_EQ(r1.format_ids[0], "GT");
        CHECK_STR_EQ(r1.format_ids[1], "DP");
    }
    CHECK_EQ(r1.genotypes.size(), 2u);
    if (r1.genotypes.size() == 2) {
        CHECK_STR_EQ(r1.genotypes[0], "0/1");
        CHECK_STR_EQ(r1.genotypes[1], "1|1");
    }

    // ordinal 7: multi-allelic, AC=1,2, odd so DB set
    const MaterializedRow& r7 = result.rows[1];
    CHECK(r7.found);
    CHECK_STR_EQ(r7.alt, "C,G");
    if (!r7.info.empty()) CHECK_STR_EQ(r7.info[0].second, "1,2");
}

static void test_annotation_autodetect() {
    std::fprintf(stderr, "-- test_annotation_autodetect\n");
    VariantIndex index;
    CHECK(build_and_load(g_csq.bcf, index));

    MaterializeOptions options;
    MaterializeResult result;
    CHECK(run(g_csq.bcf, index, {0, 1, 2}, options, result));
    CHECK(result.has_annotation());
    CHECK_STR_EQ(result.annotation_key, "CSQ");
    CHECK_EQ(result.annotation_fields.size(), 3u);
    if (result.annotation_fields.size() == 3) {
        CHECK_STR_EQ(result.annotation_fields[0], "Allele");
        CHECK_STR_EQ(result.annotation_fields[1], "Consequence");
        CHECK_STR_EQ(result.annotation_fields[2], "IMPACT");
    }
    if (result.rows.size() != 3) {
        CHECK_EQ(result.rows.size(), 3u);
        return;
    }

    // ordinals 0 and 1 carry CSQ, ordinal 2 does not
    CHECK(result.rows[0].annotation.has_value());
    if (result.rows[0].annotation) {
        const AnnotationTable& t = *result.rows[0].annotation;
        CHECK_EQ(t.size(), 2u);
        if (t.size() == 2) {
            CHECK_STR_EQ(t[0][1], "missense_variant");
            CHECK_STR_EQ(t[1][1], "intron_variant");
            CHECK_STR_EQ(t[1][2], "MODIFIER");
        }
    }
    CHECK(result.rows[1].annotation.has_value());
    CHECK(!result.rows[2].annotation.has_value());
}

static void test_annotation_disabled() {
    std::fprintf(stderr, "-- test_annotation_disabled\n");
    VariantIndex index;
    CHECK(build_and_load(g_csq.vcf_gz, index));

    MaterializeOptions options;
    options.annotate = false;
    MaterializeResult result;
    CHECK(run(g_csq.vcf_gz, index, {0, 1}, options, result));
    CHECK(!result.has_annotation());
    for (const auto& row : result.rows) CHECK(!row.annotation.has_value());
}

static void test_annotation_absent_from_header() {
    std::fprintf(stderr, "-- test_annotation_absent_from_header\n");
    VariantIndex index;
    CHECK(build_and_load(g_plain.vcf_gz, index));

    MaterializeOptions options;
    MaterializeResult result;
    CHECK(run(g_plain.vcf_gz, index, {0, 1, 2}, options, result));
    CHECK(!result.has_annotation());
    CHECK(result.annotation_fields.empty());
    for (const auto& row : result.rows) {
        CHECK(row.found);
        CHECK(!row.annotation.has_value());
    }
}

static void test_annotation_unsupported_key() {
    std::fprintf(stderr, "-- test_annotation_unsupported_key\n");
    VariantIndex index;
    CHECK(build_and_load(g_csq.vcf_gz, index));

    // AC is an Integer key with no field list
    MaterializeOptions options;
    options.annotation_key = "AC";
    MaterializeResult result;
    CHECK(run(g_csq.vcf_gz, index, {0}, options, result));
    CHECK(!result.has_annotation());
    CHECK_EQ(result.rows.size(), 1u);
    if (!result.rows.empty()) {
        CHECK(result.rows[0].found);
        CHECK(!result.rows[0].annotation.has_value());
    }
}

static void test_out_of_range_ordinal() {
    std::fprintf(stderr, "-- test_out_of_range_ordinal\n");
    VariantIndex index;
    CHECK(build_and_load(g_csq.vcf_gz, index));

    MaterializeOptions options;
    MaterializeResult result;
    Ordinal past_end = index.num_markers() + 5;
    CHECK(run(g_csq.vcf_gz, index, {3, past_end, 4}, options, result));
    CHECK_EQ(result.rows.size(), 3u);
    CHECK_EQ(result.not_found, 1u);
    if (result.rows.size() == 3) {
        CHECK(result.rows[0].found);
        CHECK(!result.rows[1].found);
        CHECK_EQ(result.rows[1].ordinal, past_end);
        CHECK(result.rows[2].found);
        CHECK_EQ(result.rows[2].pos, g_expected[4].pos);
    }
}

// Same text length, every position moved by one: offsets still land on
// record boundaries but the records no longer match the index.
static void test_stale_source() {
    std::fprintf(stderr, "-- test_stale_source\n");
    VariantIndex index;
    CHECK(build_and_load(g_plain.vcf, index));

    FixtureOptions shifted;
    shifted.with_csq = false;
    shifted.pos_shift = 1;
    std::string stale = g_output_dir + "/stale.vcf";
    CHECK(vcf_fixture::write_vcf(stale, shifted));

    MaterializeOptions options;
    MaterializeResult result;
    Error err;
    CHECK(run(stale, index, {10, 20, 30}, options, result, &err));
    CHECK_EQ(result.not_found, 3u);
    for (const auto& row : result.rows) CHECK(!row.found);
}

static void test_missing_source() {
    std::fprintf(stderr, "-- test_missing_source\n");
    VariantIndex index;
    CHECK(build_and_load(g_plain.vcf_gz, index));

    MaterializeOptions options;
    MaterializeResult result;
    Error err;
    CHECK(!run(g_output_dir + "/gone.vcf.gz", index, {0}, options, result, &err));
    CHECK(err.kind == ErrorKind::kIo);
}

static void test_codec_mismatch() {
    std::fprintf(stderr, "-- test_codec_mismatch\n");
    VariantIndex index;
    CHECK(build_and_load(g_plain.vcf, index));
    CHECK(index.codec() == OffsetCodec::kByteOffset);

    MaterializeOptions options;
    MaterializeResult result;
    Error err;
    CHECK(!run(g_plain.vcf_gz, index, {0}, options, result, &err));
    CHECK(err.kind == ErrorKind::kIo);
}

static void test_unloaded_index() {
    std::fprintf(stderr, "-- test_unloaded_index\n");
    VariantIndex index;
    MaterializeOptions options;
    MaterializeResult result;
    Error err;
    CHECK(!run(g_plain.vcf, index, {0}, options, result, &err));
    CHECK(err.kind == ErrorKind::kArgument);
}

static void test_empty_ordinal_list() {
    std::fprintf(stderr, "-- test_empty_ordinal_list\n");
    VariantIndex index;
    CHECK(build_and_load(g_csq.bcf, index));

    MaterializeOptions options;
    options.threads = 4;
    MaterializeResult result;
    CHECK(run(g_csq.bcf, index, {}, options, result));
    CHECK(result.rows.empty());
    CHECK_EQ(result.not_found, 0u);
}

static void test_parallel_matches_sequential() {
    std::fprintf(stderr, "-- test_parallel_matches_sequential\n");
    VariantIndex index;
    CHECK(build_and_load(g_csq.bcf, index));

    // Reverse order so chunks are not monotone in file offset
    std::vector<Ordinal> ordinals = all_ordinals(index);
    std::vector<Ordinal> reversed(ordinals.rbegin(), ordinals.rend());

    MaterializeOptions seq_opt;
    seq_opt.include_info = true;
    seq_opt.include_genotypes = true;
    MaterializeOptions par_opt = seq_opt;
    par_opt.threads = 4;

    MaterializeResult seq, par;
    CHECK(run(g_csq.bcf, index, reversed, seq_opt, seq));
    CHECK(run(g_csq.bcf, index, reversed, par_opt, par));
    CHECK_EQ(seq.rows.size(), par.rows.size());
    CHECK_EQ(par.not_found, 0u);

    int diffs = 0;
    for (size_t i = 0; i < seq.rows.size() && i < par.rows.size(); i++) {
        const MaterializedRow& a = seq.rows[i];
        const MaterializedRow& b = par.rows[i];
        if (a.ordinal != b.ordinal || a.found != b.found || a.chrom != b.chrom ||
            a.pos != b.pos || a.id != b.id || a.alt != b.alt || a.qual != b.qual ||
            a.filter != b.filter || a.info != b.info || a.genotypes != b.genotypes ||
            a.annotation != b.annotation) {
            diffs++;
        }
    }
    CHECK_EQ(diffs, 0);
    if (!par.rows.empty()) CHECK_EQ(par.rows.front().ordinal, index.num_markers() - 1);
}

int main() {
    g_output_dir = "/tmp/vbi_materializer_test";
    std::filesystem::remove_all(g_output_dir);
    std::filesystem::create_directories(g_output_dir);

    FixtureOptions csq_opt;
    FixtureOptions plain_opt;
    plain_opt.with_csq = false;
    g_expected = vcf_fixture::expected_records(csq_opt);
    if (!vcf_fixture::make_sources(g_output_dir, "csq", csq_opt, g_csq) ||
        !vcf_fixture::make_sources(g_output_dir, "plain", plain_opt, g_plain)) {
        std::fprintf(stderr, "FAIL: cannot generate test sources in %s\n", g_output_dir.c_str());
        return 1;
    }

    test_fidelity_plain_vcf();
    test_fidelity_bgzipped_vcf();
    test_fidelity_bcf();
    test_multi_region_backward_seek();
    test_vcf_text_matches_source();
    test_core_fields();
    test_info_format_genotypes();
    test_annotation_autodetect();
    test_annotation_disabled();
    test_annotation_absent_from_header();
    test_annotation_unsupported_key();
    test_out_of_range_ordinal();
    test_stale_source();
    test_missing_source();
    test_codec_mismatch();
    test_unloaded_index();
    test_empty_ordinal_list();
    test_parallel_matches_sequential();

    std::filesystem::remove_all(g_output_dir);

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
