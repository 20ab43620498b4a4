#include "materialize/record_materializer.hpp"
#include "index/variant_index.hpp"
#include "io/variant_reader.hpp"
#include "core/config.hpp"
#include "util/logger.hpp"
#include "util/progress.hpp"

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <cstring>
#include <mutex>

#include <htslib/kstring.h>

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

namespace vbi {

namespace {

// Scratch array grown by htslib's bcf_get_* calls.
template <typename T>
struct HtsBuffer {
    T* data = nullptr;
    int capacity = 0;

    HtsBuffer() = default;
    HtsBuffer(const HtsBuffer&) = delete;
    HtsBuffer& operator=(const HtsBuffer&) = delete;
    ~HtsBuffer() { std::free(data); }
};

struct KString {
    kstring_t ks = KS_INITIALIZE;

    KString() = default;
    KString(const KString&) = delete;
    KString& operator=(const KString&) = delete;
    ~KString() { ks_free(&ks); }
};

// Schema shared read-only by every decoder of one materialize() call.
struct DecodeSchema {
    std::string annotation_key;
    size_t num_annotation_fields = 0;
};

// Owns one reader; used by exactly one thread.
class RecordDecoder {
public:
    RecordDecoder(const VariantIndex& index, const MaterializeOptions& options,
                  const DecodeSchema& schema, const Logger& logger)
        : index_(index), options_(options), schema_(schema), logger_(logger) {}

    bool open(const std::string& path, Error* err) {
        if (!reader_.open(path, 1, err)) return false;
        if (!rec_.valid()) {
            return fail(err, ErrorKind::kIo, "cannot allocate VCF record");
        }
        if (reader_.codec() != index_.codec()) {
            return fail(err, ErrorKind::kIo,
                        "'" + path + "' uses " + offset_codec_name(reader_.codec()) +
                        " offsets but the index was built with " +
                        offset_codec_name(index_.codec()) + " offsets");
        }
        return true;
    }

    VariantReader& reader() { return reader_; }

    void decode(Ordinal ordinal, MaterializedRow& row) {
        row = MaterializedRow();
        row.ordinal = ordinal;

        if (ordinal >= index_.num_markers()) {
            logger_.debug("Ordinal %lu out of range (%lu markers)",
                          static_cast<unsigned long>(ordinal),
                          static_cast<unsigned long>(index_.num_markers()));
            return;
        }
        int64_t offset = index_.offset_of(ordinal);
        if (!reader_.seek(offset)) {
            logger_.debug("Seek to offset %ld failed for ordinal %lu",
                          static_cast<long>(offset), static_cast<unsigned long>(ordinal));
            return;
        }
        if (reader_.read(rec_.get()) != 1) {
            logger_.debug("Read failed for ordinal %lu", static_cast<unsigned long>(ordinal));
            return;
        }

        const char* chrom = reader_.chrom_name(rec_.get());
        GenomePos pos = static_cast<GenomePos>(rec_->pos) + 1;
        if (index_.chrom_of(ordinal) != chrom || index_.position_of(ordinal) != pos) {
            logger_.debug("Ordinal %lu: found %s:%ld, index expects %s:%ld",
                          static_cast<unsigned long>(ordinal), chrom, static_cast<long>(pos),
                          index_.chrom_of(ordinal).c_str(),
                          static_cast<long>(index_.position_of(ordinal)));
            return;
        }

        fill(row, chrom, pos);
        row.found = true;
    }

private:
    void fill(MaterializedRow& row, const char* chrom, GenomePos pos) {
        bcf1_t* rec = rec_.get();
        bcf_hdr_t* hdr = reader_.header();

        bool need_fmt = options_.include_format || options_.include_genotypes ||
                        options_.include_vcf_text;
        bcf_unpack(rec, need_fmt ? BCF_UN_ALL : BCF_UN_SHR);

        row.chrom = chrom;
        row.pos = pos;

        const char* id = rec->d.id;
        if (id && std::strcmp(id, ".") != 0 && id[0] != '\0') row.id = id;

        row.n_allele = rec->n_allele;
        if (rec->n_allele > 0) row.ref = rec->d.allele[0];
        if (rec->n_allele < 2) {
            row.alt = ".";
        } else {
            for (int a = 1; a < rec->n_allele; a++) {
                if (a > 1) row.alt += ',';
                row.alt += rec->d.allele[a];
            }
        }

        if (!bcf_float_is_missing(rec->qual)) row.qual = rec->qual;

        if (rec->d.n_flt == 0) {
            row.filter = "PASS";
        } else {
            for (int f = 0; f < rec->d.n_flt; f++) {
                if (f > 0) row.filter += ';';
                row.filter += bcf_hdr_int2id(hdr, BCF_DT_ID, rec->d.flt[f]);
            }
        }

        if (options_.include_info) fill_info(row, hdr, rec);
        if (options_.include_format) {
            for (int i = 0; i < rec->n_fmt; i++) {
                row.format_ids.emplace_back(bcf_hdr_int2id(hdr, BCF_DT_ID, rec->d.fmt[i].id));
            }
        }
        if (options_.include_genotypes) fill_genotypes(row, hdr, rec);
        if (!schema_.annotation_key.empty()) fill_annotation(row, hdr, rec);
        if (options_.include_vcf_text) fill_vcf_line(row, hdr, rec);
    }

    void fill_vcf_line(MaterializedRow& row, bcf_hdr_t* hdr, bcf1_t* rec) {
        scratch_.ks.l = 0;
        if (vcf_format1(hdr, rec, &scratch_.ks) < 0 || !scratch_.ks.s) {
            logger_.debug("Cannot format %s:%ld as VCF", row.chrom.c_str(),
                          static_cast<long>(row.pos));
            return;
        }
        size_t len = scratch_.ks.l;
        if (len > 0 && scratch_.ks.s[len - 1] == '\n') len--;
        row.vcf_line.assign(scratch_.ks.s, len);
    }

    void fill_info(MaterializedRow& row, bcf_hdr_t* hdr, bcf1_t* rec) {
        for (int i = 0; i < rec->n_info; i++) {
            const bcf_info_t* info = &rec->d.info[i];
            if (!info->vptr) continue;  // removed by bcf_update_info
            std::string key = bcf_hdr_int2id(hdr, BCF_DT_ID, info->key);

            if (info->len <= 0) {  // flag
                row.info.emplace_back(std::move(key), std::string());
            } else if (info->type == BCF_BT_CHAR) {
                const char* s = reinterpret_cast<const char*>(info->vptr);
                size_t len = strnlen(s, static_cast<size_t>(info->len));
                row.info.emplace_back(std::move(key), std::string(s, len));
            } else {
                scratch_.ks.l = 0;
                if (bcf_fmt_array(&scratch_.ks, info->len, info->type, info->vptr) < 0) {
                    continue;
                }
                row.info.emplace_back(std::move(key),
                                      std::string(scratch_.ks.s ? scratch_.ks.s : "",
                                                  scratch_.ks.l));
            }
        }
    }

    void fill_genotypes(MaterializedRow& row, bcf_hdr_t* hdr, bcf1_t* rec) {
        int nsmpl = bcf_hdr_nsamples(hdr);
        if (nsmpl <= 0) return;
        row.genotypes.assign(static_cast<size_t>(nsmpl), ".");

        int n = bcf_get_genotypes(hdr, rec, &gt_.data, &gt_.capacity);
        if (n <= 0) return;
        int ploidy = n / nsmpl;

        for (int s = 0; s < nsmpl; s++) {
            const int32_t* ptr = gt_.data + s * ploidy;
            std::string gt;
            for (int j = 0; j < ploidy; j++) {
                if (ptr[j] == bcf_int32_vector_end) break;
                if (j > 0) gt += bcf_gt_is_phased(ptr[j]) ? '|' : '/';
                if (bcf_gt_is_missing(ptr[j])) {
                    gt += '.';
                } else {
                    gt += std::to_string(bcf_gt_allele(ptr[j]));
                }
            }
            if (!gt.empty()) row.genotypes[s] = std::move(gt);
        }
    }

    void fill_annotation(MaterializedRow& row, bcf_hdr_t* hdr, bcf1_t* rec) {
        int n = bcf_get_info_string(hdr, rec, schema_.annotation_key.c_str(),
                                    &str_.data, &str_.capacity);
        if (n < 0) return;  // key absent on this record
        std::string value(str_.data, strnlen(str_.data, static_cast<size_t>(n)));
        row.annotation = split_annotation(value, schema_.num_annotation_fields);
    }

    const VariantIndex& index_;
    const MaterializeOptions& options_;
    const DecodeSchema& schema_;
    const Logger& logger_;

    VariantReader reader_;
    BcfRecord rec_;
    HtsBuffer<int32_t> gt_;
    HtsBuffer<char> str_;
    KString scratch_;
};

} // namespace

bool materialize(const std::string& source_path, const VariantIndex& index,
                 const std::vector<Ordinal>& ordinals, const MaterializeOptions& options,
                 const Logger& logger, MaterializeResult& result, Error* err) {
    result = MaterializeResult();

    if (!index.loaded()) {
        return fail(err, ErrorKind::kArgument, "index is not loaded");
    }

    DecodeSchema schema;
    RecordDecoder primary(index, options, schema, logger);
    Error open_err;
    if (!primary.open(source_path, &open_err)) {
        logger.error("%s", open_err.message.c_str());
        return fail(err, open_err.kind, open_err.message);
    }

    const bcf_hdr_t* hdr = primary.reader().header();
    if (options.annotate) {
        if (find_annotation_key(hdr, options.annotation_key,
                                result.annotation_key, result.annotation_fields)) {
            logger.debug("Annotation key %s: %zu sub-fields",
                         result.annotation_key.c_str(), result.annotation_fields.size());
        } else if (!options.annotation_key.empty()) {
            logger.warn("INFO/%s does not declare a field list; annotations disabled",
                        options.annotation_key.c_str());
        }
    }
    schema.annotation_key = result.annotation_key;
    schema.num_annotation_fields = result.annotation_fields.size();

    if (options.include_vcf_text) {
        KString text;
        if (bcf_hdr_format(hdr, 0, &text.ks) != 0 || !text.ks.s) {
            std::string msg = "cannot format the VCF header of '" + source_path + "'";
            logger.error("%s", msg.c_str());
            return fail(err, ErrorKind::kIo, msg);
        }
        result.vcf_header.assign(text.ks.s, text.ks.l);
    }

    if (options.include_genotypes) {
        int nsmpl = bcf_hdr_nsamples(hdr);
        for (int s = 0; s < nsmpl; s++) {
            result.sample_names.emplace_back(bcf_hdr_int2id(hdr, BCF_DT_SAMPLE, s));
        }
    }

    const size_t n = ordinals.size();
    result.rows.resize(n);
    Progress progress("Materialize", n, options.verbose);

    size_t chunk = std::max<size_t>(MATERIALIZE_MIN_CHUNK,
        (n + static_cast<size_t>(std::max(options.threads, 1)) * 4 - 1) /
        (static_cast<size_t>(std::max(options.threads, 1)) * 4));
    size_t num_chunks = (n + chunk - 1) / chunk;

    if (options.threads <= 1 || num_chunks <= 1) {
        for (size_t i = 0; i < n; i++) {
            primary.decode(ordinals[i], result.rows[i]);
            progress.advance(1);
        }
    } else {
        primary.reader().close();

        std::atomic<bool> failed{false};
        std::mutex err_mu;
        Error chunk_err;

        tbb::task_arena arena(options.threads);
        arena.execute([&] {
            tbb::parallel_for(
                tbb::blocked_range<size_t>(0, num_chunks, 1),
                [&](const tbb::blocked_range<size_t>& range) {
                    for (size_t c = range.begin(); c < range.end(); c++) {
                        if (failed.load(std::memory_order_relaxed)) return;
                        size_t lo = c * chunk;
                        size_t hi = std::min(n, lo + chunk);

                        RecordDecoder decoder(index, options, schema, logger);
                        Error e;
                        if (!decoder.open(source_path, &e)) {
                            std::lock_guard<std::mutex> lock(err_mu);
                            if (!failed.exchange(true)) chunk_err = e;
                            return;
                        }
                        for (size_t i = lo; i < hi; i++) {
                            decoder.decode(ordinals[i], result.rows[i]);
                        }
                        progress.advance(hi - lo);
                    }
                });
        });

        if (failed.load()) {
            result.rows.clear();
            logger.error("%s", chunk_err.message.c_str());
            return fail(err, chunk_err.kind, chunk_err.message);
        }
    }
    progress.finish();

    for (const auto& row : result.rows) {
        if (!row.found) result.not_found++;
    }
    if (result.not_found > 0) {
        logger.warn("%lu of %zu records could not be read back",
                    static_cast<unsigned long>(result.not_found), n);
    }
    return true;
}

} // namespace vbi
