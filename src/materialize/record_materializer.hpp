#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/error.hpp"
#include "core/types.hpp"
#include "materialize/annotation.hpp"

namespace vbi {

class Logger;
class VariantIndex;

struct MaterializeOptions {
    bool include_info = false;       // raw INFO key/value pairs
    bool include_format = false;     // FORMAT ids present on the record
    bool include_genotypes = false;  // one GT string per sample
    bool include_vcf_text = false;   // keep each record (and the header) as VCF text
    bool annotate = true;            // decode the annotation INFO key
    std::string annotation_key;      // empty: auto-detect (CSQ, ANN, BCSQ, ...)
    int threads = 1;                 // >1: chunks decoded in parallel
    bool verbose = false;            // progress on stderr
};

struct MaterializedRow {
    Ordinal ordinal = 0;
    bool found = false;              // false: seek/read failed, fields are sentinels

    std::string chrom;
    GenomePos pos = 0;               // 1-based
    std::optional<std::string> id;   // nullopt: no ID on the record
    std::string ref;
    std::string alt;                 // comma-joined, "." if none
    std::optional<float> qual;       // nullopt: missing
    std::string filter;              // ';'-joined, "PASS" if none set
    int n_allele = 0;

    std::vector<std::pair<std::string, std::string>> info;
    std::vector<std::string> format_ids;
    std::vector<std::string> genotypes;

    // nullopt: the record does not carry the annotation key
    std::optional<AnnotationTable> annotation;

    // Record as a VCF data line without the newline (include_vcf_text)
    std::string vcf_line;
};

struct MaterializeResult {
    std::string annotation_key;               // empty: no annotation support
    std::vector<std::string> annotation_fields;
    std::vector<std::string> sample_names;    // filled with include_genotypes
    std::string vcf_header;                   // source header text with include_vcf_text
    std::vector<MaterializedRow> rows;        // same order as the ordinals
    uint64_t not_found = 0;

    bool has_annotation() const { return !annotation_key.empty(); }
};

// Re-open source_path (never cached across calls), seek to each ordinal's
// stored offset and decode one record per ordinal.
//
// A failure for a single ordinal (out of range, seek or read error, or a
// record that no longer matches the index) yields a row with found=false
// and processing continues. Failing to open the source or read its header,
// or a source whose offset codec differs from the index, fails with kIo.
//
// With threads > 1 the ordinals are split into contiguous chunks decoded in
// parallel; every chunk opens its own reader.
bool materialize(const std::string& source_path, const VariantIndex& index,
                 const std::vector<Ordinal>& ordinals, const MaterializeOptions& options,
                 const Logger& logger, MaterializeResult& result, Error* err = nullptr);

} // namespace vbi
