#pragma once

#include <ostream>
#include <string>

#include "materialize/record_materializer.hpp"

namespace vbi {

enum class OutputFormat { kTab, kJson, kVcf };

// Parse an output format string ("tab", "json", "vcf").
// Returns true on success. On failure, out is unchanged and error_msg is set.
bool parse_output_format(const std::string& str, OutputFormat& out,
                         std::string& error_msg);

// Tab-delimited: one header line, then one line per row. Missing values and
// unreadable rows print as ".". Optional columns appear only when the
// corresponding option was used to materialize.
void write_rows_tab(std::ostream& out, const MaterializeResult& result,
                    const MaterializeOptions& options);

// JSON document {"annotation_key": ..., "rows": [...]}; missing values are null.
void write_rows_json(std::ostream& out, const MaterializeResult& result,
                     const MaterializeOptions& options);

// The source header followed by one VCF line per found row, in row order.
// Requires rows materialized with include_vcf_text; unreadable rows are
// skipped.
void write_rows_vcf(std::ostream& out, const MaterializeResult& result);

void write_rows(std::ostream& out, const MaterializeResult& result,
                const MaterializeOptions& options, OutputFormat fmt);

} // namespace vbi
