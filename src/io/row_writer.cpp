#include "io/row_writer.hpp"

namespace vbi {

static void write_info_tab(std::ostream& out, const MaterializedRow& row) {
    if (row.info.empty()) {
        out << '.';
        return;
    }
    for (size_t i = 0; i < row.info.size(); i++) {
        if (i > 0) out << ';';
        out << row.info[i].first;
        if (!row.info[i].second.empty()) out << '=' << row.info[i].second;
    }
}

static void write_annotation_tab(std::ostream& out, const MaterializedRow& row) {
    if (!row.annotation || row.annotation->empty()) {
        out << '.';
        return;
    }
    const AnnotationTable& table = *row.annotation;
    for (size_t e = 0; e < table.size(); e++) {
        if (e > 0) out << ',';
        for (size_t f = 0; f < table[e].size(); f++) {
            if (f > 0) out << '|';
            out << table[e][f];
        }
    }
}

void write_rows_tab(std::ostream& out, const MaterializeResult& result,
                    const MaterializeOptions& options) {
    out << "# ordinal\tchrom\tpos\tid\tref\talt\tqual\tfilter\tn_allele";
    if (options.include_info) out << "\tinfo";
    if (options.include_format) out << "\tformat";
    if (result.has_annotation()) out << '\t' << result.annotation_key;
    if (options.include_genotypes) {
        for (const auto& s : result.sample_names) out << '\t' << s;
    }
    out << '\n';

    for (const auto& row : result.rows) {
        out << row.ordinal << '\t';
        if (!row.found) {
            out << ".\t.\t.\t.\t.\t.\t.\t.";
            if (options.include_info) out << "\t.";
            if (options.include_format) out << "\t.";
            if (result.has_annotation()) out << "\t.";
            if (options.include_genotypes) {
                for (size_t s = 0; s < result.sample_names.size(); s++) out << "\t.";
            }
            out << '\n';
            continue;
        }

        out << row.chrom << '\t'
            << row.pos << '\t'
            << (row.id ? *row.id : ".") << '\t'
            << row.ref << '\t'
            << row.alt << '\t';
        if (row.qual) out << *row.qual; else out << '.';
        out << '\t' << row.filter << '\t' << row.n_allele;

        if (options.include_info) {
            out << '\t';
            write_info_tab(out, row);
        }
        if (options.include_format) {
            out << '\t';
            if (row.format_ids.empty()) out << '.';
            for (size_t i = 0; i < row.format_ids.size(); i++) {
                if (i > 0) out << ':';
                out << row.format_ids[i];
            }
        }
        if (result.has_annotation()) {
            out << '\t';
            write_annotation_tab(out, row);
        }
        if (options.include_genotypes) {
            for (size_t s = 0; s < result.sample_names.size(); s++) {
                out << '\t' << (s < row.genotypes.size() ? row.genotypes[s] : ".");
            }
        }
        out << '\n';
    }
}

static void json_escape(std::ostream& out, const std::string& s) {
    static const char* const kHex = "0123456789abcdef";
    out << '"';
    for (char c : s) {
        switch (c) {
            case '"':  out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n";  break;
            case '\r': out << "\\r";  break;
            case '\t': out << "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out << "\\u00" << kHex[(c >> 4) & 0xF] << kHex[c & 0xF];
                } else {
                    out << c;
                }
                break;
        }
    }
    out << '"';
}

static void json_string_list(std::ostream& out, const std::vector<std::string>& v) {
    out << '[';
    for (size_t i = 0; i < v.size(); i++) {
        if (i > 0) out << ", ";
        json_escape(out, v[i]);
    }
    out << ']';
}

static void write_row_json(std::ostream& out, const MaterializeResult& result,
                           const MaterializeOptions& options,
                           const MaterializedRow& row) {
    out << "    {\n";
    out << "      \"ordinal\": " << row.ordinal << ",\n";
    out << "      \"found\": " << (row.found ? "true" : "false");
    if (!row.found) {
        out << "\n    }";
        return;
    }
    out << ",\n";
    out << "      \"chrom\": "; json_escape(out, row.chrom); out << ",\n";
    out << "      \"pos\": " << row.pos << ",\n";
    out << "      \"id\": ";
    if (row.id) json_escape(out, *row.id); else out << "null";
    out << ",\n";
    out << "      \"ref\": "; json_escape(out, row.ref); out << ",\n";
    out << "      \"alt\": "; json_escape(out, row.alt); out << ",\n";
    out << "      \"qual\": ";
    if (row.qual) out << *row.qual; else out << "null";
    out << ",\n";
    out << "      \"filter\": "; json_escape(out, row.filter); out << ",\n";
    out << "      \"n_allele\": " << row.n_allele;

    if (options.include_info) {
        out << ",\n      \"info\": {";
        for (size_t i = 0; i < row.info.size(); i++) {
            if (i > 0) out << ", ";
            json_escape(out, row.info[i].first);
            out << ": ";
            json_escape(out, row.info[i].second);
        }
        out << '}';
    }
    if (options.include_format) {
        out << ",\n      \"format\": ";
        json_string_list(out, row.format_ids);
    }
    if (options.include_genotypes) {
        out << ",\n      \"genotypes\": ";
        json_string_list(out, row.genotypes);
    }
    if (result.has_annotation()) {
        out << ",\n      \"annotation\": ";
        if (!row.annotation) {
            out << "null";
        } else {
            out << '[';
            const AnnotationTable& table = *row.annotation;
            for (size_t e = 0; e < table.size(); e++) {
                if (e > 0) out << ", ";
                out << '{';
                for (size_t f = 0; f < table[e].size(); f++) {
                    if (f > 0) out << ", ";
                    json_escape(out, result.annotation_fields[f]);
                    out << ": ";
                    json_escape(out, table[e][f]);
                }
                out << '}';
            }
            out << ']';
        }
    }
    out << "\n    }";
}

void write_rows_json(std::ostream& out, const MaterializeResult& result,
                     const MaterializeOptions& options) {
    out << "{\n  \"annotation_key\": ";
    if (result.has_annotation()) json_escape(out, result.annotation_key); else out << "null";
    out << ",\n";
    if (options.include_genotypes) {
        out << "  \"samples\": ";
        json_string_list(out, result.sample_names);
        out << ",\n";
    }
    out << "  \"rows\": [\n";
    for (size_t i = 0; i < result.rows.size(); i++) {
        write_row_json(out, result, options, result.rows[i]);
        if (i + 1 < result.rows.size()) out << ',';
        out << '\n';
    }
    out << "  ]\n}\n";
}

void write_rows_vcf(std::ostream& out, const MaterializeResult& result) {
    out << result.vcf_header;
    for (const auto& row : result.rows) {
        if (!row.found || row.vcf_line.empty()) continue;
        out << row.vcf_line << '\n';
    }
}

void write_rows(std::ostream& out, const MaterializeResult& result,
                const MaterializeOptions& options, OutputFormat fmt) {
    switch (fmt) {
        case OutputFormat::kTab:
            write_rows_tab(out, result, options);
            break;
        case OutputFormat::kJson:
            write_rows_json(out, result, options);
            break;
        case OutputFormat::kVcf:
            write_rows_vcf(out, result);
            break;
    }
}

bool parse_output_format(const std::string& str, OutputFormat& out,
                         std::string& error_msg) {
    if (str == "tab") {
        out = OutputFormat::kTab;
    } else if (str == "json") {
        out = OutputFormat::kJson;
    } else if (str == "vcf") {
        out = OutputFormat::kVcf;
    } else {
        error_msg = "Error: unknown output format '" + str + "'";
        return false;
    }
    return true;
}

} // namespace vbi
