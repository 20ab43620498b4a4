#pragma once

#include <string>
#include <vector>

#include <htslib/vcf.h>

namespace vbi {

// One row per overlapping annotation, one value per declared sub-field.
using AnnotationTable = std::vector<std::vector<std::string>>;

// INFO keys tried, in order, when no key is requested explicitly.
inline const char* const kAnnotationKeys[] = {"CSQ", "ANN", "BCSQ"};

// Extract the sub-field names from an INFO description such as
//   "Consequence annotations from Ensembl VEP. Format: Allele|Consequence|IMPACT"
//   "Functional annotations: 'Allele | Annotation | Annotation_Impact'"
// Returns an empty list when the description declares no field list.
std::vector<std::string> parse_annotation_fields(const std::string& description);

// Find an annotation INFO key in the header and its sub-field names.
// If requested_key is non-empty only that key is considered; otherwise the
// keys in kAnnotationKeys are tried first, then any String INFO key whose
// description declares a field list. Returns false if none qualifies.
bool find_annotation_key(const bcf_hdr_t* hdr, const std::string& requested_key,
                         std::string& key_out, std::vector<std::string>& fields_out);

// Split a raw annotation value: ',' separates annotations, '|' separates
// sub-fields. Every row has exactly num_fields values (padded with empty
// strings, surplus values dropped).
AnnotationTable split_annotation(const std::string& value, size_t num_fields);

} // namespace vbi
