#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/error.hpp"
#include "core/types.hpp"

namespace vbi {

struct RegionDescriptor {
    std::string chrom;
    GenomePos start = 0;
    GenomePos end = 0;
    bool is_point = false;  // "CHROM:POS" form, start == end
};

// Parse a single region: "CHROM", "CHROM:POS" or "CHROM:START-END".
// A bare chromosome covers [0, MAX_COORDINATE]. The coordinate part is
// split at the last ':' so contig names containing ':' parse when a
// coordinate follows ("HLA-A*01:01:1-500"). Such a name given alone is
// read as CHROM:POS ("HLA-A*01:01" becomes "HLA-A*01" at position 1); to
// select the whole contig append a range, e.g. "HLA-A*01:01:0-9223372036854775807".
// Malformed or negative numbers and END < START fail with kArgument.
bool parse_region(const std::string& text, RegionDescriptor& out, Error* err = nullptr);

// Parse a comma-separated list of regions. Empty items are skipped and
// surrounding blanks trimmed. Chromosome names are not validated here.
bool parse_regions(const std::string& text, std::vector<RegionDescriptor>& out,
                   Error* err = nullptr);

} // namespace vbi
