#pragma once

#include <cstdint>
#include <string>

namespace vbi {

using Ordinal = uint64_t;   // 0-based record index in source scan order
using ChromId = int32_t;    // 0-based index into the chromosome dictionary
using GenomePos = int64_t;  // 1-based genomic coordinate

// How the stored seek tokens must be interpreted.
enum class OffsetCodec : uint8_t {
    kByteOffset = 0,     // plain byte offset into an uncompressed stream
    kVirtualOffset = 1,  // BGZF virtual offset (block address << 16 | in-block)
};

inline const char* offset_codec_name(OffsetCodec codec) {
    return codec == OffsetCodec::kVirtualOffset ? "bgzf-virtual" : "byte";
}

// One entry of extract_ranges(): a point interval labelled with its ordinal.
struct MarkerRange {
    std::string chrom;
    GenomePos start;
    GenomePos end;
    Ordinal ordinal;
};

struct MemoryUsage {
    uint64_t index_bytes = 0;           // arrays + chromosome dictionary
    uint64_t interval_index_bytes = 0;  // derived point-interval index
};

} // namespace vbi
