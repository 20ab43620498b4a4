#pragma once

#include <cstdint>

namespace vbi {

inline constexpr char VBI_MAGIC[4] = {'V', 'B', 'I', 'X'};

// flags bit 0: offsets are BGZF virtual offsets (otherwise byte offsets)
inline constexpr uint16_t VBI_FLAG_VIRTUAL_OFFSETS = 0x0001;

// File layout (little-endian, no padding):
//   VbiHeader
//   int32  name_len, char[name_len] name     x chrom_count
//   VbiMarkerRecord                          x marker_count (scan order)
#pragma pack(push, 1)
struct VbiHeader {
    char     magic[4];        // 0x00: "VBIX"
    uint16_t format_version;  // 0x04
    uint16_t flags;           // 0x06
    int64_t  sample_count;    // 0x08
    int64_t  marker_count;    // 0x10
    int32_t  chrom_count;     // 0x18
};

struct VbiMarkerRecord {
    int32_t chrom_id;         // 0-based dictionary index
    int64_t position;         // 1-based coordinate
    int64_t offset;           // codec-specific seek token
};
#pragma pack(pop)

static_assert(sizeof(VbiHeader) == 28, "VbiHeader must be 28 bytes");
static_assert(sizeof(VbiMarkerRecord) == 20, "VbiMarkerRecord must be 20 bytes");

} // namespace vbi
