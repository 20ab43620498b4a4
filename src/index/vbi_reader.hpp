#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "core/error.hpp"
#include "core/types.hpp"
#include "index/vbi_format.hpp"
#include "io/mmap_file.hpp"

namespace vbi {

// Validating view over a memory-mapped .vbi file. open() checks magic,
// version and that every section fits inside the file.
class VbiReader {
public:
    bool open(const std::string& path, Error* err = nullptr);
    void close();

    bool is_open() const { return mmap_.is_open(); }

    int64_t num_samples() const { return header_.sample_count; }
    uint64_t num_markers() const { return static_cast<uint64_t>(header_.marker_count); }
    uint32_t num_chroms() const { return static_cast<uint32_t>(chrom_names_.size()); }
    OffsetCodec codec() const;

    std::string_view chrom_name(uint32_t id) const { return chrom_names_[id]; }

    // Marker i in scan order. Records are unaligned in the file, so this
    // returns a copy.
    VbiMarkerRecord marker(uint64_t i) const;

private:
    MmapFile mmap_;
    VbiHeader header_{};
    std::vector<std::string_view> chrom_names_;
    const uint8_t* records_ = nullptr;
};

} // namespace vbi
