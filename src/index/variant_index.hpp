#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "core/error.hpp"
#include "core/types.hpp"
#include "index/interval_index.hpp"

namespace vbi {

// Loaded, read-only variant block index: the chromosome dictionary, the
// parallel per-marker arrays and the derived point-interval index.
//
// load() either fully succeeds or leaves the object empty. Once loaded the
// object is immutable, so concurrent readers need no locking.
class VariantIndex {
public:
    VariantIndex() = default;

    VariantIndex(const VariantIndex&) = delete;
    VariantIndex& operator=(const VariantIndex&) = delete;
    VariantIndex(VariantIndex&&) = default;
    VariantIndex& operator=(VariantIndex&&) = default;

    // Read a .vbi file and rebuild the interval index.
    // Fails with kIo if the file cannot be opened, kFormat if it is
    // truncated or malformed.
    bool load(const std::string& path, Error* err = nullptr);

    // Release everything.
    void clear();

    bool loaded() const { return loaded_; }
    const std::string& path() const { return path_; }

    int64_t num_samples() const { return num_samples_; }
    uint64_t num_markers() const { return positions_.size(); }
    uint32_t num_chroms() const { return static_cast<uint32_t>(chrom_names_.size()); }
    OffsetCodec codec() const { return codec_; }

    const std::vector<std::string>& chrom_names() const { return chrom_names_; }
    const std::vector<ChromId>& chrom_ids() const { return chrom_ids_; }
    const std::vector<GenomePos>& positions() const { return positions_; }
    const std::vector<int64_t>& offsets() const { return offsets_; }
    const IntervalIndex& intervals() const { return intervals_; }

    const std::string& chrom_of(Ordinal i) const { return chrom_names_[chrom_ids_[i]]; }
    GenomePos position_of(Ordinal i) const { return positions_[i]; }
    int64_t offset_of(Ordinal i) const { return offsets_[i]; }

    // (chrom, pos, pos, ordinal) for the first `limit` markers in scan
    // order; limit 0 returns all.
    std::vector<MarkerRange> extract_ranges(uint64_t limit = 0) const;

    MemoryUsage memory_usage() const;

    // "ordinal<TAB>chrom<TAB>pos<TAB>offset" for the first n markers
    // (1-based ordinals, n <= 0 prints all).
    void print(std::ostream& out, int64_t n) const;

private:
    bool loaded_ = false;
    std::string path_;
    int64_t num_samples_ = 0;
    OffsetCodec codec_ = OffsetCodec::kByteOffset;
    std::vector<std::string> chrom_names_;
    std::vector<ChromId> chrom_ids_;
    std::vector<GenomePos> positions_;
    std::vector<int64_t> offsets_;
    IntervalIndex intervals_;
};

} // namespace vbi
