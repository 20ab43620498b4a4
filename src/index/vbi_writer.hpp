#pragma once

#include <cstdint>
#include <cstdio>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/error.hpp"
#include "core/types.hpp"

namespace vbi {

// Accumulates markers in scan order and writes a .vbi file.
class VbiWriter {
public:
    VbiWriter();

    void set_num_samples(int64_t n) { num_samples_ = n; }
    void set_codec(OffsetCodec codec) { codec_ = codec; }

    // Add one marker. chrom names get ids in first-seen order.
    void add_marker(const char* chrom, GenomePos pos, int64_t offset);

    // Write to a unique temp file beside path (path + ".XXXXXX"), fsync,
    // then rename onto path. The temp file is removed on failure.
    bool write(const std::string& path, Error* err = nullptr) const;

    int64_t num_samples() const { return num_samples_; }
    uint64_t num_markers() const { return positions_.size(); }
    uint32_t num_chroms() const { return static_cast<uint32_t>(chrom_names_.size()); }

private:
    ChromId chrom_id_for(const char* chrom);
    bool write_stream(std::FILE* fp) const;

    int64_t num_samples_ = 0;
    OffsetCodec codec_ = OffsetCodec::kByteOffset;
    std::vector<std::string> chrom_names_;
    std::unordered_map<std::string, ChromId> chrom_lookup_;
    std::vector<ChromId> chrom_ids_;
    std::vector<GenomePos> positions_;
    std::vector<int64_t> offsets_;

    // Records in a sorted file share their chrom with the previous one.
    ChromId last_id_ = -1;
};

} // namespace vbi
