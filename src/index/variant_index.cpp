#include "index/variant_index.hpp"
#include "index/vbi_reader.hpp"

#include <algorithm>
#include <utility>

namespace vbi {

bool VariantIndex::load(const std::string& path, Error* err) {
    // Build into a scratch object so a failure never leaves partial state.
    VariantIndex tmp;

    VbiReader reader;
    if (!reader.open(path, err)) {
        clear();
        return false;
    }

    tmp.path_ = path;
    tmp.num_samples_ = reader.num_samples();
    tmp.codec_ = reader.codec();

    const uint32_t nchrom = reader.num_chroms();
    tmp.chrom_names_.reserve(nchrom);
    for (uint32_t c = 0; c < nchrom; c++) {
        tmp.chrom_names_.emplace_back(reader.chrom_name(c));
    }

    const uint64_t n = reader.num_markers();
    tmp.chrom_ids_.resize(n);
    tmp.positions_.resize(n);
    tmp.offsets_.resize(n);
    for (uint64_t i = 0; i < n; i++) {
        VbiMarkerRecord rec = reader.marker(i);
        if (rec.chrom_id < 0 || static_cast<uint32_t>(rec.chrom_id) >= nchrom) {
            clear();
            return fail(err, ErrorKind::kFormat,
                        "'" + path + "': marker " + std::to_string(i) +
                        " has chromosome id " + std::to_string(rec.chrom_id) +
                        " outside dictionary of " + std::to_string(nchrom));
        }
        tmp.chrom_ids_[i] = rec.chrom_id;
        tmp.positions_[i] = rec.position;
        tmp.offsets_[i] = rec.offset;
    }
    reader.close();

    // Phase 1: one zero-length interval per marker; phase 2: finalize.
    tmp.intervals_.reserve(n);
    for (uint64_t i = 0; i < n; i++) {
        GenomePos p = tmp.positions_[i];
        tmp.intervals_.add(tmp.chrom_names_[tmp.chrom_ids_[i]], p, p, i);
    }
    tmp.intervals_.index();

    tmp.loaded_ = true;
    *this = std::move(tmp);
    return true;
}

void VariantIndex::clear() {
    *this = VariantIndex();
}

std::vector<MarkerRange> VariantIndex::extract_ranges(uint64_t limit) const {
    uint64_t n = num_markers();
    if (limit > 0) n = std::min(n, limit);

    std::vector<MarkerRange> ranges;
    ranges.reserve(n);
    for (uint64_t i = 0; i < n; i++) {
        ranges.push_back({chrom_of(i), positions_[i], positions_[i], i});
    }
    return ranges;
}

MemoryUsage VariantIndex::memory_usage() const {
    MemoryUsage mu;
    mu.index_bytes = sizeof(*this) - sizeof(IntervalIndex);
    mu.index_bytes += chrom_ids_.capacity() * sizeof(ChromId);
    mu.index_bytes += positions_.capacity() * sizeof(GenomePos);
    mu.index_bytes += offsets_.capacity() * sizeof(int64_t);
    mu.index_bytes += chrom_names_.capacity() * sizeof(std::string);
    for (const auto& name : chrom_names_) mu.index_bytes += name.capacity();
    mu.index_bytes += path_.capacity();
    mu.interval_index_bytes = intervals_.memory_bytes();
    return mu;
}

void VariantIndex::print(std::ostream& out, int64_t n) const {
    uint64_t count = num_markers();
    if (n > 0 && static_cast<uint64_t>(n) < count) count = static_cast<uint64_t>(n);

    out << "# markers=" << num_markers()
        << " samples=" << num_samples_
        << " chromosomes=" << num_chroms()
        << " offsets=" << offset_codec_name(codec_) << '\n';
    for (uint64_t i = 0; i < count; i++) {
        out << (i + 1) << '\t'
            << chrom_of(i) << '\t'
            << positions_[i] << '\t'
            << offsets_[i] << '\n';
    }
}

} // namespace vbi
