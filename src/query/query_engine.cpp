#include "query/query_engine.hpp"
#include "index/variant_index.hpp"

#include <algorithm>

namespace vbi {

void query_regions(const VariantIndex& index,
                   const std::vector<RegionDescriptor>& regions,
                   std::vector<Ordinal>& out) {
    out.clear();
    if (regions.empty()) return;

    // Resolve region chromosomes to dictionary ids once; unknown names
    // (id -1) can never match.
    const auto& names = index.chrom_names();
    std::vector<ChromId> region_ids(regions.size(), -1);
    for (size_t r = 0; r < regions.size(); r++) {
        auto it = std::find(names.begin(), names.end(), regions[r].chrom);
        if (it != names.end()) region_ids[r] = static_cast<ChromId>(it - names.begin());
    }

    const auto& chrom_ids = index.chrom_ids();
    const auto& positions = index.positions();
    const uint64_t n = index.num_markers();
    for (uint64_t i = 0; i < n; i++) {
        for (size_t r = 0; r < regions.size(); r++) {
            if (chrom_ids[i] == region_ids[r] &&
                positions[i] >= regions[r].start &&
                positions[i] <= regions[r].end) {
                out.push_back(i);
                break;
            }
        }
    }
}

void query_regions_indexed(const VariantIndex& index,
                           const std::vector<RegionDescriptor>& regions,
                           std::vector<Ordinal>& out) {
    out.clear();
    const IntervalIndex& intervals = index.intervals();

    std::vector<bool> seen;
    if (regions.size() > 1) seen.assign(index.num_markers(), false);

    std::vector<Ordinal> hits;
    for (const auto& r : regions) {
        hits.clear();
        intervals.overlap(r.chrom, r.start, r.end, hits);
        // Equal positions come back in label order; a file that is not
        // coordinate-sorted may interleave, so restore ordinal order.
        std::sort(hits.begin(), hits.end());
        for (Ordinal o : hits) {
            if (!seen.empty()) {
                if (seen[o]) continue;
                seen[o] = true;
            }
            out.push_back(o);
        }
    }
}

bool query_region(const VariantIndex& index, const std::string& region,
                  std::vector<Ordinal>& out, Error* err) {
    std::vector<RegionDescriptor> regions;
    if (!parse_regions(region, regions, err)) {
        out.clear();
        return false;
    }
    query_regions(index, regions, out);
    return true;
}

bool query_region_indexed(const VariantIndex& index, const std::string& region,
                          std::vector<Ordinal>& out, Error* err) {
    std::vector<RegionDescriptor> regions;
    if (!parse_regions(region, regions, err)) {
        out.clear();
        return false;
    }
    query_regions_indexed(index, regions, out);
    return true;
}

std::vector<Ordinal> query_index_range(const VariantIndex& index,
                                       int64_t start_1based, int64_t end_1based) {
    const int64_t n = static_cast<int64_t>(index.num_markers());
    int64_t start = std::max<int64_t>(start_1based, 1);
    int64_t end = std::min<int64_t>(end_1based, n);

    std::vector<Ordinal> out;
    if (end < start) return out;
    out.reserve(static_cast<size_t>(end - start + 1));
    for (int64_t i = start - 1; i < end; i++) {
        out.push_back(static_cast<Ordinal>(i));
    }
    return out;
}

} // namespace vbi
