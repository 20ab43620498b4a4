#include "index/interval_index.hpp"

#include <algorithm>
#include <limits>

namespace vbi {

uint32_t IntervalIndex::contig_id_for(std::string_view contig) {
    if (last_contig_ >= 0 && contigs_[last_contig_].name == contig) {
        return static_cast<uint32_t>(last_contig_);
    }
    std::string key(contig);
    auto it = contig_ids_.find(key);
    if (it == contig_ids_.end()) {
        uint32_t id = static_cast<uint32_t>(contigs_.size());
        contigs_.push_back(Contig{key, {}, 0});
        it = contig_ids_.emplace(std::move(key), id).first;
    }
    last_contig_ = it->second;
    return it->second;
}

bool IntervalIndex::add(std::string_view contig, GenomePos start, GenomePos end,
                        Ordinal label) {
    if (state_ != State::kBuilding || end < start) return false;
    pending_.push_back({contig_id_for(contig), {start, end, label}});
    size_++;
    return true;
}

bool IntervalIndex::index() {
    if (state_ != State::kBuilding) return false;

    // Distribute pending entries per contig
    std::vector<size_t> counts(contigs_.size(), 0);
    for (const auto& p : pending_) counts[p.contig]++;
    for (size_t c = 0; c < contigs_.size(); c++) {
        contigs_[c].entries.reserve(counts[c]);
    }
    for (const auto& p : pending_) {
        contigs_[p.contig].entries.push_back(p.entry);
    }
    std::vector<Pending>().swap(pending_);

    for (auto& c : contigs_) {
        std::sort(c.entries.begin(), c.entries.end(),
            [](const Entry& a, const Entry& b) {
                if (a.start != b.start) return a.start < b.start;
                return a.label < b.label;
            });
        GenomePos max_span = 0;
        for (const auto& e : c.entries) {
            max_span = std::max(max_span, e.end - e.start);
        }
        c.max_span = max_span;
    }

    state_ = State::kFinalized;
    return true;
}

bool IntervalIndex::overlap(std::string_view contig, GenomePos start, GenomePos end,
                            std::vector<Ordinal>& out) const {
    if (state_ != State::kFinalized) return false;
    if (end < start) return true;

    auto it = contig_ids_.find(std::string(contig));
    if (it == contig_ids_.end()) return true;
    const Contig& c = contigs_[it->second];

    // Any overlapping interval starts at or after start - max_span
    constexpr GenomePos kMin = std::numeric_limits<GenomePos>::min();
    GenomePos lo = (start >= kMin + c.max_span) ? start - c.max_span : kMin;

    auto first = std::lower_bound(c.entries.begin(), c.entries.end(), lo,
        [](const Entry& e, GenomePos value) { return e.start < value; });

    for (auto e = first; e != c.entries.end() && e->start <= end; ++e) {
        if (e->end >= start) out.push_back(e->label);
    }
    return true;
}

uint64_t IntervalIndex::memory_bytes() const {
    uint64_t bytes = sizeof(*this);
    bytes += contigs_.capacity() * sizeof(Contig);
    for (const auto& c : contigs_) {
        bytes += c.entries.capacity() * sizeof(Entry);
        bytes += c.name.capacity();
    }
    bytes += pending_.capacity() * sizeof(Pending);
    // Rough node cost of the name lookup table
    bytes += contig_ids_.size() * (sizeof(std::string) + sizeof(uint32_t) + 2 * sizeof(void*));
    bytes += contig_ids_.bucket_count() * sizeof(void*);
    return bytes;
}

} // namespace vbi
