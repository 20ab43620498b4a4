#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "core/types.hpp"

namespace vbi {

// Overlap index over labelled closed intervals, keyed by contig name.
//
// Two-phase: add() intervals while Building, then index() once to enter
// Finalized. add() after index() and overlap() before index() both fail.
// Per contig the intervals are sorted by start and the largest span is
// recorded, so an overlap query is a binary search to (start - max_span)
// followed by a forward scan: O(log n + k) for point intervals.
class IntervalIndex {
public:
    enum class State { kBuilding, kFinalized };

    IntervalIndex() = default;

    IntervalIndex(const IntervalIndex&) = delete;
    IntervalIndex& operator=(const IntervalIndex&) = delete;
    IntervalIndex(IntervalIndex&&) = default;
    IntervalIndex& operator=(IntervalIndex&&) = default;

    void reserve(size_t n) { pending_.reserve(n); }

    // Returns false if finalized or if end < start.
    bool add(std::string_view contig, GenomePos start, GenomePos end, Ordinal label);

    // Sort and freeze. Returns false if already finalized.
    bool index();

    State state() const { return state_; }
    bool finalized() const { return state_ == State::kFinalized; }

    // Append labels of intervals on contig overlapping [start, end] to out,
    // ordered by (interval start, label). Returns false before index().
    bool overlap(std::string_view contig, GenomePos start, GenomePos end,
                 std::vector<Ordinal>& out) const;

    size_t size() const { return size_; }
    size_t num_contigs() const { return contigs_.size(); }

    // Bytes owned by the index (entries, contig table, name lookup).
    uint64_t memory_bytes() const;

private:
    struct Entry {
        GenomePos start;
        GenomePos end;
        Ordinal label;
    };

    struct Contig {
        std::string name;
        std::vector<Entry> entries;
        GenomePos max_span = 0;
    };

    struct Pending {
        uint32_t contig;
        Entry entry;
    };

    uint32_t contig_id_for(std::string_view contig);

    State state_ = State::kBuilding;
    size_t size_ = 0;
    std::vector<Contig> contigs_;
    std::unordered_map<std::string, uint32_t> contig_ids_;
    std::vector<Pending> pending_;
    int64_t last_contig_ = -1;
};

} // namespace vbi
