#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/error.hpp"
#include "core/types.hpp"
#include "query/region_parser.hpp"

namespace vbi {

class VariantIndex;

// All queries read only the loaded index; none touches the source file.

// Linear scan over every marker. Each ordinal appears at most once, in
// ascending order. Fails with kArgument on malformed region syntax.
bool query_region(const VariantIndex& index, const std::string& region,
                  std::vector<Ordinal>& out, Error* err = nullptr);

// One interval-index lookup per region. Returns the same set of ordinals
// as query_region(); within one region the ordinals are ascending, across
// regions no order is implied. Duplicates across regions are dropped.
bool query_region_indexed(const VariantIndex& index, const std::string& region,
                          std::vector<Ordinal>& out, Error* err = nullptr);

// Pre-parsed variants of the two region queries.
void query_regions(const VariantIndex& index,
                   const std::vector<RegionDescriptor>& regions,
                   std::vector<Ordinal>& out);
void query_regions_indexed(const VariantIndex& index,
                           const std::vector<RegionDescriptor>& regions,
                           std::vector<Ordinal>& out);

// Inclusive 1-based ordinal range. start is clamped up to 1 and end down
// to num_markers(); returns [start-1, end-1] or nothing if inverted.
std::vector<Ordinal> query_index_range(const VariantIndex& index,
                                       int64_t start_1based, int64_t end_1based);

} // namespace vbi
