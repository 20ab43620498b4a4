#pragma once

#include <cstdint>
#include <string>

#include "core/error.hpp"

namespace vbi {

class Logger;

// Configuration for index building.
struct IndexBuilderConfig {
    std::string source_path;   // VCF, bgzipped VCF or BCF
    std::string index_path;    // destination .vbi (overwritten)
    int threads = 1;           // decompression threads, does not affect output
    bool verbose = false;
};

// Single streaming pass over the source: capture the seek token before each
// record, record (chrom, pos, offset) in scan order, then write the index
// atomically (temp file + rename).
//
// Fails with kIo if the source cannot be opened, its header or a record
// cannot be read, or the destination cannot be written.
bool build_index(const IndexBuilderConfig& config, const Logger& logger,
                 Error* err = nullptr);

} // namespace vbi
