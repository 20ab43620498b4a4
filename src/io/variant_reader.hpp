#pragma once

#include <cstdint>
#include <string>

#include <htslib/hts.h>
#include <htslib/vcf.h>

#include "core/error.hpp"
#include "core/types.hpp"

namespace vbi {

// Owning wrapper for an htslib variant record.
class BcfRecord {
public:
    BcfRecord() : rec_(bcf_init()) {}
    ~BcfRecord() { if (rec_) bcf_destroy(rec_); }

    BcfRecord(const BcfRecord&) = delete;
    BcfRecord& operator=(const BcfRecord&) = delete;

    bool valid() const { return rec_ != nullptr; }
    bcf1_t* get() const { return rec_; }
    bcf1_t* operator->() const { return rec_; }

private:
    bcf1_t* rec_;
};

// Streaming VCF/BCF reader exposing sequential reads, the current seek
// token and seeking to a stored token. BGZF-backed inputs (bgzipped VCF,
// BCF) use virtual offsets; plain-text VCF uses byte offsets.
//
// A reader is owned by exactly one caller; it is never shared between
// threads.
class VariantReader {
public:
    VariantReader() = default;
    ~VariantReader();

    VariantReader(const VariantReader&) = delete;
    VariantReader& operator=(const VariantReader&) = delete;

    // Open the source and read its header. threads > 1 enables htslib's
    // BGZF decompression pool; it does not change the record order.
    bool open(const std::string& path, int threads = 1, Error* err = nullptr);
    void close();

    bool is_open() const { return fp_ != nullptr; }
    const std::string& path() const { return path_; }
    OffsetCodec codec() const { return codec_; }

    const bcf_hdr_t* header() const { return hdr_; }
    bcf_hdr_t* header() { return hdr_; }
    int64_t num_samples() const;

    // Seek token of the next record to be read, or -1 on error.
    int64_t tell() const;

    // Position the stream at a token previously returned by tell().
    bool seek(int64_t offset);

    // Returns 1 when a record was read, 0 at end of stream, -1 on error.
    int read(bcf1_t* rec);

    // Chromosome name of a record read through this reader.
    const char* chrom_name(const bcf1_t* rec) const;

private:
    htsFile* fp_ = nullptr;
    bcf_hdr_t* hdr_ = nullptr;
    OffsetCodec codec_ = OffsetCodec::kByteOffset;
    std::string path_;
};

} // namespace vbi
