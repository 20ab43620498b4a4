#include "io/variant_reader.hpp"

#include <htslib/bgzf.h>
#include <htslib/hfile.h>

namespace vbi {

VariantReader::~VariantReader() {
    close();
}

bool VariantReader::open(const std::string& path, int threads, Error* err) {
    close();

    fp_ = hts_open(path.c_str(), "r");
    if (!fp_) {
        return fail(err, ErrorKind::kIo, "cannot open '" + path + "'");
    }

    const htsFormat* fmt = hts_get_format(fp_);
    if (fmt->category != variant_data) {
        close();
        return fail(err, ErrorKind::kIo, "'" + path + "' is not a VCF/BCF file");
    }
    // Offsets into a plain gzip stream cannot be seeked to.
    if (fmt->compression == gzip) {
        close();
        return fail(err, ErrorKind::kIo,
                    "'" + path + "' is gzip- but not BGZF-compressed; "
                    "recompress it with bgzip");
    }

    codec_ = fp_->is_bgzf ? OffsetCodec::kVirtualOffset : OffsetCodec::kByteOffset;

    if (threads > 1 && codec_ == OffsetCodec::kVirtualOffset) {
        if (hts_set_threads(fp_, threads) != 0) {
            close();
            return fail(err, ErrorKind::kIo,
                        "cannot start " + std::to_string(threads) +
                        " decompression threads for '" + path + "'");
        }
    }

    hdr_ = bcf_hdr_read(fp_);
    if (!hdr_) {
        close();
        return fail(err, ErrorKind::kIo, "failed to read VCF/BCF header of '" + path + "'");
    }

    path_ = path;
    return true;
}

void VariantReader::close() {
    if (hdr_) {
        bcf_hdr_destroy(hdr_);
        hdr_ = nullptr;
    }
    if (fp_) {
        hts_close(fp_);
        fp_ = nullptr;
    }
    path_.clear();
    codec_ = OffsetCodec::kByteOffset;
}

int64_t VariantReader::num_samples() const {
    return hdr_ ? static_cast<int64_t>(bcf_hdr_nsamples(hdr_)) : 0;
}

int64_t VariantReader::tell() const {
    if (!fp_) return -1;
    if (codec_ == OffsetCodec::kVirtualOffset) {
        return static_cast<int64_t>(bgzf_tell(fp_->fp.bgzf));
    }
    return static_cast<int64_t>(htell(fp_->fp.hfile));
}

bool VariantReader::seek(int64_t offset) {
    if (!fp_ || offset < 0) return false;
    if (codec_ == OffsetCodec::kVirtualOffset) {
        return bgzf_seek(fp_->fp.bgzf, offset, SEEK_SET) == 0;
    }
    // hseek returns the resulting offset
    return hseek(fp_->fp.hfile, static_cast<off_t>(offset), SEEK_SET) == offset;
}

int VariantReader::read(bcf1_t* rec) {
    if (!fp_ || !hdr_) return -1;
    int ret = bcf_read(fp_, hdr_, rec);
    if (ret == 0) return 1;
    if (ret == -1) return 0;
    return -1;
}

const char* VariantReader::chrom_name(const bcf1_t* rec) const {
    return bcf_hdr_id2name(hdr_, rec->rid);
}

} // namespace vbi
