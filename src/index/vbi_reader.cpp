#include "index/vbi_reader.hpp"
#include "core/config.hpp"

#include <sys/mman.h>
#include <cstring>

namespace vbi {

bool VbiReader::open(const std::string& path, Error* err) {
    close();

    std::string msg;
    if (!mmap_.open(path, &msg)) {
        return fail(err, ErrorKind::kIo, msg);
    }

    auto bad = [&](const std::string& why) {
        close();
        return fail(err, ErrorKind::kFormat, "'" + path + "': " + why);
    };

    const uint8_t* base = mmap_.data();
    const size_t size = mmap_.size();

    if (size < sizeof(VbiHeader)) return bad("file too small for header");
    std::memcpy(&header_, base, sizeof(VbiHeader));

    if (std::memcmp(header_.magic, VBI_MAGIC, 4) != 0) return bad("invalid magic");
    if (header_.format_version != VBI_FORMAT_VERSION) {
        return bad("unsupported format version " + std::to_string(header_.format_version));
    }
    if (header_.sample_count < 0 || header_.marker_count < 0 || header_.chrom_count < 0) {
        return bad("negative count in header");
    }

    size_t pos = sizeof(VbiHeader);
    // Every name needs at least its length field
    if (static_cast<uint64_t>(header_.chrom_count) > (size - pos) / sizeof(int32_t)) {
        return bad("chromosome count exceeds file size");
    }
    chrom_names_.reserve(static_cast<size_t>(header_.chrom_count));
    for (int32_t c = 0; c < header_.chrom_count; c++) {
        int32_t len;
        if (size - pos < sizeof(len)) return bad("truncated chromosome dictionary");
        std::memcpy(&len, base + pos, sizeof(len));
        pos += sizeof(len);
        if (len < 0 || size - pos < static_cast<size_t>(len)) {
            return bad("truncated chromosome name");
        }
        chrom_names_.emplace_back(reinterpret_cast<const char*>(base + pos),
                                  static_cast<size_t>(len));
        pos += static_cast<size_t>(len);
    }

    uint64_t n = static_cast<uint64_t>(header_.marker_count);
    if (n > (size - pos) / sizeof(VbiMarkerRecord) ||
        (size - pos) != n * sizeof(VbiMarkerRecord)) {
        return bad("marker section holds " + std::to_string(size - pos) +
                   " bytes, expected " + std::to_string(n * sizeof(VbiMarkerRecord)));
    }
    records_ = base + pos;

    // The loader copies the records in one forward pass
    mmap_.advise(MADV_SEQUENTIAL);

    return true;
}

void VbiReader::close() {
    mmap_.close();
    header_ = VbiHeader{};
    chrom_names_.clear();
    records_ = nullptr;
}

OffsetCodec VbiReader::codec() const {
    return (header_.flags & VBI_FLAG_VIRTUAL_OFFSETS) ? OffsetCodec::kVirtualOffset
                                                      : OffsetCodec::kByteOffset;
}

VbiMarkerRecord VbiReader::marker(uint64_t i) const {
    VbiMarkerRecord rec;
    std::memcpy(&rec, records_ + i * sizeof(VbiMarkerRecord), sizeof(rec));
    return rec;
}

} // namespace vbi
