#include "index/vbi_writer.hpp"
#include "index/vbi_format.hpp"
#include "core/config.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <cstdlib>
#include <sys/stat.h>
#include <unistd.h>

namespace vbi {

VbiWriter::VbiWriter() {
    chrom_ids_.reserve(BUILDER_INITIAL_CAPACITY);
    positions_.reserve(BUILDER_INITIAL_CAPACITY);
    offsets_.reserve(BUILDER_INITIAL_CAPACITY);
}

ChromId VbiWriter::chrom_id_for(const char* chrom) {
    if (last_id_ >= 0 && chrom_names_[last_id_] == chrom) return last_id_;

    auto it = chrom_lookup_.find(chrom);
    if (it != chrom_lookup_.end()) {
        last_id_ = it->second;
        return last_id_;
    }
    ChromId id = static_cast<ChromId>(chrom_names_.size());
    chrom_names_.emplace_back(chrom);
    chrom_lookup_.emplace(chrom_names_.back(), id);
    last_id_ = id;
    return id;
}

void VbiWriter::add_marker(const char* chrom, GenomePos pos, int64_t offset) {
    chrom_ids_.push_back(chrom_id_for(chrom));
    positions_.push_back(pos);
    offsets_.push_back(offset);
}

bool VbiWriter::write_stream(std::FILE* fp) const {
    VbiHeader hdr{};
    std::memcpy(hdr.magic, VBI_MAGIC, 4);
    hdr.format_version = VBI_FORMAT_VERSION;
    hdr.flags = (codec_ == OffsetCodec::kVirtualOffset) ? VBI_FLAG_VIRTUAL_OFFSETS : 0;
    hdr.sample_count = num_samples_;
    hdr.marker_count = static_cast<int64_t>(positions_.size());
    hdr.chrom_count = static_cast<int32_t>(chrom_names_.size());
    if (std::fwrite(&hdr, sizeof(hdr), 1, fp) != 1) return false;

    // Chromosome dictionary (not NUL-terminated)
    for (const auto& name : chrom_names_) {
        int32_t len = static_cast<int32_t>(name.size());
        if (std::fwrite(&len, sizeof(len), 1, fp) != 1) return false;
        if (len > 0 && std::fwrite(name.data(), 1, name.size(), fp) != name.size())
            return false;
    }

    // Per-marker records, buffered in batches
    constexpr size_t kBatch = 4096;
    std::vector<VbiMarkerRecord> batch;
    batch.reserve(kBatch);
    for (size_t i = 0; i < positions_.size(); i++) {
        batch.push_back({chrom_ids_[i], positions_[i], offsets_[i]});
        if (batch.size() == kBatch || i + 1 == positions_.size()) {
            if (std::fwrite(batch.data(), sizeof(VbiMarkerRecord), batch.size(), fp)
                != batch.size())
                return false;
            batch.clear();
        }
    }

    if (std::fflush(fp) != 0) return false;
    return ::fsync(fileno(fp)) == 0;
}

bool VbiWriter::write(const std::string& path, Error* err) const {
    // Unique per writer, so concurrent builds of one destination never
    // share a temp file.
    std::string tmp_path = path + VBI_TMP_TEMPLATE;
    int fd = ::mkstemp(&tmp_path[0]);
    if (fd < 0) {
        return fail(err, ErrorKind::kIo,
                    "cannot create temporary file for '" + path + "': " +
                    std::strerror(errno));
    }
    // mkstemp creates 0600; the index is readable like any output file
    std::FILE* fp = nullptr;
    if (::fchmod(fd, 0644) == 0) fp = ::fdopen(fd, "wb");
    if (!fp) {
        int saved = errno;
        ::close(fd);
        std::remove(tmp_path.c_str());
        return fail(err, ErrorKind::kIo,
                    "cannot open '" + tmp_path + "' for writing: " + std::strerror(saved));
    }

    bool ok = write_stream(fp);
    int saved = errno;
    if (std::fclose(fp) != 0 && ok) {
        ok = false;
        saved = errno;
    }
    if (!ok) {
        std::remove(tmp_path.c_str());
        return fail(err, ErrorKind::kIo,
                    "failed to write '" + tmp_path + "': " + std::strerror(saved));
    }

    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        saved = errno;
        std::remove(tmp_path.c_str());
        return fail(err, ErrorKind::kIo,
                    "failed to rename '" + tmp_path + "' -> '" + path + "': " +
                    std::strerror(saved));
    }
    return true;
}

} // namespace vbi
