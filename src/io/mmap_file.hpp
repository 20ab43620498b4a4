#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace vbi {

// Read-only private mapping of a whole file. An empty file opens
// successfully with size() == 0 and data() == nullptr.
class MmapFile {
public:
    MmapFile() = default;
    ~MmapFile();

    MmapFile(const MmapFile&) = delete;
    MmapFile& operator=(const MmapFile&) = delete;

    MmapFile(MmapFile&& other) noexcept;
    MmapFile& operator=(MmapFile&& other) noexcept;

    // On failure returns false and, if error_msg is given, describes why.
    bool open(const std::string& path, std::string* error_msg = nullptr);
    void close();

    bool is_open() const { return open_; }
    const uint8_t* data() const { return data_; }
    size_t size() const { return size_; }

    // madvise hint for the whole mapping (e.g. MADV_SEQUENTIAL)
    bool advise(int advice);

private:
    uint8_t* data_ = nullptr;
    size_t size_ = 0;
    bool open_ = false;
};

} // namespace vbi
