#include "io/mmap_file.hpp"

#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace vbi {

MmapFile::~MmapFile() {
    close();
}

MmapFile::MmapFile(MmapFile&& other) noexcept
    : data_(other.data_), size_(other.size_), open_(other.open_) {
    other.data_ = nullptr;
    other.size_ = 0;
    other.open_ = false;
}

MmapFile& MmapFile::operator=(MmapFile&& other) noexcept {
    if (this != &other) {
        close();
        data_ = other.data_;
        size_ = other.size_;
        open_ = other.open_;
        other.data_ = nullptr;
        other.size_ = 0;
        other.open_ = false;
    }
    return *this;
}

static bool report(std::string* error_msg, const std::string& what,
                   const std::string& path) {
    if (error_msg) {
        *error_msg = what + " '" + path + "': " + std::strerror(errno);
    }
    return false;
}

bool MmapFile::open(const std::string& path, std::string* error_msg) {
    close();

    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) return report(error_msg, "cannot open", path);

    struct stat st;
    if (fstat(fd, &st) != 0) {
        int saved = errno;
        ::close(fd);
        errno = saved;
        return report(error_msg, "fstat failed for", path);
    }

    if (st.st_size == 0) {
        ::close(fd);
        open_ = true;
        return true;
    }

    void* mapped = ::mmap(nullptr, static_cast<size_t>(st.st_size),
                          PROT_READ, MAP_PRIVATE, fd, 0);
    int saved = errno;
    ::close(fd);

    if (mapped == MAP_FAILED) {
        errno = saved;
        return report(error_msg, "mmap failed for", path);
    }

    data_ = static_cast<uint8_t*>(mapped);
    size_ = static_cast<size_t>(st.st_size);
    open_ = true;
    return true;
}

bool MmapFile::advise(int advice) {
    if (!data_) return false;
    return ::madvise(data_, size_, advice) == 0;
}

void MmapFile::close() {
    if (data_) {
        ::munmap(data_, size_);
    }
    data_ = nullptr;
    size_ = 0;
    open_ = false;
}

} // namespace vbi
