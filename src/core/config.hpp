#pragma once

#include <cstdint>
#include <cstddef>
#include <limits>

#if __cplusplus >= 202002L
#include <bit>
#endif

namespace vbi {

// The on-disk layout is written with plain fwrite of native integers.
#if __cplusplus >= 202002L
static_assert(std::endian::native == std::endian::little,
              "vbi requires a little-endian platform");
#else
static_assert(__BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__,
              "vbi requires a little-endian platform");
#endif

// Format version
inline constexpr uint16_t VBI_FORMAT_VERSION = 1;

// Default index file extension appended to the source path
inline constexpr const char* VBI_DEFAULT_EXTENSION = ".vbi";

// mkstemp template suffix of the file written during construction
// (renamed onto the destination on success)
inline constexpr const char* VBI_TMP_TEMPLATE = ".XXXXXX";

// Upper bound used for a bare-chromosome region
inline constexpr int64_t MAX_COORDINATE = std::numeric_limits<int64_t>::max();

// Initial capacity of the builder's per-marker arrays
inline constexpr size_t BUILDER_INITIAL_CAPACITY = 1024;

// Minimum number of ordinals per parallel materialization chunk
inline constexpr size_t MATERIALIZE_MIN_CHUNK = 256;

} // namespace vbi
