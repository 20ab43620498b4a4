#include "query/region_parser.hpp"
#include "core/config.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace vbi {

static std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) b++;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
    return s.substr(b, e - b);
}

// Non-negative decimal integer, nothing else.
static bool parse_coordinate(const std::string& s, GenomePos& out) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    errno = 0;
    long long v = std::strtoll(s.c_str(), nullptr, 10);
    if (errno == ERANGE) return false;
    out = static_cast<GenomePos>(v);
    return true;
}

bool parse_region(const std::string& text, RegionDescriptor& out, Error* err) {
    std::string s = trim(text);
    if (s.empty()) {
        return fail(err, ErrorKind::kArgument, "empty region");
    }

    auto bad = [&](const std::string& why) {
        return fail(err, ErrorKind::kArgument, "invalid region '" + s + "': " + why);
    };

    RegionDescriptor r;
    size_t colon = s.rfind(':');
    if (colon == std::string::npos) {
        r.chrom = s;
        r.start = 0;
        r.end = MAX_COORDINATE;
        out = std::move(r);
        return true;
    }

    r.chrom = s.substr(0, colon);
    if (r.chrom.empty()) return bad("missing chromosome name");

    std::string coords = s.substr(colon + 1);
    size_t dash = coords.find('-');
    if (dash == std::string::npos) {
        if (!parse_coordinate(coords, r.start)) return bad("position is not a number");
        r.end = r.start;
        r.is_point = true;
    } else {
        if (!parse_coordinate(coords.substr(0, dash), r.start)) {
            return bad("start is not a number");
        }
        if (!parse_coordinate(coords.substr(dash + 1), r.end)) {
            return bad("end is not a number");
        }
        if (r.end < r.start) return bad("end precedes start");
    }

    out = std::move(r);
    return true;
}

bool parse_regions(const std::string& text, std::vector<RegionDescriptor>& out, Error* err) {
    out.clear();
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t comma = text.find(',', pos);
        if (comma == std::string::npos) comma = text.size();
        std::string item = trim(text.substr(pos, comma - pos));
        if (!item.empty()) {
            RegionDescriptor r;
            if (!parse_region(item, r, err)) {
                out.clear();
                return false;
            }
            out.push_back(std::move(r));
        }
        pos = comma + 1;
    }
    return true;
}

} // namespace vbi
