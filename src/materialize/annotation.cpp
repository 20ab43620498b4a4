#include "materialize/annotation.hpp"

#include <cctype>
#include <cstring>

namespace vbi {

static std::string strip(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    auto junk = [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) || c == '"' || c == '\'';
    };
    while (b < e && junk(s[b])) b++;
    while (e > b && junk(s[e - 1])) e--;
    return s.substr(b, e - b);
}

std::vector<std::string> parse_annotation_fields(const std::string& description) {
    static const char* const kMarkers[] = {"Format:", "Functional annotations:"};

    size_t start = std::string::npos;
    for (const char* marker : kMarkers) {
        size_t p = description.find(marker);
        if (p != std::string::npos) {
            start = p + std::strlen(marker);
            break;
        }
    }
    if (start == std::string::npos) return {};

    std::string list = strip(description.substr(start));
    if (list.empty()) return {};

    std::vector<std::string> fields;
    size_t pos = 0;
    for (;;) {
        size_t bar = list.find('|', pos);
        fields.push_back(strip(list.substr(pos, bar == std::string::npos ? std::string::npos
                                                                         : bar - pos)));
        if (bar == std::string::npos) break;
        pos = bar + 1;
    }
    return fields;
}

// Field list declared for an INFO key, empty if the key is not a String
// INFO field or its description has no list.
static std::vector<std::string> fields_for_key(const bcf_hdr_t* hdr, const char* key) {
    int id = bcf_hdr_id2int(hdr, BCF_DT_ID, key);
    if (id < 0 || !bcf_hdr_idinfo_exists(hdr, BCF_HL_INFO, id)) return {};
    if (bcf_hdr_id2type(hdr, BCF_HL_INFO, id) != BCF_HT_STR) return {};

    bcf_hrec_t* hrec = bcf_hdr_get_hrec(hdr, BCF_HL_INFO, "ID", key, nullptr);
    if (!hrec) return {};
    int idx = bcf_hrec_find_key(hrec, "Description");
    if (idx < 0) return {};
    return parse_annotation_fields(hrec->vals[idx]);
}

bool find_annotation_key(const bcf_hdr_t* hdr, const std::string& requested_key,
                         std::string& key_out, std::vector<std::string>& fields_out) {
    key_out.clear();
    fields_out.clear();

    if (!requested_key.empty()) {
        fields_out = fields_for_key(hdr, requested_key.c_str());
        if (fields_out.empty()) return false;
        key_out = requested_key;
        return true;
    }

    for (const char* key : kAnnotationKeys) {
        fields_out = fields_for_key(hdr, key);
        if (!fields_out.empty()) {
            key_out = key;
            return true;
        }
    }

    for (int i = 0; i < hdr->nhrec; i++) {
        bcf_hrec_t* hrec = hdr->hrec[i];
        if (hrec->type != BCF_HL_INFO) continue;
        int idx = bcf_hrec_find_key(hrec, "ID");
        if (idx < 0) continue;
        fields_out = fields_for_key(hdr, hrec->vals[idx]);
        if (!fields_out.empty()) {
            key_out = hrec->vals[idx];
            return true;
        }
    }
    return false;
}

AnnotationTable split_annotation(const std::string& value, size_t num_fields) {
    AnnotationTable table;
    size_t pos = 0;
    for (;;) {
        size_t comma = value.find(',', pos);
        size_t stop = (comma == std::string::npos) ? value.size() : comma;

        std::vector<std::string> row;
        row.reserve(num_fields);
        size_t p = pos;
        while (row.size() < num_fields) {
            size_t bar = value.find('|', p);
            if (bar == std::string::npos || bar > stop) bar = stop;
            row.push_back(value.substr(p, bar - p));
            if (bar == stop) break;
            p = bar + 1;
        }
        row.resize(num_fields);
        table.push_back(std::move(row));

        if (comma == std::string::npos) break;
        pos = comma + 1;
    }
    return table;
}

} // namespace vbi
