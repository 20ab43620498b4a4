#include "util/cli_parser.hpp"

#include <cerrno>
#include <cstdlib>

namespace vbi {

static bool parse_int64(const std::string& s, int64_t& out) {
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    out = static_cast<int64_t>(v);
    return true;
}

static bool looks_like_value(const char* arg) {
    if (arg[0] != '-') return true;
    int64_t unused;
    return parse_int64(arg, unused);
}

CliParser::CliParser(int argc, char* argv[]) {
    if (argc > 0) {
        program_ = argv[0];
    }

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.size() >= 2 && arg[0] == '-' && !looks_like_value(argv[i])) {
            // --key=value
            if (arg[1] == '-') {
                auto eq = arg.find('=');
                if (eq != std::string::npos) {
                    opts_[arg.substr(0, eq)].push_back(arg.substr(eq + 1));
                    continue;
                }
            }

            if (i + 1 < argc && looks_like_value(argv[i + 1])) {
                opts_[arg].push_back(argv[i + 1]);
                i++;
            } else {
                opts_[arg].push_back("1");
            }
        } else {
            positional_.push_back(arg);
        }
    }
}

bool CliParser::has(const std::string& key) const {
    return opts_.count(key) > 0;
}

std::string CliParser::get_string(const std::string& key,
                                  const std::string& default_val) const {
    auto it = opts_.find(key);
    if (it != opts_.end() && !it->second.empty()) return it->second.back();
    return default_val;
}

std::vector<std::string> CliParser::get_strings(const std::string& key) const {
    auto it = opts_.find(key);
    if (it != opts_.end()) return it->second;
    return {};
}

int CliParser::get_int(const std::string& key, int default_val) const {
    int64_t v;
    if (!get_int64(key, v)) return default_val;
    return static_cast<int>(v);
}

bool CliParser::get_int64(const std::string& key, int64_t& value) const {
    auto it = opts_.find(key);
    if (it == opts_.end() || it->second.empty()) return false;
    return parse_int64(it->second.back(), value);
}

} // namespace vbi
