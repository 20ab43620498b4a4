#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace vbi {

// Command-line parser for "-key value" style arguments.
// A token starting with '-' is a key unless it parses as a number, so
// "-start -5" binds -5 to -start.
class CliParser {
public:
    CliParser(int argc, char* argv[]);

    bool has(const std::string& key) const;

    // Last value given for key, or default_val if absent.
    std::string get_string(const std::string& key,
                           const std::string& default_val = {}) const;

    // All values given for a repeatable key, in command-line order.
    std::vector<std::string> get_strings(const std::string& key) const;

    // Returns default_val if not found or not a valid integer.
    int get_int(const std::string& key, int default_val = 0) const;

    // Strict 64-bit variant: returns false (value untouched) when the key is
    // absent or its value is not entirely an integer.
    bool get_int64(const std::string& key, int64_t& value) const;

    const std::string& program() const { return program_; }

    // Arguments not bound to a -key.
    const std::vector<std::string>& positional() const { return positional_; }

private:
    std::string program_;
    std::unordered_map<std::string, std::vector<std::string>> opts_;
    std::vector<std::string> positional_;
};

} // namespace vbi
