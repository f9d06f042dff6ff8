#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace seqreport {

// Command-line parser for -key value style arguments.
// A key may be given more than once; every value is kept in order.
class CliParser {
public:
    CliParser(int argc, char* argv[]);

    bool has(const std::string& key) const;

    // Last value given for key, or default_val.
    std::string get_string(const std::string& key,
                           const std::string& default_val = {}) const;

    // All values given for key, in command-line order.
    std::vector<std::string> get_strings(const std::string& key) const;

    // All values given for key, each further split on whitespace and commas.
    // "-db 'a b' -db c" yields {"a", "b", "c"}.
    std::vector<std::string> get_list(const std::string& key) const;

    // Returns default_val if not found or not an integer.
    int get_int(const std::string& key, int default_val = 0) const;

    const std::string& program() const { return program_; }

    // Arguments not preceded by a -key.
    const std::vector<std::string>& positional() const { return positional_; }

private:
    std::string program_;
    std::unordered_map<std::string, std::vector<std::string>> opts_;
    std::vector<std::string> positional_;
};

} // namespace seqreport
