#include "util/cli_parser.hpp"

#include <cstdlib>
#include <stdexcept>

namespace seqreport {

CliParser::CliParser(int argc, char* argv[]) {
    if (argc > 0) {
        program_ = argv[0];
    }

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.size() < 2 || arg[0] != '-') {
            positional_.push_back(arg);
            continue;
        }

        // --key=value
        if (arg[1] == '-') {
            auto eq = arg.find('=');
            if (eq != std::string::npos) {
                opts_[arg.substr(0, eq)].push_back(arg.substr(eq + 1));
                continue;
            }
        }

        // A following argument that does not look like an option is the value;
        // "-" alone (stdin) is a value too.
        if (i + 1 < argc &&
            (argv[i + 1][0] != '-' || std::string(argv[i + 1]) == "-")) {
            opts_[arg].push_back(argv[i + 1]);
            i++;
        } else {
            opts_[arg].push_back("1");
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

std::vector<std::string> CliParser::get_list(const std::string& key) const {
    std::vector<std::string> out;
    for (const auto& value : get_strings(key)) {
        std::string cur;
        for (char c : value) {
            if (c == ' ' || c == '\t' || c == ',') {
                if (!cur.empty()) out.push_back(std::move(cur));
                cur.clear();
            } else {
                cur += c;
            }
        }
        if (!cur.empty()) out.push_back(std::move(cur));
    }
    return out;
}

int CliParser::get_int(const std::string& key, int default_val) const {
    auto it = opts_.find(key);
    if (it == opts_.end() || it->second.empty()) return default_val;
    try {
        return std::stoi(it->second.back());
    } catch (const std::logic_error&) {
        return default_val;
    }
}

} // namespace seqreport
