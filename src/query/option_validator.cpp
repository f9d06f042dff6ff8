#include "query/option_validator.hpp"

#include <algorithm>
#include <cctype>

namespace seqreport {

static const char* const kReservedOptions[] = {
    "-out", "-html", "-outfmt", "-db", "-query",
};

static bool allowed_option_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' ||
           c == '_' || c == '.' || c == ' ' || c == '\'';
}

static std::string to_lower(std::string s) {
    for (auto& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

const std::vector<std::string>& blast_methods() {
    static const std::vector<std::string> methods = {
        "blastn", "blastp", "blastx", "tblastn", "tblastx",
    };
    return methods;
}

bool validate_method(const std::string& method, std::string& error_msg) {
    const auto& methods = blast_methods();
    if (std::find(methods.begin(), methods.end(), method) == methods.end()) {
        error_msg = "Unknown BLAST method: " + method + ".";
        return false;
    }
    return true;
}

bool validate_advanced_options(const std::string& options,
                               std::string& error_msg) {
    if (!std::all_of(options.begin(), options.end(), allowed_option_char)) {
        error_msg = "Invalid characters detected in the advanced options";
        return false;
    }

    std::string lower = to_lower(options);
    for (const char* opt : kReservedOptions) {
        if (lower.find(opt) != std::string::npos) {
            error_msg = std::string("The advanced BLAST option \"") + opt +
                        "\" is used internally and so cannot be specified by you";
            return false;
        }
    }
    return true;
}

std::string prepare_advanced_options(const std::string& method,
                                     const std::string& options,
                                     int num_threads) {
    std::string out = options;
    if (method == "blastn" && out.find("task") == std::string::npos) {
        out += " -task blastn";
    }
    out += " -num_threads " + std::to_string(num_threads);
    return out;
}

} // namespace seqreport
