#pragma once

#include <ctime>
#include <string>

namespace seqreport {

// Header label for a submission that has none:
// "Submitted at 15:33, Monday, February 14, 2011" (local time).
std::string submission_label(std::time_t when);

// Make user-submitted sequence text valid multi-FASTA with unique ids.
// Leading whitespace is removed; text without a leading '>' gets the header
// ">label" prepended. The n-th repeat (n >= 1) of a header id gets "_n"
// appended to the id, so ">a >a >b >a" becomes ">a >a_1 >b >a_2".
// Empty input yields an empty string.
std::string to_fasta(const std::string& text, const std::string& label);

// As above, labelling headerless input with the current time.
std::string to_fasta(const std::string& text);

} // namespace seqreport
