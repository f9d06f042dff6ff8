#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace seqreport {

// Wrapper around NCBI CSeqDB for looking up sequences in a BLAST database
// (nucleotide or protein, detected on open).
class BlastDbReader {
public:
    BlastDbReader();
    ~BlastDbReader();

    // Non-copyable
    BlastDbReader(const BlastDbReader&) = delete;
    BlastDbReader& operator=(const BlastDbReader&) = delete;

    // Move
    BlastDbReader(BlastDbReader&&) noexcept;
    BlastDbReader& operator=(BlastDbReader&&) noexcept;

    // Open a BLAST DB by path (without extension).
    // Returns false and sets error_msg on error.
    bool open(const std::string& db_path, std::string& error_msg);

    void close();

    uint32_t num_sequences() const;

    bool is_protein() const;

    std::string get_title() const;

    // OIDs whose identifiers match id (accession, gnl|db|tag, lcl|name, ...).
    // Returns an empty vector when nothing matches.
    std::vector<uint32_t> find_oids(const std::string& id) const;

    // Residues of the sequence at oid as IUPAC letters.
    std::string get_sequence(uint32_t oid) const;

    // Definition line title of the sequence at oid (may be empty).
    std::string get_defline_title(uint32_t oid) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace seqreport
