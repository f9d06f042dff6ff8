#include "io/blastdb_reader.hpp"

#include <objtools/blast/seqdb_reader/seqdb.hpp>
#include <objects/blastdb/Blast_def_line.hpp>
#include <objects/blastdb/Blast_def_line_set.hpp>

#include <cstdio>

namespace seqreport {

struct BlastDbReader::Impl {
    std::unique_ptr<ncbi::CSeqDB> db;
};

BlastDbReader::BlastDbReader() : impl_(std::make_unique<Impl>()) {}

BlastDbReader::~BlastDbReader() {
    if (impl_) close();
}

BlastDbReader::BlastDbReader(BlastDbReader&&) noexcept = default;
BlastDbReader& BlastDbReader::operator=(BlastDbReader&&) noexcept = default;

bool BlastDbReader::open(const std::string& db_path, std::string& error_msg) {
    try {
        impl_->db = std::make_unique<ncbi::CSeqDB>(
            db_path, ncbi::CSeqDB::eUnknown);
        return true;
    } catch (const std::exception& e) {
        impl_->db.reset();
        error_msg = "failed to open BLAST DB '" + db_path + "': " + e.what();
        return false;
    }
}

void BlastDbReader::close() {
    impl_->db.reset();
}

uint32_t BlastDbReader::num_sequences() const {
    if (!impl_->db) return 0;
    return static_cast<uint32_t>(impl_->db->GetNumSeqs());
}

bool BlastDbReader::is_protein() const {
    if (!impl_->db) return false;
    return impl_->db->GetSequenceType() == ncbi::CSeqDB::eProtein;
}

std::string BlastDbReader::get_title() const {
    if (!impl_->db) return {};
    return impl_->db->GetTitle();
}

std::vector<uint32_t> BlastDbReader::find_oids(const std::string& id) const {
    std::vector<uint32_t> result;
    if (!impl_->db) return result;

    try {
        std::vector<int> oids;
        impl_->db->AccessionToOids(id, oids);
        for (int oid : oids) {
            if (oid >= 0) result.push_back(static_cast<uint32_t>(oid));
        }
    } catch (const std::exception& e) {
        std::fprintf(stderr, "BlastDbReader: lookup of '%s' failed: %s\n",
                     id.c_str(), e.what());
    }
    return result;
}

std::string BlastDbReader::get_sequence(uint32_t oid) const {
    if (!impl_->db) return {};

    std::string residues;
    try {
        impl_->db->GetSequenceAsString(static_cast<int>(oid), residues);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "BlastDbReader: get_sequence(%u) failed: %s\n",
                     oid, e.what());
        return {};
    }
    return residues;
}

std::string BlastDbReader::get_defline_title(uint32_t oid) const {
    if (!impl_->db) return {};

    try {
        ncbi::CRef<ncbi::objects::CBlast_def_line_set> hdr =
            impl_->db->GetHdr(static_cast<int>(oid));
        if (hdr.NotEmpty() && hdr->IsSet() && !hdr->Get().empty()) {
            const auto& first = hdr->Get().front();
            if (first->IsSetTitle()) return first->GetTitle();
        }
    } catch (const std::exception& e) {
        std::fprintf(stderr, "BlastDbReader: get_defline_title(%u) failed: %s\n",
                     oid, e.what());
    }
    return {};
}

} // namespace seqreport
