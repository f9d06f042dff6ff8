#include "io/database_set.hpp"
#include "io/blastdb_reader.hpp"

#include <iomanip>
#include <sstream>

#include <openssl/evp.h>

namespace seqreport {

static std::string bytes_to_hex(const unsigned char* data, unsigned int len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < len; i++)
        oss << std::setw(2) << static_cast<unsigned>(data[i]);
    return oss.str();
}

std::string database_id(const std::string& path) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    EVP_Digest(path.data(), path.size(), hash, &hash_len, EVP_md5(), nullptr);
    return bytes_to_hex(hash, hash_len);
}

bool DatabaseSet::load(const std::vector<std::string>& paths,
                       const Logger& logger, std::string& error_msg) {
    for (const auto& path : paths) {
        BlastDbReader db;
        if (!db.open(path, error_msg)) {
            return false;
        }

        DatabaseEntry entry;
        entry.id = database_id(path);
        entry.path = path;
        entry.title = db.get_title();
        entry.type = db.is_protein() ? "protein" : "nucleotide";
        logger.info("Found %s database: %s at %s (%u sequences)",
                    entry.type.c_str(), entry.title.c_str(), path.c_str(),
                    db.num_sequences());
        entries_.push_back(std::move(entry));
    }
    return true;
}

const DatabaseEntry* DatabaseSet::find(const std::string& id) const {
    for (const auto& e : entries_) {
        if (e.id == id) return &e;
    }
    return nullptr;
}

} // namespace seqreport
