#pragma once

#include <string>
#include <vector>

#include "util/logger.hpp"

namespace seqreport {

struct DatabaseEntry {
    std::string id;     // hex MD5 of path; what search forms refer to
    std::string path;   // BLAST DB path as given to BLAST+ (-db)
    std::string title;
    std::string type;   // "nucleotide" or "protein"
};

// Stable identifier of a database path: its MD5 digest in hex.
std::string database_id(const std::string& path);

// The BLAST databases an installation serves, in configuration order.
class DatabaseSet {
public:
    // Open every path to read its title and type.
    // Returns false and sets error_msg on the first database that fails.
    bool load(const std::vector<std::string>& paths, const Logger& logger,
              std::string& error_msg);

    // Register a database without opening it.
    void add(DatabaseEntry entry) { entries_.push_back(std::move(entry)); }

    // Entry with the given id, or nullptr.
    const DatabaseEntry* find(const std::string& id) const;

    const std::vector<DatabaseEntry>& entries() const { return entries_; }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<DatabaseEntry> entries_;
};

} // namespace seqreport
