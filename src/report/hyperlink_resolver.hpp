#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "core/types.hpp"
#include "util/logger.hpp"

namespace seqreport {

// Builds a complete replacement for a hit line, or nullopt to decline.
using HitLineStrategy =
    std::function<std::optional<std::string>(const HyperlinkRequest&)>;

// Builds a link target (URL path) for a hit, or nullopt for no link.
using HitLinkStrategy =
    std::function<std::optional<std::string>(const HyperlinkRequest&)>;

// "/get_sequence/?id=<id>&db=<databases space-joined>".
// No link when the hit line has whitespace right after '>'.
std::optional<std::string> standard_sequence_link(const HyperlinkRequest& req);

// Hyperlinking strategies in priority order. An empty std::function means
// the installation registered no such strategy.
//  1. line:     replaces the whole hit line when it returns a value.
//  2. link:     when registered, decides the link alone.
//  3. standard: used only when no link strategy is registered.
struct HyperlinkStrategies {
    HitLineStrategy line;
    HitLinkStrategy link;
    HitLinkStrategy standard = standard_sequence_link;
};

// Ids of every linked hit, in order of first appearance.
class RetrievableIds {
public:
    void add(const std::string& id) {
        if (seen_.insert(id).second) ids_.push_back(id);
    }

    const std::vector<std::string>& ids() const { return ids_; }
    size_t size() const { return ids_.size(); }
    bool empty() const { return ids_.empty(); }

private:
    std::vector<std::string> ids_;
    std::unordered_set<std::string> seen_;
};

// Split a normalized hit line ">  ID rest" into the text between '>' and the
// id, the id, and the rest of the line. Returns false if there is no id.
bool split_hit_line(const std::string& hit_line, std::string& prefix,
                    std::string& id, std::string& rest);

class HyperlinkResolver {
public:
    HyperlinkResolver(HyperlinkStrategies strategies, std::string url_prefix,
                      const Logger& logger);

    // Resolve the link for hit (hit.line normalized, hit.span scanned).
    // Sets hit.sequence_id and hit.link, records linked ids in retrievable,
    // and returns the line to emit.
    std::string resolve(HitRecord& hit,
                        const std::vector<std::string>& databases,
                        RetrievableIds& retrievable) const;

    const std::string& url_prefix() const { return url_prefix_; }

private:
    HyperlinkStrategies strategies_;
    std::string url_prefix_;
    const Logger& logger_;
};

} // namespace seqreport
