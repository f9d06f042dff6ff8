#include "report/hyperlink_resolver.hpp"
#include "util/string_utils.hpp"

namespace seqreport {

bool split_hit_line(const std::string& hit_line, std::string& prefix,
                    std::string& id, std::string& rest) {
    prefix.clear();
    id.clear();
    rest.clear();
    if (hit_line.empty() || hit_line[0] != '>') return false;

    size_t i = 1;
    while (i < hit_line.size() && is_space(hit_line[i])) i++;
    size_t id_start = i;
    while (i < hit_line.size() && !is_space(hit_line[i])) i++;
    if (i == id_start) return false;

    prefix = hit_line.substr(1, id_start - 1);
    id = hit_line.substr(id_start, i - id_start);
    rest = hit_line.substr(i);
    return true;
}

std::optional<std::string> standard_sequence_link(const HyperlinkRequest& req) {
    if (req.sequence_id.empty()) return std::nullopt;
    if (req.hit_line.size() > 1 && is_space(req.hit_line[1])) {
        return std::nullopt;
    }
    return "/get_sequence/?id=" + req.sequence_id +
           "&db=" + join(req.databases, " ");
}

static std::string describe(const HyperlinkRequest& req) {
    std::string s = "id=" + req.sequence_id + " databases=[" +
                    join(req.databases, ", ") + "]";
    if (req.span) {
        s += " coordinates=" + std::to_string(req.span->min) + ".." +
             std::to_string(req.span->max);
    }
    return s;
}

HyperlinkResolver::HyperlinkResolver(HyperlinkStrategies strategies,
                                     std::string url_prefix,
                                     const Logger& logger)
    : strategies_(std::move(strategies)),
      url_prefix_(std::move(url_prefix)),
      logger_(logger) {}

std::string HyperlinkResolver::resolve(HitRecord& hit,
                                       const std::vector<std::string>& databases,
                                       RetrievableIds& retrievable) const {
    std::string prefix, id, rest;
    split_hit_line(hit.line, prefix, id, rest);
    hit.sequence_id = id;
    hit.link.reset();

    HyperlinkRequest req;
    req.sequence_id = id;
    req.databases = databases;
    req.span = hit.span;
    req.hit_line = hit.line;

    if (strategies_.line) {
        logger_.debug("Using custom hit line builder: %s", describe(req).c_str());
        std::optional<std::string> line = strategies_.line(req);
        if (line) return *line;
    }

    std::optional<std::string> link;
    if (strategies_.link) {
        logger_.debug("Using custom hyperlink builder: %s", describe(req).c_str());
        link = strategies_.link(req);
    } else if (strategies_.standard) {
        logger_.debug("Using standard hyperlink builder: %s", describe(req).c_str());
        link = strategies_.standard(req);
    }

    if (!link || id.empty()) {
        logger_.debug("No link added for '%s'", id.c_str());
        return hit.line;
    }

    hit.link = url_prefix_ + *link;
    retrievable.add(id);
    logger_.debug("Added link for '%s': %s", id.c_str(), hit.link->c_str());

    return ">" + prefix + "<a href='" + *hit.link + "' target='_blank'>" +
           id + "</a>" + rest;
}

} // namespace seqreport
