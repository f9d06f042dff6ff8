#pragma once

#include <functional>
#include <memory>
#include <string>

#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <drogon/HttpTypes.h>

#include "io/blast_runner.hpp"
#include "io/database_set.hpp"
#include "report/hyperlink_resolver.hpp"
#include "util/logger.hpp"

namespace seqreport {

// Everything a request handler needs; shared by all handler threads and
// never modified after startup.
struct ServerContext {
    DatabaseSet databases;
    BlastRunner runner;
    HyperlinkStrategies strategies;
    std::string path_prefix;
    int num_threads = 1;  // BLAST -num_threads
    Logger logger;
};

// HTTP front end: runs searches, renders their reports and serves
// get_sequence links.
class HttpController {
public:
    explicit HttpController(std::shared_ptr<const ServerContext> ctx);

    // Register HTTP routes with Drogon. Must be called before app().run().
    void register_routes();

    // POST /  (form: method, sequence, databases, advanced)
    void search(const drogon::HttpRequestPtr& req,
                std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    // GET /get_sequence/?id=...&db=...
    void get_sequence(const drogon::HttpRequestPtr& req,
                      std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    // GET /api/v1/databases
    void databases(const drogon::HttpRequestPtr& req,
                   std::function<void(const drogon::HttpResponsePtr&)>&& callback);

private:
    std::shared_ptr<const ServerContext> ctx_;

    static drogon::HttpResponsePtr make_html_response(std::string html);

    static drogon::HttpResponsePtr make_error_response(
        drogon::HttpStatusCode status, const std::string& message);
};

} // namespace seqreport
