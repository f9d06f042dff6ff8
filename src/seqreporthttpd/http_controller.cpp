#include "seqreporthttpd/http_controller.hpp"
#include "seqreporthttpd/search_request.hpp"
#include "io/blastdb_fetcher.hpp"
#include "query/option_validator.hpp"
#include "report/report_rewriter.hpp"
#include "retrieve/retrieval_reconciler.hpp"
#include "util/string_utils.hpp"

#include <thread>

#include <drogon/HttpAppFramework.h>
#include <json/json.h>

namespace seqreport {

HttpController::HttpController(std::shared_ptr<const ServerContext> ctx)
    : ctx_(std::move(ctx)) {}

void HttpController::register_routes() {
    std::string prefix = ctx_->path_prefix;
    if (!prefix.empty() && prefix.back() == '/') {
        prefix.pop_back();
    }

    auto self = this;

    drogon::app().registerHandler(
        prefix + "/",
        [self](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            self->search(req, std::move(callback));
        },
        {drogon::Post});

    drogon::app().registerHandler(
        prefix + "/get_sequence/",
        [self](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            self->get_sequence(req, std::move(callback));
        },
        {drogon::Get});

    drogon::app().registerHandler(
        prefix + "/api/v1/databases",
        [self](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            self->databases(req, std::move(callback));
        },
        {drogon::Get});
}

void HttpController::search(
    const drogon::HttpRequestPtr& req,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    SearchForm form;
    form.method = req->getParameter("method");
    form.sequence = req->getParameter("sequence");
    form.databases = req->getParameter("databases");
    form.advanced = req->getParameter("advanced");

    const Logger& logger = ctx_->logger;
    logger.debug("method: %s", form.method.c_str());
    logger.debug("sequence: %s", form.sequence.c_str());
    logger.debug("databases: %s", form.databases.c_str());
    logger.debug("advanced: %s", form.advanced.c_str());

    AlignmentRequest areq;
    int status = 0;
    std::string error_msg;
    if (!build_alignment_request(form, ctx_->databases, ctx_->num_threads,
                                 areq, status, error_msg)) {
        callback(make_error_response(
            static_cast<drogon::HttpStatusCode>(status), error_msg));
        return;
    }

    // BLAST runs for seconds to hours; keep it off the Drogon event loop.
    auto ctx = ctx_;
    auto cb = std::make_shared<std::function<void(const drogon::HttpResponsePtr&)>>(
        std::move(callback));

    std::thread([ctx, areq = std::move(areq), cb]() {
        const Logger& logger = ctx->logger;

        AlignmentResult result = ctx->runner.run(areq);
        logger.info("Ran: %s", ctx->runner.command(areq).c_str());

        if (!result.success) {
            logger.warn("BLAST failed (%d): %s", result.error_status,
                        result.error_message.c_str());
            (*cb)(make_error_response(
                static_cast<drogon::HttpStatusCode>(result.error_status),
                result.error_message));
            return;
        }

        HyperlinkResolver resolver(ctx->strategies, ctx->path_prefix, logger);
        ReportRewriter rewriter(resolver, logger);
        std::string html = rewriter.rewrite(make_report_lines(result.lines),
                                            areq.databases);
        (*cb)(make_html_response(std::move(html)));
    }).detach();
}

void HttpController::get_sequence(
    const drogon::HttpRequestPtr& req,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    RetrievalRequest rreq = parse_retrieval_request(req->getParameter("id"),
                                                    req->getParameter("db"));
    if (rreq.sequence_ids.empty()) {
        callback(make_error_response(drogon::k400BadRequest,
                                     "No sequence identifier provided."));
        return;
    }
    if (rreq.databases.empty()) {
        callback(make_error_response(drogon::k400BadRequest,
                                     "No BLAST database provided."));
        return;
    }

    // Only databases this server searches may be read.
    for (const auto& db : rreq.databases) {
        bool known = false;
        for (const auto& e : ctx_->databases.entries()) {
            if (e.path == db) {
                known = true;
                break;
            }
        }
        if (!known) {
            callback(make_error_response(drogon::k400BadRequest,
                                         "Unknown BLAST database: " + db + "."));
            return;
        }
    }

    auto ctx = ctx_;
    auto cb = std::make_shared<std::function<void(const drogon::HttpResponsePtr&)>>(
        std::move(callback));

    std::thread([ctx, rreq = std::move(rreq), cb]() {
        std::string html = reconcile_retrieval(
            rreq, make_blastdb_fetcher(ctx->logger), ctx->logger);
        (*cb)(make_html_response(std::move(html)));
    }).detach();
}

void HttpController::databases(
    const drogon::HttpRequestPtr& req,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    Json::Value result;
    Json::Value databases_arr(Json::arrayValue);
    for (const auto& db : ctx_->databases.entries()) {
        Json::Value dbobj;
        dbobj["id"] = db.id;
        dbobj["path"] = db.path;
        dbobj["title"] = db.title;
        dbobj["type"] = db.type;
        databases_arr.append(std::move(dbobj));
    }
    result["databases"] = std::move(databases_arr);
    result["methods"] = Json::Value(Json::arrayValue);
    for (const auto& m : blast_methods()) {
        result["methods"].append(m);
    }

    callback(drogon::HttpResponse::newHttpJsonResponse(std::move(result)));
}

drogon::HttpResponsePtr HttpController::make_html_response(std::string html) {
    auto resp = drogon::HttpResponse::newHttpResponse();
    resp->setContentTypeCode(drogon::CT_TEXT_HTML);
    resp->setBody(std::move(html));
    return resp;
}

drogon::HttpResponsePtr HttpController::make_error_response(
    drogon::HttpStatusCode status, const std::string& message) {
    Json::Value body;
    body["error"] = message;
    auto resp = drogon::HttpResponse::newHttpJsonResponse(std::move(body));
    resp->setStatusCode(status);
    return resp;
}

} // namespace seqreport
