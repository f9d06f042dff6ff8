#include "seqreporthttpd/http_controller.hpp"
#include "core/version.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"
#include "util/net_utils.hpp"

#include <drogon/HttpAppFramework.h>
#include <trantor/utils/Logger.h>

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>

#include <unistd.h>

using namespace seqreport;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options]\n"
        "\n"
        "Databases (at least one required):\n"
        "  -db <path>                  BLAST DB to search (repeatable)\n"
        "\n"
        "Options:\n"
        "  -bin_dir <dir>              Directory of the BLAST+ executables (default: PATH)\n"
        "  -num_threads <int>          Threads per BLAST run (default: 1)\n"
        "  -listen <host>:<port>       HTTP listen address (default: 0.0.0.0:4567)\n"
        "  -path_prefix <prefix>       URL path prefix (e.g., /blast)\n"
        "  -threads <int>              Drogon I/O threads (default: all cores)\n"
        "  -pid <path>                 PID file path\n"
        "  -v, --verbose               Verbose logging\n",
        prog);
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv);

    if (check_version(cli, "seqreporthttpd")) return 0;

    if (cli.has("-h") || cli.has("--help")) {
        print_usage(argv[0]);
        return 0;
    }

    Logger logger = make_logger(cli);
    bool verbose = logger.verbose();

    auto db_paths = cli.get_list("-db");
    if (db_paths.empty()) {
        std::fprintf(stderr, "Error: at least one -db is required\n");
        print_usage(argv[0]);
        return 1;
    }

    auto ctx = std::make_shared<ServerContext>();
    ctx->logger = logger;
    ctx->runner = BlastRunner(cli.get_string("-bin_dir"));
    ctx->num_threads = cli.get_int("-num_threads", 1);
    if (ctx->num_threads < 1) ctx->num_threads = 1;
    ctx->path_prefix = cli.get_string("-path_prefix");
    if (!ctx->path_prefix.empty() && ctx->path_prefix.back() == '/') {
        ctx->path_prefix.pop_back();
    }

    std::string error_msg;
    if (!ctx->databases.load(db_paths, logger, error_msg)) {
        std::fprintf(stderr, "Error: %s\n", error_msg.c_str());
        return 1;
    }
    logger.info("Will use %d thread(s) to run BLAST.", ctx->num_threads);

    HttpController controller(ctx);
    controller.register_routes();

    std::string listen_addr = cli.get_string("-listen", "0.0.0.0:4567");
    std::string host;
    uint16_t port;
    if (!parse_host_port(listen_addr, host, port)) {
        std::fprintf(stderr,
            "Error: invalid listen address '%s' (expected host:port)\n",
            listen_addr.c_str());
        return 1;
    }

    int threads = resolve_threads(cli, "-threads");

    drogon::app()
        .addListener(host, port)
        .setThreadNum(static_cast<size_t>(threads))
        .setLogLevel(verbose ? trantor::Logger::kDebug
                             : trantor::Logger::kWarn);

    std::string pid_file = cli.get_string("-pid");
    if (!pid_file.empty()) {
        FILE* f = std::fopen(pid_file.c_str(), "w");
        if (f) {
            std::fprintf(f, "%d\n", ::getpid());
            std::fclose(f);
        } else {
            logger.warn("Cannot write PID file %s", pid_file.c_str());
        }
    }

    logger.info("Starting HTTP server on %s:%u (threads: %d, databases: %zu)",
                host.c_str(), port, threads, ctx->databases.entries().size());
    if (!ctx->path_prefix.empty()) {
        logger.info("URL path prefix: %s", ctx->path_prefix.c_str());
    }

    // Run Drogon (blocks until shutdown via SIGTERM/SIGINT)
    drogon::app().run();

    if (!pid_file.empty()) {
        std::remove(pid_file.c_str());
    }

    return 0;
}
