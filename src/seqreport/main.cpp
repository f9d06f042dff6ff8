#include "io/blast_runner.hpp"
#include "io/report_reader.hpp"
#include "query/option_validator.hpp"
#include "query/query_normalizer.hpp"
#include "report/hyperlink_resolver.hpp"
#include "report/report_rewriter.hpp"
#include "core/version.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

using namespace seqreport;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options]\n"
        "\n"
        "Input (one required):\n"
        "  -report <path>          Saved BLAST HTML report (- for stdin)\n"
        "  -query <path>           Query FASTA/raw sequence; runs BLAST (- for stdin)\n"
        "\n"
        "Options:\n"
        "  -db <path>              BLAST DB searched (repeatable; used in links)\n"
        "  -method <name>          blastn, blastp, blastx, tblastn or tblastx (with -query)\n"
        "  --advanced=<options>    Extra BLAST options (with -query)\n"
        "  -bin_dir <dir>          Directory of the BLAST+ executables (default: PATH)\n"
        "  -num_threads <int>      Threads for BLAST (default: 1)\n"
        "  -url_prefix <prefix>    Prefix for generated links (e.g., /blast)\n"
        "  -o <path>               Output HTML file (default: stdout)\n"
        "  -v, --verbose           Verbose logging\n",
        prog);
}

static bool read_text(const std::string& path, std::string& text) {
    if (path == "-") {
        text.assign(std::istreambuf_iterator<char>(std::cin),
                    std::istreambuf_iterator<char>());
        return true;
    }
    std::ifstream in(path);
    if (!in.is_open()) return false;
    text.assign(std::istreambuf_iterator<char>(in),
                std::istreambuf_iterator<char>());
    return true;
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv);

    if (check_version(cli, "seqreport")) return 0;

    if (cli.has("-h") || cli.has("--help")) {
        print_usage(argv[0]);
        return 0;
    }

    bool has_report = cli.has("-report");
    bool has_query = cli.has("-query");
    if (has_report == has_query) {
        std::fprintf(stderr, "Error: exactly one of -report or -query is required\n");
        print_usage(argv[0]);
        return 1;
    }

    Logger logger = make_logger(cli);
    std::vector<std::string> databases = cli.get_list("-db");
    std::vector<std::string> report;

    if (has_report) {
        std::string path = cli.get_string("-report");
        std::string error_msg;
        if (!read_report(path, report, error_msg)) {
            std::fprintf(stderr, "Error: %s\n", error_msg.c_str());
            return 1;
        }
        logger.info("Read %zu line(s) from %s", report.size(),
                    path == "-" ? "stdin" : path.c_str());
    } else {
        if (databases.empty()) {
            std::fprintf(stderr, "Error: -query requires at least one -db\n");
            return 1;
        }

        AlignmentRequest req;
        req.method = cli.get_string("-method");
        std::string error_msg;
        if (!validate_method(req.method, error_msg)) {
            std::fprintf(stderr, "Error: %s\n", error_msg.c_str());
            return 1;
        }
        std::string advanced = cli.get_string("--advanced");
        if (!validate_advanced_options(advanced, error_msg)) {
            std::fprintf(stderr, "Error: %s\n", error_msg.c_str());
            return 1;
        }

        std::string query_path = cli.get_string("-query");
        std::string raw;
        if (!read_text(query_path, raw)) {
            std::fprintf(stderr, "Error: cannot open %s\n", query_path.c_str());
            return 1;
        }
        req.query = to_fasta(raw);
        if (req.query.empty()) {
            std::fprintf(stderr, "Error: no input sequence provided\n");
            return 1;
        }

        int num_threads = cli.get_int("-num_threads", 1);
        if (num_threads < 1) num_threads = 1;
        req.databases = databases;
        req.advanced_options =
            prepare_advanced_options(req.method, advanced, num_threads);

        BlastRunner runner(cli.get_string("-bin_dir"));
        logger.info("Running: %s", runner.command(req).c_str());
        AlignmentResult result = runner.run(req);
        if (!result.success) {
            std::fprintf(stderr, "Error: BLAST failed (%d): %s\n",
                         result.error_status, result.error_message.c_str());
            return 1;
        }
        report = std::move(result.lines);
    }

    HyperlinkResolver resolver(HyperlinkStrategies{},
                               cli.get_string("-url_prefix"), logger);
    ReportRewriter rewriter(resolver, logger);
    RenderedReport rendered = rewriter.render(make_report_lines(report), databases);
    logger.info("Rendered %zu query block(s), %zu hit(s), %zu linked",
                rendered.queries.size(), rendered.hit_count,
                rendered.retrievable_ids.size());

    std::string output_path = cli.get_string("-o");
    if (output_path.empty()) {
        std::cout << rendered.html << '\n';
    } else {
        std::ofstream out(output_path);
        if (!out.is_open()) {
            std::fprintf(stderr, "Error: cannot open output file %s\n",
                         output_path.c_str());
            return 1;
        }
        out << rendered.html << '\n';
    }
    return 0;
}
