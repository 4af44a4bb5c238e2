#include "apidoc/core/diagnostic.hpp"
#include "apidoc/core/request_json.hpp"
#include "apidoc/core/request_parser.hpp"
#include "apidoc_scan/options.hpp"
#include "apidoc_scan/scanner.hpp"

#include <fstream>
#include <iostream>
#include <ostream>
#include <string>

namespace fs = std::filesystem;
using namespace apidoc_scan;

namespace {

int run_scan(const options& opts) {
    if (opts.input.empty()) {
        std::cerr << "[scan] input path is required\n";
        return 1;
    }

    auto docs = collect_documents(opts.input, opts.include_versioned);
    if (!docs) {
        std::cerr << "[scan] cannot read " << opts.input << ": " << docs.error().message() << "\n";
        return 1;
    }

    std::ofstream file_out;
    if (!opts.output.empty()) {
        file_out.open(opts.output, std::ios::binary);
        if (!file_out) {
            std::cerr << "[scan] failed to open " << opts.output << "\n";
            return 1;
        }
    }
    std::ostream& out = opts.output.empty() ? std::cout : file_out;

    const auto policy = to_parse_options(opts);
    const bool single_file = docs->size() == 1 && fs::is_regular_file(opts.input);

    size_t parsed = 0;
    size_t failed = 0;
    for (const auto& doc : *docs) {
        std::string scope = (single_file && !opts.scope.empty()) ? opts.scope : doc.scope;
        std::string label = scope + "/" + doc.path.filename().string();

        if (opts.verbose) {
            std::cerr << "[scan] parsing " << label << "\n";
        }

        auto text = read_document(doc.path);
        if (!text) {
            std::cerr << "[scan] failed to read " << doc.path << ": " << text.error().message()
                      << "\n";
            ++failed;
            if (!opts.keep_going) {
                return 1;
            }
            continue;
        }

        apidoc::parse_diagnostic diag;
        auto req = apidoc::parse_request(*text, scope, policy, &diag);
        if (!req) {
            std::cerr << "[parse] failed to parse " << label << ": "
                      << apidoc::format_diagnostic(req.error(), diag) << "\n";
            ++failed;
            if (!opts.keep_going) {
                return 1;
            }
            continue;
        }

        ++parsed;
        if (!opts.check_only) {
            out << apidoc::to_json(*req) << "\n";
        }
    }

    out.flush();
    if (opts.check_only) {
        std::cout << "[check] " << (failed == 0 ? "OK" : "FAILED") << ": parsed=" << parsed
                  << ", failed=" << failed << "\n";
    } else if (opts.verbose || failed != 0) {
        std::cerr << "[scan] " << (failed == 0 ? "OK" : "FAILED") << ": parsed=" << parsed
                  << ", failed=" << failed << "\n";
    }
    return failed == 0 ? 0 : 1;
}

} // namespace

int main(int argc, char** argv) {
    options opts = parse_args(argc, argv);
    if (opts.subcommand != "scan") {
        std::cerr << "Unknown subcommand: " << opts.subcommand << "\n";
        print_usage();
    }
    return run_scan(opts);
}
