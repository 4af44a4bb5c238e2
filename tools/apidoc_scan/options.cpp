#include "options.hpp"

#include <cstdlib>
#include <iostream>
#include <string_view>

namespace apidoc_scan {

apidoc::parse_options to_parse_options(const options& opts) {
    apidoc::parse_options po;
    po.allow_missing_param_description = !opts.strict_params;
    po.accept_v2 = !opts.v3_only;
    po.require_v3_permissions = !opts.allow_v3_without_permissions;
    po.ignore_null_array_elements = opts.ignore_null_items;
    return po;
}

[[noreturn]] void print_usage() {
    std::cout << R"(apidoc_scan: API documentation page parser

Usage:
  apidoc_scan scan -i <dir|file> [options]
  apidoc_scan examples

Options:
  -i, --input <path>                 Documentation tree or a single .md page
  -o, --output <file>                Write JSON lines to a file (default: stdout)
  --scope <name>                     Scope for a single-file input (default: parent dir name)
  --include-versioned                Also parse pages under directories named *version*
  --keep-going                       Report every failing page instead of stopping at the first
  --check                            Parse only, print a summary instead of JSON
  --verbose                          Log every page as it is parsed
  --strict-params                    Require "` - " between a parameter and its description
  --v3-only                          Reject version 2 pages
  --allow-v3-without-permissions     Do not require a Permission section in version 3 pages
  --ignore-null-items                Ignore null elements when classifying sample arrays
  -h, --help                         Show this help
)";
    std::exit(1);
}

[[noreturn]] void print_examples() {
    std::cout << R"(apidoc_scan examples:

  # Dump every page of a checked-out documentation tree as JSON lines
  apidoc_scan scan -i repos > requests.jsonl

  # Validate a tree, listing every broken page
  apidoc_scan scan -i repos --check --keep-going

  # Parse one page with an explicit scope
  apidoc_scan scan -i repos/student-details/getStudent.md --scope student-details
)";
    std::exit(0);
}

options parse_args(int argc, char** argv) {
    options opts;
    if (argc < 2) {
        print_usage();
    }
    opts.subcommand = argv[1];
    if (opts.subcommand == "-h" || opts.subcommand == "--help") {
        print_usage();
    }
    if (opts.subcommand == "examples") {
        print_examples();
    }
    for (int i = 2; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage();
        } else if (arg == "-i" || arg == "--input") {
            if (i + 1 >= argc) {
                print_usage();
            }
            opts.input = argv[++i];
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 >= argc) {
                print_usage();
            }
            opts.output = argv[++i];
        } else if (arg == "--scope") {
            if (i + 1 >= argc) {
                print_usage();
            }
            opts.scope = argv[++i];
        } else if (arg == "--include-versioned") {
            opts.include_versioned = true;
        } else if (arg == "--keep-going") {
            opts.keep_going = true;
        } else if (arg == "--check") {
            opts.check_only = true;
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--strict-params") {
            opts.strict_params = true;
        } else if (arg == "--v3-only") {
            opts.v3_only = true;
        } else if (arg == "--allow-v3-without-permissions") {
            opts.allow_v3_without_permissions = true;
        } else if (arg == "--ignore-null-items") {
            opts.ignore_null_items = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
        }
    }
    return opts;
}

} // namespace apidoc_scan
