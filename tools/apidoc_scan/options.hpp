#pragma once

#include "apidoc/core/parse_options.hpp"

#include <filesystem>
#include <string>

namespace apidoc_scan {

struct options {
    std::string subcommand;
    std::filesystem::path input;
    std::filesystem::path output;   // empty: stdout
    std::string scope;              // single-file input only; default: parent directory name
    bool include_versioned = false; // also parse directories whose path mentions "version"
    bool keep_going = false;
    bool check_only = false;
    bool verbose = false;

    // parser policies
    bool strict_params = false;
    bool v3_only = false;
    bool allow_v3_without_permissions = false;
    bool ignore_null_items = false;
};

apidoc::parse_options to_parse_options(const options& opts);

[[noreturn]] void print_usage();
[[noreturn]] void print_examples();
options parse_args(int argc, char** argv);

} // namespace apidoc_scan
