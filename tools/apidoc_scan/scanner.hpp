#pragma once

#include "apidoc/core/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace apidoc_scan {

struct document_source {
    std::filesystem::path path;
    std::string scope;
};

// Scope of a page: the name of the directory it lives in.
std::string scope_for(const std::filesystem::path& file);

// True when `dir`, relative to `root`, mentions "version" (versioned copies
// of an API kept next to the current one).
bool is_versioned_dir(const std::filesystem::path& root, const std::filesystem::path& dir);

// Pages under `root` in sorted path order: *.md files except README.md,
// skipping versioned directories unless `include_versioned`.
apidoc::result<std::vector<document_source>>
collect_documents(const std::filesystem::path& root, bool include_versioned);

apidoc::result<std::string> read_document(const std::filesystem::path& path);

} // namespace apidoc_scan
