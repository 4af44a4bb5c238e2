#include "scanner.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace apidoc_scan {

std::string scope_for(const fs::path& file) {
    return file.parent_path().filename().string();
}

bool is_versioned_dir(const fs::path& root, const fs::path& dir) {
    std::error_code ec;
    auto rel = fs::relative(dir, root, ec);
    const auto& shown = (ec || rel.empty()) ? dir : rel;
    return shown.generic_string().find("version") != std::string::npos;
}

apidoc::result<std::vector<document_source>>
collect_documents(const fs::path& root, bool include_versioned) {
    std::error_code ec;
    if (fs::is_regular_file(root, ec)) {
        return std::vector<document_source>{{root, scope_for(root)}};
    }
    if (!fs::is_directory(root, ec)) {
        return std::unexpected(ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory));
    }

    std::vector<document_source> docs;
    fs::recursive_directory_iterator it(root, ec);
    if (ec) {
        return std::unexpected(ec);
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return std::unexpected(ec);
        }
        const auto& entry = *it;
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        const auto& path = entry.path();
        if (path.extension() != ".md" || path.filename() == "README.md") {
            continue;
        }
        if (!include_versioned && is_versioned_dir(root, path.parent_path())) {
            continue;
        }
        docs.push_back({path, scope_for(path)});
    }
    if (ec) {
        return std::unexpected(ec);
    }

    std::sort(docs.begin(), docs.end(), [](const document_source& a, const document_source& b) {
        return a.path < b.path;
    });
    return docs;
}

apidoc::result<std::string> read_document(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        if (fs::is_directory(path, ec)) {
            return std::unexpected(std::make_error_code(std::errc::is_a_directory));
        }
        return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(std::make_error_code(std::errc::permission_denied));
    }
    std::string content;
    in.seekg(0, std::ios::end);
    auto size = in.tellg();
    if (size < 0) {
        return std::unexpected(std::make_error_code(std::errc::io_error));
    }
    content.resize(static_cast<size_t>(size));
    in.seekg(0, std::ios::beg);
    in.read(content.data(), static_cast<std::streamsize>(content.size()));
    if (!in) {
        return std::unexpected(std::make_error_code(std::errc::io_error));
    }
    return content;
}

} // namespace apidoc_scan
