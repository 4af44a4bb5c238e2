#include "apidoc/core/schema_infer.hpp"

#include <set>
#include <string>
#include <utility>
#include <vector>

namespace apidoc {

namespace {

using json::value;

std::string member_path(std::string_view prefix, std::string_view key) {
    if (prefix.empty()) {
        return std::string(key);
    }
    std::string out(prefix);
    out.push_back('.');
    out.append(key);
    return out;
}

result<response> infer_object(const value& obj,
                              std::string_view path,
                              const parse_options& opts,
                              parse_diagnostic* diag);

result<response> fold_elements(const std::vector<const value*>& elements,
                               std::string_view path,
                               const parse_options& opts,
                               parse_diagnostic* diag) {
    response merged;
    for (const auto* element : elements) {
        auto inferred = infer_object(*element, path, opts, diag);
        if (!inferred) {
            return inferred;
        }
        auto unified = unify(merged, *inferred, diag);
        if (!unified) {
            return unified;
        }
        merged = std::move(*unified);
    }
    return merged;
}

result<response_field> infer_array(const std::string& key,
                                   const value& arr,
                                   std::string_view path,
                                   const parse_options& opts,
                                   parse_diagnostic* diag) {
    std::vector<const value*> elements;
    std::set<value::kind> kinds;
    for (const auto& element : arr.array) {
        if (opts.ignore_null_array_elements && element->k == value::kind::null) {
            continue;
        }
        elements.push_back(element.get());
        kinds.insert(element->k);
    }

    if (elements.empty()) {
        return response_field::array(key);
    }

    if (kinds.size() == 1) {
        value::kind only = *kinds.begin();
        if (only == value::kind::object) {
            auto items = fold_elements(elements, path, opts, diag);
            if (!items) {
                return std::unexpected(items.error());
            }
            return response_field::array(key, std::move(*items));
        }
        if (only != value::kind::array) {
            return response_field::array(key);
        }
    }

    std::string found;
    for (auto k : kinds) {
        if (!found.empty()) {
            found += ", ";
        }
        found += json::kind_name(k);
    }
    return fail(error_code::heterogeneous_array,
                diag,
                "array '" + std::string(path) + "' has elements of kind " + found);
}

result<response> infer_object(const value& obj,
                              std::string_view path,
                              const parse_options& opts,
                              parse_diagnostic* diag) {
    response out;
    for (const auto& [key, member] : obj.object) {
        auto child_path = member_path(path, key);
        if (member->is_object()) {
            auto nested = infer_object(*member, child_path, opts, diag);
            if (!nested) {
                return nested;
            }
            out.set(response_field::object(key, std::move(*nested)));
        } else if (member->is_array()) {
            auto field = infer_array(key, *member, child_path, opts, diag);
            if (!field) {
                return std::unexpected(field.error());
            }
            out.set(std::move(*field));
        } else {
            out.set(response_field::primitive(key));
        }
    }
    return out;
}

} // namespace

result<response> infer_schema(const json::value& root,
                              const parse_options& opts,
                              parse_diagnostic* diag) {
    if (root.is_object()) {
        return infer_object(root, {}, opts, diag);
    }
    if (root.is_array()) {
        std::vector<const value*> elements;
        elements.reserve(root.array.size());
        for (const auto& element : root.array) {
            if (!element->is_object()) {
                return fail(error_code::unsupported_root_shape,
                            diag,
                            std::string("root array contains ") + json::kind_name(element->k));
            }
            elements.push_back(element.get());
        }
        return fold_elements(elements, {}, opts, diag);
    }
    return fail(error_code::unsupported_root_shape,
                diag,
                std::string("root is ") + json::kind_name(root.k));
}

result<response> infer_schema_from_text(std::string_view json_text,
                                        const parse_options& opts,
                                        parse_diagnostic* diag) {
    json::decode_error err;
    auto decoded = json::decode(json_text, &err);
    if (!decoded) {
        set_detail(diag, err.message + " at offset " + std::to_string(err.offset));
        return std::unexpected(decoded.error());
    }
    return infer_schema(*decoded, opts, diag);
}

} // namespace apidoc
