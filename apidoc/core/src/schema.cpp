#include "apidoc/core/schema.hpp"

#include <algorithm>
#include <utility>

namespace apidoc {

const char* field_kind_name(field_kind k) noexcept {
    switch (k) {
    case field_kind::primitive:
        return "primitive";
    case field_kind::array:
        return "array";
    case field_kind::object:
        return "object";
    }
    return "unknown";
}

bool response::empty() const noexcept {
    return fields_.empty();
}

size_t response::size() const noexcept {
    return fields_.size();
}

const std::vector<response_field>& response::fields() const noexcept {
    return fields_;
}

const response_field* response::find(std::string_view key) const noexcept {
    auto it = std::find_if(
        fields_.begin(), fields_.end(), [key](const response_field& f) { return f.key == key; });
    return it == fields_.end() ? nullptr : &*it;
}

void response::set(response_field field) {
    auto it = std::find_if(fields_.begin(), fields_.end(), [&](const response_field& f) {
        return f.key == field.key;
    });
    if (it != fields_.end()) {
        *it = std::move(field);
        return;
    }
    fields_.push_back(std::move(field));
}

bool response::operator==(const response& other) const {
    return fields_ == other.fields_;
}

const response* response_field::nested() const noexcept {
    if (const auto* arr = std::get_if<array_field>(&shape)) {
        return arr->items ? &*arr->items : nullptr;
    }
    if (const auto* obj = std::get_if<object_field>(&shape)) {
        return &obj->members;
    }
    return nullptr;
}

response_field response_field::primitive(std::string key) {
    return response_field{std::move(key), primitive_field{}};
}

response_field response_field::array(std::string key, std::optional<response> items) {
    return response_field{std::move(key), array_field{std::move(items)}};
}

response_field response_field::object(std::string key, response members) {
    return response_field{std::move(key), object_field{std::move(members)}};
}

bool equivalent(const response& a, const response& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (const auto& fa : a.fields()) {
        const auto* fb = b.find(fa.key);
        if (!fb || fb->kind() != fa.kind()) {
            return false;
        }
        const auto* na = fa.nested();
        const auto* nb = fb->nested();
        if ((na == nullptr) != (nb == nullptr)) {
            return false;
        }
        if (na && !equivalent(*na, *nb)) {
            return false;
        }
    }
    return true;
}

namespace {

std::string join_path(std::string_view prefix, std::string_view key) {
    if (prefix.empty()) {
        return std::string(key);
    }
    std::string out(prefix);
    out.push_back('.');
    out.append(key);
    return out;
}

result<response> unify_at(const response& a,
                          const response& b,
                          std::string_view path,
                          parse_diagnostic* diag) {
    response out = a;

    for (const auto& fb : b.fields()) {
        const auto* fa = a.find(fb.key);
        if (!fa) {
            out.set(fb);
            continue;
        }

        if (fa->kind() != fb.kind()) {
            return fail(error_code::conflicting_field_type,
                        diag,
                        "field '" + join_path(path, fb.key) + "' is " + field_kind_name(fa->kind()) +
                            " in one sample and " + field_kind_name(fb.kind()) + " in another");
        }

        switch (fb.kind()) {
        case field_kind::primitive:
            break;
        case field_kind::object: {
            auto merged = unify_at(std::get<object_field>(fa->shape).members,
                                   std::get<object_field>(fb.shape).members,
                                   join_path(path, fb.key),
                                   diag);
            if (!merged) {
                return std::unexpected(merged.error());
            }
            out.set(response_field::object(fb.key, std::move(*merged)));
            break;
        }
        case field_kind::array: {
            const auto& items_a = std::get<array_field>(fa->shape).items;
            const auto& items_b = std::get<array_field>(fb.shape).items;
            if (!items_b) {
                break;
            }
            if (!items_a) {
                out.set(fb);
                break;
            }
            auto merged = unify_at(*items_a, *items_b, join_path(path, fb.key), diag);
            if (!merged) {
                return std::unexpected(merged.error());
            }
            out.set(response_field::array(fb.key, std::move(*merged)));
            break;
        }
        }
    }

    return out;
}

} // namespace

result<response> unify(const response& a, const response& b, parse_diagnostic* diag) {
    return unify_at(a, b, {}, diag);
}

} // namespace apidoc
