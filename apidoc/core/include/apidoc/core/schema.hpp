#pragma once

#include "diagnostic.hpp"
#include "result.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace apidoc {

enum class field_kind : uint8_t { primitive, array, object };

const char* field_kind_name(field_kind k) noexcept;

struct response_field;

// Ordered key -> field mapping inferred from one or more JSON samples.
// Keys are unique and keep the order in which they were first seen.
class response {
public:
    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] size_t size() const noexcept;
    [[nodiscard]] const std::vector<response_field>& fields() const noexcept;
    [[nodiscard]] const response_field* find(std::string_view key) const noexcept;

    // Inserts `field`, or replaces the field with the same key in place.
    void set(response_field field);

    bool operator==(const response& other) const;

private:
    std::vector<response_field> fields_;
};

struct primitive_field {
    bool operator==(const primitive_field&) const = default;
};

// Array of primitives, or of an empty sample, has no items schema.
struct array_field {
    std::optional<response> items;
    bool operator==(const array_field&) const = default;
};

struct object_field {
    response members;
    bool operator==(const object_field&) const = default;
};

// Alternative order matches field_kind.
using field_shape = std::variant<primitive_field, array_field, object_field>;

struct response_field {
    std::string key;
    field_shape shape;

    [[nodiscard]] field_kind kind() const noexcept {
        return static_cast<field_kind>(shape.index());
    }

    // Items of an array or members of an object, if any.
    [[nodiscard]] const response* nested() const noexcept;

    static response_field primitive(std::string key);
    static response_field array(std::string key, std::optional<response> items = std::nullopt);
    static response_field object(std::string key, response members);

    bool operator==(const response_field&) const = default;
};

// Structural equality ignoring key order at every level.
bool equivalent(const response& a, const response& b);

// Key-set union of two schemas. A key on both sides must have the same kind
// (conflicting_field_type otherwise); nested schemas are unified recursively
// and an array without items never conflicts with one that has them.
result<response> unify(const response& a, const response& b, parse_diagnostic* diag = nullptr);

} // namespace apidoc
