#pragma once

#include "result.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace apidoc::json {

// Decoded sample payload. Numbers keep their lexeme; schema inference only
// needs to know that a value is a number.
struct value {
    enum class kind { null, boolean, number, string, object, array };

    kind k{kind::null};
    bool boolean = false;
    std::string scalar; // number lexeme or decoded string
    std::vector<std::pair<std::string, std::unique_ptr<value>>> object;
    std::vector<std::unique_ptr<value>> array;

    [[nodiscard]] bool is_object() const noexcept { return k == kind::object; }
    [[nodiscard]] bool is_array() const noexcept { return k == kind::array; }

    static value null_value() { return value{}; }

    static value bool_value(bool b) {
        value v;
        v.k = kind::boolean;
        v.boolean = b;
        return v;
    }

    static value number_value(std::string lexeme) {
        value v;
        v.k = kind::number;
        v.scalar = std::move(lexeme);
        return v;
    }

    static value string_value(std::string s) {
        value v;
        v.k = kind::string;
        v.scalar = std::move(s);
        return v;
    }

    static value object_value() {
        value v;
        v.k = kind::object;
        return v;
    }

    static value array_value() {
        value v;
        v.k = kind::array;
        return v;
    }
};

const char* kind_name(value::kind k) noexcept;

struct decode_error {
    size_t offset = 0;
    std::string message;
};

// Strict RFC 8259 decoding of a complete document. Trailing non-whitespace is
// an error. Fails with error_code::invalid_json; `err` receives the offset.
result<value> decode(std::string_view text, decode_error* err = nullptr);

} // namespace apidoc::json
