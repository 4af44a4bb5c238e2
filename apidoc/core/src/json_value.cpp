#include "apidoc/core/json_value.hpp"

#include "apidoc/core/serde.hpp"

#include <optional>

namespace apidoc::json {

namespace {

using serde::json_cursor;

constexpr int kMaxDepth = 128;

class decoder {
public:
    explicit decoder(std::string_view text) : cur_{text.data(), text.data() + text.size()} {}

    std::optional<value> run() {
        auto v = parse_value(0);
        if (!v) {
            return std::nullopt;
        }
        cur_.skip_ws();
        if (!cur_.eof()) {
            return error("unexpected trailing characters");
        }
        return v;
    }

    decode_error take_error() { return std::move(error_); }

private:
    std::nullopt_t error(std::string_view message) {
        if (error_.message.empty()) {
            error_.offset = cur_.pos();
            error_.message.assign(message.begin(), message.end());
        }
        return std::nullopt;
    }

    std::optional<value> parse_value(int depth) {
        if (depth > kMaxDepth) {
            return error("nesting too deep");
        }
        cur_.skip_ws();
        switch (cur_.peek()) {
        case '{':
            return parse_object(depth);
        case '[':
            return parse_array(depth);
        case '\"': {
            auto s = parse_string();
            if (!s) {
                return std::nullopt;
            }
            return value::string_value(std::move(*s));
        }
        case 't':
            if (cur_.consume_literal("true")) {
                return value::bool_value(true);
            }
            return error("invalid literal");
        case 'f':
            if (cur_.consume_literal("false")) {
                return value::bool_value(false);
            }
            return error("invalid literal");
        case 'n':
            if (cur_.consume_literal("null")) {
                return value::null_value();
            }
            return error("invalid literal");
        case '\0':
            if (cur_.eof()) {
                return error("unexpected end of input");
            }
            return error("unexpected character");
        default: {
            auto lexeme = cur_.number();
            if (!lexeme) {
                return error("unexpected character");
            }
            return value::number_value(std::string(*lexeme));
        }
        }
    }

    std::optional<std::string> parse_string() {
        auto raw = cur_.string();
        if (!raw) {
            return error("malformed string");
        }
        auto decoded = serde::unescape_json_string(*raw);
        if (!decoded) {
            return error("invalid escape sequence");
        }
        return decoded;
    }

    std::optional<value> parse_object(int depth) {
        cur_.try_object_start();
        value obj = value::object_value();
        if (cur_.try_object_end()) {
            return obj;
        }
        while (true) {
            cur_.skip_ws();
            if (cur_.peek() != '\"') {
                return error("expected object key");
            }
            auto key = parse_string();
            if (!key) {
                return std::nullopt;
            }
            if (!cur_.consume(':')) {
                return error("expected ':' after object key");
            }
            auto member = parse_value(depth + 1);
            if (!member) {
                return std::nullopt;
            }
            obj.object.emplace_back(std::move(*key), std::make_unique<value>(std::move(*member)));
            if (cur_.try_comma()) {
                continue;
            }
            if (cur_.try_object_end()) {
                return obj;
            }
            return error("expected ',' or '}' in object");
        }
    }

    std::optional<value> parse_array(int depth) {
        cur_.try_array_start();
        value arr = value::array_value();
        if (cur_.try_array_end()) {
            return arr;
        }
        while (true) {
            auto element = parse_value(depth + 1);
            if (!element) {
                return std::nullopt;
            }
            arr.array.push_back(std::make_unique<value>(std::move(*element)));
            if (cur_.try_comma()) {
                continue;
            }
            if (cur_.try_array_end()) {
                return arr;
            }
            return error("expected ',' or ']' in array");
        }
    }

    json_cursor cur_;
    decode_error error_;
};

} // namespace

const char* kind_name(value::kind k) noexcept {
    switch (k) {
    case value::kind::null:
        return "null";
    case value::kind::boolean:
        return "boolean";
    case value::kind::number:
        return "number";
    case value::kind::string:
        return "string";
    case value::kind::object:
        return "object";
    case value::kind::array:
        return "array";
    }
    return "unknown";
}

result<value> decode(std::string_view text, decode_error* err) {
    decoder d(text);
    auto v = d.run();
    if (!v) {
        if (err) {
            *err = d.take_error();
        }
        return std::unexpected(make_error_code(error_code::invalid_json));
    }
    return std::move(*v);
}

} // namespace apidoc::json
