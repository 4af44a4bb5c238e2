#include "apidoc/core/request_json.hpp"

#include "apidoc/core/serde.hpp"

#include <sstream>

namespace apidoc {

namespace {

using serde::escape_json_string;

void write_response(std::ostringstream& os, const response& r);

void write_field(std::ostringstream& os, const response_field& f) {
    os << "{";
    os << "\"key\":\"" << escape_json_string(f.key) << "\",";
    os << "\"kind\":\"" << field_kind_name(f.kind()) << "\",";
    os << "\"nested\":";
    if (const auto* nested = f.nested()) {
        write_response(os, *nested);
    } else {
        os << "null";
    }
    os << "}";
}

void write_response(std::ostringstream& os, const response& r) {
    os << "{\"fields\":{";
    bool first = true;
    for (const auto& f : r.fields()) {
        if (!first) {
            os << ",";
        }
        first = false;
        os << "\"" << escape_json_string(f.key) << "\":";
        write_field(os, f);
    }
    os << "}}";
}

void write_parameter(std::ostringstream& os, const parameter& p) {
    os << "{";
    os << "\"name\":\"" << escape_json_string(p.name) << "\",";
    os << "\"type\":";
    if (p.type) {
        os << "\"" << type_tag_name(*p.type) << "\"";
    } else {
        os << "null";
    }
    os << ",";
    os << "\"doc\":\"" << escape_json_string(p.doc) << "\",";
    os << "\"presence\":\"" << presence_name(p.kind) << "\"";
    os << "}";
}

} // namespace

std::string to_json(const parameter& p) {
    std::ostringstream os;
    write_parameter(os, p);
    return os.str();
}

std::string to_json(const response& r) {
    std::ostringstream os;
    write_response(os, r);
    return os.str();
}

std::string to_json(const request& req) {
    std::ostringstream os;
    os << "{";
    os << "\"action\":\"" << escape_json_string(req.action) << "\",";
    os << "\"resource\":\"" << escape_json_string(req.resource) << "\",";
    os << "\"doc\":\"" << escape_json_string(req.doc) << "\",";
    os << "\"scope\":\"" << escape_json_string(req.scope) << "\",";
    os << "\"version\":" << req.version << ",";
    os << "\"permissions\":";
    if (req.permissions) {
        os << "\"" << escape_json_string(*req.permissions) << "\"";
    } else {
        os << "null";
    }
    os << ",";

    os << "\"params\":[";
    bool first_param = true;
    for (const auto& p : req.params) {
        if (!first_param) {
            os << ",";
        }
        first_param = false;
        write_parameter(os, p);
    }
    os << "],";

    os << "\"sample_params\":\"" << escape_json_string(req.sample_params) << "\",";
    os << "\"success_response\":";
    write_response(os, req.success_response);
    os << ",\"error_response\":";
    write_response(os, req.error_response);
    os << "}";
    return os.str();
}

} // namespace apidoc
