#include "json_utils.h"

#include <fstream>

using nlohmann::json;

json make_error(int status, const std::string& message) {
    return {
        {"error", {
            {"code", status},
            {"message", message}
        }}
    };
}

std::string dump_json_safe(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

bool parse_json_body(const std::string& body, json* out, std::string* err) {
    if (!out) return false;
    try {
        *out = json::parse(body);
    } catch (const std::exception& e) {
        if (err) *err = std::string("Invalid JSON: ") + e.what();
        return false;
    }
    return true;
}

bool read_json_file(const std::string& path, json* out, std::string* err) {
    if (!out) return false;
    std::ifstream ifs(path);
    if (!ifs) {
        if (err) *err = "cannot open " + path;
        return false;
    }
    try {
        ifs >> *out;
    } catch (const std::exception& e) {
        if (err) *err = "parse " + path + ": " + e.what();
        return false;
    }
    return true;
}
