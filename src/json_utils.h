#pragma once

#include <nlohmann/json.hpp>

#include <string>

nlohmann::json make_error(int status, const std::string& message);

// Invalid UTF-8 is replaced instead of throwing.
std::string dump_json_safe(const nlohmann::json& j);

bool parse_json_body(const std::string& body, nlohmann::json* out, std::string* err);
bool read_json_file(const std::string& path, nlohmann::json* out, std::string* err);
