#pragma once

#include <cstdint>
#include <optional>
#include <string>

int64_t now_ms_epoch();

// "req-<epoch ms>-<counter>", unique within the process.
std::string make_request_id();

std::optional<int> parse_int(const std::string& s);
std::optional<double> parse_double(const std::string& s);

bool getenv_int(const char* name, int* out);
bool getenv_double(const char* name, double* out);
bool getenv_string(const char* name, std::string* out);

std::string sanitize_for_log(const std::string& s);
std::string truncate_for_log(const std::string& s, size_t max_len);

// One line per event on stderr: "[<epoch ms>] <tag> <msg>".
void log_event(const std::string& tag, const std::string& msg);
