#pragma once

#include <cstddef>
#include <string>
#include <vector>

std::string trim_text(const std::string& s);
std::string to_lower_copy(std::string s);

// UTF-8 helpers. Lengths and prefixes count code points; malformed lead
// bytes count as one code point each.
size_t utf8_char_len(unsigned char c);
size_t utf8_length(const std::string& s);
std::string utf8_prefix(const std::string& s, size_t max_code_points);
std::string sanitize_utf8_strict(const std::string& s);

// "/data/uploads/Policy.pdf" -> "Policy.pdf"
std::string path_basename(const std::string& path);

std::vector<std::string> split_comma_list(const std::string& s);
