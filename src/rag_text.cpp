#include "rag_text.h"

#include <cctype>

namespace {

bool is_utf8_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

} // namespace

std::string trim_text(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string to_lower_copy(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

size_t utf8_char_len(unsigned char c) {
    if (c < 0x80) return 1;
    if ((c >> 5) == 0x6) return 2;
    if ((c >> 4) == 0xE) return 3;
    if ((c >> 3) == 0x1E) return 4;
    return 1;
}

size_t utf8_length(const std::string& s) {
    size_t n = 0;
    for (size_t i = 0; i < s.size();) {
        size_t len = utf8_char_len(static_cast<unsigned char>(s[i]));
        if (i + len > s.size()) len = 1;
        i += len;
        ++n;
    }
    return n;
}

std::string utf8_prefix(const std::string& s, size_t max_code_points) {
    size_t i = 0;
    size_t n = 0;
    while (i < s.size() && n < max_code_points) {
        size_t len = utf8_char_len(static_cast<unsigned char>(s[i]));
        if (i + len > s.size()) len = 1;
        i += len;
        ++n;
    }
    return s.substr(0, i);
}

std::string sanitize_utf8_strict(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    auto is_cont = [&](size_t i) { return i < s.size() && is_utf8_continuation(static_cast<unsigned char>(s[i])); };
    for (size_t i = 0; i < s.size();) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
            ++i;
            continue;
        }

        size_t len = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c == 0xE0) {
            len = 3;
            lo = 0xA0;
        } else if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) {
            len = 3;
        } else if (c == 0xED) {
            // excludes UTF-16 surrogates
            len = 3;
            hi = 0x9F;
        } else if (c == 0xF0) {
            len = 4;
            lo = 0x90;
        } else if (c >= 0xF1 && c <= 0xF3) {
            len = 4;
        } else if (c == 0xF4) {
            len = 4;
            hi = 0x8F;
        }

        bool ok = len > 0 && i + len <= s.size();
        if (ok) {
            unsigned char c1 = static_cast<unsigned char>(s[i + 1]);
            ok = c1 >= lo && c1 <= hi;
            for (size_t k = 2; ok && k < len; ++k) ok = is_cont(i + k);
        }
        if (ok) {
            out.append(s, i, len);
            i += len;
        } else {
            out.push_back('?');
            ++i;
        }
    }
    return out;
}

std::string path_basename(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    if (pos == std::string::npos) return path;
    return path.substr(pos + 1);
}

std::vector<std::string> split_comma_list(const std::string& s) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= s.size()) {
        size_t comma = s.find(',', start);
        if (comma == std::string::npos) comma = s.size();
        std::string item = trim_text(s.substr(start, comma - start));
        if (!item.empty()) out.push_back(std::move(item));
        start = comma + 1;
    }
    return out;
}
