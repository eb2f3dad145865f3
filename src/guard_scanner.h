#pragma once

#include "guard_patterns.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

struct ScanVerdict {
    bool flagged = false;
    std::optional<GuardCategory> category;
    std::string matched_text;  // at most 100 code points, "..." appended when cut
    std::string message;
    std::string rule;          // operator logs only, never shown to the user
};

struct ScanOptions {
    size_t max_len = 4000;
    size_t repetition_min_len = 100;
    double repetition_max_share = 0.4;
    size_t excerpt_max_chars = 100;
};

class InputScanner {
public:
    explicit InputScanner(const PatternCatalog& catalog, ScanOptions opt = ScanOptions());

    ScanVerdict scan(const std::string& raw_text) const;
    ScanVerdict scan(const std::string& raw_text, size_t max_len) const;

    const ScanOptions& options() const { return opt_; }

private:
    const PatternCatalog& catalog_;
    ScanOptions opt_;
};

// What the end user sees: the category label and the matched excerpt only.
std::string rejection_message(const ScanVerdict& verdict);
nlohmann::json verdict_to_json(const ScanVerdict& verdict, bool include_rule = false);
