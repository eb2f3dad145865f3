#include "guard_scanner.h"

#include "rag_text.h"

#include <unordered_map>

using nlohmann::json;

namespace {

const char kOverflowMessage[] = "Input too long (possible overflow attack)";
const char kRepetitionMessage[] = "Suspicious repetition detected (possible denial-of-service attack)";

ScanVerdict make_flag(GuardCategory category, std::string message) {
    ScanVerdict v;
    v.flagged = true;
    v.category = category;
    v.message = std::move(message);
    return v;
}

// Share of the most frequent code point in the text.
double max_char_share(const std::string& text, size_t total) {
    if (total == 0) return 0.0;
    std::unordered_map<std::string, size_t> counts;
    size_t best = 0;
    for (size_t i = 0; i < text.size();) {
        size_t len = utf8_char_len(static_cast<unsigned char>(text[i]));
        if (i + len > text.size()) len = 1;
        size_t n = ++counts[text.substr(i, len)];
        if (n > best) best = n;
        i += len;
    }
    return static_cast<double>(best) / static_cast<double>(total);
}

} // namespace

InputScanner::InputScanner(const PatternCatalog& catalog, ScanOptions opt)
    : catalog_(catalog), opt_(opt) {}

ScanVerdict InputScanner::scan(const std::string& raw_text) const {
    return scan(raw_text, opt_.max_len);
}

ScanVerdict InputScanner::scan(const std::string& raw_text, size_t max_len) const {
    const std::string text = trim_text(raw_text);
    if (text.empty()) return ScanVerdict();

    const size_t length = utf8_length(text);
    if (length > max_len) {
        return make_flag(GuardCategory::InputOverflow, kOverflowMessage);
    }

    if (length > opt_.repetition_min_len && max_char_share(text, length) > opt_.repetition_max_share) {
        return make_flag(GuardCategory::RepetitionAttack, kRepetitionMessage);
    }

    for (const auto& cat : catalog_.categories()) {
        for (const auto& rule : cat.rules) {
            std::smatch m;
            if (!std::regex_search(text, m, rule.regex)) continue;

            const std::string matched = m.str(0);
            std::string excerpt = utf8_prefix(matched, opt_.excerpt_max_chars);
            if (excerpt.size() < matched.size()) excerpt += "...";

            ScanVerdict v = make_flag(cat.category,
                                      std::string(category_label(cat.category)) + " detected: '" + excerpt + "'");
            v.matched_text = std::move(excerpt);
            v.rule = rule.pattern;
            return v;
        }
    }
    return ScanVerdict();
}

std::string rejection_message(const ScanVerdict& verdict) {
    if (!verdict.flagged) return {};
    return "Input rejected: " + verdict.message;
}

json verdict_to_json(const ScanVerdict& verdict, bool include_rule) {
    json out = {
        {"flagged", verdict.flagged},
        {"category", nullptr},
        {"label", nullptr},
        {"matched_text", sanitize_utf8_strict(verdict.matched_text)},
        {"message", sanitize_utf8_strict(verdict.message)}
    };
    if (verdict.category) {
        out["category"] = category_id(*verdict.category);
        out["label"] = category_label(*verdict.category);
    }
    if (include_rule && !verdict.rule.empty()) out["rule"] = verdict.rule;
    return out;
}
