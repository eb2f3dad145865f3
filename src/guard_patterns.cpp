#include "guard_patterns.h"

#include "guard_rules_embedded.h"
#include "json_utils.h"

#include <algorithm>
#include <stdexcept>

using nlohmann::json;

namespace {

// std::regex backtracks one stack frame per repeated character, so a `*`, `+`
// or `{n,}` over a long run of input overflows the stack. Every rule must
// bound its repetitions.
bool has_unbounded_repeat(const std::string& pattern) {
    bool in_class = false;
    for (size_t i = 0; i < pattern.size(); ++i) {
        const char c = pattern[i];
        if (c == '\\') {
            ++i;
            continue;
        }
        if (in_class) {
            if (c == ']') in_class = false;
            continue;
        }
        if (c == '[') {
            in_class = true;
            if (i + 1 < pattern.size() && pattern[i + 1] == '^') ++i;
            continue;
        }
        if (c == '*' || c == '+') return true;
        if (c == '{') {
            const size_t close = pattern.find('}', i);
            if (close != std::string::npos && close > i + 1 && pattern[close - 1] == ',') return true;
        }
    }
    return false;
}

bool compile_rule(const std::string& pattern, PatternRule* out, std::string* err) {
    if (pattern.empty()) {
        if (err) *err = "empty pattern";
        return false;
    }
    if (has_unbounded_repeat(pattern)) {
        if (err) *err = "unbounded repetition in '" + pattern + "'; use a {min,max} bound";
        return false;
    }
    PatternRule rule;
    rule.pattern = pattern;
    try {
        rule.regex = std::regex(pattern, std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
    } catch (const std::regex_error& e) {
        if (err) *err = "bad pattern '" + pattern + "': " + e.what();
        return false;
    }
    // A rule that matches the empty string would match every input.
    if (std::regex_search(std::string(), rule.regex)) {
        if (err) *err = "pattern matches empty text: '" + pattern + "'";
        return false;
    }
    *out = std::move(rule);
    return true;
}

bool compile_rule_list(const json& list, const std::string& where, std::vector<PatternRule>* out, std::string* err) {
    if (!list.is_array()) {
        if (err) *err = where + ": rules must be an array";
        return false;
    }
    for (const auto& item : list) {
        if (!item.is_string()) {
            if (err) *err = where + ": rule must be a string";
            return false;
        }
        PatternRule rule;
        std::string rule_err;
        if (!compile_rule(item.get<std::string>(), &rule, &rule_err)) {
            if (err) *err = where + ": " + rule_err;
            return false;
        }
        out->push_back(std::move(rule));
    }
    return true;
}

} // namespace

const char* category_id(GuardCategory c) {
    switch (c) {
        case GuardCategory::InputOverflow: return "input_overflow";
        case GuardCategory::RepetitionAttack: return "repetition_attack";
        case GuardCategory::InstructionOverride: return "instruction_override";
        case GuardCategory::SafetyBypass: return "safety_bypass";
        case GuardCategory::PromptLeakage: return "prompt_leakage";
        case GuardCategory::DataExfiltration: return "data_exfiltration";
        case GuardCategory::CodeExecution: return "code_execution";
        case GuardCategory::ExternalRequests: return "external_requests";
        case GuardCategory::RoleManipulation: return "role_manipulation";
        case GuardCategory::JailbreakAttempts: return "jailbreak_attempts";
        case GuardCategory::InstructionInjection: return "instruction_injection";
        case GuardCategory::InformationDisclosure: return "information_disclosure";
    }
    return "unknown";
}

const char* category_label(GuardCategory c) {
    switch (c) {
        case GuardCategory::InputOverflow: return "Input Overflow";
        case GuardCategory::RepetitionAttack: return "Repetition Attack";
        case GuardCategory::InstructionOverride: return "Instruction Override";
        case GuardCategory::SafetyBypass: return "Safety Bypass";
        case GuardCategory::PromptLeakage: return "Prompt Leakage";
        case GuardCategory::DataExfiltration: return "Data Exfiltration";
        case GuardCategory::CodeExecution: return "Code Execution";
        case GuardCategory::ExternalRequests: return "External Request";
        case GuardCategory::RoleManipulation: return "Role Manipulation";
        case GuardCategory::JailbreakAttempts: return "Jailbreak Attempt";
        case GuardCategory::InstructionInjection: return "Instruction Injection";
        case GuardCategory::InformationDisclosure: return "Information Disclosure";
    }
    return "Unknown";
}

bool parse_category_id(const std::string& id, GuardCategory* out) {
    static const GuardCategory all[] = {
        GuardCategory::InputOverflow,        GuardCategory::RepetitionAttack,
        GuardCategory::InstructionOverride,  GuardCategory::SafetyBypass,
        GuardCategory::PromptLeakage,        GuardCategory::DataExfiltration,
        GuardCategory::CodeExecution,        GuardCategory::ExternalRequests,
        GuardCategory::RoleManipulation,     GuardCategory::JailbreakAttempts,
        GuardCategory::InstructionInjection, GuardCategory::InformationDisclosure,
    };
    for (GuardCategory c : all) {
        if (id == category_id(c)) {
            if (out) *out = c;
            return true;
        }
    }
    return false;
}

const PatternCatalog& PatternCatalog::builtin() {
    static const PatternCatalog catalog = [] {
        PatternCatalog c;
        json table;
        std::string err;
        if (!parse_json_body(kGuardRulesJson, &table, &err) || !from_json(table, &c, &err)) {
            throw std::runtime_error("embedded guard rule table: " + err);
        }
        return c;
    }();
    return catalog;
}

bool PatternCatalog::from_json(const json& table, PatternCatalog* out, std::string* err) {
    if (!out) return false;
    if (!table.is_object()) {
        if (err) *err = "rule table must be an object";
        return false;
    }

    PatternCatalog catalog;
    catalog.version_ = table.value("version", std::string("unversioned"));

    auto cats_it = table.find("categories");
    if (cats_it == table.end() || !cats_it->is_array() || cats_it->empty()) {
        if (err) *err = "rule table needs a non-empty `categories` array";
        return false;
    }

    for (const auto& entry : *cats_it) {
        if (!entry.is_object()) {
            if (err) *err = "category entry must be an object";
            return false;
        }
        const std::string id = entry.value("id", std::string());
        PatternCategory cat;
        if (!parse_category_id(id, &cat.category)) {
            if (err) *err = "unknown category '" + id + "'";
            return false;
        }
        if (cat.category == GuardCategory::InputOverflow || cat.category == GuardCategory::RepetitionAttack) {
            if (err) *err = "category '" + id + "' is reserved for built-in checks";
            return false;
        }
        for (const auto& existing : catalog.categories_) {
            if (existing.category == cat.category) {
                if (err) *err = "duplicate category '" + id + "'";
                return false;
            }
        }
        auto prio_it = entry.find("priority");
        if (prio_it == entry.end() || !prio_it->is_number_integer()) {
            if (err) *err = "category '" + id + "' needs an integer priority";
            return false;
        }
        cat.priority = prio_it->get<int>();
        auto rules_it = entry.find("rules");
        if (rules_it == entry.end()) {
            if (err) *err = "category '" + id + "' has no rules";
            return false;
        }
        if (!compile_rule_list(*rules_it, id, &cat.rules, err)) return false;
        catalog.categories_.push_back(std::move(cat));
    }

    std::stable_sort(catalog.categories_.begin(), catalog.categories_.end(),
                     [](const PatternCategory& a, const PatternCategory& b) { return a.priority < b.priority; });

    auto strip_it = table.find("strip");
    if (strip_it != table.end() && !compile_rule_list(*strip_it, "strip", &catalog.strip_rules_, err)) {
        return false;
    }

    if (catalog.rule_count() == 0) {
        if (err) *err = "rule table has no detection rules";
        return false;
    }

    *out = std::move(catalog);
    return true;
}

bool PatternCatalog::load_file(const std::string& path, PatternCatalog* out, std::string* err) {
    json table;
    if (!read_json_file(path, &table, err)) return false;
    return from_json(table, out, err);
}

size_t PatternCatalog::rule_count() const {
    size_t n = 0;
    for (const auto& cat : categories_) n += cat.rules.size();
    return n;
}

json PatternCatalog::describe() const {
    json cats = json::array();
    for (const auto& cat : categories_) {
        cats.push_back({
            {"id", category_id(cat.category)},
            {"label", category_label(cat.category)},
            {"priority", cat.priority},
            {"rules", cat.rules.size()}
        });
    }
    return {
        {"version", version_},
        {"categories", cats},
        {"strip_rules", strip_rules_.size()}
    };
}
