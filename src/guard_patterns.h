#pragma once

#include <nlohmann/json.hpp>

#include <regex>
#include <string>
#include <vector>

// Every reason the guard can flag an input. The first two come from the
// scanner's built-in checks; the rest are rule categories of the catalog.
enum class GuardCategory {
    InputOverflow,
    RepetitionAttack,
    InstructionOverride,
    SafetyBypass,
    PromptLeakage,
    DataExfiltration,
    CodeExecution,
    ExternalRequests,
    RoleManipulation,
    JailbreakAttempts,
    InstructionInjection,
    InformationDisclosure,
};

const char* category_id(GuardCategory c);
const char* category_label(GuardCategory c);
bool parse_category_id(const std::string& id, GuardCategory* out);

struct PatternRule {
    std::string pattern;
    std::regex regex;
};

struct PatternCategory {
    GuardCategory category = GuardCategory::InstructionOverride;
    int priority = 0;
    std::vector<PatternRule> rules;
};

// Immutable rule set: detection categories in priority order plus the strip
// rules used on retrieved text. Built once and shared read-only between
// requests.
class PatternCatalog {
public:
    // Rule table embedded at build time from rules/guard_rules.json.
    // Throws std::runtime_error if the embedded table does not compile.
    static const PatternCatalog& builtin();

    // Table format:
    //   {"version": "...",
    //    "categories": [{"id": "instruction_override", "priority": 10, "rules": ["..."]}],
    //    "strip": ["..."]}
    // Categories are evaluated by ascending priority; equal priorities keep
    // file order. Patterns are ECMAScript regexes, matched case-insensitively.
    static bool from_json(const nlohmann::json& table, PatternCatalog* out, std::string* err);
    static bool load_file(const std::string& path, PatternCatalog* out, std::string* err);

    const std::string& version() const { return version_; }
    const std::vector<PatternCategory>& categories() const { return categories_; }
    const std::vector<PatternRule>& strip_rules() const { return strip_rules_; }
    size_t rule_count() const;

    nlohmann::json describe() const;

private:
    std::string version_;
    std::vector<PatternCategory> categories_;
    std::vector<PatternRule> strip_rules_;
};
