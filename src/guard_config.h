#pragma once

#include "guard_citations.h"
#include "guard_coverage.h"
#include "guard_scanner.h"
#include "guard_scrubber.h"

#include <nlohmann/json.hpp>

#include <string>

struct GuardConfig {
    ScanOptions scan;
    ScrubOptions scrub;
    CoverageOptions coverage;
    CitationOptions citations;
    int max_retries = 1;
    size_t history_turns = 3;
    size_t history_max_chars = 5000;
    std::string rules_path;  // empty: built-in table
};

// Config file layout (every key optional):
//   {"scan": {"max_len": 4000, "repetition_min_len": 100, "repetition_max_share": 0.4},
//    "scrub": {"placeholder": "...", "max_passes": 8},
//    "coverage": {"top_k": 5, "dedupe_prefix": 150,
//                 "semantic": {"floor": 0.35, "average": 0.2}, "hybrid": {...}, "rerank": {...}},
//    "citations": {"policy": "warn", "require_citation_per_sentence": true, "max_retries": 1},
//    "history": {"turns": 3, "max_chars": 5000},
//    "rules": "path/to/guard_rules.json"}
// A null floor or average disables that check.
bool apply_config_json(const nlohmann::json& j, GuardConfig* cfg, std::string* err);
bool load_config_file(const std::string& path, GuardConfig* cfg, std::string* err);

// RAG_GUARD_MAX_LEN, RAG_GUARD_TOP_K, RAG_GUARD_{MIN,AVG}_{SEM_SIM,HYBRID,RERANK},
// RAG_GUARD_CITATION_POLICY, RAG_GUARD_MAX_RETRIES.
bool apply_env_overrides(GuardConfig* cfg, std::string* err);

bool validate_config(const GuardConfig& cfg, std::string* err);
nlohmann::json config_to_json(const GuardConfig& cfg);
