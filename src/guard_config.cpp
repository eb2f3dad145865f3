#include "guard_config.h"

#include "json_utils.h"
#include "util.h"

#include <cmath>
#include <cstdlib>
#include <initializer_list>
#include <stdexcept>

using nlohmann::json;

namespace {

void read_gate(const json& j, SignalGate* gate) {
    if (!j.is_object()) throw std::runtime_error("signal gate must be an object");
    if (j.contains("floor")) {
        const json& v = j.at("floor");
        gate->floor = v.is_null() ? std::optional<double>() : std::optional<double>(v.get<double>());
    }
    if (j.contains("average")) {
        const json& v = j.at("average");
        gate->average = v.is_null() ? std::optional<double>() : std::optional<double>(v.get<double>());
    }
}

// Read signed, so a negative count is refused rather than wrapped to a huge size_t.
void read_count(const json& section, const char* name, const char* key, bool allow_zero, size_t* out) {
    auto it = section.find(key);
    if (it == section.end()) return;
    if (!it->is_number_integer()) throw std::runtime_error(std::string(name) + " must be an integer");
    const long long v = it->get<long long>();
    if (v < 0 || (v == 0 && !allow_zero)) {
        throw std::runtime_error(std::string(name) + (allow_zero ? " must not be negative" : " must be positive"));
    }
    *out = static_cast<size_t>(v);
}

json gate_to_json(const SignalGate& g) {
    return {
        {"floor", g.floor ? json(*g.floor) : json(nullptr)},
        {"average", g.average ? json(*g.average) : json(nullptr)}
    };
}

bool env_positive(const char* name, size_t* out, std::string* err) {
    const char* raw = std::getenv(name);
    if (!raw || !*raw) return true;
    int v = 0;
    if (!getenv_int(name, &v) || v <= 0) {
        if (err) *err = std::string(name) + " must be a positive integer";
        return false;
    }
    *out = static_cast<size_t>(v);
    return true;
}

bool env_threshold(const char* name, std::optional<double>* out, std::string* err) {
    const char* raw = std::getenv(name);
    if (!raw || !*raw) return true;
    double v = 0.0;
    if (!getenv_double(name, &v)) {
        if (err) *err = std::string(name) + " must be a number";
        return false;
    }
    *out = v;
    return true;
}

} // namespace

bool apply_config_json(const json& j, GuardConfig* cfg, std::string* err) {
    if (!j.is_object()) {
        if (err) *err = "config must be a JSON object";
        return false;
    }
    try {
        if (j.contains("scan")) {
            const json& s = j.at("scan");
            read_count(s, "scan.max_len", "max_len", false, &cfg->scan.max_len);
            read_count(s, "scan.repetition_min_len", "repetition_min_len", false, &cfg->scan.repetition_min_len);
            cfg->scan.repetition_max_share = s.value("repetition_max_share", cfg->scan.repetition_max_share);
        }
        if (j.contains("scrub")) {
            const json& s = j.at("scrub");
            cfg->scrub.placeholder = s.value("placeholder", cfg->scrub.placeholder);
            read_count(s, "scrub.max_passes", "max_passes", false, &cfg->scrub.max_passes);
        }
        if (j.contains("coverage")) {
            const json& c = j.at("coverage");
            read_count(c, "coverage.top_k", "top_k", false, &cfg->coverage.top_k);
            read_count(c, "coverage.dedupe_prefix", "dedupe_prefix", true, &cfg->coverage.dedupe_prefix);
            if (c.contains("semantic")) read_gate(c.at("semantic"), &cfg->coverage.semantic);
            if (c.contains("hybrid")) read_gate(c.at("hybrid"), &cfg->coverage.hybrid);
            if (c.contains("rerank")) read_gate(c.at("rerank"), &cfg->coverage.rerank);
        }
        if (j.contains("citations")) {
            const json& c = j.at("citations");
            if (c.contains("policy")) {
                const std::string policy = c.at("policy").get<std::string>();
                if (!parse_citation_policy(policy, &cfg->citations.policy)) {
                    if (err) *err = "unknown citation policy: " + policy;
                    return false;
                }
            }
            cfg->citations.require_citation_per_sentence =
                c.value("require_citation_per_sentence", cfg->citations.require_citation_per_sentence);
            cfg->max_retries = c.value("max_retries", cfg->max_retries);
        }
        if (j.contains("history")) {
            const json& h = j.at("history");
            read_count(h, "history.turns", "turns", true, &cfg->history_turns);
            read_count(h, "history.max_chars", "max_chars", false, &cfg->history_max_chars);
        }
        cfg->rules_path = j.value("rules", cfg->rules_path);
    } catch (const std::exception& e) {
        if (err) *err = std::string("config: ") + e.what();
        return false;
    }
    return true;
}

bool load_config_file(const std::string& path, GuardConfig* cfg, std::string* err) {
    json j;
    if (!read_json_file(path, &j, err)) return false;
    return apply_config_json(j, cfg, err);
}

bool apply_env_overrides(GuardConfig* cfg, std::string* err) {
    if (!env_positive("RAG_GUARD_MAX_LEN", &cfg->scan.max_len, err)) return false;
    if (!env_positive("RAG_GUARD_TOP_K", &cfg->coverage.top_k, err)) return false;
    if (!env_threshold("RAG_GUARD_MIN_SEM_SIM", &cfg->coverage.semantic.floor, err)) return false;
    if (!env_threshold("RAG_GUARD_AVG_SEM_SIM", &cfg->coverage.semantic.average, err)) return false;
    if (!env_threshold("RAG_GUARD_MIN_HYBRID", &cfg->coverage.hybrid.floor, err)) return false;
    if (!env_threshold("RAG_GUARD_AVG_HYBRID", &cfg->coverage.hybrid.average, err)) return false;
    if (!env_threshold("RAG_GUARD_MIN_RERANK", &cfg->coverage.rerank.floor, err)) return false;
    if (!env_threshold("RAG_GUARD_AVG_RERANK", &cfg->coverage.rerank.average, err)) return false;

    std::string policy;
    if (getenv_string("RAG_GUARD_CITATION_POLICY", &policy) &&
        !parse_citation_policy(policy, &cfg->citations.policy)) {
        if (err) *err = "RAG_GUARD_CITATION_POLICY must be warn, redact or retry";
        return false;
    }

    const char* retries_raw = std::getenv("RAG_GUARD_MAX_RETRIES");
    if (retries_raw && *retries_raw) {
        int retries = 0;
        if (!getenv_int("RAG_GUARD_MAX_RETRIES", &retries) || retries < 0) {
            if (err) *err = "RAG_GUARD_MAX_RETRIES must be a non-negative integer";
            return false;
        }
        cfg->max_retries = retries;
    }
    return true;
}

bool validate_config(const GuardConfig& cfg, std::string* err) {
    auto fail = [err](const std::string& msg) {
        if (err) *err = msg;
        return false;
    };
    if (cfg.scan.max_len == 0) return fail("scan.max_len must be positive");
    if (!(cfg.scan.repetition_max_share > 0.0 && cfg.scan.repetition_max_share <= 1.0)) {
        return fail("scan.repetition_max_share must be in (0, 1]");
    }
    if (cfg.coverage.top_k == 0) return fail("coverage.top_k must be positive");
    for (Signal s : {Signal::Semantic, Signal::Hybrid, Signal::Rerank}) {
        const SignalGate& g = cfg.coverage.gate(s);
        if ((g.floor && !std::isfinite(*g.floor)) || (g.average && !std::isfinite(*g.average))) {
            return fail(std::string("coverage.") + signal_name(s) + " thresholds must be finite");
        }
    }
    if (cfg.scrub.max_passes == 0) return fail("scrub.max_passes must be positive");
    if (cfg.max_retries < 0) return fail("citations.max_retries must be non-negative");
    if (cfg.history_max_chars == 0) return fail("history.max_chars must be positive");
    return true;
}

json config_to_json(const GuardConfig& cfg) {
    return {
        {"scan", {
            {"max_len", cfg.scan.max_len},
            {"repetition_min_len", cfg.scan.repetition_min_len},
            {"repetition_max_share", cfg.scan.repetition_max_share}
        }},
        {"scrub", {
            {"placeholder", cfg.scrub.placeholder},
            {"max_passes", cfg.scrub.max_passes}
        }},
        {"coverage", {
            {"top_k", cfg.coverage.top_k},
            {"dedupe_prefix", cfg.coverage.dedupe_prefix},
            {"semantic", gate_to_json(cfg.coverage.semantic)},
            {"hybrid", gate_to_json(cfg.coverage.hybrid)},
            {"rerank", gate_to_json(cfg.coverage.rerank)}
        }},
        {"citations", {
            {"policy", citation_policy_name(cfg.citations.policy)},
            {"require_citation_per_sentence", cfg.citations.require_citation_per_sentence},
            {"max_retries", cfg.max_retries}
        }},
        {"history", {
            {"turns", cfg.history_turns},
            {"max_chars", cfg.history_max_chars}
        }},
        {"rules", cfg.rules_path}
    };
}
