#include "guard_coverage.h"

#include "rag_text.h"

#include <cmath>
#include <cstdio>
#include <unordered_set>

using nlohmann::json;

namespace {

const Signal kGatedSignals[] = {Signal::Semantic, Signal::Hybrid, Signal::Rerank};

const std::optional<double>& signal_value(const ContextChunk& chunk, Signal s) {
    switch (s) {
        case Signal::Semantic: return chunk.scores.semantic;
        case Signal::Hybrid: return chunk.scores.hybrid;
        case Signal::Rerank: return chunk.scores.rerank;
    }
    return chunk.scores.semantic;
}

std::string fmt_score(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3f", v);
    return buf;
}

std::string string_member(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::string();
    return it->get<std::string>();
}

ChunkRejection make_rejection(const ContextChunk& chunk, const char* stage, std::string reason) {
    ChunkRejection r;
    r.chunk_id = chunk.chunk_id;
    r.source = chunk.source;
    r.stage = stage;
    r.reason = std::move(reason);
    return r;
}

} // namespace

const char* signal_name(Signal s) {
    switch (s) {
        case Signal::Semantic: return "semantic";
        case Signal::Hybrid: return "hybrid";
        case Signal::Rerank: return "rerank";
    }
    return "unknown";
}

const SignalGate& CoverageOptions::gate(Signal s) const {
    switch (s) {
        case Signal::Semantic: return semantic;
        case Signal::Hybrid: return hybrid;
        case Signal::Rerank: return rerank;
    }
    return semantic;
}

SignalGate& CoverageOptions::gate(Signal s) {
    return const_cast<SignalGate&>(static_cast<const CoverageOptions&>(*this).gate(s));
}

ChunkFilter chunk_filter_from_json(const json& filters) {
    ChunkFilter f;
    std::vector<const json*> entries;
    if (filters.is_object()) {
        entries.push_back(&filters);
    } else if (filters.is_array()) {
        for (const auto& e : filters) {
            if (e.is_object()) entries.push_back(&e);
        }
    }

    bool have_tags = false;
    bool have_exts = false;
    std::string dept;
    std::string user;
    for (const json* e : entries) {
        if (!have_tags && e->contains("tags")) {
            f.tags = parse_tags(e->at("tags"));
            have_tags = true;
        }
        if (!have_exts && e->contains("exts")) {
            for (const auto& x : parse_tags(e->at("exts"))) {
                std::string ext = normalize_ext(x);
                if (!ext.empty()) f.exts.insert(std::move(ext));
            }
            have_exts = true;
        }
        if (dept.empty()) dept = string_member(*e, "dept_id");
        if (user.empty()) user = string_member(*e, "user_id");
    }
    if (!dept.empty() || !user.empty()) f.scope = RequestScope{dept, user};
    return f;
}

CoverageGate::CoverageGate(CoverageOptions opt) : opt_(std::move(opt)) {}

bool CoverageGate::validate(const ContextChunk& chunk, std::string* reason) const {
    if (chunk.chunk_id.empty()) {
        *reason = "missing chunk_id";
        return false;
    }
    if (trim_text(chunk.text).empty()) {
        *reason = "empty text";
        return false;
    }
    bool any_signal = false;
    for (Signal s : kGatedSignals) {
        const auto& v = signal_value(chunk, s);
        if (!v) continue;
        if (!std::isfinite(*v)) {
            *reason = std::string("non-finite ") + signal_name(s) + " score";
            return false;
        }
        any_signal = true;
    }
    if (chunk.scores.bm25 && !std::isfinite(*chunk.scores.bm25)) {
        *reason = "non-finite bm25 score";
        return false;
    }
    if (!any_signal) {
        *reason = "no retrieval scores";
        return false;
    }
    return true;
}

bool CoverageGate::clears_floors(const ContextChunk& chunk, std::string* reason) const {
    for (Signal s : kGatedSignals) {
        const auto& v = signal_value(chunk, s);
        const auto& floor = opt_.gate(s).floor;
        if (!v || !floor) continue;
        if (*v < *floor) {
            *reason = std::string(signal_name(s)) + " " + fmt_score(*v) + " < floor " + fmt_score(*floor);
            return false;
        }
    }
    return true;
}

CoverageDecision CoverageGate::admit(const std::vector<ContextChunk>& chunks, const ChunkFilter& filter) const {
    return admit(chunks, filter, opt_.top_k);
}

CoverageDecision CoverageGate::admit(const std::vector<ContextChunk>& chunks,
                                     const ChunkFilter& filter,
                                     size_t top_k) const {
    CoverageDecision decision;

    std::set<std::string> wanted_tags;
    for (const auto& t : filter.tags) {
        std::string tag = to_lower_copy(trim_text(t));
        if (!tag.empty()) wanted_tags.insert(std::move(tag));
    }

    std::set<std::string> wanted_exts;
    for (const auto& e : filter.exts) {
        std::string ext = normalize_ext(e);
        if (!ext.empty()) wanted_exts.insert(std::move(ext));
    }

    std::unordered_set<std::string> seen;
    std::vector<const ContextChunk*> candidates;
    candidates.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        std::string reason;
        if (!validate(chunk, &reason)) {
            decision.rejected.push_back(make_rejection(chunk, "validate", reason));
            continue;
        }
        if (filter.scope) {
            if (chunk.dept_id != filter.scope->dept_id) {
                decision.rejected.push_back(make_rejection(chunk, "scope", "outside requesting department"));
                continue;
            }
            if (chunk.file_for_user && chunk.user_id != filter.scope->user_id) {
                decision.rejected.push_back(make_rejection(chunk, "scope", "private to another user"));
                continue;
            }
        }
        if (!wanted_exts.empty()) {
            const std::string ext = chunk_ext(chunk);
            if (!wanted_exts.count(ext)) {
                decision.rejected.push_back(make_rejection(chunk, "ext",
                                                           ext.empty() ? "no file type" : "file type " + ext + " not requested"));
                continue;
            }
        }
        if (opt_.dedupe_prefix > 0) {
            std::string key = chunk.source + '\n' + utf8_prefix(chunk.text, opt_.dedupe_prefix);
            if (!seen.insert(std::move(key)).second) {
                decision.rejected.push_back(make_rejection(chunk, "dedupe", "duplicate of an earlier chunk"));
                continue;
            }
        }
        if (!wanted_tags.empty()) {
            bool hit = false;
            for (const auto& t : chunk.tags) {
                if (wanted_tags.count(to_lower_copy(t))) {
                    hit = true;
                    break;
                }
            }
            if (!hit) {
                decision.rejected.push_back(make_rejection(chunk, "tags", "no requested tag"));
                continue;
            }
        }
        candidates.push_back(&chunk);
    }

    if (candidates.size() > top_k) {
        for (size_t i = top_k; i < candidates.size(); ++i) {
            decision.rejected.push_back(make_rejection(*candidates[i], "top_k",
                                                       "beyond top " + std::to_string(top_k)));
        }
        candidates.resize(top_k);
    }

    std::vector<const ContextChunk*> survivors;
    survivors.reserve(candidates.size());
    for (const ContextChunk* chunk : candidates) {
        std::string reason;
        if (!clears_floors(*chunk, &reason)) {
            decision.rejected.push_back(make_rejection(*chunk, "floor", reason));
            continue;
        }
        survivors.push_back(chunk);
    }

    bool averages_ok = true;
    for (Signal s : kGatedSignals) {
        SignalSummary summary;
        summary.signal = s;
        summary.threshold = opt_.gate(s).average;
        double sum = 0.0;
        for (const ContextChunk* chunk : survivors) {
            const auto& v = signal_value(*chunk, s);
            if (!v) continue;
            sum += *v;
            ++summary.samples;
        }
        if (summary.samples == 0) continue;
        summary.mean = sum / static_cast<double>(summary.samples);
        if (summary.threshold && summary.mean < *summary.threshold) {
            summary.passed = false;
            if (averages_ok) {
                decision.reason = std::string("mean ") + signal_name(s) + " " + fmt_score(summary.mean) +
                                  " < average " + fmt_score(*summary.threshold);
            }
            averages_ok = false;
        }
        decision.signals.push_back(summary);
    }

    if (survivors.empty()) {
        decision.reason = candidates.empty() ? "no candidate chunks" : "no chunk cleared the per-signal floors";
        return decision;
    }
    if (!averages_ok) return decision;

    decision.confident = true;
    decision.admitted.reserve(survivors.size());
    for (const ContextChunk* chunk : survivors) decision.admitted.push_back(*chunk);
    return decision;
}

json coverage_to_json(const CoverageDecision& decision, bool include_text) {
    json admitted = json::array();
    for (const auto& chunk : decision.admitted) admitted.push_back(chunk_to_json(chunk, include_text));

    json rejected = json::array();
    for (const auto& r : decision.rejected) {
        rejected.push_back({
            {"chunk_id", r.chunk_id},
            {"source", r.source},
            {"stage", r.stage},
            {"reason", r.reason}
        });
    }

    json signals = json::array();
    for (const auto& s : decision.signals) {
        json entry = {
            {"signal", signal_name(s.signal)},
            {"samples", s.samples},
            {"mean", s.mean},
            {"passed", s.passed}
        };
        entry["threshold"] = s.threshold ? json(*s.threshold) : json(nullptr);
        signals.push_back(entry);
    }

    json out = {
        {"confident", decision.confident},
        {"admitted", admitted},
        {"rejected", rejected},
        {"signals", signals}
    };
    if (!decision.reason.empty()) out["reason"] = decision.reason;
    return out;
}
