#pragma once

#include "rag_chunk.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <set>
#include <string>
#include <vector>

enum class Signal {
    Semantic,
    Hybrid,
    Rerank,
};

const char* signal_name(Signal s);

// Per-signal thresholds. An unset floor or average disables that check.
struct SignalGate {
    std::optional<double> floor;
    std::optional<double> average;
};

struct CoverageOptions {
    SignalGate semantic{0.35, 0.2};
    SignalGate hybrid{0.1, 0.1};
    SignalGate rerank{0.5, 0.3};
    size_t top_k = 5;
    size_t dedupe_prefix = 150;  // 0 disables duplicate suppression

    const SignalGate& gate(Signal s) const;
    SignalGate& gate(Signal s);
};

struct ChunkFilter {
    std::set<std::string> tags;          // empty: no tag filter
    std::set<std::string> exts;          // normalized, empty: any file type
    std::optional<RequestScope> scope;   // empty: no ownership filter
};

// Reads either {"tags": ..., "exts": ..., "dept_id": ..., "user_id": ...} or
// the list form [{"exts": [...]}, {"tags": [...]}]. In the list form the
// first entry carrying a key decides it. Tags and exts may be arrays or
// comma separated strings. Anything else yields an empty filter.
ChunkFilter chunk_filter_from_json(const nlohmann::json& filters);

struct ChunkRejection {
    std::string chunk_id;
    std::string source;
    std::string stage;   // validate | scope | ext | dedupe | tags | top_k | floor
    std::string reason;
};

struct SignalSummary {
    Signal signal = Signal::Semantic;
    size_t samples = 0;
    double mean = 0.0;
    std::optional<double> threshold;
    bool passed = true;
};

struct CoverageDecision {
    bool confident = false;
    std::vector<ContextChunk> admitted;     // rank order, empty unless confident
    std::vector<ChunkRejection> rejected;
    std::vector<SignalSummary> signals;     // means over the chunks that cleared the floors
    std::string reason;                     // why the set was judged insufficient
};

class CoverageGate {
public:
    explicit CoverageGate(CoverageOptions opt = CoverageOptions());

    CoverageDecision admit(const std::vector<ContextChunk>& chunks, const ChunkFilter& filter) const;
    CoverageDecision admit(const std::vector<ContextChunk>& chunks, const ChunkFilter& filter, size_t top_k) const;

    const CoverageOptions& options() const { return opt_; }

private:
    CoverageOptions opt_;

    bool validate(const ContextChunk& chunk, std::string* reason) const;
    bool clears_floors(const ContextChunk& chunk, std::string* reason) const;
};

nlohmann::json coverage_to_json(const CoverageDecision& decision, bool include_text = false);
