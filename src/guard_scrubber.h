#pragma once

#include "guard_patterns.h"
#include "rag_chunk.h"

#include <string>
#include <vector>

struct ScrubOptions {
    std::string placeholder = "[removed: unsafe instruction text]";
    size_t max_passes = 8;
};

// Neutralizes instruction-like fragments inside retrieved text. Never rejects
// text; matched spans are replaced by the placeholder. The output contains no
// match for any strip rule, so scrubbing its own output is a no-op.
class ContextScrubber {
public:
    ContextScrubber();

    // Refuses a placeholder that a strip rule would match again.
    bool init(const PatternCatalog& catalog, const ScrubOptions& opt, std::string* err);

    std::string scrub(const std::string& text, size_t* replaced = nullptr) const;

    // Scrubbed copy; the input chunk is left untouched.
    ContextChunk scrub_chunk(const ContextChunk& chunk, size_t* replaced = nullptr) const;

    const ScrubOptions& options() const { return opt_; }

private:
    const std::vector<PatternRule>* rules_ = nullptr;
    ScrubOptions opt_;

    bool apply_pass(std::string& text, const std::string& replacement, size_t* replaced) const;
};
