#pragma once

#include "guard_scrubber.h"
#include "rag_chunk.h"

#include <string>
#include <vector>

struct ChatTurn {
    std::string role;     // "user" | "assistant"
    std::string content;
};

struct GroundedPrompt {
    std::string system;
    std::vector<ChatTurn> history;
    std::string user;
};

// Returned verbatim when the coverage gate finds no confident evidence.
const std::string& no_answer_message();

// Keeps the last max_turns user/assistant turns, each cut to max_chars code
// points and scrubbed like retrieved text.
std::vector<ChatTurn> sanitize_history(const std::vector<ChatTurn>& turns,
                                       const ContextScrubber& scrubber,
                                       size_t max_turns,
                                       size_t max_chars);

// "Context 1 (Source: a.pdf, Page: 3):\n<text>\nHybrid score: 0.42, Rerank score: 0.77"
std::string format_context_blocks(const std::vector<ContextChunk>& admitted);

// strict selects the tighter system prompt used when regenerating after a
// citation violation.
GroundedPrompt build_grounded_prompt(const std::string& query,
                                     const std::vector<ContextChunk>& admitted,
                                     std::vector<ChatTurn> history,
                                     bool strict);
