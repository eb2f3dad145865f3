#pragma once

#include "guard_audit.h"
#include "guard_citations.h"
#include "guard_config.h"
#include "guard_coverage.h"
#include "guard_patterns.h"
#include "guard_scanner.h"
#include "guard_scrubber.h"
#include "rag_prompt.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Supplies ranked candidate chunks for a query.
class ChunkRetriever {
public:
    virtual ~ChunkRetriever() = default;
    virtual bool retrieve(const std::string& query,
                          const ChunkFilter& filter,
                          size_t top_k,
                          std::vector<ContextChunk>* out,
                          std::string* err) = 0;
};

// Produces the answer text incrementally. Generation stops as soon as
// on_delta returns false; that is not an error.
class AnswerGenerator {
public:
    virtual ~AnswerGenerator() = default;
    virtual bool generate(const GroundedPrompt& prompt,
                          const std::function<bool(const std::string&)>& on_delta,
                          std::string* err) = 0;
};

// Returns false when the client is gone.
using ChatWriter = std::function<bool(const std::string&)>;

struct ChatRequest {
    std::string request_id;
    std::vector<ChatTurn> messages;  // oldest first; the last one is the prompt
    ChunkFilter filter;
    std::optional<size_t> top_k;
    const std::atomic<bool>* cancel = nullptr;
    // Polled before every delta. Buffered attempts never write, so this is
    // how a departed client is noticed while an answer is held back.
    std::function<bool()> connected;
};

enum class ChatOutcome {
    InvalidRequest,
    Rejected,
    NoAnswer,
    Answered,
    Aborted,
    UpstreamError,
};

const char* chat_outcome_name(ChatOutcome o);

struct ChatResult {
    ChatOutcome outcome = ChatOutcome::InvalidRequest;
    std::string query;
    std::string error;       // user-facing reason for InvalidRequest, Rejected, UpstreamError
    ScanVerdict verdict;
    CoverageDecision coverage;
    CitationReport citations;
    int attempts = 0;
};

class GuardPipeline {
public:
    // Built-in rules and default thresholds.
    GuardPipeline();

    bool init(const GuardConfig& cfg, std::string* err);

    // Not owned; must outlive the pipeline.
    void set_audit_sink(GuardAuditSink* sink) { audit_ = sink; }

    const GuardConfig& config() const { return cfg_; }
    const PatternCatalog& catalog() const { return *catalog_; }
    const InputScanner& scanner() const { return *scanner_; }
    const ContextScrubber& scrubber() const { return scrubber_; }
    const CoverageGate& gate() const { return gate_; }
    const CitationEnforcer& enforcer() const { return enforcer_; }

    ScanVerdict screen_prompt(const std::string& request_id, const std::string& prompt) const;

    // Scrubs every candidate, then runs the coverage gate on the scrubbed copies.
    CoverageDecision prepare_context(const std::string& request_id,
                                     const std::vector<ContextChunk>& candidates,
                                     const ChunkFilter& filter,
                                     size_t top_k) const;

    CitationReport review(const std::string& request_id,
                          const std::string& answer,
                          const std::vector<ContextChunk>& admitted) const;

    // Validates the message list and screens the prompt. Returns false with
    // result filled when the request must not go further.
    bool accept_request(const ChatRequest& req, ChatResult* result) const;

    // Retrieval, gating, generation and citation enforcement for a request
    // that passed accept_request.
    ChatResult answer_request(const ChatRequest& req,
                              ChunkRetriever& retriever,
                              AnswerGenerator& generator,
                              const ChatWriter& write) const;

    ChatResult run_chat(const ChatRequest& req,
                        ChunkRetriever& retriever,
                        AnswerGenerator& generator,
                        const ChatWriter& write) const;

private:
    GuardConfig cfg_;
    std::unique_ptr<PatternCatalog> loaded_catalog_;
    const PatternCatalog* catalog_ = nullptr;
    std::unique_ptr<InputScanner> scanner_;
    ContextScrubber scrubber_;
    CoverageGate gate_;
    CitationEnforcer enforcer_;
    GuardAuditSink* audit_ = nullptr;

    void audit(const std::string& request_id,
               const char* stage,
               const std::string& category,
               const std::string& detail) const;
    void audit_violations(const std::string& request_id, const CitationReport& report) const;
};

nlohmann::json chat_result_to_json(const ChatResult& result);
