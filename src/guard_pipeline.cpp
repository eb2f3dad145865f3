#include "guard_pipeline.h"

#include "rag_text.h"
#include "util.h"

#include <memory>
#include <sstream>

using nlohmann::json;

namespace {

std::string summarize_coverage(const CoverageDecision& d) {
    std::ostringstream oss;
    oss << "confident=" << (d.confident ? 1 : 0)
        << " admitted=" << d.admitted.size()
        << " rejected=" << d.rejected.size();
    for (const auto& s : d.signals) {
        oss << " " << signal_name(s.signal) << "_mean=" << s.mean << "(n=" << s.samples << ")";
    }
    if (!d.reason.empty()) oss << " reason=\"" << d.reason << "\"";
    return oss.str();
}

} // namespace

const char* chat_outcome_name(ChatOutcome o) {
    switch (o) {
        case ChatOutcome::InvalidRequest: return "invalid_request";
        case ChatOutcome::Rejected: return "rejected";
        case ChatOutcome::NoAnswer: return "no_answer";
        case ChatOutcome::Answered: return "answered";
        case ChatOutcome::Aborted: return "aborted";
        case ChatOutcome::UpstreamError: return "upstream_error";
    }
    return "unknown";
}

GuardPipeline::GuardPipeline()
    : catalog_(&PatternCatalog::builtin()),
      scanner_(std::make_unique<InputScanner>(PatternCatalog::builtin())) {}

bool GuardPipeline::init(const GuardConfig& cfg, std::string* err) {
    if (!validate_config(cfg, err)) return false;

    std::unique_ptr<PatternCatalog> loaded;
    const PatternCatalog* catalog = &PatternCatalog::builtin();
    if (!cfg.rules_path.empty()) {
        loaded = std::make_unique<PatternCatalog>();
        std::string load_err;
        if (!PatternCatalog::load_file(cfg.rules_path, loaded.get(), &load_err)) {
            if (err) *err = "rules " + cfg.rules_path + ": " + load_err;
            return false;
        }
        catalog = loaded.get();
    }

    ContextScrubber scrubber;
    if (!scrubber.init(*catalog, cfg.scrub, err)) return false;

    cfg_ = cfg;
    loaded_catalog_ = std::move(loaded);
    catalog_ = catalog;
    scanner_ = std::make_unique<InputScanner>(*catalog_, cfg_.scan);
    scrubber_ = scrubber;
    gate_ = CoverageGate(cfg_.coverage);
    enforcer_ = CitationEnforcer(cfg_.citations);
    return true;
}

void GuardPipeline::audit(const std::string& request_id,
                          const char* stage,
                          const std::string& category,
                          const std::string& detail) const {
    if (!audit_) return;
    GuardEvent ev;
    ev.ts_ms = now_ms_epoch();
    ev.request_id = request_id;
    ev.stage = stage;
    ev.category = category;
    ev.detail = detail;
    audit_->record(ev);
}

void GuardPipeline::audit_violations(const std::string& request_id, const CitationReport& report) const {
    for (const auto& v : report.violations) {
        std::string detail = v.reference.empty() ? std::string() : v.reference + " in ";
        detail += "sentence " + std::to_string(v.sentence_index) + ": " + truncate_for_log(v.sentence, 300);
        audit(request_id, "citations", violation_kind_name(v.kind), detail);
    }
}

ScanVerdict GuardPipeline::screen_prompt(const std::string& request_id, const std::string& prompt) const {
    ScanVerdict v = scanner_->scan(prompt);
    if (v.flagged) {
        const char* cat = v.category ? category_id(*v.category) : "unknown";
        log_event("guard.scan", "request_id=" + request_id +
                                    " flagged=1 category=" + cat +
                                    " rule=\"" + truncate_for_log(v.rule, 120) + "\"" +
                                    " excerpt=\"" + truncate_for_log(v.matched_text, 120) + "\"");
        audit(request_id, "scan", cat, v.message);
    }
    return v;
}

CoverageDecision GuardPipeline::prepare_context(const std::string& request_id,
                                                const std::vector<ContextChunk>& candidates,
                                                const ChunkFilter& filter,
                                                size_t top_k) const {
    std::vector<ContextChunk> scrubbed;
    scrubbed.reserve(candidates.size());
    size_t total_replaced = 0;
    size_t touched = 0;
    for (const auto& c : candidates) {
        size_t replaced = 0;
        scrubbed.push_back(scrubber_.scrub_chunk(c, &replaced));
        if (replaced > 0) ++touched;
        total_replaced += replaced;
    }
    if (total_replaced > 0) {
        log_event("guard.scrub", "request_id=" + request_id +
                                     " chunks=" + std::to_string(touched) +
                                     " replaced=" + std::to_string(total_replaced));
    }

    CoverageDecision d = gate_.admit(scrubbed, filter, top_k);
    log_event("guard.coverage", "request_id=" + request_id + " candidates=" +
                                    std::to_string(candidates.size()) + " " + summarize_coverage(d));
    if (!d.confident) audit(request_id, "coverage", "no_confident_evidence", d.reason);
    return d;
}

CitationReport GuardPipeline::review(const std::string& request_id,
                                     const std::string& answer,
                                     const std::vector<ContextChunk>& admitted) const {
    CitationReport report = enforcer_.enforce(answer, admitted);
    if (!report.violations.empty()) {
        log_event("guard.citations", "request_id=" + request_id +
                                         " violations=" + std::to_string(report.violations.size()) +
                                         " supported=" + std::to_string(report.supported_sentences) +
                                         "/" + std::to_string(report.total_sentences));
        audit_violations(request_id, report);
    }
    return report;
}

bool GuardPipeline::accept_request(const ChatRequest& req, ChatResult* result) const {
    if (req.messages.empty() || req.messages.back().role != "user" ||
        trim_text(req.messages.back().content).empty()) {
        result->outcome = ChatOutcome::InvalidRequest;
        result->error = "last message must be a non-empty user message";
        return false;
    }
    result->query = trim_text(req.messages.back().content);
    result->verdict = screen_prompt(req.request_id, result->query);
    if (result->verdict.flagged) {
        result->outcome = ChatOutcome::Rejected;
        result->error = rejection_message(result->verdict);
        return false;
    }
    return true;
}

ChatResult GuardPipeline::answer_request(const ChatRequest& req,
                                         ChunkRetriever& retriever,
                                         AnswerGenerator& generator,
                                         const ChatWriter& write) const {
    ChatResult result;
    if (req.messages.empty()) {
        result.error = "no messages";
        return result;
    }
    result.query = trim_text(req.messages.back().content);
    const size_t top_k = req.top_k ? *req.top_k : cfg_.coverage.top_k;

    std::vector<ContextChunk> candidates;
    std::string retrieve_err;
    if (!retriever.retrieve(result.query, req.filter, top_k, &candidates, &retrieve_err)) {
        log_event("retrieval.error", "request_id=" + req.request_id + " error=\"" +
                                         truncate_for_log(retrieve_err, 300) + "\"");
        audit(req.request_id, "coverage", "retrieval_error", retrieve_err);
        candidates.clear();
    }

    result.coverage = prepare_context(req.request_id, candidates, req.filter, top_k);
    if (!result.coverage.confident) {
        result.outcome = write(no_answer_message()) ? ChatOutcome::NoAnswer : ChatOutcome::Aborted;
        return result;
    }
    const std::vector<ContextChunk>& admitted = result.coverage.admitted;

    std::vector<ChatTurn> earlier(req.messages.begin(), req.messages.end() - 1);
    std::vector<ChatTurn> history = sanitize_history(earlier, scrubber_, cfg_.history_turns, cfg_.history_max_chars);

    const CitationPolicy policy = cfg_.citations.policy;
    bool strict = false;
    for (int attempt = 0;; ++attempt) {
        result.attempts = attempt + 1;
        const GroundedPrompt prompt = build_grounded_prompt(result.query, admitted, history, strict);
        // Only a retry that can still happen needs the answer held back.
        const bool buffer = policy == CitationPolicy::Retry && attempt < cfg_.max_retries;

        CitationStream stream = enforcer_.stream(admitted);
        std::string held;
        bool aborted = false;
        auto forward = [&](const StreamUpdate& up) -> bool {
            const std::string& out = policy == CitationPolicy::Redact ? up.accepted : up.passthrough;
            if (out.empty()) return true;
            if (buffer) {
                held += out;
                return true;
            }
            if (!write(out)) {
                aborted = true;
                return false;
            }
            return true;
        };

        std::string gen_err;
        const bool ok = generator.generate(prompt, [&](const std::string& delta) {
            if ((req.cancel && req.cancel->load()) || (req.connected && !req.connected())) {
                aborted = true;
                return false;
            }
            return forward(stream.feed(delta));
        }, &gen_err);

        if (!aborted && ok) forward(stream.finish());
        if (!aborted && ok && buffer && !stream.report().retry_requested && !held.empty() && !write(held)) {
            aborted = true;
        }

        if (aborted) {
            stream.abort();
            result.citations = stream.report();
            result.outcome = ChatOutcome::Aborted;
            log_event("guard.stream", "request_id=" + req.request_id + " aborted=1 attempt=" +
                                          std::to_string(result.attempts));
            audit(req.request_id, "stream", "aborted", "attempt " + std::to_string(result.attempts));
            return result;
        }
        if (!ok) {
            stream.abort();
            result.citations = stream.report();
            result.outcome = ChatOutcome::UpstreamError;
            result.error = gen_err.empty() ? "generation failed" : gen_err;
            log_event("upstream.error", "request_id=" + req.request_id + " error=\"" +
                                            truncate_for_log(result.error, 300) + "\"");
            audit(req.request_id, "upstream", "upstream_error", result.error);
            if (!write("\n[upstream_error] " + result.error)) {
                log_event("guard.stream", "request_id=" + req.request_id + " aborted=1 stage=upstream_error");
            }
            return result;
        }

        result.citations = stream.report();
        if (!result.citations.violations.empty()) {
            log_event("guard.citations", "request_id=" + req.request_id +
                                             " policy=" + citation_policy_name(policy) +
                                             " violations=" + std::to_string(result.citations.violations.size()) +
                                             " supported=" + std::to_string(result.citations.supported_sentences) +
                                             "/" + std::to_string(result.citations.total_sentences) +
                                             " attempt=" + std::to_string(result.attempts));
            audit_violations(req.request_id, result.citations);
        }

        if (buffer && result.citations.retry_requested) {
            log_event("guard.retry", "request_id=" + req.request_id + " attempt=" +
                                         std::to_string(result.attempts) + " max_retries=" +
                                         std::to_string(cfg_.max_retries));
            audit(req.request_id, "retry", "citation_retry",
                  std::to_string(result.citations.violations.size()) + " violations on attempt " +
                      std::to_string(result.attempts));
            strict = true;
            continue;
        }
        break;
    }

    if (!write(build_context_trailer(admitted))) {
        result.citations.violations.clear();
        result.citations.retry_requested = false;
        result.citations.outcome = StreamOutcome::Aborted;
        result.outcome = ChatOutcome::Aborted;
        return result;
    }
    result.outcome = ChatOutcome::Answered;
    return result;
}

ChatResult GuardPipeline::run_chat(const ChatRequest& req,
                                   ChunkRetriever& retriever,
                                   AnswerGenerator& generator,
                                   const ChatWriter& write) const {
    ChatResult result;
    if (!accept_request(req, &result)) return result;
    ChatResult answered = answer_request(req, retriever, generator, write);
    answered.verdict = result.verdict;
    return answered;
}

json chat_result_to_json(const ChatResult& result) {
    json out = {
        {"outcome", chat_outcome_name(result.outcome)},
        {"attempts", result.attempts},
        {"scan", verdict_to_json(result.verdict)},
        {"coverage", coverage_to_json(result.coverage)},
        {"citations", citation_report_to_json(result.citations)}
    };
    if (!result.error.empty()) out["error"] = result.error;
    return out;
}
