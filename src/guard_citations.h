#pragma once

#include "rag_chunk.h"

#include <nlohmann/json.hpp>

#include <set>
#include <string>
#include <vector>

// Separates the answer from the evidence list in a chat stream.
extern const char kContextMarker[];

enum class CitationPolicy {
    Warn,    // pass text through, report violations
    Redact,  // drop uncited sentences and unresolvable references
    Retry,   // pass text through, ask the caller to regenerate
};

const char* citation_policy_name(CitationPolicy p);
bool parse_citation_policy(const std::string& s, CitationPolicy* out);

enum class ViolationKind {
    UnknownReference,
    UncitedSentence,
    UnknownSource,
};

const char* violation_kind_name(ViolationKind k);

struct CitationOptions {
    CitationPolicy policy = CitationPolicy::Warn;
    bool require_citation_per_sentence = true;
};

// One reference found in the answer: "[2]" yields one, "[1, 3]" two,
// "[chunk:abc]" one. chunk_index is 0-based into the admitted list.
struct CitationRef {
    std::string raw;
    size_t sentence_index = 0;
    bool resolved = false;
    size_t chunk_index = 0;
};

struct CitationViolation {
    ViolationKind kind = ViolationKind::UncitedSentence;
    std::string reference;   // offending reference or file name, empty for uncited
    std::string sentence;
    size_t sentence_index = 0;
};

enum class StreamOutcome {
    Completed,
    Aborted,
};

struct CitationReport {
    StreamOutcome outcome = StreamOutcome::Completed;
    std::string answer;          // text before the context marker, trimmed
    std::string accepted_text;   // what the policy lets through
    std::vector<CitationViolation> violations;
    std::vector<CitationRef> references;
    size_t supported_sentences = 0;
    size_t total_sentences = 0;
    bool all_supported = false;
    bool retry_requested = false;
    std::string context_payload; // raw text after the marker, if the stream carried one
};

// Result of one feed() call.
struct StreamUpdate {
    std::string passthrough;  // answer text that can be forwarded unchanged
    std::string accepted;     // redacted text of sentences completed by this delta
    std::vector<CitationViolation> violations;
};

// Incremental citation monitor. A sentence is judged once it is complete:
// a terminator followed by whitespace outside any open '['. Text that may
// be the start of a split context marker is held back from passthrough.
class CitationStream {
public:
    CitationStream(const std::vector<ContextChunk>& admitted, CitationOptions opt);

    StreamUpdate feed(const std::string& delta);
    StreamUpdate finish();

    // Client gone or generation cancelled. The report keeps what was seen
    // but carries no violations. Also valid after finish().
    void abort();

    bool done() const { return finished_; }
    const CitationReport& report() const { return report_; }

private:
    std::vector<std::string> chunk_ids_;
    std::set<std::string> known_sources_;  // lower-cased basenames
    CitationOptions opt_;

    std::string answer_;
    size_t forwarded_ = 0;
    size_t sentence_start_ = 0;
    size_t scan_pos_ = 0;
    int depth_ = 0;
    bool in_payload_ = false;
    bool finished_ = false;
    bool accepted_any_ = false;
    CitationReport report_;

    void extract_sentences(size_t limit, StreamUpdate* up);
    void evaluate_unit(const std::string& unit, StreamUpdate* up);
    void evaluate_sentence(const std::string& sentence, StreamUpdate* up);
    void evaluate_trailer(const std::string& trailer, StreamUpdate* up);
    void emit_accepted(const std::string& text, const char* sep, StreamUpdate* up);
    void add_violation(CitationViolation v, StreamUpdate* up);
};

class CitationEnforcer {
public:
    explicit CitationEnforcer(CitationOptions opt = CitationOptions());

    CitationReport enforce(const std::string& output, const std::vector<ContextChunk>& admitted) const;
    CitationStream stream(const std::vector<ContextChunk>& admitted) const;

    const CitationOptions& options() const { return opt_; }

private:
    CitationOptions opt_;
};

nlohmann::json citation_report_to_json(const CitationReport& report);

// "\n__CONTEXT__:" followed by the JSON array of the admitted chunks.
std::string build_context_trailer(const std::vector<ContextChunk>& admitted);

// Splits a complete stream into answer and evidence list. A stream without
// the marker yields the whole text and an empty array.
bool split_context_trailer(const std::string& stream, std::string* answer, nlohmann::json* chunks, std::string* err);
