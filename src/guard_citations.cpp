#include "guard_citations.h"

#include "json_utils.h"
#include "rag_text.h"
#include "util.h"

#include <algorithm>
#include <cctype>
#include <regex>

using nlohmann::json;

const char kContextMarker[] = "__CONTEXT__:";

namespace {

// Bodies past 64 characters are plain bracketed text, never a reference.
const std::regex& bracket_re() {
    static const std::regex re(R"(\[([^\[\]\n]{0,64})\])");
    return re;
}

bool is_terminator(char c) {
    return c == '.' || c == '!' || c == '?';
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Length of the longest tail of s that is a proper prefix of the marker.
size_t partial_marker_suffix(const std::string& s) {
    const size_t mlen = sizeof(kContextMarker) - 1;
    size_t k = std::min(s.size(), mlen - 1);
    for (; k > 0; --k) {
        if (s.compare(s.size() - k, k, kContextMarker, k) == 0) return k;
    }
    return 0;
}

// Reference bodies: "2", "1, 3", "chunk:abc". Anything else is ordinary
// bracketed text and stays untouched.
bool split_ref(const std::string& raw_body, std::vector<std::string>* parts, bool* chunk_form) {
    const std::string body = trim_text(raw_body);
    if (body.empty()) return false;
    if (body.size() > 6 && to_lower_copy(body.substr(0, 6)) == "chunk:") {
        std::string id = trim_text(body.substr(6));
        if (id.empty()) return false;
        parts->assign(1, id);
        *chunk_form = true;
        return true;
    }
    std::vector<std::string> items = split_comma_list(body);
    if (items.empty()) return false;
    for (const auto& item : items) {
        if (item.empty()) return false;
        for (char c : item) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        }
    }
    *parts = std::move(items);
    *chunk_form = false;
    return true;
}

std::string join(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out += sep;
        out += items[i];
    }
    return out;
}

// Start of the first line opening with "Sources:" (case-insensitive,
// markdown emphasis allowed), or npos.
size_t find_sources_line(const std::string& unit) {
    size_t line = 0;
    while (line < unit.size()) {
        size_t p = line;
        while (p < unit.size() && (unit[p] == ' ' || unit[p] == '\t' || unit[p] == '*' || unit[p] == '#')) ++p;
        if (unit.size() - p >= 8 && to_lower_copy(unit.substr(p, 8)) == "sources:") return line;
        size_t nl = unit.find('\n', line);
        if (nl == std::string::npos) break;
        line = nl + 1;
    }
    return std::string::npos;
}

// "a.pdf (pages 1, 2), b.pdf (page 7)" -> entries split on commas outside
// parentheses.
std::vector<std::string> split_trailer_entries(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    int paren = 0;
    for (char c : s) {
        if (c == '(') ++paren;
        if (c == ')' && paren > 0) --paren;
        if (c == ',' && paren == 0) {
            out.push_back(trim_text(cur));
            cur.clear();
            continue;
        }
        cur.push_back(c);
    }
    out.push_back(trim_text(cur));
    return out;
}

std::string entry_file_name(const std::string& entry) {
    std::string name = entry.substr(0, entry.find('('));
    name = trim_text(name);
    while (!name.empty() && (name.back() == '.' || name.back() == ';' || name.back() == '*')) name.pop_back();
    while (!name.empty() && name.front() == '*') name.erase(0, 1);
    return trim_text(name);
}

} // namespace

const char* citation_policy_name(CitationPolicy p) {
    switch (p) {
        case CitationPolicy::Warn: return "warn";
        case CitationPolicy::Redact: return "redact";
        case CitationPolicy::Retry: return "retry";
    }
    return "warn";
}

bool parse_citation_policy(const std::string& s, CitationPolicy* out) {
    const std::string v = to_lower_copy(trim_text(s));
    if (v == "warn") {
        *out = CitationPolicy::Warn;
    } else if (v == "redact") {
        *out = CitationPolicy::Redact;
    } else if (v == "retry") {
        *out = CitationPolicy::Retry;
    } else {
        return false;
    }
    return true;
}

const char* violation_kind_name(ViolationKind k) {
    switch (k) {
        case ViolationKind::UnknownReference: return "unknown_reference";
        case ViolationKind::UncitedSentence: return "uncited_sentence";
        case ViolationKind::UnknownSource: return "unknown_source";
    }
    return "unknown";
}

CitationStream::CitationStream(const std::vector<ContextChunk>& admitted, CitationOptions opt)
    : opt_(opt) {
    chunk_ids_.reserve(admitted.size());
    for (const auto& c : admitted) {
        chunk_ids_.push_back(c.chunk_id);
        if (!c.source.empty()) known_sources_.insert(to_lower_copy(path_basename(c.source)));
    }
}

StreamUpdate CitationStream::feed(const std::string& delta) {
    StreamUpdate up;
    if (finished_ || delta.empty()) return up;
    if (in_payload_) {
        report_.context_payload += delta;
        return up;
    }

    // Only the region where a marker could straddle the old tail is searched again.
    const size_t mlen = sizeof(kContextMarker) - 1;
    const size_t search_from = answer_.size() >= mlen - 1 ? answer_.size() - (mlen - 1) : 0;
    answer_ += delta;

    size_t limit = answer_.size();
    size_t marker = answer_.find(kContextMarker, search_from);
    if (marker != std::string::npos) {
        report_.context_payload = answer_.substr(marker + mlen);
        answer_.resize(marker);
        in_payload_ = true;
        limit = answer_.size();
    } else {
        limit -= partial_marker_suffix(answer_);
    }

    if (limit > forwarded_) {
        up.passthrough = answer_.substr(forwarded_, limit - forwarded_);
        forwarded_ = limit;
    }
    extract_sentences(limit, &up);
    return up;
}

StreamUpdate CitationStream::finish() {
    StreamUpdate up;
    if (finished_) return up;

    if (answer_.size() > forwarded_) {
        up.passthrough = answer_.substr(forwarded_);
        forwarded_ = answer_.size();
    }
    extract_sentences(answer_.size(), &up);
    if (sentence_start_ < answer_.size()) {
        evaluate_unit(answer_.substr(sentence_start_), &up);
        sentence_start_ = answer_.size();
    }

    finished_ = true;
    report_.answer = trim_text(answer_);
    if (opt_.policy != CitationPolicy::Redact) report_.accepted_text = report_.answer;
    report_.all_supported = report_.total_sentences > 0 &&
                            report_.supported_sentences == report_.total_sentences;
    report_.retry_requested = opt_.policy == CitationPolicy::Retry && !report_.violations.empty();
    return up;
}

void CitationStream::abort() {
    if (!finished_) {
        finished_ = true;
        report_.answer = trim_text(answer_);
        if (opt_.policy != CitationPolicy::Redact) report_.accepted_text = report_.answer;
    }
    report_.outcome = StreamOutcome::Aborted;
    report_.violations.clear();
    report_.all_supported = false;
    report_.retry_requested = false;
}

void CitationStream::extract_sentences(size_t limit, StreamUpdate* up) {
    for (; scan_pos_ + 1 < limit; ++scan_pos_) {
        const char c = answer_[scan_pos_];
        if (c == '[') {
            ++depth_;
        } else if (c == ']') {
            if (depth_ > 0) --depth_;
        } else if (c == '\n') {
            depth_ = 0;
        }
        if (depth_ == 0 && is_terminator(c) && is_space(answer_[scan_pos_ + 1])) {
            evaluate_unit(answer_.substr(sentence_start_, scan_pos_ + 1 - sentence_start_), up);
            sentence_start_ = scan_pos_ + 1;
        }
    }
}

void CitationStream::evaluate_unit(const std::string& unit, StreamUpdate* up) {
    const size_t trailer = find_sources_line(unit);
    if (trailer == std::string::npos) {
        if (!trim_text(unit).empty()) evaluate_sentence(unit, up);
        return;
    }
    const std::string body = unit.substr(0, trailer);
    if (!trim_text(body).empty()) evaluate_sentence(body, up);
    evaluate_trailer(unit.substr(trailer), up);
}

void CitationStream::evaluate_sentence(const std::string& raw, StreamUpdate* up) {
    const std::string sentence = trim_text(raw);
    const size_t idx = report_.total_sentences++;

    std::string rewritten;
    auto last = sentence.cbegin();
    bool supported = false;
    auto end = std::sregex_iterator();
    for (auto it = std::sregex_iterator(sentence.begin(), sentence.end(), bracket_re()); it != end; ++it) {
        const auto& m = *it;
        std::vector<std::string> parts;
        bool chunk_form = false;
        if (!split_ref(m.str(1), &parts, &chunk_form)) continue;

        rewritten.append(last, m[0].first);
        last = m[0].second;

        std::vector<std::string> kept;
        for (const auto& p : parts) {
            CitationRef ref;
            ref.raw = chunk_form ? "chunk:" + p : p;
            ref.sentence_index = idx;
            if (chunk_form) {
                for (size_t i = 0; i < chunk_ids_.size(); ++i) {
                    if (chunk_ids_[i] == p) {
                        ref.resolved = true;
                        ref.chunk_index = i;
                        break;
                    }
                }
            } else {
                auto n = parse_int(p);
                if (n && *n >= 1 && static_cast<size_t>(*n) <= chunk_ids_.size()) {
                    ref.resolved = true;
                    ref.chunk_index = static_cast<size_t>(*n - 1);
                }
            }
            if (ref.resolved) {
                supported = true;
                kept.push_back(p);
            } else {
                CitationViolation v;
                v.kind = ViolationKind::UnknownReference;
                v.reference = "[" + ref.raw + "]";
                v.sentence = sentence;
                v.sentence_index = idx;
                add_violation(std::move(v), up);
            }
            report_.references.push_back(std::move(ref));
        }

        if (kept.size() == parts.size()) {
            rewritten += m.str(0);
        } else if (!kept.empty()) {
            rewritten += std::string("[") + (chunk_form ? "chunk:" : "") + join(kept, ", ") + "]";
        } else if (!rewritten.empty() && rewritten.back() == ' ') {
            rewritten.pop_back();
        }
    }
    rewritten.append(last, sentence.cend());

    if (supported) {
        ++report_.supported_sentences;
    } else if (opt_.require_citation_per_sentence) {
        CitationViolation v;
        v.kind = ViolationKind::UncitedSentence;
        v.sentence = sentence;
        v.sentence_index = idx;
        add_violation(std::move(v), up);
    }

    if (supported || !opt_.require_citation_per_sentence) emit_accepted(rewritten, " ", up);
}

void CitationStream::evaluate_trailer(const std::string& raw, StreamUpdate* up) {
    std::string trailer = trim_text(raw);
    size_t colon = trailer.find(':');
    std::string list = colon == std::string::npos ? std::string() : trailer.substr(colon + 1);
    // Only the first line belongs to the trailer.
    std::string rest;
    size_t nl = list.find('\n');
    if (nl != std::string::npos) {
        rest = list.substr(nl + 1);
        list.resize(nl);
    }

    std::vector<std::string> kept;
    for (const auto& entry : split_trailer_entries(list)) {
        const std::string name = entry_file_name(entry);
        if (name.empty()) continue;
        if (known_sources_.count(to_lower_copy(name))) {
            kept.push_back(trim_text(entry));
            continue;
        }
        CitationViolation v;
        v.kind = ViolationKind::UnknownSource;
        v.reference = name;
        v.sentence = trailer.substr(0, trailer.find('\n'));
        v.sentence_index = report_.total_sentences;
        add_violation(std::move(v), up);
    }
    if (!kept.empty()) emit_accepted("Sources: " + join(kept, ", "), "\n\n", up);

    if (!trim_text(rest).empty()) evaluate_unit(rest, up);
}

void CitationStream::emit_accepted(const std::string& text, const char* sep, StreamUpdate* up) {
    if (opt_.policy != CitationPolicy::Redact) return;
    const std::string t = trim_text(text);
    if (t.empty()) return;
    std::string piece = accepted_any_ ? std::string(sep) + t : t;
    accepted_any_ = true;
    up->accepted += piece;
    report_.accepted_text += piece;
}

void CitationStream::add_violation(CitationViolation v, StreamUpdate* up) {
    up->violations.push_back(v);
    report_.violations.push_back(std::move(v));
}

CitationEnforcer::CitationEnforcer(CitationOptions opt) : opt_(opt) {}

CitationReport CitationEnforcer::enforce(const std::string& output, const std::vector<ContextChunk>& admitted) const {
    CitationStream s(admitted, opt_);
    s.feed(output);
    s.finish();
    return s.report();
}

CitationStream CitationEnforcer::stream(const std::vector<ContextChunk>& admitted) const {
    return CitationStream(admitted, opt_);
}

json citation_report_to_json(const CitationReport& report) {
    json violations = json::array();
    for (const auto& v : report.violations) {
        violations.push_back({
            {"kind", violation_kind_name(v.kind)},
            {"reference", v.reference},
            {"sentence", v.sentence},
            {"sentence_index", v.sentence_index}
        });
    }
    json refs = json::array();
    for (const auto& r : report.references) {
        json entry = {
            {"ref", r.raw},
            {"sentence_index", r.sentence_index},
            {"resolved", r.resolved}
        };
        if (r.resolved) entry["chunk_index"] = r.chunk_index;
        refs.push_back(entry);
    }
    return {
        {"outcome", report.outcome == StreamOutcome::Aborted ? "aborted" : "completed"},
        {"accepted_text", report.accepted_text},
        {"violations", violations},
        {"references", refs},
        {"supported_sentences", report.supported_sentences},
        {"total_sentences", report.total_sentences},
        {"all_supported", report.all_supported},
        {"retry_requested", report.retry_requested}
    };
}

std::string build_context_trailer(const std::vector<ContextChunk>& admitted) {
    json arr = json::array();
    for (const auto& c : admitted) arr.push_back(chunk_to_json(c, true));
    return std::string("\n") + kContextMarker + dump_json_safe(arr);
}

bool split_context_trailer(const std::string& stream, std::string* answer, json* chunks, std::string* err) {
    const size_t pos = stream.find(kContextMarker);
    if (pos == std::string::npos) {
        *answer = stream;
        *chunks = json::array();
        return true;
    }
    std::string head = stream.substr(0, pos);
    if (!head.empty() && head.back() == '\n') head.pop_back();

    json payload;
    if (!parse_json_body(stream.substr(pos + sizeof(kContextMarker) - 1), &payload, err)) return false;
    if (!payload.is_array()) {
        if (err) *err = "context payload is not an array";
        return false;
    }
    *answer = std::move(head);
    *chunks = std::move(payload);
    return true;
}
