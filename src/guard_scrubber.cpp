#include "guard_scrubber.h"

#include <iterator>

namespace {

// Runs of four or more newlines shrink to three.
bool collapse_newlines(std::string& text) {
    std::string out;
    out.reserve(text.size());
    size_t run = 0;
    bool changed = false;
    for (char c : text) {
        if (c == '\n') {
            if (++run > 3) {
                changed = true;
                continue;
            }
        } else {
            run = 0;
        }
        out.push_back(c);
    }
    if (changed) text.swap(out);
    return changed;
}

} // namespace

ContextScrubber::ContextScrubber() : rules_(&PatternCatalog::builtin().strip_rules()) {}

bool ContextScrubber::init(const PatternCatalog& catalog, const ScrubOptions& opt, std::string* err) {
    if (opt.max_passes == 0) {
        if (err) *err = "scrub max_passes must be positive";
        return false;
    }
    for (const auto& rule : catalog.strip_rules()) {
        if (std::regex_search(opt.placeholder, rule.regex)) {
            if (err) *err = "placeholder '" + opt.placeholder + "' matches strip rule '" + rule.pattern + "'";
            return false;
        }
    }
    rules_ = &catalog.strip_rules();
    opt_ = opt;
    return true;
}

bool ContextScrubber::apply_pass(std::string& text, const std::string& replacement, size_t* replaced) const {
    bool changed = collapse_newlines(text);
    for (const auto& rule : *rules_) {
        auto begin = std::sregex_iterator(text.begin(), text.end(), rule.regex);
        auto end = std::sregex_iterator();
        if (begin == end) continue;

        std::string out;
        out.reserve(text.size());
        auto last = text.cbegin();
        for (auto it = begin; it != end; ++it) {
            const auto& m = *it;
            out.append(last, m[0].first);
            out += replacement;
            last = m[0].second;
            if (replaced) ++*replaced;
        }
        out.append(last, text.cend());
        text.swap(out);
        changed = true;
    }
    return changed;
}

std::string ContextScrubber::scrub(const std::string& text, size_t* replaced) const {
    if (replaced) *replaced = 0;
    if (text.empty()) return {};

    std::string out = text;
    for (size_t pass = 0; pass < opt_.max_passes; ++pass) {
        if (!apply_pass(out, opt_.placeholder, replaced)) return out;
    }

    // Placeholders keep combining with neighbouring text into new matches;
    // drop the matches outright. Every pass shortens the text, so this ends.
    while (apply_pass(out, std::string(), replaced)) {
    }
    return out;
}

ContextChunk ContextScrubber::scrub_chunk(const ContextChunk& chunk, size_t* replaced) const {
    ContextChunk copy = chunk;
    copy.text = scrub(chunk.text, replaced);
    return copy;
}
