#include "rag_chunk.h"

#include "rag_text.h"

using nlohmann::json;

namespace {

bool read_score(const json& scores, const char* key, std::optional<double>* out, std::string* err) {
    auto it = scores.find(key);
    if (it == scores.end() || it->is_null()) return true;
    if (!it->is_number()) {
        if (err) *err = std::string("score '") + key + "' is not a number";
        return false;
    }
    *out = it->get<double>();
    return true;
}

std::string string_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return {};
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number_integer()) return std::to_string(it->get<long long>());
    return it->dump();
}

void put_score(json& scores, const char* key, const std::optional<double>& v) {
    if (v) scores[key] = *v;
    else scores[key] = nullptr;
}

} // namespace

std::set<std::string> parse_tags(const json& j) {
    std::set<std::string> tags;
    if (j.is_string()) {
        for (auto& t : split_comma_list(j.get<std::string>())) tags.insert(to_lower_copy(t));
    } else if (j.is_array()) {
        for (const auto& item : j) {
            if (!item.is_string()) continue;
            std::string t = trim_text(item.get<std::string>());
            if (!t.empty()) tags.insert(to_lower_copy(t));
        }
    }
    return tags;
}

std::string normalize_ext(const std::string& ext) {
    std::string e = to_lower_copy(trim_text(ext));
    size_t dots = 0;
    while (dots < e.size() && e[dots] == '.') ++dots;
    return e.substr(dots);
}

std::string chunk_ext(const ContextChunk& chunk) {
    if (!chunk.ext.empty()) return normalize_ext(chunk.ext);
    const std::string name = path_basename(chunk.source);
    const size_t dot = name.find_last_of('.');
    if (dot == std::string::npos || dot == 0) return std::string();
    return normalize_ext(name.substr(dot + 1));
}

bool chunk_from_json(const json& j, ContextChunk* out, std::string* err) {
    if (!out) return false;
    if (!j.is_object()) {
        if (err) *err = "chunk must be an object";
        return false;
    }

    ContextChunk chunk;
    chunk.chunk_id = string_field(j, "chunk_id");
    chunk.source = string_field(j, "source");
    chunk.file_id = string_field(j, "file_id");
    chunk.ext = string_field(j, "ext");
    chunk.dept_id = string_field(j, "dept_id");
    chunk.user_id = string_field(j, "user_id");

    // The retrieval side names the text field "chunk"; "text" is accepted too.
    auto text_it = j.find("text");
    if (text_it == j.end()) text_it = j.find("chunk");
    if (text_it != j.end() && !text_it->is_null()) {
        if (!text_it->is_string()) {
            if (err) *err = "chunk text must be a string";
            return false;
        }
        chunk.text = text_it->get<std::string>();
    }

    auto page_it = j.find("page");
    if (page_it != j.end() && page_it->is_number_integer()) chunk.page = page_it->get<int>();

    auto ffu_it = j.find("file_for_user");
    if (ffu_it != j.end() && ffu_it->is_boolean()) chunk.file_for_user = ffu_it->get<bool>();

    auto tags_it = j.find("tags");
    if (tags_it != j.end()) chunk.tags = parse_tags(*tags_it);

    // Scores may sit in a nested "scores" object or flat on the chunk, using
    // the retrieval side's field names.
    const json* scores = &j;
    auto scores_it = j.find("scores");
    if (scores_it != j.end() && scores_it->is_object()) scores = &*scores_it;

    if (!read_score(*scores, "semantic", &chunk.scores.semantic, err)) return false;
    if (!chunk.scores.semantic && !read_score(*scores, "sem_sim", &chunk.scores.semantic, err)) return false;
    if (!read_score(*scores, "hybrid", &chunk.scores.hybrid, err)) return false;
    if (!read_score(*scores, "rerank", &chunk.scores.rerank, err)) return false;
    if (!read_score(*scores, "bm25", &chunk.scores.bm25, err)) return false;

    *out = std::move(chunk);
    return true;
}

bool chunks_from_json(const json& j, std::vector<ContextChunk>* out, std::vector<std::string>* skipped, std::string* err) {
    if (!out) return false;
    if (!j.is_array()) {
        if (err) *err = "`chunks` must be an array";
        return false;
    }
    out->clear();
    out->reserve(j.size());
    for (size_t i = 0; i < j.size(); ++i) {
        ContextChunk chunk;
        std::string chunk_err;
        if (!chunk_from_json(j[i], &chunk, &chunk_err)) {
            // Malformed entries are dropped, never admitted with defaults.
            if (skipped) skipped->push_back("#" + std::to_string(i) + ": " + chunk_err);
            continue;
        }
        out->push_back(std::move(chunk));
    }
    return true;
}

json chunk_to_json(const ContextChunk& chunk, bool include_text) {
    json scores = json::object();
    put_score(scores, "semantic", chunk.scores.semantic);
    put_score(scores, "hybrid", chunk.scores.hybrid);
    put_score(scores, "rerank", chunk.scores.rerank);
    put_score(scores, "bm25", chunk.scores.bm25);

    json tags = json::array();
    for (const auto& t : chunk.tags) tags.push_back(t);

    json out = {
        {"chunk_id", sanitize_utf8_strict(chunk.chunk_id)},
        {"source", sanitize_utf8_strict(chunk.source)},
        {"page", chunk.page},
        {"tags", tags},
        {"scores", scores},
        {"file_id", chunk.file_id},
        {"ext", chunk.ext}
    };
    if (include_text) out["text"] = sanitize_utf8_strict(chunk.text);
    return out;
}
