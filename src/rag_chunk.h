#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <set>
#include <string>
#include <vector>

// Retrieval scores of one chunk. A score the retriever did not compute stays
// empty and is skipped by every gate check.
struct ChunkScores {
    std::optional<double> semantic;
    std::optional<double> hybrid;
    std::optional<double> rerank;
    std::optional<double> bm25;
};

struct ContextChunk {
    std::string chunk_id;
    std::string source;
    int page = 0;
    std::string text;
    std::set<std::string> tags;
    ChunkScores scores;

    // Ownership scoping, as stored by the ingestion side.
    std::string dept_id;
    std::string user_id;
    bool file_for_user = false;
    std::string file_id;
    std::string ext;
};

struct RequestScope {
    std::string dept_id;
    std::string user_id;
};

// Tags arrive either as a JSON array or as the comma separated string the
// ingestion side stores; both normalize to trimmed lower case.
std::set<std::string> parse_tags(const nlohmann::json& j);

// "PDF", ".pdf" and " pdf " all become "pdf".
std::string normalize_ext(const std::string& ext);

// The stored extension, or the one on the source file name when none was stored.
std::string chunk_ext(const ContextChunk& chunk);

bool chunk_from_json(const nlohmann::json& j, ContextChunk* out, std::string* err);
bool chunks_from_json(const nlohmann::json& j, std::vector<ContextChunk>* out, std::vector<std::string>* skipped, std::string* err);
nlohmann::json chunk_to_json(const ContextChunk& chunk, bool include_text = true);
