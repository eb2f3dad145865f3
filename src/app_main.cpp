#include "guard_audit.h"
#include "guard_config.h"
#include "guard_pipeline.h"
#include "rag_chunk.h"
#include "rag_text.h"
#include "upstream_llm.h"

#include "json_utils.h"
#include "util.h"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using nlohmann::json;

namespace {

struct AppOptions {
    std::string host = "0.0.0.0";
    int port = 8080;
    std::string db_path = "data/guard_audit.sqlite";
    bool audit_enabled = true;
    std::string config_path;
    std::string rules_path;
    UpstreamOptions upstream;

    // Command-line overrides; applied after the config file and environment.
    std::optional<int> max_len;
    std::optional<int> top_k;
    std::optional<double> min_sem;
    std::optional<double> avg_sem;
    std::optional<double> min_hybrid;
    std::optional<double> avg_hybrid;
    std::optional<double> min_rerank;
    std::optional<double> avg_rerank;
    std::optional<int> max_retries;
    std::string citation_policy;
};

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "  --host ADDR           Listen address (default: 0.0.0.0)\n"
              << "  --port N              HTTP port (default: 8080)\n"
              << "  --db PATH             Audit log SQLite path (default: data/guard_audit.sqlite)\n"
              << "  --no-audit            Disable the audit log\n"
              << "  --config PATH         JSON config file\n"
              << "  --rules PATH          Pattern table overriding the built-in rules\n"
              << "  --upstream URL        OpenAI-compatible base URL (default: https://api.openai.com/v1/)\n"
              << "  --model NAME          Upstream model name (default: gpt-4o-mini)\n"
              << "  --max-tokens N        Completion token limit (default: 200)\n"
              << "  --max-len N           Prompt length limit in characters (default: 4000)\n"
              << "  --top-k N             Chunks considered by the coverage gate (default: 5)\n"
              << "  --min-sem X           Semantic similarity floor (default: 0.35)\n"
              << "  --avg-sem X           Semantic similarity average (default: 0.2)\n"
              << "  --min-hybrid X        Hybrid score floor (default: 0.1)\n"
              << "  --avg-hybrid X        Hybrid score average (default: 0.1)\n"
              << "  --min-rerank X        Rerank score floor (default: 0.5)\n"
              << "  --avg-rerank X        Rerank score average (default: 0.3)\n"
              << "  --citation-policy P   warn | redact | retry (default: warn)\n"
              << "  --max-retries N       Regenerations under the retry policy (default: 1)\n"
              << "  --help                Show this help\n"
              << "Environment: OPENAI_API_KEY, RAG_GUARD_MAX_LEN, RAG_GUARD_TOP_K, RAG_GUARD_MIN_SEM_SIM,\n"
              << "  RAG_GUARD_AVG_SEM_SIM, RAG_GUARD_MIN_HYBRID, RAG_GUARD_AVG_HYBRID, RAG_GUARD_MIN_RERANK,\n"
              << "  RAG_GUARD_AVG_RERANK, RAG_GUARD_CITATION_POLICY, RAG_GUARD_MAX_RETRIES\n";
}

AppOptions parse_options(int argc, char** argv) {
    AppOptions opt;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "--host" && i + 1 < argc) {
            opt.host = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            if (auto v = parse_int(argv[++i])) opt.port = *v;
        } else if (arg == "--db" && i + 1 < argc) {
            opt.db_path = argv[++i];
        } else if (arg == "--no-audit") {
            opt.audit_enabled = false;
        } else if (arg == "--config" && i + 1 < argc) {
            opt.config_path = argv[++i];
        } else if (arg == "--rules" && i + 1 < argc) {
            opt.rules_path = argv[++i];
        } else if (arg == "--upstream" && i + 1 < argc) {
            opt.upstream.base_url = argv[++i];
        } else if (arg == "--model" && i + 1 < argc) {
            opt.upstream.model = argv[++i];
        } else if (arg == "--max-tokens" && i + 1 < argc) {
            if (auto v = parse_int(argv[++i])) opt.upstream.max_tokens = std::max(1, *v);
        } else if (arg == "--max-len" && i + 1 < argc) {
            opt.max_len = parse_int(argv[++i]);
        } else if (arg == "--top-k" && i + 1 < argc) {
            opt.top_k = parse_int(argv[++i]);
        } else if (arg == "--min-sem" && i + 1 < argc) {
            opt.min_sem = parse_double(argv[++i]);
        } else if (arg == "--avg-sem" && i + 1 < argc) {
            opt.avg_sem = parse_double(argv[++i]);
        } else if (arg == "--min-hybrid" && i + 1 < argc) {
            opt.min_hybrid = parse_double(argv[++i]);
        } else if (arg == "--avg-hybrid" && i + 1 < argc) {
            opt.avg_hybrid = parse_double(argv[++i]);
        } else if (arg == "--min-rerank" && i + 1 < argc) {
            opt.min_rerank = parse_double(argv[++i]);
        } else if (arg == "--avg-rerank" && i + 1 < argc) {
            opt.avg_rerank = parse_double(argv[++i]);
        } else if (arg == "--citation-policy" && i + 1 < argc) {
            opt.citation_policy = argv[++i];
        } else if (arg == "--max-retries" && i + 1 < argc) {
            opt.max_retries = parse_int(argv[++i]);
        } else {
            std::cerr << "Warning: ignoring unknown option " << arg << "\n";
        }
    }
    return opt;
}

bool apply_cli_overrides(const AppOptions& opt, GuardConfig* cfg, std::string* err) {
    if (opt.max_len) {
        if (*opt.max_len <= 0) {
            if (err) *err = "--max-len must be positive";
            return false;
        }
        cfg->scan.max_len = static_cast<size_t>(*opt.max_len);
    }
    if (opt.top_k) {
        if (*opt.top_k <= 0) {
            if (err) *err = "--top-k must be positive";
            return false;
        }
        cfg->coverage.top_k = static_cast<size_t>(*opt.top_k);
    }
    if (opt.min_sem) cfg->coverage.semantic.floor = opt.min_sem;
    if (opt.avg_sem) cfg->coverage.semantic.average = opt.avg_sem;
    if (opt.min_hybrid) cfg->coverage.hybrid.floor = opt.min_hybrid;
    if (opt.avg_hybrid) cfg->coverage.hybrid.average = opt.avg_hybrid;
    if (opt.min_rerank) cfg->coverage.rerank.floor = opt.min_rerank;
    if (opt.avg_rerank) cfg->coverage.rerank.average = opt.avg_rerank;
    if (!opt.citation_policy.empty() && !parse_citation_policy(opt.citation_policy, &cfg->citations.policy)) {
        if (err) *err = "--citation-policy must be warn, redact or retry";
        return false;
    }
    if (opt.max_retries) cfg->max_retries = *opt.max_retries;
    if (!opt.rules_path.empty()) cfg->rules_path = opt.rules_path;
    return true;
}

void send_json(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(dump_json_safe(body), "application/json");
}

bool parse_request_json(const httplib::Request& req, httplib::Response& res, const char* tag, json* body) {
    std::string err;
    if (!parse_json_body(req.body, body, &err) || !body->is_object()) {
        if (err.empty()) err = "request body must be a JSON object";
        send_json(res, 400, make_error(400, err));
        log_event(tag, "error=\"" + truncate_for_log(err, 200) + "\"");
        return false;
    }
    return true;
}

ChunkFilter parse_filter(const json& body) {
    if (!body.contains("filters")) return ChunkFilter();
    return chunk_filter_from_json(body.at("filters"));
}

std::optional<size_t> parse_top_k(const json& body) {
    if (!body.contains("top_k") || !body.at("top_k").is_number_integer()) return std::nullopt;
    int v = body.at("top_k").get<int>();
    if (v <= 0) return std::nullopt;
    return static_cast<size_t>(v);
}

std::vector<ChatTurn> parse_messages(const json& arr) {
    std::vector<ChatTurn> out;
    for (const auto& m : arr) {
        if (!m.is_object()) continue;
        if (!m.contains("role") || !m.at("role").is_string()) continue;
        if (!m.contains("content") || !m.at("content").is_string()) continue;
        out.push_back({m.at("role").get<std::string>(), m.at("content").get<std::string>()});
    }
    return out;
}

// Retrieval happens upstream of this service; candidates travel in the
// request body. Malformed entries are dropped before the gate sees them.
class PayloadRetriever : public ChunkRetriever {
public:
    PayloadRetriever(std::vector<ContextChunk> chunks, bool present)
        : chunks_(std::move(chunks)), present_(present) {}

    bool retrieve(const std::string&, const ChunkFilter&, size_t, std::vector<ContextChunk>* out, std::string* err) override {
        if (!present_) {
            if (err) *err = "request carried no candidate chunks";
            return false;
        }
        *out = chunks_;
        return true;
    }

private:
    std::vector<ContextChunk> chunks_;
    bool present_ = false;
};

bool read_chunks(const json& body, const std::string& request_id, std::vector<ContextChunk>* chunks, json* skipped_out) {
    if (!body.contains("chunks")) return false;
    std::vector<std::string> skipped;
    std::string err;
    if (!chunks_from_json(body.at("chunks"), chunks, &skipped, &err)) {
        log_event("retrieval.error", "request_id=" + request_id + " error=\"" + truncate_for_log(err, 200) + "\"");
        return false;
    }
    if (!skipped.empty()) {
        log_event("retrieval.error", "request_id=" + request_id + " skipped=" + std::to_string(skipped.size()) +
                                         " first=\"" + truncate_for_log(skipped.front(), 200) + "\"");
    }
    if (skipped_out) *skipped_out = skipped;
    return true;
}

} // namespace

int main(int argc, char** argv) {
    AppOptions opt = parse_options(argc, argv);
    getenv_string("OPENAI_API_KEY", &opt.upstream.api_key);

    GuardConfig cfg;
    std::string cfg_err;
    if (!opt.config_path.empty() && !load_config_file(opt.config_path, &cfg, &cfg_err)) {
        std::cerr << "Config error: " << cfg_err << "\n";
        log_event("config", "ok=0 error=\"" + truncate_for_log(cfg_err, 300) + "\"");
        return 1;
    }
    if (!apply_env_overrides(&cfg, &cfg_err) || !apply_cli_overrides(opt, &cfg, &cfg_err)) {
        std::cerr << "Config error: " << cfg_err << "\n";
        log_event("config", "ok=0 error=\"" + truncate_for_log(cfg_err, 300) + "\"");
        return 1;
    }

    GuardPipeline pipeline;
    if (!pipeline.init(cfg, &cfg_err)) {
        std::cerr << "Guard init failed: " << cfg_err << "\n";
        log_event("config", "ok=0 error=\"" + truncate_for_log(cfg_err, 300) + "\"");
        return 1;
    }
    log_event("config", "ok=1 " + truncate_for_log(dump_json_safe(config_to_json(pipeline.config())), 2000));

    GuardAuditLog audit;
    bool audit_ready = false;
    if (opt.audit_enabled) {
        std::string db_err;
        std::filesystem::path db_path(opt.db_path);
        if (db_path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(db_path.parent_path(), ec);
        }
        if (audit.open(opt.db_path, &db_err)) {
            pipeline.set_audit_sink(&audit);
            audit_ready = true;
        } else {
            std::cerr << "Warning: audit log disabled, open " << opt.db_path << " failed: " << db_err << "\n";
            log_event("audit.error", "open path=" + opt.db_path + " error=\"" + db_err + "\"");
        }
    }

    UpstreamChatClient upstream(opt.upstream);
    {
        std::string up_err;
        if (!upstream.init(&up_err)) {
            std::cerr << "Upstream error: " << up_err << "\n";
            return 1;
        }
    }

    log_event("startup", "rules_version=" + pipeline.catalog().version() +
                             " rules=" + std::to_string(pipeline.catalog().rule_count()) +
                             " strip_rules=" + std::to_string(pipeline.catalog().strip_rules().size()) +
                             " policy=" + citation_policy_name(pipeline.config().citations.policy) +
                             " audit=" + std::string(audit_ready ? "1" : "0") +
                             " upstream=" + opt.upstream.base_url +
                             " model=" + opt.upstream.model);

    httplib::Server server;
    server.set_read_timeout(std::chrono::seconds(120));
    server.set_payload_max_length(32ULL * 1024 * 1024);
    server.set_exception_handler([&](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        try {
            if (ep) std::rethrow_exception(ep);
            throw std::runtime_error("unknown exception");
        } catch (const std::exception& e) {
            log_event("http.exception", "path=" + req.path + " what=" + std::string(e.what()));
            send_json(res, 500, make_error(500, std::string("Internal error: ") + e.what()));
        }
    });
    server.set_error_handler([&](const httplib::Request& req, httplib::Response& res) {
        if (req.path.rfind("/api/", 0) == 0 && res.body.empty()) {
            const int status = res.status ? res.status : 500;
            res.set_content(dump_json_safe(make_error(status, status == 404 ? "Not Found" : "Internal Server Error")),
                            "application/json");
        }
    });
    server.set_logger([&](const httplib::Request& req, const httplib::Response& res) {
        log_event("http", req.method + " " + req.path + " status=" + std::to_string(res.status));
    });

    server.Get("/api/health", [&](const httplib::Request&, httplib::Response& res) {
        send_json(res, 200, {
            {"status", "ok"},
            {"rules_version", pipeline.catalog().version()},
            {"rule_count", pipeline.catalog().rule_count()},
            {"citation_policy", citation_policy_name(pipeline.config().citations.policy)},
            {"audit", audit_ready}
        });
    });

    server.Get("/api/catalog", [&](const httplib::Request&, httplib::Response& res) {
        json out = pipeline.catalog().describe();
        out["config"] = config_to_json(pipeline.config());
        send_json(res, 200, out);
    });

    server.Post("/api/scan", [&](const httplib::Request& req, httplib::Response& res) {
        json body;
        if (!parse_request_json(req, res, "guard.scan", &body)) return;
        if (!body.contains("text") || !body.at("text").is_string()) {
            send_json(res, 400, make_error(400, "`text` must be a string"));
            return;
        }
        const std::string text = body.at("text").get<std::string>();
        ScanVerdict v;
        if (body.contains("max_len") && body.at("max_len").is_number_integer() && body.at("max_len").get<int>() > 0) {
            v = pipeline.scanner().scan(text, static_cast<size_t>(body.at("max_len").get<int>()));
        } else {
            v = pipeline.scanner().scan(text);
        }
        send_json(res, 200, verdict_to_json(v));
    });

    server.Post("/api/scrub", [&](const httplib::Request& req, httplib::Response& res) {
        json body;
        if (!parse_request_json(req, res, "guard.scrub", &body)) return;
        if (body.contains("text") && body.at("text").is_string()) {
            size_t replaced = 0;
            std::string out = pipeline.scrubber().scrub(body.at("text").get<std::string>(), &replaced);
            send_json(res, 200, {{"text", out}, {"replaced", replaced}});
            return;
        }
        std::vector<ContextChunk> chunks;
        json skipped = json::array();
        const std::string request_id = make_request_id();
        if (!read_chunks(body, request_id, &chunks, &skipped)) {
            send_json(res, 400, make_error(400, "expected `text` string or `chunks` array"));
            return;
        }
        json out_chunks = json::array();
        size_t total = 0;
        for (const auto& c : chunks) {
            size_t replaced = 0;
            out_chunks.push_back(chunk_to_json(pipeline.scrubber().scrub_chunk(c, &replaced)));
            total += replaced;
        }
        send_json(res, 200, {{"chunks", out_chunks}, {"replaced", total}, {"skipped", skipped}});
    });

    server.Post("/api/admit", [&](const httplib::Request& req, httplib::Response& res) {
        json body;
        if (!parse_request_json(req, res, "guard.coverage", &body)) return;
        const std::string request_id = make_request_id();
        std::vector<ContextChunk> chunks;
        json skipped = json::array();
        if (!read_chunks(body, request_id, &chunks, &skipped)) {
            send_json(res, 400, make_error(400, "`chunks` must be an array"));
            return;
        }
        const size_t top_k = parse_top_k(body).value_or(pipeline.config().coverage.top_k);
        CoverageDecision d = pipeline.prepare_context(request_id, chunks, parse_filter(body), top_k);
        json out = coverage_to_json(d, true);
        out["request_id"] = request_id;
        out["skipped"] = skipped;
        if (!d.confident) out["message"] = no_answer_message();
        send_json(res, 200, out);
    });

    server.Post("/api/citations", [&](const httplib::Request& req, httplib::Response& res) {
        json body;
        if (!parse_request_json(req, res, "guard.citations", &body)) return;
        if (!body.contains("answer") || !body.at("answer").is_string()) {
            send_json(res, 400, make_error(400, "`answer` must be a string"));
            return;
        }
        const std::string request_id = make_request_id();
        std::vector<ContextChunk> chunks;
        if (!read_chunks(body, request_id, &chunks, nullptr)) {
            send_json(res, 400, make_error(400, "`chunks` must be an array"));
            return;
        }
        CitationReport report = pipeline.review(request_id, body.at("answer").get<std::string>(), chunks);
        json out = citation_report_to_json(report);
        out["request_id"] = request_id;
        out["policy"] = citation_policy_name(pipeline.config().citations.policy);
        send_json(res, 200, out);
    });

    server.Post("/api/chat", [&](const httplib::Request& req, httplib::Response& res) {
        json body;
        if (!parse_request_json(req, res, "guard.scan", &body)) return;
        if (!body.contains("messages") || !body.at("messages").is_array()) {
            send_json(res, 400, make_error(400, "`messages` must be an array"));
            return;
        }

        ChatRequest chat;
        chat.request_id = make_request_id();
        chat.messages = parse_messages(body.at("messages"));
        chat.filter = parse_filter(body);
        chat.top_k = parse_top_k(body);

        ChatResult gate_result;
        if (!pipeline.accept_request(chat, &gate_result)) {
            json errj = make_error(400, gate_result.error);
            if (gate_result.outcome == ChatOutcome::Rejected) {
                errj["flagged"] = true;
                errj["message"] = gate_result.error;
                if (gate_result.verdict.category) errj["category"] = category_id(*gate_result.verdict.category);
            }
            send_json(res, 400, errj);
            return;
        }

        std::vector<ContextChunk> chunks;
        const bool has_chunks = read_chunks(body, chat.request_id, &chunks, nullptr);
        auto retriever = std::make_shared<PayloadRetriever>(std::move(chunks), has_chunks);

        log_event("guard.scan", "request_id=" + chat.request_id + " flagged=0 messages=" +
                                    std::to_string(chat.messages.size()) + " query=\"" +
                                    truncate_for_log(gate_result.query, 200) + "\"");

        res.set_header("Cache-Control", "no-cache");
        res.set_chunked_content_provider(
            "text/plain; charset=utf-8",
            [&pipeline, &upstream, chat, retriever](size_t, httplib::DataSink& sink) {
                auto write = [&sink](const std::string& s) { return sink.write(s.data(), s.size()); };
                ChatRequest live = chat;
                live.connected = [&sink] { return !sink.is_writable || sink.is_writable(); };
                ChatResult result = pipeline.answer_request(live, *retriever, upstream, write);
                log_event("guard.stream", "request_id=" + chat.request_id +
                                              " outcome=" + chat_outcome_name(result.outcome) +
                                              " attempts=" + std::to_string(result.attempts) +
                                              " violations=" + std::to_string(result.citations.violations.size()));
                if (result.outcome != ChatOutcome::Aborted) sink.done();
                return result.outcome != ChatOutcome::Aborted;
            });
    });

    server.Get("/api/audit", [&](const httplib::Request& req, httplib::Response& res) {
        if (!audit_ready) {
            send_json(res, 503, make_error(503, "audit log disabled"));
            return;
        }
        size_t limit = 100;
        size_t offset = 0;
        if (req.has_param("limit")) {
            if (auto v = parse_int(req.get_param_value("limit"))) limit = static_cast<size_t>(std::clamp(*v, 1, 1000));
        }
        if (req.has_param("offset")) {
            if (auto v = parse_int(req.get_param_value("offset"))) offset = static_cast<size_t>(std::max(0, *v));
        }
        json events = json::array();
        for (const auto& ev : audit.recent(limit, offset)) events.push_back(guard_event_to_json(ev));
        send_json(res, 200, {{"events", events}, {"total", audit.count()}, {"limit", limit}, {"offset", offset}});
    });

    std::cout << "rag_guard listening on http://" << opt.host << ":" << opt.port << "\n";
    std::cout << "POST /api/chat, /api/scan, /api/scrub, /api/admit, /api/citations\n";
    if (!server.listen(opt.host, opt.port)) {
        std::cerr << "listen failed on " << opt.host << ":" << opt.port << "\n";
        return 1;
    }
    return 0;
}
