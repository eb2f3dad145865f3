#pragma once

#include "guard_pipeline.h"

#include <nlohmann/json.hpp>

#include <string>

struct UpstreamOptions {
    std::string base_url = "https://api.openai.com/v1/";
    std::string model = "gpt-4o-mini";
    std::string api_key;
    double temperature = 0.2;
    int max_tokens = 200;
    int connect_timeout_sec = 10;
    int read_timeout_sec = 120;
};

struct HttpUrlParts {
    std::string scheme;
    std::string host;
    int port = 80;
    std::string base_path;  // always ends with '/'
};

bool parse_url_base(const std::string& url, HttpUrlParts* out, std::string* err);

// Streams "delta.content" pieces out of an OpenAI-compatible server-sent
// event stream. Feed raw bytes; complete "data:" lines are decoded.
class SseDeltaParser {
public:
    // Returns false when on_delta asked to stop or the stream reported an error.
    bool feed(const char* data, size_t len, const std::function<bool(const std::string&)>& on_delta);

    bool done() const { return done_; }
    const std::string& error() const { return error_; }

private:
    std::string line_;
    bool done_ = false;
    std::string error_;

    bool handle_line(const std::string& line, const std::function<bool(const std::string&)>& on_delta);
};

// Answer generator backed by POST <base_url>chat/completions with stream=true.
class UpstreamChatClient : public AnswerGenerator {
public:
    explicit UpstreamChatClient(UpstreamOptions opt);

    bool init(std::string* err);

    bool generate(const GroundedPrompt& prompt,
                  const std::function<bool(const std::string&)>& on_delta,
                  std::string* err) override;

    const UpstreamOptions& options() const { return opt_; }

private:
    UpstreamOptions opt_;
    HttpUrlParts base_;

    nlohmann::json build_request_body(const GroundedPrompt& prompt) const;
};
