#include "upstream_llm.h"

#include "json_utils.h"
#include "rag_text.h"
#include "util.h"

#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

using nlohmann::json;

namespace {

template <typename ClientT>
bool stream_chat_completion(ClientT& cli,
                            const UpstreamOptions& opt,
                            const std::string& path,
                            const std::string& body,
                            const std::function<bool(const std::string&)>& on_delta,
                            std::string* err) {
    cli.set_connection_timeout(opt.connect_timeout_sec);
    cli.set_read_timeout(opt.read_timeout_sec);

    SseDeltaParser parser;
    bool stopped = false;
    std::string raw_head;

    httplib::Request req;
    req.method = "POST";
    req.path = path;
    req.body = body;
    req.set_header("Content-Type", "application/json");
    req.set_header("Accept", "text/event-stream");
    if (!opt.api_key.empty()) req.set_header("Authorization", "Bearer " + opt.api_key);
    req.content_receiver = [&](const char* data, size_t len, uint64_t, uint64_t) {
        if (raw_head.size() < 512) raw_head.append(data, std::min(len, 512 - raw_head.size()));
        if (!parser.feed(data, len, on_delta)) {
            stopped = true;
            return false;
        }
        return !parser.done();
    };

    auto res = cli.send(req);
    if (stopped && parser.error().empty()) return true;
    if (!parser.error().empty()) {
        if (err) *err = "upstream error: " + parser.error();
        return false;
    }
    if (parser.done()) return true;
    if (!res) {
        if (err) *err = "upstream request failed: " + httplib::to_string(res.error());
        return false;
    }
    if (res->status != 200) {
        if (err) *err = "upstream status " + std::to_string(res->status) + ": " + truncate_for_log(raw_head, 300);
        return false;
    }
    return true;
}

} // namespace

bool parse_url_base(const std::string& url_in, HttpUrlParts* out, std::string* err) {
    if (!out) return false;
    auto pos = url_in.find("://");
    if (pos == std::string::npos) {
        if (err) *err = "missing scheme";
        return false;
    }
    std::string scheme = url_in.substr(0, pos);
    std::string rest = url_in.substr(pos + 3);
    if (scheme != "http" && scheme != "https") {
        if (err) *err = "unsupported scheme: " + scheme;
        return false;
    }

    std::string host_port;
    std::string path = "/";
    auto slash = rest.find('/');
    if (slash == std::string::npos) {
        host_port = rest;
    } else {
        host_port = rest.substr(0, slash);
        path = rest.substr(slash);
    }

    std::string host = host_port;
    int port = (scheme == "https") ? 443 : 80;
    auto colon = host_port.rfind(':');
    if (colon != std::string::npos && colon + 1 < host_port.size()) {
        bool all_digits = true;
        for (size_t i = colon + 1; i < host_port.size(); ++i) {
            if (!std::isdigit(static_cast<unsigned char>(host_port[i]))) {
                all_digits = false;
                break;
            }
        }
        if (all_digits) {
            host = host_port.substr(0, colon);
            port = std::atoi(host_port.substr(colon + 1).c_str());
            if (port <= 0 || port > 65535) {
                if (err) *err = "invalid port";
                return false;
            }
        }
    }

    if (host.empty()) {
        if (err) *err = "missing host";
        return false;
    }
    if (path.empty()) path = "/";
    if (path.back() != '/') path.push_back('/');

    out->scheme = scheme;
    out->host = host;
    out->port = port;
    out->base_path = path;
    return true;
}

bool SseDeltaParser::feed(const char* data, size_t len, const std::function<bool(const std::string&)>& on_delta) {
    for (size_t i = 0; i < len; ++i) {
        if (done_) return true;
        char c = data[i];
        if (c != '\n') {
            line_.push_back(c);
            continue;
        }
        std::string line;
        line.swap(line_);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!handle_line(line, on_delta)) return false;
    }
    return true;
}

bool SseDeltaParser::handle_line(const std::string& line, const std::function<bool(const std::string&)>& on_delta) {
    if (line.compare(0, 5, "data:") != 0) return true;
    const std::string payload = trim_text(line.substr(5));
    if (payload.empty()) return true;
    if (payload == "[DONE]") {
        done_ = true;
        return true;
    }

    json j;
    std::string parse_err;
    if (!parse_json_body(payload, &j, &parse_err)) {
        log_event("upstream.error", "skip sse line: " + truncate_for_log(parse_err, 200));
        return true;
    }
    if (j.contains("error")) {
        const json& e = j.at("error");
        error_ = e.is_object() ? e.value("message", std::string("unknown error")) : e.dump();
        return false;
    }
    if (!j.contains("choices") || !j.at("choices").is_array() || j.at("choices").empty()) return true;
    const json& choice = j.at("choices").at(0);
    if (!choice.contains("delta") || !choice.at("delta").is_object()) return true;
    const json& delta = choice.at("delta");
    if (!delta.contains("content") || !delta.at("content").is_string()) return true;
    const std::string content = delta.at("content").get<std::string>();
    if (content.empty()) return true;
    return on_delta(content);
}

UpstreamChatClient::UpstreamChatClient(UpstreamOptions opt) : opt_(std::move(opt)) {}

bool UpstreamChatClient::init(std::string* err) {
    std::string parse_err;
    if (!parse_url_base(opt_.base_url, &base_, &parse_err)) {
        if (err) *err = "invalid upstream url: " + parse_err;
        return false;
    }
    return true;
}

json UpstreamChatClient::build_request_body(const GroundedPrompt& prompt) const {
    json messages = json::array();
    messages.push_back({{"role", "system"}, {"content", prompt.system}});
    for (const auto& turn : prompt.history) {
        messages.push_back({{"role", turn.role}, {"content", turn.content}});
    }
    messages.push_back({{"role", "user"}, {"content", prompt.user}});
    return {
        {"model", opt_.model},
        {"messages", messages},
        {"stream", true},
        {"temperature", opt_.temperature},
        {"max_tokens", opt_.max_tokens}
    };
}

bool UpstreamChatClient::generate(const GroundedPrompt& prompt,
                                  const std::function<bool(const std::string&)>& on_delta,
                                  std::string* err) {
    if (base_.host.empty()) {
        if (err) *err = "upstream client not initialized";
        return false;
    }
    const std::string path = base_.base_path + "chat/completions";
    const std::string body = dump_json_safe(build_request_body(prompt));
    if (base_.scheme == "https") {
        httplib::SSLClient cli(base_.host, base_.port);
        cli.enable_server_certificate_verification(true);
        return stream_chat_completion(cli, opt_, path, body, on_delta, err);
    }
    httplib::Client cli(base_.host, base_.port);
    return stream_chat_completion(cli, opt_, path, body, on_delta, err);
}
