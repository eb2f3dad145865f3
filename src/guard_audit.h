#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

// One guard decision worth keeping for operators: a rejected prompt, an
// insufficient-evidence answer, a citation violation, a retry.
struct GuardEvent {
    int64_t id = 0;
    int64_t ts_ms = 0;
    std::string request_id;
    std::string stage;     // scan | coverage | citations | retry | stream | upstream
    std::string category;  // category id, violation kind or outcome
    std::string detail;
};

class GuardAuditSink {
public:
    virtual ~GuardAuditSink() = default;
    virtual void record(const GuardEvent& ev) = 0;
};

// sqlite-backed audit trail. Safe to share between request threads.
class GuardAuditLog : public GuardAuditSink {
public:
    GuardAuditLog();
    ~GuardAuditLog() override;
    GuardAuditLog(const GuardAuditLog&) = delete;
    GuardAuditLog& operator=(const GuardAuditLog&) = delete;

    bool open(const std::string& path, std::string* err);

    // Failures are logged, never thrown; auditing must not break a request.
    void record(const GuardEvent& ev) override;

    // Most recent first.
    std::vector<GuardEvent> recent(size_t limit = 100, size_t offset = 0) const;
    size_t count() const;

private:
    struct sqlite3* db_ = nullptr;
    mutable std::mutex mu_;

    bool exec(const std::string& sql, std::string* err) const;
    bool ensure_schema(std::string* err);
};

nlohmann::json guard_event_to_json(const GuardEvent& ev);
