#pragma once

#include <string>
#include <map>
#include <memory>
#include <variant>
#include <optional>
#include <cstdint>
#include <core/types.hpp>

using TraceValue = std::variant<std::string, int64_t, double>;

// Job identifiers copied into every trace record.
struct JobInfo {
    std::string produserid;
    std::string jobid;
    std::string taskid;
    std::string jobdefinitionid;
    std::string pq;              // queue / site name
};

// Production user DNs arrive URL-escaped on the command line ("%20" for spaces).
std::string decode_user_dn(const std::string& dn);

class TraceReport;

// Delivers one trace record somewhere.
class TraceSink {
public:
    virtual ~TraceSink() = default;
    virtual Result<void> send(const TraceReport& report) = 0;
};

// Appends one flow-style YAML record per line to a file.
class FileTraceSink : public TraceSink {
public:
    explicit FileTraceSink(std::string path);

    Result<void> send(const TraceReport& report) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Mutable accumulator of transfer lifecycle fields, flushed with send().
// Not thread safe: one report per sequential batch.
class TraceReport {
public:
    explicit TraceReport(std::shared_ptr<TraceSink> sink = nullptr);

    TraceReport& update(const std::string& key, const std::string& value);
    TraceReport& update(const std::string& key, const char* value);
    TraceReport& update(const std::string& key, int64_t value);
    TraceReport& update(const std::string& key, int value);
    TraceReport& update(const std::string& key, double value);

    bool has(const std::string& key) const;
    std::optional<TraceValue> get(const std::string& key) const;

    // String value of a field, "" if missing or not a string.
    std::string get_string(const std::string& key) const;

    // Seed the job-level fields and mark the report INIT_REPORT. usrdn is the
    // decoded produserid.
    void init(const JobInfo& job, const std::string& event_type);

    // True if the fields the trace server insists on are present.
    bool verify() const;

    // Hand the current state to the sink. Delivery problems are logged and
    // reported through the return value only; they never abort a transfer.
    bool send();

    const std::map<std::string, TraceValue>& fields() const { return fields_; }
    int sent_count() const { return sent_count_; }

    // {key: value, ...} on a single line
    std::string to_yaml() const;

private:
    std::shared_ptr<TraceSink> sink_;
    std::map<std::string, TraceValue> fields_;
    int sent_count_ = 0;
};
