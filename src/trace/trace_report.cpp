#include "trace_report.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

static const char* const REQUIRED_TRACE_FIELDS[] = {"eventType", "localSite", "remoteSite"};

std::string decode_user_dn(const std::string& dn) {
    std::string out;
    out.reserve(dn.size());
    for (size_t i = 0; i < dn.size(); i++) {
        if (dn.compare(i, 3, "%20") == 0) {
            out += ' ';
            i += 2;
        } else {
            out += dn[i];
        }
    }
    return out;
}

// ── FileTraceSink ────────────────────────────────────────────

FileTraceSink::FileTraceSink(std::string path) : path_(std::move(path)) {}

Result<void> FileTraceSink::send(const TraceReport& report) {
    std::error_code ec;
    fs::path p(path_);
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    std::ofstream out(path_, std::ios::app);
    if (!out) {
        return Result<void>::Err("cannot open trace file " + path_);
    }
    out << report.to_yaml() << "\n";
    if (!out) {
        return Result<void>::Err("failed writing trace file " + path_);
    }
    return Result<void>::Ok();
}

// ── TraceReport ──────────────────────────────────────────────

TraceReport::TraceReport(std::shared_ptr<TraceSink> sink) : sink_(std::move(sink)) {}

TraceReport& TraceReport::update(const std::string& key, const std::string& value) {
    fields_[key] = value;
    return *this;
}

TraceReport& TraceReport::update(const std::string& key, const char* value) {
    fields_[key] = std::string(value ? value : "");
    return *this;
}

TraceReport& TraceReport::update(const std::string& key, int64_t value) {
    fields_[key] = value;
    return *this;
}

TraceReport& TraceReport::update(const std::string& key, int value) {
    fields_[key] = static_cast<int64_t>(value);
    return *this;
}

TraceReport& TraceReport::update(const std::string& key, double value) {
    fields_[key] = value;
    return *this;
}

bool TraceReport::has(const std::string& key) const {
    return fields_.count(key) > 0;
}

std::optional<TraceValue> TraceReport::get(const std::string& key) const {
    auto it = fields_.find(key);
    if (it == fields_.end()) return std::nullopt;
    return it->second;
}

std::string TraceReport::get_string(const std::string& key) const {
    auto it = fields_.find(key);
    if (it == fields_.end()) return "";
    if (const auto* s = std::get_if<std::string>(&it->second)) return *s;
    return "";
}

void TraceReport::init(const JobInfo& job, const std::string& event_type) {
    update("eventType", event_type);
    update("eventVersion", "xstage");
    update("clientState", "INIT_REPORT");
    update("timeStart", now_epoch());
    update("hostname", host_name());
    update("uuid", random_hex(32));
    if (!job.pq.empty()) update("pq", job.pq);
    if (!job.taskid.empty()) update("taskid", job.taskid);
    if (!job.jobid.empty()) update("jobid", job.jobid);
    if (!job.produserid.empty()) update("usrdn", decode_user_dn(job.produserid));
    if (!job.jobdefinitionid.empty()) update("appid", job.jobdefinitionid);
}

bool TraceReport::verify() const {
    for (const char* key : REQUIRED_TRACE_FIELDS) {
        if (get_string(key).empty()) {
            xstage_warn(fmt::format("trace report is missing {}", key));
            return false;
        }
    }
    return true;
}

bool TraceReport::send() {
    if (!sink_) {
        xstage_debug("trace reporting disabled, dropping record");
        return false;
    }
    if (!verify()) {
        xstage_warn("trace report not sent: mandatory fields missing");
        return false;
    }

    try {
        auto r = sink_->send(*this);
        if (r.is_err()) {
            xstage_warn(fmt::format("failed to send trace report: {}", r.error));
            return false;
        }
    } catch (const std::exception& e) {
        xstage_warn(fmt::format("failed to send trace report: {}", e.what()));
        return false;
    }

    sent_count_++;
    xstage_debug(fmt::format("trace report sent: {}", to_yaml()));
    return true;
}

std::string TraceReport::to_yaml() const {
    YAML::Emitter out;
    out << YAML::Flow << YAML::BeginMap;
    for (const auto& [key, value] : fields_) {
        out << YAML::Key << key << YAML::Value;
        if (const auto* s = std::get_if<std::string>(&value)) {
            out << YAML::DoubleQuoted << *s;
        } else if (const auto* i = std::get_if<int64_t>(&value)) {
            out << static_cast<long long>(*i);
        } else {
            out << std::get<double>(value);
        }
    }
    out << YAML::EndMap;
    return out.c_str();
}
