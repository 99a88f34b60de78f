#include "frameport/exporter/observability.hpp"
#include "frameport/exporter/settings.hpp"
#include <prometheus/text_serializer.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <vector>

namespace frameport {
namespace exporter {

using json = nlohmann::json;

// Secret fields to filter
static const std::vector<std::string> SECRET_FIELDS = {
    "password", "api_key", "secret", "token", "access_token",
    "refresh_token", "authorization", "cookie", "x-figma-token"
};

// Case-insensitive substring match against SECRET_FIELDS
static bool is_secret_field(const std::string& field_name) {
    std::string lower_field = field_name;
    std::transform(lower_field.begin(), lower_field.end(), lower_field.begin(), ::tolower);

    for (const auto& secret_field : SECRET_FIELDS) {
        if (lower_field.find(secret_field) != std::string::npos) {
            return true;
        }
    }
    return false;
}

static void filter_secrets(json& obj) {
    if (obj.is_object()) {
        for (auto it = obj.begin(); it != obj.end(); ++it) {
            if (is_secret_field(it.key())) {
                it.value() = "[REDACTED]";
            } else if (it.value().is_object() || it.value().is_array()) {
                filter_secrets(it.value());
            }
        }
    } else if (obj.is_array()) {
        for (auto& item : obj) {
            if (item.is_object() || item.is_array()) {
                filter_secrets(item);
            }
        }
    }
}

// ISO 8601 timestamp with microseconds, UTC
static std::string get_iso8601_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()) % 1000000;

    std::tm tm_buf;
    gmtime_r(&time_t, &tm_buf);

    char buf[32];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06ldZ",
             tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
             tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
             static_cast<long>(microseconds.count()));

    return std::string(buf);
}

static const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::debug:
            return "DEBUG";
        case LogLevel::info:
            return "INFO";
        case LogLevel::warn:
            return "WARN";
        case LogLevel::error:
            return "ERROR";
    }
    return "INFO";
}

Observability::Observability(const std::string& component)
    : Observability(component, Settings::is_metrics_enabled()) {}

Observability::Observability(const std::string& component, bool metrics_enabled)
    : component_(component),
      level_(parse_level(Settings::log_level())),
      metrics_enabled_(metrics_enabled),
      registry_(std::make_shared<prometheus::Registry>()) {
    initialize_metrics();
}

void Observability::initialize_metrics() {
    if (!metrics_enabled_) {
        return;
    }

    requests_total_family_ = &prometheus::BuildCounter()
        .Name("frameport_requests_total")
        .Help("Outbound requests by kind and outcome")
        .Register(*registry_);

    retries_total_family_ = &prometheus::BuildCounter()
        .Name("frameport_retries_total")
        .Help("Retries scheduled by the retry policy")
        .Register(*registry_);

    rate_limit_hits_total_family_ = &prometheus::BuildCounter()
        .Name("frameport_rate_limit_hits_total")
        .Help("HTTP 429 responses received")
        .Register(*registry_);

    exports_total_family_ = &prometheus::BuildCounter()
        .Name("frameport_exports_total")
        .Help("Nodes finished by outcome")
        .Register(*registry_);

    transfer_duration_seconds_family_ = &prometheus::BuildHistogram()
        .Name("frameport_transfer_duration_seconds")
        .Help("Duration of one download attempt in seconds")
        .Register(*registry_);

    active_transfers_family_ = &prometheus::BuildGauge()
        .Name("frameport_active_transfers")
        .Help("Downloads currently in flight")
        .Register(*registry_);
}

LogLevel Observability::parse_level(const std::string& value) {
    std::string upper = value;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
    if (upper == "DEBUG") return LogLevel::debug;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::warn;
    if (upper == "ERROR") return LogLevel::error;
    return LogLevel::info;
}

void Observability::set_output(std::ostream* out) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    output_ = out;
}

void Observability::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    level_ = level;
}

LogLevel Observability::level() const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    return level_;
}

void Observability::log_info(const std::string& message,
                             const std::string& job_id,
                             const std::string& source_id,
                             const std::string& node_id,
                             const std::unordered_map<std::string, std::string>& context) {
    write(LogLevel::info, message, job_id, source_id, node_id, context);
}

void Observability::log_warn(const std::string& message,
                             const std::string& job_id,
                             const std::string& source_id,
                             const std::string& node_id,
                             const std::unordered_map<std::string, std::string>& context) {
    write(LogLevel::warn, message, job_id, source_id, node_id, context);
}

void Observability::log_error(const std::string& message,
                              const std::string& job_id,
                              const std::string& source_id,
                              const std::string& node_id,
                              const std::unordered_map<std::string, std::string>& context) {
    write(LogLevel::error, message, job_id, source_id, node_id, context);
}

void Observability::log_debug(const std::string& message,
                              const std::string& job_id,
                              const std::string& source_id,
                              const std::string& node_id,
                              const std::unordered_map<std::string, std::string>& context) {
    write(LogLevel::debug, message, job_id, source_id, node_id, context);
}

void Observability::write(LogLevel level,
                          const std::string& message,
                          const std::string& job_id,
                          const std::string& source_id,
                          const std::string& node_id,
                          const std::unordered_map<std::string, std::string>& context) {
    std::string line = format_json_log(level_name(level), message, job_id, source_id, node_id, context);

    std::lock_guard<std::mutex> lock(log_mutex_);
    if (level < level_) {
        return;
    }
    std::ostream& out = output_ != nullptr ? *output_ : (level == LogLevel::error ? std::cerr : std::cout);
    out << line << std::endl;
}

std::string Observability::format_json_log(const std::string& level,
                                           const std::string& message,
                                           const std::string& job_id,
                                           const std::string& source_id,
                                           const std::string& node_id,
                                           const std::unordered_map<std::string, std::string>& context) const {
    json log_entry;

    // Required fields (always present)
    log_entry["timestamp"] = get_iso8601_timestamp();
    log_entry["level"] = level;
    log_entry["component"] = component_;
    log_entry["message"] = message;

    // Correlation fields (at top level, when provided)
    if (!job_id.empty()) {
        log_entry["job_id"] = job_id;
    }
    if (!source_id.empty()) {
        log_entry["source_id"] = source_id;
    }
    if (!node_id.empty()) {
        log_entry["node_id"] = node_id;
    }

    json context_obj = json::object();
    for (const auto& [key, value] : context) {
        context_obj[key] = value;
    }
    filter_secrets(context_obj);

    if (!context_obj.empty()) {
        log_entry["context"] = context_obj;
    }

    return log_entry.dump();
}

void Observability::record_request(const std::string& kind, const std::string& outcome) {
    if (!metrics_enabled_) {
        return;
    }
    requests_total_family_->Add({{"kind", kind}, {"outcome", outcome}}).Increment();
}

void Observability::record_retry(const std::string& kind) {
    if (!metrics_enabled_) {
        return;
    }
    retries_total_family_->Add({{"kind", kind}}).Increment();
}

void Observability::record_rate_limit_hit(const std::string& kind) {
    if (!metrics_enabled_) {
        return;
    }
    rate_limit_hits_total_family_->Add({{"kind", kind}}).Increment();
}

void Observability::record_export(const std::string& outcome) {
    if (!metrics_enabled_) {
        return;
    }
    exports_total_family_->Add({{"outcome", outcome}}).Increment();
}

void Observability::record_transfer_duration(double duration_seconds) {
    if (!metrics_enabled_) {
        return;
    }
    auto& histogram = transfer_duration_seconds_family_->Add(
        {}, prometheus::Histogram::BucketBoundaries{0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0, 30.0, 60.0});
    histogram.Observe(duration_seconds);
}

void Observability::transfer_started() {
    if (!metrics_enabled_) {
        return;
    }
    active_transfers_family_->Add({}).Increment();
}

void Observability::transfer_finished() {
    if (!metrics_enabled_) {
        return;
    }
    active_transfers_family_->Add({}).Decrement();
}

std::string Observability::metrics_text() const {
    if (!metrics_enabled_) {
        return ""; // Empty if metrics are disabled
    }
    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
}

} // namespace exporter
} // namespace frameport
