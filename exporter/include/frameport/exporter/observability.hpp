#pragma once

#include "frameport/exporter/core.hpp"
#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>
#include <cstdint>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <unordered_map>

namespace frameport {
namespace exporter {

enum class LogLevel {
    debug = 0,
    info = 1,
    warn = 2,
    error = 3
};

class Observability {
public:
    // Metrics follow FRAMEPORT_METRICS_ENABLED
    explicit Observability(const std::string& component = "exporter");
    Observability(const std::string& component, bool metrics_enabled);
    ~Observability() = default;

    Observability(const Observability&) = delete;
    Observability& operator=(const Observability&) = delete;

    // Logging
    void log_info(const std::string& message,
                  const std::string& job_id = "",
                  const std::string& source_id = "",
                  const std::string& node_id = "",
                  const std::unordered_map<std::string, std::string>& context = {});

    void log_warn(const std::string& message,
                  const std::string& job_id = "",
                  const std::string& source_id = "",
                  const std::string& node_id = "",
                  const std::unordered_map<std::string, std::string>& context = {});

    void log_error(const std::string& message,
                   const std::string& job_id = "",
                   const std::string& source_id = "",
                   const std::string& node_id = "",
                   const std::unordered_map<std::string, std::string>& context = {});

    void log_debug(const std::string& message,
                   const std::string& job_id = "",
                   const std::string& source_id = "",
                   const std::string& node_id = "",
                   const std::unordered_map<std::string, std::string>& context = {});

    // Send every level to `out` instead of stdout/stderr; nullptr restores the default
    void set_output(std::ostream* out);
    void set_level(LogLevel level);
    LogLevel level() const;

    static LogLevel parse_level(const std::string& value);

    // Metrics (gated behind FRAMEPORT_METRICS_ENABLED)
    // kind: "hierarchy" | "resolve" | "transfer"
    void record_request(const std::string& kind, const std::string& outcome);
    void record_retry(const std::string& kind);
    void record_rate_limit_hit(const std::string& kind);
    void record_export(const std::string& outcome);
    void record_transfer_duration(double duration_seconds);
    void transfer_started();
    void transfer_finished();

    bool metrics_enabled() const { return metrics_enabled_; }
    std::string metrics_text() const; // Prometheus text format

    std::shared_ptr<prometheus::Registry> registry() { return registry_; }

private:
    void initialize_metrics();
    void write(LogLevel level,
               const std::string& message,
               const std::string& job_id,
               const std::string& source_id,
               const std::string& node_id,
               const std::unordered_map<std::string, std::string>& context);
    std::string format_json_log(const std::string& level,
                                const std::string& message,
                                const std::string& job_id,
                                const std::string& source_id,
                                const std::string& node_id,
                                const std::unordered_map<std::string, std::string>& context) const;

    std::string component_;
    LogLevel level_ = LogLevel::info;
    std::ostream* output_ = nullptr;
    mutable std::mutex log_mutex_;

    bool metrics_enabled_ = false;
    std::shared_ptr<prometheus::Registry> registry_;
    prometheus::Family<prometheus::Counter>* requests_total_family_ = nullptr;
    prometheus::Family<prometheus::Counter>* retries_total_family_ = nullptr;
    prometheus::Family<prometheus::Counter>* rate_limit_hits_total_family_ = nullptr;
    prometheus::Family<prometheus::Counter>* exports_total_family_ = nullptr;
    prometheus::Family<prometheus::Histogram>* transfer_duration_seconds_family_ = nullptr;
    prometheus::Family<prometheus::Gauge>* active_transfers_family_ = nullptr;
};

} // namespace exporter
} // namespace frameport
