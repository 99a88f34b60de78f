#pragma once

#include "frameport/exporter/core.hpp"
#include "frameport/exporter/result_converter.hpp"
#include <string>
#include <cstdlib>
#include <cstdint>
#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>

namespace frameport {
namespace exporter {

/**
 * Environment configuration
 *
 * Every knob can be set through a FRAMEPORT_* environment variable:
 * - FRAMEPORT_STRATEGY (fast | conservative)
 * - FRAMEPORT_MAX_WORKERS, FRAMEPORT_BATCH_SIZE, FRAMEPORT_MAX_RETRIES
 * - FRAMEPORT_API_TIMEOUT, FRAMEPORT_TRANSFER_TIMEOUT (seconds)
 * - FRAMEPORT_ACCESS_TOKEN, FRAMEPORT_API_BASE
 * - FRAMEPORT_LOG_LEVEL, FRAMEPORT_METRICS_ENABLED
 *
 * Unset or unparsable values leave the default in place. Command-line options
 * are applied after these and win.
 */
class Settings {
public:
    static ExportStrategy strategy() {
        auto value = get_env_string("FRAMEPORT_STRATEGY");
        if (value) {
            auto parsed = ResultConverter::string_to_strategy(to_lower(*value));
            if (parsed) {
                return *parsed;
            }
        }
        return ExportStrategy::fast;
    }

    // FIGMA_ACCESS_TOKEN is honoured for existing setups
    static std::string access_token() {
        auto value = get_env_string("FRAMEPORT_ACCESS_TOKEN");
        if (!value) {
            value = get_env_string("FIGMA_ACCESS_TOKEN");
        }
        return value ? *value : "";
    }

    static std::string api_base(const std::string& default_value) {
        auto value = get_env_string("FRAMEPORT_API_BASE");
        return value ? *value : default_value;
    }

    static std::string log_level() {
        auto value = get_env_string("FRAMEPORT_LOG_LEVEL");
        return value ? *value : "INFO";
    }

    /**
     * Check if Prometheus metrics collection is enabled
     *
     * Gates:
     * - Request, retry and rate-limit counters
     * - Transfer duration histogram
     * - --metrics-file output
     */
    static bool is_metrics_enabled() {
        return get_env_bool("FRAMEPORT_METRICS_ENABLED", false);
    }

    // Overlay the numeric environment knobs on a job built from a strategy preset
    static void apply_env_overrides(ExportJob& job) {
        job.max_workers = static_cast<int>(get_env_int("FRAMEPORT_MAX_WORKERS", job.max_workers));
        job.batch_size = static_cast<int>(get_env_int("FRAMEPORT_BATCH_SIZE", job.batch_size));
        job.max_retries = static_cast<int32_t>(get_env_int("FRAMEPORT_MAX_RETRIES", job.max_retries));
        job.api_timeout_ms = get_env_int("FRAMEPORT_API_TIMEOUT", job.api_timeout_ms / 1000) * 1000;
        job.transfer_timeout_ms = get_env_int("FRAMEPORT_TRANSFER_TIMEOUT", job.transfer_timeout_ms / 1000) * 1000;
    }

    static std::optional<std::string> get_env_string(const char* env_var) {
        const char* value = std::getenv(env_var);
        if (value == nullptr || *value == '\0') {
            return std::nullopt;
        }
        return std::string(value);
    }

    /**
     * Get boolean value from environment variable
     *
     * Returns `true` if environment variable is set to:
     * - "true" (case-insensitive)
     * - "1"
     * - "yes" (case-insensitive)
     */
    static bool get_env_bool(const char* env_var, bool default_value) {
        const char* value = std::getenv(env_var);
        if (value == nullptr) {
            return default_value;
        }

        std::string str_value = to_lower(value);
        return (str_value == "true" || str_value == "1" || str_value == "yes");
    }

    // Non-negative integers up to max_value only; anything else yields the default
    static int64_t get_env_int(const char* env_var, int64_t default_value,
                               int64_t max_value = std::numeric_limits<int>::max()) {
        auto value = get_env_string(env_var);
        if (!value || value->size() > 12) {
            return default_value;
        }
        if (!std::all_of(value->begin(), value->end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return default_value;
        }
        int64_t parsed = std::stoll(*value);
        return parsed > max_value ? default_value : parsed;
    }

private:
    static std::string to_lower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(), ::tolower);
        return value;
    }
};

} // namespace exporter
} // namespace frameport
