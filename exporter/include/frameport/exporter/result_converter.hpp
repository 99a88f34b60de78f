#pragma once

#include "frameport/exporter/core.hpp"
#include <string>
#include <optional>

namespace frameport {
namespace exporter {

// Converter utilities between pipeline enums and their wire/CLI/manifest strings

class ResultConverter {
public:
    // Manifest contract: "ok" | "partial" | "failed" | "cancelled"
    static std::string job_status_to_string(JobStatus status) {
        switch (status) {
            case JobStatus::ok:
                return "ok";
            case JobStatus::partial:
                return "partial";
            case JobStatus::failed:
                return "failed";
            case JobStatus::cancelled:
                return "cancelled";
            default:
                return "failed";
        }
    }

    static std::string outcome_to_string(OutcomeStatus status) {
        return status == OutcomeStatus::success ? "success" : "failed";
    }

    static OutcomeStatus string_to_outcome(const std::string& status_str) {
        return status_str == "success" ? OutcomeStatus::success : OutcomeStatus::permanent_failure;
    }

    // Convert ErrorCode to machine-readable string code
    static std::string error_code_to_string(ErrorCode code) {
        switch (code) {
            case ErrorCode::none:
                return "NONE";
            case ErrorCode::invalid_input:
                return "INVALID_INPUT";
            case ErrorCode::invalid_format:
                return "INVALID_FORMAT";
            case ErrorCode::enumeration_failed:
                return "ENUMERATION_FAILED";
            case ErrorCode::resolution_failed:
                return "RESOLUTION_FAILED";
            case ErrorCode::transfer_failed:
                return "TRANSFER_FAILED";
            case ErrorCode::storage_failed:
                return "STORAGE_FAILED";
            case ErrorCode::all_nodes_failed:
                return "ALL_NODES_FAILED";
            case ErrorCode::network_error:
                return "NETWORK_ERROR";
            case ErrorCode::connection_timeout:
                return "CONNECTION_TIMEOUT";
            case ErrorCode::http_error:
                return "HTTP_ERROR";
            case ErrorCode::rate_limited:
                return "RATE_LIMITED";
            case ErrorCode::internal_error:
                return "INTERNAL_ERROR";
            case ErrorCode::cancelled_by_user:
                return "CANCELLED_BY_USER";
            default:
                return "UNKNOWN_ERROR";
        }
    }

    static ErrorCode string_to_error_code(const std::string& code) {
        static const ErrorCode all[] = {
            ErrorCode::none, ErrorCode::invalid_input, ErrorCode::invalid_format,
            ErrorCode::enumeration_failed, ErrorCode::resolution_failed, ErrorCode::transfer_failed,
            ErrorCode::storage_failed, ErrorCode::all_nodes_failed, ErrorCode::network_error,
            ErrorCode::connection_timeout, ErrorCode::http_error, ErrorCode::rate_limited,
            ErrorCode::internal_error, ErrorCode::cancelled_by_user
        };
        for (auto candidate : all) {
            if (error_code_to_string(candidate) == code) {
                return candidate;
            }
        }
        return ErrorCode::internal_error;
    }

    // Value of the `format` query parameter, also used as the file extension
    static std::string format_to_string(ExportFormat format) {
        switch (format) {
            case ExportFormat::png:
                return "png";
            case ExportFormat::jpg:
                return "jpg";
            case ExportFormat::svg:
                return "svg";
            case ExportFormat::pdf:
                return "pdf";
            default:
                return "png";
        }
    }

    static std::optional<ExportFormat> string_to_format(const std::string& format) {
        if (format == "png") return ExportFormat::png;
        if (format == "jpg" || format == "jpeg") return ExportFormat::jpg;
        if (format == "svg") return ExportFormat::svg;
        if (format == "pdf") return ExportFormat::pdf;
        return std::nullopt;
    }

    static std::string strategy_to_string(ExportStrategy strategy) {
        return strategy == ExportStrategy::conservative ? "conservative" : "fast";
    }

    static std::optional<ExportStrategy> string_to_strategy(const std::string& strategy) {
        if (strategy == "fast") return ExportStrategy::fast;
        if (strategy == "conservative") return ExportStrategy::conservative;
        return std::nullopt;
    }

    // Check that status and error code agree
    static bool validate_result(const ExportResult& result) {
        if (result.status == OutcomeStatus::success) {
            return result.error_code == ErrorCode::none && !result.path.empty();
        }
        return result.error_code != ErrorCode::none && !result.reason.empty();
    }
};

} // namespace exporter
} // namespace frameport
