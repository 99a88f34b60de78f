#include <iostream>
#include <cassert>
#include <cstdlib>
#include <string>
#include <vector>
#include "frameport/exporter/core.hpp"
#include "frameport/exporter/filename.hpp"
#include "frameport/exporter/result_converter.hpp"
#include "frameport/exporter/settings.hpp"
#include "frameport/exporter/source_client.hpp"

using namespace frameport::exporter;

void test_export_job_defaults() {
    std::cout << "Testing ExportJob defaults..." << std::endl;

    ExportJob job;
    assert(job.scale == 2.0);
    assert(job.format == ExportFormat::png);
    assert(job.max_workers == 8);
    assert(job.batch_size == 15);
    assert(job.api_timeout_ms == 15000);
    assert(job.transfer_timeout_ms == 30000);
    assert(job.max_retries == 5);
    assert(job.write_manifest);
    assert(!job.root_node_id.has_value());

    std::cout << "✓ ExportJob defaults test passed" << std::endl;
}

void test_strategy_presets() {
    std::cout << "Testing strategy presets..." << std::endl;

    ExportJob fast = ExportJob::for_strategy(ExportStrategy::fast);
    assert(fast.max_workers == 8);
    assert(fast.batch_size == 15);
    assert(fast.max_retries == 5);

    ExportJob conservative = ExportJob::for_strategy(ExportStrategy::conservative);
    assert(conservative.max_workers == 1);
    assert(conservative.batch_size == 5);
    assert(conservative.api_timeout_ms == 60000);
    assert(conservative.transfer_timeout_ms == 120000);
    assert(conservative.max_retries == 3);
    // Presets only change job defaults
    assert(conservative.format == fast.format);
    assert(conservative.scale == fast.scale);

    std::cout << "✓ Strategy presets test passed" << std::endl;
}

void test_export_result_factories() {
    std::cout << "Testing ExportResult factories..." << std::endl;

    NodeDescriptor node{"1:2", "Login", "FRAME", {"Page 1"}};

    auto ok = ExportResult::success(node, "/tmp/out/Login_1-2.png", 2);
    assert(ok.is_success());
    assert(!ok.is_failure());
    assert(ok.path == "/tmp/out/Login_1-2.png");
    assert(ok.attempts == 2);
    assert(ok.error_code == ErrorCode::none);
    assert(ResultConverter::validate_result(ok));

    auto failed = ExportResult::permanent_failure(node, ErrorCode::transfer_failed, "transfer failed: HTTP 404", 1);
    assert(failed.is_failure());
    assert(failed.path.empty());
    assert(failed.reason == "transfer failed: HTTP 404");
    assert(ResultConverter::validate_result(failed));

    ExportResult inconsistent = ok;
    inconsistent.error_code = ErrorCode::network_error;
    assert(!ResultConverter::validate_result(inconsistent));

    std::cout << "✓ ExportResult factories test passed" << std::endl;
}

void test_job_result_status() {
    std::cout << "Testing JobResult status derivation..." << std::endl;

    NodeDescriptor a{"1:1", "A", "FRAME", {}};
    NodeDescriptor b{"1:2", "B", "FRAME", {}};

    ExportReport all_ok;
    all_ok.total = 1;
    all_ok.succeeded.push_back(ExportResult::success(a, "a.png"));
    auto ok = JobResult::completed(all_ok);
    assert(ok.status == JobStatus::ok);
    assert(ok.is_success());
    assert(ok.report->success_rate() == 1.0);

    ExportReport mixed = all_ok;
    mixed.total = 2;
    mixed.failed.push_back(ExportResult::permanent_failure(b, ErrorCode::resolution_failed, "resolution failed"));
    auto partial = JobResult::completed(mixed);
    assert(partial.status == JobStatus::partial);
    assert(partial.is_success());
    assert(partial.report->success_rate() == 0.5);

    auto failed = JobResult::error_result(ErrorCode::enumeration_failed, "boom");
    assert(failed.is_failed());
    assert(!failed.report.has_value());

    auto cancelled = JobResult::cancelled_result(mixed);
    assert(cancelled.is_cancelled());
    assert(cancelled.error_code == ErrorCode::cancelled_by_user);
    assert(cancelled.report.has_value());

    ExportReport empty;
    assert(empty.success_rate() == 0.0);

    std::cout << "✓ JobResult status test passed" << std::endl;
}

void test_result_converter_strings() {
    std::cout << "Testing ResultConverter strings..." << std::endl;

    assert(ResultConverter::job_status_to_string(JobStatus::ok) == "ok");
    assert(ResultConverter::job_status_to_string(JobStatus::partial) == "partial");
    assert(ResultConverter::job_status_to_string(JobStatus::failed) == "failed");
    assert(ResultConverter::job_status_to_string(JobStatus::cancelled) == "cancelled");

    assert(ResultConverter::outcome_to_string(OutcomeStatus::success) == "success");
    assert(ResultConverter::outcome_to_string(OutcomeStatus::permanent_failure) == "failed");
    assert(ResultConverter::string_to_outcome("failed") == OutcomeStatus::permanent_failure);

    assert(ResultConverter::error_code_to_string(ErrorCode::resolution_failed) == "RESOLUTION_FAILED");
    assert(ResultConverter::string_to_error_code("TRANSFER_FAILED") == ErrorCode::transfer_failed);
    assert(ResultConverter::string_to_error_code("CANCELLED_BY_USER") == ErrorCode::cancelled_by_user);
    assert(ResultConverter::string_to_error_code("nonsense") == ErrorCode::internal_error);

    assert(ResultConverter::format_to_string(ExportFormat::svg) == "svg");
    assert(ResultConverter::string_to_format("jpeg") == ExportFormat::jpg);
    assert(ResultConverter::string_to_format("pdf") == ExportFormat::pdf);
    assert(!ResultConverter::string_to_format("gif").has_value());

    assert(ResultConverter::string_to_strategy("conservative") == ExportStrategy::conservative);
    assert(!ResultConverter::string_to_strategy("reckless").has_value());
    assert(ResultConverter::strategy_to_string(ExportStrategy::fast) == "fast");

    std::cout << "✓ ResultConverter strings test passed" << std::endl;
}

void test_sanitize_filename() {
    std::cout << "Testing sanitize_filename..." << std::endl;

    assert(sanitize_filename("Page 1: Overview") == "Page-1-Overview");
    assert(sanitize_filename("Dashboard / Settings") == "Dashboard-Settings");
    assert(sanitize_filename("  Login   Screen  ") == "Login-Screen");
    assert(sanitize_filename("a*b?c\"d<e>f|g") == "abcdefg");
    assert(sanitize_filename("--Card -- Large--") == "Card-Large");
    assert(sanitize_filename("") == "Unnamed");
    assert(sanitize_filename("/:*?") == "Unnamed");

    std::string long_name(250, 'x');
    assert(sanitize_filename(long_name).size() == 200);

    // Truncation must not leave a dangling separator
    std::string edge = std::string(199, 'y') + " tail";
    std::string sanitized = sanitize_filename(edge);
    assert(sanitized.size() == 199);
    assert(sanitized.back() == 'y');

    assert(sanitize_node_id("12:34") == "12-34");
    assert(sanitize_node_id("I5:6;7:8") == "I5-6;7-8");

    std::cout << "✓ sanitize_filename test passed" << std::endl;
}

void test_extract_source_id() {
    std::cout << "Testing extract_source_id..." << std::endl;

    auto design = SourceClient::extract_source_id("https://www.figma.com/design/AbC123xyz/My-File?node-id=1-2");
    assert(design.has_value());
    assert(*design == "AbC123xyz");

    auto file = SourceClient::extract_source_id("https://figma.com/file/KEY42/Name");
    assert(file.has_value());
    assert(*file == "KEY42");

    assert(!SourceClient::extract_source_id("https://example.com/file/KEY42").has_value());
    assert(!SourceClient::extract_source_id("").has_value());

    assert(SourceClient::format_scale(2.0) == "2");
    assert(SourceClient::format_scale(1.5) == "1.5");
    assert(SourceClient::url_encode("1:2") == "1%3A2");

    std::cout << "✓ extract_source_id test passed" << std::endl;
}

void test_settings_env_overrides() {
    std::cout << "Testing Settings environment overrides..." << std::endl;

    setenv("FRAMEPORT_MAX_WORKERS", "3", 1);
    setenv("FRAMEPORT_BATCH_SIZE", "7", 1);
    setenv("FRAMEPORT_API_TIMEOUT", "20", 1);
    setenv("FRAMEPORT_MAX_RETRIES", "not-a-number", 1);
    unsetenv("FRAMEPORT_TRANSFER_TIMEOUT");

    ExportJob job;
    Settings::apply_env_overrides(job);
    assert(job.max_workers == 3);
    assert(job.batch_size == 7);
    assert(job.api_timeout_ms == 20000);
    assert(job.max_retries == 5);           // unparsable value keeps the default
    assert(job.transfer_timeout_ms == 30000);

    // Values past INT_MAX are ignored rather than wrapped
    setenv("FRAMEPORT_MAX_WORKERS", "99999999999", 1);
    setenv("FRAMEPORT_BATCH_SIZE", "2147483648", 1);
    ExportJob oversized;
    Settings::apply_env_overrides(oversized);
    assert(oversized.max_workers == 8);
    assert(oversized.batch_size == 15);
    assert(Settings::get_env_int("FRAMEPORT_BATCH_SIZE", 1, int64_t{1} << 40) == 2147483648LL);
    setenv("FRAMEPORT_BATCH_SIZE", "2147483647", 1);
    assert(Settings::get_env_int("FRAMEPORT_BATCH_SIZE", 1) == 2147483647LL);

    unsetenv("FRAMEPORT_MAX_WORKERS");
    unsetenv("FRAMEPORT_BATCH_SIZE");
    unsetenv("FRAMEPORT_API_TIMEOUT");
    unsetenv("FRAMEPORT_MAX_RETRIES");

    setenv("FRAMEPORT_STRATEGY", "CONSERVATIVE", 1);
    assert(Settings::strategy() == ExportStrategy::conservative);
    setenv("FRAMEPORT_STRATEGY", "bogus", 1);
    assert(Settings::strategy() == ExportStrategy::fast);
    unsetenv("FRAMEPORT_STRATEGY");

    unsetenv("FRAMEPORT_ACCESS_TOKEN");
    setenv("FIGMA_ACCESS_TOKEN", "legacy", 1);
    assert(Settings::access_token() == "legacy");
    setenv("FRAMEPORT_ACCESS_TOKEN", "primary", 1);
    assert(Settings::access_token() == "primary");
    unsetenv("FRAMEPORT_ACCESS_TOKEN");
    unsetenv("FIGMA_ACCESS_TOKEN");

    setenv("FRAMEPORT_METRICS_ENABLED", "Yes", 1);
    assert(Settings::is_metrics_enabled());
    setenv("FRAMEPORT_METRICS_ENABLED", "0", 1);
    assert(!Settings::is_metrics_enabled());
    unsetenv("FRAMEPORT_METRICS_ENABLED");

    std::cout << "✓ Settings environment overrides test passed" << std::endl;
}

int main() {
    std::cout << "Running Exporter Core Tests..." << std::endl;
    std::cout << "===========================================" << std::endl;

    try {
        std::cout << "\n[Data Structures]" << std::endl;
        test_export_job_defaults();
        test_strategy_presets();
        test_export_result_factories();
        test_job_result_status();

        std::cout << "\n[Conversions]" << std::endl;
        test_result_converter_strings();
        test_sanitize_filename();
        test_extract_source_id();

        std::cout << "\n[Configuration]" << std::endl;
        test_settings_env_overrides();

        std::cout << "\n===========================================" << std::endl;
        std::cout << "✅ All core tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
