#include <iostream>
#include <fstream>
#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <chrono>
#include <csignal>
#include <sstream>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <caf/actor_system_config.hpp>
#include <caf/error.hpp>
#include "frameport/exporter/core.hpp"
#include "frameport/exporter/export_coordinator.hpp"
#include "frameport/exporter/export_report.hpp"
#include "frameport/exporter/http_transport.hpp"
#include "frameport/exporter/observability.hpp"
#include "frameport/exporter/result_converter.hpp"
#include "frameport/exporter/settings.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitPartial = 2;
constexpr int kExitBadArguments = 3;
constexpr int kExitCancelled = 130;

volatile std::sig_atomic_t g_interrupted = 0;

void handle_sigint(int) {
    g_interrupted = 1;
}

// Unset options keep these sentinels so environment values survive
struct CliOptions {
    std::string source_id;
    std::string url;
    std::string output_dir;
    std::string token;
    std::string api_base;
    std::string strategy;
    std::string format;
    double scale = 0.0;
    int max_workers = -1;
    int batch_size = -1;
    int api_timeout_ms = -1;
    int transfer_timeout_ms = -1;
    int max_retries = -1;
    std::string root_node;
    std::string page;
    std::string scales;
    std::string node_ids;
    std::string resume_from;
    bool count_only = false;
    bool no_manifest = false;
    int min_file_size = 0;
    std::string metrics_file;
};

std::vector<std::string> split_ids(const std::string& value) {
    std::vector<std::string> ids;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        size_t start = item.find_first_not_of(' ');
        size_t end = item.find_last_not_of(' ');
        if (start != std::string::npos) {
            ids.push_back(item.substr(start, end - start + 1));
        }
    }
    return ids;
}

std::optional<std::vector<double>> parse_scales(const std::string& value) {
    std::vector<double> scales;
    for (const auto& item : split_ids(value)) {
        char* end = nullptr;
        double scale = std::strtod(item.c_str(), &end);
        if (end == item.c_str() || *end != '\0') {
            return std::nullopt;
        }
        scales.push_back(scale);
    }
    return scales;
}

std::string render_progress_bar(int64_t current, int64_t total, int width = 25) {
    if (total <= 0) {
        return std::string(static_cast<size_t>(width), '.');
    }
    int filled = static_cast<int>((current * width) / total);
    int percentage = static_cast<int>((current * 100) / total);
    return std::string(static_cast<size_t>(filled), '#') + std::string(static_cast<size_t>(width - filled), '.') +
           " " + std::to_string(current) + "/" + std::to_string(total) + " (" + std::to_string(percentage) + "%)";
}

int exit_code_for(frameport::exporter::JobStatus status) {
    using frameport::exporter::JobStatus;
    switch (status) {
        case JobStatus::ok:
            return kExitOk;
        case JobStatus::partial:
            return kExitPartial;
        case JobStatus::cancelled:
            return kExitCancelled;
        case JobStatus::failed:
        default:
            return kExitFailed;
    }
}

} // namespace

class FrameportConfig : public caf::actor_system_config {
public:
    FrameportConfig() {
        opt_group{custom_options_, "global"}
            .add(options.source_id, "source-id", "File key of the design source")
            .add(options.url, "url", "Share URL of the design source (alternative to source-id)")
            .add(options.output_dir, "output-dir", "Directory receiving exported files")
            .add(options.token, "token", "Access token (default: FRAMEPORT_ACCESS_TOKEN)")
            .add(options.api_base, "api-base", "Service base URL")
            .add(options.strategy, "strategy", "fast | conservative")
            .add(options.format, "format", "png | jpg | svg | pdf")
            .add(options.scale, "scale", "Export scale (0, 4]")
            .add(options.max_workers, "max-workers", "Concurrent downloads")
            .add(options.batch_size, "batch-size", "Node ids per resolve call")
            .add(options.api_timeout_ms, "api-timeout-ms", "Timeout of one API call (ms)")
            .add(options.transfer_timeout_ms, "transfer-timeout-ms", "Timeout of one download (ms)")
            .add(options.max_retries, "max-retries", "Retries after the first attempt")
            .add(options.root_node, "root-node", "Only export below this node id")
            .add(options.page, "page", "Only export frames of the page with this name")
            .add(options.scales, "scales", "Comma-separated scales, one pass each into scale_<N>x/")
            .add(options.node_ids, "node-ids", "Comma-separated node ids to export")
            .add(options.resume_from, "resume-from", "Re-export failures listed in a manifest")
            .add(options.count_only, "count-only", "Print the number of exportable nodes and exit")
            .add(options.no_manifest, "no-manifest", "Do not write export_report.json")
            .add(options.min_file_size, "min-file-size", "Flag outputs smaller than this many bytes")
            .add(options.metrics_file, "metrics-file", "Write Prometheus metrics here on exit");
    }

    CliOptions options;
};

namespace {

using namespace frameport::exporter;

// Strategy preset, then environment, then command line
std::optional<ExportJob> build_job(const CliOptions& options, Observability& observability) {
    ExportStrategy strategy = Settings::strategy();
    if (!options.strategy.empty()) {
        auto parsed = ResultConverter::string_to_strategy(options.strategy);
        if (!parsed) {
            observability.log_error("Unknown strategy", "", "", "", {{"strategy", options.strategy}});
            return std::nullopt;
        }
        strategy = *parsed;
    }

    ExportJob job = ExportJob::for_strategy(strategy);
    Settings::apply_env_overrides(job);

    job.source_id = options.source_id;
    if (job.source_id.empty() && !options.url.empty()) {
        auto extracted = SourceClient::extract_source_id(options.url);
        if (!extracted) {
            observability.log_error("Could not extract a file key from the URL", "", "", "", {{"url", options.url}});
            return std::nullopt;
        }
        job.source_id = *extracted;
    }
    job.output_dir = options.output_dir;

    if (!options.format.empty()) {
        auto format = ResultConverter::string_to_format(options.format);
        if (!format) {
            observability.log_error("Unknown format", "", "", "", {{"format", options.format}});
            return std::nullopt;
        }
        job.format = *format;
    }
    if (options.scale > 0.0) job.scale = options.scale;
    if (options.max_workers >= 0) job.max_workers = options.max_workers;
    if (options.batch_size >= 0) job.batch_size = options.batch_size;
    if (options.api_timeout_ms >= 0) job.api_timeout_ms = options.api_timeout_ms;
    if (options.transfer_timeout_ms >= 0) job.transfer_timeout_ms = options.transfer_timeout_ms;
    if (options.max_retries >= 0) job.max_retries = options.max_retries;
    if (!options.root_node.empty()) job.root_node_id = options.root_node;
    if (!options.page.empty()) job.page_name = options.page;
    if (!options.scales.empty()) {
        auto scales = parse_scales(options.scales);
        if (!scales) {
            observability.log_error("Invalid scale list", "", "", "", {{"scales", options.scales}});
            return std::nullopt;
        }
        job.scales = std::move(*scales);
    }
    job.write_manifest = !options.no_manifest;

    for (const auto& id : split_ids(options.node_ids)) {
        NodeDescriptor node;
        node.id = id;
        job.nodes.push_back(std::move(node));
    }

    if (!options.resume_from.empty()) {
        auto failed = read_failed_nodes(options.resume_from);
        if (!failed) {
            observability.log_error("Cannot resume from manifest", "", job.source_id, "", {
                {"manifest", options.resume_from},
                {"error", caf::to_string(failed.error())}
            });
            return std::nullopt;
        }
        job.nodes.insert(job.nodes.end(), failed->begin(), failed->end());
    }

    std::string invalid = ExportCoordinator::validate(job);
    if (!invalid.empty() && !options.count_only) {
        observability.log_error("Invalid arguments", "", job.source_id, "", {{"reason", invalid}});
        return std::nullopt;
    }
    return job;
}

void write_metrics_file(const std::string& path, Observability& observability) {
    if (path.empty()) {
        return;
    }
    if (!observability.metrics_enabled()) {
        observability.log_warn("Metrics file requested but FRAMEPORT_METRICS_ENABLED is off", "", "", "", {
            {"metrics_file", path}
        });
        return;
    }
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        observability.log_error("Cannot write metrics file", "", "", "", {{"metrics_file", path}});
        return;
    }
    out << observability.metrics_text();
}

void report_run(const ScaleRun& run, const CliOptions& options, Observability& observability) {
    const JobResult& result = run.result;
    if (result.report) {
        const auto& report = *result.report;
        std::cerr << "Exported " << report.succeeded.size() << "/" << report.total << " in "
                  << report.duration.count() << " ms -> " << run.output_dir << std::endl;
        for (const auto& failure : report.failed) {
            std::cerr << "  failed: " << failure.node.name << " (" << failure.node.id << "): "
                      << failure.reason << std::endl;
        }

        if (options.min_file_size > 0) {
            auto quality = validate_outputs(report, options.min_file_size);
            observability.log_info("Output validation", "", "", "", {
                {"output_dir", run.output_dir},
                {"valid_files", std::to_string(quality.valid_files)},
                {"invalid_files", std::to_string(quality.invalid_files)},
                {"total_bytes", std::to_string(quality.total_bytes)}
            });
            for (const auto& issue : quality.issues) {
                observability.log_warn("Output below quality threshold", "", "", "", {{"issue", issue}});
            }
        }
    }
    if (result.is_failed()) {
        std::cerr << ResultConverter::error_code_to_string(result.error_code) << ": " << result.error_message
                  << std::endl;
    }
}

int run_cli(const CliOptions& options) {
    auto observability = std::make_shared<Observability>("frameport");

    auto job = build_job(options, *observability);
    if (!job) {
        return kExitBadArguments;
    }
    if (!options.resume_from.empty() && job->nodes.empty()) {
        observability->log_info("Manifest lists no failures; nothing to resume", "", job->source_id);
        return kExitOk;
    }

    SourceClientConfig client_config;
    client_config.api_base = options.api_base.empty() ? Settings::api_base(client_config.api_base) : options.api_base;
    client_config.token = options.token.empty() ? Settings::access_token() : options.token;
    if (client_config.token.empty()) {
        observability->log_error("Access token not found; set FRAMEPORT_ACCESS_TOKEN or pass --token");
        return kExitBadArguments;
    }

    auto transport = std::make_shared<CurlTransport>(static_cast<std::size_t>(std::max(job->max_workers, 1)) + 2);
    ExportCoordinator coordinator(transport, client_config, nullptr, observability);

    if (options.count_only) {
        auto nodes = coordinator.enumerate(*job);
        if (!nodes) {
            observability->log_error("Enumeration failed", "", job->source_id, "", {
                {"error", caf::to_string(nodes.error())}
            });
            return kExitFailed;
        }
        std::cout << nodes->size() << std::endl;
        return kExitOk;
    }

    coordinator.on_progress([](int64_t current, int64_t total, const std::string& label) {
        std::cerr << "\rExporting " << render_progress_bar(current, total) << " " << label.substr(0, 40)
                  << "          " << std::flush;
        if (current == total) {
            std::cerr << std::endl;
        }
    });

    std::signal(SIGINT, handle_sigint);
    std::atomic<bool> finished{false};
    std::thread watcher([&coordinator, &finished]() {
        while (!finished.load()) {
            if (g_interrupted) {
                coordinator.cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    std::vector<ScaleRun> runs = coordinator.run_scales(*job);
    finished = true;
    watcher.join();

    for (const auto& run : runs) {
        report_run(run, options, *observability);
    }

    write_metrics_file(options.metrics_file, *observability);
    return exit_code_for(ExportCoordinator::combined_status(runs));
}

} // namespace

int main(int argc, char** argv) {
    FrameportConfig config;

    if (auto err = config.parse(argc, argv)) {
        std::cerr << "Failed to parse arguments: " << caf::to_string(err) << std::endl;
        return kExitBadArguments;
    }
    if (config.cli_helptext_printed) {
        return kExitOk;
    }

    try {
        return run_cli(config.options);
    } catch (const std::exception& e) {
        std::cerr << "frameport fatal error: " << e.what() << std::endl;
        return kExitFailed;
    }
}
