#pragma once

#include "config.hpp"
#include "logger.hpp"
#include "reporter.hpp"
#include "result.hpp"
#include "toolchain.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tempo {

    struct run_options {
        std::filesystem::path temp_dir{};
        // Regex source selecting benchmark cases; empty selects all.
        std::string pattern{};
    };

    /*
     * Runs every job, one executor session at a time, builds in order within a job.
     * Results are keyed by suite file and tagged with builder and executor names.
     *
     * A suite_case_error is logged with its parameters and its cause rethrown; any other
     * error is logged and rethrown unchanged. close() runs on every exit path.
     */
    result_set run_jobs(const std::vector<job>& jobs, const run_options& options, host_logger& logger);

    struct host_config {
        std::vector<toolchain_spec> toolchains{};
        std::vector<std::shared_ptr<reporter>> reporters{};
        std::filesystem::path temp_dir{".tempo-tmp"};
        bool clean_temp_dir{true};
        std::optional<std::filesystem::path> diff{};
        log_level level{log_level::debug};
    };

    /*
     * Reads a JSON config file and builds the tools, toolchains and reporters it names.
     * A missing file yields the defaults when `optional` is set. Throws
     * configuration_error on invalid content.
     */
    host_config load_host_config(const std::filesystem::path& path, bool optional = false);

    // Same as load_host_config() for an in-memory document.
    host_config parse_host_config(std::string_view json);

    class host {
      public:
        host(host_config config, host_logger& logger);

        // Checks the toolchains, then builds, runs and reports. Returns the collected results
        // (empty when no file matched).
        const result_set& run(const job_filter& filter = {}, std::optional<std::string_view> shared = std::nullopt);

        // Merges saved result files in order and hands them to the reporters.
        void report(const std::vector<std::filesystem::path>& files);

        const host_config& config() const { return config_; }
        const result_set& result() const { return result_; }

      private:
        void run_reporters(const result_set& result);

        host_config config_;
        host_logger& logger_;
        result_set result_{};
    };

}  // namespace tempo
