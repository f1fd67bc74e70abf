#pragma once

#include "utils.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tempo {

    using namespace std::string_view_literals;

    /*
     * Tempo Startup Config Options
     *
     * Command
     * - command: run (build, execute and report) or report (saved results only).
     *
     * Run selection
     * - config_path: JSON config file describing toolchains and reporters.
     * - file: Only run suite files whose path contains this string.
     * - builder: Regex source; only builders with a matching name are used.
     * - executor: Regex source; only executors with a matching name are used.
     * - name: Regex source forwarded to executors to select benchmark cases.
     * - shared: Partition the suite files as "index/total" (1-based index).
     *
     * Output
     * - log_level: Host log verbosity (debug/info/warn/error/off); overrides the config file.
     * - color: ANSI color behavior for console reports.
     *
     * Report command
     * - report_files: Saved result files merged in order before reporting.
     *
     * Diagnostics
     * - print_config: Print the resolved startup config and exit.
     */

    enum class log_level : uint8_t { debug, info, warn, error, off };
    enum class color_mode : uint8_t { automatic, always, never };
    enum class ratio_style : uint8_t { value, percentage, trend };
    enum class outlier_mode : uint8_t { none, worst, best, all };
    enum class command_kind : uint8_t { run, report };

    inline constexpr std::string_view to_string(log_level level) {
        switch (level) {
            case log_level::debug:
                return "debug"sv;
            case log_level::info:
                return "info"sv;
            case log_level::warn:
                return "warn"sv;
            case log_level::error:
                return "error"sv;
            case log_level::off:
                return "off"sv;
        }
        return "debug"sv;
    }

    inline constexpr std::string_view to_string(color_mode mode) {
        switch (mode) {
            case color_mode::automatic:
                return "auto"sv;
            case color_mode::always:
                return "always"sv;
            case color_mode::never:
                return "never"sv;
        }
        return "auto"sv;
    }

    inline constexpr std::string_view to_string(ratio_style style) {
        switch (style) {
            case ratio_style::value:
                return "value"sv;
            case ratio_style::percentage:
                return "percentage"sv;
            case ratio_style::trend:
                return "trend"sv;
        }
        return "percentage"sv;
    }

    inline constexpr std::string_view to_string(outlier_mode mode) {
        switch (mode) {
            case outlier_mode::none:
                return "none"sv;
            case outlier_mode::worst:
                return "worst"sv;
            case outlier_mode::best:
                return "best"sv;
            case outlier_mode::all:
                return "all"sv;
        }
        return "all"sv;
    }

    inline constexpr std::string_view to_string(command_kind command) {
        switch (command) {
            case command_kind::run:
                return "run"sv;
            case command_kind::report:
                return "report"sv;
        }
        return "run"sv;
    }

    inline constexpr bool try_parse_log_level(std::string_view text, log_level& out) {
        if (utils::str_case_eq(text, "debug"sv)) {
            out = log_level::debug;
            return true;
        }
        if (utils::str_case_eq(text, "info"sv)) {
            out = log_level::info;
            return true;
        }
        if (utils::str_case_eq(text, "warn"sv) || utils::str_case_eq(text, "warning"sv)) {
            out = log_level::warn;
            return true;
        }
        if (utils::str_case_eq(text, "error"sv)) {
            out = log_level::error;
            return true;
        }
        if (utils::str_case_eq(text, "off"sv)) {
            out = log_level::off;
            return true;
        }
        return false;
    }

    inline constexpr bool try_parse_color_mode(std::string_view text, color_mode& out) {
        if (utils::str_case_eq(text, "auto"sv)) {
            out = color_mode::automatic;
            return true;
        }
        if (utils::str_case_eq(text, "always"sv)) {
            out = color_mode::always;
            return true;
        }
        if (utils::str_case_eq(text, "never"sv)) {
            out = color_mode::never;
            return true;
        }
        return false;
    }

    inline constexpr bool try_parse_ratio_style(std::string_view text, ratio_style& out) {
        if (utils::str_case_eq(text, "value"sv)) {
            out = ratio_style::value;
            return true;
        }
        if (utils::str_case_eq(text, "percentage"sv)) {
            out = ratio_style::percentage;
            return true;
        }
        if (utils::str_case_eq(text, "trend"sv)) {
            out = ratio_style::trend;
            return true;
        }
        return false;
    }

    inline constexpr bool try_parse_outlier_mode(std::string_view text, outlier_mode& out) {
        if (utils::str_case_eq(text, "none"sv) || utils::str_case_eq(text, "false"sv)) {
            out = outlier_mode::none;
            return true;
        }
        if (utils::str_case_eq(text, "worst"sv)) {
            out = outlier_mode::worst;
            return true;
        }
        if (utils::str_case_eq(text, "best"sv)) {
            out = outlier_mode::best;
            return true;
        }
        if (utils::str_case_eq(text, "all"sv)) {
            out = outlier_mode::all;
            return true;
        }
        return false;
    }

    struct startup_config {
        command_kind command{command_kind::run};

        // Unset: "tempo.json" in the working directory, defaults when it does not exist.
        std::optional<std::filesystem::path> config_path{};

        std::optional<std::string> file{};
        std::optional<std::string> builder{};
        std::optional<std::string> executor{};
        std::optional<std::string> name{};
        std::optional<std::string> shared{};

        std::optional<log_level> level{};
        color_mode color{color_mode::automatic};

        std::vector<std::filesystem::path> report_files{};

        bool print_config{false};
    };

}  // namespace tempo
