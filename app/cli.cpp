#include "cli.hpp"

#include "tempo/host.hpp"

#include <CLI/CLI.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tempo::cli {

    namespace detail {

        using namespace std::string_view_literals;

        static void print_config(const startup_config& cfg, std::ostream& os) {
            auto or_unset = [](const std::optional<std::string>& value) -> std::string_view {
                return value ? std::string_view{*value} : "<unset>"sv;
            };

            os << "command=" << to_string(cfg.command) << '\n';
            os << "config=" << (cfg.config_path ? cfg.config_path->string() : "tempo.json") << '\n';
            os << "file=" << or_unset(cfg.file) << '\n';
            os << "builder=" << or_unset(cfg.builder) << '\n';
            os << "executor=" << or_unset(cfg.executor) << '\n';
            os << "name=" << or_unset(cfg.name) << '\n';
            os << "shared=" << or_unset(cfg.shared) << '\n';
            os << "log_level=" << (cfg.level ? to_string(*cfg.level) : "<config>"sv) << '\n';
            os << "color=" << to_string(cfg.color) << '\n';
            for (const auto& file : cfg.report_files) {
                os << "report_file=" << file.string() << '\n';
            }
        }

        static std::optional<std::string> normalize_optional(const std::string& value) {
            auto trimmed = utils::trim_ascii(value);
            if (trimmed.empty()) {
                return std::nullopt;
            }
            return std::string(trimmed);
        }

    }  // namespace detail

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg) {
        CLI::App app{"tempo: build, run and compare benchmark suites"};

        bool show_version = false;
        std::string config_arg{};
        std::string log_level_arg{};
        std::string color_arg{std::string{to_string(cfg.color)}};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("-c,--config", config_arg, "Config file (default: tempo.json)");
        app.add_option("--log-level", log_level_arg, "Log level: debug|info|warn|error|off");
        app.add_option("--color", color_arg, "Color mode: auto|always|never");
        app.add_flag("--no-color", "Force color mode to never");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");

        std::string file_arg{};
        std::string builder_arg{};
        std::string executor_arg{};
        std::string name_arg{};
        std::string shared_arg{};

        auto* run = app.add_subcommand("run", "Build and run suites, then report (default)");
        run->add_option("-f,--file", file_arg, "Only run suite files whose path contains this text");
        run->add_option("-b,--builder", builder_arg, "Regex; only use builders with a matching name");
        run->add_option("-e,--executor", executor_arg, "Regex; only use executors with a matching name");
        run->add_option("-n,--name", name_arg, "Regex; only run benchmark cases with a matching name");
        run->add_option("--shared", shared_arg, "Run a shard of the suite files, as index/total");

        std::vector<std::string> report_files{};
        auto* report = app.add_subcommand("report", "Report saved result files");
        report->add_option("files", report_files, "Result files, merged in order")->required();

        app.require_subcommand(0, 1);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (show_version) {
            std::cout << "tempo 0.1.0\n";
            return std::optional<int>{0};
        }

        if (!try_parse_color_mode(color_arg, cfg.color)) {
            std::cerr << "invalid --color value: " << color_arg << " (expected auto|always|never)\n";
            return std::optional<int>{2};
        }
        if (app.get_option("--no-color")->count() > 0U) {
            cfg.color = color_mode::never;
        }

        if (auto level = detail::normalize_optional(log_level_arg)) {
            auto parsed = log_level::debug;
            if (!try_parse_log_level(*level, parsed)) {
                std::cerr << "invalid --log-level value: " << *level << " (expected debug|info|warn|error|off)\n";
                return std::optional<int>{2};
            }
            cfg.level = parsed;
        }

        if (auto path = detail::normalize_optional(config_arg)) {
            cfg.config_path = *path;
        }

        cfg.command = report->parsed() ? command_kind::report : command_kind::run;
        cfg.file = detail::normalize_optional(file_arg);
        cfg.builder = detail::normalize_optional(builder_arg);
        cfg.executor = detail::normalize_optional(executor_arg);
        cfg.name = detail::normalize_optional(name_arg);
        cfg.shared = detail::normalize_optional(shared_arg);
        cfg.report_files.assign(report_files.begin(), report_files.end());

        if (cfg.print_config) {
            detail::print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        return std::nullopt;
    }

    int run_command(const startup_config& cfg) {
        host_logger logger{std::cout, std::cerr};

        auto config = cfg.config_path ? load_host_config(*cfg.config_path) : load_host_config("tempo.json", true);
        if (cfg.level) {
            config.level = *cfg.level;
        }
        if (cfg.color != color_mode::automatic) {
            for (const auto& r : config.reporters) {
                if (auto* text = dynamic_cast<text_reporter*>(r.get())) {
                    text->set_color(cfg.color);
                }
            }
        }

        host h{std::move(config), logger};

        if (cfg.command == command_kind::report) {
            h.report(cfg.report_files);
            return 0;
        }

        job_filter filter{.file = cfg.file, .builder = cfg.builder, .executor = cfg.executor, .name = cfg.name};
        h.run(filter, cfg.shared ? std::optional<std::string_view>{*cfg.shared} : std::nullopt);
        return 0;
    }

}  // namespace tempo::cli
