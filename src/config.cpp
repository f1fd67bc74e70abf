#include "tempo/errors.hpp"
#include "tempo/host.hpp"
#include "tempo/tools.hpp"

#include "internal/types.hpp"

#include <fstream>
#include <map>
#include <sstream>
#include <tuple>

namespace fs = std::filesystem;
using namespace tempo::literals;

namespace tempo {

    namespace detail {

        inline constexpr auto default_include = "./benchmark/**/*"sv;
        inline constexpr int supported_schema_version = 1;

        // Tools are shared between toolchains when kind, name and command all match.
        class tool_factory {
          public:
            named_tool<builder> make_builder(const internal::tool_record& record) {
                auto key = key_of(record);
                if (auto it = builders_.find(key); it != builders_.end()) {
                    return it->second;
                }

                std::shared_ptr<builder> tool{};
                if (record.kind == "noop"sv) {
                    tool = std::make_shared<noop_builder>();
                }
                else if (record.kind == "command"sv) {
                    tool = std::make_shared<command_builder>(require_command(record));
                }
                else {
                    throw configuration_error{"Unknown builder kind: \"{}\""_format(record.kind)};
                }

                named_tool<builder> named{.name = record.name.value_or(tool->name()), .tool = tool};
                builders_.emplace(std::move(key), named);
                return named;
            }

            named_tool<executor> make_executor(const internal::tool_record& record) {
                auto key = key_of(record);
                if (auto it = executors_.find(key); it != executors_.end()) {
                    return it->second;
                }

                std::shared_ptr<executor> tool{};
                if (record.kind == "process"sv) {
                    tool = std::make_shared<process_executor>(require_command(record));
                }
                else {
                    throw configuration_error{"Unknown executor kind: \"{}\""_format(record.kind)};
                }

                named_tool<executor> named{.name = record.name.value_or(tool->name()), .tool = tool};
                executors_.emplace(std::move(key), named);
                return named;
            }

          private:
            using tool_key = std::tuple<std::string, std::string, std::string>;

            static tool_key key_of(const internal::tool_record& record) {
                return {record.kind, record.name.value_or(""), record.command.value_or("")};
            }

            static std::string require_command(const internal::tool_record& record) {
                if (!record.command || utils::is_blank(*record.command)) {
                    throw configuration_error{"Tool kind \"{}\" requires a command"_format(record.kind)};
                }
                return *record.command;
            }

            std::map<tool_key, named_tool<builder>> builders_{};
            std::map<tool_key, named_tool<executor>> executors_{};
        };

        static std::shared_ptr<reporter> make_reporter(const internal::reporter_record& record) {
            if (record.kind == "raw"sv) {
                return std::make_shared<raw_reporter>(record.file.value_or("tempo-result.json"));
            }
            if (record.kind != "text"sv) {
                throw configuration_error{"Unknown reporter kind: \"{}\""_format(record.kind)};
            }

            text_reporter_options options{};
            if (record.file) {
                options.file = *record.file;
            }
            options.console = record.console.value_or(true);
            options.flex_unit = record.flex_unit.value_or(false);
            options.table.std_dev = record.std_dev.value_or(true);
            options.table.show_single = record.show_single.value_or(false);
            if (record.percentiles) {
                options.table.percentiles = *record.percentiles;
                for (auto p : options.table.percentiles) {
                    if (p < 0.0 || p > 100.0) {
                        throw configuration_error{"Percentile out of range: {}"_format(p)};
                    }
                }
            }
            if (record.outliers && !try_parse_outlier_mode(*record.outliers, options.table.outliers)) {
                throw configuration_error{"Invalid outliers mode: \"{}\""_format(*record.outliers)};
            }
            if (record.ratio_style && !try_parse_ratio_style(*record.ratio_style, options.table.ratio)) {
                throw configuration_error{"Invalid ratio style: \"{}\""_format(*record.ratio_style)};
            }
            return std::make_shared<text_reporter>(std::move(options));
        }

        static host_config normalize_config(const internal::persisted_config& persisted) {
            if (persisted.schema_version > supported_schema_version) {
                throw configuration_error{"unsupported schema_version: {} > {}"_format(
                        persisted.schema_version, supported_schema_version)};
            }

            host_config config{};
            if (persisted.temp_dir) {
                config.temp_dir = *persisted.temp_dir;
            }
            config.clean_temp_dir = persisted.clean_temp_dir.value_or(true);
            if (persisted.diff) {
                config.diff = *persisted.diff;
            }
            if (persisted.log_level && !try_parse_log_level(*persisted.log_level, config.level)) {
                throw configuration_error{"Invalid log level: \"{}\""_format(*persisted.log_level)};
            }

            if (persisted.reporters) {
                for (const auto& record : *persisted.reporters) {
                    config.reporters.push_back(make_reporter(record));
                }
            }
            else {
                config.reporters.push_back(std::make_shared<text_reporter>());
            }

            tool_factory factory{};
            auto toolchains = persisted.toolchains.value_or(std::vector<internal::toolchain_record>(1U));
            for (const auto& record : toolchains) {
                toolchain_spec spec{};
                spec.include = record.include.value_or(std::vector<std::string>{std::string{default_include}});

                auto builders = record.builders.value_or(std::vector<internal::tool_record>{{.kind = "noop"}});
                for (const auto& b : builders) {
                    spec.builders.push_back(factory.make_builder(b));
                }
                if (record.executors) {
                    for (const auto& e : *record.executors) {
                        spec.executors.push_back(factory.make_executor(e));
                    }
                }
                config.toolchains.push_back(std::move(spec));
            }
            return config;
        }

    }  // namespace detail

    host_config parse_host_config(std::string_view text) {
        std::string json{text};
        internal::persisted_config persisted{};
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(persisted, json);
        if (ec) {
            throw configuration_error{"failed to parse config: {}"_format(glz::format_error(ec, json))};
        }
        return detail::normalize_config(persisted);
    }

    host_config load_host_config(const fs::path& path, bool optional) {
        std::error_code ec{};
        if (!fs::exists(path, ec)) {
            if (optional) {
                return detail::normalize_config(internal::persisted_config{});
            }
            throw configuration_error{"config file does not exist: {}"_format(path.string())};
        }

        std::ifstream in{path};
        if (!in) {
            throw configuration_error{"failed to open {}"_format(path.string())};
        }
        std::ostringstream ss{};
        ss << in.rdbuf();

        try {
            return parse_host_config(ss.str());
        } catch (const configuration_error& e) {
            throw configuration_error{"{}: {}"_format(path.string(), e.what())};
        }
    }

}  // namespace tempo
