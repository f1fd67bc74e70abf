#include "tempo/tools.hpp"

#include "tempo/errors.hpp"

#include "internal/process.hpp"
#include "internal/types.hpp"

#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;
using namespace tempo::literals;

namespace tempo {

    namespace detail {

        static std::vector<std::string> split_command(const std::string& command) {
            auto args = utils::split_whitespace(command);
            if (args.empty()) {
                throw configuration_error{"Command must not be empty"};
            }
            return args;
        }

        static std::string join_lines(const std::vector<std::string>& values) {
            return utils::join_with_separator(values, "\n"sv);
        }

    }  // namespace detail

    void noop_builder::build(const fs::path& output_dir, const std::vector<std::string>& files) {
        internal::build_manifest manifest{.files = files};

        std::string json{};
        auto ec = glz::write_json(manifest, json);
        if (ec) {
            throw std::runtime_error("failed to serialize build manifest");
        }

        auto path = output_dir / "index.json";
        std::ofstream out{path};
        if (!out) {
            throw std::runtime_error("failed to open {}"_format(path.string()));
        }
        out << json << '\n';
    }

    command_builder::command_builder(std::string command) : command_{std::move(command)} {
        (void)detail::split_command(command_);
    }

    std::string command_builder::name() const {
        return internal::process::program_name(command_);
    }

    void command_builder::build(const fs::path& output_dir, const std::vector<std::string>& files) {
        std::vector<std::string> args{};
        bool has_files = false;
        for (auto& token : detail::split_command(command_)) {
            if (token == "{out}") {
                args.push_back(output_dir.string());
            }
            else if (token == "{files}") {
                args.insert(args.end(), files.begin(), files.end());
                has_files = true;
            }
            else {
                args.push_back(std::move(token));
            }
        }
        if (!has_files) {
            args.insert(args.end(), files.begin(), files.end());
        }

        auto exit_code =
                internal::process::run_process(args, output_dir / "build.stdout", output_dir / "build.stderr");
        if (exit_code != 0) {
            throw std::runtime_error(
                    "Execute Failed ({}), Command: {}"_format(exit_code, internal::process::join_command(args)));
        }
    }

    process_executor::process_executor(std::string command) : command_{std::move(command)} {
        (void)detail::split_command(command_);
    }

    std::string process_executor::name() const {
        return internal::process::program_name(command_);
    }

    void process_executor::run(execution_context& ctx) {
        auto args = detail::split_command(command_);
        args.push_back(ctx.root.string());

        internal::process::env_list env{
                {"TEMPO_ROOT", ctx.root.string()},
                {"TEMPO_FILES", detail::join_lines(ctx.files)},
                {"TEMPO_PATTERN", ctx.pattern},
                {"TEMPO_TEMP_DIR", ctx.temp_dir.string()}};

        auto exit_code = internal::process::run_process_lines(args, env, [&](std::string_view line) {
            if (auto message = parse_client_message(line)) {
                ctx.dispatch(std::move(*message));
            }
            else if (!utils::is_blank(line)) {
                ctx.dispatch(log_message{.level = log_level::debug, .log = std::string{line}});
            }
        });

        if (exit_code != 0) {
            throw executor_transport_error{
                    "Execute Failed ({}), Command: {}"_format(exit_code, internal::process::join_command(args))};
        }
    }

    std::optional<client_message> parse_client_message(std::string_view line) {
        line = utils::trim_ascii(line);
        if (!line.starts_with('{')) {
            return std::nullopt;
        }

        std::string json{line};
        internal::wire_message message{};
        if (glz::read<glz::opts{.error_on_unknown_keys = false}>(message, json)) {
            return std::nullopt;
        }

        if (message.records) {
            return client_message{std::move(*message.records)};
        }
        if (message.error) {
            return client_message{error_message{
                    .message = std::move(message.error->message), .params = std::move(message.error->params)}};
        }
        if (message.log) {
            auto level = log_level::info;
            if (message.level && !try_parse_log_level(*message.level, level)) {
                level = log_level::info;
            }
            return client_message{log_message{.level = level, .log = std::move(*message.log)}};
        }
        return std::nullopt;
    }

}  // namespace tempo
