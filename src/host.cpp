#include "tempo/host.hpp"

#include "tempo/errors.hpp"
#include "tempo/units.hpp"

#include <chrono>
#include <exception>
#include <future>
#include <system_error>

namespace fs = std::filesystem;
using namespace tempo::literals;

namespace tempo {

    namespace detail {

        // Calls close() on scope exit unless close() already ran.
        class executor_session {
          public:
            executor_session(executor& e, std::string_view name, host_logger& logger)
                    : executor_{e}, name_{name}, logger_{logger} {}

            executor_session(const executor_session&) = delete;
            executor_session& operator=(const executor_session&) = delete;

            ~executor_session() {
                if (closed_) {
                    return;
                }
                try {
                    executor_.close();
                } catch (const std::exception& e) {
                    logger_.error("Failed to close executor \"{}\": {}"_format(name_, e.what()));
                }
            }

            void start() { executor_.start(); }

            void close() {
                closed_ = true;
                executor_.close();
            }

          private:
            executor& executor_;
            std::string_view name_;
            host_logger& logger_;
            bool closed_{false};
        };

        /*
         * One run() of an executor: the run itself on a worker, its messages drained here
         * until the worker finishes. Both must succeed.
         */
        static record_list run_build(
                executor& e, const build_artifact& build, const run_options& options, host_logger& logger) {
            message_channel channel{};
            execution_context ctx{
                    .temp_dir = options.temp_dir,
                    .pattern = options.pattern,
                    .files = build.files,
                    .root = build.root,
                    .dispatch = [&channel](client_message message) { channel.push(std::move(message)); }};

            auto worker = std::async(std::launch::async, [&e, &ctx, &channel] {
                struct close_on_exit {
                    message_channel& channel;
                    ~close_on_exit() { channel.close(); }
                } guard{channel};
                e.run(ctx);
            });

            std::optional<record_list> records{};
            std::optional<error_message> error{};
            while (auto message = channel.pop()) {
                if (auto* log = std::get_if<log_message>(&*message)) {
                    logger.log(log->level, log->log);
                }
                else if (auto* list = std::get_if<record_list>(&*message)) {
                    if (!records && !error) {
                        records = std::move(*list);
                    }
                }
                else if (auto* err = std::get_if<error_message>(&*message)) {
                    if (!records && !error) {
                        error = std::move(*err);
                    }
                }
            }

            // a reported case error settles first; a later failure of run() is only logged
            if (error) {
                try {
                    worker.get();
                } catch (const std::exception& ex) {
                    logger.warn("Executor failed after reporting an error: {}"_format(ex.what()));
                }
                auto cause = std::make_exception_ptr(std::runtime_error{error->message});
                if (error->params) {
                    throw suite_case_error{*error->params, cause};
                }
                std::rethrow_exception(cause);
            }

            worker.get();

            if (!records) {
                throw executor_transport_error{"Executor exited without sending results"};
            }
            if (records->size() != build.files.size()) {
                throw executor_transport_error{
                        "Executor sent {} results for {} suite files"_format(records->size(), build.files.size())};
            }
            return std::move(*records);
        }

        static std::string format_elapsed(std::chrono::steady_clock::time_point start) {
            auto ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
            return units::duration().format_div(ms, "ms");
        }

        static void validate(const host_config& config) {
            if (config.toolchains.empty()) {
                throw configuration_error{"No toolchains."};
            }
            for (const auto& toolchain : config.toolchains) {
                if (toolchain.include.empty()) {
                    throw configuration_error{"No included files."};
                }
                if (toolchain.builders.empty()) {
                    throw configuration_error{"No builders."};
                }
                if (toolchain.executors.empty()) {
                    throw configuration_error{"No executors."};
                }
            }
        }

    }  // namespace detail

    result_set run_jobs(const std::vector<job>& jobs, const run_options& options, host_logger& logger) {
        result_set result{};

        for (const auto& j : jobs) {
            logger.info("Running suites with executor \"{}\""_format(j.executor_name));

            detail::executor_session session{*j.executor, j.executor_name, logger};
            session.start();

            for (const auto& build : j.builds) {
                logger.info("{} suites from builder \"{}\""_format(build.files.size(), build.builder_name));

                record_list records{};
                try {
                    records = detail::run_build(*j.executor, build, options, logger);
                } catch (const suite_case_error& e) {
                    logger.error("Failed to run suite with (builder={}, executor={})"_format(
                            build.builder_name, j.executor_name));
                    logger.error("At scene {}"_format(e.params()));
                    if (auto cause = e.cause()) {
                        std::rethrow_exception(cause);
                    }
                    throw;
                } catch (const std::exception&) {
                    logger.error("Failed to run suite with (builder={}, executor={})"_format(
                            build.builder_name, j.executor_name));
                    throw;
                }

                for (size_t i = 0U; i < records.size(); ++i) {
                    auto& record = records[i];
                    record.builder = build.builder_name;
                    record.executor = j.executor_name;
                    result[utils::strip_dot_slash(build.files[i])].push_back(std::move(record));
                }
            }

            session.close();
        }

        return result;
    }

    host::host(host_config config, host_logger& logger) : config_{std::move(config)}, logger_{logger} {
        logger_.set_level(config_.level);
    }

    const result_set& host::run(const job_filter& filter, std::optional<std::string_view> shared) {
        detail::validate(config_);

        auto start = std::chrono::steady_clock::now();
        result_.clear();

        job_generator generator{config_.temp_dir, filter, logger_};
        for (const auto& toolchain : config_.toolchains) {
            generator.add(toolchain);
        }
        generator.build(shared);
        auto jobs = generator.get_jobs();

        if (jobs.empty()) {
            logger_.warn("No files match the includes, please check your config.");
            return result_;
        }

        size_t count = 0U;
        for (const auto& j : jobs) {
            count += j.builds.size();
        }
        logger_.info("{} jobs for {} executors."_format(count, jobs.size()));

        result_ = run_jobs(jobs, run_options{.temp_dir = config_.temp_dir, .pattern = filter.name.value_or("")}, logger_);

        run_reporters(result_);

        // kept on failure so the build output can be inspected
        if (config_.clean_temp_dir) {
            std::error_code ec{};
            fs::remove_all(config_.temp_dir, ec);
            if (ec) {
                logger_.error("Failed to clean {}: {}"_format(config_.temp_dir.string(), ec.message()));
            }
        }

        logger_.info("Global total time: {}."_format(detail::format_elapsed(start)));
        return result_;
    }

    void host::report(const std::vector<fs::path>& files) {
        if (files.empty()) {
            throw configuration_error{"No result files to report."};
        }
        result_set result{};
        for (const auto& file : files) {
            merge(result, std::move(*load_result_set(file)));
        }
        run_reporters(result);
    }

    void host::run_reporters(const result_set& result) {
        std::optional<result_set> previous{};
        if (config_.diff) {
            previous = load_result_set(*config_.diff, true);
        }
        for (const auto& r : config_.reporters) {
            r->report(result, previous, logger_);
        }
    }

}  // namespace tempo
