#pragma once

#include "config.hpp"
#include "logger.hpp"
#include "result.hpp"

#include <compare>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace tempo {

    // Turns suite files into a runnable bundle under `output_dir`.
    class builder {
      public:
        virtual ~builder() = default;

        // Name used when the configuration gives none.
        virtual std::string name() const = 0;

        virtual void build(const std::filesystem::path& output_dir, const std::vector<std::string>& files) = 0;
    };

    struct log_message {
        log_level level{log_level::info};
        std::string log{};
    };

    // Raised by the suite side; `params` names the scene a case failed in.
    struct error_message {
        std::string message{};
        std::optional<std::string> params{};
    };

    using client_message = std::variant<log_message, record_list, error_message>;

    /*
     * Unbounded multi-producer queue between an executor and the coordinator.
     * pop() blocks until a message arrives or the channel is closed and drained.
     */
    class message_channel {
      public:
        void push(client_message message) {
            {
                std::lock_guard lock{mutex_};
                if (closed_) {
                    return;
                }
                queue_.push_back(std::move(message));
            }
            cv_.notify_one();
        }

        std::optional<client_message> pop() {
            std::unique_lock lock{mutex_};
            cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
            if (queue_.empty()) {
                return std::nullopt;
            }
            auto message = std::move(queue_.front());
            queue_.pop_front();
            return message;
        }

        void close() {
            {
                std::lock_guard lock{mutex_};
                closed_ = true;
            }
            cv_.notify_all();
        }

      private:
        std::mutex mutex_;
        std::condition_variable cv_;
        std::deque<client_message> queue_;
        bool closed_{false};
    };

    struct execution_context {
        std::filesystem::path temp_dir{};
        // Regex source selecting benchmark cases by name.
        std::string pattern{};
        std::vector<std::string> files{};
        std::filesystem::path root{};
        std::function<void(client_message)> dispatch{};
    };

    /*
     * Runs built suites. start()/close() bracket every run() of one job; run() returns
     * once the process or session has exited, streaming messages through ctx.dispatch.
     * A run is expected to dispatch exactly one record_list (index-aligned with
     * ctx.files) or one error_message.
     */
    class executor {
      public:
        virtual ~executor() = default;

        virtual std::string name() const = 0;

        virtual void start() {}
        virtual void close() {}

        virtual void run(execution_context& ctx) = 0;
    };

    template <typename T>
    struct named_tool {
        std::string name{};
        std::shared_ptr<T> tool{};
    };

    struct toolchain_spec {
        std::vector<std::string> include{};
        std::vector<named_tool<builder>> builders{};
        std::vector<named_tool<executor>> executors{};
    };

    struct build_artifact {
        std::string builder_name{};
        std::filesystem::path root{};
        std::vector<std::string> files{};
    };

    struct job {
        std::string executor_name{};
        std::shared_ptr<tempo::executor> executor{};
        std::vector<build_artifact> builds{};
    };

    struct tool_id {
        size_t value{};

        auto operator<=>(const tool_id&) const = default;
    };

    using tool_handle = std::variant<std::shared_ptr<builder>, std::shared_ptr<executor>>;

    /*
     * Names tool instances. Identity is the instance, not its name: one instance may be
     * listed by several toolchains but must carry the same name everywhere.
     */
    class tool_registry {
      public:
        // Throws configuration_error on a blank name or an instance already named differently.
        tool_id register_tool(const tool_handle& tool, std::string_view name);

        std::optional<tool_id> find(const tool_handle& tool) const;

        const std::string& name_of(tool_id id) const;
        const tool_handle& tool(tool_id id) const;

        size_t size() const { return entries_.size(); }

      private:
        struct entry {
            tool_handle tool;
            std::string name;
        };

        std::vector<entry> entries_{};
    };

    struct job_filter {
        // Substring of the suite path.
        std::optional<std::string> file{};
        // Regex sources matched against tool names.
        std::optional<std::string> builder{};
        std::optional<std::string> executor{};
        // Regex source forwarded to executors.
        std::optional<std::string> name{};
    };

    using glob_fn = std::function<std::vector<std::string>(const std::vector<std::string>& patterns)>;

    /*
     * Builds the executor -> artifacts matrix.
     *
     * add() every toolchain, build() once, then get_jobs(). Builders run concurrently;
     * artifacts and jobs follow registration order.
     */
    class job_generator {
      public:
        job_generator(std::filesystem::path temp_dir, job_filter filter, host_logger& logger, glob_fn glob = {});

        void add(const toolchain_spec& toolchain);

        // Throws build_error naming the first builder (in registration order) that failed.
        void build(std::optional<std::string_view> shared = std::nullopt);

        std::vector<job> get_jobs() const;

        const tool_registry& registry() const { return registry_; }

      private:
        struct builder_entry {
            tool_id id;
            std::vector<std::string> includes{};
        };

        struct executor_entry {
            tool_id id;
            std::vector<tool_id> builders{};
        };

        std::filesystem::path temp_dir_;
        job_filter filter_;
        host_logger& logger_;
        glob_fn glob_;

        tool_registry registry_{};
        std::vector<builder_entry> builders_{};
        std::vector<executor_entry> executors_{};
        std::vector<std::pair<tool_id, build_artifact>> artifacts_{};
    };

}  // namespace tempo
