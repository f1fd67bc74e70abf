#pragma once

#include "toolchain.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace tempo {

    /*
     * Copies nothing: writes <root>/index.json listing the suite files so an executor can
     * load them from their original location.
     */
    class noop_builder final : public builder {
      public:
        std::string name() const override { return "noop"; }

        void build(const std::filesystem::path& output_dir, const std::vector<std::string>& files) override;
    };

    /*
     * Runs an external command per build. The tokens "{out}" and "{files}" are replaced by
     * the output directory and the suite files; without "{files}" the files are appended.
     * stdout/stderr are kept in the output directory as build.stdout/build.stderr.
     */
    class command_builder final : public builder {
      public:
        explicit command_builder(std::string command);

        std::string name() const override;

        void build(const std::filesystem::path& output_dir, const std::vector<std::string>& files) override;

        const std::string& command() const { return command_; }

      private:
        std::string command_;
    };

    /*
     * Spawns `command <root>` once per build and reads client messages, one JSON object per
     * stdout line:
     *
     *   {"level": "info", "log": "..."}
     *   {"records": [ ...toolchain results, one per file... ]}
     *   {"error": {"message": "...", "params": "..."}}
     *
     * The child sees TEMPO_ROOT, TEMPO_FILES (newline separated), TEMPO_PATTERN and
     * TEMPO_TEMP_DIR in its environment.
     */
    class process_executor final : public executor {
      public:
        explicit process_executor(std::string command);

        std::string name() const override;

        void run(execution_context& ctx) override;

        const std::string& command() const { return command_; }

      private:
        std::string command_;
    };

    // nullopt for lines that are not a client message.
    std::optional<client_message> parse_client_message(std::string_view line);

}  // namespace tempo
