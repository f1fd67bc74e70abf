#pragma once

#include "config.hpp"
#include "logger.hpp"
#include "result.hpp"
#include "table.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <ostream>

namespace tempo {

    class reporter {
      public:
        virtual ~reporter() = default;

        // `previous` is the diff baseline when one is configured and exists.
        virtual void report(const result_set& result, const std::optional<result_set>& previous, host_logger& logger) = 0;
    };

    // Saves the raw result set as JSON.
    class raw_reporter final : public reporter {
      public:
        explicit raw_reporter(std::filesystem::path file = "tempo-result.json") : file_{std::move(file)} {}

        const std::filesystem::path& file() const { return file_; }

        void report(const result_set& result, const std::optional<result_set>& previous, host_logger& logger) override;

      private:
        std::filesystem::path file_;
    };

    struct text_reporter_options {
        bool console{true};
        std::optional<std::filesystem::path> file{};
        color_mode color{color_mode::automatic};
        bool flex_unit{false};
        summary_table_options table{};
    };

    // One markdown table per suite, followed by its hints and warnings.
    class text_reporter final : public reporter {
      public:
        explicit text_reporter(text_reporter_options options = {}, std::ostream& console = std::cout)
                : options_{std::move(options)}, console_{console} {}

        const text_reporter_options& options() const { return options_; }
        void set_color(color_mode color) { options_.color = color; }

        void report(const result_set& result, const std::optional<result_set>& previous, host_logger& logger) override;

        // Renders the whole report into `out`, ANSI colors only when `colors` is set.
        void print(const result_set& result, const std::optional<result_set>& previous, std::ostream& out, bool colors) const;

      private:
        text_reporter_options options_;
        std::ostream& console_;
    };

}  // namespace tempo
