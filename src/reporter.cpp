#include "tempo/reporter.hpp"

extern "C" {
#include <unistd.h>
}

#include <fstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;
using namespace tempo::literals;

namespace tempo {

    namespace detail {

        static bool console_colors(color_mode mode, const std::ostream& console) {
            switch (mode) {
                case color_mode::always:
                    return true;
                case color_mode::never:
                    return false;
                case color_mode::automatic:
                    return &console == &std::cout && ::isatty(STDOUT_FILENO) != 0;
            }
            return false;
        }

        static std::span<const toolchain_result> previous_of(
                const std::optional<result_set>& previous, const std::string& file) {
            if (!previous) {
                return {};
            }
            auto it = previous->find(file);
            if (it == previous->end()) {
                return {};
            }
            return it->second;
        }

    }  // namespace detail

    void raw_reporter::report(const result_set& result, const std::optional<result_set>&, host_logger& logger) {
        save_result_set(result, file_);
        logger.info("Raw result saved to {}"_format(file_.string()));
    }

    void text_reporter::print(
            const result_set& result, const std::optional<result_set>& previous, std::ostream& out, bool colors) const {
        table_format_options format{.flex_unit = options_.flex_unit};
        if (colors) {
            format.stainer = ansi_stain;
        }
        auto stain = [&](std::string_view text, cell_color color) {
            return colors ? ansi_stain(text, color) : std::string{text};
        };

        out << stain("Text reporter: Format benchmark results of {} suites:"_format(result.size()), cell_color::cyan);

        for (const auto& [file, stages] : result) {
            auto table = summary_table::from(stages, detail::previous_of(previous, file), options_.table);
            auto formatted = table.format(format);

            out << stain("\n\nSuite: ", cell_color::green) << file << '\n';
            out << formatted.to_markdown();

            if (!formatted.hints.empty()) {
                out << "\nHints:\n";
                for (const auto& hint : formatted.hints) {
                    out << hint << '\n';
                }
            }
            if (!formatted.warnings.empty()) {
                out << "\nWarnings:\n";
                for (const auto& warning : formatted.warnings) {
                    out << warning << '\n';
                }
            }
        }
        out << '\n';
    }

    void text_reporter::report(const result_set& result, const std::optional<result_set>& previous, host_logger& logger) {
        if (options_.console) {
            print(result, previous, console_, detail::console_colors(options_.color, console_));
        }
        if (options_.file) {
            auto parent = options_.file->parent_path();
            if (!parent.empty()) {
                std::error_code ec{};
                fs::create_directories(parent, ec);
                if (ec) {
                    throw std::runtime_error("failed to create directory: {}"_format(parent.string()));
                }
            }
            std::ofstream out{*options_.file};
            if (!out) {
                throw std::runtime_error("failed to open {}"_format(options_.file->string()));
            }
            print(result, previous, out, false);
            logger.info("Text report saved to {}"_format(options_.file->string()));
        }
    }

}  // namespace tempo
