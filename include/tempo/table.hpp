#pragma once

#include "config.hpp"
#include "summary.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tempo {

    enum class cell_color : uint8_t { none, green, red, magenta, gray, cyan, yellow };

    inline constexpr std::string_view to_string(cell_color color) {
        switch (color) {
            case cell_color::none:
                return "none"sv;
            case cell_color::green:
                return "green"sv;
            case cell_color::red:
                return "red"sv;
            case cell_color::magenta:
                return "magenta"sv;
            case cell_color::gray:
                return "gray"sv;
            case cell_color::cyan:
                return "cyan"sv;
            case cell_color::yellow:
                return "yellow"sv;
        }
        return "none"sv;
    }

    // Empty, a number still to be formatted, or final text.
    using cell_value = std::variant<std::monostate, double, std::string>;

    struct table_cell {
        cell_value value{};
        cell_color color{cell_color::none};

        bool operator==(const table_cell&) const = default;
    };

    struct summary_table_options {
        // Add a "<metric>.SD" column for statistics metrics.
        bool std_dev{true};
        // Show variables with a single value (Name is always shown).
        bool show_single{false};
        // Percentile columns "<metric>.pNN" for statistics metrics.
        std::vector<double> percentiles{};
        outlier_mode outliers{outlier_mode::all};
        ratio_style ratio{ratio_style::percentage};
    };

    // Renders `text` in `color`; the default leaves text untouched.
    using stainer_fn = std::function<std::string(std::string_view text, cell_color color)>;

    std::string ansi_stain(std::string_view text, cell_color color);

    struct table_format_options {
        // Pick a unit per value instead of one unit per column.
        bool flex_unit{false};
        stainer_fn stainer{};
    };

    struct formatted_table {
        std::vector<std::string> header{};
        // An empty row separates two groups.
        std::vector<std::vector<std::string>> rows{};
        std::vector<std::string> hints{};
        std::vector<std::string> warnings{};

        // Right-aligned markdown table; widths ignore ANSI escapes.
        std::string to_markdown() const;
    };

    class table_column;

    /*
     * Report table of one suite.
     *
     * Rows are flattened cases grouped by the baseline variable (a single group without a
     * baseline); numbers stay raw until format() picks units per group.
     */
    class summary_table {
      public:
        static summary_table from(
                std::span<const toolchain_result> result,
                std::span<const toolchain_result> diff = {},
                const summary_table_options& options = {});

        const std::vector<table_cell>& header() const { return header_; }
        const std::vector<std::vector<std::vector<table_cell>>>& groups() const { return groups_; }

        // Header then every row; groups are separated by an empty row.
        std::vector<std::vector<table_cell>> cells() const;

        const std::vector<std::string>& hints() const { return hints_; }
        const std::vector<std::string>& warnings() const { return warnings_; }

        formatted_table format(const table_format_options& options = {}) const;

      private:
        std::vector<table_cell> header_{};
        std::vector<std::optional<std::string>> formats_{};
        std::vector<std::vector<std::vector<table_cell>>> groups_{};
        std::vector<std::string> hints_{};
        std::vector<std::string> warnings_{};
    };

}  // namespace tempo
