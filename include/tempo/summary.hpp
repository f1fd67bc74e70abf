#pragma once

#include "result.hpp"

#include <array>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tempo {

    inline constexpr std::array<std::string_view, 3> builtin_variables{"Name"sv, "Builder"sv, "Executor"sv};

    inline constexpr bool is_builtin_variable(std::string_view name) {
        for (auto builtin : builtin_variables) {
            if (builtin == name) {
                return true;
            }
        }
        return false;
    }

    /*
     * One case under one parameter combination, the unit of comparison in a report.
     *
     * `metrics` is the raw data as received; `processed` is the copy the table works on
     * (series sorted, outliers removed).
     */
    struct flattened_row {
        std::string name{};
        std::optional<std::string> builder{};
        std::optional<std::string> executor{};
        std::vector<std::pair<std::string, std::string>> params{};
        metric_map metrics{};
        metric_map processed{};
        std::optional<size_t> row_number{};

        std::optional<std::string_view> variable(std::string_view key) const;
    };

    struct summary_note {
        note_type type{note_type::info};
        std::optional<size_t> row{};
        std::string text{};
    };

    struct variable_domain {
        std::string name{};
        std::set<std::string> values{};
    };

    class summary {
      public:
        summary() = default;
        explicit summary(std::span<const toolchain_result> results);

        std::vector<flattened_row>& rows() { return rows_; }
        const std::vector<flattened_row>& rows() const { return rows_; }

        // Name, Builder, Executor, then parameters in first-seen order.
        const std::vector<variable_domain>& variables() const { return vars_; }
        const variable_domain* find_variable(std::string_view name) const;

        // Append-only; the first definition of a key is kept.
        const std::vector<metric_meta>& meta() const { return meta_; }
        const metric_meta* find_meta(std::string_view key) const;

        std::vector<summary_note>& notes() { return notes_; }
        const std::vector<summary_note>& notes() const { return notes_; }

        const std::optional<result_baseline>& baseline() const { return baseline_; }

        // The row with the same Name, Builder, Executor and parameter values.
        const flattened_row* find(const flattened_row& row) const;

        // Groups of rows that agree on every variable except `variable`, in first-seen order.
        std::vector<std::vector<flattened_row*>> split(std::string_view variable);

        static std::string identity_of(const flattened_row& row, std::string_view excluded = {});

      private:
        void add_meta(const metric_meta& meta);
        void add_variable_value(std::string_view name, std::optional<std::string_view> value);
        void add_result(const toolchain_result& result);

        std::vector<flattened_row> rows_{};
        std::vector<variable_domain> vars_{};
        std::vector<metric_meta> meta_{};
        std::vector<summary_note> notes_{};
        std::optional<result_baseline> baseline_{};
        std::unordered_map<std::string, size_t> index_{};
    };

}  // namespace tempo
