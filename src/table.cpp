#include "tempo/table.hpp"

#include "tempo/errors.hpp"
#include "tempo/stats.hpp"
#include "tempo/units.hpp"

#include <algorithm>
#include <cmath>

using namespace tempo::literals;

namespace tempo {

    /*
     * One column of a summary table. prepare() runs once per group before value() is
     * asked for every row of that group, in row order.
     */
    class table_column {
      public:
        virtual ~table_column() = default;

        virtual std::string name() const = 0;
        virtual cell_color header_color() const { return cell_color::none; }
        virtual std::optional<std::string> format() const { return std::nullopt; }

        virtual void prepare(std::span<flattened_row* const>) {}
        virtual table_cell value(flattened_row& row) = 0;
    };

    namespace detail {

        static const metric_value* find_metric(const flattened_row& row, const std::string& key) {
            auto it = row.processed.find(key);
            return it == row.processed.end() ? nullptr : &it->second;
        }

        static std::string fixed2(double v) {
            return "{:.2f}"_format(v);
        }

        static std::string ratio_text(double v, ratio_style style) {
            switch (style) {
                case ratio_style::percentage: {
                    auto delta = (v - 1.0) * 100.0;
                    return delta > 0.0 ? "+{}%"_format(fixed2(delta)) : "{}%"_format(fixed2(delta));
                }
                case ratio_style::trend:
                    return "{}%"_format(fixed2(v * 100.0));
                case ratio_style::value:
                    return "{}x"_format(fixed2(v));
            }
            return fixed2(v);
        }

        static table_cell ratio_cell(double v, ratio_style style, bool lower_is_better) {
            if (!std::isfinite(v)) {
                return {std::string{"N/A"}, cell_color::gray};
            }
            auto text = ratio_text(v, style);
            if (v == 1.0) {
                return {std::move(text), cell_color::none};
            }
            return {std::move(text), (v < 1.0) == lower_is_better ? cell_color::green : cell_color::red};
        }

        static stats::fence_side fence_side_of(outlier_mode mode, bool lower_is_better) {
            if (mode == outlier_mode::all) {
                return stats::fence_side::all;
            }
            return (mode == outlier_mode::best) == lower_is_better ? stats::fence_side::lower
                                                                     : stats::fence_side::upper;
        }

        static const metric_series& require_series(const metric_value& value, const std::string& key) {
            if (const auto* series = std::get_if<metric_series>(&value)) {
                return *series;
            }
            throw metric_shape_error{"Metric \"{}\" must be an array"_format(key)};
        }

        // Mean of a series, the value itself for a scalar, nothing otherwise.
        static std::optional<double> metric_number(const metric_value* value) {
            if (value == nullptr) {
                return std::nullopt;
            }
            if (const auto* series = std::get_if<metric_series>(value)) {
                return stats::mean(*series);
            }
            if (const auto* number = std::get_if<double>(value)) {
                return *number;
            }
            return std::nullopt;
        }

        class row_number_column final : public table_column {
          public:
            std::string name() const override { return "No."; }

            table_cell value(flattened_row& row) override {
                row.row_number = index_;
                return {std::to_string(index_++)};
            }

          private:
            size_t index_{0U};
        };

        class variable_column final : public table_column {
          public:
            explicit variable_column(std::string key) : key_{std::move(key)} {}

            std::string name() const override { return key_; }

            cell_color header_color() const override {
                return is_builtin_variable(key_) ? cell_color::none : cell_color::magenta;
            }

            table_cell value(flattened_row& row) override {
                if (auto v = row.variable(key_)) {
                    return {std::string{*v}};
                }
                return {};
            }

          private:
            std::string key_;
        };

        class raw_metric_column final : public table_column {
          public:
            explicit raw_metric_column(const metric_meta& meta) : meta_{meta} {}

            std::string name() const override { return meta_.key; }
            std::optional<std::string> format() const override { return meta_.format; }

            table_cell value(flattened_row& row) override {
                const auto* v = find_metric(row, meta_.key);
                if (v == nullptr) {
                    return {};
                }
                if (const auto* text = std::get_if<std::string>(v)) {
                    return {*text};
                }
                return {*metric_number(v)};
            }

          private:
            metric_meta meta_;
        };

        class statistics_column : public table_column {
          public:
            explicit statistics_column(const metric_meta& meta) : meta_{meta} {}

            std::optional<std::string> format() const override { return meta_.format; }

            table_cell value(flattened_row& row) override {
                const auto* v = find_metric(row, meta_.key);
                if (v == nullptr) {
                    return {};
                }
                return {calculate(require_series(*v, meta_.key))};
            }

          protected:
            virtual double calculate(const metric_series& sorted) const = 0;

            metric_meta meta_;
        };

        class std_dev_column final : public statistics_column {
          public:
            using statistics_column::statistics_column;

            std::string name() const override { return meta_.key + ".SD"; }

          protected:
            double calculate(const metric_series& sorted) const override {
                return stats::standard_deviation(sorted);
            }
        };

        class percentile_column final : public statistics_column {
          public:
            percentile_column(const metric_meta& meta, double p) : statistics_column{meta}, p_{p} {}

            std::string name() const override { return "{}.p{}"_format(meta_.key, units::format_number(p_)); }

          protected:
            double calculate(const metric_series& sorted) const override {
                if (sorted.empty()) {
                    return std::nan("");
                }
                return stats::quantile_sorted(sorted, p_ / 100.0);
            }

          private:
            double p_;
        };

        class baseline_column final : public table_column {
          public:
            baseline_column(const metric_meta& meta, result_baseline baseline, ratio_style style)
                    : meta_{meta}, baseline_{std::move(baseline)}, style_{style} {}

            std::string name() const override { return meta_.key + ".ratio"; }

            void prepare(std::span<flattened_row* const> group) override {
                auto it = std::ranges::find_if(
                        group, [&](const flattened_row* row) { return row->variable(baseline_.type) == baseline_.value; });
                if (it == group.end()) {
                    throw baseline_not_found_error{
                            "Baseline ({}={}) does not in the table"_format(baseline_.type, baseline_.value)};
                }
                ratio1_ = to_number(**it);
            }

            table_cell value(flattened_row& row) override {
                return ratio_cell(to_number(row) / ratio1_, style_, meta_.lower_is_better);
            }

          private:
            double to_number(const flattened_row& row) const {
                return metric_number(find_metric(row, meta_.key)).value_or(0.0);
            }

            metric_meta meta_;
            result_baseline baseline_;
            ratio_style style_;
            double ratio1_{0.0};
        };

        class difference_column final : public table_column {
          public:
            difference_column(const summary& previous, const metric_meta& meta, ratio_style style)
                    : previous_{previous}, meta_{meta}, style_{style} {}

            std::string name() const override { return meta_.key + ".diff"; }

            table_cell value(flattened_row& row) override {
                const auto* other = previous_.find(row);
                if (other == nullptr) {
                    return {};
                }
                auto p = metric_number(find_metric(*other, meta_.key));
                auto c = metric_number(find_metric(row, meta_.key));
                if (!p || !c) {
                    return {};
                }
                return ratio_cell(*c / *p, style_, meta_.lower_is_better);
            }

          private:
            const summary& previous_;
            metric_meta meta_;
            ratio_style style_;
        };

        // Sorts statistics series and drops their outliers; notes every removal.
        static void preprocess(summary& s, flattened_row& row, size_t row_index, outlier_mode mode) {
            for (const auto& meta : s.meta()) {
                if (meta.analysis != metric_analysis::statistics) {
                    continue;
                }
                auto it = row.processed.find(meta.key);
                if (it == row.processed.end()) {
                    continue;
                }
                auto before = require_series(it->second, meta.key);
                std::ranges::sort(before);

                if (mode == outlier_mode::none) {
                    it->second = std::move(before);
                    continue;
                }

                stats::tukey_outlier_detector detector{before};
                auto after = detector.filter(before, fence_side_of(mode, meta.lower_is_better));
                auto removed = before.size() - after.size();
                it->second = std::move(after);

                if (removed != 0U) {
                    s.notes().push_back(summary_note{
                            .type = note_type::info, .row = row_index, .text = "{} outliers were removed."_format(removed)});
                }
            }
        }

        struct column_formatter {
            units::parsed_format spec;
            std::optional<units::fixed_unit> shared{};

            std::string operator()(double v) const {
                auto text = shared ? shared->format(v) : spec.convertor->format_div(v, spec.unit);
                return units::separate_thousand(text) + spec.suffix;
            }
        };

        static std::string cell_text(const table_cell& cell) {
            if (const auto* text = std::get_if<std::string>(&cell.value)) {
                return *text;
            }
            if (const auto* number = std::get_if<double>(&cell.value)) {
                return units::format_number(*number);
            }
            return {};
        }

        static size_t display_width(std::string_view text) {
            size_t width = 0U;
            for (size_t i = 0U; i < text.size(); ++i) {
                if (text[i] == '\x1b') {
                    while (i < text.size() && text[i] != 'm') {
                        ++i;
                    }
                    continue;
                }
                // count code points, not continuation bytes
                if ((static_cast<unsigned char>(text[i]) & 0xC0U) != 0x80U) {
                    ++width;
                }
            }
            return width;
        }

    }  // namespace detail

    std::string ansi_stain(std::string_view text, cell_color color) {
        std::string_view code{};
        switch (color) {
            case cell_color::none:
                return std::string{text};
            case cell_color::green:
                code = "\x1b[32m"sv;
                break;
            case cell_color::red:
                code = "\x1b[31m"sv;
                break;
            case cell_color::magenta:
                code = "\x1b[95m"sv;
                break;
            case cell_color::gray:
                code = "\x1b[90m"sv;
                break;
            case cell_color::cyan:
                code = "\x1b[36m"sv;
                break;
            case cell_color::yellow:
                code = "\x1b[93m"sv;
                break;
        }
        return "{}{}\x1b[39m"_format(code, text);
    }

    summary_table summary_table::from(
            std::span<const toolchain_result> result,
            std::span<const toolchain_result> diff,
            const summary_table_options& options) {
        summary current{result};
        summary previous{diff};
        const auto& baseline = current.baseline();

        if (baseline) {
            const auto* domain = current.find_variable(baseline->type);
            if (domain == nullptr || !domain->values.contains(baseline->value)) {
                throw baseline_not_found_error{
                        "Baseline ({}={}) does not in the table"_format(baseline->type, baseline->value)};
            }
        }

        // the previous run is compared after the same outlier removal; its notes are dropped
        for (size_t i = 0U; i < previous.rows().size(); ++i) {
            detail::preprocess(previous, previous.rows()[i], i, options.outliers);
        }

        // 1. columns
        std::vector<std::unique_ptr<table_column>> columns{};
        columns.push_back(std::make_unique<detail::row_number_column>());

        for (const auto& var : current.variables()) {
            if (options.show_single || var.values.size() > 1U || var.name == "Name"sv) {
                columns.push_back(std::make_unique<detail::variable_column>(var.name));
            }
        }

        for (const auto& meta : current.meta()) {
            columns.push_back(std::make_unique<detail::raw_metric_column>(meta));
            if (meta.analysis == metric_analysis::none) {
                continue;
            }
            if (meta.analysis == metric_analysis::statistics) {
                if (options.std_dev) {
                    columns.push_back(std::make_unique<detail::std_dev_column>(meta));
                }
                for (auto p : options.percentiles) {
                    columns.push_back(std::make_unique<detail::percentile_column>(meta, p));
                }
            }
            if (baseline) {
                columns.push_back(std::make_unique<detail::baseline_column>(meta, *baseline, options.ratio));
            }
            if (previous.find_meta(meta.key) != nullptr) {
                columns.push_back(std::make_unique<detail::difference_column>(previous, meta, options.ratio));
            }
        }

        summary_table table{};
        for (const auto& column : columns) {
            table.header_.push_back(table_cell{column->name(), column->header_color()});
            table.formats_.push_back(column->format());
        }

        // 2. body
        std::vector<std::vector<flattened_row*>> groups{};
        if (baseline) {
            groups = current.split(baseline->type);
        }
        else {
            auto& all = groups.emplace_back();
            for (auto& row : current.rows()) {
                all.push_back(&row);
            }
        }

        auto* first = current.rows().data();
        for (const auto& group : groups) {
            for (auto* row : group) {
                detail::preprocess(current, *row, static_cast<size_t>(row - first), options.outliers);
            }
            for (auto& column : columns) {
                column->prepare(group);
            }

            auto& body = table.groups_.emplace_back();
            for (auto* row : group) {
                auto& cells = body.emplace_back();
                cells.reserve(columns.size());
                for (auto& column : columns) {
                    cells.push_back(column->value(*row));
                }
            }
        }

        // 3. notes
        for (const auto& note : current.notes()) {
            std::string text{};
            if (note.row) {
                const auto& row = current.rows()[*note.row];
                if (row.row_number) {
                    text = "[No.{}] "_format(*row.row_number);
                }
                text += "{}: "_format(row.name);
            }
            text += note.text;

            if (note.type == note_type::info) {
                table.hints_.push_back(std::move(text));
            }
            else {
                table.warnings_.push_back(std::move(text));
            }
        }

        return table;
    }

    std::vector<std::vector<table_cell>> summary_table::cells() const {
        std::vector<std::vector<table_cell>> out{};
        out.push_back(header_);
        for (size_t g = 0U; g < groups_.size(); ++g) {
            if (g != 0U) {
                out.emplace_back();
            }
            out.insert(out.end(), groups_[g].begin(), groups_[g].end());
        }
        return out;
    }

    formatted_table summary_table::format(const table_format_options& options) const {
        auto stain = [&](std::string text, cell_color color) {
            if (!options.stainer || color == cell_color::none) {
                return text;
            }
            return options.stainer(text, color);
        };

        formatted_table out{};
        for (const auto& cell : header_) {
            out.header.push_back(stain(detail::cell_text(cell), cell.color));
        }

        for (size_t g = 0U; g < groups_.size(); ++g) {
            if (g != 0U) {
                out.rows.emplace_back();
            }
            const auto& body = groups_[g];
            auto offset = out.rows.size();
            for (const auto& row : body) {
                auto& texts = out.rows.emplace_back();
                for (const auto& cell : row) {
                    texts.push_back(stain(detail::cell_text(cell), cell.color));
                }
            }

            for (size_t c = 0U; c < formats_.size(); ++c) {
                if (!formats_[c]) {
                    continue;
                }

                std::vector<double> values{};
                for (const auto& row : body) {
                    const auto& cell = row[c].value;
                    if (const auto* number = std::get_if<double>(&cell)) {
                        values.push_back(*number);
                    }
                    else if (std::holds_alternative<std::string>(cell)) {
                        throw metric_shape_error{
                                "Column \"{}\" has a format but contains text"_format(detail::cell_text(header_[c]))};
                    }
                }

                detail::column_formatter formatter{units::parse_format(*formats_[c])};
                if (!options.flex_unit) {
                    formatter.shared = formatter.spec.convertor->homogeneous(values, formatter.spec.unit);
                }

                for (size_t r = 0U; r < body.size(); ++r) {
                    const auto& cell = body[r][c];
                    if (const auto* number = std::get_if<double>(&cell.value)) {
                        out.rows[offset + r][c] = stain(formatter(*number), cell.color);
                    }
                }
            }
        }

        for (const auto& hint : hints_) {
            out.hints.push_back(stain(hint, cell_color::cyan));
        }
        for (const auto& warning : warnings_) {
            out.warnings.push_back(stain(warning, cell_color::yellow));
        }
        return out;
    }

    std::string formatted_table::to_markdown() const {
        std::vector<size_t> widths(header.size(), 3U);
        auto measure = [&](const std::vector<std::string>& row) {
            for (size_t i = 0U; i < row.size() && i < widths.size(); ++i) {
                widths[i] = std::max(widths[i], detail::display_width(row[i]));
            }
        };
        measure(header);
        for (const auto& row : rows) {
            measure(row);
        }

        std::string out{};
        auto append_row = [&](const std::vector<std::string>& row) {
            out += '|';
            for (size_t i = 0U; i < widths.size(); ++i) {
                std::string_view text = i < row.size() ? std::string_view{row[i]} : std::string_view{};
                out += ' ';
                out.append(widths[i] - detail::display_width(text), ' ');
                out += text;
                out += " |";
            }
            out += '\n';
        };

        append_row(header);
        out += '|';
        for (auto w : widths) {
            out += ' ';
            out.append(w - 1U, '-');
            out += ": |";
        }
        out += '\n';
        for (const auto& row : rows) {
            append_row(row);
        }
        return out;
    }

}  // namespace tempo
