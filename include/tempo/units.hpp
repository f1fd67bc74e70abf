#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tempo::units {

    // Value rendering with at most two decimals, trailing zeros dropped: 750, 1.75, 433.01.
    std::string format_number(double value);

    // Inserts ',' every three digits in the integer part of the first number in `text`.
    std::string separate_thousand(std::string_view text);

    struct fixed_unit {
        double scale{1.0};
        std::string unit{};

        std::string format(double value) const;
    };

    /*
     * A family of units over one dimension, fractions[i] being the size of units[i]
     * in the smallest unit (e.g. ns for durations).
     */
    class unit_convertor {
      public:
        // `base` is the unit assumed when a format spec names none.
        unit_convertor(std::vector<std::string> units, std::vector<double> fractions, size_t base);

        const std::vector<std::string>& units() const { return units_; }
        const std::vector<double>& fractions() const { return fractions_; }

        // Size of `unit` in the smallest unit; nullopt selects the base unit.
        double fraction_of(std::optional<std::string_view> unit) const;

        // Index of the largest unit not exceeding |value| (value in the smallest unit).
        size_t suit(double value) const;

        // Best unit for a single value given in `unit`.
        std::string format_div(double value, std::optional<std::string_view> unit = std::nullopt) const;

        // One unit for all values: the largest unit keeping the smallest non-zero magnitude >= 1.
        fixed_unit homogeneous(std::span<const double> values, std::optional<std::string_view> unit = std::nullopt) const;

      private:
        std::vector<std::string> units_;
        std::vector<double> fractions_;
        size_t base_;
    };

    const unit_convertor& decimal_prefix();
    const unit_convertor& duration();
    const unit_convertor& data_size_iec();

    struct parsed_format {
        const unit_convertor* convertor{};
        std::optional<std::string> unit{};
        std::string suffix{};
    };

    // Parses "{kind}" or "{kind.unit}" followed by a literal suffix; throws std::invalid_argument.
    parsed_format parse_format(std::string_view spec);

}  // namespace tempo::units
