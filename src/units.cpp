#include "tempo/units.hpp"

#include "tempo/format.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

using namespace tempo::literals;
using namespace std::string_view_literals;

namespace tempo::units {

    namespace detail {

        static bool ascii_is_digit(char c) {
            return c >= '0' && c <= '9';
        }

        static std::string join_value_and_unit(std::string value, std::string_view unit) {
            if (unit.empty()) {
                return value;
            }
            value.push_back(' ');
            value.append(unit);
            return value;
        }

        static bool is_identifier(std::string_view text) {
            return !text.empty() && std::ranges::all_of(text, [](char c) {
                return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
            });
        }

    }  // namespace detail

    std::string format_number(double value) {
        if (std::isnan(value)) {
            return "NaN";
        }
        if (std::isinf(value)) {
            return value > 0 ? "Infinity" : "-Infinity";
        }

        auto text = "{:.2f}"_format(value);
        if (auto dot = text.find('.'); dot != std::string::npos) {
            while (text.back() == '0') {
                text.pop_back();
            }
            if (text.back() == '.') {
                text.pop_back();
            }
        }
        if (text == "-0") {
            return "0";
        }
        return text;
    }

    std::string separate_thousand(std::string_view text) {
        auto begin = size_t{0U};
        while (begin < text.size() && !detail::ascii_is_digit(text[begin])) {
            ++begin;
        }
        auto end = begin;
        while (end < text.size() && detail::ascii_is_digit(text[end])) {
            ++end;
        }
        if (end - begin <= 3U) {
            return std::string{text};
        }

        std::string out{text.substr(0U, begin)};
        auto digits = text.substr(begin, end - begin);
        for (size_t i = 0U; i < digits.size(); ++i) {
            if (i != 0U && (digits.size() - i) % 3U == 0U) {
                out.push_back(',');
            }
            out.push_back(digits[i]);
        }
        out.append(text.substr(end));
        return out;
    }

    std::string fixed_unit::format(double value) const {
        return detail::join_value_and_unit(format_number(value / scale), unit);
    }

    unit_convertor::unit_convertor(std::vector<std::string> units, std::vector<double> fractions, size_t base)
            : units_{std::move(units)}, fractions_{std::move(fractions)}, base_{base} {
        if (units_.empty() || units_.size() != fractions_.size() || base_ >= units_.size()) {
            throw std::invalid_argument("unit table is malformed");
        }
    }

    double unit_convertor::fraction_of(std::optional<std::string_view> unit) const {
        if (!unit) {
            return fractions_[base_];
        }
        for (size_t i = 0U; i < units_.size(); ++i) {
            if (units_[i] == *unit) {
                return fractions_[i];
            }
        }
        throw std::invalid_argument("unknown unit: {}"_format(*unit));
    }

    size_t unit_convertor::suit(double value) const {
        value = std::abs(value);
        for (size_t i = units_.size(); i-- > 0U;) {
            if (value >= fractions_[i]) {
                return i;
            }
        }
        return 0U;
    }

    std::string unit_convertor::format_div(double value, std::optional<std::string_view> unit) const {
        auto x = fraction_of(unit);
        if (!std::isfinite(value) || value == 0.0) {
            auto base = unit ? std::string{*unit} : units_[base_];
            return detail::join_value_and_unit(format_number(value), base);
        }
        auto scaled = value * x;
        auto i = suit(scaled);
        return detail::join_value_and_unit(format_number(scaled / fractions_[i]), units_[i]);
    }

    fixed_unit unit_convertor::homogeneous(std::span<const double> values, std::optional<std::string_view> unit) const {
        auto x = fraction_of(unit);

        auto min = std::numeric_limits<double>::infinity();
        for (auto v : values) {
            if (v != 0.0 && std::isfinite(v)) {
                min = std::min(min, std::abs(v * x));
            }
        }
        if (!std::isfinite(min)) {
            return fixed_unit{.scale = 1.0, .unit = unit ? std::string{*unit} : units_[base_]};
        }

        auto i = suit(min);
        return fixed_unit{.scale = fractions_[i] / x, .unit = units_[i]};
    }

    const unit_convertor& decimal_prefix() {
        static const unit_convertor convertor{
                {"p", "n", "μ", "m", "", "K", "M", "G", "T", "P", "E"},
                {1e0, 1e3, 1e6, 1e9, 1e12, 1e15, 1e18, 1e21, 1e24, 1e27, 1e30},
                4U};
        return convertor;
    }

    const unit_convertor& duration() {
        static const unit_convertor convertor{
                {"ns", "us", "ms", "s", "m", "h", "d"}, {1e0, 1e3, 1e6, 1e9, 60e9, 3600e9, 86400e9}, 0U};
        return convertor;
    }

    const unit_convertor& data_size_iec() {
        static const unit_convertor convertor{
                {"B", "KiB", "MiB", "GiB", "TiB", "PiB", "EiB"},
                {1.0,
                 1024.0,
                 1024.0 * 1024.0,
                 1024.0 * 1024.0 * 1024.0,
                 1024.0 * 1024.0 * 1024.0 * 1024.0,
                 1024.0 * 1024.0 * 1024.0 * 1024.0 * 1024.0,
                 1024.0 * 1024.0 * 1024.0 * 1024.0 * 1024.0 * 1024.0},
                0U};
        return convertor;
    }

    parsed_format parse_format(std::string_view spec) {
        if (!spec.starts_with('{')) {
            throw std::invalid_argument("invalid metric format: {}"_format(spec));
        }
        auto close = spec.find('}');
        if (close == std::string_view::npos) {
            throw std::invalid_argument("invalid metric format: {}"_format(spec));
        }

        auto inner = spec.substr(1U, close - 1U);
        auto kind = inner;
        std::optional<std::string> unit{};
        if (auto dot = inner.find('.'); dot != std::string_view::npos) {
            kind = inner.substr(0U, dot);
            auto unit_text = inner.substr(dot + 1U);
            if (!detail::is_identifier(unit_text)) {
                throw std::invalid_argument("invalid metric format: {}"_format(spec));
            }
            unit = std::string{unit_text};
        }

        parsed_format parsed{};
        if (kind == "number"sv) {
            parsed.convertor = &decimal_prefix();
        }
        else if (kind == "duration"sv) {
            parsed.convertor = &duration();
        }
        else if (kind == "dataSize"sv || kind == "data_size"sv) {
            parsed.convertor = &data_size_iec();
        }
        else {
            throw std::invalid_argument("invalid metric format: {}"_format(spec));
        }

        // throws on an unknown unit
        (void)parsed.convertor->fraction_of(unit);

        parsed.unit = std::move(unit);
        parsed.suffix = std::string{spec.substr(close + 1U)};
        return parsed;
    }

}  // namespace tempo::units
