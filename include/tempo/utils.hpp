#pragma once

#include <algorithm>
#include <charconv>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <vector>

namespace tempo {

    namespace utils {
        constexpr char char_tolower(char c) {
            if (c >= 'A' && c <= 'Z') {
                return c + ('a' - 'A');
            }
            return c;
        }

        constexpr bool str_case_eq(std::string_view lhs, std::string_view rhs) {
            return std::ranges::equal(
                    lhs | std::views::transform(char_tolower), rhs | std::views::transform(char_tolower));
        }

        constexpr std::string_view trim_ascii(std::string_view value) {
            auto first = value.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos) {
                return {};
            }
            auto last = value.find_last_not_of(" \t\r\n");
            return value.substr(first, (last - first) + 1U);
        }

        constexpr bool is_blank(std::string_view value) {
            return trim_ascii(value).empty();
        }

        namespace detail {
            template <typename T>
            concept arithmetic_type = std::integral<T> || std::floating_point<T>;
        }

        template <detail::arithmetic_type T>
        constexpr std::optional<T> parse_arithmetic(std::string_view input, [[maybe_unused]] int base = 10) {
            T value{};
            std::from_chars_result result;

            if constexpr (std::integral<T>) {
                result = std::from_chars(input.data(), input.data() + input.size(), value, base);
            }
            else {
                result = std::from_chars(input.data(), input.data() + input.size(), value);
            }

            if (result.ec != std::errc{} || result.ptr != input.data() + input.size()) {
                return std::nullopt;
            }

            return {value};
        }

        inline std::string join_with_separator(const std::vector<std::string>& values, std::string_view separator) {
            if (values.empty()) {
                return {};
            }
            return values | std::views::join_with(separator) | std::ranges::to<std::string>();
        }

        // Splits on any run of ASCII whitespace, dropping empty tokens.
        inline std::vector<std::string> split_whitespace(std::string_view text) {
            std::vector<std::string> tokens{};
            size_t cursor = 0U;
            while (cursor < text.size()) {
                auto begin = text.find_first_not_of(" \t\r\n", cursor);
                if (begin == std::string_view::npos) {
                    break;
                }
                auto end = text.find_first_of(" \t\r\n", begin);
                if (end == std::string_view::npos) {
                    end = text.size();
                }
                tokens.emplace_back(text.substr(begin, end - begin));
                cursor = end;
            }
            return tokens;
        }

        inline std::string strip_dot_slash(std::string_view path) {
            if (path.starts_with("./")) {
                path.remove_prefix(2U);
            }
            return std::string{path};
        }

    }  // namespace utils

}  // namespace tempo
