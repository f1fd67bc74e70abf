#pragma once

#include "format.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tempo {

    using namespace std::string_view_literals;

    enum class metric_analysis : uint8_t {
        none,
        compare,
        statistics,
    };

    inline constexpr std::string_view to_string(metric_analysis analysis) {
        switch (analysis) {
            case metric_analysis::none:
                return "none"sv;
            case metric_analysis::compare:
                return "compare"sv;
            case metric_analysis::statistics:
                return "statistics"sv;
        }
        return "none"sv;
    }

    enum class note_type : uint8_t { info, warn };

    inline constexpr std::string_view to_string(note_type type) {
        switch (type) {
            case note_type::info:
                return "info"sv;
            case note_type::warn:
                return "warn"sv;
        }
        return "info"sv;
    }

    struct metric_meta {
        std::string key{};
        std::optional<std::string> format{};
        metric_analysis analysis{metric_analysis::none};
        bool lower_is_better{false};

        bool operator==(const metric_meta&) const = default;
    };

    using metric_series = std::vector<double>;
    using metric_value = std::variant<double, metric_series, std::string>;
    using metric_map = std::map<std::string, metric_value>;

    struct case_result {
        std::string name{};
        metric_map metrics{};
    };

    // One parameter combination: every case that ran with it, in definition order.
    using scene_result = std::vector<case_result>;

    struct param_definition {
        std::string name{};
        std::vector<std::string> values{};
    };

    struct result_note {
        note_type type{note_type::info};
        std::optional<size_t> case_id{};
        std::string text{};
    };

    struct result_baseline {
        std::string type{};
        std::string value{};
    };

    /*
     * Result of one suite file under one builder/executor pair.
     *
     * scenes[i] belongs to the i-th combination of the Cartesian product of `params`,
     * iterated with the last parameter varying fastest.
     */
    struct toolchain_result {
        std::string name{};
        std::optional<std::string> builder{};
        std::optional<std::string> executor{};
        std::vector<metric_meta> meta{};
        std::vector<param_definition> params{};
        std::vector<scene_result> scenes{};
        std::vector<result_note> notes{};
        std::optional<result_baseline> baseline{};
    };

    // Index-aligned with the file list handed to an executor.
    using record_list = std::vector<toolchain_result>;

    // Suite file -> results of every toolchain that ran it.
    using result_set = std::map<std::string, std::vector<toolchain_result>>;

    void merge(result_set& raw, const result_set& more);
    void merge(result_set& raw, result_set&& more);

    std::string serialize_result_set(const result_set& result);
    result_set parse_result_set(std::string_view json);

    // Throws when the file is missing unless `optional` is set, in which case nullopt is returned.
    std::optional<result_set> load_result_set(const std::filesystem::path& path, bool optional = false);
    void save_result_set(const result_set& result, const std::filesystem::path& path);

}  // namespace tempo
