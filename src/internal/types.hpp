#pragma once

#include "tempo/result.hpp"

#include <glaze/glaze.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tempo::internal {

    struct tool_record {
        std::string kind{};
        std::optional<std::string> name{};
        std::optional<std::string> command{};
    };

    struct toolchain_record {
        std::optional<std::vector<std::string>> include{};
        std::optional<std::vector<tool_record>> builders{};
        std::optional<std::vector<tool_record>> executors{};
    };

    struct reporter_record {
        std::string kind{};
        std::optional<std::string> file{};
        std::optional<bool> console{};
        std::optional<bool> std_dev{};
        std::optional<bool> show_single{};
        std::optional<bool> flex_unit{};
        std::optional<std::vector<double>> percentiles{};
        std::optional<std::string> outliers{};
        std::optional<std::string> ratio_style{};
    };

    struct persisted_config {
        int schema_version{1};
        std::optional<std::string> temp_dir{};
        std::optional<bool> clean_temp_dir{};
        std::optional<std::string> log_level{};
        std::optional<std::string> diff{};
        std::optional<std::vector<reporter_record>> reporters{};
        std::optional<std::vector<toolchain_record>> toolchains{};
    };

    // Written by the noop builder as <root>/index.json.
    struct build_manifest {
        int schema_version{1};
        std::vector<std::string> files{};
    };

    // Lines written by a suite process on stdout, one JSON object each.
    struct wire_error {
        std::string message{};
        std::optional<std::string> params{};
    };

    struct wire_message {
        std::optional<std::string> level{};
        std::optional<std::string> log{};
        std::optional<std::vector<toolchain_result>> records{};
        std::optional<wire_error> error{};
    };

}  // namespace tempo::internal

template <>
struct glz::meta<tempo::note_type> {
    using enum tempo::note_type;
    static constexpr auto value = enumerate("info", info, "warn", warn);
};
