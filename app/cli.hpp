#pragma once

#include "tempo/config.hpp"

#include <optional>

namespace tempo::cli {

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg);
    int run_command(const startup_config& cfg);

}  // namespace tempo::cli
