#include "cli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        tempo::startup_config cfg{};
        if (auto cli_result = tempo::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }

        return tempo::cli::run_command(cfg);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
