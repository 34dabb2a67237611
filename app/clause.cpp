#include "clause/cli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        clause::engine_config cfg{};
        if (auto cli_result = clause::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }

        return clause::cli::run(cfg, std::cin, std::cout, std::cerr);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
