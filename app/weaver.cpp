#include "cli.hpp"

#include <exception>
#include <iostream>

using namespace weaver::literals;

int main(int argc, char** argv) {
    try {
        weaver::startup_config cfg{};
        if (auto cli_result = weaver::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }

        return weaver::cli::run(cfg);
    } catch (const weaver::error& e) {
        std::cerr << "fatal: {}: {}\n"_format(e.kind(), e.what());
        return 1;
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
