#pragma once

#include "weaver.hpp"

#include <optional>

namespace weaver::cli {

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg);
    int run(const startup_config& cfg);

}  // namespace weaver::cli
