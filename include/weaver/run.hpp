#pragma once

#include "analysis.hpp"
#include "config.hpp"

#include <cstddef>
#include <filesystem>
#include <ostream>
#include <string>

namespace weaver {

    struct run_summary {
        std::string name{};
        size_t pointcuts{0U};
        size_t artifacts{0U};
        size_t files_woven{0U};
        size_t matches_applied{0U};
    };

    struct run_options {
        std::ostream* log{nullptr};
        bool verbose{false};
    };

    // Weaves every record of one artifact into the files under `root`, then deletes the artifact
    void weave_artifact(
            const std::filesystem::path& artifact,
            const pointcut& pc,
            const std::filesystem::path& root,
            char placeholder,
            run_summary& summary,
            const run_options& opts = {});

    /** Runs every pointcut of `cfg` in order against the tree under `root`.

        Each pointcut's analysis sees the output of the previous pointcuts. The
        first failure propagates; nothing already written is rolled back here.
     */
    run_summary run_pointcuts(
            const weave_config& cfg,
            const std::filesystem::path& root,
            analysis_runner& runner,
            const run_options& opts = {});

    std::string render_summary(const run_summary& summary, output_mode mode);

}  // namespace weaver
