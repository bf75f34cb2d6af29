#pragma once

#include "config.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace weaver {

    // Produces match-report artifacts for one pointcut condition
    class analysis_runner {
      public:
        virtual ~analysis_runner() = default;

        virtual std::vector<std::filesystem::path> run_analysis(std::string_view condition) = 0;
    };

    struct analysis_command {
        std::vector<std::string> argv{};
        std::filesystem::path working_dir{};
        std::filesystem::path build_dir{};
        std::string artifact_suffix{};
        std::filesystem::path log_dir{};
    };

    analysis_command make_analysis_command(const weave_config& cfg, const std::filesystem::path& root);

    // Launches the configured tool once per condition and collects the artifacts it leaves behind
    class command_analysis_runner final : public analysis_runner {
      public:
        explicit command_analysis_runner(analysis_command command);

        std::vector<std::filesystem::path> run_analysis(std::string_view condition) override;

      private:
        analysis_command command_;
        size_t invocations_{0U};
    };

    std::vector<std::string> expand_command(const std::vector<std::string>& argv, std::string_view condition);

    // Files under `dir` (recursive) whose name ends with `suffix`, sorted by path
    std::vector<std::filesystem::path> find_artifacts(const std::filesystem::path& dir, std::string_view suffix);

    /** Runs `args` with stdout/stderr redirected to the given files and returns the
        exit code (128 + signal for a signalled child, 127 if exec fails).
     */
    int run_process(
            const std::vector<std::string>& args,
            const std::filesystem::path& working_dir,
            const std::filesystem::path& stdout_path,
            const std::filesystem::path& stderr_path);

}  // namespace weaver
