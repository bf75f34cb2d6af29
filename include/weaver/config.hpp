#pragma once

#include "utils.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace weaver {

    using namespace std::string_view_literals;

    /*
     * Weaver Config (Aspect.json, project root)
     *
     * System
     * - schema_version: Config layout version; newer than supported is rejected.
     * - name: System name, printed in the run banner.
     * - pointcuts: Ordered list of {condition, advice}. Applied strictly in order.
     *
     * Analysis collaborator
     * - analysis_command: argv template; "{condition}" inside any argument is
     *   replaced with the pointcut condition before launch.
     * - project_marker: File whose presence identifies the project root.
     * - build_dir: Directory (relative to root) searched recursively for artifacts.
     * - artifact_suffix: File name suffix identifying an analysis artifact.
     * - cache_dir: Directory (relative to root) for analysis stdout/stderr logs.
     *
     * Weaving
     * - source_dir: Directory (relative to root) snapshotted before and restored after a run.
     * - placeholder: Single character replaced by the matched source text in advice.
     */

    inline constexpr auto condition_token = "{condition}"sv;

    struct pointcut {
        std::string condition{};
        std::string advice{};
    };

    struct weave_config {
        int schema_version{1};
        std::string name{};
        std::vector<pointcut> pointcuts{};

        std::vector<std::string> analysis_command{
                "cargo", "+AOP", "rustc", "--", "-Z", "aop-inspect=\"{condition}\""};
        std::string project_marker{"Cargo.toml"};
        std::string build_dir{"target"};
        std::string artifact_suffix{"RUST_ASPECT_OUTPUT.txt"};
        std::string cache_dir{".weaver"};

        std::string source_dir{"src"};
        std::string placeholder{"$"};

        char placeholder_char() const { return placeholder.empty() ? '$' : placeholder.front(); }
    };

    enum class output_mode { table, json };

    inline constexpr std::string_view to_string(output_mode mode) {
        switch (mode) {
            case output_mode::table:
                return "table"sv;
            case output_mode::json:
                return "json"sv;
        }
        return "table"sv;
    }

    inline constexpr bool try_parse_output_mode(std::string_view text, output_mode& out) {
        if (utils::str_case_eq(text, "table"sv)) {
            out = output_mode::table;
            return true;
        }
        if (utils::str_case_eq(text, "json"sv)) {
            out = output_mode::json;
            return true;
        }
        return false;
    }

    struct startup_config {
        std::filesystem::path root{};
        std::filesystem::path config_file{"Aspect.json"};
        output_mode output{output_mode::table};
        bool quiet{false};
        bool verbose{false};
        bool print_config{false};
    };

    // Throws error_kind::config_error unless `root` is a directory holding `marker`
    std::filesystem::path check_project_root(const std::filesystem::path& root, std::string_view marker);

    weave_config parse_config(std::string_view json, std::string_view origin);
    weave_config load_config(const std::filesystem::path& path);
    void validate_config(const weave_config& cfg);

    std::string render_config(const weave_config& cfg);

}  // namespace weaver
