#include "weaver/run.hpp"

#include "weaver/error.hpp"
#include "weaver/format.hpp"
#include "weaver/report.hpp"
#include "weaver/weave.hpp"

#include <glaze/glaze.hpp>

#include <sstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;
using namespace weaver::literals;

namespace glz {

    template <>
    struct meta<weaver::run_summary> {
        using T = weaver::run_summary;
        static constexpr auto value =
                object("name",
                       &T::name,
                       "pointcuts",
                       &T::pointcuts,
                       "artifacts",
                       &T::artifacts,
                       "files_woven",
                       &T::files_woven,
                       "matches_applied",
                       &T::matches_applied);
    };

}  // namespace glz

namespace weaver {

    namespace detail {

        static void log_line(const run_options& opts, std::string_view line) {
            if (opts.verbose && opts.log != nullptr) {
                *opts.log << line << '\n';
            }
        }

        static fs::path resolve_source(const fs::path& root, std::string_view file) {
            fs::path path{file};
            if (path.is_absolute()) {
                return path;
            }
            return root / path;
        }

    }  // namespace detail

    void weave_artifact(
            const fs::path& artifact,
            const pointcut& pc,
            const fs::path& root,
            char placeholder,
            run_summary& summary,
            const run_options& opts) {
        auto report = parse_report(read_text_file(artifact));

        for (const auto& [file, matches] : report) {
            auto path = detail::resolve_source(root, file);
            weave_file(path, matches, pc.advice, placeholder);
            detail::log_line(opts, "  wove {} match(es) into {}"_format(matches.size(), file));
            ++summary.files_woven;
            summary.matches_applied += matches.size();
        }
        ++summary.artifacts;

        std::error_code ec{};
        fs::remove(artifact, ec);
        if (ec) {
            detail::log_line(opts, "  unable to remove artifact {}: {}"_format(artifact.string(), ec.message()));
        }
    }

    run_summary run_pointcuts(
            const weave_config& cfg, const fs::path& root, analysis_runner& runner, const run_options& opts) {
        run_summary summary{};
        summary.name = cfg.name;

        for (size_t i = 0U; i < cfg.pointcuts.size(); ++i) {
            const auto& pc = cfg.pointcuts[i];
            detail::log_line(opts, "pointcut #{}: {}"_format(i + 1U, pc.condition));

            auto artifacts = runner.run_analysis(pc.condition);
            for (const auto& artifact : artifacts) {
                weave_artifact(artifact, pc, root, cfg.placeholder_char(), summary, opts);
            }
            ++summary.pointcuts;
        }

        return summary;
    }

    std::string render_summary(const run_summary& summary, output_mode mode) {
        if (mode == output_mode::json) {
            std::string json{};
            auto ec = glz::write_json(summary, json);
            if (ec) {
                throw std::runtime_error("failed to serialize run summary");
            }
            return json + '\n';
        }

        std::ostringstream os{};
        os << "system:          " << summary.name << '\n';
        os << "pointcuts:       " << summary.pointcuts << '\n';
        os << "artifacts:       " << summary.artifacts << '\n';
        os << "files woven:     " << summary.files_woven << '\n';
        os << "matches applied: " << summary.matches_applied << '\n';
        return os.str();
    }

}  // namespace weaver
