#include "weaver/config.hpp"

#include "weaver/error.hpp"
#include "weaver/format.hpp"
#include "weaver/weave.hpp"

#include <glaze/glaze.hpp>

#include <sstream>
#include <system_error>

namespace fs = std::filesystem;
using namespace weaver::literals;

namespace glz {

    template <>
    struct meta<weaver::pointcut> {
        using T = weaver::pointcut;
        static constexpr auto value = object("condition", &T::condition, "advice", &T::advice);
    };

    template <>
    struct meta<weaver::weave_config> {
        using T = weaver::weave_config;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "name",
                       &T::name,
                       "pointcuts",
                       &T::pointcuts,
                       "analysis_command",
                       &T::analysis_command,
                       "project_marker",
                       &T::project_marker,
                       "build_dir",
                       &T::build_dir,
                       "artifact_suffix",
                       &T::artifact_suffix,
                       "cache_dir",
                       &T::cache_dir,
                       "source_dir",
                       &T::source_dir,
                       "placeholder",
                       &T::placeholder);
    };

}  // namespace glz

namespace weaver {

    namespace detail {

        static constexpr int supported_schema_version = 1;

        [[noreturn]] static void config_failure(std::string message) {
            throw error{error_kind::config_error, std::move(message)};
        }

        // Relative, below the project root, and not the root itself
        static bool is_nested_relative(std::string_view dir) {
            fs::path path{dir};
            if (path.has_root_path()) {
                return false;
            }
            auto normal = path.lexically_normal();
            if (!normal.has_filename()) {
                normal = normal.parent_path();
            }
            if (normal.empty() || normal == ".") {
                return false;
            }
            for (const auto& part : normal) {
                if (part == "..") {
                    return false;
                }
            }
            return true;
        }

    }  // namespace detail

    fs::path check_project_root(const fs::path& root, std::string_view marker) {
        std::error_code ec{};
        auto resolved = fs::absolute(root, ec);
        if (ec) {
            detail::config_failure("unable to resolve project root {}: {}"_format(root.string(), ec.message()));
        }
        if (!fs::is_directory(resolved, ec) || ec) {
            detail::config_failure("project root is not a directory: {}"_format(resolved.string()));
        }
        if (!fs::is_regular_file(resolved / marker, ec) || ec) {
            detail::config_failure(
                    "`{}` does not look like a project root (missing {})"_format(resolved.string(), marker));
        }
        return resolved;
    }

    void validate_config(const weave_config& cfg) {
        if (cfg.schema_version > detail::supported_schema_version) {
            detail::config_failure(
                    "unsupported schema_version: {} > {}"_format(cfg.schema_version, detail::supported_schema_version));
        }
        if (cfg.name.empty()) {
            detail::config_failure("`name` must be non-empty");
        }
        if (cfg.pointcuts.empty()) {
            detail::config_failure("`pointcuts` must list at least one pointcut");
        }
        for (size_t i = 0U; i < cfg.pointcuts.size(); ++i) {
            if (utils::trim_view(cfg.pointcuts[i].condition).empty()) {
                detail::config_failure("pointcut #{} has an empty condition"_format(i + 1U));
            }
        }
        if (cfg.analysis_command.empty() || cfg.analysis_command.front().empty()) {
            detail::config_failure("`analysis_command` must name an executable");
        }
        if (cfg.placeholder.size() != 1U) {
            detail::config_failure("`placeholder` must be exactly one character, got \"{}\""_format(cfg.placeholder));
        }
        if (cfg.source_dir.empty() || cfg.build_dir.empty() || cfg.artifact_suffix.empty()) {
            detail::config_failure("`source_dir`, `build_dir` and `artifact_suffix` must be non-empty");
        }
        if (!detail::is_nested_relative(cfg.source_dir)) {
            detail::config_failure(
                    "`source_dir` must be a relative directory inside the project root, got \"{}\""_format(
                            cfg.source_dir));
        }
        if (cfg.project_marker.empty()) {
            detail::config_failure("`project_marker` must be non-empty");
        }
    }

    weave_config parse_config(std::string_view json, std::string_view origin) {
        weave_config cfg{};
        std::string buffer{json};
        auto ec = glz::read_json(cfg, buffer);
        if (ec) {
            detail::config_failure("failed to parse {}: {}"_format(origin, glz::format_error(ec, buffer)));
        }
        validate_config(cfg);
        return cfg;
    }

    weave_config load_config(const fs::path& path) {
        std::error_code ec{};
        if (!fs::is_regular_file(path, ec) || ec) {
            detail::config_failure("config file not found: {}"_format(path.string()));
        }

        std::string json{};
        try {
            json = read_text_file(path);
        } catch (const error& e) {
            detail::config_failure(e.what());
        }
        return parse_config(json, path.string());
    }

    std::string render_config(const weave_config& cfg) {
        std::ostringstream os{};
        os << "name=" << cfg.name << '\n';
        os << "analysis_command=" << utils::join_with_separator(cfg.analysis_command, " "sv) << '\n';
        os << "project_marker=" << cfg.project_marker << '\n';
        os << "source_dir=" << cfg.source_dir << '\n';
        os << "build_dir=" << cfg.build_dir << '\n';
        os << "artifact_suffix=" << cfg.artifact_suffix << '\n';
        os << "cache_dir=" << cfg.cache_dir << '\n';
        os << "placeholder=" << cfg.placeholder << '\n';
        for (size_t i = 0U; i < cfg.pointcuts.size(); ++i) {
            os << "pointcut[" << i << "].condition=" << cfg.pointcuts[i].condition << '\n';
            os << "pointcut[" << i << "].advice=" << cfg.pointcuts[i].advice << '\n';
        }
        return os.str();
    }

}  // namespace weaver
