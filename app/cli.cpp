#include "cli.hpp"

#include <CLI/CLI.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace weaver::cli {

    namespace detail {

        namespace fs = std::filesystem;

        static constexpr auto version_string = "weaver 0.1.0"sv;

        static fs::path resolve_root(const startup_config& cfg) {
            if (cfg.root.empty()) {
                return fs::current_path();
            }
            return cfg.root;
        }

        static fs::path resolve_config_path(const fs::path& root, const fs::path& config_file) {
            if (config_file.is_absolute()) {
                return config_file;
            }
            return root / config_file;
        }

    }  // namespace detail

    int run(const startup_config& cfg) {
        auto root = detail::resolve_root(cfg);
        auto weave_cfg = load_config(detail::resolve_config_path(root, cfg.config_file));
        root = check_project_root(root, weave_cfg.project_marker);

        if (cfg.print_config) {
            std::cout << "root=" << root.string() << '\n';
            std::cout << render_config(weave_cfg);
            return 0;
        }

        if (!cfg.quiet) {
            std::cout << "=== " << weave_cfg.name << " ===\n";
        }

        source_snapshot snapshot{root, weave_cfg.source_dir};
        command_analysis_runner runner{make_analysis_command(weave_cfg, root)};

        run_options opts{};
        opts.log = &std::cerr;
        opts.verbose = cfg.verbose;

        auto summary = run_pointcuts(weave_cfg, root, runner, opts);
        snapshot.release();

        if (cfg.output == output_mode::json) {
            std::cout << render_summary(summary, cfg.output);
        }
        else if (!cfg.quiet) {
            std::cout << render_summary(summary, cfg.output);
            std::cout << "woven sources: " << snapshot.modified_path().string() << '\n';
        }
        return 0;
    }

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg) {
        CLI::App app{"weaver: splice advice into analysis-reported source locations"};

        bool show_version = false;
        std::string root_arg{cfg.root.string()};
        std::string config_arg{cfg.config_file.string()};
        std::string output_arg{std::string{to_string(cfg.output)}};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("-C,--root", root_arg, "Project root (default: current directory)");
        app.add_option("-c,--config", config_arg, "Config file, relative to the project root");
        app.add_option("--output", output_arg, "Summary format: table|json");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--quiet", cfg.quiet, "Suppress non-essential output");
        app.add_flag("--verbose", cfg.verbose, "Log each pointcut and woven file");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }

        if (!try_parse_output_mode(output_arg, cfg.output)) {
            std::cerr << "invalid --output value: " << output_arg << " (expected table|json)\n";
            return std::optional<int>{2};
        }

        if (utils::trim_view(config_arg).empty()) {
            std::cerr << "--config must be non-empty\n";
            return std::optional<int>{2};
        }

        cfg.root = root_arg;
        cfg.config_file = config_arg;

        if (show_version) {
            std::cout << detail::version_string << '\n';
            return std::optional<int>{0};
        }

        return std::nullopt;
    }

}  // namespace weaver::cli
