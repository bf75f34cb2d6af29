#include "utils.hpp"

#include "cli.hpp"

#include <vector>

namespace weaver::test {

    namespace detail {
        std::vector<char*> to_argv(std::vector<std::string>& args) {
            std::vector<char*> argv{};
            argv.reserve(args.size());
            for (auto& arg : args) {
                argv.push_back(arg.data());
            }
            return argv;
        }
    }  // namespace detail

    TEST_CASE("002: parse_cli accepts startup options", "[002][cli]") {
        startup_config cfg{};
        std::vector<std::string> args{
                "weaver", "--root", "/tmp/project", "--config", "aspects/log.json", "--output", "json", "--verbose"};
        auto argv = detail::to_argv(args);

        auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
        CHECK(!result);
        CHECK(cfg.root == "/tmp/project");
        CHECK(cfg.config_file == "aspects/log.json");
        CHECK(cfg.output == output_mode::json);
        CHECK(cfg.verbose);
        CHECK_FALSE(cfg.quiet);
        CHECK_FALSE(cfg.print_config);
    }

    TEST_CASE("002: parse_cli defaults", "[002][cli]") {
        startup_config cfg{};
        std::vector<std::string> args{"weaver"};
        auto argv = detail::to_argv(args);

        auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
        CHECK(!result);
        CHECK(cfg.root.empty());
        CHECK(cfg.config_file == "Aspect.json");
        CHECK(cfg.output == output_mode::table);
    }

    TEST_CASE("002: parse_cli rejects invalid startup combos", "[002][cli]") {
        SECTION("invalid output mode is rejected") {
            startup_config cfg{};
            std::vector<std::string> args{"weaver", "--output", "yaml"};
            auto argv = detail::to_argv(args);

            auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
            REQUIRE(result);
            CHECK(*result == 2);
        }

        SECTION("quiet and verbose cannot be combined") {
            startup_config cfg{};
            std::vector<std::string> args{"weaver", "--quiet", "--verbose"};
            auto argv = detail::to_argv(args);

            auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
            REQUIRE(result);
            CHECK(*result == 2);
        }
    }

    TEST_CASE("002: parse_cli handles one-shot exits", "[002][cli]") {
        startup_config cfg{};
        std::vector<std::string> args{"weaver", "--version"};
        auto argv = detail::to_argv(args);

        auto result = cli::parse_cli(static_cast<int>(argv.size()), argv.data(), cfg);
        REQUIRE(result);
        CHECK(*result == 0);
    }

    TEST_CASE("002: print-config loads the project config without weaving", "[002][cli]") {
        detail::temp_dir tmp{"weaver_002_print"};
        detail::write_file(tmp.path / "Cargo.toml", "[package]\n");
        detail::write_file(tmp.path / "Aspect.json", R"({"name":"noop","pointcuts":[{"condition":"c","advice":"a"}]})");
        detail::write_file(tmp.path / "src" / "main.rs", "fn main() {}\n");

        startup_config cfg{};
        cfg.root = tmp.path;
        cfg.print_config = true;

        CHECK(cli::run(cfg) == 0);
        CHECK_FALSE(std::filesystem::exists(tmp.path / "src-saved"));
        CHECK_FALSE(std::filesystem::exists(tmp.path / "src-modified"));
    }

    TEST_CASE("002: run outside a project root is a config error", "[002][cli]") {
        detail::temp_dir tmp{"weaver_002_noroot"};
        detail::write_file(tmp.path / "Aspect.json", R"({"name":"noop","pointcuts":[{"condition":"c","advice":"a"}]})");

        startup_config cfg{};
        cfg.root = tmp.path;

        CHECK(detail::thrown_kind([&] { (void)cli::run(cfg); }) == error_kind::config_error);
    }
}  // namespace weaver::test
