#include "weaver/analysis.hpp"

#include "weaver/error.hpp"
#include "weaver/format.hpp"
#include "weaver/utils.hpp"
#include "weaver/weave.hpp"

extern "C" {
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <algorithm>
#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;
using namespace weaver::literals;

namespace weaver {

    namespace detail {

        static void ensure_dir(const fs::path& path) {
            std::error_code ec{};
            fs::create_directories(path, ec);
            if (ec) {
                throw error{error_kind::filesystem_error, "failed to create directory: {}"_format(path.string())};
            }
        }

        static int open_write_file(const fs::path& path) {
            auto fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
            if (fd < 0) {
                throw error{error_kind::filesystem_error, "failed to open file for write: {}"_format(path.string())};
            }
            return fd;
        }

        static std::string tail_text(std::string_view text, size_t max_bytes) {
            if (text.size() <= max_bytes) {
                return std::string{utils::trim_view(text)};
            }
            return "...{}"_format(utils::trim_view(text.substr(text.size() - max_bytes)));
        }

        static void remove_stale_artifacts(const fs::path& build_dir, std::string_view suffix) {
            for (const auto& stale : find_artifacts(build_dir, suffix)) {
                std::error_code ec{};
                fs::remove(stale, ec);
                if (ec) {
                    debug_log("unable to remove stale artifact ", stale.string(), ": ", ec.message());
                }
            }
        }

    }  // namespace detail

    int run_process(
            const std::vector<std::string>& args,
            const fs::path& working_dir,
            const fs::path& stdout_path,
            const fs::path& stderr_path) {
        if (args.empty()) {
            throw error{error_kind::external_analysis_error, "empty command line"};
        }

        auto stdout_fd = detail::open_write_file(stdout_path);
        int stderr_fd = -1;
        try {
            stderr_fd = detail::open_write_file(stderr_path);
        } catch (const error&) {
            ::close(stdout_fd);
            throw;
        }

        auto pid = ::fork();
        if (pid < 0) {
            ::close(stdout_fd);
            ::close(stderr_fd);
            throw error{error_kind::external_analysis_error, "fork failed"};
        }

        if (pid == 0) {
            if (::dup2(stdout_fd, STDOUT_FILENO) < 0) {
                _exit(127);
            }
            if (::dup2(stderr_fd, STDERR_FILENO) < 0) {
                _exit(127);
            }

            ::close(stdout_fd);
            ::close(stderr_fd);

            if (!working_dir.empty() && ::chdir(working_dir.c_str()) != 0) {
                _exit(127);
            }

            std::vector<char*> argv{};
            argv.reserve(args.size() + 1U);
            for (const auto& arg : args) {
                argv.push_back(const_cast<char*>(arg.c_str()));
            }
            argv.push_back(nullptr);

            ::execvp(argv[0], argv.data());
            _exit(127);
        }

        ::close(stdout_fd);
        ::close(stderr_fd);

        int status = 0;
        if (::waitpid(pid, &status, 0) < 0) {
            throw error{error_kind::external_analysis_error, "waitpid failed"};
        }

        if (WIFEXITED(status)) {
            return WEXITSTATUS(status);
        }
        if (WIFSIGNALED(status)) {
            return 128 + WTERMSIG(status);
        }
        return 1;
    }

    std::vector<std::string> expand_command(const std::vector<std::string>& argv, std::string_view condition) {
        std::vector<std::string> expanded{};
        expanded.reserve(argv.size());
        for (const auto& arg : argv) {
            std::string out{};
            size_t cursor = 0U;
            for (auto pos = arg.find(condition_token); pos != std::string::npos;
                 pos = arg.find(condition_token, cursor)) {
                out.append(arg, cursor, pos - cursor);
                out.append(condition);
                cursor = pos + condition_token.size();
            }
            out.append(arg, cursor);
            expanded.push_back(std::move(out));
        }
        return expanded;
    }

    std::vector<fs::path> find_artifacts(const fs::path& dir, std::string_view suffix) {
        std::vector<fs::path> found{};
        std::error_code ec{};
        if (!fs::is_directory(dir, ec) || ec) {
            return found;
        }

        fs::recursive_directory_iterator it{dir, ec};
        if (ec) {
            throw error{error_kind::filesystem_error, "failed to enumerate {}: {}"_format(dir.string(), ec.message())};
        }
        for (; it != fs::recursive_directory_iterator{}; it.increment(ec)) {
            if (ec) {
                throw error{
                        error_kind::filesystem_error, "failed to enumerate {}: {}"_format(dir.string(), ec.message())};
            }
            if (!it->is_regular_file(ec) || ec) {
                continue;
            }
            if (it->path().filename().string().ends_with(suffix)) {
                found.push_back(it->path());
            }
        }
        if (ec) {
            throw error{error_kind::filesystem_error, "failed to enumerate {}: {}"_format(dir.string(), ec.message())};
        }

        std::ranges::sort(found);
        return found;
    }

    analysis_command make_analysis_command(const weave_config& cfg, const fs::path& root) {
        analysis_command command{};
        command.argv = cfg.analysis_command;
        command.working_dir = root;
        command.build_dir = root / cfg.build_dir;
        command.artifact_suffix = cfg.artifact_suffix;
        command.log_dir = root / cfg.cache_dir / "logs";
        return command;
    }

    command_analysis_runner::command_analysis_runner(analysis_command command) : command_{std::move(command)} {}

    std::vector<fs::path> command_analysis_runner::run_analysis(std::string_view condition) {
        ++invocations_;

        detail::remove_stale_artifacts(command_.build_dir, command_.artifact_suffix);
        detail::ensure_dir(command_.log_dir);

        auto stdout_path = command_.log_dir / "analysis-{}.stdout"_format(invocations_);
        auto stderr_path = command_.log_dir / "analysis-{}.stderr"_format(invocations_);
        auto args = expand_command(command_.argv, condition);

        debug_log("running analysis: ", utils::join_with_separator(args, " "sv));
        auto exit_code = run_process(args, command_.working_dir, stdout_path, stderr_path);

        if (exit_code != 0) {
            std::string stderr_text{};
            try {
                stderr_text = read_text_file(stderr_path);
            } catch (const error& e) {
                stderr_text = e.what();
            }
            throw error{
                    error_kind::external_analysis_error,
                    "`{}` exited with code {} (see {}): {}"_format(
                            args.front(), exit_code, stderr_path.string(), detail::tail_text(stderr_text, 512U))};
        }

        auto artifacts = find_artifacts(command_.build_dir, command_.artifact_suffix);
        if (artifacts.empty()) {
            throw error{
                    error_kind::external_analysis_error,
                    "no *{} artifacts found under {} for condition `{}`"_format(
                            command_.artifact_suffix, command_.build_dir.string(), condition)};
        }
        return artifacts;
    }

}  // namespace weaver
