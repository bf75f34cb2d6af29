#include "weaver/snapshot.hpp"

#include "weaver/error.hpp"
#include "weaver/format.hpp"
#include "weaver/utils.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;
using namespace weaver::literals;

namespace weaver {

    namespace detail {

        // `root/source_dir` without `.` segments or a trailing separator, so suffixed siblings land beside it
        static fs::path normalized_source(const fs::path& root, std::string_view source_dir) {
            auto path = (root / source_dir).lexically_normal();
            if (!path.has_filename()) {
                path = path.parent_path();
            }
            return path;
        }

        static fs::path sibling_with_suffix(const fs::path& dir, std::string_view suffix) {
            auto sibling = dir;
            sibling += suffix;
            return sibling;
        }

        static void remove_tree(const fs::path& path) {
            std::error_code ec{};
            fs::remove_all(path, ec);
            if (ec) {
                throw error{
                        error_kind::filesystem_error, "failed to remove {}: {}"_format(path.string(), ec.message())};
            }
        }

        static void move_tree(const fs::path& from, const fs::path& to) {
            std::error_code ec{};
            fs::rename(from, to, ec);
            if (ec) {
                throw error{
                        error_kind::filesystem_error,
                        "failed to move {} to {}: {}"_format(from.string(), to.string(), ec.message())};
            }
        }

    }  // namespace detail

    source_snapshot::source_snapshot(const fs::path& root, std::string_view source_dir)
            : source_path_{detail::normalized_source(root, source_dir)},
              saved_path_{detail::sibling_with_suffix(source_path_, saved_dir_suffix)},
              modified_path_{detail::sibling_with_suffix(source_path_, modified_dir_suffix)} {
        std::error_code ec{};
        if (!fs::is_directory(source_path_, ec) || ec) {
            throw error{error_kind::filesystem_error, "source directory not found: {}"_format(source_path_.string())};
        }

        detail::remove_tree(saved_path_);

        fs::copy(source_path_, saved_path_, fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
        if (ec) {
            std::error_code cleanup_ec{};
            fs::remove_all(saved_path_, cleanup_ec);
            throw error{
                    error_kind::filesystem_error,
                    "failed to snapshot {} to {}: {}"_format(source_path_.string(), saved_path_.string(), ec.message())};
        }
        debug_log("snapshot ", source_path_.string(), " -> ", saved_path_.string());
    }

    source_snapshot::~source_snapshot() {
        if (released_) {
            return;
        }
        try {
            release();
        } catch (const std::exception& e) {
            std::cerr << "failed to restore " << source_path_.string() << " (original copy kept at "
                      << saved_path_.string() << "): " << e.what() << '\n';
        }
    }

    void source_snapshot::release() {
        if (released_) {
            return;
        }
        released_ = true;

        detail::remove_tree(modified_path_);
        detail::move_tree(source_path_, modified_path_);
        detail::move_tree(saved_path_, source_path_);
        debug_log("restored ", source_path_.string(), ", woven output in ", modified_path_.string());
    }

}  // namespace weaver
