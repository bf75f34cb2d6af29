#include "utils.hpp"

#include <stdexcept>

namespace weaver::test {
    using namespace std::string_view_literals;

    namespace detail {
        static void make_source_tree(const fs::path& root) {
            write_file(root / "src" / "main.rs", "fn main() {}\n");
            write_file(root / "src" / "util" / "mod.rs", "pub fn help() {}\n");
        }
    }  // namespace detail

    TEST_CASE("008: release restores the original tree and keeps the woven copy", "[008][snapshot]") {
        detail::temp_dir tmp{"weaver_008_release"};
        detail::make_source_tree(tmp.path);

        source_snapshot snapshot{tmp.path, "src"sv};
        CHECK(snapshot.source_path() == tmp.path / "src");
        CHECK(snapshot.saved_path() == tmp.path / "src-saved");
        CHECK(snapshot.modified_path() == tmp.path / "src-modified");
        CHECK(detail::read_file(snapshot.saved_path() / "util" / "mod.rs") == "pub fn help() {}\n");

        detail::write_file(tmp.path / "src" / "main.rs", "fn main() { woven(); }\n");
        snapshot.release();

        CHECK(snapshot.released());
        CHECK(detail::read_file(tmp.path / "src" / "main.rs") == "fn main() {}\n");
        CHECK(detail::read_file(tmp.path / "src" / "util" / "mod.rs") == "pub fn help() {}\n");
        CHECK(detail::read_file(tmp.path / "src-modified" / "main.rs") == "fn main() { woven(); }\n");
        CHECK_FALSE(fs::exists(tmp.path / "src-saved"));
    }

    TEST_CASE("008: an aborted run still restores the original tree", "[008][snapshot]") {
        detail::temp_dir tmp{"weaver_008_abort"};
        detail::make_source_tree(tmp.path);

        try {
            source_snapshot snapshot{tmp.path, "src"sv};
            detail::write_file(tmp.path / "src" / "main.rs", "fn main() { half");
            throw std::runtime_error("abort midway");
        } catch (const std::runtime_error& e) {
            CHECK(std::string_view{e.what()} == "abort midway");
        }

        CHECK(detail::read_file(tmp.path / "src" / "main.rs") == "fn main() {}\n");
        CHECK(detail::read_file(tmp.path / "src-modified" / "main.rs") == "fn main() { half");
        CHECK_FALSE(fs::exists(tmp.path / "src-saved"));
    }

    TEST_CASE("008: leftovers from an earlier run are replaced", "[008][snapshot]") {
        detail::temp_dir tmp{"weaver_008_stale"};
        detail::make_source_tree(tmp.path);
        detail::write_file(tmp.path / "src-saved" / "stale.rs", "old\n");
        detail::write_file(tmp.path / "src-modified" / "stale.rs", "old\n");

        {
            source_snapshot snapshot{tmp.path, "src"sv};
            CHECK_FALSE(fs::exists(tmp.path / "src-saved" / "stale.rs"));
        }

        CHECK(fs::exists(tmp.path / "src-modified" / "main.rs"));
        CHECK_FALSE(fs::exists(tmp.path / "src-modified" / "stale.rs"));
    }

    TEST_CASE("008: a trailing separator in source_dir still snapshots beside the tree", "[008][snapshot]") {
        detail::temp_dir tmp{"weaver_008_trailing"};
        detail::make_source_tree(tmp.path);

        {
            source_snapshot snapshot{tmp.path, "src/"sv};
            CHECK(snapshot.source_path() == tmp.path / "src");
            CHECK(snapshot.saved_path() == tmp.path / "src-saved");
            CHECK(snapshot.modified_path() == tmp.path / "src-modified");
            CHECK_FALSE(fs::exists(tmp.path / "src" / "-saved"));

            detail::write_file(tmp.path / "src" / "main.rs", "fn main() { woven(); }\n");
        }

        CHECK(detail::read_file(tmp.path / "src" / "main.rs") == "fn main() {}\n");
        CHECK(detail::read_file(tmp.path / "src-modified" / "main.rs") == "fn main() { woven(); }\n");
        CHECK(detail::read_file(tmp.path / "src-modified" / "util" / "mod.rs") == "pub fn help() {}\n");
        CHECK_FALSE(fs::exists(tmp.path / "src-saved"));
    }

    TEST_CASE("008: missing source directory is a filesystem error", "[008][snapshot]") {
        detail::temp_dir tmp{"weaver_008_missing"};
        CHECK(detail::thrown_kind([&] { source_snapshot snapshot{tmp.path, "src"sv}; }) ==
              error_kind::filesystem_error);
    }
}  // namespace weaver::test
