#pragma once

#include "weaver.hpp"

#include <catch2/catch_test_macros.hpp>

extern "C" {
#include <unistd.h>
}

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace weaver::test {
    namespace fs = std::filesystem;
}  // namespace weaver::test

namespace weaver::test::detail {

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }
    };

    inline void write_file(const fs::path& path, std::string_view text) {
        auto parent = path.parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }
        std::ofstream out{path, std::ios::binary};
        REQUIRE(out.good());
        out << text;
        REQUIRE(out.good());
    }

    inline std::string read_file(const fs::path& path) {
        std::ifstream in{path, std::ios::binary};
        REQUIRE(in.good());
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    inline void make_executable_file(const fs::path& path, std::string_view content) {
        write_file(path, content);
        fs::permissions(
                path,
                fs::perms::owner_read | fs::perms::owner_write | fs::perms::owner_exec | fs::perms::group_read |
                        fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec,
                fs::perm_options::replace);
    }

    inline match_record make_record(
            std::string file,
            position start,
            position end,
            std::string matched_text = {},
            std::map<std::string, std::string> args = {}) {
        match_record record{};
        record.source_file = std::move(file);
        record.start = start;
        record.end = end;
        record.matched_text = std::move(matched_text);
        record.captured_args = std::move(args);
        return record;
    }

    // One artifact record block in the layout the analysis pass prints
    inline std::string make_block(
            std::string_view file,
            position start,
            position end,
            std::string_view src,
            const std::vector<std::pair<std::string, std::string>>& args = {}) {
        std::ostringstream block{};
        block << "Found {\n";
        block << "    span: " << file << ':' << start.line << ':' << start.column << ": " << end.line << ':'
              << end.column << " (#0),\n";
        block << "    src: \"" << src << "\",\n";
        block << "    args: {\n";
        for (const auto& [key, value] : args) {
            block << "        \"" << key << "\": \"" << value << "\",\n";
        }
        block << "    },\n";
        block << "}\n";
        return block.str();
    }

    template <typename F>
    error_kind thrown_kind(F&& fn) {
        try {
            fn();
        } catch (const error& e) {
            return e.kind();
        }
        FAIL("expected weaver::error");
        return error_kind::filesystem_error;
    }
}  // namespace weaver::test::detail
