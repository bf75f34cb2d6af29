#include "weaver/weave.hpp"

#include "weaver/error.hpp"
#include "weaver/format.hpp"
#include "weaver/position.hpp"

#include <fstream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
using namespace weaver::literals;

namespace weaver {

    std::string read_text_file(const fs::path& path) {
        std::ifstream in{path, std::ios::binary};
        if (!in) {
            throw error{error_kind::filesystem_error, "failed to open file for read: {}"_format(path.string())};
        }
        std::ostringstream ss{};
        ss << in.rdbuf();
        if (!in.good() && !in.eof()) {
            throw error{error_kind::filesystem_error, "failed to read file: {}"_format(path.string())};
        }
        return ss.str();
    }

    void write_text_file(const fs::path& path, std::string_view text) {
        std::ofstream out{path, std::ios::binary | std::ios::trunc};
        if (!out) {
            throw error{error_kind::filesystem_error, "failed to open file for write: {}"_format(path.string())};
        }
        out << text;
        out.flush();
        if (!out) {
            throw error{error_kind::filesystem_error, "failed to write file: {}"_format(path.string())};
        }
    }

    std::string weave_text(
            std::string_view original, const file_match_set& matches, std::string_view advice, char placeholder) {
        std::string buffer{original};

        for (const auto& match : matches) {
            auto from = resolve_offset(buffer, match.start);
            auto to = resolve_offset(buffer, match.end);
            buffer.replace(from, to - from, expand_advice(advice, match, placeholder));
        }

        return buffer;
    }

    void weave_file(const fs::path& path, const file_match_set& matches, std::string_view advice, char placeholder) {
        if (matches.empty()) {
            return;
        }
        auto original = read_text_file(path);

        std::string woven{};
        try {
            woven = weave_text(original, matches, advice, placeholder);
        } catch (const error& e) {
            throw error{e.kind(), "{}: {}"_format(path.string(), e.what())};
        }
        write_text_file(path, woven);
    }

}  // namespace weaver
