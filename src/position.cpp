#include "weaver/position.hpp"

#include "weaver/error.hpp"
#include "weaver/format.hpp"

using namespace weaver::literals;

namespace weaver {

    size_t resolve_offset(std::string_view text, position pos) {
        position cursor{};
        for (size_t i = 0U; i < text.size(); ++i) {
            if (cursor == pos) {
                return i;
            }
            if (text[i] == '\n') {
                ++cursor.line;
                cursor.column = 1U;
            }
            else {
                ++cursor.column;
            }
        }
        throw error{
                error_kind::position_not_found,
                "line {} column {} is not found ({} bytes scanned)"_format(pos.line, pos.column, text.size())};
    }

    position position_at(std::string_view text, size_t offset) {
        position cursor{};
        auto limit = offset < text.size() ? offset : text.size();
        for (size_t i = 0U; i < limit; ++i) {
            if (text[i] == '\n') {
                ++cursor.line;
                cursor.column = 1U;
            }
            else {
                ++cursor.column;
            }
        }
        return cursor;
    }

}  // namespace weaver
