#pragma once

#include <compare>
#include <cstddef>
#include <format>
#include <string>
#include <string_view>

namespace weaver {

    // 1-indexed line/column; columns count bytes
    struct position {
        size_t line{1};
        size_t column{1};

        constexpr auto operator<=>(const position&) const = default;

        std::string to_string() const { return std::format("{}:{}", line, column); }
    };

    /** Byte offset of the character at `pos` within `text`.

        Throws error_kind::position_not_found when no byte of `text` sits at `pos`,
        which includes a position one past the final byte.
     */
    size_t resolve_offset(std::string_view text, position pos);

    /** Position of the byte at `offset`; offsets past the end map to the position
        following the last byte.
     */
    position position_at(std::string_view text, size_t offset);

}  // namespace weaver
