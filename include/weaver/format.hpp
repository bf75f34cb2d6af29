#pragma once

#include "error.hpp"
#include "position.hpp"

#include <algorithm>
#include <cstddef>
#include <format>
#include <string>
#include <string_view>

namespace weaver {

    namespace detail {
        // Format literal carried as a template argument so `std::format` still checks it at compile time
        template <size_t N>
        struct format_pattern {
            char text[N]{};

            consteval format_pattern(const char (&s)[N]) { std::copy_n(s, N, text); }

            constexpr std::string_view view() const { return {text, N - 1U}; }
        };

        template <format_pattern Pattern>
        struct pattern_formatter {
            template <typename... Args>
            std::string operator()(Args&&... args) const {
                return std::format(Pattern.view(), std::forward<Args>(args)...);
            }
        };
    }  // namespace detail

    namespace literals {
        // "{} at {}"_format(file, pos)
        template <detail::format_pattern Pattern>
        consteval auto operator""_format() {
            return detail::pattern_formatter<Pattern>{};
        }
    }  // namespace literals

}  // namespace weaver

namespace std {
    // `line:column`
    template <>
    struct formatter<weaver::position, char> : formatter<std::string_view> {
        template <typename FormatContext>
        auto format(const weaver::position& pos, FormatContext& ctx) const {
            return formatter<std::string_view>::format(pos.to_string(), ctx);
        }
    };

    template <>
    struct formatter<weaver::error_kind, char> : formatter<std::string_view> {
        template <typename FormatContext>
        auto format(weaver::error_kind kind, FormatContext& ctx) const {
            return formatter<std::string_view>::format(weaver::to_string(kind), ctx);
        }
    };
}  // namespace std
