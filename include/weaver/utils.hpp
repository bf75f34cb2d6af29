#pragma once

#include <cstddef>
#include <iostream>
#include <ranges>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace weaver {

    /** Debug trace to stderr, prefixed with `[weaver file:line]`.

        Compiled out under NDEBUG, so arguments must not carry side effects.
     */
#ifndef NDEBUG
    template <typename... Args>
    struct debug_log {
        explicit debug_log(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            std::string_view file{loc.file_name()};
            if (auto slash = file.rfind('/'); slash != std::string_view::npos) {
                file.remove_prefix(slash + 1U);
            }
            std::cerr << "[weaver " << file << ':' << loc.line() << "] ";
            (std::cerr << ... << std::forward<Args>(args)) << '\n';
        }
    };
#else
    template <typename... Args>
    struct debug_log {
        explicit debug_log(Args&&...) {}
    };
#endif

    template <typename... Args>
    debug_log(Args&&...) -> debug_log<Args...>;

    namespace utils {

        // ASCII-only; used for option values such as `--output JSON`
        constexpr bool str_case_eq(std::string_view lhs, std::string_view rhs) {
            if (lhs.size() != rhs.size()) {
                return false;
            }
            auto lower = [](char c) { return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c; };
            for (size_t i = 0U; i < lhs.size(); ++i) {
                if (lower(lhs[i]) != lower(rhs[i])) {
                    return false;
                }
            }
            return true;
        }

        // Strips any leading/trailing characters contained in `chars`
        constexpr std::string_view trim_chars(std::string_view value, std::string_view chars) {
            auto first = value.find_first_not_of(chars);
            if (first == std::string_view::npos) {
                return {};
            }
            auto last = value.find_last_not_of(chars);
            return value.substr(first, (last - first) + 1U);
        }

        constexpr std::string_view trim_view(std::string_view value) { return trim_chars(value, " \t\r\n"); }

        // Report values escape quotes with backslashes; the escapes are dropped, not decoded
        inline std::string erase_char(std::string_view value, char c) {
            std::string out{};
            out.reserve(value.size());
            for (auto ch : value) {
                if (ch != c) {
                    out.push_back(ch);
                }
            }
            return out;
        }

        inline std::string join_with_separator(const std::vector<std::string>& values, std::string_view separator) {
            return values | std::views::join_with(separator) | std::ranges::to<std::string>();
        }

    }  // namespace utils

}  // namespace weaver
