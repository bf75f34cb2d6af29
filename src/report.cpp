#include "weaver/report.hpp"

#include "weaver/error.hpp"
#include "weaver/format.hpp"
#include "weaver/utils.hpp"

#include <algorithm>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

using namespace weaver::literals;

namespace weaver {

    namespace detail {

        // Characters stripped around `src:` and argument values
        static constexpr auto value_trim = " \","sv;
        static constexpr auto key_trim = " \""sv;

        struct header_fields {
            std::string file{};
            position start{};
            position end{};
        };

        static std::vector<std::string_view> split_lines(std::string_view text) {
            std::vector<std::string_view> lines{};
            size_t cursor = 0U;
            while (cursor < text.size()) {
                auto line_end = text.find('\n', cursor);
                auto line = text.substr(cursor, line_end == std::string_view::npos ? line_end : line_end - cursor);
                if (line.ends_with('\r')) {
                    line.remove_suffix(1U);
                }
                lines.push_back(line);
                if (line_end == std::string_view::npos) {
                    break;
                }
                cursor = line_end + 1U;
            }
            return lines;
        }

        static std::vector<std::string_view> split_tokens(std::string_view line) {
            std::vector<std::string_view> tokens{};
            size_t cursor = 0U;
            while (cursor < line.size()) {
                auto begin = line.find_first_not_of(" \t", cursor);
                if (begin == std::string_view::npos) {
                    break;
                }
                auto end = line.find_first_of(" \t", begin);
                if (end == std::string_view::npos) {
                    end = line.size();
                }
                tokens.push_back(line.substr(begin, end - begin));
                cursor = end;
            }
            return tokens;
        }

        static bool all_digits(std::string_view text) {
            return !text.empty() && std::ranges::all_of(text, [](char c) { return c >= '0' && c <= '9'; });
        }

        static std::optional<size_t> parse_index(std::string_view text) {
            if (!all_digits(text)) {
                return std::nullopt;
            }
            size_t value{};
            auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || end != text.data() + text.size()) {
                return std::nullopt;
            }
            return value;
        }

        // `<file>:<line>:<col>:`
        static std::optional<std::pair<std::string_view, position>> parse_start_token(std::string_view token) {
            if (!token.ends_with(':')) {
                return std::nullopt;
            }
            token.remove_suffix(1U);

            auto col_sep = token.rfind(':');
            if (col_sep == std::string_view::npos) {
                return std::nullopt;
            }
            auto line_sep = token.rfind(':', col_sep == 0U ? 0U : col_sep - 1U);
            if (line_sep == std::string_view::npos || line_sep == 0U || line_sep >= col_sep) {
                return std::nullopt;
            }

            auto line = parse_index(token.substr(line_sep + 1U, col_sep - line_sep - 1U));
            auto column = parse_index(token.substr(col_sep + 1U));
            if (!line || !column) {
                return std::nullopt;
            }
            return std::pair{token.substr(0U, line_sep), position{*line, *column}};
        }

        // `<line>:<col>` followed by anything that is not a digit
        static std::optional<position> parse_end_token(std::string_view token) {
            auto digits_end = [](std::string_view text) {
                size_t n = 0U;
                while (n < text.size() && text[n] >= '0' && text[n] <= '9') {
                    ++n;
                }
                return n;
            };

            auto line_len = digits_end(token);
            if (line_len == 0U || line_len >= token.size() || token[line_len] != ':') {
                return std::nullopt;
            }
            auto rest = token.substr(line_len + 1U);
            auto col_len = digits_end(rest);
            if (col_len == 0U) {
                return std::nullopt;
            }

            auto line = parse_index(token.substr(0U, line_len));
            auto column = parse_index(rest.substr(0U, col_len));
            if (!line || !column) {
                return std::nullopt;
            }
            return position{*line, *column};
        }

        static std::optional<header_fields> find_header(const std::vector<std::string_view>& lines) {
            for (auto line : lines) {
                auto tokens = split_tokens(line);
                for (size_t i = 0U; i + 1U < tokens.size(); ++i) {
                    auto start = parse_start_token(tokens[i]);
                    if (!start) {
                        continue;
                    }
                    auto end = parse_end_token(tokens[i + 1U]);
                    if (!end) {
                        continue;
                    }
                    return header_fields{std::string{start->first}, start->second, *end};
                }
            }
            return std::nullopt;
        }

        static std::string clean_value(std::string_view raw) {
            return utils::erase_char(utils::trim_chars(raw, value_trim), '\\');
        }

        static std::string summarize_block(std::string_view block) {
            auto first_line = block.substr(0U, block.find('\n'));
            if (first_line.size() > 80U) {
                first_line = first_line.substr(0U, 80U);
            }
            return std::string{first_line};
        }

    }  // namespace detail

    match_record parse_record(std::string_view block) {
        auto lines = detail::split_lines(block);

        auto header = detail::find_header(lines);
        if (!header) {
            throw error{
                    error_kind::artifact_parse_error,
                    "record has no `<file>:<line>:<col>: <line>:<col>` header: {}"_format(
                            detail::summarize_block(block))};
        }
        if (header->start.line == 0U || header->start.column == 0U || header->end.line == 0U ||
            header->end.column == 0U) {
            throw error{
                    error_kind::artifact_parse_error,
                    "record positions are 1-indexed: {}:{}"_format(header->file, header->start)};
        }
        if (header->end < header->start) {
            throw error{
                    error_kind::artifact_parse_error,
                    "record ends before it starts: {}:{} .. {}"_format(header->file, header->start, header->end)};
        }

        match_record record{};
        record.source_file = std::move(header->file);
        record.start = header->start;
        record.end = header->end;

        for (auto line : lines) {
            if (line.find(report_tokens::source) == std::string_view::npos) {
                continue;
            }
            if (auto split = line.find(':'); split != std::string_view::npos) {
                record.matched_text = detail::clean_value(line.substr(split + 1U));
            }
            break;
        }

        bool in_args = false;
        for (auto line : lines) {
            if (!in_args) {
                in_args = line.find(report_tokens::args) != std::string_view::npos;
                continue;
            }
            auto split = line.find(':');
            if (split == std::string_view::npos) {
                continue;
            }
            auto key = utils::trim_chars(line.substr(0U, split), detail::key_trim);
            record.captured_args.insert_or_assign(std::string{key}, detail::clean_value(line.substr(split + 1U)));
        }

        return record;
    }

    void order_for_weaving(file_match_set& matches) {
        std::ranges::stable_sort(matches, [](const match_record& a, const match_record& b) {
            if (a.start != b.start) {
                return a.start > b.start;
            }
            return a.end > b.end;
        });
    }

    match_report parse_report(std::string_view artifact_text) {
        std::vector<size_t> marks{};
        for (auto pos = artifact_text.find(report_tokens::record_start); pos != std::string_view::npos;
             pos = artifact_text.find(report_tokens::record_start, pos + report_tokens::record_start.size())) {
            marks.push_back(pos);
        }

        match_report report{};
        for (size_t i = 0U; i < marks.size(); ++i) {
            auto to = i + 1U < marks.size() ? marks[i + 1U] : artifact_text.size();
            auto record = parse_record(artifact_text.substr(marks[i], to - marks[i]));
            auto file = record.source_file;
            report[file].push_back(std::move(record));
        }

        for (auto& [file, matches] : report) {
            order_for_weaving(matches);
            for (size_t i = 1U; i < matches.size(); ++i) {
                const auto& later = matches[i - 1U];
                const auto& earlier = matches[i];
                if (earlier.end > later.start) {
                    throw error{
                            error_kind::artifact_parse_error,
                            "overlapping matches in {}: {}..{} and {}..{}"_format(
                                    file, earlier.start, earlier.end, later.start, later.end)};
                }
            }
            debug_log("parsed ", matches.size(), " match(es) for ", file);
        }

        return report;
    }

}  // namespace weaver
