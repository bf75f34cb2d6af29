#pragma once

#include "position.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace weaver {

    using namespace std::string_view_literals;

    namespace report_tokens {
        inline constexpr auto record_start = "Found {"sv;
        inline constexpr auto source = "src:"sv;
        inline constexpr auto args = "args:"sv;
    }  // namespace report_tokens

    struct match_record {
        std::string source_file{};
        std::string matched_text{};
        position start{};
        position end{};
        std::map<std::string, std::string> captured_args{};
    };

    // Records for one file, greatest start first
    using file_match_set = std::vector<match_record>;

    using match_report = std::map<std::string, file_match_set>;

    /** Parses a single record block (one "Found {" segment).

        Throws error_kind::artifact_parse_error if the block carries no
        `<file>:<line>:<col>: <line>:<col>` header or the range ends before it starts.
     */
    match_record parse_record(std::string_view block);

    /** Splits `artifact_text` at each record marker and groups the parsed records
        by source file, each set ordered for descending-start consumption.
        Overlapping ranges within one file are rejected as artifact_parse_error.
     */
    match_report parse_report(std::string_view artifact_text);

    // Sorts by start descending (ties: end descending, then input order)
    void order_for_weaving(file_match_set& matches);

}  // namespace weaver
