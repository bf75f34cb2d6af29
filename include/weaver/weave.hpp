#pragma once

#include "report.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace weaver {

    inline constexpr char default_placeholder = '$';

    /** Expands `advice` for one match.

        Argument keys are replaced by their captured values, and the placeholder
        character by the record's matched text, in a single left-to-right scan:
        at each offset the longest matching key wins (ties broken
        lexicographically), keys take precedence over the placeholder, and
        substituted text is never re-scanned.
     */
    std::string expand_advice(std::string_view advice, const match_record& record, char placeholder = default_placeholder);

    /** Splices the expanded advice over every match in `matches`, which must be in
        descending-start order. Positions are resolved against the working
        buffer, so positions reported for `original` stay valid throughout.
     */
    std::string weave_text(
            std::string_view original,
            const file_match_set& matches,
            std::string_view advice,
            char placeholder = default_placeholder);

    // Reads `path`, weaves, and overwrites `path` with the result
    void weave_file(
            const std::filesystem::path& path,
            const file_match_set& matches,
            std::string_view advice,
            char placeholder = default_placeholder);

    std::string read_text_file(const std::filesystem::path& path);
    void write_text_file(const std::filesystem::path& path, std::string_view text);

}  // namespace weaver
