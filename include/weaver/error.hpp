#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace weaver {

    using namespace std::string_view_literals;

    enum class error_kind : uint8_t {
        config_error,
        external_analysis_error,
        artifact_parse_error,
        position_not_found,
        filesystem_error,
    };

    inline constexpr std::string_view to_string(error_kind kind) {
        switch (kind) {
            case error_kind::config_error:
                return "config error"sv;
            case error_kind::external_analysis_error:
                return "external analysis error"sv;
            case error_kind::artifact_parse_error:
                return "artifact parse error"sv;
            case error_kind::position_not_found:
                return "position not found"sv;
            case error_kind::filesystem_error:
                return "filesystem error"sv;
        }
        return "error"sv;
    }

    // Every failure in a run is fatal; the kind tells the operator which stage gave up.
    class error : public std::runtime_error {
      public:
        error(error_kind kind, const std::string& message) : std::runtime_error{message}, kind_{kind} {}

        error_kind kind() const noexcept { return kind_; }

      private:
        error_kind kind_;
    };

}  // namespace weaver
