#pragma once

#include <filesystem>
#include <string_view>

namespace weaver {

    using namespace std::string_view_literals;

    inline constexpr auto saved_dir_suffix = "-saved"sv;
    inline constexpr auto modified_dir_suffix = "-modified"sv;

    /** Scoped copy of the source tree.

        Construction copies `<root>/<source_dir>` to `<source_dir>-saved`. Release
        moves the (possibly woven) tree to `<source_dir>-modified` and the saved
        copy back into place, so the live tree ends byte-identical to how it
        started. Release happens on destruction if `release()` was not called.
     */
    class source_snapshot {
      public:
        source_snapshot(const std::filesystem::path& root, std::string_view source_dir);
        ~source_snapshot();

        source_snapshot(const source_snapshot&) = delete;
        source_snapshot& operator=(const source_snapshot&) = delete;

        void release();

        bool released() const { return released_; }

        const std::filesystem::path& source_path() const { return source_path_; }
        const std::filesystem::path& saved_path() const { return saved_path_; }
        const std::filesystem::path& modified_path() const { return modified_path_; }

      private:
        std::filesystem::path source_path_{};
        std::filesystem::path saved_path_{};
        std::filesystem::path modified_path_{};
        bool released_{false};
    };

}  // namespace weaver
