#include "weaver/weave.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace weaver {

    namespace detail {

        static std::vector<std::string_view> ordered_keys(const match_record& record) {
            std::vector<std::string_view> keys{};
            keys.reserve(record.captured_args.size());
            for (const auto& [key, value] : record.captured_args) {
                if (!key.empty()) {
                    keys.push_back(key);
                }
            }
            // a key that is a prefix of another must not shadow it
            std::ranges::stable_sort(keys, [](std::string_view a, std::string_view b) {
                if (a.size() != b.size()) {
                    return a.size() > b.size();
                }
                return a < b;
            });
            return keys;
        }

    }  // namespace detail

    std::string expand_advice(std::string_view advice, const match_record& record, char placeholder) {
        auto keys = detail::ordered_keys(record);

        std::string out{};
        out.reserve(advice.size() + record.matched_text.size());

        size_t i = 0U;
        while (i < advice.size()) {
            auto rest = advice.substr(i);
            auto key = std::ranges::find_if(keys, [rest](std::string_view k) { return rest.starts_with(k); });
            if (key != keys.end()) {
                out.append(record.captured_args.find(std::string{*key})->second);
                i += key->size();
                continue;
            }
            if (advice[i] == placeholder) {
                out.append(record.matched_text);
            }
            else {
                out.push_back(advice[i]);
            }
            ++i;
        }
        return out;
    }

}  // namespace weaver
