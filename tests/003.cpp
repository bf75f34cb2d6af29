#include "utils.hpp"

namespace weaver::test {
    using namespace std::string_view_literals;
    using namespace weaver::literals;

    TEST_CASE("003: resolve_offset walks lines and columns", "[003][position]") {
        constexpr auto text = "ab\ncd\n\nxyz"sv;

        CHECK(resolve_offset(text, {1, 1}) == 0U);
        CHECK(resolve_offset(text, {1, 2}) == 1U);
        CHECK(resolve_offset(text, {1, 3}) == 2U);  // the newline itself
        CHECK(resolve_offset(text, {2, 1}) == 3U);
        CHECK(resolve_offset(text, {3, 1}) == 6U);
        CHECK(resolve_offset(text, {4, 3}) == 9U);
    }

    TEST_CASE("003: unresolvable positions are fatal", "[003][position]") {
        constexpr auto text = "ab\ncd"sv;

        CHECK(detail::thrown_kind([&] { (void)resolve_offset(text, {1, 4}); }) == error_kind::position_not_found);
        CHECK(detail::thrown_kind([&] { (void)resolve_offset(text, {3, 1}); }) == error_kind::position_not_found);
        CHECK(detail::thrown_kind([&] { (void)resolve_offset(text, {2, 3}); }) == error_kind::position_not_found);
        CHECK(detail::thrown_kind([&] { (void)resolve_offset(""sv, {1, 1}); }) == error_kind::position_not_found);
    }

    TEST_CASE("003: tabs count as a single column", "[003][position]") {
        constexpr auto text = "\tx = 1;\n"sv;
        CHECK(resolve_offset(text, {1, 2}) == 1U);
    }

    TEST_CASE("003: position_at inverts resolve_offset for every byte", "[003][position]") {
        constexpr auto text = "fn main() {\n    let x = 1;\r\n\n\tfoo(x);\n}"sv;

        for (size_t offset = 0U; offset < text.size(); ++offset) {
            auto pos = position_at(text, offset);
            INFO("offset " << offset << " -> " << pos.to_string());
            CHECK(resolve_offset(text, pos) == offset);
        }
    }

    TEST_CASE("003: positions order by line then column", "[003][position]") {
        CHECK(position{1, 9} < position{2, 1});
        CHECK(position{2, 1} < position{2, 2});
        CHECK(position{3, 4} == position{3, 4});
        CHECK(position{10, 1} > position{9, 80});
        CHECK(position{7, 12}.to_string() == "7:12");
    }

    TEST_CASE("003: positions and error kinds format for messages", "[003][position]") {
        CHECK("{}"_format(position{7, 12}) == "7:12");
        CHECK("at {:>6}|"_format(position{1, 2}) == "at    1:2|");
        CHECK("{}: boom"_format(error_kind::position_not_found) == "position not found: boom");
    }
}  // namespace weaver::test
