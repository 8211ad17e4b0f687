#include "roster/Errors.hpp"
#include "roster/GapScan.hpp"

#include <catch2/catch.hpp>
#include <fmt/format.h>

using namespace roster;

namespace {

std::vector<std::string> names_from(InstanceId first, InstanceId last) {
    std::vector<std::string> names;
    for (uint32_t id = first; id <= last; ++id)
        names.push_back(format_record_name(static_cast<InstanceId>(id)));
    return names;
}

}

TEST_CASE("Gap scan", "[GapScan]") {
    SECTION("should start at one in an empty namespace") { CHECK(find_smallest_free_id({}) == 1); }
    SECTION("should follow a dense run") { CHECK(find_smallest_free_id({"1", "2", "3"}) == 4); }
    SECTION("should fill the smallest gap") { CHECK(find_smallest_free_id({"1", "2", "4"}) == 3); }
    SECTION("should fill a gap at the start") { CHECK(find_smallest_free_id({"2", "3"}) == 1); }
    SECTION("should prefer the first of several gaps") { CHECK(find_smallest_free_id({"1", "3", "5", "7"}) == 2); }
    SECTION("should not trust the listing order") {
        SECTION("lexicographic") {
            CHECK(find_smallest_free_id({"1", "10", "2", "3", "4", "5", "6", "7", "8", "9"}) == 11);
        }
        SECTION("lexicographic with a gap") { CHECK(find_smallest_free_id({"1", "10", "11", "3"}) == 2); }
        SECTION("reversed") { CHECK(find_smallest_free_id({"4", "3", "2", "1"}) == 5); }
    }
    SECTION("should reject foreign records") {
        SECTION("wherever they appear") {
            CHECK_THROWS_AS(find_smallest_free_id({"1", "3", "readme.txt"}), NamespaceCorruptError);
        }
        SECTION("naming the offender") {
            try {
                (void)find_smallest_free_id({"1", "007"});
                FAIL("expected a NamespaceCorruptError");
            } catch (const NamespaceCorruptError &e) {
                CHECK(e.record_name() == "007");
            }
        }
        SECTION("including zero") { CHECK_THROWS_AS(find_smallest_free_id({"0"}), NamespaceCorruptError); }
    }
    SECTION("should hand out the very last ID") {
        CHECK(find_smallest_free_id(names_from(1, MaxInstanceId - 1)) == MaxInstanceId);
    }
    SECTION("should find a gap near the top") {
        auto names = names_from(1, MaxInstanceId);
        names.erase(names.begin() + 65000);
        CHECK(find_smallest_free_id(names) == 65001);
    }
    SECTION("should fail when every ID is taken") {
        CHECK_THROWS_AS(find_smallest_free_id(names_from(1, MaxInstanceId)), IdSpaceExhaustedError);
    }
    SECTION("should not be fooled by a full top range") {
        CHECK(find_smallest_free_id(names_from(2, MaxInstanceId)) == 1);
    }
}
