#include <catch2/catch_test_macros.hpp>

#include "libpricecast/core/business_days.hpp"

using namespace libpricecast::core;
using boost::gregorian::date;

TEST_CASE("Business days: weekday index", "[calendar]") {
	REQUIRE(WeekdayIndex(date(2024, 1, 1)) == 0); // Monday
	REQUIRE(WeekdayIndex(date(2024, 1, 5)) == 4); // Friday
	REQUIRE(WeekdayIndex(date(2024, 1, 6)) == 5); // Saturday
	REQUIRE(WeekdayIndex(date(2024, 1, 7)) == 6); // Sunday

	REQUIRE(IsBusinessDay(date(2024, 1, 3)));
	REQUIRE_FALSE(IsBusinessDay(date(2024, 1, 6)));
}

TEST_CASE("Business days: next business day", "[calendar]") {
	REQUIRE(NextBusinessDay(date(2024, 1, 3)) == date(2024, 1, 4));
	REQUIRE(NextBusinessDay(date(2024, 1, 5)) == date(2024, 1, 8));
	REQUIRE(NextBusinessDay(date(2024, 1, 6)) == date(2024, 1, 8));
}

TEST_CASE("Business days: sequence after a Friday", "[calendar]") {
	auto days = BusinessDaysAfter(date(2024, 1, 5), 7);

	REQUIRE(days.size() == 7);
	REQUIRE(days.front() == date(2024, 1, 8));
	REQUIRE(days.back() == date(2024, 1, 16));
	for (size_t i = 0; i < days.size(); i++) {
		REQUIRE(IsBusinessDay(days[i]));
		if (i > 0) {
			REQUIRE(days[i - 1] < days[i]);
		}
	}
}

TEST_CASE("Business days: holidays are not skipped", "[calendar]") {
	// 2024-12-25 is a Wednesday
	auto days = BusinessDaysAfter(date(2024, 12, 24), 1);
	REQUIRE(days.front() == date(2024, 12, 25));
}

TEST_CASE("Business days: zero count", "[calendar]") {
	REQUIRE(BusinessDaysAfter(date(2024, 1, 5), 0).empty());
}
