#pragma once

#include <boost/date_time/gregorian/gregorian.hpp>

#include <cstddef>
#include <vector>

namespace libpricecast {
namespace core {

// Weekday-only calendar. Exchange holidays are not excluded.

/// Day of week with Monday = 0 ... Sunday = 6
inline int WeekdayIndex(const boost::gregorian::date &d) {
	// boost numbers Sunday as 0
	return (static_cast<int>(d.day_of_week().as_number()) + 6) % 7;
}

inline bool IsBusinessDay(const boost::gregorian::date &d) {
	return WeekdayIndex(d) < 5;
}

/// First business day strictly after d
inline boost::gregorian::date NextBusinessDay(const boost::gregorian::date &d) {
	boost::gregorian::date next = d + boost::gregorian::days(1);
	while (!IsBusinessDay(next)) {
		next += boost::gregorian::days(1);
	}
	return next;
}

/**
 * Business-day sequence starting the day after last_date
 *
 * @param last_date Last historical trading date
 * @param count Number of dates to generate
 * @return Strictly increasing weekdays, length = count
 */
inline std::vector<boost::gregorian::date> BusinessDaysAfter(const boost::gregorian::date &last_date, size_t count) {
	std::vector<boost::gregorian::date> out;
	out.reserve(count);
	boost::gregorian::date cursor = last_date;
	for (size_t i = 0; i < count; i++) {
		cursor = NextBusinessDay(cursor);
		out.push_back(cursor);
	}
	return out;
}

} // namespace core
} // namespace libpricecast
