#pragma once

#include "core/utils.hpp"
#include "models/activity_record.hpp"

#include <map>

namespace podium {

// kilometer mark -> elapsed seconds, keys and values strictly increasing
using split_map = std::map<int, type::seconds>;

class split_service {
public:
	enum class time_source {
		exact_split,	 // split recorded at the target mark
		interpolated,	 // projected from the nearest lower split
		average_pace,	 // whole-workout pace times the target
		total_duration // nothing usable, raw duration
	};

	struct resolved_time {
		type::seconds seconds{};
		time_source source{time_source::total_duration};
	};

	// Validates the record's split annotations in their given order. Marks
	// that are not positive integers and times that do not parse (or parse
	// to zero) are dropped; a repeated mark keeps its last value; entries
	// whose time does not increase with the mark are dropped afterwards.
	[[nodiscard]] static auto extract_splits(const activity_record &record) -> split_map;

	// Best estimate of the elapsed time to cover exactly `target_km`.
	// Split-derived times never exceed the record's total duration.
	[[nodiscard]] static auto resolve(const activity_record &record, double target_km) -> resolved_time;

	[[nodiscard]] static auto time_at_distance(const activity_record &record, double target_km) -> type::seconds
	{
		return resolve(record, target_km).seconds;
	}
};

} // namespace podium
