#include "core/constants.hpp"
#include "core/format.hpp"
#include "core/logging.hpp"
#include "services/split_service.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace podium {

auto split_service::extract_splits(const activity_record &record) -> split_map
{
	split_map raw;

	for (const auto &s : record.splits) {
		auto km = format::parse_whole_number(s.kilometer_mark);
		if (!km || *km <= 0 || *km > std::numeric_limits<int>::max()) {
			continue;
		}

		auto elapsed = format::parse_duration(s.elapsed);
		if (!elapsed || *elapsed <= 0) {
			continue;
		}

		raw[util::narrow<int>(*km)] = *elapsed; // last write wins
	}

	split_map out;
	type::seconds last = 0;
	for (const auto &[km, elapsed] : raw) {
		if (elapsed <= last) {
			PODIUM_LOG_DEBUG("dropping non-monotonic split km " << km << " of record " << util::short_id(record.id));
			continue;
		}
		out.emplace(km, elapsed);
		last = elapsed;
	}
	return out;
}

auto split_service::resolve(const activity_record &record, double target_km) -> resolved_time
{
	const auto splits = extract_splits(record);
	const auto total = record.duration_seconds;

	if (splits.empty()) {
		const double distance_km = record.distance_or_zero() / constants::scoring::meters_per_km;
		if (distance_km > 0.0) {
			const double pace = static_cast<double>(total) / distance_km;
			return {.seconds = std::llround(pace * target_km), .source = time_source::average_pace};
		}
		return {.seconds = total, .source = time_source::total_duration};
	}

	// Exact match only exists for whole-kilometer targets.
	if (target_km == std::floor(target_km) && target_km <= std::numeric_limits<int>::max()) {
		if (auto it = splits.find(static_cast<int>(target_km)); it != splits.end()) {
			return {.seconds = std::min(it->second, total), .source = time_source::exact_split};
		}
	}

	// Largest mark at or below the target.
	auto it = splits.upper_bound(static_cast<int>(std::min(std::floor(target_km), static_cast<double>(std::numeric_limits<int>::max()))));
	if (it != splits.begin()) {
		--it;
		const auto [km, elapsed] = *it;
		const double pace = static_cast<double>(elapsed) / km;
		const double estimate = static_cast<double>(elapsed) + pace * (target_km - km);
		return {.seconds = std::min<type::seconds>(std::llround(estimate), total), .source = time_source::interpolated};
	}

	return {.seconds = total, .source = time_source::total_duration};
}

} // namespace podium
