#pragma once

#include "models/activity_record.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace podium::test {

inline auto make_record(std::string id,
												std::string participant,
												std::optional<double> meters,
												type::seconds duration,
												std::vector<split_annotation> splits = {},
												std::optional<std::string> team = std::nullopt) -> activity_record
{
	activity_record r;
	r.id = std::move(id);
	r.participant_id = std::move(participant);
	r.distance_meters = meters;
	r.duration_seconds = duration;
	r.splits = std::move(splits);
	r.team_id = std::move(team);
	return r;
}

} // namespace podium::test
