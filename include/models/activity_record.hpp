#pragma once

#include "core/constants.hpp"
#include "core/format.hpp"
#include "core/utils.hpp"
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <optional>
#include <string>
#include <vector>

namespace podium {

// Raw checkpoint as published: ["split", "5", "00:25:30"]. Validated only
// when a split map is extracted from it.
struct split_annotation {
	std::string kilometer_mark;
	std::string elapsed;

	[[nodiscard]] auto operator==(const split_annotation &) const -> bool = default;
};

// One completed workout attributed to one participant.
class activity_record {
public:
	std::string id;
	type::participant_id participant_id;
	std::optional<double> distance_meters; // absent counts as 0
	type::seconds duration_seconds{};
	std::vector<split_annotation> splits;
	std::optional<type::team_id> team_id;

	[[nodiscard]] auto distance_or_zero() const -> double { return distance_meters.value_or(0.0); }

	[[nodiscard]] auto to_json() const -> nlohmann::json
	{
		nlohmann::json tags = nlohmann::json::array();
		if (distance_meters) {
			tags.push_back(nlohmann::json::array({std::string(constants::tags::distance), nlohmann::json(*distance_meters).dump(), "m"}));
		}
		tags.push_back(nlohmann::json::array({std::string(constants::tags::duration), std::to_string(duration_seconds)}));
		for (const auto &s : splits) {
			tags.push_back(nlohmann::json::array({std::string(constants::tags::split), s.kilometer_mark, s.elapsed}));
		}
		if (team_id) {
			tags.push_back(nlohmann::json::array({std::string(constants::tags::team), *team_id}));
		}
		return {{"id", id}, {"pubkey", participant_id}, {"tags", std::move(tags)}};
	}

	// Decodes a published workout event. Unusable tags are skipped rather
	// than rejected; a missing or non-string "id" or "pubkey" throws.
	[[nodiscard]] static auto from_json(const nlohmann::json &j) -> activity_record
	{
		activity_record r;
		r.id = j.at("id").get<std::string>();
		r.participant_id = j.at("pubkey").get<std::string>();

		if (!j.contains("tags") || !j.at("tags").is_array()) {
			return r;
		}

		for (const auto &tag : j.at("tags")) {
			if (!tag.is_array() || tag.size() < 2 || !std::all_of(tag.begin(), tag.end(), [](const nlohmann::json &v) { return v.is_string(); })) {
				continue;
			}

			const auto name = tag[0].get<std::string>();
			const auto value = tag[1].get<std::string>();

			if (name == constants::tags::distance) {
				auto amount = format::parse_leading_number(value);
				if (!amount || *amount < 0.0) {
					continue;
				}
				const auto unit = tag.size() >= 3 ? tag[2].get<std::string>() : std::string{};
				if (unit == constants::tags::unit_km) {
					*amount *= constants::scoring::meters_per_km;
				}
				else if (unit == constants::tags::unit_mile) {
					*amount *= constants::scoring::meters_per_mile;
				}
				if (!std::isfinite(*amount)) {
					continue;
				}
				r.distance_meters = *amount;
			}
			else if (name == constants::tags::duration) {
				auto secs = value.find(':') != std::string::npos ? format::parse_duration(value) : format::parse_whole_number(value);
				r.duration_seconds = secs.value_or(0);
			}
			else if (name == constants::tags::split && tag.size() >= 3) {
				r.splits.push_back({.kilometer_mark = value, .elapsed = tag[2].get<std::string>()});
			}
			else if (name == constants::tags::team && !r.team_id && !value.empty()) {
				r.team_id = value;
			}
		}
		return r;
	}
};

} // namespace podium
