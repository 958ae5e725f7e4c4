#include "core/constants.hpp"
#include "models/scoring_mode.hpp"

#include <string>

namespace podium {

auto parse_scoring_mode(std::string_view name) -> std::expected<scoring_mode, type::error>
{
	if (name == "fastest_time") {
		return scoring_mode::fastest_time;
	}
	if (name == "most_distance") {
		return scoring_mode::most_distance;
	}
	if (name == "participation") {
		return scoring_mode::participation;
	}
	return std::unexpected(type::error{std::string(constants::text::unknown_scoring) + ": " + std::string(name)});
}

auto to_string(scoring_mode mode) -> std::string_view
{
	switch (mode) {
	case scoring_mode::fastest_time:
		return "fastest_time";
	case scoring_mode::most_distance:
		return "most_distance";
	case scoring_mode::participation:
		return "participation";
	}
	return "fastest_time";
}

auto describe(scoring_mode mode) -> std::string_view
{
	switch (mode) {
	case scoring_mode::fastest_time:
		return "Fastest time to complete target distance";
	case scoring_mode::most_distance:
		return "Highest total distance accumulated";
	case scoring_mode::participation:
		return "Complete any qualifying workout to participate";
	}
	return "";
}

auto score_label(scoring_mode mode) -> std::string_view
{
	switch (mode) {
	case scoring_mode::fastest_time:
		return "Time";
	case scoring_mode::most_distance:
		return "Distance";
	case scoring_mode::participation:
		return "Workouts";
	}
	return "Score";
}

} // namespace podium
