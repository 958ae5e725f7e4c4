#include "core/constants.hpp"
#include "core/logging.hpp"
#include "services/competition_store.hpp"
#include <nlohmann/json.hpp>

#include <fstream>

namespace podium {

auto competition_store::competition_path() const -> std::filesystem::path { return data_dir_ / constants::files::competition_file; }

auto competition_store::workouts_path() const -> std::filesystem::path { return data_dir_ / constants::files::workouts_file; }

auto competition_store::load_competition() const -> std::expected<competition, type::error>
{
	if (!std::filesystem::exists(competition_path())) {
		return std::unexpected(type::error{std::string(constants::text::competition_missing) + ": " + competition_path().string()});
	}

	try { // The try block is for nlohmann::json
		std::ifstream file(competition_path());
		nlohmann::json j;
		file >> j;

		return competition::from_json(j);
	} catch (const std::exception &e) {
		return std::unexpected(type::error{std::string("cannot load competition: ") + e.what()});
	}
}

auto competition_store::load_workouts() const -> std::expected<std::vector<activity_record>, type::error>
{
	std::vector<activity_record> records;

	if (!std::filesystem::exists(workouts_path())) {
		return records; // Return empty vector if file doesn't exist
	}

	try { // The try block is for nlohmann::json
		std::ifstream file(workouts_path());
		nlohmann::json j;
		file >> j;

		if (!j.is_array()) {
			return std::unexpected(type::error{"cannot load workouts: expected an array of workout events"});
		}

		for (const auto &item : j) {
			if (!item.is_object() || !item.contains("id") || !item.contains("pubkey") || !item.at("id").is_string() || !item.at("pubkey").is_string()) {
				PODIUM_LOG_WARN("skipping workout event without id or pubkey");
				continue;
			}
			records.push_back(activity_record::from_json(item));
		}

		return records;
	} catch (const std::exception &e) {
		return std::unexpected(type::error{std::string("cannot load workouts: ") + e.what()});
	}
}

auto competition_store::group_by_participant(std::span<const activity_record> records) -> participant_records
{
	participant_records out;
	for (const auto &r : records) {
		if (r.participant_id.empty()) {
			continue;
		}
		out[r.participant_id].push_back(r);
	}
	return out;
}

} // namespace podium
