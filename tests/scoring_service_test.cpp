#include "services/scoring_service.hpp"
#include "test_records.hpp"

#include <catch2/catch.hpp>

#include <cmath>
#include <limits>
#include <vector>

using namespace podium;
using podium::test::make_record;

namespace {
auto build(const participant_records &records, scoring_mode mode, double target = 5.0, std::vector<type::participant_id> roster = {})
		-> std::vector<leaderboard_entry>
{
	auto res = scoring_service::build_leaderboard(records, mode, target, roster);
	REQUIRE(res.has_value());
	return *res;
}
} // namespace

TEST_CASE("fastest time qualifying threshold")
{
	participant_records records;
	records["alice"] = {make_record("a1", "alice", 4800.0, 1500)};
	records["bob"] = {make_record("b1", "bob", 4700.0, 1200)};

	const auto board = build(records, scoring_mode::fastest_time);

	REQUIRE(board.size() == 1);
	REQUIRE(board[0].participant_id == "alice");
	// 4.8 km in 1500 s projected to 5 km
	REQUIRE(board[0].score == 1563.0);
	REQUIRE(board[0].formatted_score == "26:03");
}

TEST_CASE("fastest time ranking")
{
	participant_records records;
	records["carol"] = {make_record("c1", "carol", 5000.0, 1500)};
	records["alice"] = {make_record("a1", "alice", 5000.0, 1500), make_record("a2", "alice", 3000.0, 800)};
	records["bob"] = {make_record("b1", "bob", 20000.0, 6000, {{"5", "24:00"}, {"10", "49:00"}})};

	const auto board = build(records, scoring_mode::fastest_time);

	REQUIRE(board.size() == 3);

	SECTION("a split inside a longer run beats a full-distance time")
	{
		REQUIRE(board[0].participant_id == "bob");
		REQUIRE(board[0].rank == 1);
		REQUIRE(board[0].score == 1440.0);
		REQUIRE(board[0].formatted_score == "24:00");
		REQUIRE(board[0].reference_record_id == "b1");
	}

	SECTION("equal times are ordered by participant id")
	{
		REQUIRE(board[1].participant_id == "alice");
		REQUIRE(board[1].rank == 2);
		REQUIRE(board[2].participant_id == "carol");
		REQUIRE(board[2].rank == 3);
	}

	SECTION("only qualifying records are counted")
	{
		REQUIRE(board[1].qualifying_workout_count == 1);
	}
}

TEST_CASE("fastest time keeps each participant's best record")
{
	participant_records records;
	records["alice"] = {make_record("a1", "alice", 5000.0, 1600), make_record("a2", "alice", 6000.0, 1900, {{"5", "25:10"}})};

	const auto board = build(records, scoring_mode::fastest_time);

	REQUIRE(board.size() == 1);
	REQUIRE(board[0].score == 1510.0);
	REQUIRE(board[0].reference_record_id == "a2");
	REQUIRE(board[0].qualifying_workout_count == 2);
}

TEST_CASE("most distance sums every record")
{
	participant_records records;
	records["alice"] = {make_record("a1", "alice", 1000.0, 400), make_record("a2", "alice", 2500.0, 900)};
	records["bob"] = {make_record("b1", "bob", 12250.0, 4000)};
	records["carol"] = {make_record("c1", "carol", 300.0, 120)};
	records["dave"] = {make_record("d1", "dave", std::nullopt, 600)};

	const auto board = build(records, scoring_mode::most_distance);

	REQUIRE(board.size() == 3);

	REQUIRE(board[0].participant_id == "bob");
	REQUIRE(board[0].formatted_score == "12.3 km");

	REQUIRE(board[1].participant_id == "alice");
	REQUIRE(board[1].rank == 2);
	REQUIRE(board[1].score == Approx(3.5));
	REQUIRE(board[1].formatted_score == "3.50 km");
	REQUIRE(board[1].qualifying_workout_count == 2);
	REQUIRE(board[1].reference_record_id == "a2");

	// short records count too
	REQUIRE(board[2].participant_id == "carol");
	REQUIRE(board[2].formatted_score == "0.30 km");
}

TEST_CASE("most distance ties are ordered by participant id")
{
	participant_records records;
	records["bob"] = {make_record("b1", "bob", 5000.0, 1500)};
	records["alice"] = {make_record("a1", "alice", 5000.0, 1700)};

	const auto board = build(records, scoring_mode::most_distance);

	REQUIRE(board[0].participant_id == "alice");
	REQUIRE(board[0].rank == 1);
	REQUIRE(board[1].participant_id == "bob");
	REQUIRE(board[1].rank == 2);
}

TEST_CASE("participation shares rank 1")
{
	participant_records records;
	records["zed"] = {make_record("z1", "zed", 1000.0, 300), make_record("z2", "zed", 500.0, 200)};
	records["amy"] = {make_record("y1", "amy", std::nullopt, 60)};
	records["kim"] = {make_record("k1", "kim", 200.0, 100)};

	const auto board = build(records, scoring_mode::participation);

	REQUIRE(board.size() == 3);
	for (const auto &e : board) {
		REQUIRE(e.rank == 1);
	}

	REQUIRE(board[0].participant_id == "amy");
	REQUIRE(board[0].formatted_score == "1 workout");
	REQUIRE(board[1].participant_id == "kim");
	REQUIRE(board[2].participant_id == "zed");
	REQUIRE(board[2].score == 2.0);
	REQUIRE(board[2].formatted_score == "2 workouts");
	REQUIRE(board[2].reference_record_id == "z1");
}

TEST_CASE("roster backfill")
{
	participant_records records;
	records["A"] = {make_record("a1", "A", 5000.0, 1500)};
	records["B"] = {make_record("b1", "B", 2000.0, 700)};

	SECTION("everyone on the roster appears")
	{
		const auto board = build(records, scoring_mode::fastest_time, 5.0, {"A", "B", "C"});

		REQUIRE(board.size() == 3);
		REQUIRE(board[0].participant_id == "A");
		REQUIRE(board[0].rank == 1);

		REQUIRE(board[1].participant_id == "B");
		REQUIRE(board[1].rank == 2);
		REQUIRE(board[1].score == 0.0);
		REQUIRE(board[1].formatted_score.empty());
		REQUIRE(board[1].qualifying_workout_count == 0);
		REQUIRE_FALSE(board[1].reference_record_id.has_value());

		REQUIRE(board[2].participant_id == "C");
		REQUIRE(board[2].rank == 2);
	}

	SECTION("roster duplicates are added once")
	{
		const auto board = build(records, scoring_mode::fastest_time, 5.0, {"C", "A", "C"});

		REQUIRE(board.size() == 2);
		REQUIRE(board[1].participant_id == "C");
	}

	SECTION("participation keeps rank 1 and trails the rest")
	{
		const auto board = build(records, scoring_mode::participation, 5.0, {"A", "B", "C"});

		REQUIRE(board.size() == 3);
		REQUIRE(board[0].rank == 1);
		REQUIRE(board[1].rank == 1);
		REQUIRE(board[2].participant_id == "C");
		REQUIRE(board[2].rank == 3);
	}

	SECTION("without a roster only scored participants appear")
	{
		REQUIRE(build(records, scoring_mode::fastest_time).size() == 1);
	}
}

TEST_CASE("leaderboards are deterministic")
{
	participant_records records;
	records["alice"] = {make_record("a1", "alice", 5200.0, 1620, {{"1", "5:10"}, {"5", "25:40"}})};
	records["bob"] = {make_record("b1", "bob", 8000.0, 2500)};
	records["carol"] = {make_record("c1", "carol", 5000.0, 1500)};

	for (auto mode : {scoring_mode::fastest_time, scoring_mode::most_distance, scoring_mode::participation}) {
		const auto first = build(records, mode, 5.0, {"dave", "alice"});
		const auto second = build(records, mode, 5.0, {"dave", "alice"});

		REQUIRE(first == second);
		for (std::size_t i = 0; i < first.size(); ++i) {
			REQUIRE(first[i].to_json().dump() == second[i].to_json().dump());
		}
	}
}

TEST_CASE("target distance contract")
{
	participant_records records;
	records["alice"] = {make_record("a1", "alice", 5000.0, 1500)};

	SECTION("non-positive or non-finite targets are errors")
	{
		for (double target : {0.0, -5.0, std::numeric_limits<double>::quiet_NaN(), std::numeric_limits<double>::infinity()}) {
			auto res = scoring_service::build_leaderboard(records, scoring_mode::fastest_time, target);
			REQUIRE_FALSE(res.has_value());
		}
	}

	SECTION("nobody qualifying is a valid empty leaderboard")
	{
		auto res = scoring_service::build_leaderboard(records, scoring_mode::fastest_time, 10.0);
		REQUIRE(res.has_value());
		REQUIRE(res->empty());
	}

	SECTION("the default target is 5 km")
	{
		auto res = scoring_service::build_leaderboard(records, scoring_mode::fastest_time);
		REQUIRE(res.has_value());
		REQUIRE(res->size() == 1);
		REQUIRE(scoring_service::qualifying_distance_meters(5.0) == Approx(4750.0));
	}
}
