#include "core/constants.hpp"
#include "core/format.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <limits>
#include <vector>

namespace podium::format {

auto parse_whole_number(std::string_view text) -> std::optional<std::int64_t>
{
	if (text.empty() || !std::ranges::all_of(text, [](char c) { return c >= '0' && c <= '9'; })) {
		return std::nullopt;
	}

	std::int64_t value{};
	auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
	if (ec != std::errc{} || ptr != text.data() + text.size()) {
		return std::nullopt;
	}
	return value;
}

auto parse_leading_number(std::string_view text) -> std::optional<double>
{
	double value{};
	auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
	if (ec != std::errc{} || ptr == text.data() || !std::isfinite(value)) {
		return std::nullopt;
	}
	return value;
}

auto parse_duration(std::string_view text) -> std::optional<type::seconds>
{
	std::vector<std::int64_t> parts;
	std::size_t start = 0;

	while (true) {
		const auto end = text.find(':', start);
		const auto piece = text.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);

		auto value = parse_whole_number(piece);
		if (!value) {
			return std::nullopt;
		}
		parts.push_back(*value);

		if (end == std::string_view::npos) {
			break;
		}
		start = end + 1;
	}

	if (parts.size() != 2 && parts.size() != 3) {
		return std::nullopt;
	}

	constexpr std::array<type::seconds, 3> unit{3600, 60, 1};
	constexpr auto limit = std::numeric_limits<type::seconds>::max();
	const auto offset = unit.size() - parts.size();

	type::seconds total = 0;
	for (std::size_t i = 0; i < parts.size(); ++i) {
		const auto mult = unit[offset + i];
		if (parts[i] > (limit - total) / mult) {
			return std::nullopt;
		}
		total += parts[i] * mult;
	}
	return total;
}

auto duration(type::seconds secs) -> std::string
{
	secs = std::max<type::seconds>(secs, 0);
	const auto hours = secs / 3600;
	const auto minutes = (secs % 3600) / 60;
	const auto rest = secs % 60;

	std::array<char, 48> buf{};
	if (hours > 0) {
		std::snprintf(buf.data(), buf.size(), "%lld:%02lld:%02lld", static_cast<long long>(hours), static_cast<long long>(minutes),
									static_cast<long long>(rest));
	}
	else {
		std::snprintf(buf.data(), buf.size(), "%lld:%02lld", static_cast<long long>(minutes), static_cast<long long>(rest));
	}
	return buf.data();
}

auto fixed(double value, int digits) -> std::string
{
	const double scale = std::pow(10.0, digits);
	const double scaled = value * scale;

	// An exact binary half (12.25 at one digit) goes away from zero.
	if (std::isfinite(scaled) && std::fma(value, scale, -scaled) == 0.0 && std::abs(scaled - std::trunc(scaled)) == 0.5) {
		value = (std::trunc(scaled) + std::copysign(1.0, scaled)) / scale;
	}

	std::array<char, 64> buf{};
	std::snprintf(buf.data(), buf.size(), "%.*f", digits, value);
	return buf.data();
}

auto distance_km(double km) -> std::string
{
	const int digits = km >= constants::scoring::coarse_distance_km ? 1 : 2;
	return fixed(km, digits) + std::string(constants::text::km_suffix);
}

auto counted(std::int64_t count, std::string_view noun) -> std::string
{
	std::string out = std::to_string(count);
	out += ' ';
	out += noun;
	if (count != 1) {
		out += 's';
	}
	return out;
}

} // namespace podium::format
