#include "date-parser.hxx"

#include "errors.hxx"
#include "utility.hxx"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <optional>
#include <regex>
#include <string>

namespace {
	using namespace std::chrono;

	constexpr std::string_view formatsDescription{
		"ISO 8601 / RFC 3339 (YYYY-MM-DDTHH:MM:SSZ, YYYY-MM-DDTHH:MM:SS+HH:MM), "
		"RFC 2822 (Mon, 01 Jan 2023 00:00:00 GMT), "
		"YYYY-MM-DD, "
		"YYYY-MM-DD HH:MM:SS"};

	constexpr std::array<std::string_view, 12> monthNames{
		"jan", "feb", "mar", "apr", "may", "jun", "jul", "aug", "sep", "oct", "nov", "dec"};

	constexpr std::array<std::string_view, 7> weekdayNames{"sun", "mon", "tue", "wed", "thu", "fri", "sat"};

	struct NamedZone {
		std::string_view name;
		int offsetHours;
	};

	constexpr std::array<NamedZone, 11> namedZones{{
		{"ut", 0},
		{"gmt", 0},
		{"z", 0},
		{"est", -5},
		{"edt", -4},
		{"cst", -6},
		{"cdt", -5},
		{"mst", -7},
		{"mdt", -6},
		{"pst", -8},
		{"pdt", -7},
	}};

	int toInt(const std::ssub_match& match)
	{
		return std::stoi(match.str());
	}

	std::optional<Timestamp> makeTimestamp(int year, int month, int day, int hour, int minute, int second)
	{
		if (month < 1 || month > 12 || day < 1 || day > 31) {
			return std::nullopt;
		}
		year_month_day date{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
		                    std::chrono::day{static_cast<unsigned>(day)}};
		if (!date.ok() || hour > 23 || minute > 59 || second > 59) {
			return std::nullopt;
		}
		return sys_days{date} + hours{hour} + minutes{minute} + seconds{second};
	}

	/// Digits after the decimal point of a seconds value, precision beyond nanoseconds is dropped
	nanoseconds fraction(const std::ssub_match& match)
	{
		if (!match.matched) {
			return nanoseconds{0};
		}
		std::string digits{match.str().substr(0, 9)};
		digits.resize(9, '0');
		return nanoseconds{std::stoll(digits)};
	}

	std::optional<Instant> parseRfc3339(const std::string& text)
	{
		static const std::regex expression{
			R"(^(\d{4})-(\d{2})-(\d{2})[Tt ](\d{2}):(\d{2}):(\d{2})(?:\.(\d+))?([Zz]|([+-])(\d{2}):(\d{2}))$)"};

		std::smatch match;
		if (!std::regex_match(text, match, expression)) {
			return std::nullopt;
		}
		std::optional<Timestamp> local{makeTimestamp(
			toInt(match[1]), toInt(match[2]), toInt(match[3]), toInt(match[4]), toInt(match[5]), toInt(match[6]))};
		if (!local) {
			return std::nullopt;
		}
		const Instant instant{*local + fraction(match[7])};
		if (!match[9].matched) {
			return instant;
		}
		const int offsetHours = toInt(match[10]);
		const int offsetMinutes = toInt(match[11]);
		if (offsetHours > 23 || offsetMinutes > 59) {
			return std::nullopt;
		}
		const minutes offset{offsetHours * 60 + offsetMinutes};
		return match[9].str() == "+" ? instant - offset : instant + offset;
	}

	std::optional<minutes> rfc2822Zone(std::string_view zone)
	{
		if (zone.size() == 5 && (zone[0] == '+' || zone[0] == '-')) {
			const std::string digits{zone.substr(1)};
			if (!std::ranges::all_of(digits, [](unsigned char c) { return std::isdigit(c) != 0; })) {
				return std::nullopt;
			}
			const int hh = std::stoi(digits.substr(0, 2));
			const int mm = std::stoi(digits.substr(2, 2));
			if (hh > 23 || mm > 59) {
				return std::nullopt;
			}
			const minutes offset{hh * 60 + mm};
			return zone[0] == '+' ? offset : -offset;
		}
		const std::string lowered{toLowerCopy(zone)};
		auto it = std::ranges::find(namedZones, std::string_view{lowered}, &NamedZone::name);
		if (it == namedZones.end()) {
			return std::nullopt;
		}
		return hours{it->offsetHours};
	}

	std::optional<Instant> parseRfc2822(const std::string& text)
	{
		static const std::regex expression{
			R"(^\s*(?:([A-Za-z]{3})\s*,\s*)?(\d{1,2})\s+([A-Za-z]{3})\s+(\d{4})\s+(\d{2}):(\d{2})(?::(\d{2}))?\s+([+-]\d{4}|[A-Za-z]{1,3})\s*$)"};

		std::smatch match;
		if (!std::regex_match(text, match, expression)) {
			return std::nullopt;
		}

		const std::string month{toLowerCopy(match[3].str())};
		auto monthIt = std::ranges::find(monthNames, std::string_view{month});
		if (monthIt == monthNames.end()) {
			return std::nullopt;
		}

		std::optional<Timestamp> local{makeTimestamp(
			toInt(match[4]), static_cast<int>(monthIt - monthNames.begin()) + 1, toInt(match[2]), toInt(match[5]),
			toInt(match[6]), match[7].matched ? toInt(match[7]) : 0)};
		if (!local) {
			return std::nullopt;
		}

		if (match[1].matched) {
			const std::string dayName{toLowerCopy(match[1].str())};
			const weekday actual{floor<days>(*local)};
			if (weekdayNames[actual.c_encoding()] != dayName) {
				return std::nullopt;
			}
		}

		std::optional<minutes> offset{rfc2822Zone(match[8].str())};
		if (!offset) {
			return std::nullopt;
		}
		return *local - *offset;
	}

	std::optional<Instant> parseBareDate(const std::string& text)
	{
		static const std::regex expression{R"(^(\d{4})-(\d{2})-(\d{2})$)"};

		std::smatch match;
		if (!std::regex_match(text, match, expression)) {
			return std::nullopt;
		}
		return makeTimestamp(toInt(match[1]), toInt(match[2]), toInt(match[3]), 0, 0, 0);
	}

	std::optional<Instant> parseDateTime(const std::string& text)
	{
		static const std::regex expression{R"(^(\d{4})-(\d{2})-(\d{2}) (\d{2}):(\d{2}):(\d{2})$)"};

		std::smatch match;
		if (!std::regex_match(text, match, expression)) {
			return std::nullopt;
		}
		return makeTimestamp(
			toInt(match[1]), toInt(match[2]), toInt(match[3]), toInt(match[4]), toInt(match[5]), toInt(match[6]));
	}
} // namespace

std::string_view supportedDateFormats()
{
	return formatsDescription;
}

Instant parseDate(std::string_view text)
{
	const std::string input{trimWhitespace(text)};

	for (auto parser: {&parseRfc3339, &parseRfc2822, &parseBareDate, &parseDateTime}) {
		if (std::optional<Instant> result = parser(input); result) {
			return *result;
		}
	}

	throw InvalidDateFormat{
		std::format("Unable to parse date '{}'. Supported formats: {}", text, formatsDescription)};
}
