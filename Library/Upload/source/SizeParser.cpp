#include "SizeParser.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <limits>
#include <optional>

#include "fmt/core.h"

namespace {
	__extension__ typedef unsigned __int128 Wide;

	constexpr Wide Power(Wide base, unsigned int exp)
	{
		Wide result = 1;
		while (exp-- > 0)
			result *= base;
		return result;
	}

	struct Unit {
		const char* name;
		Wide multiplier;
	};

	// "KB" is binary and "kB" decimal. The case-insensitive fallback scans
	// in this order, so "kb" resolves to kB.
	const Unit kUnits[] = {
		{ "byte",      1 },
		{ "kilobyte",  Power(1000, 1) },
		{ "kB",        Power(1000, 1) },
		{ "kibibyte",  Power(1024, 1) },
		{ "KiB",       Power(1024, 1) },
		{ "KB",        Power(1024, 1) },
		{ "megabyte",  Power(1000, 2) },
		{ "MB",        Power(1000, 2) },
		{ "mebibyte",  Power(1024, 2) },
		{ "MiB",       Power(1024, 2) },
		{ "gigabyte",  Power(1000, 3) },
		{ "GB",        Power(1000, 3) },
		{ "gibibyte",  Power(1024, 3) },
		{ "GiB",       Power(1024, 3) },
		{ "terabyte",  Power(1000, 4) },
		{ "TB",        Power(1000, 4) },
		{ "tebibyte",  Power(1024, 4) },
		{ "TiB",       Power(1024, 4) },
		{ "petabyte",  Power(1000, 5) },
		{ "PB",        Power(1000, 5) },
		{ "pebibyte",  Power(1024, 5) },
		{ "PiB",       Power(1024, 5) },
		{ "exabyte",   Power(1000, 6) },
		{ "EB",        Power(1000, 6) },
		{ "exbibyte",  Power(1024, 6) },
		{ "EiB",       Power(1024, 6) },
		{ "zettabyte", Power(1000, 7) },
		{ "ZB",        Power(1000, 7) },
		{ "zebibyte",  Power(1024, 7) },
		{ "ZiB",       Power(1024, 7) },
		{ "yottabyte", Power(1000, 8) },
		{ "YB",        Power(1000, 8) },
		{ "yobibyte",  Power(1024, 8) },
		{ "YiB",       Power(1024, 8) },
	};

	bool IsDigit(char c) noexcept
	{
		return std::isdigit(static_cast<unsigned char>(c)) != 0;
	}

	bool IsSpace(char c) noexcept
	{
		return std::isspace(static_cast<unsigned char>(c)) != 0;
	}

	std::string ToLower(std::string_view s)
	{
		std::string out(s);
		std::transform(out.begin(), out.end(), out.begin(),
			[](unsigned char c) { return static_cast<char>(std::tolower(c)); });
		return out;
	}

	std::optional<Wide> FindExact(std::string_view name) noexcept
	{
		for (const Unit& unit : kUnits)
			if (name == unit.name)
				return unit.multiplier;

		return std::nullopt;
	}

	std::optional<Wide> FindUnit(std::string_view name)
	{
		if (auto exact = FindExact(name))
			return exact;

		const std::string lowered = ToLower(name);
		for (const Unit& unit : kUnits)
			if (lowered == ToLower(unit.name))
				return unit.multiplier;

		return std::nullopt;
	}

	bool MultiplyChecked(Wide a, Wide b, Wide& out) noexcept
	{
		if (a != 0 && b > std::numeric_limits<Wide>::max() / a)
			return false;

		out = a * b;
		return true;
	}

	std::tuple<bool, Wide, UploadError> ParseCount(std::string_view digits, std::string_view expression)
	{
		Wide count = 0;
		for (char c : digits) {
			count = count * 10 + static_cast<Wide>(c - '0');
			if (count > std::numeric_limits<uint64_t>::max())
				return { false, 0, MakeConfigurationError(fmt::format("Size is out of range: {}", expression)) };
		}

		return { true, count, UploadError{} };
	}

	std::tuple<bool, uint64_t, UploadError> Combine(Wide unit, Wide multiplier, Wide count, std::string_view expression)
	{
		Wide bytes = 0;
		if (!MultiplyChecked(multiplier, count, bytes) || !MultiplyChecked(unit, bytes, bytes)
			|| bytes > std::numeric_limits<uint64_t>::max())
			return { false, 0, MakeConfigurationError(fmt::format("Size is out of range: {}", expression)) };

		return { true, static_cast<uint64_t>(bytes), UploadError{} };
	}
}

std::tuple<bool, uint64_t, UploadError> SizeParser::Parse(
	std::string_view expression,
	std::string_view default_unit,
	std::string_view default_multiplier)
{
	const auto unit = FindExact(default_unit);
	if (!unit)
		return { false, 0, MakeConfigurationError(fmt::format("Invalid default unit: {}", default_unit)) };

	const bool all_digits = !expression.empty()
		&& std::all_of(expression.begin(), expression.end(), IsDigit);

	if (all_digits) {
		const auto multiplier = FindExact(default_multiplier);
		if (!multiplier)
			return { false, 0, MakeConfigurationError(fmt::format("Invalid default multiplier: {}", default_multiplier)) };

		const auto [ok, count, err] = ParseCount(expression, expression);
		if (!ok)
			return { false, 0, err };

		return Combine(*unit, *multiplier, count, expression);
	}

	if (expression.find('.') != std::string_view::npos)
		return { false, 0, MakeConfigurationError(fmt::format("Split string must use whole numbers!: {}", expression)) };

	// ^(\d+)\s*(\S+)?
	size_t pos = 0;
	while (pos < expression.size() && IsDigit(expression[pos]))
		pos++;

	if (pos == 0)
		return { false, 0, MakeConfigurationError(fmt::format("Could not parse split string: {}!", expression)) };

	const std::string_view digits = expression.substr(0, pos);

	while (pos < expression.size() && IsSpace(expression[pos]))
		pos++;

	size_t end = pos;
	while (end < expression.size() && !IsSpace(expression[end]))
		end++;

	std::string token(expression.substr(pos, end - pos));
	if (token.empty())
		token = std::string(default_multiplier);

	const std::string lowered = ToLower(token);
	if (lowered.size() >= 5 && lowered.compare(lowered.size() - 5, 5, "bytes") == 0)
		token.pop_back();

	const auto multiplier = FindUnit(token);
	if (!multiplier)
		return { false, 0, MakeConfigurationError(fmt::format("Invalid units specified in split string: {}!", expression)) };

	const auto [ok, count, err] = ParseCount(digits, expression);
	if (!ok)
		return { false, 0, err };

	return Combine(*unit, *multiplier, count, expression);
}

std::vector<std::string> SizeParser::UnitNames()
{
	std::vector<std::string> names;
	names.reserve(std::size(kUnits));

	for (const Unit& unit : kUnits)
		names.emplace_back(unit.name);

	std::sort(names.begin(), names.end());

	return names;
}
