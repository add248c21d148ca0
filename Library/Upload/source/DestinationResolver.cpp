#include "DestinationResolver.hpp"

#include <algorithm>
#include <cctype>

#include "fmt/core.h"

namespace {
	bool EqualsIgnoreCase(std::string_view a, std::string_view b) noexcept
	{
		return a.size() == b.size()
			&& std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
				return std::tolower(static_cast<unsigned char>(x))
					== std::tolower(static_cast<unsigned char>(y));
			});
	}

	std::string_view StripLeadingSlashes(std::string_view path) noexcept
	{
		const size_t first = path.find_first_not_of('/');
		if (first == std::string_view::npos)
			return {};

		return path.substr(first);
	}
}

std::tuple<bool, DestinationTarget, UploadError> DestinationResolver::Resolve(
	std::string_view destination, std::string_view source_basename)
{
	const auto not_storage_url = [&] {
		return std::tuple<bool, DestinationTarget, UploadError>{
			false, DestinationTarget{},
			MakeConfigurationError(fmt::format("Destination needs to be an S3 url!: {}", destination))
		};
	};

	const size_t scheme_end = destination.find("://");
	if (scheme_end == std::string_view::npos)
		return not_storage_url();

	if (!EqualsIgnoreCase(destination.substr(0, scheme_end), kScheme))
		return not_storage_url();

	std::string_view rest = destination.substr(scheme_end + 3);

	// Query and fragment are not part of the object name.
	rest = rest.substr(0, rest.find_first_of("?#"));

	const size_t path_begin = rest.find('/');
	const std::string_view authority = rest.substr(0, path_begin);
	const std::string_view path = path_begin == std::string_view::npos
		? std::string_view{} : rest.substr(path_begin);

	if (authority.empty())
		return { false, DestinationTarget{},
			MakeConfigurationError(fmt::format("Destination has no bucket: {}", destination)) };

	if (source_basename.empty())
		return { false, DestinationTarget{},
			MakeConfigurationError("Source file name is empty") };

	DestinationTarget target;
	target.container = std::string(authority);

	if (path.empty() || path == "/")
		target.key = std::string(source_basename);
	else if (path.back() == '/')
		target.key = fmt::format("{}{}", StripLeadingSlashes(path), source_basename);
	else
		target.key = std::string(StripLeadingSlashes(path));

	if (target.key.empty())
		target.key = std::string(source_basename);

	return { true, std::move(target), UploadError{} };
}
