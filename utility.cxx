#include "utility.hxx"

#include <git2/oid.h>

#include <algorithm>
#include <cctype>
#include <format>

namespace {
	const char* ws = " \t\n\r\f\v";

	inline std::string& rtrim(std::string& s, const char* t = ws)
	{
		s.erase(s.find_last_not_of(t) + 1);
		return s;
	}

	inline std::string& ltrim(std::string& s, const char* t = ws)
	{
		s.erase(0, s.find_first_not_of(t));
		return s;
	}

	inline std::string& trim(std::string& s, const char* t = ws)
	{
		return ltrim(rtrim(s, t), t);
	}
} // namespace

void toLower(std::string& s)
{
	std::ranges::transform(s, s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
}

std::string toLowerCopy(std::string_view s)
{
	std::string result{s};
	toLower(result);
	return result;
}

bool ishex(std::string_view s)
{
	return std::ranges::all_of(s, [](unsigned char c) { return std::isxdigit(c) != 0; });
}

LibgitError::LibgitError(int errorCode, const git_error* error)
	: BackendError(
		  error ? std::format("libgit2 error {}/{}: {}", errorCode, error->klass, error->message)
				: std::format("libgit2 error {}", errorCode))
{
}

LibgitError::LibgitError(int error)
	: LibgitError(error, git_error_last())
{
}

void LibgitError::check(int error)
{
	if (error < 0) {
		throw LibgitError(error);
	}
}

std::string oidToString(const git_oid& id)
{
	return std::string{git_oid_tostr_s(&id)};
}

std::string& trimWhitespace(std::string& s)
{
	return trim(s);
}

std::string_view trimWhitespace(std::string_view s)
{
	std::string_view::size_type first = s.find_first_not_of(ws);
	if (first == std::string_view::npos) {
		return {};
	}
	return s.substr(first, s.find_last_not_of(ws) - first + 1);
}

std::string_view messageSummary(std::string_view message)
{
	message = trimWhitespace(message);
	std::string_view::size_type eol = message.find('\n');
	if (eol != std::string_view::npos) {
		message = message.substr(0, eol);
	}
	if (message.ends_with('\r')) {
		message.remove_suffix(1);
	}
	return message;
}
