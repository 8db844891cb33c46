#include "commit.hxx"

#include <format>

std::string_view abbreviate(std::string_view id)
{
	return id.substr(0, shortIdLength);
}

std::string formatTimestamp(Timestamp time)
{
	return std::format("{:%Y-%m-%d %H:%M:%S}", time);
}

std::string_view Commit::shortId() const
{
	return abbreviate(id);
}

