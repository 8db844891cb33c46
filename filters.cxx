#include "filters.hxx"

#include "utility.hxx"

#include <algorithm>

IgnoreRevisionsFilter::IgnoreRevisionsFilter(const std::vector<std::string>& revisions)
{
	revisions_.reserve(revisions.size());
	for (const std::string& rev: revisions) {
		std::string_view trimmed{trimWhitespace(std::string_view{rev})};
		if (!trimmed.empty()) {
			revisions_.push_back(toLowerCopy(trimmed));
		}
	}
}

bool IgnoreRevisionsFilter::ignores(std::string_view commitId) const
{
	const std::string id{toLowerCopy(commitId)};
	return std::ranges::any_of(revisions_, [&id](const std::string& rev) { return id.starts_with(rev); });
}

bool IgnoreRevisionsFilter::operator()(const Commit& commit) const
{
	return !ignores(commit.id);
}

DateRangeFilter::DateRangeFilter(std::optional<Instant> since, std::optional<Instant> until)
	: since_{since}
	, until_{until}
{
}

bool DateRangeFilter::operator()(const Commit& commit) const
{
	if (since_ && commit.time < *since_) {
		return false;
	}
	if (until_ && commit.time > *until_) {
		return false;
	}
	return true;
}
