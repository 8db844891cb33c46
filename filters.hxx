#pragma once

#include "commit.hxx"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct CommitFilter {
	virtual ~CommitFilter() = default;

	/// true if @p commit passes the filter
	virtual bool operator()(const Commit& commit) const = 0;
};

/**
 * @brief Drops commits whose id equals or starts with one of the given revisions
 *
 * Revisions are compared case-insensitively, blank entries are skipped.
 */
class IgnoreRevisionsFilter: public CommitFilter {
public:
	IgnoreRevisionsFilter(const std::vector<std::string>& revisions);

	bool operator()(const Commit& commit) const override;

	bool ignores(std::string_view commitId) const;

private:
	std::vector<std::string> revisions_;
};

/**
 * @brief Keeps commits with since <= time <= until, a missing bound does not constrain
 */
class DateRangeFilter: public CommitFilter {
public:
	DateRangeFilter(std::optional<Instant> since, std::optional<Instant> until);

	bool operator()(const Commit& commit) const override;

private:
	std::optional<Instant> since_;
	std::optional<Instant> until_;
};
