#include "options.hxx"

#include "config.hxx"
#include "ignore-revs-file.hxx"
#include "utility.hxx"

#include <git2/repository.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <iterator>

namespace {
	std::optional<SortOrder> sortOrderFromString(std::string_view name)
	{
		const std::string lowered{toLowerCopy(trimWhitespace(name))};
		if (lowered == "asc") {
			return SortOrder::Ascending;
		}
		if (lowered == "desc") {
			return SortOrder::Descending;
		}
		return std::nullopt;
	}

	std::optional<std::size_t> parseLimit(std::string_view text)
	{
		text = trimWhitespace(text);
		std::size_t value{};
		auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
		if (ec != std::errc{} || ptr != text.data() + text.size()) {
			return std::nullopt;
		}
		return value;
	}
} // namespace

void loadOptions(Options& options, git_repository& repo)
{
	RepositoryConfig config{repo};

	if (!options.format) {
		if (std::optional<std::string> format = config.value("line-history.format"); format.has_value()) {
			options.format = outputFormatFromString(*format);
			if (!options.format) {
				spdlog::warn("Ignoring unknown line-history.format '{}'", *format);
			}
		}
	}

	if (!options.sort && !options.reverse) {
		if (std::optional<std::string> sort = config.value("line-history.sort"); sort.has_value()) {
			options.sort = sortOrderFromString(*sort);
			if (!options.sort) {
				spdlog::warn("Ignoring unknown line-history.sort '{}'", *sort);
			}
		}
	}

	if (!options.limit) {
		if (std::optional<std::string> limit = config.value("line-history.limit"); limit.has_value()) {
			options.limit = parseLimit(*limit);
			if (!options.limit) {
				spdlog::warn("Ignoring invalid line-history.limit '{}'", *limit);
			}
		}
	}

	std::ranges::move(config.values("line-history.ignoreRev"), std::back_inserter(options.ignore_revs));

	const char* workdir = git_repository_workdir(&repo);
	std::ranges::move(
		config.paths("blame.ignoreRevsFile", workdir ? std::filesystem::path{workdir} : std::filesystem::current_path()),
		std::back_inserter(options.ignore_revs_files));
}

HistoryQuery makeQuery(const Options& options)
{
	HistoryQuery query{
		.filePath = options.file,
		.lineNumber = options.line,
		.sortOrder = options.reverse ? SortOrder::Descending : options.sort.value_or(SortOrder::Ascending),
		.ignoreRevs = options.ignore_revs,
		.since = options.since,
		.until = options.until,
		.limit = options.limit.value_or(0),
		.includeContent = options.show_content,
	};

	for (const std::filesystem::path& file: options.ignore_revs_files) {
		std::ranges::move(loadIgnoreRevsFile(file), std::back_inserter(query.ignoreRevs));
	}
	return query;
}

OutputFormat effectiveFormat(const Options& options)
{
	return options.format.value_or(OutputFormat::Colored);
}

FormatterOptions formatterOptions(const Options& options, bool stdoutIsTerminal)
{
	switch (options.color) {
		case ColorMode::Always:
			return FormatterOptions{.color = true};
		case ColorMode::Never:
			return FormatterOptions{.color = false};
		case ColorMode::Auto:
			break;
	}
	return FormatterOptions{.color = stdoutIsTerminal};
}
