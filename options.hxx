#pragma once

#include "formatter.hxx"
#include "history-engine.hxx"

#include <git2/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

enum class ColorMode { Auto, Always, Never };

struct Options {
	std::filesystem::path repo_path{"."};
	std::string file;
	std::uint32_t line{};
	std::optional<OutputFormat> format;
	std::optional<SortOrder> sort;
	bool reverse{false};
	std::vector<std::string> ignore_revs;
	std::vector<std::filesystem::path> ignore_revs_files;
	std::optional<std::string> since;
	std::optional<std::string> until;
	std::optional<std::size_t> limit;
	bool show_content{false};
	ColorMode color{ColorMode::Auto};
	int verbosity{0};
};

/**
 * @brief Completes @p options with the line-history.* and blame.ignoreRevsFile settings of @p repo
 *
 * Values given on the command line win, configured ignore revisions are added to the given ones.
 */
void loadOptions(Options& options, git_repository& repo);

/// Builds the engine query, reading every ignore-revs file
HistoryQuery makeQuery(const Options& options);

OutputFormat effectiveFormat(const Options& options);

/// Colour decision for ColorMode::Auto is taken from @p stdoutIsTerminal
FormatterOptions formatterOptions(const Options& options, bool stdoutIsTerminal);
