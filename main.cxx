#include "formatter.hxx"
#include "git-repository.hxx"
#include "history-engine.hxx"
#include "logging.hxx"
#include "options.hxx"
#include "utility.hxx"

#include <CLI/App.hpp>
#include <CLI/Config.hpp>
#include <CLI/Formatter.hpp>
#include <CLI/Validators.hpp>

#include <unistd.h>

#include <exception>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>

struct CommitSHAValidator: CLI::Validator {
	CommitSHAValidator()
		: CLI::Validator("SHA")
	{
		func_ = [](std::string& value) {
			if (value.empty() || !ishex(toLowerCopy(value))) {
				return std::string("Invalid SHA");
			}
			return std::string{};
		};
	}
};

int main(int argc, char** argv)
{
	Options opts;
	CLI::App app{"Trace the complete edit history of one line of a file", "git-line-history"};
	CLI::Option_group* output_options = app.add_option_group("output", "Output controls");

	app.add_option("file", opts.file, "File to analyze, relative to the repository root")->required();
	app.add_option("line", opts.line, "Line number to analyze")->required()->check(CLI::PositiveNumber);

	app.add_option("--repo,-r", opts.repo_path, "Path to git repo")
		->capture_default_str()
		->check(CLI::ExistingDirectory);

	const std::map<std::string, SortOrder> sortOrders{{"asc", SortOrder::Ascending}, {"desc", SortOrder::Descending}};
	SortOrder sort{SortOrder::Ascending};
	CLI::Option* optSort = app.add_option("--sort", sort, "Sort order of the history (asc: oldest first)")
							   ->transform(CLI::CheckedTransformer(sortOrders, CLI::ignore_case));
	CLI::Option* optReverse = app.add_flag("--reverse", opts.reverse, "Newest first, same as --sort desc");
	optSort->excludes(optReverse);
	optReverse->excludes(optSort);

	app.add_option("--ignore-rev", opts.ignore_revs, "Ignore changes made by the revision, may be given several times")
		->check(CommitSHAValidator());
	app.add_option(
		   "--ignore-revs-file", opts.ignore_revs_files,
		   "Ignore revisions listed in the file, in the format of git blame --ignore-revs-file")
		->check(CLI::ExistingFile);

	std::string since;
	std::string until;
	CLI::Option* optSince = app.add_option("--since", since, "Only commits at or after the date");
	CLI::Option* optUntil = app.add_option("--until", until, "Only commits at or before the date");

	std::size_t limit{};
	CLI::Option* optLimit = app.add_option("--limit,-n", limit, "Maximum number of commits to walk (0 for all)");

	const std::map<std::string, OutputFormat> formats{
		{"colored", OutputFormat::Colored},
		{"json", OutputFormat::Json},
		{"yaml", OutputFormat::Yaml},
		{"table", OutputFormat::Table},
	};
	OutputFormat format{OutputFormat::Colored};
	CLI::Option* optFormat = output_options->add_option("--format,-f", format, "Output format")
								 ->transform(CLI::CheckedTransformer(formats, CLI::ignore_case));

	const std::map<std::string, ColorMode> colorModes{
		{"auto", ColorMode::Auto}, {"always", ColorMode::Always}, {"never", ColorMode::Never}};
	output_options->add_option("--color", opts.color, "Colorize the colored format")
		->transform(CLI::CheckedTransformer(colorModes, CLI::ignore_case));
	output_options->add_flag("--show-content", opts.show_content, "Print the text of the line at each commit");

	app.add_flag("-v,--verbose", opts.verbosity, "Log more details to stderr, repeat for more");

	CLI11_PARSE(app, argc, argv);

	setupLogging(opts.verbosity);

	if (optSort->count()) {
		opts.sort = sort;
	}
	if (optFormat->count()) {
		opts.format = format;
	}
	if (optLimit->count()) {
		opts.limit = limit;
	}
	if (optSince->count()) {
		opts.since = since;
	}
	if (optUntil->count()) {
		opts.until = until;
	}
	opts.file = std::filesystem::path{opts.file}.lexically_normal().generic_string();

	try {
		libgit2 libgit;
		GitRepository repo{GitRepository::open(opts.repo_path)};
		loadOptions(opts, repo.native());

		LineHistoryEngine engine{repo};
		LineHistory history{engine.getLineHistory(makeQuery(opts))};

		std::unique_ptr<OutputFormatter> formatter{
			makeFormatter(effectiveFormat(opts), formatterOptions(opts, isatty(STDOUT_FILENO) != 0))};
		std::cout << formatter->render(history) << std::endl;
	} catch (const std::exception& e) {
		std::cerr << "error: " << e.what() << std::endl;
		return 1;
	}

	return 0;
}
