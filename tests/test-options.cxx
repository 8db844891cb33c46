#include "options.hxx"

#include "backend-fixture.hxx"
#include "utility.hxx"

#include <git2/config.h>
#include <git2/repository.h>

#include <gtest/gtest.h>

#include <memory>

class LoadOptions: public ::testing::Test {
protected:
	void SetUp() override
	{
		git_config* config;
		LibgitError::check(git_repository_config(&config, &scratch_.repo()));
		config_.reset(config);
	}

	void set(const char* key, const char* value)
	{
		LibgitError::check(git_config_set_string(config_.get(), key, value));
	}

	/// Adds one more value to a multi-valued key
	void add(const char* key, const char* value)
	{
		LibgitError::check(git_config_set_multivar(config_.get(), key, "^$", value));
	}

	TempGitRepository scratch_;
	std::unique_ptr<git_config, void (*)(git_config*)> config_{nullptr, &git_config_free};
};

TEST_F(LoadOptions, NothingConfigured)
{
	Options options;
	loadOptions(options, scratch_.repo());

	EXPECT_FALSE(options.format.has_value());
	EXPECT_FALSE(options.sort.has_value());
	EXPECT_FALSE(options.limit.has_value());
	EXPECT_TRUE(options.ignore_revs.empty());
	EXPECT_TRUE(options.ignore_revs_files.empty());
}

TEST_F(LoadOptions, ConfigFillsUnsetOptions)
{
	set("line-history.format", "JSON");
	set("line-history.sort", "desc");
	set("line-history.limit", "10");
	add("line-history.ignoreRev", "abcd1234");
	add("line-history.ignoreRev", "ef567890");

	Options options;
	options.ignore_revs = {"01234567"};
	loadOptions(options, scratch_.repo());

	EXPECT_EQ(options.format, OutputFormat::Json);
	EXPECT_EQ(options.sort, SortOrder::Descending);
	EXPECT_EQ(options.limit, 10u);
	EXPECT_EQ(options.ignore_revs, (std::vector<std::string>{"01234567", "abcd1234", "ef567890"}));
}

TEST_F(LoadOptions, CommandLineWins)
{
	set("line-history.format", "json");
	set("line-history.sort", "desc");
	set("line-history.limit", "10");

	Options options;
	options.format = OutputFormat::Table;
	options.sort = SortOrder::Ascending;
	options.limit = 0;
	loadOptions(options, scratch_.repo());

	EXPECT_EQ(options.format, OutputFormat::Table);
	EXPECT_EQ(options.sort, SortOrder::Ascending);
	EXPECT_EQ(options.limit, 0u);
}

TEST_F(LoadOptions, ReverseFlagSuppressesConfiguredSort)
{
	set("line-history.sort", "asc");

	Options options;
	options.reverse = true;
	loadOptions(options, scratch_.repo());

	EXPECT_FALSE(options.sort.has_value());
	EXPECT_EQ(makeQuery(options).sortOrder, SortOrder::Descending);
}

TEST_F(LoadOptions, InvalidValuesAreIgnored)
{
	set("line-history.format", "xml");
	set("line-history.sort", "sideways");
	set("line-history.limit", "ten");

	Options options;
	loadOptions(options, scratch_.repo());

	EXPECT_FALSE(options.format.has_value());
	EXPECT_FALSE(options.sort.has_value());
	EXPECT_FALSE(options.limit.has_value());
}

TEST_F(LoadOptions, BlameIgnoreRevsFileIsReadRelativeToWorkdir)
{
	scratch_.writeFile(".git-blame-ignore-revs", "# reformat\nABCDEF12\n");
	set("blame.ignoreRevsFile", ".git-blame-ignore-revs");

	Options options;
	options.file = "src/main.cxx";
	options.line = 4;
	options.ignore_revs = {"01234567"};
	loadOptions(options, scratch_.repo());

	ASSERT_EQ(options.ignore_revs_files.size(), 1u);
	EXPECT_EQ(options.ignore_revs_files.front().filename(), ".git-blame-ignore-revs");

	HistoryQuery query{makeQuery(options)};
	EXPECT_EQ(query.filePath, "src/main.cxx");
	EXPECT_EQ(query.lineNumber, 4u);
	EXPECT_EQ(query.ignoreRevs, (std::vector<std::string>{"01234567", "abcdef12"}));
}

TEST(MakeQuery, Defaults)
{
	Options options;
	options.file = "a.txt";
	options.line = 1;

	HistoryQuery query{makeQuery(options)};
	EXPECT_EQ(query.sortOrder, SortOrder::Ascending);
	EXPECT_EQ(query.limit, 0u);
	EXPECT_FALSE(query.since.has_value());
	EXPECT_FALSE(query.until.has_value());
	EXPECT_FALSE(query.includeContent);
	EXPECT_EQ(effectiveFormat(options), OutputFormat::Colored);
}

TEST(MakeQuery, CarriesFiltersAndFlags)
{
	Options options;
	options.file = "a.txt";
	options.line = 7;
	options.sort = SortOrder::Descending;
	options.since = "2023-01-01";
	options.until = "2023-06-01";
	options.limit = 25;
	options.show_content = true;

	HistoryQuery query{makeQuery(options)};
	EXPECT_EQ(query.sortOrder, SortOrder::Descending);
	EXPECT_EQ(query.since, "2023-01-01");
	EXPECT_EQ(query.until, "2023-06-01");
	EXPECT_EQ(query.limit, 25u);
	EXPECT_TRUE(query.includeContent);
}

TEST(ColorSelection, FollowsColorMode)
{
	Options options;

	options.color = ColorMode::Auto;
	EXPECT_TRUE(formatterOptions(options, true).color);
	EXPECT_FALSE(formatterOptions(options, false).color);

	options.color = ColorMode::Always;
	EXPECT_TRUE(formatterOptions(options, false).color);

	options.color = ColorMode::Never;
	EXPECT_FALSE(formatterOptions(options, true).color);
}
