#include "history-engine.hxx"

#include "backend-fixture.hxx"
#include "errors.hxx"

#include <gtest/gtest.h>

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace {
	constexpr std::int64_t day{86400};
	// 2023-01-01 00:00:00 UTC
	constexpr std::int64_t t1{1672531200};
	constexpr std::int64_t t2{t1 + day};
	constexpr std::int64_t t3{t1 + 2 * day};
	constexpr std::int64_t t4{t1 + 3 * day};

	std::vector<std::string> ids(const LineHistory& history)
	{
		std::vector<std::string> result;
		std::ranges::transform(history.events(), std::back_inserter(result), &LineEvent::commitId);
		return result;
	}

	std::vector<ChangeType> changes(const LineHistory& history)
	{
		std::vector<ChangeType> result;
		std::ranges::transform(history.events(), std::back_inserter(result), &LineEvent::change);
		return result;
	}
} // namespace

/// Three commits changing file.txt at t1 < t2 < t3, then one touching only other.txt
class LineHistoryEngineTest: public ::testing::Test {
protected:
	void SetUp() override
	{
		repo_.add(a_, at(t1), {}, {{"file.txt", "one\n"}, {"other.txt", "x"}}, "Create file\n", "Alice");
		repo_.add(b_, at(t2), {a_}, {{"file.txt", "two\n"}, {"other.txt", "x"}}, "Second\n", "Bob");
		repo_.add(c_, at(t3), {b_}, {{"file.txt", "three\n"}, {"other.txt", "x"}}, "Third\n", "Carol");
		repo_.add(d_, at(t4), {c_}, {{"file.txt", "three\n"}, {"other.txt", "y"}}, "Unrelated\n", "Dave");
	}

	LineHistory query(HistoryQuery q) const
	{
		return LineHistoryEngine{repo_}.getLineHistory(q);
	}

	const std::string a_{fakeId('a')};
	const std::string b_{fakeId('b')};
	const std::string c_{fakeId('c')};
	const std::string d_{fakeId('d')};
	FakeRepository repo_;
};

TEST_F(LineHistoryEngineTest, AscendingOldestFirst)
{
	LineHistory history{LineHistoryEngine{repo_}.getLineHistory("file.txt", 1, SortOrder::Ascending, {})};

	EXPECT_EQ(history.filePath(), "file.txt");
	EXPECT_EQ(history.lineNumber(), 1u);
	EXPECT_EQ(ids(history), (std::vector<std::string>{a_, b_, c_}));
	EXPECT_EQ(changes(history), (std::vector<ChangeType>{ChangeType::Created, ChangeType::Modified, ChangeType::Modified}));
}

TEST_F(LineHistoryEngineTest, CarriesCommitMetadata)
{
	LineHistory history{query({.filePath = "file.txt", .lineNumber = 1})};

	const LineEvent& event = history.events().at(1);
	EXPECT_EQ(event.author, "Bob");
	EXPECT_EQ(event.time, at(t2));
	EXPECT_EQ(event.message, "Second\n");
	EXPECT_EQ(event.shortId(), "bbbbbbbb");
	EXPECT_TRUE(event.content.empty());
}

TEST_F(LineHistoryEngineTest, DescendingIsReverseOfAscending)
{
	LineHistory ascending{query({.filePath = "file.txt", .lineNumber = 1, .sortOrder = SortOrder::Ascending})};
	LineHistory descending{query({.filePath = "file.txt", .lineNumber = 1, .sortOrder = SortOrder::Descending})};

	EXPECT_EQ(ids(descending), (std::vector<std::string>{c_, b_, a_}));

	std::vector<LineEvent> reversed{ascending.events()};
	std::ranges::reverse(reversed);
	EXPECT_EQ(descending.events(), reversed);
}

TEST_F(LineHistoryEngineTest, IgnoredRevisionIsDropped)
{
	LineHistory history{query({.filePath = "file.txt", .lineNumber = 1, .ignoreRevs = {b_}})};
	EXPECT_EQ(ids(history), (std::vector<std::string>{a_, c_}));
}

TEST_F(LineHistoryEngineTest, IgnoredRevisionByPrefix)
{
	LineHistory history{query({.filePath = "file.txt", .lineNumber = 1, .ignoreRevs = {"BBBBBB"}})};
	EXPECT_EQ(ids(history), (std::vector<std::string>{a_, c_}));
}

TEST_F(LineHistoryEngineTest, IgnoringTheRootPromotesNextCommitToCreated)
{
	LineHistory history{query({.filePath = "file.txt", .lineNumber = 1, .ignoreRevs = {a_}})};
	EXPECT_EQ(ids(history), (std::vector<std::string>{b_, c_}));
	EXPECT_EQ(changes(history), (std::vector<ChangeType>{ChangeType::Created, ChangeType::Modified}));
}

TEST_F(LineHistoryEngineTest, SinceIsInclusive)
{
	LineHistory history{query({.filePath = "file.txt", .lineNumber = 1, .since = "2023-01-02"})};
	EXPECT_EQ(ids(history), (std::vector<std::string>{b_, c_}));
	EXPECT_EQ(history.events().front().change, ChangeType::Created);
}

TEST_F(LineHistoryEngineTest, UntilIsInclusive)
{
	LineHistory history{query({.filePath = "file.txt", .lineNumber = 1, .until = "2023-01-02T00:00:00Z"})};
	EXPECT_EQ(ids(history), (std::vector<std::string>{a_, b_}));
}

TEST_F(LineHistoryEngineTest, FractionalSinceExcludesCommitAtWholeSecond)
{
	LineHistory since{query({.filePath = "file.txt", .lineNumber = 1, .since = "2023-01-02T00:00:00.250Z"})};
	EXPECT_EQ(ids(since), (std::vector<std::string>{c_}));

	LineHistory until{query({.filePath = "file.txt", .lineNumber = 1, .until = "2023-01-02T00:00:00.250Z"})};
	EXPECT_EQ(ids(until), (std::vector<std::string>{a_, b_}));
}

TEST_F(LineHistoryEngineTest, FutureSinceGivesEmptyHistory)
{
	LineHistory history{query({.filePath = "file.txt", .lineNumber = 1, .since = "2100-01-01"})};
	EXPECT_TRUE(history.empty());
	EXPECT_EQ(history.filePath(), "file.txt");
}

TEST_F(LineHistoryEngineTest, InvalidDateFails)
{
	EXPECT_THROW(query({.filePath = "file.txt", .lineNumber = 1, .since = "last tuesday"}), InvalidDateFormat);
	EXPECT_THROW(query({.filePath = "file.txt", .lineNumber = 1, .until = "2023-01-01T00:00:00"}), InvalidDateFormat);
}

TEST_F(LineHistoryEngineTest, RejectsInvalidArguments)
{
	EXPECT_THROW(query({.filePath = "file.txt", .lineNumber = 0}), std::invalid_argument);
	EXPECT_THROW(query({.filePath = "", .lineNumber = 1}), std::invalid_argument);
}

TEST_F(LineHistoryEngineTest, UnknownFileFails)
{
	EXPECT_THROW(query({.filePath = "missing.txt", .lineNumber = 1}), FileNotFound);
}

TEST_F(LineHistoryEngineTest, DeletedFileKeepsItsHistory)
{
	repo_.add(fakeId('e'), at(t4 + day), {d_}, {{"other.txt", "y"}});

	LineHistory history{query({.filePath = "file.txt", .lineNumber = 1})};
	EXPECT_EQ(ids(history), (std::vector<std::string>{a_, b_, c_}));
}

TEST_F(LineHistoryEngineTest, DuplicateCommitsAreReportedOnce)
{
	repo_.yieldDuplicates(true);

	LineHistory history{query({.filePath = "file.txt", .lineNumber = 1})};
	EXPECT_EQ(ids(history), (std::vector<std::string>{a_, b_, c_}));
}

TEST_F(LineHistoryEngineTest, LimitBoundsTraversal)
{
	LineHistory history{query({.filePath = "file.txt", .lineNumber = 1, .limit = 2})};

	// d and c are walked, only c touched the file
	EXPECT_EQ(ids(history), (std::vector<std::string>{c_}));
	EXPECT_EQ(history.events().front().change, ChangeType::Created);
	EXPECT_EQ(repo_.pulled(), 2u);
}

TEST_F(LineHistoryEngineTest, LimitCountsDistinctCommits)
{
	repo_.yieldDuplicates(true);

	LineHistory history{query({.filePath = "file.txt", .lineNumber = 1, .limit = 3})};
	EXPECT_EQ(ids(history), (std::vector<std::string>{b_, c_}));
}

TEST_F(LineHistoryEngineTest, ZeroLimitWalksEverything)
{
	LineHistory history{query({.filePath = "file.txt", .lineNumber = 1, .limit = 0})};
	EXPECT_EQ(history.size(), 3u);
}

TEST_F(LineHistoryEngineTest, IncludesLineContentOnRequest)
{
	LineHistory history{query({.filePath = "file.txt", .lineNumber = 1, .includeContent = true})};

	std::vector<std::string> content;
	std::ranges::transform(history.events(), std::back_inserter(content), &LineEvent::content);
	EXPECT_EQ(content, (std::vector<std::string>{"one", "two", "three"}));
}

TEST_F(LineHistoryEngineTest, LineBeyondEndHasEmptyContent)
{
	LineHistory history{query({.filePath = "file.txt", .lineNumber = 5, .includeContent = true})};

	ASSERT_EQ(history.size(), 3u);
	EXPECT_TRUE(std::ranges::all_of(history.events(), [](const LineEvent& event) { return event.content.empty(); }));
}

TEST(LineHistoryEngine, EqualTimestampsStaySymmetric)
{
	FakeRepository repo;
	repo.add(fakeId('1'), at(100), {}, {{"f", "1"}});
	repo.add(fakeId('2'), at(200), {fakeId('1')}, {{"f", "2"}});
	repo.add(fakeId('3'), at(200), {fakeId('2')}, {{"f", "3"}});

	LineHistoryEngine engine{repo};
	LineHistory ascending{engine.getLineHistory("f", 1, SortOrder::Ascending, {})};
	LineHistory descending{engine.getLineHistory("f", 1, SortOrder::Descending, {})};

	EXPECT_EQ(ids(ascending), (std::vector<std::string>{fakeId('1'), fakeId('2'), fakeId('3')}));
	std::vector<LineEvent> reversed{ascending.events()};
	std::ranges::reverse(reversed);
	EXPECT_EQ(descending.events(), reversed);
}

TEST(LineHistoryEngine, CreatedGoesToEarliestTimestampNotFirstWalked)
{
	FakeRepository repo;
	// the child carries an older author date than its parent
	repo.add(fakeId('1'), at(500), {}, {{"f", "1"}});
	repo.add(fakeId('2'), at(100), {fakeId('1')}, {{"f", "2"}});

	LineHistory history{LineHistoryEngine{repo}.getLineHistory("f", 1, SortOrder::Ascending, {})};
	EXPECT_EQ(ids(history), (std::vector<std::string>{fakeId('2'), fakeId('1')}));
	EXPECT_EQ(changes(history), (std::vector<ChangeType>{ChangeType::Created, ChangeType::Modified}));
}

TEST(LineHistoryEngine, IgnoredPrefixDropsEveryMatchingCommit)
{
	const std::string first{"abcd1" + std::string(35, '0')};
	const std::string second{"abcd2" + std::string(35, '0')};
	const std::string third{"ef012" + std::string(35, '0')};
	FakeRepository repo;
	repo.add(third, at(100), {}, {{"f", "1"}});
	repo.add(first, at(200), {third}, {{"f", "2"}});
	repo.add(second, at(300), {first}, {{"f", "3"}});

	LineHistoryEngine engine{repo};
	LineHistory all{engine.getLineHistory("f", 1, SortOrder::Ascending, {})};
	LineHistory ignored{engine.getLineHistory("f", 1, SortOrder::Ascending, {"ABCD"})};

	EXPECT_EQ(all.size(), 3u);
	EXPECT_EQ(ids(ignored), (std::vector<std::string>{third}));
	EXPECT_EQ(all.size() - ignored.size(), 2u);
}

TEST(LineHistoryEngine, EmptyRepositoryFails)
{
	FakeRepository repo;
	EXPECT_THROW(LineHistoryEngine{repo}.getLineHistory("f", 1, SortOrder::Ascending, {}), RepositoryEmpty);
}
